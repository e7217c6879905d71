#pragma once

#include <stdio.h>
#include <stdlib.h>

#include "Logs.hpp"

#define CheckPanic( condition, msg, ... ) \
    { \
        if( !(condition) ) \
        { \
            mclog( LogLevel::Fatal, msg, ##__VA_ARGS__ ); \
            abort(); \
        } \
    }

// Throws the formatted message as the given exception type. The message is only logged at debug
// level, reporting it is up to whoever handles the exception.
#define Throw( ExceptionType, msg, ... ) \
    { \
        char _throwBuf[1024]; \
        snprintf( _throwBuf, sizeof( _throwBuf ), msg, ##__VA_ARGS__ ); \
        mclog( LogLevel::Debug, "%s", _throwBuf ); \
        throw ExceptionType( _throwBuf ); \
    }
