#include <algorithm>
#include <errno.h>
#include <mutex>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>
#include <tracy/Tracy.hpp>

#include "Logs.hpp"

#define ANSI_RESET "\033[0m"
#define ANSI_BOLD "\033[1m"
#define ANSI_BLACK "\033[30m"
#define ANSI_RED "\033[31m"
#define ANSI_YELLOW "\033[33m"
#define ANSI_MAGENTA "\033[35m"

namespace
{
#ifdef NDEBUG
LogLevel s_logLevel = LogLevel::Warning;
#else
LogLevel s_logLevel = LogLevel::Info;
#endif
FILE* s_logFile = nullptr;
TracyLockableN( std::mutex, s_logLock, "Logger" );

const char* LevelTag( LogLevel level )
{
    switch( level )
    {
    case LogLevel::Debug: return "[DEBUG] ";
    case LogLevel::Info: return " [INFO] ";
    case LogLevel::Warning: return " [WARN] ";
    case LogLevel::Error: return "[ERROR] ";
    case LogLevel::Fatal: return "[FATAL] ";
    }
    return "";
}

const char* LevelColor( LogLevel level )
{
    switch( level )
    {
    case LogLevel::Debug: return ANSI_BOLD ANSI_BLACK;
    case LogLevel::Warning: return ANSI_BOLD ANSI_YELLOW;
    case LogLevel::Error: return ANSI_BOLD ANSI_RED;
    case LogLevel::Fatal: return ANSI_BOLD ANSI_MAGENTA;
    default: return "";
    }
}

void PrintSourceLocation( FILE* f, const char* fileName, size_t len, size_t line )
{
    constexpr int FnLen = 20;
    if( len > FnLen )
    {
        fprintf( f, "…%s:%-4zu│ ", fileName + len - FnLen - 1, line );
    }
    else
    {
        fprintf( f, "%*s:%-4zu%*s│ ", FnLen, fileName, line, int( FnLen - len + 2 ), "" );
    }
}
}

void SetLogLevel( LogLevel level )
{
    s_logLevel = level;
}

bool SetLogToFile( bool enabled, const char* path )
{
    std::lock_guard lock( s_logLock );
    if( enabled )
    {
        if( s_logFile ) return true;
        s_logFile = fopen( path, "w" );
        if( !s_logFile )
        {
            fprintf( stderr, "%s%sFailed to open log file %s: %s" ANSI_RESET "\n", LevelColor( LogLevel::Warning ), LevelTag( LogLevel::Warning ), path, strerror( errno ) );
            return false;
        }
    }
    else if( s_logFile )
    {
        fclose( s_logFile );
        s_logFile = nullptr;
    }
    return true;
}

void PagestackLogMessage( LogLevel level, const char* fileName, size_t line, const char *fmt, ... )
{
    if( level < s_logLevel ) return;

    va_list args;
    va_start( args, fmt );
    const auto len = strlen( fileName );

    s_logLock.lock();
    fprintf( stderr, "%s%s", LevelColor( level ), LevelTag( level ) );
    PrintSourceLocation( stderr, fileName, len, line );
    vfprintf( stderr, fmt, args );
    fprintf( stderr, ANSI_RESET "\n" );
    fflush( stderr );
    if( s_logFile )
    {
        va_end( args );
        va_start( args, fmt );
        fprintf( s_logFile, "%s", LevelTag( level ) );
        PrintSourceLocation( s_logFile, fileName, len, line );
        vfprintf( s_logFile, fmt, args );
        fprintf( s_logFile, "\n" );
        fflush( s_logFile );
    }
    s_logLock.unlock();
    va_end( args );

#ifdef TRACY_ENABLE
    va_start( args, fmt );
    char tmp[8*1024];
    const auto res = vsnprintf( tmp, sizeof( tmp ), fmt, args );
    if( res > 0 )
    {
        const auto sz = std::min<size_t>( res, sizeof( tmp ) - 1 );
        switch( level )
        {
        case LogLevel::Debug: TracyMessageC( tmp, sz, 0x888888 ); break;
        case LogLevel::Info: TracyMessage( tmp, sz ); break;
        case LogLevel::Warning: TracyMessageC( tmp, sz, 0xFFFF00 ); break;
        case LogLevel::Error: TracyMessageC( tmp, sz, 0xFF0000 ); break;
        case LogLevel::Fatal: TracyMessageC( tmp, sz, 0xFF00FF ); break;
        }
    }
    va_end( args );
#endif
}
