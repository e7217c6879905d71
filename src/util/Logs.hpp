#pragma once

#include <stddef.h>

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error,
    Fatal
};

void SetLogLevel( LogLevel level );
// Mirrors log output to a file. Returns false if the file cannot be created.
bool SetLogToFile( bool enabled, const char* path = "pagestack.log" );

void PagestackLogMessage( LogLevel level, const char* fileName, size_t line, const char* fmt, ... );

#define mclog(level, fmt, ...) PagestackLogMessage( level, __FILE__, __LINE__, fmt, ##__VA_ARGS__ )
