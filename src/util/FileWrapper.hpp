#pragma once

#include <stdio.h>

#include "NoCopy.hpp"

class FileWrapper
{
public:
    FileWrapper( const char* fn, const char* mode )
        : m_file( fopen( fn, mode ) )
    {
    }

    ~FileWrapper()
    {
        if( m_file ) fclose( m_file );
    }

    NoCopy( FileWrapper );

    bool Read( void* dst, size_t size )
    {
        return fread( dst, 1, size, m_file ) == size;
    }

    bool Write( const void* src, size_t size )
    {
        return fwrite( src, 1, size, m_file ) == size;
    }

    // Flushes and closes the file, reporting errors that fclose() would otherwise swallow.
    bool Close()
    {
        if( !m_file ) return false;
        const bool ok = fflush( m_file ) == 0 && !ferror( m_file );
        const bool closed = fclose( m_file ) == 0;
        m_file = nullptr;
        return ok && closed;
    }

    operator bool() const { return m_file != nullptr; }
    operator FILE*() { return m_file; }

private:
    FILE* m_file;
};
