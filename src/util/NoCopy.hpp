#pragma once

#define NoCopy( T ) \
    T( const T& ) = delete; \
    T& operator=( const T& ) = delete

// For owners of external resources whose identity must not travel, such as a file scheduled for removal.
#define NoCopyNoMove( T ) \
    NoCopy( T ); \
    T( T&& ) = delete; \
    T& operator=( T&& ) = delete
