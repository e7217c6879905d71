#ifdef __FreeBSD__
#include <stdlib.h>
#else
#include <alloca.h>
#endif
#include <errno.h>
#include <pwd.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "Logs.hpp"
#include "Paths.hpp"

std::string GetHome()
{
    auto home = getenv( "HOME" );
    if( home ) return home;

    auto bufSz = sysconf( _SC_GETPW_R_SIZE_MAX );
    if( bufSz == -1 ) bufSz = 16 * 1024;
    auto buf = (char*)alloca( bufSz );

    struct passwd pass;
    struct passwd* res;
    getpwuid_r( geteuid(), &pass, buf, bufSz, &res );

    return res ? pass.pw_dir : "";
}

std::string ExpandHome( const char* path )
{
    if( path[0] != '~' ) return path;
    if( path[1] != '\0' && path[1] != '/' ) return path;
    return GetHome() + (path+1);
}

bool FileExists( const char* path )
{
    struct stat st;
    return stat( path, &st ) == 0;
}

bool RemoveFile( const char* path )
{
    if( unlink( path ) == 0 )
    {
        mclog( LogLevel::Debug, "Removed %s", path );
        return true;
    }
    if( errno == ENOENT ) return true;

    mclog( LogLevel::Warning, "Failed to remove %s: %s", path, strerror( errno ) );
    return false;
}

bool RenameFile( const char* from, const char* to )
{
    if( rename( from, to ) == 0 ) return true;
    const auto err = errno;
    mclog( LogLevel::Debug, "Failed to rename %s to %s: %s", from, to, strerror( err ) );
    errno = err;
    return false;
}

const char* FileExtension( const char* path )
{
    auto slash = strrchr( path, '/' );
    auto dot = strrchr( path, '.' );
    if( !dot || ( slash && dot < slash ) || dot == path || ( slash && dot == slash + 1 ) ) return "";
    return dot + 1;
}
