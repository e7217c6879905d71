#include <errno.h>
#include <limits.h>
#include <math.h>
#include <stdlib.h>

#include "ParseNumber.hpp"

bool ParseNumber( const char* str, double& out )
{
    char* end;
    errno = 0;
    const auto val = strtod( str, &end );
    if( end == str || *end != '\0' || errno == ERANGE || !isfinite( val ) ) return false;
    out = val;
    return true;
}

bool ParseNumber( const char* str, int& out )
{
    char* end;
    errno = 0;
    const auto val = strtol( str, &end, 10 );
    if( end == str || *end != '\0' || errno == ERANGE ) return false;
    if( val < INT_MIN || val > INT_MAX ) return false;
    out = int( val );
    return true;
}
