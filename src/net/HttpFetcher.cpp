#include <errno.h>
#include <httplib.h>
#include <string.h>
#include <tracy/Tracy.hpp>

#include "HttpFetcher.hpp"
#include "util/FileWrapper.hpp"
#include "util/Logs.hpp"
#include "util/Panic.hpp"
#include "util/Paths.hpp"

HttpFetcher::HttpFetcher( int timeoutSec )
    : m_timeout( timeoutSec )
{
}

bool HttpFetcher::ParseUrl( const std::string& url, Url& out )
{
    const auto sep = url.find( "://" );
    if( sep == std::string::npos || sep == 0 ) return false;

    const auto hostStart = sep + 3;
    const auto pathStart = url.find_first_of( "/?#", hostStart );
    if( pathStart == hostStart ) return false;

    out.schemeHostPort = url.substr( 0, pathStart );
    if( pathStart == std::string::npos )
    {
        out.path = "/";
    }
    else
    {
        out.path = url.substr( pathStart, url.find( '#', pathStart ) - pathStart );
        if( out.path.empty() || out.path[0] != '/' ) out.path.insert( 0, "/" );
    }
    return true;
}

std::string HttpFetcher::Fetch( const std::string& url, const std::string& destination ) const
{
    ZoneScoped;

    Url parsed;
    if( !ParseUrl( url, parsed ) ) Throw( TransportError, "Malformed URL: %s", url.c_str() );

    httplib::Client cli( parsed.schemeHostPort );
    if( !cli.is_valid() ) Throw( TransportError, "Unsupported URL: %s", url.c_str() );
    cli.set_connection_timeout( m_timeout );
    cli.set_read_timeout( m_timeout );
    cli.set_follow_location( true );

    mclog( LogLevel::Info, "Downloading %s to %s", url.c_str(), destination.c_str() );

    FileWrapper out( destination.c_str(), "wb" );
    if( !out ) Throw( TransportError, "Failed to create %s: %s", destination.c_str(), strerror( errno ) );

    int status = 0;
    bool writeFailed = false;
    size_t received = 0;

    auto res = cli.Get( parsed.path, httplib::Headers(),
        [&status]( const httplib::Response& response ) {
            status = response.status;
            return status == 200;
        },
        [&]( const char* data, size_t len ) {
            if( !out.Write( data, len ) )
            {
                writeFailed = true;
                return false;
            }
            received += len;
            return true;
        } );

    const bool closed = out.Close();

    if( status != 0 && status != 200 )
    {
        RemoveFile( destination.c_str() );
        mclog( LogLevel::Debug, "Download of %s failed with HTTP status %d", url.c_str(), status );
        throw DownloadError( status, "Failed to download PDF: HTTP status " + std::to_string( status ) );
    }
    if( writeFailed || ( res && !closed ) )
    {
        RemoveFile( destination.c_str() );
        Throw( TransportError, "Failed to write %s: %s", destination.c_str(), strerror( errno ) );
    }
    if( !res )
    {
        RemoveFile( destination.c_str() );
        Throw( TransportError, "Failed to download %s: %s", url.c_str(), httplib::to_string( res.error() ).c_str() );
    }

    mclog( LogLevel::Info, "Downloaded %zu bytes", received );
    return destination;
}
