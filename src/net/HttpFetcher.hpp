#pragma once

#include <stdexcept>
#include <string>

#include "util/NoCopy.hpp"

class HttpFetcher
{
public:
    struct TransportError : public std::runtime_error { explicit TransportError( const std::string& msg ) : std::runtime_error( msg ) {} };
    struct DownloadError : public std::runtime_error
    {
        DownloadError( int status, const std::string& msg ) : std::runtime_error( msg ), m_status( status ) {}
        [[nodiscard]] int Status() const { return m_status; }
    private:
        int m_status;
    };

    struct Url
    {
        std::string schemeHostPort;
        std::string path;
    };

    explicit HttpFetcher( int timeoutSec = 30 );

    NoCopy( HttpFetcher );

    // Downloads url into destination, replacing any existing file, and returns destination.
    std::string Fetch( const std::string& url, const std::string& destination ) const;

    static bool ParseUrl( const std::string& url, Url& out );

private:
    int m_timeout;
};
