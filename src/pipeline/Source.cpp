#include <utility>

#include "Source.hpp"
#include "util/Logs.hpp"
#include "util/Paths.hpp"

Source ClassifySource( const std::string& input )
{
    constexpr const char* Whitespace = " \t\r\n";

    const auto begin = input.find_first_not_of( Whitespace );
    if( begin == std::string::npos ) return { Source::Kind::LocalPath, {} };
    const auto end = input.find_last_not_of( Whitespace );
    auto str = input.substr( begin, end - begin + 1 );

    if( str.starts_with( "http://" ) || str.starts_with( "https://" ) )
    {
        return { Source::Kind::Url, std::move( str ) };
    }
    return { Source::Kind::LocalPath, std::move( str ) };
}

TemporaryFile::TemporaryFile( std::string path, Ownership ownership )
    : m_path( std::move( path ) )
    , m_ownership( ownership )
{
}

TemporaryFile::~TemporaryFile()
{
    if( m_ownership != Ownership::Owned ) return;
    mclog( LogLevel::Debug, "Cleaning up %s", m_path.c_str() );
    RemoveFile( m_path.c_str() );
}
