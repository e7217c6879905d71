#include <algorithm>
#include <errno.h>
#include <stdexcept>
#include <stdint.h>
#include <string>
#include <string.h>
#include <strings.h>
#include <tracy/Tracy.hpp>

#include "Compositor.hpp"
#include "util/Bitmap.hpp"
#include "util/FileWrapper.hpp"
#include "util/Logs.hpp"
#include "util/Panic.hpp"
#include "util/Paths.hpp"

std::unique_ptr<Bitmap> ComposeVertical( const std::vector<std::unique_ptr<Bitmap>>& pages )
{
    ZoneScoped;

    if( pages.empty() ) Throw( std::invalid_argument, "No pages to compose" );

    uint32_t width = 0;
    uint64_t height = 0;
    for( auto& page : pages )
    {
        CheckPanic( page, "Null page in sequence" );
        width = std::max( width, page->Width() );
        height += page->Height();
    }
    CheckPanic( height <= UINT32_MAX, "Combined height overflow" );

    mclog( LogLevel::Info, "Composing %zu pages into %ux%u canvas", pages.size(), width, uint32_t( height ) );

    auto canvas = std::make_unique<Bitmap>( width, uint32_t( height ) );

    uint32_t offset = 0;
    for( auto& page : pages )
    {
        canvas->Blit( *page, 0, offset );
        offset += page->Height();
    }

    return canvas;
}

void SaveCanvas( const Bitmap& canvas, const char* path, int quality )
{
    ZoneScoped;

    const auto tmp = std::string( path ) + ".part";
    const bool png = strcasecmp( FileExtension( path ), "png" ) == 0;

    mclog( LogLevel::Info, "Saving %s", path );

    FileWrapper f( tmp.c_str(), "wb" );
    if( !f ) Throw( Bitmap::WriteError, "Failed to save %s: %s", path, strerror( errno ) );

    try
    {
        if( png )
        {
            canvas.SavePng( f );
        }
        else
        {
            canvas.SaveJpg( f, quality );
        }
    }
    catch( const Bitmap::WriteError& e )
    {
        RemoveFile( tmp.c_str() );
        Throw( Bitmap::WriteError, "Failed to save %s: %s", path, e.what() );
    }

    if( !f.Close() )
    {
        const auto err = errno;
        RemoveFile( tmp.c_str() );
        Throw( Bitmap::WriteError, "Failed to save %s: %s", path, strerror( err ) );
    }

    if( !RenameFile( tmp.c_str(), path ) )
    {
        const auto err = errno;
        RemoveFile( tmp.c_str() );
        Throw( Bitmap::WriteError, "Failed to save %s: %s", path, strerror( err ) );
    }
}
