#include <exception>
#include <memory>
#include <optional>
#include <tracy/Tracy.hpp>

#include "Pipeline.hpp"
#include "Source.hpp"
#include "net/HttpFetcher.hpp"
#include "util/Bitmap.hpp"
#include "util/Logs.hpp"
#include "util/Paths.hpp"

namespace
{
void Convert( const RunOptions& options, RunResult& result )
{
    const auto source = ClassifySource( options.source );

    std::optional<TemporaryFile> document;
    if( source.kind == Source::Kind::Url )
    {
        // Owned from before the fetch so that a partial download is also removed.
        document.emplace( ExpandHome( options.downloadPath.c_str() ), Ownership::Owned );
        HttpFetcher fetcher( options.timeout );
        fetcher.Fetch( source.location, document->Path() );
    }
    else
    {
        document.emplace( ExpandHome( source.location.c_str() ), Ownership::UserSupplied );
    }

    const auto pages = RenderPages( document->Path().c_str(), options.scale );
    const auto canvas = ComposeVertical( pages );
    SaveCanvas( *canvas, ExpandHome( options.output.c_str() ).c_str(), options.quality );

    result.pages = pages.size();
    result.width = canvas->Width();
    result.height = canvas->Height();
}
}

RunResult Run( const RunOptions& options )
{
    ZoneScoped;

    RunResult result;
    try
    {
        Convert( options, result );
        result.ok = true;
        mclog( LogLevel::Info, "Saved %s (%ux%u, %zu pages)", options.output.c_str(), result.width, result.height, result.pages );
    }
    catch( const std::exception& e )
    {
        result = {};
        result.error = e.what();
        mclog( LogLevel::Debug, "Conversion of %s failed: %s", options.source.c_str(), e.what() );
    }
    return result;
}
