#include <math.h>
#include <stdexcept>
#include <tracy/Tracy.hpp>

#include "PageRenderer.hpp"
#include "PdfDocument.hpp"
#include "util/Bitmap.hpp"
#include "util/Logs.hpp"
#include "util/Panic.hpp"

std::vector<std::unique_ptr<Bitmap>> RenderPages( const char* path, double scale )
{
    ZoneScoped;

    if( !( scale > 0 ) || !isfinite( scale ) ) Throw( std::invalid_argument, "Invalid render scale %g", scale );

    std::vector<std::unique_ptr<Bitmap>> pages;
    {
        PdfDocument pdf( path );
        if( pdf.PageCount() <= 0 ) Throw( PdfDocument::EmptyDocumentError, "%s has no pages", path );

        mclog( LogLevel::Info, "Rendering %d pages at scale %g", pdf.PageCount(), scale );

        pages.reserve( pdf.PageCount() );
        for( int i=0; i<pdf.PageCount(); i++ )
        {
            ZoneScopedN( "Rasterize page" );
            pages.emplace_back( pdf.Rasterize( i, scale ) );
        }
    }

    return pages;
}
