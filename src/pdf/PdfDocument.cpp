#include <algorithm>
#include <cairo.h>
#include <dlfcn.h>
#include <errno.h>
#include <glib-object.h>
#include <math.h>
#include <stdint.h>
#include <string.h>
#include <unistd.h>

#include "PdfDocument.hpp"
#include "util/Bitmap.hpp"
#include "util/FileWrapper.hpp"
#include "util/Panic.hpp"

namespace
{
typedef void*(*LoadPdf_t)( int, const char*, GError** );
typedef int(*GetPageCount_t)( void* );
typedef void*(*GetPage_t)( void*, int );
typedef void(*GetPageSize_t)( void*, double*, double* );
typedef void(*RenderPage_t)( void*, cairo_t* );

LoadPdf_t LoadPdf = nullptr;
GetPageCount_t GetPageCount = nullptr;
GetPage_t GetPage = nullptr;
GetPageSize_t GetPageSize = nullptr;
RenderPage_t RenderPage = nullptr;

struct PdfLibraryLoader
{
    PdfLibraryLoader()
    {
        void* lib = nullptr;
        for( auto name : { "libpoppler-glib.so.8", "libpoppler-glib.so" } )
        {
            lib = dlopen( name, RTLD_LAZY );
            if( lib )
            {
                mclog( LogLevel::Debug, "Loaded %s", name );
                break;
            }
        }
        if( !lib )
        {
            mclog( LogLevel::Warning, "Failed to load poppler-glib: %s", dlerror() );
            return;
        }

        auto LoadPdf_f = (LoadPdf_t)dlsym( lib, "poppler_document_new_from_fd" );
        auto GetPageCount_f = (GetPageCount_t)dlsym( lib, "poppler_document_get_n_pages" );
        auto GetPage_f = (GetPage_t)dlsym( lib, "poppler_document_get_page" );
        auto GetPageSize_f = (GetPageSize_t)dlsym( lib, "poppler_page_get_size" );
        auto RenderPage_f = (RenderPage_t)dlsym( lib, "poppler_page_render_for_printing" );

        if( LoadPdf_f && GetPageCount_f && GetPage_f && GetPageSize_f && RenderPage_f )
        {
            LoadPdf = LoadPdf_f;
            GetPageCount = GetPageCount_f;
            GetPage = GetPage_f;
            GetPageSize = GetPageSize_f;
            RenderPage = RenderPage_f;
        }
        else
        {
            mclog( LogLevel::Warning, "poppler-glib is missing required symbols" );
            dlclose( lib );
        }
    }
};

struct GObjectDeleter
{
    void operator()( void* obj ) const { if( obj ) g_object_unref( obj ); }
};

using PageHandle = std::unique_ptr<void, GObjectDeleter>;
}

PdfDocument::PdfDocument( const char* path )
    : m_pdf( nullptr )
    , m_pageCount( 0 )
{
    FileWrapper file( path, "rb" );
    if( !file ) Throw( DocumentOpenError, "Failed to open %s: %s", path, strerror( errno ) );

    uint8_t hdr[5];
    if( !file.Read( hdr, 5 ) || memcmp( hdr, "%PDF-", 5 ) != 0 ) Throw( DocumentOpenError, "%s is not a PDF document", path );

    static PdfLibraryLoader loader;
    if( !LoadPdf ) Throw( DocumentOpenError, "PDF rendering library is not available" );

    // The document takes ownership of the descriptor it is given.
    const auto fd = dup( fileno( file ) );
    if( fd < 0 ) Throw( DocumentOpenError, "Failed to open %s: %s", path, strerror( errno ) );

    GError* err = nullptr;
    m_pdf = LoadPdf( fd, nullptr, &err );
    if( !m_pdf )
    {
        std::string msg = err ? err->message : "unknown error";
        if( err ) g_error_free( err );
        Throw( DocumentOpenError, "Failed to parse %s: %s", path, msg.c_str() );
    }

    m_pageCount = GetPageCount( m_pdf );
    mclog( LogLevel::Info, "Opened %s, %d pages", path, m_pageCount );
}

PdfDocument::~PdfDocument()
{
    if( m_pdf ) g_object_unref( m_pdf );
}

void PdfDocument::PageSize( int page, double& width, double& height ) const
{
    CheckPanic( page >= 0 && page < m_pageCount, "Invalid page index %d", page );

    PageHandle handle( GetPage( m_pdf, page ) );
    if( !handle ) Throw( RenderError, "Failed to load page %d", page + 1 );

    GetPageSize( handle.get(), &width, &height );
}

std::unique_ptr<Bitmap> PdfDocument::Rasterize( int page, double scale ) const
{
    CheckPanic( page >= 0 && page < m_pageCount, "Invalid page index %d", page );

    PageHandle handle( GetPage( m_pdf, page ) );
    if( !handle ) Throw( RenderError, "Failed to load page %d", page + 1 );

    double pw, ph;
    GetPageSize( handle.get(), &pw, &ph );
    if( !( pw > 0 && ph > 0 ) ) Throw( RenderError, "Page %d has invalid size %gx%g", page + 1, pw, ph );

    // Checked before narrowing to int.
    const double sw = pw * scale;
    const double sh = ph * scale;
    if( !( sw < MaxRasterSize + 0.5 && sh < MaxRasterSize + 0.5 ) )
    {
        Throw( RenderError, "Page %d at scale %g would be %.0fx%.0f pixels, limit is %d", page + 1, scale, sw, sh, MaxRasterSize );
    }

    const int width = std::max( 1L, lround( sw ) );
    const int height = std::max( 1L, lround( sh ) );

    auto surface = cairo_image_surface_create( CAIRO_FORMAT_RGB24, width, height );
    if( cairo_surface_status( surface ) != CAIRO_STATUS_SUCCESS )
    {
        const auto status = cairo_surface_status( surface );
        cairo_surface_destroy( surface );
        Throw( RenderError, "Failed to allocate %dx%d surface for page %d: %s", width, height, page + 1, cairo_status_to_string( status ) );
    }
    auto cr = cairo_create( surface );

    cairo_set_source_rgb( cr, 1, 1, 1 );
    cairo_paint( cr );
    cairo_scale( cr, double( width ) / pw, double( height ) / ph );

    RenderPage( handle.get(), cr );

    if( cairo_status( cr ) != CAIRO_STATUS_SUCCESS )
    {
        mclog( LogLevel::Warning, "Page %d rendered with errors: %s", page + 1, cairo_status_to_string( cairo_status( cr ) ) );
    }
    cairo_destroy( cr );
    cairo_surface_flush( surface );

    const auto stride = cairo_image_surface_get_stride( surface );
    auto src = cairo_image_surface_get_data( surface );

    auto img = std::make_unique<Bitmap>( width, height );
    auto dst = img->Data();

    for( int y=0; y<height; y++ )
    {
        auto px = (const uint32_t*)( src + size_t( y ) * stride );
        for( int x=0; x<width; x++ )
        {
            const auto c = *px++;
            *dst++ = ( c >> 16 ) & 0xFF;
            *dst++ = ( c >> 8  ) & 0xFF;
            *dst++ = ( c       ) & 0xFF;
        }
    }

    cairo_surface_destroy( surface );

    mclog( LogLevel::Debug, "Page %d rasterized: %dx%d", page + 1, width, height );
    return img;
}
