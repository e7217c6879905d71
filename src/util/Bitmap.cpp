#include <stdio.h>
#include <jpeglib.h>
#include <png.h>
#include <setjmp.h>
#include <string.h>
#include <utility>

#include "Bitmap.hpp"
#include "Panic.hpp"

Bitmap::Bitmap( uint32_t width, uint32_t height )
    : m_width( width )
    , m_height( height )
    , m_data( new uint8_t[size_t( width ) * height * Channels]() )
{
}

Bitmap::~Bitmap()
{
    delete[] m_data;
}

Bitmap::Bitmap( Bitmap&& other ) noexcept
    : m_width( other.m_width )
    , m_height( other.m_height )
    , m_data( other.m_data )
{
    other.m_width = 0;
    other.m_height = 0;
    other.m_data = nullptr;
}

Bitmap& Bitmap::operator=( Bitmap&& other ) noexcept
{
    std::swap( m_width, other.m_width );
    std::swap( m_height, other.m_height );
    std::swap( m_data, other.m_data );
    return *this;
}

void Bitmap::Blit( const Bitmap& src, uint32_t x, uint32_t y )
{
    CheckPanic( size_t( x ) + src.m_width <= m_width && size_t( y ) + src.m_height <= m_height,
        "Blit of %ux%u at %u,%u outside %ux%u bitmap", src.m_width, src.m_height, x, y, m_width, m_height );

    const auto rowSize = src.Stride();
    auto dst = m_data + y * Stride() + size_t( x ) * Channels;
    auto ptr = src.m_data;
    for( uint32_t i=0; i<src.m_height; i++ )
    {
        memcpy( dst, ptr, rowSize );
        dst += Stride();
        ptr += rowSize;
    }
}

namespace
{
struct JpgErrorMgr
{
    jpeg_error_mgr pub;
    jmp_buf setjmp_buffer;
    char message[JMSG_LENGTH_MAX];
};
}

void Bitmap::SaveJpg( FILE* f, int quality ) const
{
    mclog( LogLevel::Info, "Encoding JPEG: %ux%u, quality %d", m_width, m_height, quality );

    jpeg_compress_struct cinfo;
    JpgErrorMgr jerr;

    cinfo.err = jpeg_std_error( &jerr.pub );
    jerr.pub.error_exit = []( j_common_ptr cinfo ) {
        auto mgr = (JpgErrorMgr*)cinfo->err;
        mgr->pub.format_message( cinfo, mgr->message );
        longjmp( mgr->setjmp_buffer, 1 );
    };
    if( setjmp( jerr.setjmp_buffer ) )
    {
        jpeg_destroy_compress( &cinfo );
        Throw( WriteError, "JPEG encoding failed: %s", jerr.message );
    }

    jpeg_create_compress( &cinfo );
    jpeg_stdio_dest( &cinfo, f );

    cinfo.image_width = m_width;
    cinfo.image_height = m_height;
    cinfo.input_components = Channels;
    cinfo.in_color_space = JCS_RGB;
    jpeg_set_defaults( &cinfo );
    jpeg_set_quality( &cinfo, quality, TRUE );
    jpeg_start_compress( &cinfo, TRUE );

    while( cinfo.next_scanline < cinfo.image_height )
    {
        auto row = (JSAMPROW)( m_data + cinfo.next_scanline * Stride() );
        jpeg_write_scanlines( &cinfo, &row, 1 );
    }

    jpeg_finish_compress( &cinfo );
    jpeg_destroy_compress( &cinfo );
}

void Bitmap::SavePng( FILE* f ) const
{
    mclog( LogLevel::Info, "Encoding PNG: %ux%u", m_width, m_height );

    png_structp png_ptr = png_create_write_struct( PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr );
    if( !png_ptr ) Throw( WriteError, "Failed to create PNG writer" );
    png_infop info_ptr = png_create_info_struct( png_ptr );
    if( !info_ptr )
    {
        png_destroy_write_struct( &png_ptr, nullptr );
        Throw( WriteError, "Failed to create PNG writer" );
    }
    if( setjmp( png_jmpbuf( png_ptr ) ) )
    {
        png_destroy_write_struct( &png_ptr, &info_ptr );
        Throw( WriteError, "PNG encoding failed" );
    }
    png_init_io( png_ptr, f );

    png_set_IHDR( png_ptr, info_ptr, m_width, m_height, 8, PNG_COLOR_TYPE_RGB, PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE );

    png_write_info( png_ptr, info_ptr );

    auto ptr = m_data;
    for( uint32_t i=0; i<m_height; i++ )
    {
        png_write_row( png_ptr, ptr );
        ptr += Stride();
    }

    png_write_end( png_ptr, info_ptr );
    png_destroy_write_struct( &png_ptr, &info_ptr );
}
