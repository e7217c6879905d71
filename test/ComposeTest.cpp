#include <cassert>
#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <sys/stat.h>
#include <vector>

#include "TestPdf.hpp"
#include "compose/Compositor.hpp"
#include "util/Bitmap.hpp"
#include "util/Logs.hpp"
#include "util/Paths.hpp"

namespace {

std::unique_ptr<Bitmap> SolidBitmap( uint32_t w, uint32_t h, uint8_t r, uint8_t g, uint8_t b )
{
    auto bmp = std::make_unique<Bitmap>( w, h );
    auto ptr = bmp->Data();
    for( size_t i=0; i<size_t( w ) * h; i++ )
    {
        *ptr++ = r;
        *ptr++ = g;
        *ptr++ = b;
    }
    return bmp;
}

const uint8_t* PixelAt( const Bitmap& bmp, uint32_t x, uint32_t y )
{
    return bmp.Data() + y * bmp.Stride() + x * Bitmap::Channels;
}

bool IsColor( const uint8_t* px, uint8_t r, uint8_t g, uint8_t b )
{
    return px[0] == r && px[1] == g && px[2] == b;
}

void TestCanvasGeometry()
{
    std::vector<std::unique_ptr<Bitmap>> pages;
    pages.emplace_back( SolidBitmap( 40, 10, 255, 0, 0 ) );
    pages.emplace_back( SolidBitmap( 60, 20, 0, 255, 0 ) );
    pages.emplace_back( SolidBitmap( 30, 5, 0, 0, 255 ) );

    auto canvas = ComposeVertical( pages );
    assert( canvas->Width() == 60 );
    assert( canvas->Height() == 35 );

    assert( IsColor( PixelAt( *canvas, 0, 0 ), 255, 0, 0 ) );
    assert( IsColor( PixelAt( *canvas, 39, 9 ), 255, 0, 0 ) );
    assert( IsColor( PixelAt( *canvas, 40, 0 ), 0, 0, 0 ) );
    assert( IsColor( PixelAt( *canvas, 59, 9 ), 0, 0, 0 ) );

    assert( IsColor( PixelAt( *canvas, 0, 10 ), 0, 255, 0 ) );
    assert( IsColor( PixelAt( *canvas, 59, 29 ), 0, 255, 0 ) );

    assert( IsColor( PixelAt( *canvas, 0, 30 ), 0, 0, 255 ) );
    assert( IsColor( PixelAt( *canvas, 29, 34 ), 0, 0, 255 ) );
    assert( IsColor( PixelAt( *canvas, 30, 34 ), 0, 0, 0 ) );

    std::cout << "[Test] canvas geometry: OK" << std::endl;
}

void TestSinglePageIsIdentical()
{
    std::vector<std::unique_ptr<Bitmap>> pages;
    pages.emplace_back( std::make_unique<Bitmap>( 17, 13 ) );
    auto ptr = pages[0]->Data();
    for( size_t i=0; i<pages[0]->Size(); i++ ) ptr[i] = uint8_t( i * 31 );

    auto canvas = ComposeVertical( pages );
    assert( canvas->Width() == 17 && canvas->Height() == 13 );
    assert( memcmp( canvas->Data(), pages[0]->Data(), pages[0]->Size() ) == 0 );

    std::cout << "[Test] single page round trip: OK" << std::endl;
}

void TestEmptySequenceRejected()
{
    bool thrown = false;
    try
    {
        auto canvas = ComposeVertical( {} );
    }
    catch( const std::invalid_argument& )
    {
        thrown = true;
    }
    assert( thrown );

    std::cout << "[Test] empty sequence: OK" << std::endl;
}

void TestSaveFormats()
{
    auto bmp = SolidBitmap( 32, 24, 10, 200, 30 );

    SaveCanvas( *bmp, "compose_out.jpg" );
    auto jpg = ReadFile( "compose_out.jpg" );
    assert( jpg.size() > 2 && uint8_t( jpg[0] ) == 0xFF && uint8_t( jpg[1] ) == 0xD8 );
    assert( !FileExists( "compose_out.jpg.part" ) );

    SaveCanvas( *bmp, "compose_out.PNG" );
    auto png = ReadFile( "compose_out.PNG" );
    assert( png.size() > 8 && memcmp( png.data(), "\x89PNG\r\n\x1a\n", 8 ) == 0 );

    Bitmap noise( 64, 64 );
    for( size_t i=0; i<noise.Size(); i++ ) noise.Data()[i] = uint8_t( ( i * 7919 ) >> 3 );
    SaveCanvas( noise, "compose_low.jpg", 5 );
    SaveCanvas( noise, "compose_high.jpg", 100 );
    assert( ReadFile( "compose_low.jpg" ).size() < ReadFile( "compose_high.jpg" ).size() );

    RemoveFile( "compose_out.jpg" );
    RemoveFile( "compose_out.PNG" );
    RemoveFile( "compose_low.jpg" );
    RemoveFile( "compose_high.jpg" );
    std::cout << "[Test] output formats: OK" << std::endl;
}

void TestWriteFailures()
{
    auto bmp = SolidBitmap( 8, 8, 1, 2, 3 );

    bool thrown = false;
    try
    {
        SaveCanvas( *bmp, "no_such_directory/out.jpg" );
    }
    catch( const Bitmap::WriteError& e )
    {
        thrown = true;
        assert( std::string( e.what() ).find( "no_such_directory/out.jpg" ) != std::string::npos );
    }
    assert( thrown );

    // A directory in place of the output cannot be replaced; nothing may be left behind.
    mkdir( "compose_dir.jpg", 0755 );
    thrown = false;
    try
    {
        SaveCanvas( *bmp, "compose_dir.jpg" );
    }
    catch( const Bitmap::WriteError& )
    {
        thrown = true;
    }
    assert( thrown );
    assert( !FileExists( "compose_dir.jpg.part" ) );
    rmdir( "compose_dir.jpg" );

    std::cout << "[Test] write failures: OK" << std::endl;
}

void TestFailedSaveKeepsPreviousOutput()
{
    const std::string previous = "previous run output";
    {
        std::ofstream out( "compose_keep.jpg", std::ios::binary );
        out << previous;
    }

    // Taller than the JPEG format allows, so encoding fails after the file was opened.
    Bitmap tall( 1, 70000 );

    std::string message;
    try
    {
        SaveCanvas( tall, "compose_keep.jpg" );
    }
    catch( const Bitmap::WriteError& e )
    {
        message = e.what();
    }
    assert( !message.empty() );
    assert( message.find( "compose_keep.jpg" ) != std::string::npos );
    assert( message.find( ".part" ) == std::string::npos );

    assert( ReadFile( "compose_keep.jpg" ) == previous );
    assert( !FileExists( "compose_keep.jpg.part" ) );

    RemoveFile( "compose_keep.jpg" );
    std::cout << "[Test] failed save keeps previous output: OK" << std::endl;
}

}

int main() {
    SetLogLevel( LogLevel::Fatal );
    std::cout << "[Test] Starting compositor tests..." << std::endl;

    TestCanvasGeometry();
    TestSinglePageIsIdentical();
    TestEmptySequenceRejected();
    TestSaveFormats();
    TestWriteFailures();
    TestFailedSaveKeepsPreviousOutput();

    std::cout << "[Test] Compositor tests passed." << std::endl;
    return 0;
}
