#include <getopt.h>
#include <iostream>
#include <stdio.h>
#include <stdlib.h>
#include <string>

#include "pipeline/Pipeline.hpp"
#include "util/Logs.hpp"
#include "util/ParseNumber.hpp"

namespace {
void PrintHelp()
{
    printf( "Usage: pagestack [options] [file.pdf | url]\n" );
    printf( "Renders every page of a PDF and stacks them into one image.\n" );
    printf( "Options:\n" );
    printf( "  -o, --output [file]          Output image, .png or .jpg (default output_image.jpg)\n" );
    printf( "  -s, --scale [factor]         Render scale relative to 72 DPI (default 2)\n" );
    printf( "  -r, --dpi [dpi]              Render resolution, overrides --scale\n" );
    printf( "  -q, --quality [1-100]        JPEG quality (default 75)\n" );
    printf( "  -t, --timeout [seconds]      Download timeout (default 30)\n" );
    printf( "  --download-path [file]       Where a downloaded PDF is kept while rendering\n" );
    printf( "  -d, --debug                  Enable debug logging\n" );
    printf( "  -l, --log-file               Also write log to pagestack.log\n" );
    printf( "  --help                       Print this help\n" );
    printf( "\nWithout a file or URL argument, the source is read from standard input.\n" );
}
}

int main( int argc, char** argv )
{
#ifdef NDEBUG
    SetLogLevel( LogLevel::Error );
#endif

    enum { OptHelp = 256, OptDownloadPath };

    struct option longOptions[] = {
        { "output", required_argument, nullptr, 'o' },
        { "scale", required_argument, nullptr, 's' },
        { "dpi", required_argument, nullptr, 'r' },
        { "quality", required_argument, nullptr, 'q' },
        { "timeout", required_argument, nullptr, 't' },
        { "download-path", required_argument, nullptr, OptDownloadPath },
        { "debug", no_argument, nullptr, 'd' },
        { "log-file", no_argument, nullptr, 'l' },
        { "help", no_argument, nullptr, OptHelp },
        {}
    };

    RunOptions options;
    double dpi = 0;

    int opt;
    while( ( opt = getopt_long( argc, argv, "o:s:r:q:t:dl", longOptions, nullptr ) ) != -1 )
    {
        switch (opt)
        {
        case 'o':
            options.output = optarg;
            break;
        case 's':
            if( !ParseNumber( optarg, options.scale ) || !( options.scale > 0 ) )
            {
                mclog( LogLevel::Error, "Scale must be a positive number" );
                return 1;
            }
            break;
        case 'r':
            if( !ParseNumber( optarg, dpi ) || !( dpi > 0 ) )
            {
                mclog( LogLevel::Error, "DPI must be a positive number" );
                return 1;
            }
            break;
        case 'q':
            if( !ParseNumber( optarg, options.quality ) || options.quality < 1 || options.quality > 100 )
            {
                mclog( LogLevel::Error, "Quality must be between 1 and 100" );
                return 1;
            }
            break;
        case 't':
            if( !ParseNumber( optarg, options.timeout ) || options.timeout <= 0 )
            {
                mclog( LogLevel::Error, "Timeout must be a positive number of seconds" );
                return 1;
            }
            break;
        case OptDownloadPath:
            options.downloadPath = optarg;
            break;
        case 'd':
            SetLogLevel( LogLevel::Debug );
            break;
        case 'l':
            if( !SetLogToFile( true ) ) return 1;
            break;
        default:
            printf( "\n" );
            [[fallthrough]];
        case OptHelp:
            PrintHelp();
            return opt == OptHelp ? 0 : 1;
        }
    }
    if( dpi > 0 ) options.scale = DpiToScale( dpi );

    if( optind < argc )
    {
        options.source = argv[optind];
    }
    else
    {
        printf( "Enter the file path or URL of the PDF: " );
        fflush( stdout );
        if( !std::getline( std::cin, options.source ) )
        {
            mclog( LogLevel::Error, "No input provided" );
            return 1;
        }
    }

    const auto result = Run( options );
    SetLogToFile( false );

    if( !result.ok )
    {
        printf( "Error: %s\n", result.error.c_str() );
        return 1;
    }

    printf( "Saved %s (%ux%u, %zu pages)\n", options.output.c_str(), result.width, result.height, result.pages );
    return 0;
}
