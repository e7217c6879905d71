#pragma once

#include <stddef.h>
#include <stdint.h>
#include <string>

#include "compose/Compositor.hpp"
#include "pdf/PageRenderer.hpp"

struct RunOptions
{
    std::string source;
    std::string output = "output_image.jpg";
    double scale = DefaultRenderScale;
    int quality = DefaultJpegQuality;
    std::string downloadPath = "downloaded_pdf.pdf";
    int timeout = 30;
};

struct RunResult
{
    bool ok = false;
    std::string error;
    size_t pages = 0;
    uint32_t width = 0;
    uint32_t height = 0;
};

// Fetches (for URLs), renders and stitches the source document into options.output.
// Every failure is reported through the result; nothing is thrown.
[[nodiscard]] RunResult Run( const RunOptions& options );
