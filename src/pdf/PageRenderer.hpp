#pragma once

#include <memory>
#include <vector>

class Bitmap;

constexpr double DefaultRenderScale = 2.0;
constexpr double PointsPerInch = 72.0;

[[nodiscard]] inline double DpiToScale( double dpi ) { return dpi / PointsPerInch; }

// Rasterizes every page of the PDF at path, in document order. The returned sequence is never empty.
std::vector<std::unique_ptr<Bitmap>> RenderPages( const char* path, double scale = DefaultRenderScale );
