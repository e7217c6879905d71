#pragma once

#include <memory>
#include <vector>

class Bitmap;

constexpr int DefaultJpegQuality = 75;

// Stacks pages top to bottom on a canvas as wide as the widest page. Pages must not be empty.
[[nodiscard]] std::unique_ptr<Bitmap> ComposeVertical( const std::vector<std::unique_ptr<Bitmap>>& pages );

// Writes the canvas as PNG for a .png path, JPEG otherwise. Leaves any existing file intact on failure.
void SaveCanvas( const Bitmap& canvas, const char* path, int quality = DefaultJpegQuality );
