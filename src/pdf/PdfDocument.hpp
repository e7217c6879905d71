#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include "util/NoCopy.hpp"

class Bitmap;

class PdfDocument
{
public:
    struct DocumentOpenError : public std::runtime_error { explicit DocumentOpenError( const std::string& msg ) : std::runtime_error( msg ) {} };
    struct EmptyDocumentError : public std::runtime_error { explicit EmptyDocumentError( const std::string& msg ) : std::runtime_error( msg ) {} };
    struct RenderError : public std::runtime_error { explicit RenderError( const std::string& msg ) : std::runtime_error( msg ) {} };

    // Largest raster edge cairo image surfaces accept.
    static constexpr int MaxRasterSize = 32767;

    explicit PdfDocument( const char* path );
    ~PdfDocument();

    NoCopy( PdfDocument );

    [[nodiscard]] int PageCount() const { return m_pageCount; }

    // Page size in PDF points (1/72 inch), with page rotation applied.
    void PageSize( int page, double& width, double& height ) const;

    // Renders the page onto a white background at scale pixels per point.
    [[nodiscard]] std::unique_ptr<Bitmap> Rasterize( int page, double scale ) const;

private:
    void* m_pdf;
    int m_pageCount;
};
