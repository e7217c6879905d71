#pragma once

#include <stddef.h>
#include <stdio.h>
#include <stdexcept>
#include <stdint.h>
#include <string>

// Tightly packed 8-bit RGB image, top row first.
class Bitmap
{
public:
    struct WriteError : public std::runtime_error { explicit WriteError( const std::string& msg ) : std::runtime_error( msg ) {} };

    static constexpr int Channels = 3;

    Bitmap( uint32_t width, uint32_t height );
    ~Bitmap();

    Bitmap( const Bitmap& ) = delete;
    Bitmap( Bitmap&& other ) noexcept;
    Bitmap& operator=( const Bitmap& ) = delete;
    Bitmap& operator=( Bitmap&& other ) noexcept;

    // Copies src into this bitmap with its top-left corner at (x, y). Source must fit.
    void Blit( const Bitmap& src, uint32_t x, uint32_t y );

    [[nodiscard]] uint32_t Width() const { return m_width; }
    [[nodiscard]] uint32_t Height() const { return m_height; }
    [[nodiscard]] size_t Stride() const { return size_t( m_width ) * Channels; }
    [[nodiscard]] size_t Size() const { return Stride() * m_height; }
    [[nodiscard]] uint8_t* Data() { return m_data; }
    [[nodiscard]] const uint8_t* Data() const { return m_data; }

    // Encoders write to an open stream; closing it and checking the result is left to the caller.
    void SaveJpg( FILE* f, int quality ) const;
    void SavePng( FILE* f ) const;

private:
    uint32_t m_width;
    uint32_t m_height;
    uint8_t* m_data;
};
