#pragma once

#include <string>

#include "util/NoCopy.hpp"

struct Source
{
    enum class Kind
    {
        Url,
        LocalPath
    };

    Kind kind;
    std::string location;
};

// Trims surrounding whitespace and tags the input as a URL when it starts with http:// or https://.
[[nodiscard]] Source ClassifySource( const std::string& input );

enum class Ownership
{
    Owned,
    UserSupplied
};

// Document path resolved for rendering. Owned files are removed when the holder goes away.
class TemporaryFile
{
public:
    TemporaryFile( std::string path, Ownership ownership );
    ~TemporaryFile();

    NoCopyNoMove( TemporaryFile );

    [[nodiscard]] const std::string& Path() const { return m_path; }

private:
    std::string m_path;
    Ownership m_ownership;
};
