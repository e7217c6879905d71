#pragma once

#include <string>

std::string GetHome();
std::string ExpandHome( const char* path );

bool FileExists( const char* path );
bool RemoveFile( const char* path );
bool RenameFile( const char* from, const char* to );

const char* FileExtension( const char* path );
