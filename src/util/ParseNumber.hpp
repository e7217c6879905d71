#pragma once

// Whole-string numeric parsing; fails on trailing characters or values out of range.
bool ParseNumber( const char* str, double& out );
bool ParseNumber( const char* str, int& out );
