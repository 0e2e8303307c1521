#pragma once

#include <cstddef>
#include <string>

namespace vpconv {

std::string trim(const std::string& s);

std::string to_lower(std::string s);

bool starts_with(const std::string& s, const std::string& prefix);

// Case-insensitive (ASCII) helpers used by the channel-name heuristics.
bool istarts_with(const std::string& s, const std::string& prefix);
bool icontains(const std::string& s, const std::string& needle);

// Strict numeric parsing: surrounding whitespace is ignored, anything else
// after the number is an error. to_double() always uses the "C" locale.
// Both throw std::runtime_error.
int to_int(const std::string& s);
double to_double(const std::string& s);

bool file_exists(const std::string& path);

// Remove a file if it exists (best-effort). Returns true if nothing is left
// at the path afterwards.
bool remove_file_quiet(const std::string& path);

// Write a text file through a temporary file in the same directory that is
// renamed into place, so readers never see a half-written file.
//
// Parent directories are NOT created; a missing directory is a failure.
// The temporary file is removed on failure. Returns true on success.
bool write_text_file_atomic(const std::string& path, const std::string& content);

// Random hexadecimal token (2*n_bytes characters) for temporary file names.
std::string random_hex_token(size_t n_bytes = 8);

// Escape a string for inclusion in a JSON string value (no surrounding quotes).
std::string json_escape(const std::string& s);

// Format a number for JSON output ("null" for non-finite values).
// Integral values are written without a fractional part.
std::string json_number(double x);

} // namespace vpconv
