#pragma once
#include <string>

namespace wfsdl {

// Strips \ / * ? : " < > | and surrounding whitespace. Shared by fetch and check;
// both must agree or the audit reports false misses.
std::string sanitize_name(const std::string& name);

// False for "", "." and "..": such a name would resolve to the parent directory or
// above it instead of a subdirectory of its own.
bool is_usable_dir_name(const std::string& sanitized);

// "ms:budynki" -> "ms_budynki.gml"
std::string layer_file_name(const std::string& layer);

} // namespace wfsdl
