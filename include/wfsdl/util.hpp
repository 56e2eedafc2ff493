#pragma once
#include <iosfwd>
#include <string>

namespace wfsdl {

// Creates path and all parents; an existing directory is not an error.
// Throws std::runtime_error if path cannot be made a directory.
void ensure_dir(const std::string& path);
bool is_http_url(const std::string& s);
std::string trim(const std::string& s);

// Writes one line under a process-wide lock, so lines from worker threads never interleave.
void print_line(std::ostream& os, const std::string& line);

} // namespace wfsdl
