#pragma once

// Always-on assert for test executables. Release builds define NDEBUG, which
// would otherwise compile the checks away.

#include <cassert>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace wfsdl_test {

inline void fail(const char* expr, const char* file, int line) {
    std::cerr << "Test assertion failed: " << expr << " (" << file << ":" << line << ")\n";
    std::exit(1);
}

// Fresh empty directory under the system temp dir.
inline std::filesystem::path scratch_dir(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / ("wfsdl_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

inline void write_file(const std::filesystem::path& p, const std::string& content) {
    std::ofstream out(p, std::ios::binary);
    out << content;
}

inline std::string read_file(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace wfsdl_test

#ifndef WFSDL_TEST_ASSERT
#define WFSDL_TEST_ASSERT(expr) \
    (static_cast<bool>(expr) ? (void)0 : ::wfsdl_test::fail(#expr, __FILE__, __LINE__))
#endif

#ifdef assert
#undef assert
#endif
#define assert(expr) WFSDL_TEST_ASSERT(expr)
