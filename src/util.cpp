#include "wfsdl/util.hpp"

#include <filesystem>
#include <mutex>
#include <ostream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace wfsdl {

namespace fs = std::filesystem;

void ensure_dir(const std::string& path) {
    std::error_code ec;
    fs::create_directories(fs::u8path(path), ec);
    // a concurrent creator may win the race; only a path that is still not a directory is an error
    if (ec && !fs::is_directory(fs::u8path(path))) {
        throw std::runtime_error("cannot create directory " + path + ": " + ec.message());
    }
}

bool is_http_url(const std::string& s) {
    return s.rfind("http://", 0) == 0 || s.rfind("https://", 0) == 0;
}

// ASCII whitespace plus UTF-8 NO-BREAK SPACE (C2 A0), common in spreadsheet exports.
std::string trim(const std::string& s) {
    static const std::string ws = " \t\r\n\v\f";
    static const std::string nbsp = "\xC2\xA0";
    std::size_t b = 0, e = s.size();
    for (;;) {
        if (b < e && ws.find(s[b]) != std::string::npos) ++b;
        else if (e - b >= 2 && s.compare(b, 2, nbsp) == 0) b += 2;
        else break;
    }
    for (;;) {
        if (e > b && ws.find(s[e - 1]) != std::string::npos) --e;
        else if (e - b >= 2 && s.compare(e - 2, 2, nbsp) == 0) e -= 2;
        else break;
    }
    return s.substr(b, e - b);
}

void print_line(std::ostream& os, const std::string& line) {
    static std::mutex mu;
    std::lock_guard<std::mutex> lock(mu);
    os << line << '\n';
    os.flush();
}

} // namespace wfsdl
