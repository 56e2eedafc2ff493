#include "wfsdl/sanitize.hpp"
#include "wfsdl/util.hpp"

#include <algorithm>
#include <cstring>
#include <iterator>
#include <string>

namespace wfsdl {

static bool is_forbidden(char c) {
    return c != '\0' && std::strchr("\\/*?:\"<>|", c) != nullptr;
}

std::string sanitize_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    std::copy_if(name.begin(), name.end(), std::back_inserter(out),
                 [](char c) { return !is_forbidden(c); });
    return trim(out);
}

bool is_usable_dir_name(const std::string& sanitized) {
    return !sanitized.empty() && sanitized != "." && sanitized != "..";
}

std::string layer_file_name(const std::string& layer) {
    std::string s = layer;
    std::replace(s.begin(), s.end(), ':', '_');
    return sanitize_name(s) + ".gml";
}

} // namespace wfsdl
