#include "wfsdl/csv.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace wfsdl {

CsvReader::CsvReader(const std::string& path, char delimiter)
    : in_(std::filesystem::u8path(path), std::ios::binary), delim_(delimiter)
{
    if (!in_) throw CsvOpenError(path);
    char bom[3] = {};
    in_.read(bom, 3);
    if (!(in_.gcount() == 3 && bom[0] == '\xEF' && bom[1] == '\xBB' && bom[2] == '\xBF')) {
        in_.clear();
        in_.seekg(0);
    }
    read_record(header_);
}

std::optional<std::size_t> CsvReader::find_column(const std::string& needle) const {
    for (std::size_t i = 0; i < header_.size(); ++i) {
        if (header_[i].find(needle) != std::string::npos) return i;
    }
    return std::nullopt;
}

std::size_t CsvReader::require_column(const std::string& needle) const {
    if (auto idx = find_column(needle)) return *idx;
    throw MissingColumnError(needle);
}

bool CsvReader::next(std::vector<std::string>& row) {
    for (;;) {
        if (!read_record(row)) return false;
        if (row.size() == 1 && row[0].empty()) continue;
        if (row.size() < header_.size()) row.resize(header_.size());
        return true;
    }
}

bool CsvReader::read_record(std::vector<std::string>& fields) {
    fields.clear();
    std::string line;
    if (!std::getline(in_, line)) return false;
    ++line_no_;
    record_line_ = line_no_;

    std::string field;
    bool quoted = false;
    bool field_start = true;  // a quote opens a quoted field only here; elsewhere it is literal
    for (;;) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        for (std::size_t i = 0; i < line.size(); ++i) {
            const char c = line[i];
            if (quoted) {
                if (c == '"') {
                    if (i + 1 < line.size() && line[i + 1] == '"') { field += '"'; ++i; }
                    else quoted = false;
                } else {
                    field += c;
                }
            } else if (c == '"' && field_start) {
                quoted = true;
                field_start = false;
            } else if (c == delim_) {
                fields.push_back(std::move(field));
                field.clear();
                field_start = true;
            } else {
                field += c;
                field_start = false;
            }
        }
        if (!quoted) break;
        // quoted field continues on the next physical line
        if (!std::getline(in_, line)) break;
        ++line_no_;
        field += '\n';
    }
    fields.push_back(std::move(field));
    return true;
}

} // namespace wfsdl
