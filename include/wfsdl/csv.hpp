#pragma once
#include <cstddef>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace wfsdl {

class CsvOpenError : public std::runtime_error {
public:
    explicit CsvOpenError(const std::string& path)
        : std::runtime_error("the file " + path + " was not found"), path_(path) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

class MissingColumnError : public std::runtime_error {
public:
    explicit MissingColumnError(const std::string& needle)
        : std::runtime_error("could not find the required column '" + needle + "' in the CSV"),
          needle_(needle) {}
    const std::string& column() const { return needle_; }
private:
    std::string needle_;
};

// Single-pass reader for delimited text with a header row. Handles a UTF-8 BOM,
// double-quoted fields ("" escapes, embedded delimiters and newlines) and CRLF.
class CsvReader {
public:
    explicit CsvReader(const std::string& path, char delimiter = ';');

    const std::vector<std::string>& header() const { return header_; }
    std::optional<std::size_t> find_column(const std::string& needle) const;
    std::size_t require_column(const std::string& needle) const;

    // Fills row with the next record, padded to the header width. False at end of file.
    bool next(std::vector<std::string>& row);
    // Physical line on which the last record returned by next() started.
    std::size_t line() const { return record_line_; }

private:
    bool read_record(std::vector<std::string>& fields);

    std::ifstream in_;
    char delim_;
    std::vector<std::string> header_;
    std::size_t line_no_ = 0;
    std::size_t record_line_ = 0;
};

} // namespace wfsdl
