#pragma once
#include <cstddef>
#include <iosfwd>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace wfsdl {

struct VerifyConfig {
    std::string csv_path = "adresywfs.csv";
    std::string base_dir = "wfs_data";
    std::vector<std::string> expected_files = {"ms_budynki.gml", "ms_dzialki.gml"};
};

struct VerificationReport {
    std::set<std::string> missing_directories;
    std::map<std::string, std::vector<std::string>> missing_files;
    std::size_t checked = 0;

    bool complete() const { return missing_directories.empty() && missing_files.empty(); }
};

// Read-only. Throws CsvOpenError, MissingColumnError.
VerificationReport verify(const std::string& csv_path,
                          const std::string& base_dir,
                          const std::vector<std::string>& expected_files);
VerificationReport verify(const VerifyConfig& cfg);

void print_report(std::ostream& os, const VerificationReport& report);

} // namespace wfsdl
