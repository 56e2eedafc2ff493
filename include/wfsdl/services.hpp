#pragma once
#include "wfsdl/csv.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace wfsdl {

inline constexpr const char* kUrlColumn = "Usługa pobierania";
inline constexpr const char* kOrganColumn = "Organ zgłaszający";

struct ServiceEntry {
    std::string organization;
    std::string url;
};

class ServiceListReader {
public:
    // Throws CsvOpenError, MissingColumnError.
    explicit ServiceListReader(const std::string& path);

    // Next row with both fields non-empty; incomplete rows are logged and skipped.
    bool next(ServiceEntry& out);
    std::size_t skipped() const { return skipped_; }

private:
    CsvReader csv_;
    std::size_t url_col_;
    std::size_t organ_col_;
    std::vector<std::string> row_;
    std::size_t skipped_ = 0;
};

std::vector<ServiceEntry> read_service_list(const std::string& path);

// Distinct trimmed non-empty organization names. Only the organization column is required.
std::set<std::string> read_organizations(const std::string& path);

} // namespace wfsdl
