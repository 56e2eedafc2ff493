#include "wfsdl/services.hpp"
#include "wfsdl/util.hpp"

#include <iostream>
#include <string>

namespace wfsdl {

ServiceListReader::ServiceListReader(const std::string& path)
    : csv_(path),
      url_col_(csv_.require_column(kUrlColumn)),
      organ_col_(csv_.require_column(kOrganColumn))
{}

bool ServiceListReader::next(ServiceEntry& out) {
    while (csv_.next(row_)) {
        std::string url = trim(row_[url_col_]);
        std::string organ = trim(row_[organ_col_]);
        if (url.empty() || organ.empty()) {
            ++skipped_;
            print_line(std::cout, "Skipping row at line " + std::to_string(csv_.line()) +
                                  " due to missing URL or organization name.");
            continue;
        }
        out.organization = std::move(organ);
        out.url = std::move(url);
        return true;
    }
    return false;
}

std::vector<ServiceEntry> read_service_list(const std::string& path) {
    ServiceListReader reader(path);
    std::vector<ServiceEntry> entries;
    ServiceEntry e;
    while (reader.next(e)) entries.push_back(e);
    return entries;
}

std::set<std::string> read_organizations(const std::string& path) {
    CsvReader csv(path);
    const std::size_t col = csv.require_column(kOrganColumn);
    std::set<std::string> names;
    std::vector<std::string> row;
    while (csv.next(row)) {
        std::string name = trim(row[col]);
        if (!name.empty()) names.insert(std::move(name));
    }
    return names;
}

} // namespace wfsdl
