#include "wfsdl/verify.hpp"
#include "wfsdl/sanitize.hpp"
#include "wfsdl/services.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <system_error>
#include <vector>

namespace wfsdl {

namespace fs = std::filesystem;

VerificationReport verify(const std::string& csv_path,
                          const std::string& base_dir,
                          const std::vector<std::string>& expected_files)
{
    VerificationReport report;
    const fs::path base = fs::u8path(base_dir);

    for (const auto& organ : read_organizations(csv_path)) {
        ++report.checked;
        const std::string name = sanitize_name(organ);
        // the fetch program never creates a directory for such a name
        if (!is_usable_dir_name(name)) {
            report.missing_directories.insert(organ);
            continue;
        }
        const fs::path dir = base / fs::u8path(name);
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            report.missing_directories.insert(organ);
            continue;
        }
        std::vector<std::string> missing;
        for (const auto& name : expected_files) {
            if (!fs::exists(dir / fs::u8path(name), ec)) missing.push_back(name);
        }
        if (!missing.empty()) report.missing_files.emplace(organ, std::move(missing));
    }
    return report;
}

VerificationReport verify(const VerifyConfig& cfg) {
    return verify(cfg.csv_path, cfg.base_dir, cfg.expected_files);
}

void print_report(std::ostream& os, const VerificationReport& report) {
    os << "\n--- Verification Report ---\n";
    os << "Organizations checked: " << report.checked << "\n";

    if (report.complete()) {
        os << "✓ All directories and files are present. Verification successful!\n";
        return;
    }

    if (!report.missing_directories.empty()) {
        os << "\n✗ Missing Directories:\n";
        for (const auto& name : report.missing_directories) os << "  - " << name << "\n";
    }

    if (!report.missing_files.empty()) {
        os << "\n✗ Missing Files in Existing Directories:\n";
        for (const auto& [organ, files] : report.missing_files) {
            os << "  - In '" << organ << "': missing ";
            for (std::size_t i = 0; i < files.size(); ++i) {
                if (i) os << ", ";
                os << files[i];
            }
            os << "\n";
        }
    }
}

} // namespace wfsdl
