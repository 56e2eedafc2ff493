#include "wfsdl/csv.hpp"
#include "wfsdl/verify.hpp"

#include "test_support.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

int main() {
    using namespace wfsdl;
    using wfsdl_test::scratch_dir;
    using wfsdl_test::write_file;

    const auto root = scratch_dir("verify");
    const auto csv = root / "adresywfs.csv";
    write_file(csv,
        "\xEF\xBB\xBF" "Lp.;Organ zgłaszający (nazwa);Usługa pobierania\n"
        "1;Gmina Pełna;https://a.example/wfs\n"
        "2;Gmina Częściowa;https://b.example/wfs\n"
        "3;Gmina Brak;https://c.example/wfs\n"
        "4;Starosta: Powiat \"Nowy\";https://d.example/wfs\n"
        "5;Gmina Pełna;https://e.example/wfs\n"
        "6;;https://f.example/wfs\n");

    const auto base = root / "wfs_data";
    fs::create_directories(base / fs::u8path("Gmina Pełna"));
    write_file(base / fs::u8path("Gmina Pełna") / "ms_budynki.gml", "a");
    write_file(base / fs::u8path("Gmina Pełna") / "ms_dzialki.gml", "b");
    fs::create_directories(base / fs::u8path("Gmina Częściowa"));
    write_file(base / fs::u8path("Gmina Częściowa") / "ms_budynki.gml", "a");
    // found through the sanitized name
    fs::create_directories(base / fs::u8path("Starosta Powiat Nowy"));
    write_file(base / fs::u8path("Starosta Powiat Nowy") / "ms_budynki.gml", "a");
    write_file(base / fs::u8path("Starosta Powiat Nowy") / "ms_dzialki.gml", "b");

    const std::vector<std::string> expected = {"ms_budynki.gml", "ms_dzialki.gml"};
    const auto report = verify(csv.string(), base.string(), expected);

    assert(report.checked == 4);
    assert(!report.complete());
    assert(report.missing_directories.size() == 1);
    assert(report.missing_directories.count("Gmina Brak") == 1);
    // a missing directory is not reported again as missing files
    assert(report.missing_files.count("Gmina Brak") == 0);
    assert(report.missing_files.size() == 1);
    const auto& partial = report.missing_files.at("Gmina Częściowa");
    assert(partial.size() == 1);
    assert(partial[0] == "ms_dzialki.gml");

    {
        std::ostringstream os;
        print_report(os, report);
        const std::string text = os.str();
        assert(text.find("Missing Directories") != std::string::npos);
        assert(text.find("  - Gmina Brak\n") != std::string::npos);
        assert(text.find("  - In 'Gmina Częściowa': missing ms_dzialki.gml\n") != std::string::npos);
        assert(text.find("Verification successful") == std::string::npos);
        assert(text.find("Missing Directories") < text.find("Missing Files"));
    }

    // a regular file where the directory should be counts as a missing directory
    write_file(base / fs::u8path("Gmina Brak"), "oops");
    assert(verify(csv.string(), base.string(), expected).missing_directories.count("Gmina Brak") == 1);
    fs::remove(base / fs::u8path("Gmina Brak"));

    // the audit never touches the tree
    assert(!fs::exists(base / fs::u8path("Gmina Brak")));

    // complete tree
    {
        fs::create_directories(base / fs::u8path("Gmina Brak"));
        write_file(base / fs::u8path("Gmina Brak") / "ms_budynki.gml", "a");
        write_file(base / fs::u8path("Gmina Brak") / "ms_dzialki.gml", "b");
        write_file(base / fs::u8path("Gmina Częściowa") / "ms_dzialki.gml", "b");

        VerifyConfig cfg;
        cfg.csv_path = csv.string();
        cfg.base_dir = base.string();
        const auto ok = verify(cfg);
        assert(ok.complete());

        std::ostringstream os;
        print_report(os, ok);
        assert(os.str().find("All directories and files are present") != std::string::npos);
    }

    // configured expectations replace the defaults
    {
        const auto r = verify(csv.string(), base.string(), {"ms_budynki.gml", "ms_adresy.gml"});
        assert(r.missing_files.size() == 4);
        for (const auto& [organ, files] : r.missing_files) {
            assert(files.size() == 1);
            assert(files[0] == "ms_adresy.gml");
        }
    }

    // a name that sanitizes to nothing maps to no directory, so files in the base
    // directory itself never count for it
    {
        const auto csv2 = root / "empty_names.csv";
        write_file(csv2,
            "Organ zgłaszający;Usługa pobierania\n"
            "???;https://x.example/wfs\n"
            "..;https://y.example/wfs\n"
            "Gmina Pełna;https://a.example/wfs\n");
        write_file(base / "ms_budynki.gml", "a");
        write_file(base / "ms_dzialki.gml", "b");

        const auto r = verify(csv2.string(), base.string(), expected);
        assert(r.checked == 3);
        assert(r.missing_directories.size() == 2);
        assert(r.missing_directories.count("???") == 1);
        assert(r.missing_directories.count("..") == 1);
        assert(r.missing_files.empty());
        assert(!r.complete());
        fs::remove(base / "ms_budynki.gml");
        fs::remove(base / "ms_dzialki.gml");
    }

    {
        bool thrown = false;
        try {
            verify((root / "missing.csv").string(), base.string(), expected);
        } catch (const CsvOpenError&) {
            thrown = true;
        }
        assert(thrown);

        const auto bad = root / "bad.csv";
        write_file(bad, "Organ;Usługa pobierania\nx;y\n");
        thrown = false;
        try {
            verify(bad.string(), base.string(), expected);
        } catch (const MissingColumnError&) {
            thrown = true;
        }
        assert(thrown);
    }

    std::cout << "test_verify: OK\n";
    return 0;
}
