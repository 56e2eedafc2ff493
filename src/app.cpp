#include "wfsdl/app.hpp"
#include "wfsdl/csv.hpp"
#include "wfsdl/http.hpp"
#include "wfsdl/services.hpp"
#include "wfsdl/util.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace wfsdl {

static std::string value_of(int& i, int argc, char** argv) {
    const std::string k = argv[i];
    if (i + 1 >= argc) throw std::invalid_argument("missing value for " + k);
    return argv[++i];
}

static long positive_long(const std::string& flag, const std::string& v) {
    std::size_t pos = 0;
    long n = 0;
    try {
        n = std::stol(v, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("bad value for " + flag + ": " + v);
    }
    if (pos != v.size() || n <= 0) throw std::invalid_argument("bad value for " + flag + ": " + v);
    return n;
}

void FetchApp::usage(const char* prog) {
    std::cerr <<
        "Usage:\n"
        "  " << prog << " [--csv adresywfs.csv] [--out wfs_data] [--format <mime>]\n"
        "      [--workers 10] [--timeout 30] [--layer ms:budynki --layer ms:dzialki]\n\n"
        "Downloads every --layer from each WFS listed in the CSV into <out>/<organization>/.\n";
}

FetchArgs FetchApp::parse_args(int argc, char** argv) {
    FetchArgs a;
    std::vector<std::string> layers;
    for (int i=1; i<argc; ++i) {
        const std::string k = argv[i];
        if (k=="--csv") { a.csv = value_of(i, argc, argv); }
        else if (k=="--out") { a.download.output_dir = value_of(i, argc, argv); }
        else if (k=="--format") { a.download.output_format = value_of(i, argc, argv); }
        else if (k=="--workers") { a.download.max_workers = static_cast<std::size_t>(positive_long(k, value_of(i, argc, argv))); }
        else if (k=="--timeout") { a.download.timeout_s = positive_long(k, value_of(i, argc, argv)); }
        else if (k=="--layer") { layers.push_back(value_of(i, argc, argv)); }
        else if (k=="-h" || k=="--help") { a.help = true; }
        else { throw std::invalid_argument("Unknown arg: " + k); }
    }
    if (!layers.empty()) a.download.layers = std::move(layers);
    return a;
}

int FetchApp::run(int argc, char** argv) {
    FetchArgs args;
    try {
        args = parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        usage(argv[0]);
        return 1;
    }
    if (args.help) { usage(argv[0]); return 0; }

    try {
        CurlGlobal curl;
        HttpClient http;
        Downloader downloader(args.download, http);

        ServiceListReader reader(args.csv);
        print_line(std::cout, "Reading service list from " + args.csv);
        const auto results = downloader.run(reader);

        const DownloadSummary s = summarize(results);
        print_line(std::cout, "\nAll download tasks have been processed.");
        print_line(std::cout, std::to_string(s.succeeded) + "/" + std::to_string(s.total) + " layers saved, " +
                              std::to_string(s.not_defined) + " not defined, " +
                              std::to_string(s.timed_out) + " timed out, " +
                              std::to_string(s.http_errors + s.unexpected) + " failed; " +
                              std::to_string(reader.skipped()) + " rows skipped.");
        return 0;
    } catch (const CsvOpenError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const MissingColumnError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "An error occurred while processing the CSV file: " << e.what() << "\n";
        return 2;
    }
}

void CheckApp::usage(const char* prog) {
    std::cerr <<
        "Usage:\n"
        "  " << prog << " [--csv adresywfs.csv] [--base wfs_data]\n"
        "      [--expect ms_budynki.gml --expect ms_dzialki.gml]\n\n"
        "Reports organizations from the CSV whose directory or expected files are missing.\n";
}

CheckArgs CheckApp::parse_args(int argc, char** argv) {
    CheckArgs a;
    std::vector<std::string> expected;
    for (int i=1; i<argc; ++i) {
        const std::string k = argv[i];
        if (k=="--csv") { a.verify.csv_path = value_of(i, argc, argv); }
        else if (k=="--base") { a.verify.base_dir = value_of(i, argc, argv); }
        else if (k=="--expect") { expected.push_back(value_of(i, argc, argv)); }
        else if (k=="-h" || k=="--help") { a.help = true; }
        else { throw std::invalid_argument("Unknown arg: " + k); }
    }
    if (!expected.empty()) a.verify.expected_files = std::move(expected);
    return a;
}

int CheckApp::run(int argc, char** argv) {
    CheckArgs args;
    try {
        args = parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        usage(argv[0]);
        return 1;
    }
    if (args.help) { usage(argv[0]); return 0; }

    try {
        std::cout << "Starting verification based on " << args.verify.csv_path << "...\n";
        const VerificationReport report = verify(args.verify);
        print_report(std::cout, report);
        return 0;
    } catch (const CsvOpenError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const MissingColumnError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << "\n";
        return 2;
    }
}

} // namespace wfsdl
