#pragma once
#include "wfsdl/downloader.hpp"
#include "wfsdl/verify.hpp"

#include <string>

namespace wfsdl {

struct FetchArgs {
    std::string csv = "adresywfs.csv";
    DownloadConfig download;
    bool help = false;
};

struct CheckArgs {
    VerifyConfig verify;
    bool help = false;
};

// parse_args throws std::invalid_argument on an unknown flag or a bad value.
class FetchApp {
public:
    int run(int argc, char** argv);
    static FetchArgs parse_args(int argc, char** argv);
private:
    static void usage(const char* prog);
};

class CheckApp {
public:
    int run(int argc, char** argv);
    static CheckArgs parse_args(int argc, char** argv);
private:
    static void usage(const char* prog);
};

} // namespace wfsdl
