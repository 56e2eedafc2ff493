#pragma once
#include "wfsdl/http.hpp"
#include "wfsdl/services.hpp"
#include "wfsdl/wfs.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace wfsdl {

struct DownloadConfig {
    std::vector<std::string> layers = {"ms:budynki", "ms:dzialki"};
    std::string output_dir = "wfs_data";
    std::string output_format = kDefaultOutputFormat;
    std::size_t max_workers = 10;
    long timeout_s = 30;
};

struct LayerRequest {
    ServiceEntry entry;
    std::string layer;
};

enum class Outcome {
    Success,
    Timeout,
    HttpError,
    LayerNotDefined,
    UnexpectedError,
};

const char* to_string(Outcome o);

struct DownloadResult {
    std::string organization;
    std::string layer;
    std::string url;
    Outcome outcome = Outcome::UnexpectedError;
    std::string path;    // written file, Success only
    std::string detail;  // failure reason
};

struct DownloadSummary {
    std::size_t total = 0;
    std::size_t succeeded = 0;
    std::size_t timed_out = 0;
    std::size_t http_errors = 0;
    std::size_t not_defined = 0;
    std::size_t unexpected = 0;
};

DownloadSummary summarize(const std::vector<DownloadResult>& results);

class Downloader {
public:
    Downloader(DownloadConfig cfg, const HttpClient& http);

    // One GET and, on success, one file. Every failure becomes a classified result.
    DownloadResult fetch_layer(const LayerRequest& req) const;

    // Runs entries x layers on max_workers threads and waits for all of them.
    // Results are in submission order.
    std::vector<DownloadResult> run(const std::vector<ServiceEntry>& entries) const;
    // Same, submitting tasks while the CSV is still being read.
    std::vector<DownloadResult> run(ServiceListReader& reader) const;

    const DownloadConfig& config() const { return cfg_; }

private:
    using next_fn_t = std::function<bool(ServiceEntry&)>;
    std::vector<DownloadResult> run_with(const next_fn_t& next) const;
    std::string write_layer(const LayerRequest& req, const std::string& body) const;

    DownloadConfig cfg_;
    const HttpClient& http_;
};

} // namespace wfsdl
