#include "wfsdl/downloader.hpp"
#include "wfsdl/sanitize.hpp"
#include "wfsdl/thread_pool.hpp"
#include "wfsdl/util.hpp"

#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace wfsdl {

namespace fs = std::filesystem;

const char* to_string(Outcome o) {
    switch (o) {
    case Outcome::Success:         return "success";
    case Outcome::Timeout:         return "timeout";
    case Outcome::HttpError:       return "http error";
    case Outcome::LayerNotDefined: return "layer not defined";
    case Outcome::UnexpectedError: return "unexpected error";
    }
    return "unknown";
}

DownloadSummary summarize(const std::vector<DownloadResult>& results) {
    DownloadSummary s;
    s.total = results.size();
    for (const auto& r : results) {
        switch (r.outcome) {
        case Outcome::Success:         ++s.succeeded; break;
        case Outcome::Timeout:         ++s.timed_out; break;
        case Outcome::HttpError:       ++s.http_errors; break;
        case Outcome::LayerNotDefined: ++s.not_defined; break;
        case Outcome::UnexpectedError: ++s.unexpected; break;
        }
    }
    return s;
}

Downloader::Downloader(DownloadConfig cfg, const HttpClient& http)
    : cfg_(std::move(cfg)), http_(http) {}

static DownloadResult fail(DownloadResult r, Outcome o, std::string detail) {
    r.outcome = o;
    r.detail = std::move(detail);
    switch (o) {
    case Outcome::Timeout:
        print_line(std::cout, "  -> TIMEOUT: for " + r.layer + " from " + r.url);
        break;
    case Outcome::LayerNotDefined:
        print_line(std::cout, "  -> INFO: Layer " + r.layer + " not found on " + r.url + ". Skipping.");
        break;
    case Outcome::HttpError:
        print_line(std::cerr, "  -> ERROR: Could not download " + r.layer + " from " + r.url +
                              ". Reason: " + r.detail);
        break;
    default:
        print_line(std::cerr, "  -> UNEXPECTED ERROR: for " + r.layer + " from " + r.url +
                              ". Reason: " + r.detail);
        break;
    }
    return r;
}

std::string Downloader::write_layer(const LayerRequest& req, const std::string& body) const {
    const fs::path dir = fs::u8path(cfg_.output_dir) / fs::u8path(sanitize_name(req.entry.organization));
    ensure_dir(dir.u8string());

    const fs::path target = dir / fs::u8path(layer_file_name(req.layer));
    // unique per thread so duplicate rows racing on one target never share a temp file
    std::ostringstream tmpname;
    tmpname << '.' << target.filename().u8string() << ".part-"
            << std::hash<std::thread::id>{}(std::this_thread::get_id());
    const fs::path tmp = dir / fs::u8path(tmpname.str());

    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) throw std::runtime_error("cannot open output file: " + tmp.u8string());
        f.write(body.data(), static_cast<std::streamsize>(body.size()));
        f.close();
        if (!f) {
            std::error_code ec;
            fs::remove(tmp, ec);
            throw std::runtime_error("cannot write output file: " + tmp.u8string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code rm;
        fs::remove(tmp, rm);
        throw std::runtime_error("cannot move " + tmp.u8string() + " to " + target.u8string() +
                                 ": " + ec.message());
    }
    return target.u8string();
}

DownloadResult Downloader::fetch_layer(const LayerRequest& req) const {
    DownloadResult r;
    r.organization = req.entry.organization;
    r.layer = req.layer;
    r.url = req.entry.url;

    if (!is_http_url(req.entry.url)) {
        return fail(std::move(r), Outcome::HttpError, "not an http(s) URL");
    }
    if (!is_usable_dir_name(sanitize_name(req.entry.organization))) {
        return fail(std::move(r), Outcome::UnexpectedError,
                    "organization name is empty after sanitization");
    }

    HttpResponse resp;
    try {
        resp = http_.get(get_feature_url(req.entry.url, req.layer, cfg_.output_format),
                         cfg_.timeout_s);
    } catch (const TransportError& e) {
        return fail(std::move(r), e.timed_out() ? Outcome::Timeout : Outcome::HttpError, e.what());
    } catch (const std::exception& e) {
        return fail(std::move(r), Outcome::UnexpectedError, e.what());
    }

    if (!resp.ok()) {
        if (is_layer_not_defined(resp.body)) {
            return fail(std::move(r), Outcome::LayerNotDefined, "HTTP " + std::to_string(resp.status));
        }
        return fail(std::move(r), Outcome::HttpError, "HTTP " + std::to_string(resp.status));
    }

    try {
        r.path = write_layer(req, resp.body);
    } catch (const std::exception& e) {
        return fail(std::move(r), Outcome::UnexpectedError, e.what());
    }

    r.outcome = Outcome::Success;
    print_line(std::cout, "  -> ✓ SUCCESS: Saved " + r.layer + " from " + r.url + " to " + r.path);
    return r;
}

std::vector<DownloadResult> Downloader::run(const std::vector<ServiceEntry>& entries) const {
    std::size_t i = 0;
    return run_with([&](ServiceEntry& out) {
        if (i >= entries.size()) return false;
        out = entries[i++];
        return true;
    });
}

std::vector<DownloadResult> Downloader::run(ServiceListReader& reader) const {
    return run_with([&](ServiceEntry& out) { return reader.next(out); });
}

std::vector<DownloadResult> Downloader::run_with(const next_fn_t& next) const {
    print_line(std::cout, "Starting parallel download process (max_workers=" +
                          std::to_string(cfg_.max_workers) + ")...");

    std::vector<LayerRequest> requests;
    std::vector<std::future<DownloadResult>> futures;
    {
        ThreadPool pool(cfg_.max_workers);
        ServiceEntry e;
        while (next(e)) {
            print_line(std::cout, "Processing: " + e.organization);
            for (const auto& layer : cfg_.layers) {
                requests.push_back(LayerRequest{e, layer});
                futures.push_back(pool.enqueue([this, req = requests.back()] { return fetch_layer(req); }));
            }
        }
        // pool destructor waits for every queued task
    }

    std::vector<DownloadResult> results;
    results.reserve(futures.size());
    for (std::size_t i = 0; i < futures.size(); ++i) {
        try {
            results.push_back(futures[i].get());
        } catch (const std::exception& ex) {
            DownloadResult r;
            r.organization = requests[i].entry.organization;
            r.layer = requests[i].layer;
            r.url = requests[i].entry.url;
            results.push_back(fail(std::move(r), Outcome::UnexpectedError, ex.what()));
        }
    }
    return results;
}

} // namespace wfsdl
