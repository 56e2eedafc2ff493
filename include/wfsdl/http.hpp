#pragma once
#include <stdexcept>
#include <string>

namespace wfsdl {

struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

class TransportError : public std::runtime_error {
public:
    TransportError(const std::string& what, bool timed_out = false)
        : std::runtime_error(what), timed_out_(timed_out) {}
    bool timed_out() const { return timed_out_; }
private:
    bool timed_out_;
};

// curl_global_init/cleanup for the lifetime of the program.
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Blocking GET. timeout_s bounds connecting and any stall in the transfer.
    // Returns the response whatever its status; throws TransportError when no
    // complete response was received.
    virtual HttpResponse get(const std::string& url, long timeout_s) const;
};

} // namespace wfsdl
