#include "wfsdl/http.hpp"

#include <curl/curl.h>
#include <new>
#include <stdexcept>
#include <string>

namespace wfsdl {

static size_t curl_writestring(void* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    try {
        body->append(static_cast<const char*>(ptr), size * nmemb);
    } catch (const std::bad_alloc&) {
        return 0;  // makes curl abort with CURLE_WRITE_ERROR
    }
    return size * nmemb;
}

CurlGlobal::CurlGlobal() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        throw std::runtime_error("curl global init failed");
    }
}

CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

HttpResponse HttpClient::get(const std::string& url, long timeout_s) const {
    CURL* curl = curl_easy_init();
    if (!curl) throw TransportError("curl init failed");

    HttpResponse resp;
    char errbuf[CURL_ERROR_SIZE] = {};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_writestring);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "wfsdl/1.0");
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    // no SIGALRM-based DNS timeouts from worker threads
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, timeout_s);
    // read timeout: abort when less than 1 byte/s arrives for timeout_s seconds
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, timeout_s);

    const CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        std::string msg = errbuf[0] ? errbuf : curl_easy_strerror(res);
        throw TransportError(msg, res == CURLE_OPERATION_TIMEDOUT);
    }
    return resp;
}

} // namespace wfsdl
