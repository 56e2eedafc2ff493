#include "wfsdl/wfs.hpp"
#include "wfsdl/http.hpp"

#include <curl/curl.h>
#include <string>
#include <utility>
#include <vector>

namespace wfsdl {

std::string get_feature_url(const std::string& base_url,
                            const std::string& layer,
                            const std::string& output_format)
{
    CURLU* u = curl_url();
    if (!u) throw TransportError("curl_url failed");

    CURLUcode rc = curl_url_set(u, CURLUPART_URL, base_url.c_str(), 0);
    if (rc != CURLUE_OK) {
        curl_url_cleanup(u);
        throw TransportError("invalid URL '" + base_url + "': " + curl_url_strerror(rc));
    }

    const std::vector<std::pair<const char*, std::string>> params = {
        {"service", "WFS"},
        {"version", "2.0.0"},
        {"request", "GetFeature"},
        {"typeName", layer},
        {"outputFormat", output_format},
    };
    for (const auto& [key, value] : params) {
        const std::string kv = std::string(key) + "=" + value;
        rc = curl_url_set(u, CURLUPART_QUERY, kv.c_str(), CURLU_APPENDQUERY | CURLU_URLENCODE);
        if (rc != CURLUE_OK) {
            curl_url_cleanup(u);
            throw TransportError(std::string("cannot append query parameter ") + key + ": " +
                                 curl_url_strerror(rc));
        }
    }

    char* out = nullptr;
    rc = curl_url_get(u, CURLUPART_URL, &out, 0);
    curl_url_cleanup(u);
    if (rc != CURLUE_OK) throw TransportError(std::string("cannot build URL: ") + curl_url_strerror(rc));
    std::string url(out);
    curl_free(out);
    return url;
}

bool is_layer_not_defined(const std::string& body) {
    return body.find("LayerNotDefined") != std::string::npos;
}

} // namespace wfsdl
