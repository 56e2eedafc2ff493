#pragma once
#include <string>

namespace wfsdl {

inline constexpr const char* kDefaultOutputFormat = "application/gml+xml; version=3.2";

// base_url + service=WFS&version=2.0.0&request=GetFeature&typeName=..&outputFormat=..
// Values are URL-encoded; an existing query string is kept. Throws TransportError
// if base_url cannot be parsed.
std::string get_feature_url(const std::string& base_url,
                            const std::string& layer,
                            const std::string& output_format);

// Servers answer a request for an unknown typeName with an OWS exception report
// naming LayerNotDefined. Matching on that text depends on the server's wording.
bool is_layer_not_defined(const std::string& body);

} // namespace wfsdl
