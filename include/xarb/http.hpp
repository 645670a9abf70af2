#pragma once
#include <map>
#include <string>
#include <vector>

namespace xarb {

struct HttpResponse {
  long status = 0;
  std::string body;
  std::map<std::string, std::string> headers; // names lowercased

  std::string header(const std::string &name) const;
};

// Blocking request over libcurl with a hard timeout. Network failures throw
// TransientVenueError; HTTP status codes are returned as-is.
HttpResponse httpRequest(const std::string &method, const std::string &url,
                         const std::vector<std::string> &headers,
                         const std::string &body = "", long timeout_s = 15);

// Percent-encode a query parameter value.
std::string urlEncode(const std::string &s);

} // namespace xarb
