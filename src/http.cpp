#include "xarb/http.hpp"
#include "xarb/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <curl/curl.h>
#include <mutex>

namespace xarb {

static std::once_flag curl_init_flag;
static void initCurlOnce() {
  curl_global_init(CURL_GLOBAL_DEFAULT);
  std::atexit(curl_global_cleanup);
}

// ── cURL callbacks ───────────────────────────────────────────────────
static size_t writeCallback(char *data, size_t size, size_t nmemb,
                            void *userp) {
  auto *buf = static_cast<std::string *>(userp);
  buf->append(data, size * nmemb);
  return size * nmemb;
}

static std::string trim(const std::string &s) {
  size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos)
    return "";
  size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

static size_t headerCallback(char *data, size_t size, size_t nitems,
                             void *userp) {
  auto *headers = static_cast<std::map<std::string, std::string> *>(userp);
  std::string line(data, size * nitems);
  auto colon = line.find(':');
  if (colon != std::string::npos) {
    std::string name = trim(line.substr(0, colon));
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    (*headers)[name] = trim(line.substr(colon + 1));
  }
  return size * nitems;
}

std::string HttpResponse::header(const std::string &name) const {
  std::string key = name;
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  auto it = headers.find(key);
  return it == headers.end() ? "" : it->second;
}

// ── Request ──────────────────────────────────────────────────────────
HttpResponse httpRequest(const std::string &method, const std::string &url,
                         const std::vector<std::string> &headers,
                         const std::string &body, long timeout_s) {
  std::call_once(curl_init_flag, initCurlOnce);

  CURL *curl = curl_easy_init();
  if (!curl)
    throw TransientVenueError("Failed to init curl");

  HttpResponse resp;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &resp.headers);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

  if (method == "POST") {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  } else if (method != "GET") {
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    if (!body.empty())
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  }

  struct curl_slist *hdrs = nullptr;
  for (const auto &h : headers)
    hdrs = curl_slist_append(hdrs, h.c_str());
  if (hdrs)
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, hdrs);

  CURLcode res = curl_easy_perform(curl);
  if (res == CURLE_OK)
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
  curl_slist_free_all(hdrs);
  curl_easy_cleanup(curl);

  if (res != CURLE_OK)
    throw TransientVenueError(std::string("HTTP ") + method +
                              " failed: " + curl_easy_strerror(res));
  return resp;
}

std::string urlEncode(const std::string &s) {
  static const char *hex = "0123456789ABCDEF";
  std::string out;
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
        c == ',') {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += hex[c >> 4];
      out += hex[c & 0x0F];
    }
  }
  return out;
}

} // namespace xarb
