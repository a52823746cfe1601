#include "repochurn/http.hpp"

#include "repochurn/errors.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace repochurn::http {

namespace {

struct EasyDeleter {
  void operator()(CURL *c) const noexcept { curl_easy_cleanup(c); }
};
struct SlistDeleter {
  void operator()(curl_slist *l) const noexcept { curl_slist_free_all(l); }
};
using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

// Callback function for curl to append response bytes
size_t write_body(char *contents, size_t size, size_t nmemb, void *userdata) {
  auto *body = static_cast<std::vector<std::uint8_t> *>(userdata);
  const size_t total = size * nmemb;
  body->insert(body->end(), reinterpret_cast<std::uint8_t *>(contents),
               reinterpret_cast<std::uint8_t *>(contents) + total);
  return total;
}

HeaderList build_headers(const Headers &headers) {
  HeaderList list;
  for (const auto &[name, value] : headers) {
    const std::string line = name + ": " + value;
    curl_slist *next = curl_slist_append(list.get(), line.c_str());
    if (next == nullptr) {
      throw TransportError("curl_slist_append failed");
    }
    (void)list.release();
    list.reset(next);
  }
  return list;
}

void check(CURLcode rc, const char *what) {
  if (rc != CURLE_OK) {
    throw TransportError(std::string(what) + ": " + curl_easy_strerror(rc));
  }
}

} // namespace

// PIMPL keeps curl out of the public header
struct CurlTransport::Impl {
  CurlOptions options;

  explicit Impl(CurlOptions opts) : options(std::move(opts)) {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw TransportError("curl_global_init failed");
    }
  }
  ~Impl() { curl_global_cleanup(); }

  Impl(const Impl &) = delete;
  auto operator=(const Impl &) -> Impl & = delete;

  auto perform(const std::string &url, const std::string *post_body, const Headers &headers)
      -> Response {
    EasyHandle curl{curl_easy_init()};
    if (!curl) {
      throw TransportError("failed to initialize curl");
    }
    Response res;
    const HeaderList list = build_headers(headers);

    check(curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str()), "CURLOPT_URL");
    check(curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get()), "CURLOPT_HTTPHEADER");
    check(curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body), "CURLOPT_WRITEFUNCTION");
    check(curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &res.body), "CURLOPT_WRITEDATA");
    check(curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L), "CURLOPT_FOLLOWLOCATION");
    check(curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options.user_agent.c_str()),
          "CURLOPT_USERAGENT");
    check(curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options.timeout_seconds), "CURLOPT_TIMEOUT");
    if (post_body != nullptr) {
      check(curl_easy_setopt(curl.get(), CURLOPT_POST, 1L), "CURLOPT_POST");
      check(curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, post_body->data()),
            "CURLOPT_POSTFIELDS");
      check(curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(post_body->size())),
            "CURLOPT_POSTFIELDSIZE_LARGE");
    }

    spdlog::debug("{} {}", post_body != nullptr ? "POST" : "GET", url);
    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
      throw TransportError("request to " + url + " failed: " + curl_easy_strerror(rc));
    }

    check(curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &res.status),
          "CURLINFO_RESPONSE_CODE");
    char *ctype = nullptr;
    check(curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &ctype), "CURLINFO_CONTENT_TYPE");
    if (ctype != nullptr) {
      res.content_type = ctype;
    }
    spdlog::debug("HTTP {} ({}), {} bytes", res.status, res.content_type, res.body.size());
    return res;
  }
};

CurlTransport::CurlTransport(CurlOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

CurlTransport::~CurlTransport() = default;

auto CurlTransport::get(const std::string &url, const Headers &headers) -> Response {
  return impl_->perform(url, nullptr, headers);
}

auto CurlTransport::post(const std::string &url, const std::string &body, const Headers &headers)
    -> Response {
  return impl_->perform(url, &body, headers);
}

} // namespace repochurn::http
