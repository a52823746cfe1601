#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace repochurn::http {

using Headers = std::vector<std::pair<std::string, std::string>>;

struct Response {
  long status = 0;
  std::string content_type; // as sent by the server, empty if absent
  std::vector<std::uint8_t> body;

  [[nodiscard]] bool ok() const { return status >= 200 && status < 300; }
};

// Blocking HTTP client seam. Network failures throw TransportError;
// non-2xx statuses are returned, not thrown.
class Transport {
public:
  virtual ~Transport() = default;

  virtual auto get(const std::string &url, const Headers &headers) -> Response = 0;
  virtual auto post(const std::string &url, const std::string &body, const Headers &headers)
      -> Response = 0;
};

struct CurlOptions {
  long timeout_seconds = 60; // 0 disables the timeout
  std::string user_agent = "repochurn";
};

// libcurl-backed transport. Follows redirects.
class CurlTransport final : public Transport {
public:
  explicit CurlTransport(CurlOptions options = {});
  ~CurlTransport() override;

  CurlTransport(const CurlTransport &) = delete;
  auto operator=(const CurlTransport &) -> CurlTransport & = delete;

  auto get(const std::string &url, const Headers &headers) -> Response override;
  auto post(const std::string &url, const std::string &body, const Headers &headers)
      -> Response override;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace repochurn::http
