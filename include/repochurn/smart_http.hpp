#pragma once
#include "repochurn/http.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace repochurn::smart {

// First advertised ref of a git-upload-pack discovery response.
struct RefAdvertisement {
  std::string oid;                        // 40 lowercase hex
  std::string name;                       // always "HEAD"
  std::vector<std::string> capabilities;  // as advertised after the NUL
  std::optional<std::string> symref;      // e.g. "refs/heads/main" when advertised
};

// Validate and decode a discovery body (the HTTP-level checks are done by the caller).
auto parse_ref_advertisement(std::span<const std::uint8_t> body) -> RefAdvertisement;

// GET <base>/info/refs?service=git-upload-pack and return the default ref.
auto discover_head_ref(http::Transport &transport, const std::string &base_url)
    -> RefAdvertisement;

// Body of the single-want upload-pack request, e.g.
// "0057want <id> filter=blob:none agent=repochurn\n00000009done\n".
auto build_upload_request(std::string_view want_oid, std::string_view agent) -> std::string;

// Return the binary pack carried by an upload-pack result body.
// Throws TransferNotFoundError if the body has no pack frame.
auto extract_pack(std::span<const std::uint8_t> body) -> std::span<const std::uint8_t>;

// POST the want for `want_oid` and return the pack bytes.
auto fetch_pack(http::Transport &transport, const std::string &base_url, std::string_view want_oid,
                std::string_view agent) -> std::vector<std::uint8_t>;

} // namespace repochurn::smart
