#include "repochurn/smart_http.hpp"

#include "repochurn/consts.hpp"
#include "repochurn/errors.hpp"
#include "repochurn/pkt_line.hpp"
#include "repochurn/util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <sstream>

namespace repochurn::smart {

namespace {

[[nodiscard]] auto is_lower_hex(std::uint8_t c) -> bool {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

// "^[0-9a-f]{4}#": the advertisement must open with a "# service=" frame.
[[nodiscard]] auto has_service_prefix(std::span<const std::uint8_t> body) -> bool {
  if (body.size() < 5) {
    return false;
  }
  for (std::size_t i = 0; i < 4; ++i) {
    if (!is_lower_hex(body[i])) {
      return false;
    }
  }
  return body[4] == '#';
}

void throw_if_server_error(std::span<const std::uint8_t> payload) {
  const std::string_view prefix = consts::kErrPrefix;
  if (payload.size() < prefix.size() ||
      !std::equal(prefix.begin(), prefix.end(), payload.begin(),
                  [](char a, std::uint8_t b) { return static_cast<std::uint8_t>(a) == b; })) {
    return;
  }
  std::string msg = pkt::ascii_text(payload.subspan(prefix.size()));
  strutil::rstrip_newlines(msg);
  throw ProtocolError("remote error: " + msg);
}

[[nodiscard]] auto next_data_or_throw(pkt::FrameReader &reader) -> std::span<const std::uint8_t> {
  const auto f = reader.next_data();
  if (!f) {
    throw ProtocolError("unexpected end of ref advertisement");
  }
  return f->payload;
}

void require_content_type(const http::Response &res, std::string_view expected) {
  if (res.content_type != expected) {
    throw ProtocolError("server does not speak the smart protocol (content type '" +
                        res.content_type + "', expected '" + std::string(expected) + "')");
  }
}

void require_success(const http::Response &res, std::string_view what) {
  if (!res.ok()) {
    throw ProtocolError(std::string(what) + " failed with HTTP status " +
                        std::to_string(res.status));
  }
}

void parse_capabilities(std::string_view caps, RefAdvertisement &out) {
  std::istringstream is{std::string(caps)};
  std::string cap;
  while (is >> cap) {
    if (cap.starts_with(consts::kSymrefHead)) {
      out.symref = cap.substr(consts::kSymrefHead.size());
    }
    out.capabilities.push_back(std::move(cap));
  }
}

} // namespace

auto parse_ref_advertisement(std::span<const std::uint8_t> body) -> RefAdvertisement {
  if (!has_service_prefix(body)) {
    throw ProtocolError("invalid response: advertisement does not start with a service line");
  }

  pkt::FrameReader reader{body};
  const std::string service = pkt::ascii_text(next_data_or_throw(reader));
  if (service != consts::kServiceLine) {
    throw ProtocolError("invalid first line of ref advertisement");
  }

  const auto line = next_data_or_throw(reader);
  throw_if_server_error(line);

  // "<40 hex> HEAD\0<capabilities>\n"
  constexpr std::size_t kNameAt = consts::kOidHexLen + 1;
  constexpr std::size_t kDelimAt = kNameAt + 4;
  if (line.size() < consts::kOidHexLen) {
    throw ProtocolError("first ref line is too short");
  }
  const std::string id = pkt::ascii_text(line.first(consts::kOidHexLen));
  if (id == consts::kNullOid) {
    throw EmptyRepositoryError();
  }
  if (line.size() <= kDelimAt || line[consts::kOidHexLen] != consts::kSpace ||
      line[kDelimAt] != static_cast<std::uint8_t>(consts::kNul)) {
    throw ProtocolError("first ref not of the expected size");
  }
  const std::string name = pkt::ascii_text(line.subspan(kNameAt, kDelimAt - kNameAt));
  if (name != consts::kHeadName) {
    throw ProtocolError("first ref is unexpectedly not HEAD (got '" + name + "')");
  }
  if (!looks_hex40(id)) {
    throw ProtocolError("malformed object id in ref advertisement: " + id);
  }

  RefAdvertisement out;
  out.oid = id;
  out.name = name;
  std::string caps = pkt::ascii_text(line.subspan(kDelimAt + 1));
  strutil::rstrip_newlines(caps);
  parse_capabilities(caps, out);
  return out;
}

auto discover_head_ref(http::Transport &transport, const std::string &base_url)
    -> RefAdvertisement {
  const std::string url =
      base_url + "/info/refs?service=" + std::string(consts::kUploadPack);
  const http::Response res = transport.get(url, {});

  require_success(res, "ref discovery");
  require_content_type(res, consts::kAdvertisementType);

  auto ad = parse_ref_advertisement(res.body);
  spdlog::info("HEAD is {}{}", ad.oid, ad.symref ? " (" + *ad.symref + ")" : std::string{});
  return ad;
}

auto build_upload_request(std::string_view want_oid, std::string_view agent) -> std::string {
  if (!looks_hex40(want_oid)) {
    throw ProtocolError("want requires a 40-hex object id, got '" + std::string(want_oid) + "'");
  }
  std::string want = "want ";
  want += want_oid;
  want += ' ';
  want += consts::kBlobNoneFilter;
  want += " agent=";
  want += agent;
  want += '\n';

  std::string body = pkt::encode_frame(want);
  body += consts::kFlushPkt;
  body += pkt::encode_frame("done\n");
  return body;
}

auto extract_pack(std::span<const std::uint8_t> body) -> std::span<const std::uint8_t> {
  pkt::FrameReader reader{body};
  std::size_t frames = 0;
  while (auto f = reader.next()) {
    if (f->kind == pkt::FrameKind::pack) {
      spdlog::debug("pack found after {} frame(s), {} bytes", frames, f->payload.size());
      return f->payload;
    }
    if (f->kind == pkt::FrameKind::data) {
      throw_if_server_error(f->payload);
    }
    ++frames;
  }
  throw TransferNotFoundError();
}

auto fetch_pack(http::Transport &transport, const std::string &base_url, std::string_view want_oid,
                std::string_view agent) -> std::vector<std::uint8_t> {
  const std::string url = base_url + "/" + std::string(consts::kUploadPack);
  const http::Headers headers{
      {"Accept", std::string(consts::kResultType)},
      {"Content-Type", std::string(consts::kRequestType)},
  };
  const http::Response res = transport.post(url, build_upload_request(want_oid, agent), headers);

  require_success(res, "upload-pack");
  require_content_type(res, consts::kResultType);

  const auto pack = extract_pack(res.body);
  return {pack.begin(), pack.end()};
}

} // namespace repochurn::smart
