#include "repochurn/errors.hpp"
#include "repochurn/smart_http.hpp"

#include "test_support.hpp"

#include <cctype>
#include <iostream>
#include <string>

using namespace repochurn;
using testsupport::FakeTransport;
using testsupport::advertisement;
using testsupport::bytes;
using testsupport::response;
using testsupport::throws;

static const std::string kBase = "https://example.com/user/dotfiles.git";
static const std::string kRefsUrl = kBase + "/info/refs?service=git-upload-pack";
static const std::string kHead = "4b825dc642cb6eb9a060e54bf8d69288fbee4904";
static const std::string kAdType = "application/x-git-upload-pack-advertisement";

int main() {
  try {
    // well-formed advertisement
    {
      FakeTransport t;
      t.responses[kRefsUrl] = response(200, kAdType, advertisement(kHead));
      const auto ad = smart::discover_head_ref(t, kBase);
      if (t.calls.size() != 1 || t.calls[0].method != "GET" || t.calls[0].url != kRefsUrl) {
        std::cerr << "discover: unexpected request\n"; return 1;
      }
      if (ad.oid != kHead || ad.name != "HEAD") { std::cerr << "discover: wrong head\n"; return 1; }
      if (!ad.symref || *ad.symref != "refs/heads/main") { std::cerr << "discover: symref\n"; return 1; }
      if (ad.capabilities.size() != 4 || ad.capabilities[0] != "multi_ack") {
        std::cerr << "discover: capabilities\n"; return 1;
      }
    }

    // advertisement without symref capability
    {
      const auto ad = smart::parse_ref_advertisement(bytes(advertisement(kHead, "ofs-delta")));
      if (ad.symref || ad.capabilities.size() != 1) { std::cerr << "parse: unexpected symref\n"; return 1; }
    }

    // non-smart server: body is not a pkt-line stream
    {
      FakeTransport t;
      t.responses[kRefsUrl] = response(200, kAdType, "<html>not git</html>");
      if (!throws<ProtocolError>([&] { (void)smart::discover_head_ref(t, kBase); })) {
        std::cerr << "discover: html body accepted\n"; return 1;
      }
      if (t.calls.size() != 1) { std::cerr << "discover: should not issue further requests\n"; return 1; }
    }

    // valid length but no '#' after it
    {
      FakeTransport t;
      t.responses[kRefsUrl] = response(200, kAdType, "001e service=git-upload-pack\n0000");
      if (!throws<ProtocolError>([&] { (void)smart::discover_head_ref(t, kBase); })) {
        std::cerr << "discover: service line without '#' accepted\n"; return 1;
      }
      if (t.calls.size() != 1) { std::cerr << "discover: extra request after bad prefix\n"; return 1; }
    }

    // dumb server content type
    {
      FakeTransport t;
      t.responses[kRefsUrl] = response(200, "text/plain; charset=utf-8", advertisement(kHead));
      if (!throws<ProtocolError>([&] { (void)smart::discover_head_ref(t, kBase); })) {
        std::cerr << "discover: wrong content type accepted\n"; return 1;
      }
    }

    // HTTP failure status
    {
      FakeTransport t;
      if (!throws<ProtocolError>([&] { (void)smart::discover_head_ref(t, kBase); })) {
        std::cerr << "discover: 404 accepted\n"; return 1;
      }
    }

    // empty repository advertises the null id
    {
      const std::string null_id(40, '0');
      std::string line = null_id + " capabilities^{}";
      line.push_back('\0');
      line += "agent=git/2.43.0\n";
      std::string body = pkt::encode_frame("# service=git-upload-pack\n") + "0000" + pkt::encode_frame(line) + "0000";
      if (!throws<EmptyRepositoryError>([&] { (void)smart::parse_ref_advertisement(bytes(body)); })) {
        std::cerr << "parse: empty repository not reported\n"; return 1;
      }
    }

    // wrong service line
    {
      std::string body = pkt::encode_frame("# service=git-receive-pack\n") + "0000";
      if (!throws<ProtocolError>([&] { (void)smart::parse_ref_advertisement(bytes(body)); })) {
        std::cerr << "parse: wrong service accepted\n"; return 1;
      }
    }

    // first ref is not HEAD
    {
      std::string line = kHead + " MAIN";
      line.push_back('\0');
      line += "ofs-delta\n";
      std::string body = pkt::encode_frame("# service=git-upload-pack\n") + "0000" + pkt::encode_frame(line);
      if (!throws<ProtocolError>([&] { (void)smart::parse_ref_advertisement(bytes(body)); })) {
        std::cerr << "parse: non-HEAD first ref accepted\n"; return 1;
      }
    }

    // NUL delimiter missing
    {
      std::string body = pkt::encode_frame("# service=git-upload-pack\n") + "0000" +
                         pkt::encode_frame(kHead + " refs/heads/main\n");
      if (!throws<ProtocolError>([&] { (void)smart::parse_ref_advertisement(bytes(body)); })) {
        std::cerr << "parse: missing delimiter accepted\n"; return 1;
      }
    }

    // uppercase object id
    {
      std::string upper = kHead;
      for (char& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
      if (!throws<ProtocolError>([&] { (void)smart::parse_ref_advertisement(bytes(advertisement(upper))); })) {
        std::cerr << "parse: uppercase id accepted\n"; return 1;
      }
    }

    // server-side error line
    {
      std::string body = pkt::encode_frame("# service=git-upload-pack\n") + "0000" +
                         pkt::encode_frame("ERR access denied\n");
      try {
        (void)smart::parse_ref_advertisement(bytes(body));
        std::cerr << "parse: ERR line accepted\n"; return 1;
      } catch (const ProtocolError& e) {
        if (std::string(e.what()).find("access denied") == std::string::npos) {
          std::cerr << "parse: ERR message lost: " << e.what() << "\n"; return 1;
        }
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "ref_discovery test failed: " << e.what() << "\n";
    return 1;
  }
  std::cout << "OK\n";
  return 0;
}
