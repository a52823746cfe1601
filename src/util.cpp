#include "repochurn/util.hpp"

#include "repochurn/consts.hpp"

namespace repochurn {

auto looks_hex40(std::string_view str) -> bool {
  return str.size() == consts::kOidHexLen &&
         str.find_first_not_of("0123456789abcdef") == std::string_view::npos;
}

namespace strutil {

void rstrip_newlines(std::string &str) {
  str.erase(str.find_last_not_of("\r\n") + 1);
}

auto trim(std::string_view sv) -> std::string {
  constexpr std::string_view kBlank = " \t\r";
  const auto first = sv.find_first_not_of(kBlank);
  if (first == std::string_view::npos) {
    return {};
  }
  return std::string(sv.substr(first, sv.find_last_not_of(kBlank) - first + 1));
}

} // namespace strutil

} // namespace repochurn
