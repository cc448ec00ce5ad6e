#include "hwsuite/common/repr.hpp"

#include <format>
#include <string>
#include <string_view>

namespace hwsuite::common {

auto Repr(std::string_view text) -> std::string {
  // Prefer single quotes unless the text contains one and no double quote.
  char quote = '\'';
  if (text.find('\'') != std::string_view::npos &&
      text.find('"') == std::string_view::npos) {
    quote = '"';
  }
  std::string out;
  out.reserve(text.size() + 2);
  out += quote;
  for (char ch : text) {
    auto byte = static_cast<unsigned char>(ch);
    switch (ch) {
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (ch == quote) {
          out += '\\';
          out += ch;
        } else if (byte < 0x20 || byte == 0x7f) {
          out += std::format("\\x{:02x}", byte);
        } else {
          out += ch;
        }
    }
  }
  out += quote;
  return out;
}

}  // namespace hwsuite::common
