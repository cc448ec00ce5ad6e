#pragma once

#include <string>
#include <string_view>

namespace hwsuite::common {

// Quoted literal with control characters and quotes escaped, e.g.
// "a\tb\n" becomes 'a\tb\n'.
auto Repr(std::string_view text) -> std::string;

}  // namespace hwsuite::common
