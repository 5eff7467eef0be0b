#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sn {

auto Base64Encode(std::vector<uint8_t> const &bytes) -> std::string;
auto Base64Decode(std::string const &text) -> std::vector<uint8_t>; // Whitespace is ignored, padding is optional

} // namespace sn
