#include "base64.hpp"

#include "../log/log.hpp"

#include <array>

namespace sn {

namespace {
char const *alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

auto Lookup() -> std::array<int, 256>
{
  std::array<int, 256> table;
  table.fill(-1);
  for (int ii = 0; ii < 64; ii++) {
    table[static_cast<uint8_t>(alphabet[ii])] = ii;
  }
  return table;
}
} // namespace

auto Base64Encode(std::vector<uint8_t> const &bytes) -> std::string
{
  std::string out;
  out.reserve(4 * ((bytes.size() + 2) / 3));
  size_t ii = 0;
  for (; ii + 2 < bytes.size(); ii += 3) {
    uint32_t const v = (bytes[ii] << 16) | (bytes[ii + 1] << 8) | bytes[ii + 2];
    out.push_back(alphabet[(v >> 18) & 0x3F]);
    out.push_back(alphabet[(v >> 12) & 0x3F]);
    out.push_back(alphabet[(v >> 6) & 0x3F]);
    out.push_back(alphabet[v & 0x3F]);
  }
  size_t const rem = bytes.size() - ii;
  if (rem == 1) {
    uint32_t const v = bytes[ii] << 16;
    out.push_back(alphabet[(v >> 18) & 0x3F]);
    out.push_back(alphabet[(v >> 12) & 0x3F]);
    out.append("==");
  } else if (rem == 2) {
    uint32_t const v = (bytes[ii] << 16) | (bytes[ii + 1] << 8);
    out.push_back(alphabet[(v >> 18) & 0x3F]);
    out.push_back(alphabet[(v >> 12) & 0x3F]);
    out.push_back(alphabet[(v >> 6) & 0x3F]);
    out.push_back('=');
  }
  return out;
}

auto Base64Decode(std::string const &text) -> std::vector<uint8_t>
{
  static auto const table = Lookup();

  std::vector<uint8_t> out;
  out.reserve(3 * text.size() / 4);
  uint32_t acc = 0;
  int      bits = 0;
  bool     padding = false;
  for (char const c : text) {
    if (c == ' ' || c == '\n' || c == '\r' || c == '\t') { continue; }
    if (c == '=') {
      padding = true;
      continue;
    }
    if (padding) { throw Log::Failure("Base64", "Data found after padding"); }
    int const v = table[static_cast<uint8_t>(c)];
    if (v < 0) { throw Log::Failure("Base64", "Invalid character '{}'", c); }
    acc = (acc << 6) | v;
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back((acc >> bits) & 0xFF);
    }
  }
  if (bits >= 6) { throw Log::Failure("Base64", "Truncated input of length {}", text.size()); }
  return out;
}

} // namespace sn
