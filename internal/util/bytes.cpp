#include "bytes.hpp"

#include "errors.hpp"

namespace komorebi::util {
namespace {

constexpr char kHex[] = "0123456789abcdef";

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

void AppendHexByte(std::string& out, unsigned char b) {
  out.push_back(kHex[b >> 4]);
  out.push_back(kHex[b & 0x0F]);
}

} // namespace

std::string ToHex(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size() * 2);
  for (char c : bytes) {
    AppendHexByte(out, static_cast<unsigned char>(c));
  }
  return out;
}

std::string FromHex(std::string_view hex) {
  if (hex.size() % 2 != 0) {
    throw InvalidArgument("hex input has odd length");
  }

  std::string bytes(hex.size() / 2, '\0');
  for (size_t i = 0; i < bytes.size(); ++i) {
    const int hi = HexNibble(hex[2 * i]);
    const int lo = HexNibble(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      throw InvalidArgument("non-hex character in '" + std::string(hex) + "'");
    }
    bytes[i] = static_cast<char>((hi << 4) | lo);
  }
  return bytes;
}

std::string Escape(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size());
  for (char c : bytes) {
    const auto b = static_cast<unsigned char>(c);
    if (b >= 0x20 && b < 0x7F && b != '\\') {
      out.push_back(c);
      continue;
    }
    out += "\\x";
    AppendHexByte(out, b);
  }
  return out;
}

} // namespace komorebi::util
