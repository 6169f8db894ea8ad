#pragma once

#include <string>
#include <string_view>

namespace komorebi::util {

/*
  Rendering of raw cell bytes for terminals and logs.

  Rows, families and manifests are arbitrary bytes; metadata families always
  carry a NUL.
*/

// Lowercase, two characters per byte.
std::string ToHex(std::string_view bytes);

// Throws InvalidArgument on odd length or a non-hex character.
std::string FromHex(std::string_view hex);

// Printable ASCII as is, everything else (and backslash) as \xHH.
std::string Escape(std::string_view bytes);

} // namespace komorebi::util
