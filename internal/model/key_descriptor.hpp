#pragma once

#include <string>
#include <tuple>

namespace komorebi::model {

// Address of one physical cell. Carries no value and no timestamp.
struct KeyDescriptor {
  std::string row;
  std::string family;
  std::string qualifier;
  std::string visibility;
};

inline bool operator==(const KeyDescriptor& a, const KeyDescriptor& b) {
  return std::tie(a.row, a.family, a.qualifier, a.visibility) == std::tie(b.row, b.family, b.qualifier, b.visibility);
}

inline bool operator!=(const KeyDescriptor& a, const KeyDescriptor& b) {
  return !(a == b);
}

inline bool operator<(const KeyDescriptor& a, const KeyDescriptor& b) {
  return std::tie(a.row, a.family, a.qualifier, a.visibility) < std::tie(b.row, b.family, b.qualifier, b.visibility);
}

} // namespace komorebi::model
