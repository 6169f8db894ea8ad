#pragma once

#include <string>
#include <string_view>

namespace komorebi::model {

/*
  Component metadata lives in the same row as the component, under a family
  built from a reserved prefix and the component type. The prefix ends in a
  NUL byte; Component rejects types that start with it, so a data family can
  never equal a metadata family.
*/
inline constexpr std::string_view kMetadataFamilyPrefix{"_meta\0", 6};

inline bool IsMetadataFamily(std::string_view family) {
  return family.substr(0, kMetadataFamilyPrefix.size()) == kMetadataFamilyPrefix;
}

inline std::string MetadataFamily(std::string_view component_type) {
  std::string family(kMetadataFamilyPrefix);
  family.append(component_type);
  return family;
}

} // namespace komorebi::model
