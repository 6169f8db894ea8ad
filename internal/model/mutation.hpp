#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "internal/model/key_descriptor.hpp"

namespace komorebi::model {

/*
  A single requested change to one cell.

  Either a put carrying a value, or a delete marker. Row, family, qualifier
  and visibility are raw bytes; text callers pass UTF-8.
*/
struct Mutation {
  std::string row;
  std::string family;
  std::string qualifier;
  std::string visibility;
  int64_t     timestamp_ms = 0;
  std::string value;
  bool        deleted = false;

  static Mutation Put(KeyDescriptor key, int64_t timestamp_ms, std::string value) {
    Mutation m;
    m.row          = std::move(key.row);
    m.family       = std::move(key.family);
    m.qualifier    = std::move(key.qualifier);
    m.visibility   = std::move(key.visibility);
    m.timestamp_ms = timestamp_ms;
    m.value        = std::move(value);
    return m;
  }

  static Mutation Delete(KeyDescriptor key, int64_t timestamp_ms) {
    Mutation m;
    m.row          = std::move(key.row);
    m.family       = std::move(key.family);
    m.qualifier    = std::move(key.qualifier);
    m.visibility   = std::move(key.visibility);
    m.timestamp_ms = timestamp_ms;
    m.deleted      = true;
    return m;
  }
};

// The cell a mutation addresses.
inline KeyDescriptor KeyFromMutation(const Mutation& mutation) {
  return {mutation.row, mutation.family, mutation.qualifier, mutation.visibility};
}

} // namespace komorebi::model
