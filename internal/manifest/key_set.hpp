#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "internal/model/key_descriptor.hpp"

namespace komorebi::manifest {

/*
  Ordered list of every cell one component write touched.

  Append-only; order is preserved through encode and decode so deletes are
  issued in the order the cells were written.
*/
class KeySet {
 public:
  using const_iterator = std::vector<komorebi::model::KeyDescriptor>::const_iterator;

  void Add(komorebi::model::KeyDescriptor key) {
    keys_.push_back(std::move(key));
  }

  const std::vector<komorebi::model::KeyDescriptor>& keys() const {
    return keys_;
  }

  std::size_t size() const {
    return keys_.size();
  }
  bool empty() const {
    return keys_.empty();
  }

  const_iterator begin() const {
    return keys_.begin();
  }
  const_iterator end() const {
    return keys_.end();
  }

  friend bool operator==(const KeySet& a, const KeySet& b) {
    return a.keys_ == b.keys_;
  }
  friend bool operator!=(const KeySet& a, const KeySet& b) {
    return !(a == b);
  }

 private:
  std::vector<komorebi::model::KeyDescriptor> keys_;
};

} // namespace komorebi::manifest
