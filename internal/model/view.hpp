#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/mutation.hpp"
#include "internal/model/qualifier_generator.hpp"

namespace komorebi::model {

/*
  An alternate index entry for a component, stored under lookup_term instead
  of the component's own row.

  A view has no timestamp; it takes the timestamp of the revision that writes
  it. When no qualifier is given one is drawn from the generator, so two views
  under the same term and family never overwrite each other.
*/
class View {
 public:
  explicit View(std::string                lookup_term,
                std::optional<std::string> qualifier  = std::nullopt,
                std::string                visibility = {},
                std::string                value      = {},
                std::string                family     = {},
                QualifierGenerator&        generator  = DefaultQualifierGenerator());

  const std::string& lookup_term() const {
    return lookup_term_;
  }
  const std::string& qualifier() const {
    return qualifier_;
  }
  const std::string& visibility() const {
    return visibility_;
  }
  const std::string& value() const {
    return value_;
  }
  const std::string& family() const {
    return family_;
  }

  KeyDescriptor Key() const;

  // The put writing this view at the given revision time.
  Mutation ToMutation(int64_t timestamp_ms) const;

 private:
  std::string lookup_term_;
  std::string qualifier_;
  std::string visibility_;
  std::string value_;
  std::string family_;
};

} // namespace komorebi::model
