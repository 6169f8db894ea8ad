#include "internal/model/view.hpp"

#include <utility>

namespace komorebi::model {

View::View(std::string                lookup_term,
           std::optional<std::string> qualifier,
           std::string                visibility,
           std::string                value,
           std::string                family,
           QualifierGenerator&        generator)
    : lookup_term_(std::move(lookup_term)),
      qualifier_(qualifier ? std::move(*qualifier) : generator.Next()),
      visibility_(std::move(visibility)),
      value_(std::move(value)),
      family_(std::move(family)) {
}

KeyDescriptor View::Key() const {
  return {lookup_term_, family_, qualifier_, visibility_};
}

Mutation View::ToMutation(int64_t timestamp_ms) const {
  return Mutation::Put(Key(), timestamp_ms, value_);
}

} // namespace komorebi::model
