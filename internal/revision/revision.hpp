#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "internal/model/component.hpp"
#include "internal/model/mutation.hpp"

namespace komorebi::revision {

/*
  A revision compiles into mutations that all share one timestamp.

  The store does not group writes atomically; the shared timestamp is what
  marks them as having happened together.
*/
class RevisionBase {
 public:
  // Defaults to the current wall clock time in milliseconds.
  explicit RevisionBase(std::optional<int64_t> timestamp_ms = std::nullopt);
  virtual ~RevisionBase() = default;

  int64_t timestamp_ms() const {
    return timestamp_ms_;
  }

  virtual std::vector<komorebi::model::Mutation> Mutations() const = 0;

 private:
  int64_t timestamp_ms_;
};

// Writes component instances, their views and their manifests.
class Revision final : public RevisionBase {
 public:
  explicit Revision(std::vector<komorebi::model::Component> components,
                    std::optional<int64_t>                  timestamp_ms = std::nullopt);

  const std::vector<komorebi::model::Component>& components() const {
    return components_;
  }

  // Per component, in order: one put per view, the body put, then the
  // metadata put whose value is the encoded manifest. The manifest lists the
  // view keys, the body key and the metadata key itself.
  std::vector<komorebi::model::Mutation> Mutations() const override;

 private:
  std::vector<komorebi::model::Component> components_;
};

} // namespace komorebi::revision
