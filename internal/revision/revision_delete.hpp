#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/mutation.hpp"
#include "internal/revision/revision.hpp"

namespace komorebi::revision {

/*
  Deletes component instances from their stored manifests.

  Takes the metadata values read back from the store. Keys are never
  re-derived from components, so a delete removes exactly what the original
  write produced even if views have changed since.
*/
class RevisionDelete final : public RevisionBase {
 public:
  explicit RevisionDelete(std::vector<std::string> encoded_key_sets,
                          std::optional<int64_t>   timestamp_ms = std::nullopt);

  const std::vector<std::string>& encoded_key_sets() const {
    return encoded_key_sets_;
  }

  // One delete marker per manifest key, manifests in input order, keys in
  // manifest order. Every manifest is decoded before anything is returned;
  // throws MalformedManifest if any of them is bad.
  std::vector<komorebi::model::Mutation> Mutations() const override;

 private:
  std::vector<std::string> encoded_key_sets_;
};

} // namespace komorebi::revision
