#include "internal/revision/revision_delete.hpp"

#include <utility>

#include "internal/manifest/key_set_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace komorebi::revision {

using komorebi::model::Mutation;
using komorebi::observability::IntField;
using komorebi::observability::StringField;

RevisionDelete::RevisionDelete(std::vector<std::string> encoded_key_sets, std::optional<int64_t> timestamp_ms)
    : RevisionBase(timestamp_ms), encoded_key_sets_(std::move(encoded_key_sets)) {
}

std::vector<Mutation> RevisionDelete::Mutations() const {
  std::vector<komorebi::manifest::KeySet> manifests;
  manifests.reserve(encoded_key_sets_.size());

  std::size_t total_keys = 0;
  for (std::size_t i = 0; i < encoded_key_sets_.size(); ++i) {
    try {
      auto key_set = komorebi::manifest::DecodeKeySet(encoded_key_sets_[i]);
      total_keys += key_set.size();
      manifests.push_back(std::move(key_set));
    } catch (const komorebi::util::MalformedManifest& e) {
      KOMOREBI_LOG_WARN("Rejected malformed manifest",
                        {IntField("index", static_cast<int64_t>(i)), StringField("error", e.what())});
      throw;
    }
  }

  const auto ts = timestamp_ms();

  std::vector<Mutation> mutations;
  mutations.reserve(total_keys);
  for (const auto& manifest : manifests) {
    for (const auto& key : manifest) {
      mutations.push_back(Mutation::Delete(key, ts));
    }
  }

  KOMOREBI_LOG_DEBUG("Compiled revision delete",
                     {IntField("timestamp_ms", ts),
                      IntField("manifests", static_cast<int64_t>(manifests.size())),
                      IntField("mutations", static_cast<int64_t>(mutations.size()))});
  return mutations;
}

} // namespace komorebi::revision
