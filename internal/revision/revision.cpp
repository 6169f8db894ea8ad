#include "internal/revision/revision.hpp"

#include <utility>

#include "internal/manifest/key_set.hpp"
#include "internal/manifest/key_set_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace komorebi::revision {

using komorebi::model::Component;
using komorebi::model::KeyFromMutation;
using komorebi::model::Mutation;
using komorebi::observability::IntField;

RevisionBase::RevisionBase(std::optional<int64_t> timestamp_ms)
    : timestamp_ms_(timestamp_ms ? *timestamp_ms : komorebi::util::NowUnixMillis()) {
}

Revision::Revision(std::vector<Component> components, std::optional<int64_t> timestamp_ms)
    : RevisionBase(timestamp_ms), components_(std::move(components)) {
}

std::vector<Mutation> Revision::Mutations() const {
  const auto ts = timestamp_ms();

  std::size_t total = 0;
  for (const auto& component : components_) {
    total += component.views().size() + 2;
  }

  std::vector<Mutation> mutations;
  mutations.reserve(total);
  for (const auto& component : components_) {
    komorebi::manifest::KeySet manifest;
    for (const auto& view : component.views()) {
      auto mutation = view.ToMutation(ts);
      manifest.Add(KeyFromMutation(mutation));
      mutations.push_back(std::move(mutation));
    }

    auto body = component.BodyMutation(ts);
    manifest.Add(KeyFromMutation(body));
    mutations.push_back(std::move(body));

    // The metadata cell lists itself so a delete removes it too.
    const auto metadata_key = component.MetadataKey();
    manifest.Add(metadata_key);

    mutations.push_back(Mutation::Put(metadata_key, ts, komorebi::manifest::EncodeKeySet(manifest)));
  }

  KOMOREBI_LOG_DEBUG("Compiled revision",
                     {IntField("timestamp_ms", ts),
                      IntField("components", static_cast<int64_t>(components_.size())),
                      IntField("mutations", static_cast<int64_t>(mutations.size()))});
  return mutations;
}

} // namespace komorebi::revision
