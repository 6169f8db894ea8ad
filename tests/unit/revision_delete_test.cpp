#include "internal/revision/revision_delete.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "internal/manifest/key_set_codec.hpp"
#include "internal/model/component.hpp"
#include "internal/model/metadata_family.hpp"
#include "internal/model/view.hpp"
#include "internal/revision/revision.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using komorebi::manifest::EncodeKeySet;
using komorebi::manifest::KeySet;
using komorebi::model::Component;
using komorebi::model::KeyDescriptor;
using komorebi::model::KeyFromMutation;
using komorebi::model::Mutation;
using komorebi::model::View;
using komorebi::revision::Revision;
using komorebi::revision::RevisionDelete;
using komorebi::testing::MemoryTable;
using komorebi::testing::SequenceQualifierGenerator;

constexpr int64_t kWriteTimestamp  = 1700000000000;
constexpr int64_t kDeleteTimestamp = 1700000000500;

std::vector<Component> MakeDocument(SequenceQualifierGenerator& generator) {
  std::vector<View> text_views;
  text_views.emplace_back("hello", std::nullopt, "PUBLIC", "", "idx", generator);
  text_views.emplace_back("world", std::nullopt, "PUBLIC", "", "idx", generator);

  std::vector<View> title_views;
  title_views.emplace_back("greeting", std::nullopt, "A&B", "d1", "title", generator);

  std::vector<Component> components;
  components.emplace_back("d1", "text", std::nullopt, "PUBLIC", "hello world", std::move(text_views), generator);
  components.emplace_back("d1", "title", std::nullopt, "A&B", "Greeting", std::move(title_views), generator);
  return components;
}

std::vector<std::string> Manifests(const std::vector<Mutation>& mutations) {
  std::vector<std::string> manifests;
  for (const auto& m : mutations) {
    if (komorebi::model::IsMetadataFamily(m.family)) {
      manifests.push_back(m.value);
    }
  }
  return manifests;
}

std::set<KeyDescriptor> Keys(const std::vector<Mutation>& mutations) {
  std::set<KeyDescriptor> keys;
  for (const auto& m : mutations) {
    keys.insert(KeyFromMutation(m));
  }
  return keys;
}

void TestDeleteAddressesExactlyTheWrittenKeys() {
  SequenceQualifierGenerator generator;
  Revision                   revision(MakeDocument(generator), kWriteTimestamp);
  const auto                 writes = revision.Mutations();

  RevisionDelete deletion(Manifests(writes), kDeleteTimestamp);
  const auto     deletes = deletion.Mutations();

  assert(deletes.size() == writes.size());
  assert(Keys(deletes) == Keys(writes));
  for (const auto& m : deletes) {
    assert(m.deleted);
    assert(m.value.empty());
    assert(m.timestamp_ms == kDeleteTimestamp);
  }
}

void TestDeleteFollowsManifestAndDecodeOrder() {
  SequenceQualifierGenerator generator;
  Revision                   revision(MakeDocument(generator), kWriteTimestamp);
  const auto                 writes = revision.Mutations();

  // Reverse the manifests: the title component must now come first.
  auto manifests = Manifests(writes);
  std::reverse(manifests.begin(), manifests.end());

  RevisionDelete deletion(std::move(manifests), kDeleteTimestamp);
  const auto     deletes = deletion.Mutations();

  // writes: [hello, world, text body, text meta, greeting, title body, title meta]
  const std::vector<size_t> expected_order = {4, 5, 6, 0, 1, 2, 3};
  assert(deletes.size() == expected_order.size());
  for (size_t i = 0; i < deletes.size(); ++i) {
    assert(KeyFromMutation(deletes[i]) == KeyFromMutation(writes[expected_order[i]]));
  }
}

void TestDeleteLeavesNoOrphanedCells() {
  SequenceQualifierGenerator generator;
  Revision                   revision(MakeDocument(generator), kWriteTimestamp);
  const auto                 writes = revision.Mutations();

  MemoryTable table;
  table.Apply(writes);
  assert(table.size() == writes.size());

  // Read the manifests back from the table as a caller would.
  std::vector<std::string> manifests;
  for (const auto& component : revision.components()) {
    const auto* metadata = table.Find(component.MetadataKey());
    assert(metadata != nullptr);
    manifests.push_back(metadata->value);
  }

  table.Apply(RevisionDelete(std::move(manifests), kDeleteTimestamp).Mutations());
  assert(table.size() == 0);
}

void TestManifestDrivesDeleteAfterViewsChange() {
  SequenceQualifierGenerator generator;
  Revision                   revision(MakeDocument(generator), kWriteTimestamp);
  const auto                 writes = revision.Mutations();
  const auto                 stored = Manifests(writes);

  // A later version of the text component with a different view set does not
  // change what the stored manifest deletes.
  std::vector<View> new_views;
  new_views.emplace_back("other", std::nullopt, "", "", "idx", generator);
  Component rewritten("d1", "text", revision.components()[0].qualifier(), "PUBLIC", "changed", std::move(new_views));

  RevisionDelete deletion({stored[0]}, kDeleteTimestamp);
  const auto     deletes = deletion.Mutations();
  assert(deletes.size() == 4);
  assert(deletes[0].row == "hello");
  assert(deletes[1].row == "world");
  for (const auto& m : deletes) {
    assert(m.row != "other");
  }
  assert(rewritten.views().size() == 1);
}

void TestMalformedManifestAbortsWholeCall() {
  SequenceQualifierGenerator generator;
  Revision                   revision(MakeDocument(generator), kWriteTimestamp);
  auto                       manifests = Manifests(revision.Mutations());
  manifests.insert(manifests.begin() + 1, std::string("\xff\xff\xff", 3));

  RevisionDelete deletion(std::move(manifests), kDeleteTimestamp);

  bool                  threw = false;
  std::vector<Mutation> deletes;
  try {
    deletes = deletion.Mutations();
  } catch (const komorebi::util::MalformedManifest&) {
    threw = true;
  }
  assert(threw && "RevisionDelete must reject a corrupt manifest.");
  assert(deletes.empty());
}

void TestEmptyManifestYieldsNoDeletes() {
  RevisionDelete empty_only({EncodeKeySet(KeySet{})}, kDeleteTimestamp);
  assert(empty_only.Mutations().empty());

  // An empty manifest between real ones contributes nothing and breaks nothing.
  SequenceQualifierGenerator generator;
  Revision                   revision(MakeDocument(generator), kWriteTimestamp);
  const auto                 writes    = revision.Mutations();
  auto                       manifests = Manifests(writes);
  manifests.insert(manifests.begin() + 1, EncodeKeySet(KeySet{}));

  RevisionDelete deletion(std::move(manifests), kDeleteTimestamp);
  const auto     deletes = deletion.Mutations();
  assert(deletes.size() == writes.size());
  assert(Keys(deletes) == Keys(writes));
}

void TestNoManifestsYieldNoMutations() {
  RevisionDelete deletion({}, kDeleteTimestamp);
  assert(deletion.Mutations().empty());
  assert(deletion.timestamp_ms() == kDeleteTimestamp);
}

} // namespace

int main() {
  TestDeleteAddressesExactlyTheWrittenKeys();
  TestDeleteFollowsManifestAndDecodeOrder();
  TestDeleteLeavesNoOrphanedCells();
  TestManifestDrivesDeleteAfterViewsChange();
  TestMalformedManifestAbortsWholeCall();
  TestEmptyManifestYieldsNoDeletes();
  TestNoManifestsYieldNoMutations();

  std::cout << "komorebi_unit_revision_delete: pass\n";
  return 0;
}
