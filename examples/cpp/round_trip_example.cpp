#include <iostream>
#include <string>
#include <vector>

#include "internal/model/component.hpp"
#include "internal/model/metadata_family.hpp"
#include "internal/model/view.hpp"
#include "internal/revision/revision.hpp"
#include "internal/revision/revision_delete.hpp"

namespace {

void Print(const char* title, const std::vector<komorebi::model::Mutation>& mutations) {
  std::cout << title << '\n';
  for (const auto& m : mutations) {
    std::cout << "  " << (m.deleted ? "delete " : "put    ") << m.row << " / ";
    // The metadata family starts with a NUL-terminated prefix.
    if (komorebi::model::IsMetadataFamily(m.family)) {
      std::cout << "<meta>" << m.family.substr(komorebi::model::kMetadataFamilyPrefix.size());
    } else {
      std::cout << m.family;
    }
    std::cout << " / " << m.qualifier << " @" << m.timestamp_ms << '\n';
  }
}

} // namespace

int main() {
  using komorebi::model::Component;
  using komorebi::model::View;

  // A text component indexed under each of its words.
  std::vector<View> views;
  views.emplace_back("hello", std::nullopt, "", "", "idx");
  views.emplace_back("world", std::nullopt, "", "", "idx");

  std::vector<Component> components;
  components.emplace_back("doc-1", "text", std::nullopt, "", "hello world", std::move(views));

  komorebi::revision::Revision revision(std::move(components));
  const auto                   writes = revision.Mutations();
  Print("write", writes);

  // A caller would read the metadata cell back from the store; here we take
  // it straight from the write batch.
  std::vector<std::string> manifests;
  for (const auto& m : writes) {
    if (komorebi::model::IsMetadataFamily(m.family)) {
      manifests.push_back(m.value);
    }
  }

  komorebi::revision::RevisionDelete deletion(std::move(manifests), revision.timestamp_ms() + 1);
  Print("delete", deletion.Mutations());
  return 0;
}
