#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/mutation.hpp"
#include "internal/model/qualifier_generator.hpp"
#include "internal/model/view.hpp"

namespace komorebi::model {

/*
  One content-bearing unit of a document.

  Stored at (doc_id, component_type, qualifier). The component owns its views;
  they are written and deleted together with it.
*/
class Component {
 public:
  // Throws InvalidArgument when component_type starts with the reserved
  // metadata prefix.
  Component(std::string                doc_id,
            std::string                component_type,
            std::optional<std::string> qualifier  = std::nullopt,
            std::string                visibility = {},
            std::string                content    = {},
            std::vector<View>          views      = {},
            QualifierGenerator&        generator  = DefaultQualifierGenerator());

  const std::string& doc_id() const {
    return doc_id_;
  }
  const std::string& component_type() const {
    return component_type_;
  }
  const std::string& qualifier() const {
    return qualifier_;
  }
  const std::string& visibility() const {
    return visibility_;
  }
  const std::string& content() const {
    return content_;
  }
  const std::vector<View>& views() const {
    return views_;
  }

  // Cell holding the content.
  KeyDescriptor BodyKey() const;
  // Cell holding the manifest, paired 1:1 with the body by qualifier.
  KeyDescriptor MetadataKey() const;

  Mutation BodyMutation(int64_t timestamp_ms) const;

 private:
  std::string       doc_id_;
  std::string       component_type_;
  std::string       qualifier_;
  std::string       visibility_;
  std::string       content_;
  std::vector<View> views_;
};

} // namespace komorebi::model
