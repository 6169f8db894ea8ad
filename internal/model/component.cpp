#include "internal/model/component.hpp"

#include <utility>

#include "internal/model/metadata_family.hpp"
#include "internal/util/errors.hpp"

namespace komorebi::model {

namespace {

std::string CheckedComponentType(std::string component_type) {
  if (IsMetadataFamily(component_type)) {
    throw komorebi::util::InvalidArgument("component type uses the reserved metadata prefix");
  }
  return component_type;
}

} // namespace

Component::Component(std::string                doc_id,
                     std::string                component_type,
                     std::optional<std::string> qualifier,
                     std::string                visibility,
                     std::string                content,
                     std::vector<View>          views,
                     QualifierGenerator&        generator)
    : doc_id_(std::move(doc_id)),
      component_type_(CheckedComponentType(std::move(component_type))),
      qualifier_(qualifier ? std::move(*qualifier) : generator.Next()),
      visibility_(std::move(visibility)),
      content_(std::move(content)),
      views_(std::move(views)) {
}

KeyDescriptor Component::BodyKey() const {
  return {doc_id_, component_type_, qualifier_, visibility_};
}

KeyDescriptor Component::MetadataKey() const {
  return {doc_id_, MetadataFamily(component_type_), qualifier_, visibility_};
}

Mutation Component::BodyMutation(int64_t timestamp_ms) const {
  return Mutation::Put(BodyKey(), timestamp_ms, content_);
}

} // namespace komorebi::model
