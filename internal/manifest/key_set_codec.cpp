#include "internal/manifest/key_set_codec.hpp"

#include <google/protobuf/message.h>
#include <google/protobuf/unknown_field_set.h>

#include <limits>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace komorebi::manifest {
namespace {

bool HasUnknownFields(const google::protobuf::Message& message) {
  return !message.GetReflection()->GetUnknownFields(message).empty();
}

} // namespace

komorebi::v1::Key ToProto(const komorebi::model::KeyDescriptor& key) {
  komorebi::v1::Key proto;
  proto.set_row(key.row);
  proto.set_cf(key.family);
  proto.set_cq(key.qualifier);
  proto.set_visibility(key.visibility);
  return proto;
}

komorebi::model::KeyDescriptor FromProto(const komorebi::v1::Key& key) {
  return {key.row(), key.cf(), key.cq(), key.visibility()};
}

std::string EncodeKeySet(const KeySet& key_set) {
  komorebi::v1::KeySet proto;
  proto.mutable_keys()->Reserve(static_cast<int>(key_set.size()));
  for (const auto& key : key_set) {
    *proto.add_keys() = ToProto(key);
  }

  std::string encoded;
  if (!proto.SerializeToString(&encoded)) {
    throw std::runtime_error("KeySet serialization failed");
  }
  return encoded;
}

KeySet DecodeKeySet(std::string_view encoded) {
  if (encoded.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    throw komorebi::util::MalformedManifest("manifest exceeds protobuf size limit");
  }

  komorebi::v1::KeySet proto;
  if (!proto.ParseFromArray(encoded.data(), static_cast<int>(encoded.size()))) {
    throw komorebi::util::MalformedManifest("manifest is not a valid KeySet");
  }

  if (HasUnknownFields(proto)) {
    throw komorebi::util::MalformedManifest("manifest carries fields outside the KeySet schema");
  }

  KeySet key_set;
  for (const auto& key : proto.keys()) {
    if (HasUnknownFields(key)) {
      throw komorebi::util::MalformedManifest("manifest key carries fields outside the Key schema");
    }
    key_set.Add(FromProto(key));
  }
  return key_set;
}

} // namespace komorebi::manifest
