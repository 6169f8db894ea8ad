#pragma once

#include <string>
#include <string_view>

#include "internal/manifest/key_set.hpp"
#include "komorebi/v1.hpp"

namespace komorebi::manifest {

/*
  Manifest codec

  Wire form is komorebi.core.v1.KeySet. Every key field is an arbitrary
  length byte string.
*/

std::string EncodeKeySet(const KeySet& key_set);

// Throws MalformedManifest when the bytes are not a KeySet or carry fields
// outside the schema.
KeySet DecodeKeySet(std::string_view encoded);

// protobuf helpers
komorebi::v1::Key              ToProto(const komorebi::model::KeyDescriptor& key);
komorebi::model::KeyDescriptor FromProto(const komorebi::v1::Key& key);

} // namespace komorebi::manifest
