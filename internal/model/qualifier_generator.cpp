#include "internal/model/qualifier_generator.hpp"

#include "internal/util/uuid.hpp"

namespace komorebi::model {

std::string RandomQualifierGenerator::Next() {
  return komorebi::util::ToHex(komorebi::util::GenerateUUID());
}

QualifierGenerator& DefaultQualifierGenerator() {
  static RandomQualifierGenerator generator;
  return generator;
}

} // namespace komorebi::model
