#pragma once

#include <string>

namespace komorebi::model {

/*
  Source of default qualifiers for views and components constructed without
  one. Implementations must be safe to call from several threads.
*/
class QualifierGenerator {
 public:
  virtual ~QualifierGenerator() = default;

  virtual std::string Next() = 0;
};

// 128-bit random tokens, 32 lowercase hex characters.
class RandomQualifierGenerator final : public QualifierGenerator {
 public:
  std::string Next() override;
};

// Process-wide RandomQualifierGenerator.
QualifierGenerator& DefaultQualifierGenerator();

} // namespace komorebi::model
