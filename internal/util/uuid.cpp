#include "uuid.hpp"

#include <exception>
#include <random>

#include "bytes.hpp"
#include "errors.hpp"

namespace komorebi::util {
namespace {

// Seeds from eight words of OS entropy so the 64-bit engine state is not
// limited to a single 32-bit draw.
std::mt19937_64 SeededEngine() {
  try {
    std::random_device device;
    std::array<std::random_device::result_type, 8> words{};
    for (auto& word : words)
      word = device();
    std::seed_seq seq(words.begin(), words.end());
    return std::mt19937_64(seq);
  } catch (const std::exception& e) {
    throw EntropyUnavailable(std::string("random_device unavailable: ") + e.what());
  }
}

} // namespace

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng = SeededEngine();

  UUID id{};
  for (size_t i = 0; i < id.size(); i += 8) {
    const uint64_t word = rng();
    for (size_t j = 0; j < 8; ++j)
      id[i + j] = static_cast<uint8_t>(word >> (j * 8));
  }

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToHex(const UUID& id) {
  return ToHex(std::string_view(reinterpret_cast<const char*>(id.data()), id.size()));
}

} // namespace komorebi::util
