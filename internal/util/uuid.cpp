#include "uuid.hpp"

#include <random>

namespace saga::util {

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (std::size_t i = 0; i < id.size(); i += 8) {
    const uint64_t bits = rng();
    for (std::size_t b = 0; b < 8; ++b) {
      id[i + b] = static_cast<uint8_t>(bits >> (b * 8));
    }
  }

  id[6] = (id[6] & 0x0F) | 0x40; // version 4
  id[8] = (id[8] & 0x3F) | 0x80; // RFC4122 variant
  return id;
}

std::string ToString(const UUID& id) {
  static constexpr char kHex[] = "0123456789abcdef";

  std::string text;
  text.reserve(36);
  for (std::size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) text.push_back('-');
    text.push_back(kHex[id[i] >> 4]);
    text.push_back(kHex[id[i] & 0x0F]);
  }
  return text;
}

} // namespace saga::util
