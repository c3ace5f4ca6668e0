#include "uuid.hpp"

#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace feedstore::util {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

bool IsDashPosition(size_t i) {
  return i == 8 || i == 13 || i == 18 || i == 23;
}

} // namespace

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  std::ostringstream oss;

  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(id[i]);
  }
  return oss.str();
}

UUID FromString(const std::string& str) {
  if (str.size() != 36)
    throw std::invalid_argument("invalid uuid length: '" + str + "'");

  std::string hex;
  hex.reserve(32);
  for (size_t i = 0; i < str.size(); ++i) {
    if (IsDashPosition(i)) {
      if (str[i] != '-') throw std::invalid_argument("invalid uuid layout: '" + str + "'");
      continue;
    }
    if (HexNibble(str[i]) < 0) throw std::invalid_argument("invalid uuid character: '" + str + "'");
    hex.push_back(str[i]);
  }

  UUID id{};
  for (size_t i = 0; i < id.size(); ++i)
    id[i] = static_cast<uint8_t>((HexNibble(hex[2 * i]) << 4) | HexNibble(hex[2 * i + 1]));

  return id;
}

bool IsValidUUID(const std::string& str) {
  try {
    FromString(str);
    return true;
  } catch (const std::invalid_argument&) {
    return false;
  }
}

} // namespace feedstore::util
