#include "noted/core/note_id.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <random>

namespace noted::core {

namespace {

constexpr char kHex[] = "0123456789abcdef";
constexpr size_t kUuidLength = 36;
constexpr size_t kVersionPosition = 14;
constexpr size_t kVariantPosition = 19;

bool isDashPosition(size_t i) {
  return i == 8 || i == 13 || i == 18 || i == 23;
}

// 16 random bytes from a per-thread engine
std::array<uint8_t, 16> generateRandomness() {
  static thread_local std::random_device rd;
  static thread_local std::mt19937_64 gen(rd());

  std::array<uint8_t, 16> bytes{};
  for (size_t i = 0; i < bytes.size(); i += 8) {
    uint64_t value = gen();
    for (size_t j = 0; j < 8; ++j) {
      bytes[i + j] = static_cast<uint8_t>(value >> (j * 8));
    }
  }
  return bytes;
}

}  // namespace

NoteId NoteId::generate() {
  auto bytes = generateRandomness();

  // RFC 4122: version 4, variant 10xx
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

  std::string uuid;
  uuid.reserve(kUuidLength);
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      uuid += '-';
    }
    uuid += kHex[bytes[i] >> 4];
    uuid += kHex[bytes[i] & 0x0F];
  }

  return NoteId(std::move(uuid));
}

Result<NoteId> NoteId::fromString(std::string_view str) {
  std::string normalized(str);
  for (auto& c : normalized) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  if (!isUuidV4(normalized)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Invalid UUID v4 format: " + std::string(str)));
  }

  return NoteId(std::move(normalized));
}

bool NoteId::isUuidV4(std::string_view str) noexcept {
  if (str.length() != kUuidLength) {
    return false;
  }

  for (size_t i = 0; i < str.length(); ++i) {
    char c = str[i];
    if (isDashPosition(i)) {
      if (c != '-') return false;
      continue;
    }
    bool is_hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    if (!is_hex) {
      return false;
    }
  }

  if (str[kVersionPosition] != '4') {
    return false;
  }

  char variant = str[kVariantPosition];
  return variant == '8' || variant == '9' || variant == 'a' || variant == 'b';
}

bool NoteId::isValid() const noexcept {
  return !id_.empty() && isUuidV4(id_);
}

NoteId::NoteId(std::string id) : id_(std::move(id)) {}

}  // namespace noted::core
