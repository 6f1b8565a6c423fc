#include "common/base58.h"

namespace pinion {
namespace common {

namespace {

const char BASE58_ALPHABET[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int base58_index(char c) {
  for (int i = 0; i < 58; ++i) {
    if (BASE58_ALPHABET[i] == c) {
      return i;
    }
  }
  return -1;
}

} // namespace

std::string encode_base58(const std::vector<uint8_t> &bytes) {
  size_t leading_zeros = 0;
  while (leading_zeros < bytes.size() && bytes[leading_zeros] == 0) {
    leading_zeros++;
  }

  // Little-endian base58 digits
  std::vector<int> digits;
  for (size_t i = leading_zeros; i < bytes.size(); ++i) {
    int carry = bytes[i];
    for (int &digit : digits) {
      carry += digit * 256;
      digit = carry % 58;
      carry /= 58;
    }
    while (carry > 0) {
      digits.push_back(carry % 58);
      carry /= 58;
    }
  }

  std::string result(leading_zeros, BASE58_ALPHABET[0]);
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    result += BASE58_ALPHABET[*it];
  }
  return result;
}

Result<std::vector<uint8_t>> decode_base58(const std::string &text) {
  size_t leading_ones = 0;
  while (leading_ones < text.size() && text[leading_ones] == '1') {
    leading_ones++;
  }

  // Little-endian base256 bytes
  std::vector<int> bytes;
  for (size_t i = leading_ones; i < text.size(); ++i) {
    int carry = base58_index(text[i]);
    if (carry < 0) {
      return Result<std::vector<uint8_t>>("Invalid base58 character '" +
                                          std::string(1, text[i]) + "'");
    }
    for (int &byte : bytes) {
      carry += byte * 58;
      byte = carry & 0xff;
      carry >>= 8;
    }
    while (carry > 0) {
      bytes.push_back(carry & 0xff);
      carry >>= 8;
    }
  }

  std::vector<uint8_t> result(leading_ones, 0);
  for (auto it = bytes.rbegin(); it != bytes.rend(); ++it) {
    result.push_back(static_cast<uint8_t>(*it));
  }
  return Result<std::vector<uint8_t>>(std::move(result));
}

Result<PublicKey> decode_pubkey(const std::string &text) {
  auto decoded = decode_base58(text);
  if (decoded.is_err()) {
    return Result<PublicKey>(decoded.error());
  }
  if (decoded.value().size() != PUBKEY_BYTES) {
    return Result<PublicKey>("Address '" + text + "' decodes to " +
                             std::to_string(decoded.value().size()) +
                             " bytes, expected 32");
  }
  return Result<PublicKey>(std::move(decoded).value());
}

} // namespace common
} // namespace pinion
