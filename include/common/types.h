#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace pinion {
namespace common {

/**
 * @file types.h
 * @brief Fundamental types and utilities shared by the host runtime and the
 * on-chain programs
 */

/// @brief SHA-256 digest (32 bytes)
using Hash = std::vector<uint8_t>;

/// @brief Account address: an ed25519 public key or a derived address (32 bytes)
using PublicKey = std::vector<uint8_t>;

/// @brief Slot number of the ledger clock
using Slot = uint64_t;

/// @brief Epoch number
using Epoch = uint64_t;

/// @brief Native token amount in smallest unit (1 SOL = 1,000,000,000 lamports)
using Lamports = uint64_t;

/// @brief Byte length of an address
constexpr size_t PUBKEY_BYTES = 32;

/// @brief True if the key has the address length and every byte is zero
inline bool is_zero_key(const PublicKey &key) {
  if (key.size() != PUBKEY_BYTES) {
    return false;
  }
  for (uint8_t byte : key) {
    if (byte != 0) {
      return false;
    }
  }
  return true;
}

/**
 * @brief Type-safe result wrapper for operations that can fail
 *
 * Used by the non-program parts of the code base (configuration, text
 * encodings, tooling). On-chain handlers use svm::ProgramResult, which
 * carries a typed error instead of a message.
 *
 * @tparam T The type of the success value
 *
 * Example usage:
 * @code
 * auto key = decode_base58(text);
 * if (key.is_ok()) {
 *     use(key.value());
 * } else {
 *     std::cerr << "bad address: " << key.error() << std::endl;
 * }
 * @endcode
 */
template <typename T> class Result {
private:
  bool success_;
  T value_;
  std::string error_;

public:
  /**
   * @brief Construct a successful result with a value
   * @param value The success value to store
   */
  explicit Result(T value) : success_(true), value_(std::move(value)) {}

  /**
   * @brief Construct a failed result with an error message
   * @param error C-string describing the error
   */
  explicit Result(const char *error) : success_(false), error_(error) {}

  /**
   * @brief Construct a failed result with an error message
   * @param error String describing the error
   */
  explicit Result(const std::string &error) : success_(false), error_(error) {}

  Result(const Result &other) = default;
  Result(Result &&other) noexcept = default;
  Result &operator=(const Result &other) = default;
  Result &operator=(Result &&other) noexcept = default;

  /// @return true if the operation succeeded
  bool is_ok() const noexcept { return success_; }

  /// @return true if the operation failed
  bool is_err() const noexcept { return !success_; }

  /**
   * @brief Get the success value
   * @warning Only call this if is_ok() returns true
   */
  const T &value() const & { return value_; }

  /// Rvalue overload for move semantics
  T &&value() && { return std::move(value_); }

  /**
   * @brief Get the error message
   * @warning Only call this if is_err() returns true
   */
  const std::string &error() const noexcept { return error_; }

  explicit operator bool() const noexcept { return success_; }

  /**
   * @brief Get value or return default on error
   * @param default_value Value to return if result is an error
   */
  T value_or(const T &default_value) const {
    return success_ ? value_ : default_value;
  }
};

} // namespace common
} // namespace pinion

/**
 * @brief Standard library hash specialization for byte vectors
 *
 * Enables use of Hash and PublicKey as keys in std::unordered_map and
 * std::unordered_set containers.
 */
namespace std {
template <> struct hash<std::vector<uint8_t>> {
  std::size_t operator()(const std::vector<uint8_t> &v) const noexcept {
    std::size_t seed = v.size();
    for (const auto &byte : v) {
      // Boost-style hash combine
      seed ^= byte + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }
    return seed;
  }
};
} // namespace std
