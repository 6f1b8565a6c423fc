#pragma once

#include "common/types.h"
#include <string>
#include <vector>

namespace pinion {
namespace common {

/**
 * Base58 text encoding of addresses (Bitcoin alphabet, as used by Solana)
 */
std::string encode_base58(const std::vector<uint8_t> &bytes);

/**
 * Decode base58 text. Fails on characters outside the alphabet.
 */
Result<std::vector<uint8_t>> decode_base58(const std::string &text);

/**
 * Decode base58 text that must hold exactly one 32-byte address.
 */
Result<PublicKey> decode_pubkey(const std::string &text);

} // namespace common
} // namespace pinion
