#pragma once

#include "common/types.h"
#include "svm/program_error.h"
#include <string>
#include <utility>
#include <vector>

namespace pinion {
namespace svm {

using namespace pinion::common;

/// Seed list for address derivation; each seed is at most MAX_SEED_LEN bytes
using Seeds = std::vector<std::vector<uint8_t>>;

constexpr size_t MAX_SEEDS = 16;
constexpr size_t MAX_SEED_LEN = 32;

/// Marker appended to every derivation preimage
extern const char PDA_MARKER[];

/// Bytes of a text seed such as "escrow"
inline std::vector<uint8_t> seed_bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

/**
 * SHA-256 over the concatenation of the given chunks (OpenSSL EVP).
 * Throws std::runtime_error if the digest cannot be computed.
 */
Hash sha256_concat(const std::vector<std::vector<uint8_t>>& chunks);

/**
 * True if the 32 bytes decode to a point on the ed25519 curve.
 *
 * The bytes are read as a compressed Edwards point: little-endian y with the
 * top bit holding the sign of x. The point exists iff
 * (y^2 - 1) / (d*y^2 + 1) is a square modulo 2^255 - 19.
 */
bool is_on_curve(const PublicKey& bytes);

/**
 * Derive a program address from a complete seed list (including any bump).
 *
 * Fails with InvalidSeeds if there are too many seeds, a seed is too long,
 * or the hash lands on the curve.
 */
ProgramResult<PublicKey> create_program_address(const Seeds& seeds,
                                                const PublicKey& program_id);

/**
 * Search bumps 255..0 for the first off-curve address of seeds + [bump].
 * Bump exhaustion is InvalidSeeds.
 */
ProgramResult<std::pair<PublicKey, uint8_t>> find_program_address(
    const Seeds& seeds, const PublicKey& program_id);

/// Canonical associated token account for (wallet, token_program, mint)
ProgramResult<std::pair<PublicKey, uint8_t>> find_associated_token_address(
    const PublicKey& wallet,
    const PublicKey& mint,
    const PublicKey& token_program,
    const PublicKey& associated_token_program);

/**
 * Authority token for the address derived from a seed list.
 *
 * Only create() can mint one, and only for seeds that derive a valid program
 * address. The runtime honours it solely for CPIs made by the program that
 * issued it; it then marks address() as a signer of the nested instruction.
 */
class ProgramSigner {
public:
    static ProgramResult<ProgramSigner> create(Seeds seeds, const PublicKey& program_id);

    const PublicKey& address() const { return address_; }
    const PublicKey& program_id() const { return program_id_; }
    const Seeds& seeds() const { return seeds_; }

private:
    ProgramSigner(PublicKey address, PublicKey program_id, Seeds seeds)
        : address_(std::move(address)),
          program_id_(std::move(program_id)),
          seeds_(std::move(seeds)) {}

    PublicKey address_;
    PublicKey program_id_;
    Seeds seeds_;
};

} // namespace svm
} // namespace pinion
