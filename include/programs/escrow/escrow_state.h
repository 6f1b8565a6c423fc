#pragma once

#include "common/types.h"
#include "svm/program_address.h"
#include "svm/program_error.h"
#include <optional>

namespace pinion {
namespace programs {
namespace escrow {

using namespace pinion::common;
using svm::ProgramResult;
using svm::Seeds;

/**
 * Escrow record (113 bytes)
 *
 *   0  seed     u64
 *   8  maker    address
 *  40  mint_a   address
 *  72  mint_b   address
 * 104  receive  u64
 * 112  bump     u8
 */
struct Escrow {
    static constexpr size_t LEN = 113;

    uint64_t seed = 0;
    PublicKey maker;
    PublicKey mint_a;
    PublicKey mint_b;
    uint64_t receive = 0;
    uint8_t bump = 0;

    static ProgramResult<Escrow> unpack(const std::vector<uint8_t>& data);
    std::vector<uint8_t> pack() const;

    /// ["escrow", maker, seed_le] plus [bump] when given
    static Seeds seeds(const PublicKey& maker, uint64_t seed, std::optional<uint8_t> bump = std::nullopt);
};

} // namespace escrow
} // namespace programs
} // namespace pinion
