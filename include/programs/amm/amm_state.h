#pragma once

#include "common/types.h"
#include "svm/program_address.h"
#include "svm/program_error.h"
#include <optional>

namespace pinion {
namespace programs {
namespace amm {

using namespace pinion::common;
using svm::ProgramResult;
using svm::Seeds;

enum class AmmState : uint8_t {
    Uninitialized = 0,
    Initialized = 1,
    Disabled = 2,
    WithdrawOnly = 3
};

const char* amm_state_to_string(AmmState state);

/// Fees are basis points of the swap output
constexpr uint16_t FEE_DENOMINATOR = 10000;

/// LP token decimals
constexpr uint8_t LP_DECIMALS = 1;

/**
 * Pool configuration record (108 bytes)
 *
 *   0  state        u8
 *   1  seed         u64
 *   9  authority    address, all zero when the pool has none
 *  41  mint_x       address
 *  73  mint_y       address
 * 105  fee          u16 basis points
 * 107  config_bump  u8
 */
struct Config {
    static constexpr size_t LEN = 108;

    AmmState state = AmmState::Uninitialized;
    uint64_t seed = 0;
    PublicKey authority = PublicKey(PUBKEY_BYTES, 0);
    PublicKey mint_x;
    PublicKey mint_y;
    uint16_t fee = 0;
    uint8_t config_bump = 0;

    bool has_authority() const { return !is_zero_key(authority); }

    /// Rejects unknown state values and fees of 10000 or more
    static ProgramResult<Config> unpack(const std::vector<uint8_t>& data);
    std::vector<uint8_t> pack() const;

    /// ["config", seed_le, mint_x, mint_y] plus [bump] when given
    static Seeds seeds(uint64_t seed,
                       const PublicKey& mint_x,
                       const PublicKey& mint_y,
                       std::optional<uint8_t> bump = std::nullopt);

    /// ["mint_lp", config] plus [bump] when given
    static Seeds lp_mint_seeds(const PublicKey& config, std::optional<uint8_t> bump = std::nullopt);
};

} // namespace amm
} // namespace programs
} // namespace pinion
