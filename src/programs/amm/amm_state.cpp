#include "programs/amm/amm_state.h"
#include "common/byte_codec.h"

namespace pinion {
namespace programs {
namespace amm {

using svm::ProgramError;
using svm::ProgramStatus;

const char* amm_state_to_string(AmmState state) {
    switch (state) {
        case AmmState::Uninitialized: return "Uninitialized";
        case AmmState::Initialized: return "Initialized";
        case AmmState::Disabled: return "Disabled";
        case AmmState::WithdrawOnly: return "WithdrawOnly";
    }
    return "Unknown";
}

ProgramResult<Config> Config::unpack(const std::vector<uint8_t>& data) {
    if (data.size() != LEN) {
        return ProgramStatus::fail(ProgramError::InvalidAccountData, "config record length");
    }
    ByteReader reader(data);
    Config config;
    uint8_t state = 0;
    if (!reader.read_u8(state) ||
        !reader.read_u64(config.seed) ||
        !reader.read_pubkey(config.authority) ||
        !reader.read_pubkey(config.mint_x) ||
        !reader.read_pubkey(config.mint_y) ||
        !reader.read_u16(config.fee) ||
        !reader.read_u8(config.config_bump)) {
        return ProgramStatus::fail(ProgramError::InvalidAccountData, "malformed config record");
    }
    if (state > static_cast<uint8_t>(AmmState::WithdrawOnly)) {
        return ProgramStatus::fail(ProgramError::InvalidAccountData, "config state " + std::to_string(state));
    }
    if (config.fee >= FEE_DENOMINATOR) {
        return ProgramStatus::fail(ProgramError::InvalidAccountData, "config fee " + std::to_string(config.fee));
    }
    config.state = static_cast<AmmState>(state);
    return config;
}

std::vector<uint8_t> Config::pack() const {
    ByteWriter writer(LEN);
    writer.write_u8(static_cast<uint8_t>(state))
          .write_u64(seed)
          .write_pubkey(authority)
          .write_pubkey(mint_x)
          .write_pubkey(mint_y)
          .write_u16(fee)
          .write_u8(config_bump);
    return writer.take();
}

Seeds Config::seeds(uint64_t seed,
                    const PublicKey& mint_x,
                    const PublicKey& mint_y,
                    std::optional<uint8_t> bump) {
    Seeds seeds{svm::seed_bytes("config"), u64_le_bytes(seed), mint_x, mint_y};
    if (bump) {
        seeds.push_back({*bump});
    }
    return seeds;
}

Seeds Config::lp_mint_seeds(const PublicKey& config, std::optional<uint8_t> bump) {
    Seeds seeds{svm::seed_bytes("mint_lp"), config};
    if (bump) {
        seeds.push_back({*bump});
    }
    return seeds;
}

} // namespace amm
} // namespace programs
} // namespace pinion
