#pragma once

#include "common/byte_codec.h"
#include "common/config.h"
#include "programs/amm/amm_state.h"
#include "programs/amm/curve.h"
#include "svm/engine.h"

namespace pinion {
namespace programs {
namespace amm {

using svm::AccountView;
using svm::ExecutionContext;
using svm::Instruction;
using svm::ProgramStatus;

/**
 * Constant-product AMM for one pair of mints per config
 *
 * Reserves are the balances of the config's associated token accounts and
 * are always read live. LP tokens are minted by the config, which signs
 * for itself through its derived seeds.
 */
class AmmProgram : public svm::BuiltinProgram {
public:
    explicit AmmProgram(const ProgramIds& ids);
    ~AmmProgram() override = default;

    PublicKey get_program_id() const override;
    std::string get_name() const override { return "amm"; }

    ProgramStatus execute(
        std::vector<AccountView>& accounts,
        const std::vector<uint8_t>& data,
        ExecutionContext& context
    ) const override;

    enum class AmmInstruction : uint8_t {
        Initialize = 0,
        Deposit = 1,
        Withdraw = 2,
        Swap = 3,
        SetState = 4
    };

    static constexpr size_t INITIALIZE_PAYLOAD_LEN = 76;
    static constexpr size_t INITIALIZE_WITH_AUTHORITY_PAYLOAD_LEN = 108;

    /// Pool addresses derived from (seed, mint_x, mint_y)
    struct PoolAddresses {
        PublicKey config;
        uint8_t config_bump = 0;
        PublicKey mint_lp;
        uint8_t lp_bump = 0;
        PublicKey vault_x;
        PublicKey vault_y;
    };

    static ProgramResult<PoolAddresses> derive_pool(const ProgramIds& ids,
                                                    uint64_t seed,
                                                    const PublicKey& mint_x,
                                                    const PublicKey& mint_y,
                                                    const PublicKey& token_program);

    // Instruction builders
    static ProgramResult<Instruction> initialize(const ProgramIds& ids,
                                                 const PublicKey& initializer,
                                                 const PublicKey& token_program,
                                                 uint64_t seed,
                                                 uint16_t fee,
                                                 const PublicKey& mint_x,
                                                 const PublicKey& mint_y,
                                                 const std::optional<PublicKey>& authority = std::nullopt);

    static ProgramResult<Instruction> deposit(const ProgramIds& ids,
                                              const PublicKey& user,
                                              const PoolAddresses& pool,
                                              const PublicKey& mint_x,
                                              const PublicKey& mint_y,
                                              const PublicKey& token_program,
                                              uint64_t amount,
                                              uint64_t max_x,
                                              uint64_t max_y,
                                              int64_t expiration);

    static ProgramResult<Instruction> withdraw(const ProgramIds& ids,
                                               const PublicKey& user,
                                               const PoolAddresses& pool,
                                               const PublicKey& mint_x,
                                               const PublicKey& mint_y,
                                               const PublicKey& token_program,
                                               uint64_t amount,
                                               uint64_t min_x,
                                               uint64_t min_y,
                                               int64_t expiration);

    static ProgramResult<Instruction> swap(const ProgramIds& ids,
                                           const PublicKey& user,
                                           const PoolAddresses& pool,
                                           const PublicKey& mint_x,
                                           const PublicKey& mint_y,
                                           const PublicKey& token_program,
                                           bool is_x,
                                           uint64_t amount,
                                           uint64_t min,
                                           int64_t expiration);

    static Instruction set_state(const ProgramIds& ids,
                                 const PublicKey& authority,
                                 const PublicKey& config,
                                 AmmState state);

private:
    ProgramStatus process_initialize(std::vector<AccountView>& accounts, ByteReader& reader,
                                     ExecutionContext& context) const;
    ProgramStatus process_deposit(std::vector<AccountView>& accounts, ByteReader& reader,
                                  ExecutionContext& context) const;
    ProgramStatus process_withdraw(std::vector<AccountView>& accounts, ByteReader& reader,
                                   ExecutionContext& context) const;
    ProgramStatus process_swap(std::vector<AccountView>& accounts, ByteReader& reader,
                               ExecutionContext& context) const;
    ProgramStatus process_set_state(std::vector<AccountView>& accounts, ByteReader& reader,
                                    ExecutionContext& context) const;

    /// Record check, decode, and address re-derivation from the stored seeds
    ProgramResult<Config> load_config(const AccountView& config) const;

    /// The LP mint must sit at the canonical ["mint_lp", config] address
    ProgramStatus check_lp_mint(const AccountView& mint_lp, const AccountView& config,
                                const AccountView& token_program) const;

    ProgramStatus check_not_expired(int64_t expiration, const ExecutionContext& context) const;

    ProgramIds ids_;
};

} // namespace amm
} // namespace programs
} // namespace pinion
