#pragma once

#include "common/byte_codec.h"
#include "programs/account_checks.h"
#include "svm/program_address.h"
#include <optional>
#include <utility>

namespace pinion {
namespace programs {
namespace vault {

using svm::AccountView;
using svm::ExecutionContext;
using svm::Instruction;

/**
 * Per-owner lamport vault at ["vault", owner]
 *
 * The vault stays owned by the system program; withdrawals are system
 * transfers signed through the derived seeds.
 */
class VaultProgram : public svm::BuiltinProgram {
public:
    explicit VaultProgram(const ProgramIds& ids);
    ~VaultProgram() override = default;

    PublicKey get_program_id() const override;
    std::string get_name() const override { return "vault"; }

    ProgramStatus execute(
        std::vector<AccountView>& accounts,
        const std::vector<uint8_t>& data,
        ExecutionContext& context
    ) const override;

    enum class VaultInstruction : uint8_t {
        Deposit = 0,
        Withdraw = 1
    };

    static svm::Seeds seeds(const PublicKey& owner, std::optional<uint8_t> bump = std::nullopt);

    static ProgramResult<std::pair<PublicKey, uint8_t>> derive(const ProgramIds& ids, const PublicKey& owner);

    static ProgramResult<Instruction> deposit(const ProgramIds& ids, const PublicKey& owner, Lamports amount);
    static ProgramResult<Instruction> withdraw(const ProgramIds& ids, const PublicKey& owner);

private:
    ProgramStatus process_deposit(std::vector<AccountView>& accounts, ByteReader& reader,
                                  ExecutionContext& context) const;
    ProgramStatus process_withdraw(std::vector<AccountView>& accounts, ExecutionContext& context) const;

    /// Bump of the vault passed in, or InvalidAddress if it is not the owner's vault
    ProgramResult<uint8_t> check_vault(const AccountView& owner, const AccountView& vault) const;

    ProgramIds ids_;
};

} // namespace vault
} // namespace programs
} // namespace pinion
