#pragma once

#include "common/config.h"
#include "svm/engine.h"
#include "svm/token_state.h"

namespace pinion {
namespace svm {

/**
 * SPL Associated Token Account (ATA) Program
 *
 * Creates the canonical token account of a wallet for a mint, at the address
 * derived from [wallet, token_program, mint]. Each wallet therefore has
 * exactly one such account per mint and token program. Accounts under the
 * extended token program carry the ImmutableOwner extension.
 *
 * Accounts: [payer(s,w), associated_account(w), wallet, mint, system_program,
 * token_program]
 */
class SPLAssociatedTokenProgram : public BuiltinProgram {
public:
    explicit SPLAssociatedTokenProgram(const ProgramIds& ids);
    ~SPLAssociatedTokenProgram() override = default;

    PublicKey get_program_id() const override;
    std::string get_name() const override { return "associated-token"; }

    ProgramStatus execute(
        std::vector<AccountView>& accounts,
        const std::vector<uint8_t>& data,
        ExecutionContext& context
    ) const override;

    enum class ATAInstruction : uint8_t {
        Create = 0,
        CreateIdempotent = 1
    };

    /// Instruction builder; an empty payload is read as Create
    static Instruction create(const ProgramIds& ids,
                              const PublicKey& payer,
                              const PublicKey& wallet,
                              const PublicKey& mint,
                              const PublicKey& token_program,
                              bool idempotent = false);

private:
    ProgramStatus handle_create(std::vector<AccountView>& accounts,
                                ExecutionContext& context,
                                bool idempotent) const;

    /// True if the account already is the wallet's initialized token account for mint
    bool is_existing_associated_account(const AccountView& account,
                                        const PublicKey& wallet,
                                        const PublicKey& mint,
                                        const PublicKey& token_program) const;

    ProgramStatus create_account(AccountView& payer,
                                 AccountView& associated_account,
                                 const ProgramSigner& signer,
                                 size_t space,
                                 const PublicKey& token_program,
                                 ExecutionContext& context) const;

    ProgramIds ids_;
};

} // namespace svm
} // namespace pinion
