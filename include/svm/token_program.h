#pragma once

#include "common/byte_codec.h"
#include "svm/engine.h"
#include "svm/token_state.h"

namespace pinion {
namespace svm {

/**
 * Token program
 *
 * One implementation serves both token standards. It is registered twice:
 * once under the legacy program id and once under the extended id, where it
 * also accepts extended account layouts and the ImmutableOwner extension.
 * Only the instructions the escrow, AMM and associated-token programs need
 * are supported.
 */
class TokenProgram : public BuiltinProgram {
public:
    TokenProgram(PublicKey program_id, TokenStandard standard);
    ~TokenProgram() override = default;

    PublicKey get_program_id() const override;
    std::string get_name() const override;

    ProgramStatus execute(
        std::vector<AccountView>& accounts,
        const std::vector<uint8_t>& data,
        ExecutionContext& context
    ) const override;

    TokenStandard standard() const { return standard_; }

    enum class TokenInstruction : uint8_t {
        Transfer = 3,
        MintTo = 7,
        Burn = 8,
        CloseAccount = 9,
        TransferChecked = 12,
        InitializeAccount3 = 18,
        InitializeMint2 = 20,
        InitializeImmutableOwner = 22
    };

private:
    // Instruction handlers
    ProgramStatus handle_initialize_mint(std::vector<AccountView>& accounts, ByteReader& reader,
                                         ExecutionContext& context) const;
    ProgramStatus handle_initialize_account(std::vector<AccountView>& accounts, ByteReader& reader,
                                            ExecutionContext& context) const;
    ProgramStatus handle_initialize_immutable_owner(std::vector<AccountView>& accounts) const;
    ProgramStatus handle_transfer(std::vector<AccountView>& accounts, ByteReader& reader,
                                  bool checked) const;
    ProgramStatus handle_mint_to(std::vector<AccountView>& accounts, ByteReader& reader) const;
    ProgramStatus handle_burn(std::vector<AccountView>& accounts, ByteReader& reader) const;
    ProgramStatus handle_close_account(std::vector<AccountView>& accounts) const;

    // State access
    ProgramResult<Mint> load_mint(const AccountView& account) const;
    ProgramResult<TokenAccount> load_account(const AccountView& account) const;
    ProgramStatus store_mint(AccountView& account, const Mint& mint) const;
    ProgramStatus store_account(AccountView& account, const TokenAccount& token_account) const;

    PublicKey program_id_;
    TokenStandard standard_;
};

/**
 * Instruction builders; the first argument selects the token program
 */
namespace token_instruction {

/// [mint(w)]
Instruction initialize_mint2(const PublicKey& token_program,
                             const PublicKey& mint,
                             uint8_t decimals,
                             const PublicKey& mint_authority,
                             const std::optional<PublicKey>& freeze_authority = std::nullopt);

/// [account(w), mint]
Instruction initialize_account3(const PublicKey& token_program,
                                const PublicKey& account,
                                const PublicKey& mint,
                                const PublicKey& owner);

/// [account(w)]
Instruction initialize_immutable_owner(const PublicKey& token_program,
                                       const PublicKey& account);

/// [source(w), destination(w), authority(s)]
Instruction transfer(const PublicKey& token_program,
                     const PublicKey& source,
                     const PublicKey& destination,
                     const PublicKey& authority,
                     uint64_t amount);

/// [source(w), mint, destination(w), authority(s)]
Instruction transfer_checked(const PublicKey& token_program,
                             const PublicKey& source,
                             const PublicKey& mint,
                             const PublicKey& destination,
                             const PublicKey& authority,
                             uint64_t amount,
                             uint8_t decimals);

/// [mint(w), destination(w), authority(s)]
Instruction mint_to(const PublicKey& token_program,
                    const PublicKey& mint,
                    const PublicKey& destination,
                    const PublicKey& authority,
                    uint64_t amount);

/// [account(w), mint(w), authority(s)]
Instruction burn(const PublicKey& token_program,
                 const PublicKey& account,
                 const PublicKey& mint,
                 const PublicKey& authority,
                 uint64_t amount);

/// [account(w), destination(w), authority(s)]
Instruction close_account(const PublicKey& token_program,
                          const PublicKey& account,
                          const PublicKey& destination,
                          const PublicKey& authority);

} // namespace token_instruction

} // namespace svm
} // namespace pinion
