#pragma once

#include "common/config.h"
#include "svm/engine.h"
#include "svm/token_state.h"

namespace pinion {
namespace programs {

using namespace pinion::common;
using svm::AccountView;
using svm::Mint;
using svm::ProgramError;
using svm::ProgramResult;
using svm::ProgramStatus;
using svm::TokenAccount;
using svm::TokenKind;
using svm::TokenStandard;

/**
 * Account validators
 *
 * Every instruction runs these before touching a balance, in this order:
 * signer, owner, layout, derived address, token discriminator. Each check
 * fails fast with a typed error and never modifies the account.
 */

/// NotSigner unless the account signed the instruction
struct SignerCheck {
    static ProgramStatus check(const AccountView& account);
};

/// InvalidOwner unless the account is owned by exactly program_id
struct OwnerCheck {
    static ProgramStatus check(const AccountView& account, const PublicKey& program_id);
};

/// InvalidAccountData unless the data is exactly expected_len bytes
struct LayoutCheck {
    static ProgramStatus check(const AccountView& account, size_t expected_len);
};

/**
 * Token layout dispatch shared by the mint and token-account checks.
 *
 * Legacy: the exact base length. Extended: the base length, or a longer
 * account whose type byte at offset 165 matches kind.
 */
ProgramStatus check_token_layout(const AccountView& account, TokenStandard standard, TokenKind kind);

/// Token program id of a standard
const PublicKey& token_program_id(TokenStandard standard, const ProgramIds& ids);

struct MintCheck {
    static ProgramStatus check(const AccountView& account, TokenStandard standard, const ProgramIds& ids);
};

struct TokenAccountCheck {
    static ProgramStatus check(const AccountView& account, TokenStandard standard, const ProgramIds& ids);
};

/// Mint of either standard; the standard is resolved from the owner
struct MintInterfaceCheck {
    static ProgramResult<TokenStandard> check(const AccountView& account, const ProgramIds& ids);
};

/// Token account of either standard; the standard is resolved from the owner
struct TokenAccountInterfaceCheck {
    static ProgramResult<TokenStandard> check(const AccountView& account, const ProgramIds& ids);
};

/**
 * Token account at the associated address of (authority, token_program, mint).
 * Rejects any other token account with InvalidAddress, even a valid one
 * owned by the authority. The account must also belong to token_program and
 * record mint and authority.
 */
struct AssociatedTokenCheck {
    static ProgramStatus check(const AccountView& account,
                               const PublicKey& authority,
                               const PublicKey& mint,
                               const PublicKey& token_program,
                               const ProgramIds& ids);
};

/**
 * Live record of program with exactly len bytes. A closed or never-created
 * account is InvalidAccountData.
 */
struct ProgramAccountCheck {
    static ProgramStatus check(const AccountView& account, const PublicKey& program_id, size_t len);
};

/// The account must be one of the configured token programs
struct TokenProgramCheck {
    static ProgramResult<TokenStandard> check(const AccountView& account, const ProgramIds& ids);
};

/// Decode a token account that already passed a token account check
ProgramResult<TokenAccount> read_token_account(const AccountView& account);

/// Decode a mint that already passed a mint check
ProgramResult<Mint> read_mint(const AccountView& account);

/// InsufficientAccounts unless at least count accounts were passed
ProgramStatus require_accounts(const std::vector<AccountView>& accounts, size_t count, const char* instruction);

} // namespace programs
} // namespace pinion
