#include "programs/account_checks.h"
#include "common/base58.h"
#include "svm/program_address.h"

namespace pinion {
namespace programs {

ProgramStatus SignerCheck::check(const AccountView& account) {
    if (!account.is_signer()) {
        return ProgramStatus::fail(ProgramError::NotSigner, encode_base58(account.address()));
    }
    return ProgramStatus::ok();
}

ProgramStatus OwnerCheck::check(const AccountView& account, const PublicKey& program_id) {
    if (!account.owned_by(program_id)) {
        return ProgramStatus::fail(ProgramError::InvalidOwner,
                                   encode_base58(account.address()) + " owned by " +
                                       encode_base58(account.owner()));
    }
    return ProgramStatus::ok();
}

ProgramStatus LayoutCheck::check(const AccountView& account, size_t expected_len) {
    if (account.data_len() != expected_len) {
        return ProgramStatus::fail(ProgramError::InvalidAccountData,
                                   "expected " + std::to_string(expected_len) + " bytes, found " +
                                       std::to_string(account.data_len()));
    }
    return ProgramStatus::ok();
}

ProgramStatus check_token_layout(const AccountView& account, TokenStandard standard, TokenKind kind) {
    if (!svm::has_valid_token_layout(account.data(), standard, kind)) {
        return ProgramStatus::fail(ProgramError::InvalidAccountData,
                                   std::string(kind == TokenKind::Mint ? "mint" : "token account") +
                                       " layout of " + encode_base58(account.address()));
    }
    return ProgramStatus::ok();
}

const PublicKey& token_program_id(TokenStandard standard, const ProgramIds& ids) {
    return standard == TokenStandard::Legacy ? ids.token : ids.token_2022;
}

ProgramStatus MintCheck::check(const AccountView& account, TokenStandard standard, const ProgramIds& ids) {
    RETURN_IF_ERROR(OwnerCheck::check(account, token_program_id(standard, ids)));
    return check_token_layout(account, standard, TokenKind::Mint);
}

ProgramStatus TokenAccountCheck::check(const AccountView& account, TokenStandard standard, const ProgramIds& ids) {
    RETURN_IF_ERROR(OwnerCheck::check(account, token_program_id(standard, ids)));
    return check_token_layout(account, standard, TokenKind::Account);
}

namespace {

ProgramResult<TokenStandard> standard_from_owner(const AccountView& account, const ProgramIds& ids) {
    if (account.owned_by(ids.token)) {
        return TokenStandard::Legacy;
    }
    if (account.owned_by(ids.token_2022)) {
        return TokenStandard::Extended;
    }
    return ProgramStatus::fail(ProgramError::InvalidOwner,
                               encode_base58(account.address()) + " is not a token program account");
}

} // namespace

ProgramResult<TokenStandard> MintInterfaceCheck::check(const AccountView& account, const ProgramIds& ids) {
    auto standard = standard_from_owner(account, ids);
    RETURN_IF_ERROR(standard);
    RETURN_IF_ERROR(check_token_layout(account, standard.value(), TokenKind::Mint));
    return standard;
}

ProgramResult<TokenStandard> TokenAccountInterfaceCheck::check(const AccountView& account, const ProgramIds& ids) {
    auto standard = standard_from_owner(account, ids);
    RETURN_IF_ERROR(standard);
    RETURN_IF_ERROR(check_token_layout(account, standard.value(), TokenKind::Account));
    return standard;
}

ProgramStatus AssociatedTokenCheck::check(const AccountView& account,
                                          const PublicKey& authority,
                                          const PublicKey& mint,
                                          const PublicKey& token_program,
                                          const ProgramIds& ids) {
    RETURN_IF_ERROR(TokenAccountInterfaceCheck::check(account, ids));
    auto expected = svm::find_associated_token_address(authority, mint, token_program, ids.associated_token);
    RETURN_IF_ERROR(expected);
    if (expected.value().first != account.address()) {
        return ProgramStatus::fail(ProgramError::InvalidAddress,
                                   encode_base58(account.address()) + " is not the associated account of " +
                                       encode_base58(authority));
    }
    RETURN_IF_ERROR(OwnerCheck::check(account, token_program));

    auto stored = read_token_account(account);
    RETURN_IF_ERROR(stored);
    if (stored.value().mint != mint) {
        return ProgramStatus::fail(ProgramError::MintMismatch,
                                   encode_base58(account.address()) + " holds another mint");
    }
    if (stored.value().owner != authority) {
        return ProgramStatus::fail(ProgramError::OwnerMismatch,
                                   encode_base58(account.address()) + " belongs to another wallet");
    }
    return ProgramStatus::ok();
}

ProgramStatus ProgramAccountCheck::check(const AccountView& account, const PublicKey& program_id, size_t len) {
    if (account.is_closed()) {
        return ProgramStatus::fail(ProgramError::InvalidAccountData,
                                   encode_base58(account.address()) + " is already closed");
    }
    RETURN_IF_ERROR(OwnerCheck::check(account, program_id));
    return LayoutCheck::check(account, len);
}

ProgramResult<TokenStandard> TokenProgramCheck::check(const AccountView& account, const ProgramIds& ids) {
    if (account.address() == ids.token) {
        return TokenStandard::Legacy;
    }
    if (account.address() == ids.token_2022) {
        return TokenStandard::Extended;
    }
    return ProgramStatus::fail(ProgramError::IncorrectProgramId, encode_base58(account.address()));
}

ProgramResult<TokenAccount> read_token_account(const AccountView& account) {
    auto token_account = TokenAccount::unpack(account.data());
    RETURN_IF_ERROR(token_account);
    if (!token_account.value().is_initialized()) {
        return ProgramStatus::fail(ProgramError::UninitializedAccount, encode_base58(account.address()));
    }
    return token_account;
}

ProgramResult<Mint> read_mint(const AccountView& account) {
    auto mint = Mint::unpack(account.data());
    RETURN_IF_ERROR(mint);
    if (!mint.value().is_initialized) {
        return ProgramStatus::fail(ProgramError::UninitializedAccount, encode_base58(account.address()));
    }
    return mint;
}

ProgramStatus require_accounts(const std::vector<AccountView>& accounts, size_t count, const char* instruction) {
    if (accounts.size() < count) {
        return ProgramStatus::fail(ProgramError::InsufficientAccounts,
                                   std::string(instruction) + " expects " + std::to_string(count) +
                                       " accounts, got " + std::to_string(accounts.size()));
    }
    return ProgramStatus::ok();
}

} // namespace programs
} // namespace pinion
