#include "svm/spl_programs.h"
#include "common/base58.h"
#include "common/logging.h"
#include "svm/system_program.h"
#include "svm/token_program.h"

namespace pinion {
namespace svm {

// SPL Associated Token Account Program Implementation
SPLAssociatedTokenProgram::SPLAssociatedTokenProgram(const ProgramIds& ids) : ids_(ids) {}

PublicKey SPLAssociatedTokenProgram::get_program_id() const {
    return ids_.associated_token;
}

ProgramStatus SPLAssociatedTokenProgram::execute(
    std::vector<AccountView>& accounts,
    const std::vector<uint8_t>& data,
    ExecutionContext& context) const {

    if (data.empty()) {
        return handle_create(accounts, context, false);
    }
    if (data.size() != 1) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData, "associated token payload");
    }

    switch (static_cast<ATAInstruction>(data[0])) {
        case ATAInstruction::Create:
            return handle_create(accounts, context, false);
        case ATAInstruction::CreateIdempotent:
            return handle_create(accounts, context, true);
    }
    return ProgramStatus::fail(ProgramError::InvalidInstructionData,
                               "unknown associated token instruction " + std::to_string(data[0]));
}

ProgramStatus SPLAssociatedTokenProgram::handle_create(std::vector<AccountView>& accounts,
                                                       ExecutionContext& context,
                                                       bool idempotent) const {
    if (accounts.size() < 6) {
        return ProgramStatus::fail(ProgramError::InsufficientAccounts, "associated token Create");
    }
    AccountView& payer = accounts[0];
    AccountView& associated_account = accounts[1];
    const AccountView& wallet = accounts[2];
    const AccountView& mint = accounts[3];
    const AccountView& system_program = accounts[4];
    const AccountView& token_program = accounts[5];

    if (system_program.address() != ids_.system) {
        return ProgramStatus::fail(ProgramError::IncorrectProgramId, "system program");
    }
    if (!ids_.is_token_program(token_program.address())) {
        return ProgramStatus::fail(ProgramError::IncorrectProgramId, "token program");
    }
    const TokenStandard standard = token_program.address() == ids_.token
        ? TokenStandard::Legacy
        : TokenStandard::Extended;

    if (!mint.owned_by(token_program.address())) {
        return ProgramStatus::fail(ProgramError::IncorrectProgramId, "mint owner");
    }
    if (!has_valid_token_layout(mint.data(), standard, TokenKind::Mint)) {
        return ProgramStatus::fail(ProgramError::InvalidAccountData, "mint layout");
    }

    auto derived = find_associated_token_address(
        wallet.address(), mint.address(), token_program.address(), ids_.associated_token);
    RETURN_IF_ERROR(derived);
    if (derived.value().first != associated_account.address()) {
        return ProgramStatus::fail(ProgramError::InvalidSeeds,
                                   "associated address mismatch for " + encode_base58(wallet.address()));
    }

    if (idempotent && is_existing_associated_account(associated_account, wallet.address(),
                                                     mint.address(), token_program.address())) {
        return ProgramStatus::ok();
    }

    auto signer = ProgramSigner::create(
        {wallet.address(), token_program.address(), mint.address(), {derived.value().second}},
        ids_.associated_token);
    RETURN_IF_ERROR(signer);

    const size_t space = standard == TokenStandard::Extended
        ? token_layout::EXTENDED_ACCOUNT_LEN
        : token_layout::ACCOUNT_LEN;
    RETURN_IF_ERROR(create_account(payer, associated_account, signer.value(), space,
                                   token_program.address(), context));

    if (standard == TokenStandard::Extended) {
        RETURN_IF_ERROR(context.invoke(token_instruction::initialize_immutable_owner(
            token_program.address(), associated_account.address())));
    }
    RETURN_IF_ERROR(context.invoke(token_instruction::initialize_account3(
        token_program.address(), associated_account.address(), mint.address(), wallet.address())));

    LOG_DEBUG("associated-token", "Created associated account ",
              encode_base58(associated_account.address()), " for ", encode_base58(wallet.address()));
    return ProgramStatus::ok();
}

bool SPLAssociatedTokenProgram::is_existing_associated_account(const AccountView& account,
                                                                const PublicKey& wallet,
                                                                const PublicKey& mint,
                                                                const PublicKey& token_program) const {
    if (!account.owned_by(token_program)) {
        return false;
    }
    auto token_account = TokenAccount::unpack(account.data());
    return token_account.is_ok() && token_account.value().is_initialized() &&
           token_account.value().owner == wallet && token_account.value().mint == mint;
}

ProgramStatus SPLAssociatedTokenProgram::create_account(AccountView& payer,
                                                        AccountView& associated_account,
                                                        const ProgramSigner& signer,
                                                        size_t space,
                                                        const PublicKey& token_program,
                                                        ExecutionContext& context) const {
    const Lamports required = context.rent().minimum_balance(space);
    const Lamports current = associated_account.lamports();

    if (current == 0) {
        return context.invoke(
            system_instruction::create_account(ids_.system, payer.address(), associated_account.address(),
                                               required, space, token_program),
            {signer});
    }

    // Someone pre-funded the address: top it up, then allocate and assign
    if (current < required) {
        RETURN_IF_ERROR(context.invoke(
            system_instruction::transfer(ids_.system, payer.address(), associated_account.address(),
                                         required - current)));
    }
    RETURN_IF_ERROR(context.invoke(
        system_instruction::allocate(ids_.system, associated_account.address(), space), {signer}));
    return context.invoke(
        system_instruction::assign(ids_.system, associated_account.address(), token_program), {signer});
}

Instruction SPLAssociatedTokenProgram::create(const ProgramIds& ids,
                                              const PublicKey& payer,
                                              const PublicKey& wallet,
                                              const PublicKey& mint,
                                              const PublicKey& token_program,
                                              bool idempotent) {
    PublicKey associated;
    auto derived = find_associated_token_address(wallet, mint, token_program, ids.associated_token);
    if (derived.is_ok()) {
        associated = derived.value().first;
    }
    return Instruction{
        ids.associated_token,
        {AccountMeta::writable(payer, true),
         AccountMeta::writable(associated),
         AccountMeta::readonly(wallet),
         AccountMeta::readonly(mint),
         AccountMeta::readonly(ids.system),
         AccountMeta::readonly(token_program)},
        {static_cast<uint8_t>(idempotent ? ATAInstruction::CreateIdempotent : ATAInstruction::Create)}};
}

} // namespace svm
} // namespace pinion
