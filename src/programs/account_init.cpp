#include "programs/account_init.h"
#include "svm/spl_programs.h"
#include "svm/system_program.h"
#include "svm/token_program.h"

namespace pinion {
namespace programs {

ProgramStatus create_program_account(ExecutionContext& context,
                                     const AccountView& payer,
                                     const AccountView& account,
                                     const ProgramSigner& signer,
                                     size_t space,
                                     const PublicKey& owner,
                                     const ProgramIds& ids) {
    if (signer.address() != account.address()) {
        return ProgramStatus::fail(ProgramError::InvalidSeeds, "signer does not match the new account");
    }
    const Lamports lamports = context.rent().minimum_balance(space);
    return context.invoke(
        svm::system_instruction::create_account(ids.system, payer.address(), account.address(),
                                                lamports, space, owner),
        {signer});
}

ProgramStatus init_mint(ExecutionContext& context,
                        const AccountView& payer,
                        const AccountView& mint,
                        const ProgramSigner& signer,
                        uint8_t decimals,
                        const PublicKey& mint_authority,
                        const PublicKey& token_program,
                        const ProgramIds& ids) {
    RETURN_IF_ERROR(create_program_account(context, payer, mint, signer, svm::token_layout::MINT_LEN,
                                           token_program, ids));
    return context.invoke(
        svm::token_instruction::initialize_mint2(token_program, mint.address(), decimals, mint_authority));
}

ProgramStatus init_ata(ExecutionContext& context,
                       const AccountView& payer,
                       const AccountView& account,
                       const PublicKey& wallet,
                       const PublicKey& mint,
                       const PublicKey& token_program,
                       const ProgramIds& ids) {
    svm::Instruction create = svm::SPLAssociatedTokenProgram::create(
        ids, payer.address(), wallet, mint, token_program, false);
    if (create.accounts[1].pubkey != account.address()) {
        return ProgramStatus::fail(ProgramError::InvalidAddress, "associated token account address");
    }
    return context.invoke(create);
}

ProgramStatus init_ata_if_needed(ExecutionContext& context,
                                 const AccountView& payer,
                                 const AccountView& account,
                                 const PublicKey& wallet,
                                 const PublicKey& mint,
                                 const PublicKey& token_program,
                                 const ProgramIds& ids) {
    if (AssociatedTokenCheck::check(account, wallet, mint, token_program, ids).is_ok()) {
        return ProgramStatus::ok();
    }
    return init_ata(context, payer, account, wallet, mint, token_program, ids);
}

ProgramStatus close_program_account(AccountView& account, AccountView& destination) {
    RETURN_IF_ERROR(account.write_data(0, {CLOSED_ACCOUNT_TOMBSTONE}));

    const Lamports lamports = account.lamports();
    RETURN_IF_ERROR(account.debit(lamports));
    RETURN_IF_ERROR(destination.credit(lamports));

    RETURN_IF_ERROR(account.resize(1));
    return account.close();
}

} // namespace programs
} // namespace pinion
