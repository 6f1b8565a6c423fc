#pragma once

#include "programs/account_checks.h"
#include "svm/program_address.h"

namespace pinion {
namespace programs {

using svm::ExecutionContext;
using svm::ProgramSigner;

/**
 * Account initializers
 *
 * Creation goes through CPIs into the system, token and associated-token
 * programs, so every account named here must also appear in the calling
 * instruction's account list. The *_if_needed variants run the matching
 * check first and do nothing when it passes; they never repair an existing
 * account, and a real collision surfaces as AccountAlreadyInUse from the
 * system program.
 */

/// Create a rent-exempt account of space bytes owned by owner, paid by payer
ProgramStatus create_program_account(ExecutionContext& context,
                                     const AccountView& payer,
                                     const AccountView& account,
                                     const ProgramSigner& signer,
                                     size_t space,
                                     const PublicKey& owner,
                                     const ProgramIds& ids);

/// Create a mint at a derived address and initialize it without a freeze authority
ProgramStatus init_mint(ExecutionContext& context,
                        const AccountView& payer,
                        const AccountView& mint,
                        const ProgramSigner& signer,
                        uint8_t decimals,
                        const PublicKey& mint_authority,
                        const PublicKey& token_program,
                        const ProgramIds& ids);

/// Associated-token Create; fails if the account already exists
ProgramStatus init_ata(ExecutionContext& context,
                       const AccountView& payer,
                       const AccountView& account,
                       const PublicKey& wallet,
                       const PublicKey& mint,
                       const PublicKey& token_program,
                       const ProgramIds& ids);

ProgramStatus init_ata_if_needed(ExecutionContext& context,
                                 const AccountView& payer,
                                 const AccountView& account,
                                 const PublicKey& wallet,
                                 const PublicKey& mint,
                                 const PublicKey& token_program,
                                 const ProgramIds& ids);

/**
 * Close a record owned by the executing program: tombstone byte 0, move all
 * lamports to destination, shrink to one byte, then release the account to
 * the system program.
 */
ProgramStatus close_program_account(AccountView& account, AccountView& destination);

constexpr uint8_t CLOSED_ACCOUNT_TOMBSTONE = 0xff;

} // namespace programs
} // namespace pinion
