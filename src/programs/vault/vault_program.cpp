#include "programs/vault/vault_program.h"
#include "common/base58.h"
#include "common/logging.h"
#include "programs/account_checks.h"
#include "svm/system_program.h"

namespace pinion {
namespace programs {
namespace vault {

using svm::AccountMeta;
using svm::ProgramError;
using svm::ProgramSigner;

namespace {

constexpr size_t OWNER = 0, VAULT = 1, SYSTEM_PROGRAM = 2, ACCOUNT_COUNT = 3;

} // namespace

VaultProgram::VaultProgram(const ProgramIds& ids) : ids_(ids) {}

PublicKey VaultProgram::get_program_id() const {
    return ids_.vault;
}

ProgramStatus VaultProgram::execute(
    std::vector<AccountView>& accounts,
    const std::vector<uint8_t>& data,
    ExecutionContext& context) const {

    ByteReader reader(data);
    uint8_t discriminator = 0;
    if (!reader.read_u8(discriminator)) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData, "missing discriminator");
    }

    ProgramStatus status;
    switch (static_cast<VaultInstruction>(discriminator)) {
        case VaultInstruction::Deposit:
            status = process_deposit(accounts, reader, context);
            break;
        case VaultInstruction::Withdraw:
            if (!reader.exhausted()) {
                return ProgramStatus::fail(ProgramError::InvalidInstructionData, "Withdraw takes no payload");
            }
            status = process_withdraw(accounts, context);
            break;
        default:
            return ProgramStatus::fail(ProgramError::InvalidInstructionData,
                                       "unknown vault instruction " + std::to_string(discriminator));
    }

    if (status.is_err()) {
        LOG_PROGRAM_ERROR("vault", "Instruction failed", svm::program_error_to_string(status.error()),
                          {{"detail", status.detail()}});
    }
    return status;
}

ProgramResult<uint8_t> VaultProgram::check_vault(const AccountView& owner, const AccountView& vault) const {
    auto derived = svm::find_program_address(seeds(owner.address()), ids_.vault);
    RETURN_IF_ERROR(derived);
    if (derived.value().first != vault.address()) {
        return ProgramStatus::fail(ProgramError::InvalidAddress, "vault address");
    }
    return derived.value().second;
}

ProgramStatus VaultProgram::process_deposit(std::vector<AccountView>& accounts,
                                            ByteReader& reader,
                                            ExecutionContext& context) const {
    RETURN_IF_ERROR(require_accounts(accounts, ACCOUNT_COUNT, "Deposit"));

    uint64_t amount = 0;
    if (reader.remaining() != 8 || !reader.read_u64(amount)) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData, "Deposit payload");
    }

    const AccountView& owner = accounts[OWNER];
    const AccountView& vault = accounts[VAULT];
    RETURN_IF_ERROR(SignerCheck::check(owner));
    auto bump = check_vault(owner, vault);
    RETURN_IF_ERROR(bump);
    if (accounts[SYSTEM_PROGRAM].address() != ids_.system) {
        return ProgramStatus::fail(ProgramError::IncorrectProgramId, "system program");
    }

    if (vault.lamports() != 0) {
        return ProgramStatus::fail(ProgramError::InvalidState, "vault already funded");
    }
    const Lamports minimum = context.rent().minimum_balance(0);
    if (amount <= minimum) {
        return ProgramStatus::fail(ProgramError::InvalidArgument,
                                   "deposit must exceed " + std::to_string(minimum) + " lamports");
    }

    RETURN_IF_ERROR(context.invoke(
        svm::system_instruction::transfer(ids_.system, owner.address(), vault.address(), amount)));

    context.log("Deposit: " + std::to_string(amount) + " lamports into " + encode_base58(vault.address()));
    return ProgramStatus::ok();
}

ProgramStatus VaultProgram::process_withdraw(std::vector<AccountView>& accounts,
                                             ExecutionContext& context) const {
    RETURN_IF_ERROR(require_accounts(accounts, ACCOUNT_COUNT, "Withdraw"));

    const AccountView& owner = accounts[OWNER];
    const AccountView& vault = accounts[VAULT];
    RETURN_IF_ERROR(SignerCheck::check(owner));
    auto bump = check_vault(owner, vault);
    RETURN_IF_ERROR(bump);
    if (accounts[SYSTEM_PROGRAM].address() != ids_.system) {
        return ProgramStatus::fail(ProgramError::IncorrectProgramId, "system program");
    }

    const Lamports balance = vault.lamports();
    if (balance == 0) {
        return ProgramStatus::fail(ProgramError::InvalidState, "vault is empty");
    }

    auto signer = ProgramSigner::create(seeds(owner.address(), bump.value()), ids_.vault);
    RETURN_IF_ERROR(signer);
    RETURN_IF_ERROR(context.invoke(
        svm::system_instruction::transfer(ids_.system, vault.address(), owner.address(), balance),
        {signer.value()}));

    context.log("Withdraw: " + std::to_string(balance) + " lamports");
    return ProgramStatus::ok();
}

svm::Seeds VaultProgram::seeds(const PublicKey& owner, std::optional<uint8_t> bump) {
    svm::Seeds seeds{svm::seed_bytes("vault"), owner};
    if (bump) {
        seeds.push_back({*bump});
    }
    return seeds;
}

ProgramResult<std::pair<PublicKey, uint8_t>> VaultProgram::derive(const ProgramIds& ids, const PublicKey& owner) {
    return svm::find_program_address(seeds(owner), ids.vault);
}

ProgramResult<Instruction> VaultProgram::deposit(const ProgramIds& ids, const PublicKey& owner, Lamports amount) {
    auto vault = derive(ids, owner);
    RETURN_IF_ERROR(vault);

    ByteWriter writer(9);
    writer.write_u8(static_cast<uint8_t>(VaultInstruction::Deposit)).write_u64(amount);
    return Instruction{
        ids.vault,
        {AccountMeta::writable(owner, true),
         AccountMeta::writable(vault.value().first),
         AccountMeta::readonly(ids.system)},
        writer.take()};
}

ProgramResult<Instruction> VaultProgram::withdraw(const ProgramIds& ids, const PublicKey& owner) {
    auto vault = derive(ids, owner);
    RETURN_IF_ERROR(vault);
    return Instruction{
        ids.vault,
        {AccountMeta::writable(owner, true),
         AccountMeta::writable(vault.value().first),
         AccountMeta::readonly(ids.system)},
        {static_cast<uint8_t>(VaultInstruction::Withdraw)}};
}

} // namespace vault
} // namespace programs
} // namespace pinion
