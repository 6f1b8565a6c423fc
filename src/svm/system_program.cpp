#include "svm/system_program.h"
#include "common/base58.h"
#include "common/logging.h"

namespace pinion {
namespace svm {

namespace {

ProgramStatus require_signer(const AccountView& account) {
    if (!account.is_signer()) {
        return ProgramStatus::fail(ProgramError::MissingRequiredSignature,
                                   encode_base58(account.address()));
    }
    return ProgramStatus::ok();
}

// An address is free when it holds nothing and still belongs to the system program
ProgramStatus require_unused(const AccountView& account, const PublicKey& system_program) {
    if (account.lamports() > 0 || account.data_len() > 0 || !account.owned_by(system_program)) {
        return ProgramStatus::fail(ProgramError::AccountAlreadyInUse,
                                   encode_base58(account.address()));
    }
    return ProgramStatus::ok();
}

} // namespace

SystemProgram::SystemProgram(PublicKey program_id) : program_id_(std::move(program_id)) {}

PublicKey SystemProgram::get_program_id() const {
    return program_id_;
}

ProgramStatus SystemProgram::execute(
    std::vector<AccountView>& accounts,
    const std::vector<uint8_t>& data,
    ExecutionContext& context) const {

    (void)context;
    ByteReader reader(data);
    uint32_t discriminator = 0;
    if (!reader.read_u32(discriminator)) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData, "missing system instruction tag");
    }

    switch (static_cast<SystemInstruction>(discriminator)) {
        case SystemInstruction::CreateAccount:
            return handle_create_account(accounts, reader);
        case SystemInstruction::Assign:
            return handle_assign(accounts, reader);
        case SystemInstruction::Transfer:
            return handle_transfer(accounts, reader);
        case SystemInstruction::Allocate:
            return handle_allocate(accounts, reader);
    }
    return ProgramStatus::fail(ProgramError::InvalidInstructionData,
                               "unknown system instruction " + std::to_string(discriminator));
}

ProgramStatus SystemProgram::handle_create_account(std::vector<AccountView>& accounts,
                                                   ByteReader& reader) const {
    if (accounts.size() < 2) {
        return ProgramStatus::fail(ProgramError::InsufficientAccounts, "CreateAccount");
    }
    uint64_t lamports = 0;
    uint64_t space = 0;
    PublicKey owner;
    if (!reader.read_u64(lamports) || !reader.read_u64(space) || !reader.read_pubkey(owner)) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData, "CreateAccount payload");
    }

    AccountView& funder = accounts[0];
    AccountView& new_account = accounts[1];
    RETURN_IF_ERROR(require_signer(funder));
    RETURN_IF_ERROR(require_signer(new_account));
    RETURN_IF_ERROR(require_unused(new_account, program_id_));
    if (space > AccountView::MAX_DATA_LEN) {
        return ProgramStatus::fail(ProgramError::InvalidArgument, "CreateAccount space");
    }

    RETURN_IF_ERROR(funder.debit(lamports));
    RETURN_IF_ERROR(new_account.credit(lamports));
    RETURN_IF_ERROR(new_account.resize(static_cast<size_t>(space)));
    RETURN_IF_ERROR(new_account.assign(owner));

    LOG_TRACE("system", "Created account ", encode_base58(new_account.address()),
              " with ", space, " bytes");
    return ProgramStatus::ok();
}

ProgramStatus SystemProgram::handle_assign(std::vector<AccountView>& accounts,
                                           ByteReader& reader) const {
    if (accounts.empty()) {
        return ProgramStatus::fail(ProgramError::InsufficientAccounts, "Assign");
    }
    PublicKey owner;
    if (!reader.read_pubkey(owner)) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData, "Assign payload");
    }
    RETURN_IF_ERROR(require_signer(accounts[0]));
    return accounts[0].assign(owner);
}

ProgramStatus SystemProgram::handle_transfer(std::vector<AccountView>& accounts,
                                             ByteReader& reader) const {
    if (accounts.size() < 2) {
        return ProgramStatus::fail(ProgramError::InsufficientAccounts, "Transfer");
    }
    uint64_t lamports = 0;
    if (!reader.read_u64(lamports)) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData, "Transfer payload");
    }

    AccountView& from = accounts[0];
    AccountView& to = accounts[1];
    RETURN_IF_ERROR(require_signer(from));
    if (from.data_len() > 0) {
        return ProgramStatus::fail(ProgramError::InvalidArgument, "Transfer source carries data");
    }

    RETURN_IF_ERROR(from.debit(lamports));
    return to.credit(lamports);
}

ProgramStatus SystemProgram::handle_allocate(std::vector<AccountView>& accounts,
                                             ByteReader& reader) const {
    if (accounts.empty()) {
        return ProgramStatus::fail(ProgramError::InsufficientAccounts, "Allocate");
    }
    uint64_t space = 0;
    if (!reader.read_u64(space)) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData, "Allocate payload");
    }

    AccountView& account = accounts[0];
    RETURN_IF_ERROR(require_signer(account));
    if (account.data_len() > 0 || !account.owned_by(program_id_)) {
        return ProgramStatus::fail(ProgramError::AccountAlreadyInUse, encode_base58(account.address()));
    }
    if (space > AccountView::MAX_DATA_LEN) {
        return ProgramStatus::fail(ProgramError::InvalidArgument, "Allocate space");
    }
    return account.resize(static_cast<size_t>(space));
}

namespace system_instruction {

Instruction create_account(const PublicKey& system_program,
                           const PublicKey& funder,
                           const PublicKey& new_account,
                           Lamports lamports,
                           uint64_t space,
                           const PublicKey& owner) {
    ByteWriter writer(52);
    writer.write_u32(static_cast<uint32_t>(SystemProgram::SystemInstruction::CreateAccount))
          .write_u64(lamports)
          .write_u64(space)
          .write_pubkey(owner);
    return Instruction{
        system_program,
        {AccountMeta::writable(funder, true), AccountMeta::writable(new_account, true)},
        writer.take()};
}

Instruction assign(const PublicKey& system_program,
                   const PublicKey& account,
                   const PublicKey& owner) {
    ByteWriter writer(36);
    writer.write_u32(static_cast<uint32_t>(SystemProgram::SystemInstruction::Assign))
          .write_pubkey(owner);
    return Instruction{system_program, {AccountMeta::writable(account, true)}, writer.take()};
}

Instruction transfer(const PublicKey& system_program,
                     const PublicKey& from,
                     const PublicKey& to,
                     Lamports lamports) {
    ByteWriter writer(12);
    writer.write_u32(static_cast<uint32_t>(SystemProgram::SystemInstruction::Transfer))
          .write_u64(lamports);
    return Instruction{
        system_program,
        {AccountMeta::writable(from, true), AccountMeta::writable(to)},
        writer.take()};
}

Instruction allocate(const PublicKey& system_program,
                     const PublicKey& account,
                     uint64_t space) {
    ByteWriter writer(12);
    writer.write_u32(static_cast<uint32_t>(SystemProgram::SystemInstruction::Allocate))
          .write_u64(space);
    return Instruction{system_program, {AccountMeta::writable(account, true)}, writer.take()};
}

} // namespace system_instruction

} // namespace svm
} // namespace pinion
