#include "programs/escrow/escrow_program.h"
#include "common/base58.h"
#include "common/logging.h"
#include "programs/account_init.h"
#include "svm/token_program.h"

namespace pinion {
namespace programs {
namespace escrow {

using svm::AccountMeta;
using svm::ProgramError;
using svm::ProgramSigner;

namespace {

constexpr size_t MAKE_PAYLOAD_LEN = 24;

// Account positions
namespace make_accounts {
    constexpr size_t MAKER = 0, ESCROW = 1, MINT_A = 2, MINT_B = 3, MAKER_ATA_A = 4, VAULT = 5,
                     SYSTEM_PROGRAM = 6, TOKEN_PROGRAM = 7, COUNT = 8;
}

namespace take_accounts {
    constexpr size_t TAKER = 0, MAKER = 1, ESCROW = 2, MINT_A = 3, MINT_B = 4, VAULT = 5,
                     TAKER_ATA_A = 6, TAKER_ATA_B = 7, MAKER_ATA_B = 8, SYSTEM_PROGRAM = 9,
                     TOKEN_PROGRAM = 10, COUNT = 11;
}

namespace refund_accounts {
    constexpr size_t MAKER = 0, ESCROW = 1, MINT_A = 2, VAULT = 3, MAKER_ATA_A = 4,
                     SYSTEM_PROGRAM = 5, TOKEN_PROGRAM = 6, COUNT = 7;
}

/// Mint of either standard that belongs to the token program passed in
ProgramStatus check_mint_of(const AccountView& mint, const AccountView& token_program, const ProgramIds& ids) {
    RETURN_IF_ERROR(MintInterfaceCheck::check(mint, ids));
    return OwnerCheck::check(mint, token_program.address());
}

ProgramResult<PublicKey> associated_address(const ProgramIds& ids,
                                            const PublicKey& wallet,
                                            const PublicKey& mint,
                                            const PublicKey& token_program) {
    auto derived = svm::find_associated_token_address(wallet, mint, token_program, ids.associated_token);
    RETURN_IF_ERROR(derived);
    return derived.value().first;
}

} // namespace

EscrowProgram::EscrowProgram(const ProgramIds& ids) : ids_(ids) {}

PublicKey EscrowProgram::get_program_id() const {
    return ids_.escrow;
}

ProgramStatus EscrowProgram::execute(
    std::vector<AccountView>& accounts,
    const std::vector<uint8_t>& data,
    ExecutionContext& context) const {

    ByteReader reader(data);
    uint8_t discriminator = 0;
    if (!reader.read_u8(discriminator)) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData, "missing discriminator");
    }

    ProgramStatus status;
    switch (static_cast<EscrowInstruction>(discriminator)) {
        case EscrowInstruction::Make:
            status = process_make(accounts, reader, context);
            break;
        case EscrowInstruction::Take:
            status = process_take(accounts, context);
            break;
        case EscrowInstruction::Refund:
            status = process_refund(accounts, context);
            break;
        default:
            return ProgramStatus::fail(ProgramError::InvalidInstructionData,
                                       "unknown escrow instruction " + std::to_string(discriminator));
    }

    if (status.is_err()) {
        LOG_PROGRAM_ERROR("escrow", "Instruction failed", svm::program_error_to_string(status.error()),
                          {{"detail", status.detail()}});
    }
    return status;
}

ProgramResult<Escrow> EscrowProgram::load_escrow(const AccountView& escrow_account) const {
    RETURN_IF_ERROR(ProgramAccountCheck::check(escrow_account, ids_.escrow, Escrow::LEN));
    auto escrow = Escrow::unpack(escrow_account.data());
    RETURN_IF_ERROR(escrow);

    const Escrow& record = escrow.value();
    auto expected = svm::create_program_address(Escrow::seeds(record.maker, record.seed, record.bump),
                                                ids_.escrow);
    if (expected.is_err() || expected.value() != escrow_account.address()) {
        return ProgramStatus::fail(ProgramError::InvalidAddress, "escrow does not match its stored seeds");
    }
    return escrow;
}

ProgramStatus EscrowProgram::process_make(std::vector<AccountView>& accounts,
                                          ByteReader& reader,
                                          ExecutionContext& context) const {
    using namespace make_accounts;
    RETURN_IF_ERROR(require_accounts(accounts, COUNT, "Make"));

    uint64_t seed = 0;
    uint64_t receive = 0;
    uint64_t amount = 0;
    if (reader.remaining() != MAKE_PAYLOAD_LEN ||
        !reader.read_u64(seed) || !reader.read_u64(receive) || !reader.read_u64(amount)) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData, "Make payload");
    }

    AccountView& maker = accounts[MAKER];
    AccountView& escrow = accounts[ESCROW];
    const AccountView& mint_a = accounts[MINT_A];
    const AccountView& mint_b = accounts[MINT_B];
    AccountView& maker_ata_a = accounts[MAKER_ATA_A];
    AccountView& vault = accounts[VAULT];
    const AccountView& token_program = accounts[TOKEN_PROGRAM];

    RETURN_IF_ERROR(SignerCheck::check(maker));
    RETURN_IF_ERROR(TokenProgramCheck::check(token_program, ids_));
    RETURN_IF_ERROR(check_mint_of(mint_a, token_program, ids_));
    RETURN_IF_ERROR(check_mint_of(mint_b, token_program, ids_));
    RETURN_IF_ERROR(AssociatedTokenCheck::check(maker_ata_a, maker.address(), mint_a.address(),
                                                token_program.address(), ids_));

    if (amount == 0 || receive == 0) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData, "amount and receive must be non-zero");
    }

    auto derived = svm::find_program_address(Escrow::seeds(maker.address(), seed), ids_.escrow);
    RETURN_IF_ERROR(derived);
    const uint8_t bump = derived.value().second;
    if (derived.value().first != escrow.address()) {
        return ProgramStatus::fail(ProgramError::InvalidAddress, "escrow address");
    }

    auto escrow_signer = ProgramSigner::create(Escrow::seeds(maker.address(), seed, bump), ids_.escrow);
    RETURN_IF_ERROR(escrow_signer);
    RETURN_IF_ERROR(create_program_account(context, maker, escrow, escrow_signer.value(), Escrow::LEN,
                                           ids_.escrow, ids_));

    Escrow record;
    record.seed = seed;
    record.maker = maker.address();
    record.mint_a = mint_a.address();
    record.mint_b = mint_b.address();
    record.receive = receive;
    record.bump = bump;
    RETURN_IF_ERROR(escrow.write_data(0, record.pack()));

    RETURN_IF_ERROR(init_ata(context, maker, vault, escrow.address(), mint_a.address(),
                             token_program.address(), ids_));

    auto mint = read_mint(mint_a);
    RETURN_IF_ERROR(mint);
    RETURN_IF_ERROR(context.invoke(svm::token_instruction::transfer_checked(
        token_program.address(), maker_ata_a.address(), mint_a.address(), vault.address(),
        maker.address(), amount, mint.value().decimals)));

    context.log("Make: escrow " + encode_base58(escrow.address()) + " holds " + std::to_string(amount));
    return ProgramStatus::ok();
}

ProgramStatus EscrowProgram::process_take(std::vector<AccountView>& accounts,
                                          ExecutionContext& context) const {
    using namespace take_accounts;
    RETURN_IF_ERROR(require_accounts(accounts, COUNT, "Take"));

    AccountView& taker = accounts[TAKER];
    AccountView& maker = accounts[MAKER];
    AccountView& escrow = accounts[ESCROW];
    const AccountView& mint_a = accounts[MINT_A];
    const AccountView& mint_b = accounts[MINT_B];
    AccountView& vault = accounts[VAULT];
    AccountView& taker_ata_a = accounts[TAKER_ATA_A];
    AccountView& taker_ata_b = accounts[TAKER_ATA_B];
    AccountView& maker_ata_b = accounts[MAKER_ATA_B];
    const AccountView& token_program = accounts[TOKEN_PROGRAM];

    RETURN_IF_ERROR(SignerCheck::check(taker));

    auto loaded = load_escrow(escrow);
    RETURN_IF_ERROR(loaded);
    const Escrow& record = loaded.value();
    if (record.maker != maker.address() || record.mint_a != mint_a.address() ||
        record.mint_b != mint_b.address()) {
        return ProgramStatus::fail(ProgramError::InvalidAccountData, "accounts do not match the escrow record");
    }

    RETURN_IF_ERROR(TokenProgramCheck::check(token_program, ids_));
    RETURN_IF_ERROR(check_mint_of(mint_a, token_program, ids_));
    RETURN_IF_ERROR(check_mint_of(mint_b, token_program, ids_));
    RETURN_IF_ERROR(AssociatedTokenCheck::check(vault, escrow.address(), mint_a.address(),
                                                token_program.address(), ids_));
    RETURN_IF_ERROR(AssociatedTokenCheck::check(taker_ata_b, taker.address(), mint_b.address(),
                                                token_program.address(), ids_));

    RETURN_IF_ERROR(init_ata_if_needed(context, taker, taker_ata_a, taker.address(), mint_a.address(),
                                       token_program.address(), ids_));
    RETURN_IF_ERROR(init_ata_if_needed(context, taker, maker_ata_b, maker.address(), mint_b.address(),
                                       token_program.address(), ids_));

    auto decimals_a = read_mint(mint_a);
    RETURN_IF_ERROR(decimals_a);
    auto decimals_b = read_mint(mint_b);
    RETURN_IF_ERROR(decimals_b);

    // Pay the maker first
    RETURN_IF_ERROR(context.invoke(svm::token_instruction::transfer_checked(
        token_program.address(), taker_ata_b.address(), mint_b.address(), maker_ata_b.address(),
        taker.address(), record.receive, decimals_b.value().decimals)));

    auto vault_state = read_token_account(vault);
    RETURN_IF_ERROR(vault_state);
    auto escrow_signer = ProgramSigner::create(Escrow::seeds(record.maker, record.seed, record.bump),
                                               ids_.escrow);
    RETURN_IF_ERROR(escrow_signer);

    RETURN_IF_ERROR(context.invoke(
        svm::token_instruction::transfer_checked(
            token_program.address(), vault.address(), mint_a.address(), taker_ata_a.address(),
            escrow.address(), vault_state.value().amount, decimals_a.value().decimals),
        {escrow_signer.value()}));
    RETURN_IF_ERROR(context.invoke(
        svm::token_instruction::close_account(token_program.address(), vault.address(), maker.address(),
                                              escrow.address()),
        {escrow_signer.value()}));

    RETURN_IF_ERROR(close_program_account(escrow, maker));
    context.log("Take: escrow " + encode_base58(escrow.address()) + " settled");
    return ProgramStatus::ok();
}

ProgramStatus EscrowProgram::process_refund(std::vector<AccountView>& accounts,
                                            ExecutionContext& context) const {
    using namespace refund_accounts;
    RETURN_IF_ERROR(require_accounts(accounts, COUNT, "Refund"));

    AccountView& maker = accounts[MAKER];
    AccountView& escrow = accounts[ESCROW];
    const AccountView& mint_a = accounts[MINT_A];
    AccountView& vault = accounts[VAULT];
    AccountView& maker_ata_a = accounts[MAKER_ATA_A];
    const AccountView& token_program = accounts[TOKEN_PROGRAM];

    RETURN_IF_ERROR(SignerCheck::check(maker));

    auto loaded = load_escrow(escrow);
    RETURN_IF_ERROR(loaded);
    const Escrow& record = loaded.value();
    if (record.maker != maker.address() || record.mint_a != mint_a.address()) {
        return ProgramStatus::fail(ProgramError::InvalidAccountData, "accounts do not match the escrow record");
    }

    RETURN_IF_ERROR(TokenProgramCheck::check(token_program, ids_));
    RETURN_IF_ERROR(check_mint_of(mint_a, token_program, ids_));
    RETURN_IF_ERROR(AssociatedTokenCheck::check(vault, escrow.address(), mint_a.address(),
                                                token_program.address(), ids_));
    RETURN_IF_ERROR(init_ata_if_needed(context, maker, maker_ata_a, maker.address(), mint_a.address(),
                                       token_program.address(), ids_));

    auto mint = read_mint(mint_a);
    RETURN_IF_ERROR(mint);
    auto vault_state = read_token_account(vault);
    RETURN_IF_ERROR(vault_state);
    auto escrow_signer = ProgramSigner::create(Escrow::seeds(record.maker, record.seed, record.bump),
                                               ids_.escrow);
    RETURN_IF_ERROR(escrow_signer);

    RETURN_IF_ERROR(context.invoke(
        svm::token_instruction::transfer_checked(
            token_program.address(), vault.address(), mint_a.address(), maker_ata_a.address(),
            escrow.address(), vault_state.value().amount, mint.value().decimals),
        {escrow_signer.value()}));
    RETURN_IF_ERROR(context.invoke(
        svm::token_instruction::close_account(token_program.address(), vault.address(), maker.address(),
                                              escrow.address()),
        {escrow_signer.value()}));

    RETURN_IF_ERROR(close_program_account(escrow, maker));
    context.log("Refund: escrow " + encode_base58(escrow.address()) + " returned " +
                std::to_string(vault_state.value().amount));
    return ProgramStatus::ok();
}

ProgramResult<Instruction> EscrowProgram::make(const ProgramIds& ids,
                                               const PublicKey& maker,
                                               const PublicKey& mint_a,
                                               const PublicKey& mint_b,
                                               const PublicKey& token_program,
                                               uint64_t seed,
                                               uint64_t receive,
                                               uint64_t amount) {
    auto escrow = svm::find_program_address(Escrow::seeds(maker, seed), ids.escrow);
    RETURN_IF_ERROR(escrow);
    auto maker_ata_a = associated_address(ids, maker, mint_a, token_program);
    RETURN_IF_ERROR(maker_ata_a);
    auto vault = associated_address(ids, escrow.value().first, mint_a, token_program);
    RETURN_IF_ERROR(vault);

    ByteWriter writer(1 + MAKE_PAYLOAD_LEN);
    writer.write_u8(static_cast<uint8_t>(EscrowInstruction::Make))
          .write_u64(seed)
          .write_u64(receive)
          .write_u64(amount);
    return Instruction{
        ids.escrow,
        {AccountMeta::writable(maker, true),
         AccountMeta::writable(escrow.value().first),
         AccountMeta::readonly(mint_a),
         AccountMeta::readonly(mint_b),
         AccountMeta::writable(maker_ata_a.value()),
         AccountMeta::writable(vault.value()),
         AccountMeta::readonly(ids.system),
         AccountMeta::readonly(token_program)},
        writer.take()};
}

ProgramResult<Instruction> EscrowProgram::take(const ProgramIds& ids,
                                               const PublicKey& taker,
                                               const PublicKey& maker,
                                               const PublicKey& mint_a,
                                               const PublicKey& mint_b,
                                               const PublicKey& token_program,
                                               uint64_t seed) {
    auto escrow = svm::find_program_address(Escrow::seeds(maker, seed), ids.escrow);
    RETURN_IF_ERROR(escrow);
    auto vault = associated_address(ids, escrow.value().first, mint_a, token_program);
    RETURN_IF_ERROR(vault);
    auto taker_ata_a = associated_address(ids, taker, mint_a, token_program);
    RETURN_IF_ERROR(taker_ata_a);
    auto taker_ata_b = associated_address(ids, taker, mint_b, token_program);
    RETURN_IF_ERROR(taker_ata_b);
    auto maker_ata_b = associated_address(ids, maker, mint_b, token_program);
    RETURN_IF_ERROR(maker_ata_b);

    return Instruction{
        ids.escrow,
        {AccountMeta::writable(taker, true),
         AccountMeta::writable(maker),
         AccountMeta::writable(escrow.value().first),
         AccountMeta::readonly(mint_a),
         AccountMeta::readonly(mint_b),
         AccountMeta::writable(vault.value()),
         AccountMeta::writable(taker_ata_a.value()),
         AccountMeta::writable(taker_ata_b.value()),
         AccountMeta::writable(maker_ata_b.value()),
         AccountMeta::readonly(ids.system),
         AccountMeta::readonly(token_program)},
        {static_cast<uint8_t>(EscrowInstruction::Take)}};
}

ProgramResult<Instruction> EscrowProgram::refund(const ProgramIds& ids,
                                                 const PublicKey& maker,
                                                 const PublicKey& mint_a,
                                                 const PublicKey& token_program,
                                                 uint64_t seed) {
    auto escrow = svm::find_program_address(Escrow::seeds(maker, seed), ids.escrow);
    RETURN_IF_ERROR(escrow);
    auto vault = associated_address(ids, escrow.value().first, mint_a, token_program);
    RETURN_IF_ERROR(vault);
    auto maker_ata_a = associated_address(ids, maker, mint_a, token_program);
    RETURN_IF_ERROR(maker_ata_a);

    return Instruction{
        ids.escrow,
        {AccountMeta::writable(maker, true),
         AccountMeta::writable(escrow.value().first),
         AccountMeta::readonly(mint_a),
         AccountMeta::writable(vault.value()),
         AccountMeta::writable(maker_ata_a.value()),
         AccountMeta::readonly(ids.system),
         AccountMeta::readonly(token_program)},
        {static_cast<uint8_t>(EscrowInstruction::Refund)}};
}

} // namespace escrow
} // namespace programs
} // namespace pinion
