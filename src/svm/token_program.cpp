#include "svm/token_program.h"
#include "common/base58.h"
#include "common/logging.h"

namespace pinion {
namespace svm {

namespace {

ProgramStatus require_authority(const AccountView& authority, const PublicKey& expected) {
    if (authority.address() != expected) {
        return ProgramStatus::fail(ProgramError::OwnerMismatch, encode_base58(authority.address()));
    }
    if (!authority.is_signer()) {
        return ProgramStatus::fail(ProgramError::MissingRequiredSignature,
                                   encode_base58(authority.address()));
    }
    return ProgramStatus::ok();
}

ProgramStatus require_rent_exempt(const AccountView& account, const ExecutionContext& context) {
    if (!context.rent().is_rent_exempt(account.lamports(), account.data_len())) {
        return ProgramStatus::fail(ProgramError::NotRentExempt, encode_base58(account.address()));
    }
    return ProgramStatus::ok();
}

} // namespace

TokenProgram::TokenProgram(PublicKey program_id, TokenStandard standard)
    : program_id_(std::move(program_id)), standard_(standard) {}

PublicKey TokenProgram::get_program_id() const {
    return program_id_;
}

std::string TokenProgram::get_name() const {
    return standard_ == TokenStandard::Legacy ? "token" : "token-2022";
}

ProgramStatus TokenProgram::execute(
    std::vector<AccountView>& accounts,
    const std::vector<uint8_t>& data,
    ExecutionContext& context) const {

    ByteReader reader(data);
    uint8_t discriminator = 0;
    if (!reader.read_u8(discriminator)) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData, "missing token instruction tag");
    }

    switch (static_cast<TokenInstruction>(discriminator)) {
        case TokenInstruction::InitializeMint2:
            return handle_initialize_mint(accounts, reader, context);
        case TokenInstruction::InitializeAccount3:
            return handle_initialize_account(accounts, reader, context);
        case TokenInstruction::InitializeImmutableOwner:
            return handle_initialize_immutable_owner(accounts);
        case TokenInstruction::Transfer:
            return handle_transfer(accounts, reader, false);
        case TokenInstruction::TransferChecked:
            return handle_transfer(accounts, reader, true);
        case TokenInstruction::MintTo:
            return handle_mint_to(accounts, reader);
        case TokenInstruction::Burn:
            return handle_burn(accounts, reader);
        case TokenInstruction::CloseAccount:
            return handle_close_account(accounts);
    }
    return ProgramStatus::fail(ProgramError::InvalidInstructionData,
                               "unknown token instruction " + std::to_string(discriminator));
}

ProgramResult<Mint> TokenProgram::load_mint(const AccountView& account) const {
    if (!account.owned_by(program_id_)) {
        return ProgramStatus::fail(ProgramError::IncorrectProgramId, "mint " + encode_base58(account.address()));
    }
    if (!has_valid_token_layout(account.data(), standard_, TokenKind::Mint)) {
        return ProgramStatus::fail(ProgramError::InvalidAccountData, "mint layout");
    }
    auto mint = Mint::unpack(account.data());
    RETURN_IF_ERROR(mint);
    if (!mint.value().is_initialized) {
        return ProgramStatus::fail(ProgramError::UninitializedAccount, "mint " + encode_base58(account.address()));
    }
    return mint;
}

ProgramResult<TokenAccount> TokenProgram::load_account(const AccountView& account) const {
    if (!account.owned_by(program_id_)) {
        return ProgramStatus::fail(ProgramError::IncorrectProgramId,
                                   "token account " + encode_base58(account.address()));
    }
    if (!has_valid_token_layout(account.data(), standard_, TokenKind::Account)) {
        return ProgramStatus::fail(ProgramError::InvalidAccountData, "token account layout");
    }
    auto token_account = TokenAccount::unpack(account.data());
    RETURN_IF_ERROR(token_account);
    if (!token_account.value().is_initialized()) {
        return ProgramStatus::fail(ProgramError::UninitializedAccount,
                                   "token account " + encode_base58(account.address()));
    }
    return token_account;
}

ProgramStatus TokenProgram::store_mint(AccountView& account, const Mint& mint) const {
    std::vector<uint8_t> bytes(token_layout::MINT_LEN);
    mint.pack_into(bytes);
    return account.write_data(0, bytes);
}

ProgramStatus TokenProgram::store_account(AccountView& account, const TokenAccount& token_account) const {
    std::vector<uint8_t> bytes(token_layout::ACCOUNT_LEN);
    token_account.pack_into(bytes);
    return account.write_data(0, bytes);
}

ProgramStatus TokenProgram::handle_initialize_mint(std::vector<AccountView>& accounts,
                                                   ByteReader& reader,
                                                   ExecutionContext& context) const {
    if (accounts.empty()) {
        return ProgramStatus::fail(ProgramError::InsufficientAccounts, "InitializeMint2");
    }
    uint8_t decimals = 0;
    PublicKey mint_authority;
    uint8_t freeze_tag = 0;
    if (!reader.read_u8(decimals) || !reader.read_pubkey(mint_authority) || !reader.read_u8(freeze_tag) ||
        freeze_tag > 1) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData, "InitializeMint2 payload");
    }
    std::optional<PublicKey> freeze_authority;
    if (freeze_tag == 1) {
        PublicKey key;
        if (!reader.read_pubkey(key)) {
            return ProgramStatus::fail(ProgramError::InvalidInstructionData, "InitializeMint2 freeze authority");
        }
        freeze_authority = std::move(key);
    }

    AccountView& mint_account = accounts[0];
    if (!mint_account.owned_by(program_id_)) {
        return ProgramStatus::fail(ProgramError::IncorrectProgramId, "mint not owned by token program");
    }
    if (mint_account.data_len() != token_layout::MINT_LEN) {
        return ProgramStatus::fail(ProgramError::InvalidAccountData, "mint account size");
    }
    auto existing = Mint::unpack(mint_account.data());
    RETURN_IF_ERROR(existing);
    if (existing.value().is_initialized) {
        return ProgramStatus::fail(ProgramError::AccountAlreadyInitialized, "mint");
    }
    RETURN_IF_ERROR(require_rent_exempt(mint_account, context));

    Mint mint;
    mint.mint_authority = mint_authority;
    mint.decimals = decimals;
    mint.is_initialized = true;
    mint.freeze_authority = freeze_authority;
    return store_mint(mint_account, mint);
}

ProgramStatus TokenProgram::handle_initialize_account(std::vector<AccountView>& accounts,
                                                      ByteReader& reader,
                                                      ExecutionContext& context) const {
    if (accounts.size() < 2) {
        return ProgramStatus::fail(ProgramError::InsufficientAccounts, "InitializeAccount3");
    }
    PublicKey owner;
    if (!reader.read_pubkey(owner)) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData, "InitializeAccount3 payload");
    }

    AccountView& account = accounts[0];
    const AccountView& mint_account = accounts[1];
    if (!account.owned_by(program_id_)) {
        return ProgramStatus::fail(ProgramError::IncorrectProgramId, "account not owned by token program");
    }

    const size_t len = account.data_len();
    bool size_ok = len == token_layout::ACCOUNT_LEN ||
                   (standard_ == TokenStandard::Extended && len > token_layout::ACCOUNT_LEN);
    if (!size_ok) {
        return ProgramStatus::fail(ProgramError::InvalidAccountData, "token account size");
    }
    if (account.data()[108] != static_cast<uint8_t>(TokenAccountState::Uninitialized)) {
        return ProgramStatus::fail(ProgramError::AccountAlreadyInitialized, "token account");
    }
    RETURN_IF_ERROR(load_mint(mint_account));
    RETURN_IF_ERROR(require_rent_exempt(account, context));

    TokenAccount token_account;
    token_account.mint = mint_account.address();
    token_account.owner = owner;
    token_account.state = TokenAccountState::Initialized;
    RETURN_IF_ERROR(store_account(account, token_account));

    if (len > token_layout::ACCOUNT_LEN) {
        RETURN_IF_ERROR(account.write_data(token_layout::ACCOUNT_TYPE_OFFSET,
                                           {token_layout::ACCOUNT_TYPE_ACCOUNT}));
    }
    return ProgramStatus::ok();
}

ProgramStatus TokenProgram::handle_initialize_immutable_owner(std::vector<AccountView>& accounts) const {
    if (standard_ != TokenStandard::Extended) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData,
                                   "InitializeImmutableOwner requires the extended token program");
    }
    if (accounts.empty()) {
        return ProgramStatus::fail(ProgramError::InsufficientAccounts, "InitializeImmutableOwner");
    }

    AccountView& account = accounts[0];
    if (!account.owned_by(program_id_)) {
        return ProgramStatus::fail(ProgramError::IncorrectProgramId, "account not owned by token program");
    }
    if (account.data_len() < token_layout::EXTENDED_ACCOUNT_LEN) {
        return ProgramStatus::fail(ProgramError::InvalidAccountData, "no room for ImmutableOwner extension");
    }
    if (account.data()[108] != static_cast<uint8_t>(TokenAccountState::Uninitialized)) {
        return ProgramStatus::fail(ProgramError::AccountAlreadyInitialized, "token account");
    }

    ByteWriter tlv(token_layout::TLV_HEADER_LEN);
    tlv.write_u16(token_layout::EXTENSION_IMMUTABLE_OWNER).write_u16(0);
    return account.write_data(token_layout::ACCOUNT_TYPE_OFFSET + 1, tlv.bytes());
}

ProgramStatus TokenProgram::handle_transfer(std::vector<AccountView>& accounts,
                                            ByteReader& reader,
                                            bool checked) const {
    const size_t required = checked ? 4 : 3;
    if (accounts.size() < required) {
        return ProgramStatus::fail(ProgramError::InsufficientAccounts, checked ? "TransferChecked" : "Transfer");
    }
    uint64_t amount = 0;
    uint8_t decimals = 0;
    if (!reader.read_u64(amount) || (checked && !reader.read_u8(decimals))) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData, "transfer payload");
    }

    AccountView& source_account = accounts[0];
    AccountView& destination_account = accounts[checked ? 2 : 1];
    const AccountView& authority = accounts[checked ? 3 : 2];

    auto source = load_account(source_account);
    RETURN_IF_ERROR(source);
    auto destination = load_account(destination_account);
    RETURN_IF_ERROR(destination);

    TokenAccount from = source.value();
    TokenAccount to = destination.value();
    if (from.is_frozen() || to.is_frozen()) {
        return ProgramStatus::fail(ProgramError::AccountFrozen, "transfer");
    }
    if (from.mint != to.mint) {
        return ProgramStatus::fail(ProgramError::MintMismatch, "transfer between different mints");
    }
    if (checked) {
        const AccountView& mint_account = accounts[1];
        if (mint_account.address() != from.mint) {
            return ProgramStatus::fail(ProgramError::MintMismatch, "TransferChecked mint");
        }
        auto mint = load_mint(mint_account);
        RETURN_IF_ERROR(mint);
        if (mint.value().decimals != decimals) {
            return ProgramStatus::fail(ProgramError::MintMismatch, "TransferChecked decimals");
        }
    }
    RETURN_IF_ERROR(require_authority(authority, from.owner));
    if (amount > from.amount) {
        return ProgramStatus::fail(ProgramError::InsufficientFunds,
                                   "balance " + std::to_string(from.amount) + " < " + std::to_string(amount));
    }

    if (source_account.address() == destination_account.address()) {
        return ProgramStatus::ok();
    }

    from.amount -= amount;
    to.amount += amount;
    RETURN_IF_ERROR(store_account(source_account, from));
    return store_account(destination_account, to);
}

ProgramStatus TokenProgram::handle_mint_to(std::vector<AccountView>& accounts, ByteReader& reader) const {
    if (accounts.size() < 3) {
        return ProgramStatus::fail(ProgramError::InsufficientAccounts, "MintTo");
    }
    uint64_t amount = 0;
    if (!reader.read_u64(amount)) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData, "MintTo payload");
    }

    AccountView& mint_account = accounts[0];
    AccountView& destination_account = accounts[1];
    const AccountView& authority = accounts[2];

    auto loaded_mint = load_mint(mint_account);
    RETURN_IF_ERROR(loaded_mint);
    auto destination = load_account(destination_account);
    RETURN_IF_ERROR(destination);

    Mint mint = loaded_mint.value();
    TokenAccount to = destination.value();
    if (to.mint != mint_account.address()) {
        return ProgramStatus::fail(ProgramError::MintMismatch, "MintTo destination");
    }
    if (to.is_frozen()) {
        return ProgramStatus::fail(ProgramError::AccountFrozen, "MintTo destination");
    }
    if (!mint.mint_authority) {
        return ProgramStatus::fail(ProgramError::OwnerMismatch, "mint has a fixed supply");
    }
    RETURN_IF_ERROR(require_authority(authority, *mint.mint_authority));

    if (mint.supply > UINT64_MAX - amount || to.amount > UINT64_MAX - amount) {
        return ProgramStatus::fail(ProgramError::ArithmeticOverflow, "MintTo");
    }
    mint.supply += amount;
    to.amount += amount;
    RETURN_IF_ERROR(store_mint(mint_account, mint));
    return store_account(destination_account, to);
}

ProgramStatus TokenProgram::handle_burn(std::vector<AccountView>& accounts, ByteReader& reader) const {
    if (accounts.size() < 3) {
        return ProgramStatus::fail(ProgramError::InsufficientAccounts, "Burn");
    }
    uint64_t amount = 0;
    if (!reader.read_u64(amount)) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData, "Burn payload");
    }

    AccountView& source_account = accounts[0];
    AccountView& mint_account = accounts[1];
    const AccountView& authority = accounts[2];

    auto source = load_account(source_account);
    RETURN_IF_ERROR(source);
    auto loaded_mint = load_mint(mint_account);
    RETURN_IF_ERROR(loaded_mint);

    TokenAccount from = source.value();
    Mint mint = loaded_mint.value();
    if (from.mint != mint_account.address()) {
        return ProgramStatus::fail(ProgramError::MintMismatch, "Burn mint");
    }
    if (from.is_frozen()) {
        return ProgramStatus::fail(ProgramError::AccountFrozen, "Burn source");
    }
    RETURN_IF_ERROR(require_authority(authority, from.owner));
    if (amount > from.amount) {
        return ProgramStatus::fail(ProgramError::InsufficientFunds, "Burn amount");
    }

    from.amount -= amount;
    mint.supply -= amount;
    RETURN_IF_ERROR(store_account(source_account, from));
    return store_mint(mint_account, mint);
}

ProgramStatus TokenProgram::handle_close_account(std::vector<AccountView>& accounts) const {
    if (accounts.size() < 3) {
        return ProgramStatus::fail(ProgramError::InsufficientAccounts, "CloseAccount");
    }

    AccountView& account = accounts[0];
    AccountView& destination = accounts[1];
    const AccountView& authority = accounts[2];
    if (account.address() == destination.address()) {
        return ProgramStatus::fail(ProgramError::InvalidAccountData, "CloseAccount into itself");
    }

    auto loaded = load_account(account);
    RETURN_IF_ERROR(loaded);
    const TokenAccount& token_account = loaded.value();
    if (!token_account.is_native && token_account.amount != 0) {
        return ProgramStatus::fail(ProgramError::NonZeroBalance,
                                   std::to_string(token_account.amount) + " tokens left");
    }
    RETURN_IF_ERROR(require_authority(
        authority, token_account.close_authority ? *token_account.close_authority : token_account.owner));

    const Lamports lamports = account.lamports();
    RETURN_IF_ERROR(account.debit(lamports));
    RETURN_IF_ERROR(destination.credit(lamports));
    return account.close();
}

namespace token_instruction {

namespace {

ByteWriter tagged(TokenProgram::TokenInstruction instruction, size_t reserve) {
    ByteWriter writer(reserve);
    writer.write_u8(static_cast<uint8_t>(instruction));
    return writer;
}

} // namespace

Instruction initialize_mint2(const PublicKey& token_program,
                             const PublicKey& mint,
                             uint8_t decimals,
                             const PublicKey& mint_authority,
                             const std::optional<PublicKey>& freeze_authority) {
    ByteWriter writer = tagged(TokenProgram::TokenInstruction::InitializeMint2, 67);
    writer.write_u8(decimals).write_pubkey(mint_authority);
    if (freeze_authority) {
        writer.write_u8(1).write_pubkey(*freeze_authority);
    } else {
        writer.write_u8(0);
    }
    return Instruction{token_program, {AccountMeta::writable(mint)}, writer.take()};
}

Instruction initialize_account3(const PublicKey& token_program,
                                const PublicKey& account,
                                const PublicKey& mint,
                                const PublicKey& owner) {
    ByteWriter writer = tagged(TokenProgram::TokenInstruction::InitializeAccount3, 33);
    writer.write_pubkey(owner);
    return Instruction{
        token_program,
        {AccountMeta::writable(account), AccountMeta::readonly(mint)},
        writer.take()};
}

Instruction initialize_immutable_owner(const PublicKey& token_program,
                                       const PublicKey& account) {
    return Instruction{
        token_program,
        {AccountMeta::writable(account)},
        tagged(TokenProgram::TokenInstruction::InitializeImmutableOwner, 1).take()};
}

Instruction transfer(const PublicKey& token_program,
                     const PublicKey& source,
                     const PublicKey& destination,
                     const PublicKey& authority,
                     uint64_t amount) {
    ByteWriter writer = tagged(TokenProgram::TokenInstruction::Transfer, 9);
    writer.write_u64(amount);
    return Instruction{
        token_program,
        {AccountMeta::writable(source), AccountMeta::writable(destination),
         AccountMeta::readonly(authority, true)},
        writer.take()};
}

Instruction transfer_checked(const PublicKey& token_program,
                             const PublicKey& source,
                             const PublicKey& mint,
                             const PublicKey& destination,
                             const PublicKey& authority,
                             uint64_t amount,
                             uint8_t decimals) {
    ByteWriter writer = tagged(TokenProgram::TokenInstruction::TransferChecked, 10);
    writer.write_u64(amount).write_u8(decimals);
    return Instruction{
        token_program,
        {AccountMeta::writable(source), AccountMeta::readonly(mint),
         AccountMeta::writable(destination), AccountMeta::readonly(authority, true)},
        writer.take()};
}

Instruction mint_to(const PublicKey& token_program,
                    const PublicKey& mint,
                    const PublicKey& destination,
                    const PublicKey& authority,
                    uint64_t amount) {
    ByteWriter writer = tagged(TokenProgram::TokenInstruction::MintTo, 9);
    writer.write_u64(amount);
    return Instruction{
        token_program,
        {AccountMeta::writable(mint), AccountMeta::writable(destination),
         AccountMeta::readonly(authority, true)},
        writer.take()};
}

Instruction burn(const PublicKey& token_program,
                 const PublicKey& account,
                 const PublicKey& mint,
                 const PublicKey& authority,
                 uint64_t amount) {
    ByteWriter writer = tagged(TokenProgram::TokenInstruction::Burn, 9);
    writer.write_u64(amount);
    return Instruction{
        token_program,
        {AccountMeta::writable(account), AccountMeta::writable(mint),
         AccountMeta::readonly(authority, true)},
        writer.take()};
}

Instruction close_account(const PublicKey& token_program,
                          const PublicKey& account,
                          const PublicKey& destination,
                          const PublicKey& authority) {
    return Instruction{
        token_program,
        {AccountMeta::writable(account), AccountMeta::writable(destination),
         AccountMeta::readonly(authority, true)},
        tagged(TokenProgram::TokenInstruction::CloseAccount, 1).take()};
}

} // namespace token_instruction

} // namespace svm
} // namespace pinion
