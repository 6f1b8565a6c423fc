#include "svm/token_state.h"
#include "common/byte_codec.h"
#include <algorithm>

namespace pinion {
namespace svm {

namespace {

// COption<Pubkey>: u32 tag (0 = None, 1 = Some) followed by 32 bytes either way
bool read_coption_key(ByteReader& reader, std::optional<PublicKey>& out) {
    uint32_t tag = 0;
    PublicKey key;
    if (!reader.read_u32(tag) || !reader.read_pubkey(key) || tag > 1) {
        return false;
    }
    out = tag == 1 ? std::optional<PublicKey>(std::move(key)) : std::nullopt;
    return true;
}

bool read_coption_u64(ByteReader& reader, std::optional<uint64_t>& out) {
    uint32_t tag = 0;
    uint64_t value = 0;
    if (!reader.read_u32(tag) || !reader.read_u64(value) || tag > 1) {
        return false;
    }
    out = tag == 1 ? std::optional<uint64_t>(value) : std::nullopt;
    return true;
}

void write_coption_key(ByteWriter& writer, const std::optional<PublicKey>& key) {
    writer.write_u32(key ? 1 : 0);
    writer.write_pubkey(key ? *key : PublicKey(PUBKEY_BYTES, 0));
}

void write_coption_u64(ByteWriter& writer, const std::optional<uint64_t>& value) {
    writer.write_u32(value ? 1 : 0);
    writer.write_u64(value ? *value : 0);
}

} // namespace

ProgramResult<Mint> Mint::unpack(const std::vector<uint8_t>& data) {
    if (data.size() < token_layout::MINT_LEN) {
        return ProgramStatus::fail(ProgramError::InvalidAccountData, "mint data too short");
    }

    ByteReader reader(data.data(), token_layout::MINT_LEN);
    Mint mint;
    if (!read_coption_key(reader, mint.mint_authority) ||
        !reader.read_u64(mint.supply) ||
        !reader.read_u8(mint.decimals) ||
        !reader.read_bool(mint.is_initialized) ||
        !read_coption_key(reader, mint.freeze_authority)) {
        return ProgramStatus::fail(ProgramError::InvalidAccountData, "malformed mint");
    }
    return mint;
}

void Mint::pack_into(std::vector<uint8_t>& data) const {
    ByteWriter writer(token_layout::MINT_LEN);
    write_coption_key(writer, mint_authority);
    writer.write_u64(supply);
    writer.write_u8(decimals);
    writer.write_bool(is_initialized);
    write_coption_key(writer, freeze_authority);

    const auto& bytes = writer.bytes();
    std::copy(bytes.begin(), bytes.end(), data.begin());
}

ProgramResult<TokenAccount> TokenAccount::unpack(const std::vector<uint8_t>& data) {
    if (data.size() < token_layout::ACCOUNT_LEN) {
        return ProgramStatus::fail(ProgramError::InvalidAccountData, "token account data too short");
    }

    ByteReader reader(data.data(), token_layout::ACCOUNT_LEN);
    TokenAccount account;
    uint8_t state = 0;
    if (!reader.read_pubkey(account.mint) ||
        !reader.read_pubkey(account.owner) ||
        !reader.read_u64(account.amount) ||
        !read_coption_key(reader, account.delegate) ||
        !reader.read_u8(state) ||
        !read_coption_u64(reader, account.is_native) ||
        !reader.read_u64(account.delegated_amount) ||
        !read_coption_key(reader, account.close_authority)) {
        return ProgramStatus::fail(ProgramError::InvalidAccountData, "malformed token account");
    }
    if (state > static_cast<uint8_t>(TokenAccountState::Frozen)) {
        return ProgramStatus::fail(ProgramError::InvalidAccountData, "invalid token account state");
    }
    account.state = static_cast<TokenAccountState>(state);
    return account;
}

void TokenAccount::pack_into(std::vector<uint8_t>& data) const {
    ByteWriter writer(token_layout::ACCOUNT_LEN);
    writer.write_pubkey(mint);
    writer.write_pubkey(owner);
    writer.write_u64(amount);
    write_coption_key(writer, delegate);
    writer.write_u8(static_cast<uint8_t>(state));
    write_coption_u64(writer, is_native);
    writer.write_u64(delegated_amount);
    write_coption_key(writer, close_authority);

    const auto& bytes = writer.bytes();
    std::copy(bytes.begin(), bytes.end(), data.begin());
}

bool has_valid_token_layout(const std::vector<uint8_t>& data,
                            TokenStandard standard,
                            TokenKind kind) {
    const size_t base_len = kind == TokenKind::Mint
        ? token_layout::MINT_LEN
        : token_layout::ACCOUNT_LEN;
    const uint8_t type_tag = kind == TokenKind::Mint
        ? token_layout::ACCOUNT_TYPE_MINT
        : token_layout::ACCOUNT_TYPE_ACCOUNT;

    if (data.size() == base_len) {
        return true;
    }

    switch (standard) {
        case TokenStandard::Legacy:
            return false;
        case TokenStandard::Extended:
            return data.size() > token_layout::ACCOUNT_TYPE_OFFSET &&
                   data[token_layout::ACCOUNT_TYPE_OFFSET] == type_tag;
    }
    return false;
}

} // namespace svm
} // namespace pinion
