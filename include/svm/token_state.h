#pragma once

#include "common/types.h"
#include "svm/program_error.h"
#include <optional>
#include <vector>

namespace pinion {
namespace svm {

using namespace pinion::common;

/**
 * Token program layouts.
 *
 * Both token programs share the 82-byte mint and 165-byte account base
 * layouts. The extended program may append extensions: the account is then
 * longer than 165 bytes, mints are padded to 165, and byte 165 carries the
 * account type.
 */
namespace token_layout {
    constexpr size_t MINT_LEN = 82;
    constexpr size_t ACCOUNT_LEN = 165;
    constexpr size_t ACCOUNT_TYPE_OFFSET = 165;

    constexpr uint8_t ACCOUNT_TYPE_MINT = 0x01;
    constexpr uint8_t ACCOUNT_TYPE_ACCOUNT = 0x02;

    // Extension TLV: u16 type, u16 length
    constexpr size_t TLV_HEADER_LEN = 4;
    constexpr uint16_t EXTENSION_IMMUTABLE_OWNER = 7;

    /// Size of an extended token account carrying only ImmutableOwner
    constexpr size_t EXTENDED_ACCOUNT_LEN = ACCOUNT_LEN + 1 + TLV_HEADER_LEN;
}

/// Token standard of a mint or token account, decided by its owner program
enum class TokenStandard : uint8_t {
    Legacy,
    Extended
};

enum class TokenKind : uint8_t {
    Mint,
    Account
};

enum class TokenAccountState : uint8_t {
    Uninitialized = 0,
    Initialized = 1,
    Frozen = 2
};

/**
 * Mint layout (82 bytes)
 */
struct Mint {
    std::optional<PublicKey> mint_authority;
    uint64_t supply = 0;
    uint8_t decimals = 0;
    bool is_initialized = false;
    std::optional<PublicKey> freeze_authority;

    /// Checked decode of the first 82 bytes
    static ProgramResult<Mint> unpack(const std::vector<uint8_t>& data);

    /// Overwrites the first 82 bytes of data, which must be large enough
    void pack_into(std::vector<uint8_t>& data) const;
};

/**
 * Token account layout (165 bytes)
 */
struct TokenAccount {
    PublicKey mint;
    PublicKey owner;
    uint64_t amount = 0;
    std::optional<PublicKey> delegate;
    TokenAccountState state = TokenAccountState::Uninitialized;
    std::optional<uint64_t> is_native;
    uint64_t delegated_amount = 0;
    std::optional<PublicKey> close_authority;

    bool is_initialized() const { return state != TokenAccountState::Uninitialized; }
    bool is_frozen() const { return state == TokenAccountState::Frozen; }

    /// Checked decode of the first 165 bytes
    static ProgramResult<TokenAccount> unpack(const std::vector<uint8_t>& data);

    /// Overwrites the first 165 bytes of data, which must be large enough
    void pack_into(std::vector<uint8_t>& data) const;
};

/**
 * True if data has a length valid for this kind under this standard, with
 * the extended account type byte matching when present.
 */
bool has_valid_token_layout(const std::vector<uint8_t>& data,
                            TokenStandard standard,
                            TokenKind kind);

} // namespace svm
} // namespace pinion
