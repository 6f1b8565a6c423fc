#include "svm/program_address.h"
#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <array>
#include <cstring>
#include <memory>
#include <stdexcept>

namespace pinion {
namespace svm {

const char PDA_MARKER[] = "ProgramDerivedAddress";

namespace {

struct BnDeleter {
    void operator()(BIGNUM* bn) const { BN_free(bn); }
};

struct BnCtxDeleter {
    void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;

// -121665/121666 mod p
const char ED25519_D[] =
    "37095705934669439343138083508754565189542113879843219016388785533085940283555";

BnPtr new_bn() {
    BnPtr bn(BN_new());
    if (!bn) {
        throw std::runtime_error("BN_new failed");
    }
    return bn;
}

void check_bn(int rc, const char* what) {
    if (rc != 1) {
        throw std::runtime_error(std::string("OpenSSL bignum operation failed: ") + what);
    }
}

/// Field constants, built once
struct FieldParams {
    BnPtr p;
    BnPtr d;
    BnPtr legendre_exp; // (p - 1) / 2

    FieldParams() : p(new_bn()), d(new_bn()), legendre_exp(new_bn()) {
        check_bn(BN_set_bit(p.get(), 255), "set_bit");
        check_bn(BN_sub_word(p.get(), 19), "sub_word");

        BIGNUM* parsed = d.release();
        if (BN_dec2bn(&parsed, ED25519_D) == 0) {
            throw std::runtime_error("failed to parse curve constant");
        }
        d.reset(parsed);

        if (BN_copy(legendre_exp.get(), p.get()) == nullptr) {
            throw std::runtime_error("BN_copy failed");
        }
        check_bn(BN_sub_word(legendre_exp.get(), 1), "sub_word");
        check_bn(BN_rshift1(legendre_exp.get(), legendre_exp.get()), "rshift1");
    }
};

const FieldParams& field_params() {
    static const FieldParams params;
    return params;
}

} // namespace

Hash sha256_concat(const std::vector<std::vector<uint8_t>>& chunks) {
    Hash hash(SHA256_DIGEST_LENGTH);

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1;
    for (const auto& chunk : chunks) {
        if (!ok) break;
        if (!chunk.empty()) {
            ok = EVP_DigestUpdate(ctx, chunk.data(), chunk.size()) == 1;
        }
    }

    unsigned int len = SHA256_DIGEST_LENGTH;
    if (ok) {
        ok = EVP_DigestFinal_ex(ctx, hash.data(), &len) == 1;
    }
    EVP_MD_CTX_free(ctx);

    if (!ok) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return hash;
}

bool is_on_curve(const PublicKey& bytes) {
    if (bytes.size() != PUBKEY_BYTES) {
        return false;
    }

    const FieldParams& field = field_params();
    BnCtxPtr ctx(BN_CTX_new());
    if (!ctx) {
        throw std::runtime_error("BN_CTX_new failed");
    }

    // Little-endian encoding with the sign bit cleared, as big-endian for OpenSSL
    std::array<uint8_t, PUBKEY_BYTES> big_endian{};
    for (size_t i = 0; i < PUBKEY_BYTES; ++i) {
        big_endian[i] = bytes[PUBKEY_BYTES - 1 - i];
    }
    big_endian[0] &= 0x7f;

    BnPtr y(BN_bin2bn(big_endian.data(), static_cast<int>(big_endian.size()), nullptr));
    if (!y) {
        throw std::runtime_error("BN_bin2bn failed");
    }
    check_bn(BN_nnmod(y.get(), y.get(), field.p.get(), ctx.get()), "nnmod");

    BnPtr y2 = new_bn();
    BnPtr u = new_bn();
    BnPtr v = new_bn();
    BnPtr w = new_bn();
    BnPtr legendre = new_bn();

    check_bn(BN_mod_sqr(y2.get(), y.get(), field.p.get(), ctx.get()), "mod_sqr");

    // u = y^2 - 1
    check_bn(BN_mod_sub(u.get(), y2.get(), BN_value_one(), field.p.get(), ctx.get()), "mod_sub");

    // v = d*y^2 + 1, never zero because -1/d is not a square
    check_bn(BN_mod_mul(v.get(), field.d.get(), y2.get(), field.p.get(), ctx.get()), "mod_mul");
    check_bn(BN_mod_add(v.get(), v.get(), BN_value_one(), field.p.get(), ctx.get()), "mod_add");

    BnPtr v_inv(BN_mod_inverse(nullptr, v.get(), field.p.get(), ctx.get()));
    if (!v_inv) {
        throw std::runtime_error("BN_mod_inverse failed");
    }

    // x^2 = u / v
    check_bn(BN_mod_mul(w.get(), u.get(), v_inv.get(), field.p.get(), ctx.get()), "mod_mul");
    if (BN_is_zero(w.get())) {
        return true;
    }

    // Euler's criterion
    check_bn(BN_mod_exp(legendre.get(), w.get(), field.legendre_exp.get(), field.p.get(), ctx.get()),
             "mod_exp");
    return BN_is_one(legendre.get()) == 1;
}

namespace {

ProgramStatus validate_seeds(const Seeds& seeds, const PublicKey& program_id) {
    if (seeds.size() > MAX_SEEDS) {
        return ProgramStatus::fail(ProgramError::InvalidSeeds, "too many seeds");
    }
    for (const auto& seed : seeds) {
        if (seed.size() > MAX_SEED_LEN) {
            return ProgramStatus::fail(ProgramError::InvalidSeeds,
                                       "seed longer than 32 bytes");
        }
    }
    if (program_id.size() != PUBKEY_BYTES) {
        return ProgramStatus::fail(ProgramError::IncorrectProgramId, "program id length");
    }
    return ProgramStatus::ok();
}

Hash hash_seeds(const Seeds& seeds, const PublicKey& program_id) {
    std::vector<std::vector<uint8_t>> preimage(seeds.begin(), seeds.end());
    preimage.push_back(program_id);
    preimage.emplace_back(PDA_MARKER, PDA_MARKER + std::strlen(PDA_MARKER));
    return sha256_concat(preimage);
}

} // namespace

ProgramResult<PublicKey> create_program_address(const Seeds& seeds,
                                                const PublicKey& program_id) {
    RETURN_IF_ERROR(validate_seeds(seeds, program_id));

    PublicKey address = hash_seeds(seeds, program_id);
    if (is_on_curve(address)) {
        return ProgramStatus::fail(ProgramError::InvalidSeeds, "address lies on the curve");
    }
    return address;
}

ProgramResult<std::pair<PublicKey, uint8_t>> find_program_address(
    const Seeds& seeds, const PublicKey& program_id) {
    if (seeds.size() >= MAX_SEEDS) {
        return ProgramStatus::fail(ProgramError::InvalidSeeds, "no room for bump seed");
    }
    RETURN_IF_ERROR(validate_seeds(seeds, program_id));

    Seeds with_bump = seeds;
    with_bump.push_back({0});
    for (int bump = 255; bump >= 0; --bump) {
        with_bump.back()[0] = static_cast<uint8_t>(bump);
        PublicKey address = hash_seeds(with_bump, program_id);
        if (!is_on_curve(address)) {
            return std::make_pair(std::move(address), static_cast<uint8_t>(bump));
        }
    }
    return ProgramStatus::fail(ProgramError::InvalidSeeds, "no viable bump seed");
}

ProgramResult<std::pair<PublicKey, uint8_t>> find_associated_token_address(
    const PublicKey& wallet,
    const PublicKey& mint,
    const PublicKey& token_program,
    const PublicKey& associated_token_program) {
    return find_program_address({wallet, token_program, mint}, associated_token_program);
}

ProgramResult<ProgramSigner> ProgramSigner::create(Seeds seeds, const PublicKey& program_id) {
    auto address = create_program_address(seeds, program_id);
    RETURN_IF_ERROR(address);
    return ProgramSigner(std::move(address).value(), program_id, std::move(seeds));
}

} // namespace svm
} // namespace pinion
