#include "programs/escrow/escrow_state.h"
#include "common/byte_codec.h"

namespace pinion {
namespace programs {
namespace escrow {

using svm::ProgramError;
using svm::ProgramStatus;

ProgramResult<Escrow> Escrow::unpack(const std::vector<uint8_t>& data) {
    if (data.size() != LEN) {
        return ProgramStatus::fail(ProgramError::InvalidAccountData, "escrow record length");
    }
    ByteReader reader(data);
    Escrow escrow;
    if (!reader.read_u64(escrow.seed) ||
        !reader.read_pubkey(escrow.maker) ||
        !reader.read_pubkey(escrow.mint_a) ||
        !reader.read_pubkey(escrow.mint_b) ||
        !reader.read_u64(escrow.receive) ||
        !reader.read_u8(escrow.bump)) {
        return ProgramStatus::fail(ProgramError::InvalidAccountData, "malformed escrow record");
    }
    return escrow;
}

std::vector<uint8_t> Escrow::pack() const {
    ByteWriter writer(LEN);
    writer.write_u64(seed)
          .write_pubkey(maker)
          .write_pubkey(mint_a)
          .write_pubkey(mint_b)
          .write_u64(receive)
          .write_u8(bump);
    return writer.take();
}

Seeds Escrow::seeds(const PublicKey& maker, uint64_t seed, std::optional<uint8_t> bump) {
    Seeds seeds{svm::seed_bytes("escrow"), maker, u64_le_bytes(seed)};
    if (bump) {
        seeds.push_back({*bump});
    }
    return seeds;
}

} // namespace escrow
} // namespace programs
} // namespace pinion
