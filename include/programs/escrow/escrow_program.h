#pragma once

#include "common/byte_codec.h"
#include "common/config.h"
#include "programs/escrow/escrow_state.h"
#include "svm/engine.h"

namespace pinion {
namespace programs {
namespace escrow {

using svm::AccountView;
using svm::ExecutionContext;
using svm::Instruction;
using svm::ProgramStatus;

/**
 * Two-party token escrow
 *
 * The maker locks `amount` of mint_a in a vault owned by the escrow record
 * and asks for `receive` of mint_b. A taker pays the maker and gets the
 * vault; the maker may refund instead. Either outcome closes the vault and
 * the record, so only one of them can succeed.
 */
class EscrowProgram : public svm::BuiltinProgram {
public:
    explicit EscrowProgram(const ProgramIds& ids);
    ~EscrowProgram() override = default;

    PublicKey get_program_id() const override;
    std::string get_name() const override { return "escrow"; }

    ProgramStatus execute(
        std::vector<AccountView>& accounts,
        const std::vector<uint8_t>& data,
        ExecutionContext& context
    ) const override;

    enum class EscrowInstruction : uint8_t {
        Make = 0,
        Take = 1,
        Refund = 2
    };

    // Instruction builders deriving every address from the inputs
    static ProgramResult<Instruction> make(const ProgramIds& ids,
                                           const PublicKey& maker,
                                           const PublicKey& mint_a,
                                           const PublicKey& mint_b,
                                           const PublicKey& token_program,
                                           uint64_t seed,
                                           uint64_t receive,
                                           uint64_t amount);

    static ProgramResult<Instruction> take(const ProgramIds& ids,
                                           const PublicKey& taker,
                                           const PublicKey& maker,
                                           const PublicKey& mint_a,
                                           const PublicKey& mint_b,
                                           const PublicKey& token_program,
                                           uint64_t seed);

    static ProgramResult<Instruction> refund(const ProgramIds& ids,
                                             const PublicKey& maker,
                                             const PublicKey& mint_a,
                                             const PublicKey& token_program,
                                             uint64_t seed);

private:
    ProgramStatus process_make(std::vector<AccountView>& accounts, ByteReader& reader,
                               ExecutionContext& context) const;
    ProgramStatus process_take(std::vector<AccountView>& accounts, ExecutionContext& context) const;
    ProgramStatus process_refund(std::vector<AccountView>& accounts, ExecutionContext& context) const;

    /// Decode the record and re-derive its address from the stored seeds
    ProgramResult<Escrow> load_escrow(const AccountView& escrow) const;

    ProgramIds ids_;
};

} // namespace escrow
} // namespace programs
} // namespace pinion
