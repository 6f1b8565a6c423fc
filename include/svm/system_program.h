#pragma once

#include "common/byte_codec.h"
#include "svm/engine.h"

namespace pinion {
namespace svm {

/**
 * System program: creates accounts, moves lamports between system-owned
 * accounts and hands ownership to other programs.
 *
 * Instructions use a u32 little-endian discriminator.
 */
class SystemProgram : public BuiltinProgram {
public:
    explicit SystemProgram(PublicKey program_id);
    ~SystemProgram() override = default;

    PublicKey get_program_id() const override;
    std::string get_name() const override { return "system"; }

    ProgramStatus execute(
        std::vector<AccountView>& accounts,
        const std::vector<uint8_t>& data,
        ExecutionContext& context
    ) const override;

    enum class SystemInstruction : uint32_t {
        CreateAccount = 0,
        Assign = 1,
        Transfer = 2,
        Allocate = 8
    };

private:
    // Instruction handlers
    ProgramStatus handle_create_account(std::vector<AccountView>& accounts, ByteReader& reader) const;
    ProgramStatus handle_assign(std::vector<AccountView>& accounts, ByteReader& reader) const;
    ProgramStatus handle_transfer(std::vector<AccountView>& accounts, ByteReader& reader) const;
    ProgramStatus handle_allocate(std::vector<AccountView>& accounts, ByteReader& reader) const;

    PublicKey program_id_;
};

/**
 * Instruction builders for the system program
 */
namespace system_instruction {

/// [funder(s,w), new_account(s,w)]
Instruction create_account(const PublicKey& system_program,
                           const PublicKey& funder,
                           const PublicKey& new_account,
                           Lamports lamports,
                           uint64_t space,
                           const PublicKey& owner);

/// [account(s,w)]
Instruction assign(const PublicKey& system_program,
                   const PublicKey& account,
                   const PublicKey& owner);

/// [from(s,w), to(w)]
Instruction transfer(const PublicKey& system_program,
                     const PublicKey& from,
                     const PublicKey& to,
                     Lamports lamports);

/// [account(s,w)]
Instruction allocate(const PublicKey& system_program,
                     const PublicKey& account,
                     uint64_t space);

} // namespace system_instruction

} // namespace svm
} // namespace pinion
