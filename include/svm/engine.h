#pragma once

#include "common/types.h"
#include "svm/program_address.h"
#include "svm/program_error.h"
#include "svm/rent_calculator.h"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace pinion {
namespace svm {

using namespace pinion::common;

/**
 * Ledger account: balance, data and owning program
 */
struct ProgramAccount {
    PublicKey pubkey;        // Account's public key address
    PublicKey owner;
    Lamports lamports = 0;
    std::vector<uint8_t> data;
    bool executable = false;
    Epoch rent_epoch = 0;

    /// An account exists while it holds lamports or data
    bool exists() const { return lamports > 0 || !data.empty(); }

    bool operator==(const ProgramAccount& other) const {
        return pubkey == other.pubkey && owner == other.owner &&
               lamports == other.lamports && data == other.data &&
               executable == other.executable && rent_epoch == other.rent_epoch;
    }
    bool operator!=(const ProgramAccount& other) const { return !(*this == other); }
};

/**
 * Account reference inside an instruction
 */
struct AccountMeta {
    PublicKey pubkey;
    bool is_signer = false;
    bool is_writable = false;

    static AccountMeta writable(const PublicKey& key, bool signer = false) {
        return AccountMeta{key, signer, true};
    }
    static AccountMeta readonly(const PublicKey& key, bool signer = false) {
        return AccountMeta{key, signer, false};
    }
};

/**
 * Instruction to be executed by the SVM
 */
struct Instruction {
    PublicKey program_id;
    std::vector<AccountMeta> accounts;
    std::vector<uint8_t> data;
};

/**
 * Ordered instructions plus the keys that signed them
 */
struct Transaction {
    std::vector<PublicKey> signers;
    std::vector<Instruction> instructions;
};

/**
 * Clock sysvar as seen by programs
 */
struct Clock {
    Slot slot = 0;
    int64_t unix_timestamp = 0;
};

/**
 * SVM execution result
 */
enum class ExecutionResult {
    SUCCESS,
    COMPUTE_BUDGET_EXCEEDED,
    PROGRAM_ERROR,
    ACCOUNT_NOT_FOUND,
    INSUFFICIENT_FUNDS,
    INVALID_INSTRUCTION
};

struct ExecutionOutcome {
    ExecutionResult result = ExecutionResult::SUCCESS;
    uint64_t compute_units_consumed = 0;
    std::optional<ProgramError> error;
    std::optional<size_t> failed_instruction;
    std::string error_details;
    std::vector<std::string> logs;

    bool is_success() const { return result == ExecutionResult::SUCCESS; }
};

class ExecutionContext;
class ExecutionEngine;

/**
 * A program's handle on one account of the current instruction.
 *
 * Reads are unrestricted. Mutations follow the runtime's ownership rules:
 * the account must be writable, and only its owner program may change its
 * data, spend its lamports, or reassign it. Views of the same account share
 * storage, so writes are visible to every view and to nested invocations.
 */
class AccountView {
public:
    AccountView(ProgramAccount* account,
                bool is_signer,
                bool is_writable,
                PublicKey executing_program,
                PublicKey system_program);

    const PublicKey& address() const { return account_->pubkey; }
    bool is_signer() const { return signer_; }
    bool is_writable() const { return writable_; }
    const PublicKey& owner() const { return account_->owner; }
    bool owned_by(const PublicKey& program_id) const { return account_->owner == program_id; }
    Lamports lamports() const { return account_->lamports; }
    const std::vector<uint8_t>& data() const { return account_->data; }
    size_t data_len() const { return account_->data.size(); }
    bool executable() const { return account_->executable; }

    /// No lamports and no data: never created, or closed earlier
    bool is_closed() const { return !account_->exists(); }

    ProgramStatus set_lamports(Lamports lamports);
    ProgramStatus credit(Lamports amount);
    ProgramStatus debit(Lamports amount);

    /// Overwrite bytes starting at offset; the range must already exist
    ProgramStatus write_data(size_t offset, const std::vector<uint8_t>& bytes);
    ProgramStatus resize(size_t new_len);
    ProgramStatus assign(const PublicKey& new_owner);

    /// Zero lamports, drop data and hand the account back to the system program
    ProgramStatus close();

    static constexpr size_t MAX_DATA_LEN = 10 * 1024 * 1024;

private:
    ProgramStatus check_owned_and_writable(ProgramError ownership_error) const;

    ProgramAccount* account_;
    bool signer_;
    bool writable_;
    PublicKey executing_program_;
    PublicKey system_program_;
};

/**
 * Built-in program interface
 */
class BuiltinProgram {
public:
    virtual ~BuiltinProgram() = default;
    virtual PublicKey get_program_id() const = 0;
    virtual std::string get_name() const = 0;
    virtual ProgramStatus execute(
        std::vector<AccountView>& accounts,
        const std::vector<uint8_t>& data,
        ExecutionContext& context
    ) const = 0;
};

/**
 * Per-transaction execution state: the working copy of every account the
 * transaction references, the invocation stack and the program log.
 */
class ExecutionContext {
public:
    ExecutionContext(const ExecutionEngine& engine,
                     std::unordered_map<PublicKey, ProgramAccount> accounts,
                     std::unordered_set<PublicKey> transaction_signers);

    /**
     * Cross-program invocation from the currently executing program.
     *
     * Every account of the nested instruction must belong to the caller's
     * instruction, with no added writable or signer privilege except that
     * the addresses of the given program signers become signers. A signer is
     * only honoured when issued for the calling program.
     */
    ProgramStatus invoke(const Instruction& instruction,
                         const std::vector<ProgramSigner>& signers = {});

    /// Append "Program log: <message>" to the transaction log
    void log(const std::string& message);

    const RentCalculator& rent() const;
    const Clock& clock() const;
    const PublicKey& system_program_id() const;
    const PublicKey& current_program_id() const;
    size_t invoke_depth() const { return frames_.size(); }
    uint64_t consumed_compute_units() const { return consumed_compute_units_; }
    const std::vector<std::string>& logs() const { return logs_; }

private:
    friend class ExecutionEngine;

    struct Privileges {
        bool is_signer = false;
        bool is_writable = false;
    };

    struct InvokeFrame {
        PublicKey program_id;
        std::unordered_map<PublicKey, Privileges> privileges;
    };

    ProgramStatus process_top_level(const Instruction& instruction);
    ProgramStatus process_instruction(const Instruction& instruction);

    const ExecutionEngine& engine_;
    std::unordered_map<PublicKey, ProgramAccount> accounts_;
    std::unordered_set<PublicKey> transaction_signers_;
    std::vector<InvokeFrame> frames_;
    std::vector<std::string> logs_;
    uint64_t consumed_compute_units_ = 0;
};

class AccountManager;

/**
 * SVM execution engine
 */
class ExecutionEngine {
public:
    ExecutionEngine();
    ~ExecutionEngine();

    // Program management
    void register_builtin_program(std::unique_ptr<BuiltinProgram> program);
    bool is_program_loaded(const PublicKey& program_id) const;
    const BuiltinProgram* find_program(const PublicKey& program_id) const;

    /**
     * Execute the instructions in order against a working copy of the
     * referenced accounts. The copy is committed to the account manager only
     * if every instruction succeeds.
     */
    ExecutionOutcome execute_transaction(const Transaction& transaction,
                                         AccountManager& accounts);

    // Configuration
    void set_compute_budget(uint64_t max_compute_units);
    void set_compute_units_per_instruction(uint64_t units);
    void set_max_invoke_depth(uint32_t depth);
    void set_rent(const RentCalculator& rent);
    void set_clock(const Clock& clock);
    void set_system_program_id(const PublicKey& program_id);

    uint64_t get_compute_budget() const;
    uint64_t get_compute_units_per_instruction() const;
    uint32_t get_max_invoke_depth() const;
    const RentCalculator& get_rent() const;
    const Clock& get_clock() const;
    const PublicKey& get_system_program_id() const;

    // Statistics
    uint64_t get_total_instructions_executed() const;
    uint64_t get_total_compute_units_consumed() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * Committed ledger state with staged changes
 */
class AccountManager {
public:
    AccountManager();
    ~AccountManager();

    // Account operations
    std::optional<ProgramAccount> get_account(const PublicKey& pubkey) const;

    /// Stage a new version; an account that no longer exists is staged for removal
    Result<bool> update_account(const ProgramAccount& account);

    // Account queries
    std::vector<ProgramAccount> get_program_accounts(const PublicKey& program_id) const;
    std::vector<ProgramAccount> get_all_accounts() const;
    bool account_exists(const PublicKey& pubkey) const;
    Lamports get_account_balance(const PublicKey& pubkey) const;

    // State management
    Result<bool> commit_changes();
    void rollback_changes();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace svm
} // namespace pinion
