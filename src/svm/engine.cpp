#include "svm/engine.h"
#include "common/base58.h"
#include "common/logging.h"
#include <algorithm>

namespace pinion {
namespace svm {

// AccountView implementation
AccountView::AccountView(ProgramAccount* account,
                         bool is_signer,
                         bool is_writable,
                         PublicKey executing_program,
                         PublicKey system_program)
    : account_(account),
      signer_(is_signer),
      writable_(is_writable),
      executing_program_(std::move(executing_program)),
      system_program_(std::move(system_program)) {}

ProgramStatus AccountView::check_owned_and_writable(ProgramError ownership_error) const {
    if (!writable_) {
        return ProgramStatus::fail(ProgramError::ReadonlyDataModified,
                                   "account " + encode_base58(account_->pubkey) + " is read-only");
    }
    if (account_->owner != executing_program_) {
        return ProgramStatus::fail(ownership_error,
                                   "account " + encode_base58(account_->pubkey) + " is not owned by the caller");
    }
    return ProgramStatus::ok();
}

ProgramStatus AccountView::set_lamports(Lamports lamports) {
    if (!writable_) {
        return ProgramStatus::fail(ProgramError::ReadonlyDataModified,
                                   "lamports of read-only account " + encode_base58(account_->pubkey));
    }
    // Anyone may credit a writable account; only the owner may debit it
    if (lamports < account_->lamports && account_->owner != executing_program_) {
        return ProgramStatus::fail(ProgramError::ExternalAccountLamportSpend,
                                   "debit of " + encode_base58(account_->pubkey));
    }
    account_->lamports = lamports;
    return ProgramStatus::ok();
}

ProgramStatus AccountView::credit(Lamports amount) {
    if (account_->lamports > UINT64_MAX - amount) {
        return ProgramStatus::fail(ProgramError::ArithmeticOverflow, "lamport credit");
    }
    return set_lamports(account_->lamports + amount);
}

ProgramStatus AccountView::debit(Lamports amount) {
    if (amount > account_->lamports) {
        return ProgramStatus::fail(ProgramError::InsufficientFunds,
                                   "debit of " + std::to_string(amount) + " lamports");
    }
    return set_lamports(account_->lamports - amount);
}

ProgramStatus AccountView::write_data(size_t offset, const std::vector<uint8_t>& bytes) {
    RETURN_IF_ERROR(check_owned_and_writable(ProgramError::ExternalAccountDataModified));
    if (offset > account_->data.size() || bytes.size() > account_->data.size() - offset) {
        return ProgramStatus::fail(ProgramError::InvalidAccountData, "write past end of account data");
    }
    std::copy(bytes.begin(), bytes.end(), account_->data.begin() + offset);
    return ProgramStatus::ok();
}

ProgramStatus AccountView::resize(size_t new_len) {
    RETURN_IF_ERROR(check_owned_and_writable(ProgramError::ExternalAccountDataModified));
    if (new_len > MAX_DATA_LEN) {
        return ProgramStatus::fail(ProgramError::InvalidArgument,
                                   "data length " + std::to_string(new_len) + " exceeds limit");
    }
    account_->data.resize(new_len, 0);
    return ProgramStatus::ok();
}

ProgramStatus AccountView::assign(const PublicKey& new_owner) {
    if (account_->owner == new_owner) {
        return ProgramStatus::ok();
    }
    RETURN_IF_ERROR(check_owned_and_writable(ProgramError::InvalidOwner));
    bool zeroed = std::all_of(account_->data.begin(), account_->data.end(),
                              [](uint8_t byte) { return byte == 0; });
    if (!zeroed) {
        return ProgramStatus::fail(ProgramError::ExternalAccountDataModified,
                                   "cannot reassign an account holding data");
    }
    account_->owner = new_owner;
    return ProgramStatus::ok();
}

ProgramStatus AccountView::close() {
    RETURN_IF_ERROR(check_owned_and_writable(ProgramError::ExternalAccountDataModified));
    account_->lamports = 0;
    account_->data.clear();
    account_->owner = system_program_;
    return ProgramStatus::ok();
}

// ExecutionContext implementation
ExecutionContext::ExecutionContext(const ExecutionEngine& engine,
                                   std::unordered_map<PublicKey, ProgramAccount> accounts,
                                   std::unordered_set<PublicKey> transaction_signers)
    : engine_(engine),
      accounts_(std::move(accounts)),
      transaction_signers_(std::move(transaction_signers)) {}

const RentCalculator& ExecutionContext::rent() const {
    return engine_.get_rent();
}

const Clock& ExecutionContext::clock() const {
    return engine_.get_clock();
}

const PublicKey& ExecutionContext::system_program_id() const {
    return engine_.get_system_program_id();
}

const PublicKey& ExecutionContext::current_program_id() const {
    return frames_.back().program_id;
}

void ExecutionContext::log(const std::string& message) {
    logs_.push_back("Program log: " + message);
}

ProgramStatus ExecutionContext::process_top_level(const Instruction& instruction) {
    for (const auto& meta : instruction.accounts) {
        if (meta.is_signer && transaction_signers_.count(meta.pubkey) == 0) {
            return ProgramStatus::fail(ProgramError::MissingRequiredSignature,
                                       encode_base58(meta.pubkey));
        }
    }
    return process_instruction(instruction);
}

ProgramStatus ExecutionContext::invoke(const Instruction& instruction,
                                       const std::vector<ProgramSigner>& signers) {
    if (frames_.empty()) {
        return ProgramStatus::fail(ProgramError::InvalidState, "invoke outside of program execution");
    }
    const InvokeFrame& caller = frames_.back();

    std::unordered_set<PublicKey> signed_addresses;
    for (const auto& signer : signers) {
        if (signer.program_id() != caller.program_id) {
            return ProgramStatus::fail(ProgramError::PrivilegeEscalation,
                                       "signer issued for another program");
        }
        signed_addresses.insert(signer.address());
    }

    for (const auto& meta : instruction.accounts) {
        auto it = caller.privileges.find(meta.pubkey);
        if (it == caller.privileges.end()) {
            return ProgramStatus::fail(ProgramError::MissingAccount, encode_base58(meta.pubkey));
        }
        if (meta.is_writable && !it->second.is_writable) {
            return ProgramStatus::fail(ProgramError::PrivilegeEscalation,
                                       "writable " + encode_base58(meta.pubkey));
        }
        if (meta.is_signer && !it->second.is_signer && signed_addresses.count(meta.pubkey) == 0) {
            return ProgramStatus::fail(ProgramError::PrivilegeEscalation,
                                       "signer " + encode_base58(meta.pubkey));
        }
    }

    if (frames_.size() >= 1 + static_cast<size_t>(engine_.get_max_invoke_depth())) {
        return ProgramStatus::fail(ProgramError::CallDepthExceeded,
                                   "depth " + std::to_string(frames_.size() + 1));
    }

    // Direct self-recursion is allowed, re-entering an earlier frame is not
    for (size_t i = 0; i + 1 < frames_.size(); ++i) {
        if (frames_[i].program_id == instruction.program_id &&
            caller.program_id != instruction.program_id) {
            return ProgramStatus::fail(ProgramError::ReentrancyNotAllowed,
                                       encode_base58(instruction.program_id));
        }
    }

    return process_instruction(instruction);
}

ProgramStatus ExecutionContext::process_instruction(const Instruction& instruction) {
    consumed_compute_units_ += engine_.get_compute_units_per_instruction();
    if (consumed_compute_units_ > engine_.get_compute_budget()) {
        return ProgramStatus::fail(ProgramError::ComputeBudgetExceeded,
                                   std::to_string(consumed_compute_units_) + " units");
    }

    const BuiltinProgram* program = engine_.find_program(instruction.program_id);
    if (!program) {
        return ProgramStatus::fail(ProgramError::UnsupportedProgramId,
                                   encode_base58(instruction.program_id));
    }

    InvokeFrame frame;
    frame.program_id = instruction.program_id;
    for (const auto& meta : instruction.accounts) {
        auto& privileges = frame.privileges[meta.pubkey];
        privileges.is_signer = privileges.is_signer || meta.is_signer;
        privileges.is_writable = privileges.is_writable || meta.is_writable;
    }

    // At the top level the signer set is the transaction's; in a nested call
    // program-signed addresses were validated by invoke()
    std::vector<AccountView> views;
    views.reserve(instruction.accounts.size());
    std::vector<const ProgramAccount*> unique_accounts;
    for (const auto& meta : instruction.accounts) {
        auto it = accounts_.find(meta.pubkey);
        if (it == accounts_.end()) {
            return ProgramStatus::fail(ProgramError::MissingAccount, encode_base58(meta.pubkey));
        }
        const auto& privileges = frame.privileges[meta.pubkey];
        views.emplace_back(&it->second, privileges.is_signer, privileges.is_writable,
                           instruction.program_id, engine_.get_system_program_id());
        if (std::find(unique_accounts.begin(), unique_accounts.end(), &it->second) ==
            unique_accounts.end()) {
            unique_accounts.push_back(&it->second);
        }
    }

    auto total_lamports = [&unique_accounts]() {
        unsigned __int128 total = 0;
        for (const auto* account : unique_accounts) {
            total += account->lamports;
        }
        return total;
    };
    const unsigned __int128 lamports_before = total_lamports();

    const std::string program_name = encode_base58(instruction.program_id);
    frames_.push_back(std::move(frame));
    logs_.push_back("Program " + program_name + " invoke [" + std::to_string(frames_.size()) + "]");
    LOG_DEBUG("svm", "Invoking ", program->get_name(), " at depth ", frames_.size());

    ProgramStatus status = program->execute(views, instruction.data, *this);
    frames_.pop_back();

    if (status.is_ok() && total_lamports() != lamports_before) {
        status = ProgramStatus::fail(ProgramError::UnbalancedInstruction, program->get_name());
    }

    if (status.is_ok()) {
        logs_.push_back("Program " + program_name + " success");
    } else {
        logs_.push_back("Program " + program_name + " failed: " + status.to_string());
    }
    return status;
}

// ExecutionEngine implementation
class ExecutionEngine::Impl {
public:
    std::unordered_map<PublicKey, std::unique_ptr<BuiltinProgram>> builtin_programs_;
    uint64_t max_compute_units_ = 200000;
    uint64_t compute_units_per_instruction_ = 1000;
    uint32_t max_invoke_depth_ = 4;
    RentCalculator rent_;
    Clock clock_;
    PublicKey system_program_id_ = PublicKey(PUBKEY_BYTES, 0);

    // Statistics
    uint64_t total_instructions_executed_ = 0;
    uint64_t total_compute_units_consumed_ = 0;
};

ExecutionEngine::ExecutionEngine() : impl_(std::make_unique<Impl>()) {}

ExecutionEngine::~ExecutionEngine() = default;

void ExecutionEngine::register_builtin_program(std::unique_ptr<BuiltinProgram> program) {
    PublicKey program_id = program->get_program_id();
    LOG_INFO("svm", "Registered builtin program: ", program->get_name(),
             " (", encode_base58(program_id), ")");
    impl_->builtin_programs_[program_id] = std::move(program);
}

bool ExecutionEngine::is_program_loaded(const PublicKey& program_id) const {
    return impl_->builtin_programs_.find(program_id) != impl_->builtin_programs_.end();
}

const BuiltinProgram* ExecutionEngine::find_program(const PublicKey& program_id) const {
    auto it = impl_->builtin_programs_.find(program_id);
    return it == impl_->builtin_programs_.end() ? nullptr : it->second.get();
}

namespace {

ExecutionResult classify(ProgramError error) {
    switch (error) {
        case ProgramError::ComputeBudgetExceeded:
            return ExecutionResult::COMPUTE_BUDGET_EXCEEDED;
        case ProgramError::InsufficientFunds:
            return ExecutionResult::INSUFFICIENT_FUNDS;
        case ProgramError::MissingAccount:
            return ExecutionResult::ACCOUNT_NOT_FOUND;
        case ProgramError::InvalidInstructionData:
        case ProgramError::UnsupportedProgramId:
            return ExecutionResult::INVALID_INSTRUCTION;
        default:
            return ExecutionResult::PROGRAM_ERROR;
    }
}

} // namespace

ExecutionOutcome ExecutionEngine::execute_transaction(const Transaction& transaction,
                                                      AccountManager& accounts) {
    ExecutionOutcome outcome;

    for (const auto& instruction : transaction.instructions) {
        for (const auto& meta : instruction.accounts) {
            if (meta.pubkey.size() != PUBKEY_BYTES) {
                outcome.result = ExecutionResult::INVALID_INSTRUCTION;
                outcome.error = ProgramError::InvalidArgument;
                outcome.error_details = "account address must be 32 bytes";
                return outcome;
            }
        }
    }

    // Snapshot every referenced account; unknown addresses start empty and
    // system-owned so they can be created during the transaction
    std::unordered_map<PublicKey, ProgramAccount> loaded;
    for (const auto& instruction : transaction.instructions) {
        for (const auto& meta : instruction.accounts) {
            if (loaded.count(meta.pubkey)) {
                continue;
            }
            auto existing = accounts.get_account(meta.pubkey);
            if (existing) {
                loaded.emplace(meta.pubkey, *existing);
            } else {
                ProgramAccount empty;
                empty.pubkey = meta.pubkey;
                empty.owner = impl_->system_program_id_;
                loaded.emplace(meta.pubkey, std::move(empty));
            }
        }
    }

    std::unordered_set<PublicKey> signers(transaction.signers.begin(), transaction.signers.end());
    ExecutionContext context(*this, loaded, std::move(signers));

    for (size_t i = 0; i < transaction.instructions.size(); ++i) {
        ProgramStatus status = context.process_top_level(transaction.instructions[i]);
        impl_->total_instructions_executed_++;
        if (status.is_err()) {
            outcome.result = classify(status.error());
            outcome.error = status.error();
            outcome.failed_instruction = i;
            outcome.error_details = status.to_string();
            outcome.compute_units_consumed = context.consumed_compute_units();
            outcome.logs = context.logs();
            impl_->total_compute_units_consumed_ += outcome.compute_units_consumed;
            LOG_DEBUG("svm", "Transaction failed at instruction ", i, ": ", outcome.error_details);
            return outcome;
        }
    }

    for (const auto& [pubkey, account] : context.accounts_) {
        if (account != loaded.at(pubkey)) {
            auto staged = accounts.update_account(account);
            if (staged.is_err()) {
                accounts.rollback_changes();
                LOG_SVM_ERROR("Failed to stage account update", "STAGE_FAILED",
                              {{"account", encode_base58(pubkey)}, {"error", staged.error()}});
                outcome.result = ExecutionResult::PROGRAM_ERROR;
                outcome.error_details = staged.error();
                outcome.logs = context.logs();
                return outcome;
            }
        }
    }

    auto committed = accounts.commit_changes();
    if (committed.is_err()) {
        accounts.rollback_changes();
        outcome.result = ExecutionResult::PROGRAM_ERROR;
        outcome.error_details = committed.error();
    }

    outcome.compute_units_consumed = context.consumed_compute_units();
    outcome.logs = context.logs();
    impl_->total_compute_units_consumed_ += outcome.compute_units_consumed;
    return outcome;
}

void ExecutionEngine::set_compute_budget(uint64_t max_compute_units) {
    impl_->max_compute_units_ = max_compute_units;
}

void ExecutionEngine::set_compute_units_per_instruction(uint64_t units) {
    impl_->compute_units_per_instruction_ = units;
}

void ExecutionEngine::set_max_invoke_depth(uint32_t depth) {
    impl_->max_invoke_depth_ = depth;
}

void ExecutionEngine::set_rent(const RentCalculator& rent) {
    impl_->rent_ = rent;
}

void ExecutionEngine::set_clock(const Clock& clock) {
    impl_->clock_ = clock;
}

void ExecutionEngine::set_system_program_id(const PublicKey& program_id) {
    impl_->system_program_id_ = program_id;
}

uint64_t ExecutionEngine::get_compute_budget() const {
    return impl_->max_compute_units_;
}

uint64_t ExecutionEngine::get_compute_units_per_instruction() const {
    return impl_->compute_units_per_instruction_;
}

uint32_t ExecutionEngine::get_max_invoke_depth() const {
    return impl_->max_invoke_depth_;
}

const RentCalculator& ExecutionEngine::get_rent() const {
    return impl_->rent_;
}

const Clock& ExecutionEngine::get_clock() const {
    return impl_->clock_;
}

const PublicKey& ExecutionEngine::get_system_program_id() const {
    return impl_->system_program_id_;
}

uint64_t ExecutionEngine::get_total_instructions_executed() const {
    return impl_->total_instructions_executed_;
}

uint64_t ExecutionEngine::get_total_compute_units_consumed() const {
    return impl_->total_compute_units_consumed_;
}

// AccountManager implementation
class AccountManager::Impl {
public:
    std::unordered_map<PublicKey, ProgramAccount> accounts_;
    std::unordered_map<PublicKey, ProgramAccount> pending_changes_;
};

AccountManager::AccountManager() : impl_(std::make_unique<Impl>()) {}

AccountManager::~AccountManager() = default;

std::optional<ProgramAccount> AccountManager::get_account(const PublicKey& pubkey) const {
    // Check pending changes first
    auto pending_it = impl_->pending_changes_.find(pubkey);
    if (pending_it != impl_->pending_changes_.end()) {
        if (!pending_it->second.exists()) {
            return std::nullopt;
        }
        return pending_it->second;
    }

    auto it = impl_->accounts_.find(pubkey);
    if (it != impl_->accounts_.end()) {
        return it->second;
    }
    return std::nullopt;
}

Result<bool> AccountManager::update_account(const ProgramAccount& account) {
    if (account.pubkey.size() != PUBKEY_BYTES) {
        return Result<bool>("Account address must be 32 bytes");
    }
    impl_->pending_changes_[account.pubkey] = account;
    return Result<bool>(true);
}

std::vector<ProgramAccount> AccountManager::get_program_accounts(const PublicKey& program_id) const {
    std::vector<ProgramAccount> result;
    for (const auto& account : get_all_accounts()) {
        if (account.owner == program_id) {
            result.push_back(account);
        }
    }
    return result;
}

std::vector<ProgramAccount> AccountManager::get_all_accounts() const {
    std::vector<ProgramAccount> result;
    for (const auto& [pubkey, account] : impl_->accounts_) {
        if (impl_->pending_changes_.count(pubkey) == 0) {
            result.push_back(account);
        }
    }
    // Pending versions shadow committed ones
    for (const auto& [pubkey, account] : impl_->pending_changes_) {
        if (account.exists()) {
            result.push_back(account);
        }
    }
    return result;
}

bool AccountManager::account_exists(const PublicKey& pubkey) const {
    return get_account(pubkey).has_value();
}

Lamports AccountManager::get_account_balance(const PublicKey& pubkey) const {
    auto account = get_account(pubkey);
    return account ? account->lamports : 0;
}

Result<bool> AccountManager::commit_changes() {
    for (auto& [pubkey, account] : impl_->pending_changes_) {
        if (account.exists()) {
            impl_->accounts_[pubkey] = std::move(account);
        } else {
            impl_->accounts_.erase(pubkey);
        }
    }
    LOG_TRACE("svm", "Committed ", impl_->pending_changes_.size(), " account changes");
    impl_->pending_changes_.clear();
    return Result<bool>(true);
}

void AccountManager::rollback_changes() {
    LOG_TRACE("svm", "Rolled back ", impl_->pending_changes_.size(), " account changes");
    impl_->pending_changes_.clear();
}

} // namespace svm
} // namespace pinion
