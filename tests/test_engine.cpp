#include "common/logging.h"
#include "svm/system_program.h"
#include "test_helpers.h"

using pinion::svm::AccountView;
using pinion::svm::ExecutionContext;
using pinion::svm::ExecutionResult;
using pinion::svm::ProgramStatus;

namespace {

/**
 * Test program that exercises the invocation rules.
 *
 * Accounts: [payer(s,w), other(w), ...]. Data: [command, argument].
 */
class ProbeProgram : public svm::BuiltinProgram {
public:
  enum Command : uint8_t {
    TransferAsPayer = 0, // system transfer payer -> other, argument lamports
    Recurse = 1,         // invoke itself argument more times
    CallPeer = 2,        // invoke the peer probe with command CallPeer
    ForeignSigner = 3,   // pass a signer issued for the system program
    MintLamports = 4,    // credit other without a matching debit
    WriteForeign = 5,    // write to other, which this program does not own
    EscalateWritable = 6, // pass a read-only account as writable
    TransferOutside = 7   // system transfer to an account not passed in
  };

  ProbeProgram(PublicKey id, PublicKey peer, PublicKey system)
      : id_(std::move(id)), peer_(std::move(peer)), system_(std::move(system)) {}

  PublicKey get_program_id() const override { return id_; }
  std::string get_name() const override { return "probe"; }

  ProgramStatus execute(std::vector<AccountView> &accounts,
                        const std::vector<uint8_t> &data,
                        ExecutionContext &context) const override {
    const uint8_t argument = data.size() > 1 ? data[1] : 0;
    std::vector<AccountMeta> metas;
    for (const auto &account : accounts) {
      metas.push_back(AccountMeta{account.address(), account.is_signer(),
                                  account.is_writable()});
    }

    switch (static_cast<Command>(data.at(0))) {
    case TransferAsPayer:
      return context.invoke(svm::system_instruction::transfer(
          system_, accounts[0].address(), accounts[1].address(), argument));
    case Recurse:
      if (argument == 0) {
        return ProgramStatus::ok();
      }
      return context.invoke(Instruction{id_, metas, {Recurse, static_cast<uint8_t>(argument - 1)}});
    case CallPeer:
      return context.invoke(Instruction{peer_, metas, {CallPeer}});
    case ForeignSigner: {
      svm::Seeds seeds{svm::seed_bytes("probe")};
      auto found = svm::find_program_address(seeds, system_);
      if (found.is_err()) {
        return found.status();
      }
      seeds.push_back({found.value().second});
      auto signer = svm::ProgramSigner::create(seeds, system_);
      if (signer.is_err()) {
        return signer.status();
      }
      return context.invoke(Instruction{peer_, metas, {Recurse, 0}}, {signer.value()});
    }
    case MintLamports:
      return accounts[1].credit(1);
    case WriteForeign:
      return accounts[1].write_data(0, {0x01});
    case EscalateWritable:
      metas[1].is_writable = true;
      return context.invoke(Instruction{peer_, metas, {Recurse, 0}});
    case TransferOutside:
      return context.invoke(svm::system_instruction::transfer(
          system_, accounts[0].address(), PublicKey(PUBKEY_BYTES, 0x0d), argument));
    }
    return ProgramStatus::fail(ProgramError::InvalidInstructionData, "probe command");
  }

private:
  PublicKey id_;
  PublicKey peer_;
  PublicKey system_;
};

const PublicKey ALICE = test_key(0x0a);
const PublicKey BOB = test_key(0x0b);
const PublicKey PROBE = test_key(0xa1);
const PublicKey PEER = test_key(0xa2);

void register_probes(TestLedger &ledger) {
  ledger.engine->register_builtin_program(
      std::make_unique<ProbeProgram>(PROBE, PEER, ledger.ids.system));
  ledger.engine->register_builtin_program(
      std::make_unique<ProbeProgram>(PEER, PROBE, ledger.ids.system));
}

Instruction probe(uint8_t command, uint8_t argument = 0,
                  bool other_writable = true) {
  return Instruction{PROBE,
                     {AccountMeta::writable(ALICE, true),
                      AccountMeta{BOB, false, other_writable}},
                     {command, argument}};
}

} // namespace

void test_account_view_ownership_rules() {
  const PublicKey system(32, 0);
  const PublicKey program = test_key(0x70);
  ProgramAccount account;
  account.pubkey = ALICE;
  account.owner = system;
  account.lamports = 100;

  AccountView readonly(&account, false, false, program, system);
  ASSERT_PROGRAM_ERROR(ProgramError::ReadonlyDataModified, readonly.credit(1));

  AccountView foreign(&account, false, true, program, system);
  ASSERT_OK(foreign.credit(5));
  ASSERT_EQ(static_cast<Lamports>(105), account.lamports);
  ASSERT_PROGRAM_ERROR(ProgramError::ExternalAccountLamportSpend, foreign.debit(1));
  ASSERT_PROGRAM_ERROR(ProgramError::ExternalAccountDataModified, foreign.resize(8));
  ASSERT_PROGRAM_ERROR(ProgramError::InvalidOwner, foreign.assign(program));
  ASSERT_OK(foreign.assign(system));

  AccountView owner(&account, true, true, system, system);
  ASSERT_PROGRAM_ERROR(ProgramError::InsufficientFunds, owner.debit(1000));
  ASSERT_PROGRAM_ERROR(ProgramError::InvalidArgument,
                       owner.resize(AccountView::MAX_DATA_LEN + 1));
  ASSERT_OK(owner.resize(4));
  ASSERT_PROGRAM_ERROR(ProgramError::InvalidAccountData, owner.write_data(2, {1, 2, 3}));
  ASSERT_OK(owner.write_data(2, {1, 2}));
  ASSERT_PROGRAM_ERROR(ProgramError::ExternalAccountDataModified, owner.assign(program));

  ASSERT_OK(owner.close());
  ASSERT_TRUE(owner.is_closed());
  ASSERT_EQ(system, account.owner);
}

void test_system_transfer() {
  TestLedger ledger;
  ledger.fund(ALICE, 5 * SOL);

  auto outcome = ledger.run(svm::system_instruction::transfer(ledger.ids.system, ALICE, BOB, SOL),
                            {ALICE});
  ASSERT_SUCCESS(outcome);
  ASSERT_EQ(4 * SOL, ledger.lamports(ALICE));
  ASSERT_EQ(SOL, ledger.lamports(BOB));
  ASSERT_EQ(static_cast<uint64_t>(1000), outcome.compute_units_consumed);

  ASSERT_EQ(static_cast<size_t>(2), outcome.logs.size());
  ASSERT_EQ(std::string("Program 11111111111111111111111111111111 invoke [1]"), outcome.logs[0]);
  ASSERT_EQ(std::string("Program 11111111111111111111111111111111 success"), outcome.logs[1]);
}

void test_missing_signature() {
  TestLedger ledger;
  ledger.fund(ALICE, SOL);

  auto outcome = ledger.run(svm::system_instruction::transfer(ledger.ids.system, ALICE, BOB, 1), {});
  ASSERT_TX_ERROR(ProgramError::MissingRequiredSignature, outcome);
  ASSERT_EQ(SOL, ledger.lamports(ALICE));
}

void test_failed_transaction_changes_nothing() {
  TestLedger ledger;
  ledger.fund(ALICE, SOL);
  ledger.fund(BOB, SOL);
  auto before = ledger.snapshot();

  // The first transfer succeeds on its own; the second overdraws
  std::vector<Instruction> instructions = {
      svm::system_instruction::transfer(ledger.ids.system, ALICE, BOB, SOL / 2),
      svm::system_instruction::transfer(ledger.ids.system, ALICE, BOB, SOL)};
  auto outcome = ledger.run(instructions, {ALICE});

  ASSERT_TX_ERROR(ProgramError::InsufficientFunds, outcome);
  ASSERT_TRUE(outcome.result == ExecutionResult::INSUFFICIENT_FUNDS);
  ASSERT_TRUE(outcome.failed_instruction.has_value());
  ASSERT_EQ(static_cast<size_t>(1), *outcome.failed_instruction);
  ASSERT_TRUE(before == ledger.snapshot());
}

void test_unknown_program_and_bad_address() {
  TestLedger ledger;
  ledger.fund(ALICE, SOL);

  auto unknown = ledger.run(Instruction{test_key(0xee), {AccountMeta::writable(ALICE, true)}, {0}},
                            {ALICE});
  ASSERT_TX_ERROR(ProgramError::UnsupportedProgramId, unknown);
  ASSERT_TRUE(unknown.result == ExecutionResult::INVALID_INSTRUCTION);

  auto short_key = ledger.run(
      Instruction{ledger.ids.system, {AccountMeta::writable(PublicKey(31, 0x01))}, {}}, {});
  ASSERT_TRUE(short_key.result == ExecutionResult::INVALID_INSTRUCTION);
}

void test_compute_budget() {
  TestLedger ledger;
  ledger.fund(ALICE, SOL);
  ledger.engine->set_compute_budget(1500);

  std::vector<Instruction> instructions(
      2, svm::system_instruction::transfer(ledger.ids.system, ALICE, BOB, 10));
  auto outcome = ledger.run(instructions, {ALICE});
  ASSERT_TX_ERROR(ProgramError::ComputeBudgetExceeded, outcome);
  ASSERT_TRUE(outcome.result == ExecutionResult::COMPUTE_BUDGET_EXCEEDED);
  ASSERT_EQ(SOL, ledger.lamports(ALICE));
}

void test_create_account_rules() {
  TestLedger ledger;
  ledger.fund(ALICE, SOL);
  const PublicKey fresh = test_key(0x0c);
  const PublicKey owner = test_key(0x70);

  auto unsigned_new = svm::system_instruction::create_account(ledger.ids.system, ALICE, fresh,
                                                              ledger.rent_for(10), 10, owner);
  unsigned_new.accounts[1].is_signer = false;
  ASSERT_TX_ERROR(ProgramError::MissingRequiredSignature, ledger.run(unsigned_new, {ALICE}));

  auto create = svm::system_instruction::create_account(ledger.ids.system, ALICE, fresh,
                                                        ledger.rent_for(10), 10, owner);
  ASSERT_SUCCESS(ledger.run(create, {ALICE, fresh}));
  ProgramAccount created = ledger.account(fresh);
  ASSERT_EQ(owner, created.owner);
  ASSERT_EQ(static_cast<size_t>(10), created.data.size());
  ASSERT_EQ(ledger.rent_for(10), created.lamports);

  ASSERT_TX_ERROR(ProgramError::AccountAlreadyInUse, ledger.run(create, {ALICE, fresh}));
}

void test_cpi_transfer_keeps_caller_privileges() {
  TestLedger ledger;
  register_probes(ledger);
  ledger.fund(ALICE, SOL);

  auto outcome = ledger.run(probe(ProbeProgram::TransferAsPayer, 50), {ALICE});
  ASSERT_SUCCESS(outcome);
  ASSERT_EQ(static_cast<Lamports>(50), ledger.lamports(BOB));
  ASSERT_EQ(static_cast<uint64_t>(2000), outcome.compute_units_consumed);
  ASSERT_CONTAINS(outcome.logs[1], "invoke [2]");

  // A read-only account cannot be made writable in the nested call
  auto escalated = ledger.run(probe(ProbeProgram::EscalateWritable, 0, false), {ALICE});
  ASSERT_TX_ERROR(ProgramError::PrivilegeEscalation, escalated);
}

void test_cpi_signer_from_other_program() {
  TestLedger ledger;
  register_probes(ledger);
  ledger.fund(ALICE, SOL);

  auto outcome = ledger.run(probe(ProbeProgram::ForeignSigner), {ALICE});
  ASSERT_TX_ERROR(ProgramError::PrivilegeEscalation, outcome);
}

void test_call_depth_limit() {
  TestLedger ledger;
  register_probes(ledger);
  ledger.fund(ALICE, SOL);

  // Default depth limit is 4 nested calls below the top level
  ASSERT_SUCCESS(ledger.run(probe(ProbeProgram::Recurse, 4), {ALICE}));
  ASSERT_TX_ERROR(ProgramError::CallDepthExceeded,
                  ledger.run(probe(ProbeProgram::Recurse, 5), {ALICE}));

  ledger.engine->set_max_invoke_depth(5);
  ASSERT_SUCCESS(ledger.run(probe(ProbeProgram::Recurse, 5), {ALICE}));
}

void test_reentrancy_rejected() {
  TestLedger ledger;
  register_probes(ledger);
  ledger.fund(ALICE, SOL);

  auto outcome = ledger.run(probe(ProbeProgram::CallPeer), {ALICE});
  ASSERT_TX_ERROR(ProgramError::ReentrancyNotAllowed, outcome);
}

void test_unbalanced_and_foreign_writes() {
  TestLedger ledger;
  register_probes(ledger);
  ledger.fund(ALICE, SOL);
  ledger.fund(BOB, SOL);

  ASSERT_TX_ERROR(ProgramError::UnbalancedInstruction,
                  ledger.run(probe(ProbeProgram::MintLamports), {ALICE}));
  ASSERT_TX_ERROR(ProgramError::ExternalAccountDataModified,
                  ledger.run(probe(ProbeProgram::WriteForeign), {ALICE}));
  ASSERT_EQ(SOL, ledger.lamports(BOB));
}

void test_cpi_missing_account() {
  TestLedger ledger;
  register_probes(ledger);
  ledger.fund(ALICE, SOL);

  auto outcome = ledger.run(probe(ProbeProgram::TransferOutside, 1), {ALICE});
  ASSERT_TX_ERROR(ProgramError::MissingAccount, outcome);
  ASSERT_TRUE(outcome.result == svm::ExecutionResult::ACCOUNT_NOT_FOUND);
  ASSERT_EQ(SOL, ledger.lamports(ALICE));
}

void test_engine_statistics_and_program_lookup() {
  TestLedger ledger;
  ledger.fund(ALICE, SOL);
  ASSERT_TRUE(ledger.engine->is_program_loaded(ledger.ids.system));
  ASSERT_TRUE(ledger.engine->is_program_loaded(ledger.ids.escrow));
  ASSERT_FALSE(ledger.engine->is_program_loaded(test_key(0xee)));
  ASSERT_EQ(static_cast<uint64_t>(0), ledger.engine->get_total_instructions_executed());

  auto transfer = ledger.run(svm::system_instruction::transfer(ledger.ids.system, ALICE, BOB, 10),
                             {ALICE});
  ASSERT_SUCCESS(transfer);

  // Failed transactions count the instructions they reached
  std::vector<Instruction> overdraw = {
      svm::system_instruction::transfer(ledger.ids.system, ALICE, BOB, 10),
      svm::system_instruction::transfer(ledger.ids.system, ALICE, BOB, 2 * SOL)};
  auto failed = ledger.run(overdraw, {ALICE});
  ASSERT_TX_ERROR(ProgramError::InsufficientFunds, failed);

  ASSERT_EQ(static_cast<uint64_t>(3), ledger.engine->get_total_instructions_executed());
  ASSERT_EQ(transfer.compute_units_consumed + failed.compute_units_consumed,
            ledger.engine->get_total_compute_units_consumed());
}

void test_program_accounts_query() {
  TestLedger ledger;
  ledger.fund(ALICE, 5 * SOL);
  const PublicKey owned = test_key(0x0e);
  auto create = svm::system_instruction::create_account(ledger.ids.system, ALICE, owned,
                                                        ledger.rent_for(16), 16, PROBE);
  ASSERT_SUCCESS(ledger.run(create, {ALICE, owned}));

  auto by_probe = ledger.accounts.get_program_accounts(PROBE);
  ASSERT_EQ(static_cast<size_t>(1), by_probe.size());
  ASSERT_EQ(owned, by_probe[0].pubkey);
  ASSERT_EQ(static_cast<size_t>(16), by_probe[0].data.size());
  ASSERT_EQ(static_cast<size_t>(1), ledger.accounts.get_program_accounts(ledger.ids.system).size());
  ASSERT_TRUE(ledger.accounts.get_program_accounts(PEER).empty());
}

void test_create_engine_validates_config() {
  RuntimeConfig shallow = ConfigManager::create_default();
  shallow.runtime.max_invoke_depth = 0;
  auto rejected = programs::create_engine(shallow);
  ASSERT_TRUE(rejected.is_err());
  ASSERT_CONTAINS(rejected.error(), "Invoke depth");

  RuntimeConfig no_budget = ConfigManager::create_default();
  no_budget.runtime.max_compute_units = 0;
  ASSERT_TRUE(programs::create_engine(no_budget).is_err());

  RuntimeConfig bad_rent = ConfigManager::create_default();
  bad_rent.rent.exemption_threshold = 0.5;
  ASSERT_TRUE(programs::create_engine(bad_rent).is_err());

  RuntimeConfig bad_level = ConfigManager::create_default();
  bad_level.logging.level = "LOUD";
  ASSERT_TRUE(programs::create_engine(bad_level).is_err());

  // The logging section reaches the global logger
  Logger &logger = Logger::instance();
  const LogLevel previous = logger.level();
  RuntimeConfig quiet = ConfigManager::create_default();
  quiet.logging.level = "ERROR";
  quiet.runtime.max_invoke_depth = 6;
  auto created = programs::create_engine(quiet);
  const bool warn_enabled = logger.is_enabled(LogLevel::WARN);
  logger.set_level(previous);
  ASSERT_OK(created);
  ASSERT_FALSE(warn_enabled);
  ASSERT_EQ(static_cast<uint32_t>(6), created.value()->get_max_invoke_depth());
}

int main() {
  std::cout << "=== Execution Engine Test Suite ===" << std::endl;
  TestRunner runner;

  runner.run_test("AccountView Ownership Rules", test_account_view_ownership_rules);
  runner.run_test("System Transfer", test_system_transfer);
  runner.run_test("Missing Signature", test_missing_signature);
  runner.run_test("Failed Transaction Changes Nothing", test_failed_transaction_changes_nothing);
  runner.run_test("Unknown Program And Bad Address", test_unknown_program_and_bad_address);
  runner.run_test("Compute Budget", test_compute_budget);
  runner.run_test("Create Account Rules", test_create_account_rules);
  runner.run_test("CPI Transfer Keeps Caller Privileges", test_cpi_transfer_keeps_caller_privileges);
  runner.run_test("CPI Signer From Other Program", test_cpi_signer_from_other_program);
  runner.run_test("Call Depth Limit", test_call_depth_limit);
  runner.run_test("Reentrancy Rejected", test_reentrancy_rejected);
  runner.run_test("Unbalanced And Foreign Writes", test_unbalanced_and_foreign_writes);
  runner.run_test("CPI Missing Account", test_cpi_missing_account);
  runner.run_test("Engine Statistics And Program Lookup", test_engine_statistics_and_program_lookup);
  runner.run_test("Program Accounts Query", test_program_accounts_query);
  runner.run_test("Create Engine Validates Config", test_create_engine_validates_config);

  runner.print_summary();
  return runner.all_passed() ? 0 : 1;
}
