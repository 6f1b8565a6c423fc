#include "programs/vault/vault_program.h"
#include "test_helpers.h"

using pinion::programs::vault::VaultProgram;

namespace {

const PublicKey OWNER = test_key(0x0a);
const PublicKey STRANGER = test_key(0x0b);

PublicKey vault_of(const TestLedger &ledger, const PublicKey &owner) {
  return unwrap(VaultProgram::derive(ledger.ids, owner)).first;
}

} // namespace

void test_deposit_then_withdraw() {
  TestLedger ledger;
  ledger.fund(OWNER, 5 * SOL);
  const PublicKey vault = vault_of(ledger, OWNER);

  auto deposit = ledger.run(unwrap(VaultProgram::deposit(ledger.ids, OWNER, SOL)), {OWNER});
  ASSERT_SUCCESS(deposit);
  ASSERT_EQ(SOL, ledger.lamports(vault));
  ASSERT_EQ(4 * SOL, ledger.lamports(OWNER));
  ASSERT_EQ(ledger.ids.system, ledger.account(vault).owner);

  ASSERT_SUCCESS(ledger.run(unwrap(VaultProgram::withdraw(ledger.ids, OWNER)), {OWNER}));
  ASSERT_EQ(5 * SOL, ledger.lamports(OWNER));
  ASSERT_FALSE(ledger.exists(vault));
}

void test_vault_address() {
  TestLedger ledger;
  auto derived = unwrap(VaultProgram::derive(ledger.ids, OWNER));
  ASSERT_EQ(std::string("J1Y9atELcN2Z2xoLb5MuprR4kAmsdiG6hMnXqU9ZHnQS"), encode_base58(derived.first));
  ASSERT_NE(derived.first, vault_of(ledger, STRANGER));
}

void test_second_deposit_rejected() {
  TestLedger ledger;
  ledger.fund(OWNER, 5 * SOL);
  ASSERT_SUCCESS(ledger.run(unwrap(VaultProgram::deposit(ledger.ids, OWNER, SOL)), {OWNER}));

  ASSERT_TX_ERROR(ProgramError::InvalidState,
                  ledger.run(unwrap(VaultProgram::deposit(ledger.ids, OWNER, SOL)), {OWNER}));
  ASSERT_EQ(SOL, ledger.lamports(vault_of(ledger, OWNER)));
}

void test_withdraw_from_empty_vault() {
  TestLedger ledger;
  ledger.fund(OWNER, SOL);
  ASSERT_TX_ERROR(ProgramError::InvalidState,
                  ledger.run(unwrap(VaultProgram::withdraw(ledger.ids, OWNER)), {OWNER}));
}

void test_deposit_must_exceed_rent_minimum() {
  TestLedger ledger;
  ledger.fund(OWNER, SOL);
  const Lamports minimum = ledger.rent_for(0);
  ASSERT_EQ(static_cast<Lamports>(890880), minimum);

  ASSERT_TX_ERROR(ProgramError::InvalidArgument,
                  ledger.run(unwrap(VaultProgram::deposit(ledger.ids, OWNER, minimum)), {OWNER}));
  ASSERT_SUCCESS(ledger.run(unwrap(VaultProgram::deposit(ledger.ids, OWNER, minimum + 1)), {OWNER}));
}

void test_wrong_vault_rejected() {
  TestLedger ledger;
  ledger.fund(OWNER, 5 * SOL);
  ledger.fund(STRANGER, 5 * SOL);
  ASSERT_SUCCESS(ledger.run(unwrap(VaultProgram::deposit(ledger.ids, STRANGER, SOL)), {STRANGER}));

  // Draining someone else's vault
  Instruction steal = unwrap(VaultProgram::withdraw(ledger.ids, OWNER));
  steal.accounts[1].pubkey = vault_of(ledger, STRANGER);
  ASSERT_TX_ERROR(ProgramError::InvalidAddress, ledger.run(steal, {OWNER}));

  Instruction unsigned_withdraw = unwrap(VaultProgram::withdraw(ledger.ids, STRANGER));
  unsigned_withdraw.accounts[0].is_signer = false;
  ASSERT_TX_ERROR(ProgramError::NotSigner, ledger.run(unsigned_withdraw, {}));

  Instruction wrong_system = unwrap(VaultProgram::withdraw(ledger.ids, STRANGER));
  wrong_system.accounts[2].pubkey = ledger.ids.token;
  ASSERT_TX_ERROR(ProgramError::IncorrectProgramId, ledger.run(wrong_system, {STRANGER}));

  ASSERT_EQ(SOL, ledger.lamports(vault_of(ledger, STRANGER)));
}

void test_payload_validation() {
  TestLedger ledger;
  ledger.fund(OWNER, 5 * SOL);

  Instruction short_deposit = unwrap(VaultProgram::deposit(ledger.ids, OWNER, SOL));
  short_deposit.data.pop_back();
  ASSERT_TX_ERROR(ProgramError::InvalidInstructionData, ledger.run(short_deposit, {OWNER}));

  Instruction padded_withdraw = unwrap(VaultProgram::withdraw(ledger.ids, OWNER));
  padded_withdraw.data.push_back(0);
  ASSERT_TX_ERROR(ProgramError::InvalidInstructionData, ledger.run(padded_withdraw, {OWNER}));

  Instruction unknown = unwrap(VaultProgram::withdraw(ledger.ids, OWNER));
  unknown.data[0] = 7;
  ASSERT_TX_ERROR(ProgramError::InvalidInstructionData, ledger.run(unknown, {OWNER}));
}

void test_deposit_beyond_balance() {
  TestLedger ledger;
  ledger.fund(OWNER, SOL);
  auto before = ledger.snapshot();

  ASSERT_TX_ERROR(ProgramError::InsufficientFunds,
                  ledger.run(unwrap(VaultProgram::deposit(ledger.ids, OWNER, 2 * SOL)), {OWNER}));
  ASSERT_TRUE(before == ledger.snapshot());
}

int main() {
  std::cout << "=== Vault Program Test Suite ===" << std::endl;
  TestRunner runner;

  runner.run_test("Deposit Then Withdraw", test_deposit_then_withdraw);
  runner.run_test("Vault Address", test_vault_address);
  runner.run_test("Second Deposit Rejected", test_second_deposit_rejected);
  runner.run_test("Withdraw From Empty Vault", test_withdraw_from_empty_vault);
  runner.run_test("Deposit Must Exceed Rent Minimum", test_deposit_must_exceed_rent_minimum);
  runner.run_test("Wrong Vault Rejected", test_wrong_vault_rejected);
  runner.run_test("Payload Validation", test_payload_validation);
  runner.run_test("Deposit Beyond Balance", test_deposit_beyond_balance);

  runner.print_summary();
  return runner.all_passed() ? 0 : 1;
}
