#include "svm/spl_programs.h"
#include "svm/system_program.h"
#include "svm/token_program.h"
#include "test_helpers.h"

namespace tok = pinion::svm::token_instruction;
using pinion::svm::SPLAssociatedTokenProgram;

namespace {

const PublicKey ALICE = test_key(0x0a);
const PublicKey BOB = test_key(0x0b);
const PublicKey MINT = test_key(0x21);
const PublicKey OTHER_MINT = test_key(0x22);

void freeze(TestLedger &ledger, const PublicKey &address) {
  ProgramAccount account = ledger.account(address);
  svm::TokenAccount token_account = unwrap(svm::TokenAccount::unpack(account.data));
  token_account.state = svm::TokenAccountState::Frozen;
  token_account.pack_into(account.data);
  ledger.put(account);
}

} // namespace

void test_initialize_mint_through_system() {
  TestLedger ledger;
  ledger.fund(ALICE, SOL);

  std::vector<Instruction> instructions = {
      svm::system_instruction::create_account(ledger.ids.system, ALICE, MINT,
                                              ledger.rent_for(svm::token_layout::MINT_LEN),
                                              svm::token_layout::MINT_LEN, ledger.ids.token),
      tok::initialize_mint2(ledger.ids.token, MINT, 6, ALICE)};
  ASSERT_SUCCESS(ledger.run(instructions, {ALICE, MINT}));

  svm::Mint mint = unwrap(svm::Mint::unpack(ledger.account(MINT).data));
  ASSERT_TRUE(mint.is_initialized);
  ASSERT_EQ(static_cast<uint8_t>(6), mint.decimals);
  ASSERT_TRUE(mint.mint_authority.has_value());
  ASSERT_EQ(ALICE, *mint.mint_authority);
  ASSERT_FALSE(mint.freeze_authority.has_value());

  ASSERT_TX_ERROR(ProgramError::AccountAlreadyInitialized,
                  ledger.run(tok::initialize_mint2(ledger.ids.token, MINT, 6, ALICE), {}));
}

void test_underfunded_mint_rejected() {
  TestLedger ledger;
  ledger.fund(ALICE, SOL);

  std::vector<Instruction> instructions = {
      svm::system_instruction::create_account(ledger.ids.system, ALICE, MINT,
                                              ledger.rent_for(svm::token_layout::MINT_LEN) - 1,
                                              svm::token_layout::MINT_LEN, ledger.ids.token),
      tok::initialize_mint2(ledger.ids.token, MINT, 6, ALICE)};
  ASSERT_TX_ERROR(ProgramError::NotRentExempt, ledger.run(instructions, {ALICE, MINT}));
  ASSERT_FALSE(ledger.exists(MINT));
}

void test_transfer_rules() {
  TestLedger ledger;
  ledger.put_mint(MINT, 6, ALICE);
  ledger.put_mint(OTHER_MINT, 6, ALICE);
  PublicKey alice_ata = ledger.put_ata(ALICE, MINT, 500);
  PublicKey bob_ata = ledger.put_ata(BOB, MINT, 0);
  PublicKey bob_other = ledger.put_ata(BOB, OTHER_MINT, 0);

  ASSERT_SUCCESS(ledger.run(tok::transfer(ledger.ids.token, alice_ata, bob_ata, ALICE, 200), {ALICE}));
  ASSERT_EQ(static_cast<uint64_t>(300), ledger.token_balance(alice_ata));
  ASSERT_EQ(static_cast<uint64_t>(200), ledger.token_balance(bob_ata));

  // Only the owner may move tokens
  ASSERT_TX_ERROR(ProgramError::OwnerMismatch,
                  ledger.run(tok::transfer(ledger.ids.token, alice_ata, bob_ata, BOB, 1), {BOB}));
  ASSERT_TX_ERROR(ProgramError::MintMismatch,
                  ledger.run(tok::transfer(ledger.ids.token, alice_ata, bob_other, ALICE, 1), {ALICE}));
  ASSERT_TX_ERROR(ProgramError::InsufficientFunds,
                  ledger.run(tok::transfer(ledger.ids.token, alice_ata, bob_ata, ALICE, 301), {ALICE}));
  ASSERT_TX_ERROR(ProgramError::MintMismatch,
                  ledger.run(tok::transfer_checked(ledger.ids.token, alice_ata, MINT, bob_ata, ALICE, 1, 9),
                             {ALICE}));

  // Self-transfer leaves the balance alone
  ASSERT_SUCCESS(ledger.run(tok::transfer(ledger.ids.token, alice_ata, alice_ata, ALICE, 100), {ALICE}));
  ASSERT_EQ(static_cast<uint64_t>(300), ledger.token_balance(alice_ata));

  freeze(ledger, bob_ata);
  ASSERT_TX_ERROR(ProgramError::AccountFrozen,
                  ledger.run(tok::transfer(ledger.ids.token, alice_ata, bob_ata, ALICE, 1), {ALICE}));
}

void test_transfer_checks_token_program() {
  TestLedger ledger;
  ledger.put_mint(MINT, 6, ALICE);
  PublicKey alice_ata = ledger.put_ata(ALICE, MINT, 500);
  PublicKey bob_ata = ledger.put_ata(BOB, MINT, 0);

  // Legacy accounts are not visible to the extended program
  ASSERT_TX_ERROR(ProgramError::IncorrectProgramId,
                  ledger.run(tok::transfer(ledger.ids.token_2022, alice_ata, bob_ata, ALICE, 1), {ALICE}));
}

void test_mint_and_burn_supply() {
  TestLedger ledger;
  ledger.put_mint(MINT, 6, ALICE);
  PublicKey bob_ata = ledger.put_ata(BOB, MINT, 0);

  ASSERT_TX_ERROR(ProgramError::OwnerMismatch,
                  ledger.run(tok::mint_to(ledger.ids.token, MINT, bob_ata, BOB, 10), {BOB}));

  ASSERT_SUCCESS(ledger.run(tok::mint_to(ledger.ids.token, MINT, bob_ata, ALICE, 1000), {ALICE}));
  ASSERT_EQ(static_cast<uint64_t>(1000), ledger.mint_supply(MINT));
  ASSERT_EQ(static_cast<uint64_t>(1000), ledger.token_balance(bob_ata));

  ASSERT_SUCCESS(ledger.run(tok::burn(ledger.ids.token, bob_ata, MINT, BOB, 400), {BOB}));
  ASSERT_EQ(static_cast<uint64_t>(600), ledger.mint_supply(MINT));
  ASSERT_EQ(static_cast<uint64_t>(600), ledger.token_balance(bob_ata));

  ASSERT_TX_ERROR(ProgramError::InsufficientFunds,
                  ledger.run(tok::burn(ledger.ids.token, bob_ata, MINT, BOB, 601), {BOB}));
}

void test_close_account() {
  TestLedger ledger;
  ledger.put_mint(MINT, 6, ALICE);
  PublicKey alice_ata = ledger.put_ata(ALICE, MINT, 5);
  const Lamports rent = ledger.lamports(alice_ata);

  ASSERT_TX_ERROR(ProgramError::NonZeroBalance,
                  ledger.run(tok::close_account(ledger.ids.token, alice_ata, BOB, ALICE), {ALICE}));

  ASSERT_SUCCESS(ledger.run(tok::burn(ledger.ids.token, alice_ata, MINT, ALICE, 5), {ALICE}));
  ASSERT_SUCCESS(ledger.run(tok::close_account(ledger.ids.token, alice_ata, BOB, ALICE), {ALICE}));
  ASSERT_FALSE(ledger.exists(alice_ata));
  ASSERT_EQ(rent, ledger.lamports(BOB));
}

void test_associated_account_legacy() {
  TestLedger ledger;
  ledger.fund(ALICE, SOL);
  ledger.put_mint(MINT, 6, ALICE);
  const PublicKey address = ledger.ata(BOB, MINT);

  auto create = SPLAssociatedTokenProgram::create(ledger.ids, ALICE, BOB, MINT, ledger.ids.token);
  ASSERT_SUCCESS(ledger.run(create, {ALICE}));

  ProgramAccount account = ledger.account(address);
  ASSERT_EQ(ledger.ids.token, account.owner);
  ASSERT_EQ(svm::token_layout::ACCOUNT_LEN, account.data.size());
  ASSERT_EQ(ledger.rent_for(svm::token_layout::ACCOUNT_LEN), account.lamports);
  svm::TokenAccount token_account = unwrap(svm::TokenAccount::unpack(account.data));
  ASSERT_EQ(BOB, token_account.owner);
  ASSERT_EQ(MINT, token_account.mint);
  ASSERT_EQ(SOL - account.lamports, ledger.lamports(ALICE));

  ASSERT_TX_ERROR(ProgramError::AccountAlreadyInUse, ledger.run(create, {ALICE}));

  auto idempotent =
      SPLAssociatedTokenProgram::create(ledger.ids, ALICE, BOB, MINT, ledger.ids.token, true);
  ASSERT_SUCCESS(ledger.run(idempotent, {ALICE}));
  ASSERT_TRUE(account == ledger.account(address));
}

void test_associated_account_extended() {
  TestLedger ledger;
  ledger.fund(ALICE, SOL);
  ledger.put_mint(MINT, 6, ALICE, TokenStandard::Extended);
  const PublicKey address = ledger.ata(BOB, MINT, TokenStandard::Extended);

  ASSERT_SUCCESS(ledger.run(
      SPLAssociatedTokenProgram::create(ledger.ids, ALICE, BOB, MINT, ledger.ids.token_2022),
      {ALICE}));

  ProgramAccount account = ledger.account(address);
  ASSERT_EQ(ledger.ids.token_2022, account.owner);
  ASSERT_EQ(svm::token_layout::EXTENDED_ACCOUNT_LEN, account.data.size());
  ASSERT_EQ(svm::token_layout::ACCOUNT_TYPE_ACCOUNT, account.data[165]);
  ASSERT_EQ((std::vector<uint8_t>{0x07, 0x00, 0x00, 0x00}),
            std::vector<uint8_t>(account.data.begin() + 166, account.data.end()));
  ASSERT_EQ(static_cast<uint64_t>(0), ledger.token_balance(address));
}

void test_associated_account_prefunded() {
  TestLedger ledger;
  ledger.fund(ALICE, SOL);
  ledger.put_mint(MINT, 6, ALICE);
  const PublicKey address = ledger.ata(BOB, MINT);
  ledger.fund(address, 1000);

  ASSERT_SUCCESS(ledger.run(
      SPLAssociatedTokenProgram::create(ledger.ids, ALICE, BOB, MINT, ledger.ids.token), {ALICE}));
  ASSERT_EQ(ledger.rent_for(svm::token_layout::ACCOUNT_LEN), ledger.lamports(address));
  ASSERT_EQ(ledger.ids.token, ledger.account(address).owner);
}

void test_associated_account_wrong_address() {
  TestLedger ledger;
  ledger.fund(ALICE, SOL);
  ledger.put_mint(MINT, 6, ALICE);

  auto create = SPLAssociatedTokenProgram::create(ledger.ids, ALICE, BOB, MINT, ledger.ids.token);
  create.accounts[1].pubkey = ledger.ata(ALICE, MINT);
  ASSERT_TX_ERROR(ProgramError::InvalidSeeds, ledger.run(create, {ALICE}));

  // A legacy mint cannot back an account under the extended program
  auto mismatched =
      SPLAssociatedTokenProgram::create(ledger.ids, ALICE, BOB, MINT, ledger.ids.token_2022);
  ASSERT_TX_ERROR(ProgramError::IncorrectProgramId, ledger.run(mismatched, {ALICE}));
}

int main() {
  std::cout << "=== Token Programs Test Suite ===" << std::endl;
  TestRunner runner;

  runner.run_test("Initialize Mint Through System", test_initialize_mint_through_system);
  runner.run_test("Underfunded Mint Rejected", test_underfunded_mint_rejected);
  runner.run_test("Transfer Rules", test_transfer_rules);
  runner.run_test("Transfer Checks Token Program", test_transfer_checks_token_program);
  runner.run_test("Mint And Burn Supply", test_mint_and_burn_supply);
  runner.run_test("Close Account", test_close_account);
  runner.run_test("Associated Account Legacy", test_associated_account_legacy);
  runner.run_test("Associated Account Extended", test_associated_account_extended);
  runner.run_test("Associated Account Prefunded", test_associated_account_prefunded);
  runner.run_test("Associated Account Wrong Address", test_associated_account_wrong_address);

  runner.print_summary();
  return runner.all_passed() ? 0 : 1;
}
