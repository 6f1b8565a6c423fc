#include "common/base58.h"
#include "programs/amm/amm_state.h"
#include "programs/escrow/escrow_state.h"
#include "programs/vault/vault_program.h"
#include "svm/program_address.h"
#include "svm/rent_calculator.h"
#include "test_framework.h"

using namespace pinion;
using namespace pinion::common;
using pinion::svm::ProgramError;

namespace {

PublicKey program_id(const std::string &base58) {
  return decode_pubkey(base58).value();
}

const std::string VAULT_PROGRAM = "44444444444444444444444444444444444444444444";
const std::string ESCROW_PROGRAM = "22222222222222222222222222222222222222222222";
const std::string AMM_PROGRAM = "33333333333333333333333333333333333333333333";

} // namespace

void test_sha256_concat() {
  // SHA-256("abc"), fed as two chunks
  auto digest = svm::sha256_concat({{'a'}, {'b', 'c'}});
  ASSERT_EQ(std::string("0xba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"),
            vector_to_hex_string(digest));
}

void test_curve_points() {
  // Ed25519 base point and identity
  PublicKey base_point(32, 0x66);
  base_point[0] = 0x58;
  ASSERT_TRUE(svm::is_on_curve(base_point));

  PublicKey identity(32, 0x00);
  identity[0] = 0x01;
  ASSERT_TRUE(svm::is_on_curve(identity));

  ASSERT_FALSE(svm::is_on_curve(PublicKey(31, 0x01)));
}

void test_find_matches_create() {
  const PublicKey vault_program = program_id(VAULT_PROGRAM);
  svm::Seeds seeds{svm::seed_bytes("vault"), PublicKey(32, 0x0a)};

  auto found = svm::find_program_address(seeds, vault_program);
  ASSERT_TRUE(found.is_ok());
  ASSERT_FALSE(svm::is_on_curve(found.value().first));

  seeds.push_back({found.value().second});
  auto created = svm::create_program_address(seeds, vault_program);
  ASSERT_TRUE(created.is_ok());
  ASSERT_EQ(found.value().first, created.value());
}

void test_derivation_vectors() {
  const PublicKey owner(32, 0x0a);

  auto vault = svm::find_program_address(programs::vault::VaultProgram::seeds(owner),
                                         program_id(VAULT_PROGRAM));
  ASSERT_TRUE(vault.is_ok());
  ASSERT_EQ(std::string("J1Y9atELcN2Z2xoLb5MuprR4kAmsdiG6hMnXqU9ZHnQS"),
            encode_base58(vault.value().first));
  ASSERT_EQ(255, static_cast<int>(vault.value().second));

  auto escrow = svm::find_program_address(programs::escrow::Escrow::seeds(owner, 42),
                                          program_id(ESCROW_PROGRAM));
  ASSERT_TRUE(escrow.is_ok());
  ASSERT_EQ(std::string("3FHNZ4x78VjmHkCK33cndTQST7Np67AfuFkG3CXvWFe5"),
            encode_base58(escrow.value().first));

  // Neither of these has an off-curve address at bump 255
  auto config = svm::find_program_address(
      programs::amm::Config::seeds(1, PublicKey(32, 0x21), PublicKey(32, 0x22)),
      program_id(AMM_PROGRAM));
  ASSERT_TRUE(config.is_ok());
  ASSERT_EQ(std::string("8cUMC4AXXyMxbdNrQge97cgN8Whez9baDKcogC14LwJe"),
            encode_base58(config.value().first));
  ASSERT_EQ(254, static_cast<int>(config.value().second));

  auto lp_mint = svm::find_program_address(
      programs::amm::Config::lp_mint_seeds(config.value().first), program_id(AMM_PROGRAM));
  ASSERT_TRUE(lp_mint.is_ok());
  ASSERT_EQ(std::string("5uopVYFihNsfnq9DdyXLkq7uzWHE2Ckydpt8Rz4mHpTs"),
            encode_base58(lp_mint.value().first));
  ASSERT_EQ(253, static_cast<int>(lp_mint.value().second));
}

void test_associated_token_address() {
  auto ata = svm::find_associated_token_address(
      PublicKey(32, 0x0a), PublicKey(32, 0x21),
      program_id("TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA"),
      program_id("ATokenGPvbdGVxr1b2hvZbsiqW5xWH25efTNsLJA8knL"));
  ASSERT_TRUE(ata.is_ok());
  ASSERT_EQ(std::string("9BREsCNP1sWqEBet2pZRmjvdcrhYkKpLXLvw7Gi4HkPW"),
            encode_base58(ata.value().first));
  ASSERT_EQ(253, static_cast<int>(ata.value().second));

  auto extended = svm::find_associated_token_address(
      PublicKey(32, 0x0a), PublicKey(32, 0x21),
      program_id("TokenzQdBNbLqP5VEhdkAS6EPFLC1PHnBqCXEpPxuEb"),
      program_id("ATokenGPvbdGVxr1b2hvZbsiqW5xWH25efTNsLJA8knL"));
  ASSERT_TRUE(extended.is_ok());
  ASSERT_NE(ata.value().first, extended.value().first);
}

void test_seed_limits() {
  const PublicKey vault_program = program_id(VAULT_PROGRAM);

  svm::Seeds long_seed{std::vector<uint8_t>(33, 0x01)};
  auto too_long = svm::find_program_address(long_seed, vault_program);
  ASSERT_TRUE(too_long.is_err());
  ASSERT_EQ(ProgramError::InvalidSeeds, too_long.error());

  svm::Seeds exact_seed{std::vector<uint8_t>(32, 0x01)};
  ASSERT_TRUE(svm::find_program_address(exact_seed, vault_program).is_ok());

  // Sixteen seeds leave no room for the bump
  svm::Seeds many(16, std::vector<uint8_t>{0x01});
  ASSERT_EQ(ProgramError::InvalidSeeds, svm::find_program_address(many, vault_program).error());
  svm::Seeds too_many(17, std::vector<uint8_t>{0x01});
  ASSERT_EQ(ProgramError::InvalidSeeds, svm::create_program_address(too_many, vault_program).error());
}

void test_program_signer() {
  const PublicKey escrow_program = program_id(ESCROW_PROGRAM);
  const PublicKey maker(32, 0x0a);

  auto derived = svm::find_program_address(programs::escrow::Escrow::seeds(maker, 42), escrow_program);
  ASSERT_TRUE(derived.is_ok());

  auto signer = svm::ProgramSigner::create(
      programs::escrow::Escrow::seeds(maker, 42, derived.value().second), escrow_program);
  ASSERT_TRUE(signer.is_ok());
  ASSERT_EQ(derived.value().first, signer.value().address());
  ASSERT_EQ(escrow_program, signer.value().program_id());

  // The canonical config bump is 254, so bump 255 hashes onto the curve
  auto on_curve = svm::ProgramSigner::create(
      programs::amm::Config::seeds(1, PublicKey(32, 0x21), PublicKey(32, 0x22), 255),
      program_id(AMM_PROGRAM));
  ASSERT_TRUE(on_curve.is_err());
  ASSERT_EQ(ProgramError::InvalidSeeds, on_curve.error());
}

void test_rent_minimums() {
  svm::RentCalculator rent;
  ASSERT_EQ(static_cast<Lamports>(890880), rent.minimum_balance(0));
  ASSERT_EQ(static_cast<Lamports>(1461600), rent.minimum_balance(82));
  ASSERT_EQ(static_cast<Lamports>(2039280), rent.minimum_balance(165));
  ASSERT_TRUE(rent.is_rent_exempt(2039280, 165));
  ASSERT_FALSE(rent.is_rent_exempt(2039279, 165));

  svm::RentCalculator doubled(svm::RentCalculator::RentConfig(6960, 2.0));
  ASSERT_EQ(static_cast<Lamports>(2 * 890880), doubled.minimum_balance(0));
}

int main() {
  std::cout << "=== Program Address Test Suite ===" << std::endl;
  TestRunner runner;

  runner.run_test("SHA-256 Concat", test_sha256_concat);
  runner.run_test("Curve Points", test_curve_points);
  runner.run_test("Find Matches Create", test_find_matches_create);
  runner.run_test("Derivation Vectors", test_derivation_vectors);
  runner.run_test("Associated Token Address", test_associated_token_address);
  runner.run_test("Seed Limits", test_seed_limits);
  runner.run_test("Program Signer", test_program_signer);
  runner.run_test("Rent Minimums", test_rent_minimums);

  runner.print_summary();
  return runner.all_passed() ? 0 : 1;
}
