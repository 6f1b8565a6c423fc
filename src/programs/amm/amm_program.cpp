#include "programs/amm/amm_program.h"
#include "common/base58.h"
#include "common/logging.h"
#include "programs/account_init.h"
#include "svm/token_program.h"

namespace pinion {
namespace programs {
namespace amm {

using svm::AccountMeta;
using svm::ProgramError;
using svm::ProgramSigner;

namespace {

constexpr size_t DEPOSIT_PAYLOAD_LEN = 32;
constexpr size_t WITHDRAW_PAYLOAD_LEN = 32;
constexpr size_t SWAP_PAYLOAD_LEN = 25;
constexpr size_t SET_STATE_PAYLOAD_LEN = 1;

namespace initialize_accounts {
    constexpr size_t INITIALIZER = 0, MINT_LP = 1, CONFIG = 2, MINT_X = 3, MINT_Y = 4, VAULT_X = 5,
                     VAULT_Y = 6, SYSTEM_PROGRAM = 7, TOKEN_PROGRAM = 8, COUNT = 9;
}

// Deposit and Withdraw share positions; Deposit adds the system program
namespace liquidity_accounts {
    constexpr size_t USER = 0, MINT_LP = 1, VAULT_X = 2, VAULT_Y = 3, USER_X = 4, USER_Y = 5,
                     USER_LP = 6, CONFIG = 7, TOKEN_PROGRAM = 8, SYSTEM_PROGRAM = 9;
    constexpr size_t DEPOSIT_COUNT = 10, WITHDRAW_COUNT = 9;
}

namespace swap_accounts {
    constexpr size_t USER = 0, USER_X = 1, USER_Y = 2, VAULT_X = 3, VAULT_Y = 4, CONFIG = 5,
                     TOKEN_PROGRAM = 6, COUNT = 7;
}

ProgramStatus check_mint_of(const AccountView& mint, const AccountView& token_program, const ProgramIds& ids) {
    RETURN_IF_ERROR(MintInterfaceCheck::check(mint, ids));
    return OwnerCheck::check(mint, token_program.address());
}

ProgramResult<uint64_t> token_balance(const AccountView& account) {
    auto token_account = read_token_account(account);
    RETURN_IF_ERROR(token_account);
    return token_account.value().amount;
}

ProgramResult<PublicKey> associated_address(const ProgramIds& ids,
                                            const PublicKey& wallet,
                                            const PublicKey& mint,
                                            const PublicKey& token_program) {
    auto derived = svm::find_associated_token_address(wallet, mint, token_program, ids.associated_token);
    RETURN_IF_ERROR(derived);
    return derived.value().first;
}

ProgramResult<ProgramSigner> config_signer(const Config& config, const PublicKey& program_id) {
    return ProgramSigner::create(Config::seeds(config.seed, config.mint_x, config.mint_y, config.config_bump),
                                 program_id);
}

} // namespace

AmmProgram::AmmProgram(const ProgramIds& ids) : ids_(ids) {}

PublicKey AmmProgram::get_program_id() const {
    return ids_.amm;
}

ProgramStatus AmmProgram::execute(
    std::vector<AccountView>& accounts,
    const std::vector<uint8_t>& data,
    ExecutionContext& context) const {

    ByteReader reader(data);
    uint8_t discriminator = 0;
    if (!reader.read_u8(discriminator)) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData, "missing discriminator");
    }

    ProgramStatus status;
    switch (static_cast<AmmInstruction>(discriminator)) {
        case AmmInstruction::Initialize:
            status = process_initialize(accounts, reader, context);
            break;
        case AmmInstruction::Deposit:
            status = process_deposit(accounts, reader, context);
            break;
        case AmmInstruction::Withdraw:
            status = process_withdraw(accounts, reader, context);
            break;
        case AmmInstruction::Swap:
            status = process_swap(accounts, reader, context);
            break;
        case AmmInstruction::SetState:
            status = process_set_state(accounts, reader, context);
            break;
        default:
            return ProgramStatus::fail(ProgramError::InvalidInstructionData,
                                       "unknown amm instruction " + std::to_string(discriminator));
    }

    if (status.is_err()) {
        LOG_PROGRAM_ERROR("amm", "Instruction failed", svm::program_error_to_string(status.error()),
                          {{"instruction", std::to_string(discriminator)}, {"detail", status.detail()}});
    }
    return status;
}

ProgramResult<Config> AmmProgram::load_config(const AccountView& config_account) const {
    RETURN_IF_ERROR(ProgramAccountCheck::check(config_account, ids_.amm, Config::LEN));
    auto config = Config::unpack(config_account.data());
    RETURN_IF_ERROR(config);

    const Config& record = config.value();
    auto expected = svm::create_program_address(
        Config::seeds(record.seed, record.mint_x, record.mint_y, record.config_bump), ids_.amm);
    if (expected.is_err() || expected.value() != config_account.address()) {
        return ProgramStatus::fail(ProgramError::InvalidAddress, "config does not match its stored seeds");
    }
    return config;
}

ProgramStatus AmmProgram::check_lp_mint(const AccountView& mint_lp,
                                        const AccountView& config,
                                        const AccountView& token_program) const {
    auto expected = svm::find_program_address(Config::lp_mint_seeds(config.address()), ids_.amm);
    RETURN_IF_ERROR(expected);
    if (expected.value().first != mint_lp.address()) {
        return ProgramStatus::fail(ProgramError::InvalidAddress, "LP mint address");
    }
    return check_mint_of(mint_lp, token_program, ids_);
}

ProgramStatus AmmProgram::check_not_expired(int64_t expiration, const ExecutionContext& context) const {
    if (context.clock().unix_timestamp > expiration) {
        return ProgramStatus::fail(ProgramError::Expired,
                                   "expired at " + std::to_string(expiration) + ", now " +
                                       std::to_string(context.clock().unix_timestamp));
    }
    return ProgramStatus::ok();
}

ProgramStatus AmmProgram::process_initialize(std::vector<AccountView>& accounts,
                                             ByteReader& reader,
                                             ExecutionContext& context) const {
    using namespace initialize_accounts;
    RETURN_IF_ERROR(require_accounts(accounts, COUNT, "Initialize"));

    const size_t payload_len = reader.remaining();
    if (payload_len != INITIALIZE_PAYLOAD_LEN && payload_len != INITIALIZE_WITH_AUTHORITY_PAYLOAD_LEN) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData,
                                   "Initialize payload of " + std::to_string(payload_len) + " bytes");
    }
    Config config;
    uint8_t lp_bump = 0;
    bool parsed = reader.read_u64(config.seed) &&
                  reader.read_u16(config.fee) &&
                  reader.read_pubkey(config.mint_x) &&
                  reader.read_pubkey(config.mint_y) &&
                  reader.read_u8(config.config_bump) &&
                  reader.read_u8(lp_bump);
    if (parsed && payload_len == INITIALIZE_WITH_AUTHORITY_PAYLOAD_LEN) {
        parsed = reader.read_pubkey(config.authority);
    }
    if (!parsed) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData, "Initialize payload");
    }

    AccountView& initializer = accounts[INITIALIZER];
    AccountView& mint_lp = accounts[MINT_LP];
    AccountView& config_account = accounts[CONFIG];
    const AccountView& mint_x = accounts[MINT_X];
    const AccountView& mint_y = accounts[MINT_Y];
    AccountView& vault_x = accounts[VAULT_X];
    AccountView& vault_y = accounts[VAULT_Y];
    const AccountView& token_program = accounts[TOKEN_PROGRAM];

    RETURN_IF_ERROR(SignerCheck::check(initializer));
    if (config.fee >= FEE_DENOMINATOR) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData,
                                   "fee " + std::to_string(config.fee) + " bps");
    }
    if (config.mint_x == config.mint_y) {
        return ProgramStatus::fail(ProgramError::InvalidArgument, "mint_x and mint_y are the same");
    }
    if (mint_x.address() != config.mint_x || mint_y.address() != config.mint_y) {
        return ProgramStatus::fail(ProgramError::InvalidAccountData, "mint accounts differ from payload");
    }
    RETURN_IF_ERROR(TokenProgramCheck::check(token_program, ids_));
    RETURN_IF_ERROR(check_mint_of(mint_x, token_program, ids_));
    RETURN_IF_ERROR(check_mint_of(mint_y, token_program, ids_));

    auto config_address = svm::create_program_address(
        Config::seeds(config.seed, config.mint_x, config.mint_y, config.config_bump), ids_.amm);
    if (config_address.is_err() || config_address.value() != config_account.address()) {
        return ProgramStatus::fail(ProgramError::InvalidAddress, "config address");
    }

    auto lp_address = svm::find_program_address(Config::lp_mint_seeds(config_account.address()), ids_.amm);
    RETURN_IF_ERROR(lp_address);
    if (lp_address.value().first != mint_lp.address() || lp_address.value().second != lp_bump) {
        return ProgramStatus::fail(ProgramError::InvalidAddress, "LP mint must use the canonical bump");
    }

    auto signer = config_signer(config, ids_.amm);
    RETURN_IF_ERROR(signer);
    RETURN_IF_ERROR(create_program_account(context, initializer, config_account, signer.value(), Config::LEN,
                                           ids_.amm, ids_));

    auto lp_signer = ProgramSigner::create(Config::lp_mint_seeds(config_account.address(), lp_bump), ids_.amm);
    RETURN_IF_ERROR(lp_signer);
    RETURN_IF_ERROR(init_mint(context, initializer, mint_lp, lp_signer.value(), LP_DECIMALS,
                              config_account.address(), token_program.address(), ids_));

    RETURN_IF_ERROR(init_ata_if_needed(context, initializer, vault_x, config_account.address(),
                                       config.mint_x, token_program.address(), ids_));
    RETURN_IF_ERROR(init_ata_if_needed(context, initializer, vault_y, config_account.address(),
                                       config.mint_y, token_program.address(), ids_));

    config.state = AmmState::Initialized;
    RETURN_IF_ERROR(config_account.write_data(0, config.pack()));

    context.log("Initialize: pool " + encode_base58(config_account.address()) + " fee " +
                std::to_string(config.fee) + " bps");
    return ProgramStatus::ok();
}

ProgramStatus AmmProgram::process_deposit(std::vector<AccountView>& accounts,
                                          ByteReader& reader,
                                          ExecutionContext& context) const {
    using namespace liquidity_accounts;
    RETURN_IF_ERROR(require_accounts(accounts, DEPOSIT_COUNT, "Deposit"));

    uint64_t amount = 0;
    uint64_t max_x = 0;
    uint64_t max_y = 0;
    int64_t expiration = 0;
    if (reader.remaining() != DEPOSIT_PAYLOAD_LEN || !reader.read_u64(amount) || !reader.read_u64(max_x) ||
        !reader.read_u64(max_y) || !reader.read_i64(expiration)) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData, "Deposit payload");
    }

    AccountView& user = accounts[USER];
    AccountView& mint_lp = accounts[MINT_LP];
    AccountView& vault_x = accounts[VAULT_X];
    AccountView& vault_y = accounts[VAULT_Y];
    AccountView& user_x = accounts[USER_X];
    AccountView& user_y = accounts[USER_Y];
    AccountView& user_lp = accounts[USER_LP];
    const AccountView& config_account = accounts[CONFIG];
    const AccountView& token_program = accounts[TOKEN_PROGRAM];

    RETURN_IF_ERROR(SignerCheck::check(user));
    auto loaded = load_config(config_account);
    RETURN_IF_ERROR(loaded);
    const Config& config = loaded.value();

    if (config.state != AmmState::Initialized) {
        return ProgramStatus::fail(ProgramError::InvalidState,
                                   std::string("pool is ") + amm_state_to_string(config.state));
    }
    RETURN_IF_ERROR(check_not_expired(expiration, context));
    if (amount == 0 || max_x == 0 || max_y == 0) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData, "zero deposit amount");
    }

    RETURN_IF_ERROR(TokenProgramCheck::check(token_program, ids_));
    RETURN_IF_ERROR(check_lp_mint(mint_lp, config_account, token_program));
    const PublicKey& token_program_id = token_program.address();
    RETURN_IF_ERROR(AssociatedTokenCheck::check(vault_x, config_account.address(), config.mint_x, token_program_id, ids_));
    RETURN_IF_ERROR(AssociatedTokenCheck::check(vault_y, config_account.address(), config.mint_y, token_program_id, ids_));
    RETURN_IF_ERROR(AssociatedTokenCheck::check(user_x, user.address(), config.mint_x, token_program_id, ids_));
    RETURN_IF_ERROR(AssociatedTokenCheck::check(user_y, user.address(), config.mint_y, token_program_id, ids_));

    auto reserve_x = token_balance(vault_x);
    RETURN_IF_ERROR(reserve_x);
    auto reserve_y = token_balance(vault_y);
    RETURN_IF_ERROR(reserve_y);
    auto lp_mint = read_mint(mint_lp);
    RETURN_IF_ERROR(lp_mint);
    const uint64_t supply = lp_mint.value().supply;

    XYAmounts deposit;
    if (supply == 0 && reserve_x.value() == 0 && reserve_y.value() == 0) {
        // First liquidity sets the price
        deposit.x = max_x;
        deposit.y = max_y;
    } else {
        auto computed = ConstantProductCurve::deposit_amounts(reserve_x.value(), reserve_y.value(), supply, amount);
        RETURN_IF_ERROR(computed);
        deposit = computed.value();
    }
    if (deposit.x > max_x || deposit.y > max_y) {
        return ProgramStatus::fail(ProgramError::SlippageExceeded,
                                   "deposit needs " + std::to_string(deposit.x) + "/" + std::to_string(deposit.y));
    }

    RETURN_IF_ERROR(context.invoke(svm::token_instruction::transfer(
        token_program_id, user_x.address(), vault_x.address(), user.address(), deposit.x)));
    RETURN_IF_ERROR(context.invoke(svm::token_instruction::transfer(
        token_program_id, user_y.address(), vault_y.address(), user.address(), deposit.y)));

    RETURN_IF_ERROR(init_ata_if_needed(context, user, user_lp, user.address(), mint_lp.address(),
                                       token_program_id, ids_));

    auto signer = config_signer(config, ids_.amm);
    RETURN_IF_ERROR(signer);
    RETURN_IF_ERROR(context.invoke(
        svm::token_instruction::mint_to(token_program_id, mint_lp.address(), user_lp.address(),
                                        config_account.address(), amount),
        {signer.value()}));

    context.log("Deposit: " + std::to_string(deposit.x) + " x, " + std::to_string(deposit.y) + " y for " +
                std::to_string(amount) + " LP");
    return ProgramStatus::ok();
}

ProgramStatus AmmProgram::process_withdraw(std::vector<AccountView>& accounts,
                                           ByteReader& reader,
                                           ExecutionContext& context) const {
    using namespace liquidity_accounts;
    RETURN_IF_ERROR(require_accounts(accounts, WITHDRAW_COUNT, "Withdraw"));

    uint64_t amount = 0;
    uint64_t min_x = 0;
    uint64_t min_y = 0;
    int64_t expiration = 0;
    if (reader.remaining() != WITHDRAW_PAYLOAD_LEN || !reader.read_u64(amount) || !reader.read_u64(min_x) ||
        !reader.read_u64(min_y) || !reader.read_i64(expiration)) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData, "Withdraw payload");
    }

    AccountView& user = accounts[USER];
    AccountView& mint_lp = accounts[MINT_LP];
    AccountView& vault_x = accounts[VAULT_X];
    AccountView& vault_y = accounts[VAULT_Y];
    AccountView& user_x = accounts[USER_X];
    AccountView& user_y = accounts[USER_Y];
    AccountView& user_lp = accounts[USER_LP];
    const AccountView& config_account = accounts[CONFIG];
    const AccountView& token_program = accounts[TOKEN_PROGRAM];

    RETURN_IF_ERROR(SignerCheck::check(user));
    auto loaded = load_config(config_account);
    RETURN_IF_ERROR(loaded);
    const Config& config = loaded.value();

    if (config.state == AmmState::Disabled || config.state == AmmState::Uninitialized) {
        return ProgramStatus::fail(ProgramError::InvalidState,
                                   std::string("pool is ") + amm_state_to_string(config.state));
    }
    RETURN_IF_ERROR(check_not_expired(expiration, context));
    if (amount == 0) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData, "zero withdraw amount");
    }

    RETURN_IF_ERROR(TokenProgramCheck::check(token_program, ids_));
    RETURN_IF_ERROR(check_lp_mint(mint_lp, config_account, token_program));
    const PublicKey& token_program_id = token_program.address();
    RETURN_IF_ERROR(AssociatedTokenCheck::check(vault_x, config_account.address(), config.mint_x, token_program_id, ids_));
    RETURN_IF_ERROR(AssociatedTokenCheck::check(vault_y, config_account.address(), config.mint_y, token_program_id, ids_));
    RETURN_IF_ERROR(AssociatedTokenCheck::check(user_x, user.address(), config.mint_x, token_program_id, ids_));
    RETURN_IF_ERROR(AssociatedTokenCheck::check(user_y, user.address(), config.mint_y, token_program_id, ids_));
    RETURN_IF_ERROR(AssociatedTokenCheck::check(user_lp, user.address(), mint_lp.address(), token_program_id, ids_));

    auto reserve_x = token_balance(vault_x);
    RETURN_IF_ERROR(reserve_x);
    auto reserve_y = token_balance(vault_y);
    RETURN_IF_ERROR(reserve_y);
    auto lp_mint = read_mint(mint_lp);
    RETURN_IF_ERROR(lp_mint);

    auto computed = ConstantProductCurve::withdraw_amounts(reserve_x.value(), reserve_y.value(),
                                                           lp_mint.value().supply, amount);
    RETURN_IF_ERROR(computed);
    const XYAmounts& withdrawal = computed.value();
    if (withdrawal.x < min_x || withdrawal.y < min_y) {
        return ProgramStatus::fail(ProgramError::SlippageExceeded,
                                   "withdraw yields " + std::to_string(withdrawal.x) + "/" +
                                       std::to_string(withdrawal.y));
    }

    auto signer = config_signer(config, ids_.amm);
    RETURN_IF_ERROR(signer);
    RETURN_IF_ERROR(context.invoke(
        svm::token_instruction::transfer(token_program_id, vault_x.address(), user_x.address(),
                                         config_account.address(), withdrawal.x),
        {signer.value()}));
    RETURN_IF_ERROR(context.invoke(
        svm::token_instruction::transfer(token_program_id, vault_y.address(), user_y.address(),
                                         config_account.address(), withdrawal.y),
        {signer.value()}));
    RETURN_IF_ERROR(context.invoke(svm::token_instruction::burn(
        token_program_id, user_lp.address(), mint_lp.address(), user.address(), amount)));

    context.log("Withdraw: " + std::to_string(withdrawal.x) + " x, " + std::to_string(withdrawal.y) +
                " y for " + std::to_string(amount) + " LP");
    return ProgramStatus::ok();
}

ProgramStatus AmmProgram::process_swap(std::vector<AccountView>& accounts,
                                       ByteReader& reader,
                                       ExecutionContext& context) const {
    using namespace swap_accounts;
    RETURN_IF_ERROR(require_accounts(accounts, COUNT, "Swap"));

    uint8_t is_x_byte = 0;
    uint64_t amount = 0;
    uint64_t min = 0;
    int64_t expiration = 0;
    if (reader.remaining() != SWAP_PAYLOAD_LEN || !reader.read_u8(is_x_byte) || !reader.read_u64(amount) ||
        !reader.read_u64(min) || !reader.read_i64(expiration) || is_x_byte > 1) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData, "Swap payload");
    }
    const bool is_x = is_x_byte == 1;

    AccountView& user = accounts[USER];
    AccountView& user_x = accounts[USER_X];
    AccountView& user_y = accounts[USER_Y];
    AccountView& vault_x = accounts[VAULT_X];
    AccountView& vault_y = accounts[VAULT_Y];
    const AccountView& config_account = accounts[CONFIG];
    const AccountView& token_program = accounts[TOKEN_PROGRAM];

    RETURN_IF_ERROR(SignerCheck::check(user));
    auto loaded = load_config(config_account);
    RETURN_IF_ERROR(loaded);
    const Config& config = loaded.value();

    if (config.state != AmmState::Initialized) {
        return ProgramStatus::fail(ProgramError::InvalidState,
                                   std::string("pool is ") + amm_state_to_string(config.state));
    }
    RETURN_IF_ERROR(check_not_expired(expiration, context));

    RETURN_IF_ERROR(TokenProgramCheck::check(token_program, ids_));
    const PublicKey& token_program_id = token_program.address();
    RETURN_IF_ERROR(AssociatedTokenCheck::check(vault_x, config_account.address(), config.mint_x, token_program_id, ids_));
    RETURN_IF_ERROR(AssociatedTokenCheck::check(vault_y, config_account.address(), config.mint_y, token_program_id, ids_));
    RETURN_IF_ERROR(AssociatedTokenCheck::check(user_x, user.address(), config.mint_x, token_program_id, ids_));
    RETURN_IF_ERROR(AssociatedTokenCheck::check(user_y, user.address(), config.mint_y, token_program_id, ids_));

    auto reserve_x = token_balance(vault_x);
    RETURN_IF_ERROR(reserve_x);
    auto reserve_y = token_balance(vault_y);
    RETURN_IF_ERROR(reserve_y);

    const uint64_t reserve_in = is_x ? reserve_x.value() : reserve_y.value();
    const uint64_t reserve_out = is_x ? reserve_y.value() : reserve_x.value();
    auto out = ConstantProductCurve::swap_output(reserve_in, reserve_out, amount, config.fee);
    RETURN_IF_ERROR(out);
    if (out.value() == 0) {
        return ProgramStatus::fail(ProgramError::ZeroAmount, "swap output rounds to zero");
    }
    if (out.value() < min) {
        return ProgramStatus::fail(ProgramError::SlippageExceeded,
                                   "output " + std::to_string(out.value()) + " below " + std::to_string(min));
    }

    AccountView& user_in = is_x ? user_x : user_y;
    AccountView& user_out = is_x ? user_y : user_x;
    AccountView& vault_in = is_x ? vault_x : vault_y;
    AccountView& vault_out = is_x ? vault_y : vault_x;

    RETURN_IF_ERROR(context.invoke(svm::token_instruction::transfer(
        token_program_id, user_in.address(), vault_in.address(), user.address(), amount)));

    auto signer = config_signer(config, ids_.amm);
    RETURN_IF_ERROR(signer);
    RETURN_IF_ERROR(context.invoke(
        svm::token_instruction::transfer(token_program_id, vault_out.address(), user_out.address(),
                                         config_account.address(), out.value()),
        {signer.value()}));

    context.log("Swap: " + std::to_string(amount) + (is_x ? " x" : " y") + " for " +
                std::to_string(out.value()));
    return ProgramStatus::ok();
}

ProgramStatus AmmProgram::process_set_state(std::vector<AccountView>& accounts,
                                            ByteReader& reader,
                                            ExecutionContext& context) const {
    RETURN_IF_ERROR(require_accounts(accounts, 2, "SetState"));

    uint8_t target = 0;
    if (reader.remaining() != SET_STATE_PAYLOAD_LEN || !reader.read_u8(target)) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData, "SetState payload");
    }

    const AccountView& authority = accounts[0];
    AccountView& config_account = accounts[1];

    RETURN_IF_ERROR(SignerCheck::check(authority));
    auto loaded = load_config(config_account);
    RETURN_IF_ERROR(loaded);
    Config config = loaded.value();

    if (!config.has_authority()) {
        return ProgramStatus::fail(ProgramError::InvalidState, "pool has no authority");
    }
    if (config.authority != authority.address()) {
        return ProgramStatus::fail(ProgramError::InvalidAccountData, "signer is not the pool authority");
    }
    if (target < static_cast<uint8_t>(AmmState::Initialized) ||
        target > static_cast<uint8_t>(AmmState::WithdrawOnly)) {
        return ProgramStatus::fail(ProgramError::InvalidInstructionData,
                                   "target state " + std::to_string(target));
    }

    const AmmState previous = config.state;
    config.state = static_cast<AmmState>(target);
    RETURN_IF_ERROR(config_account.write_data(0, config.pack()));

    context.log(std::string("SetState: ") + amm_state_to_string(previous) + " -> " +
                amm_state_to_string(config.state));
    return ProgramStatus::ok();
}

ProgramResult<AmmProgram::PoolAddresses> AmmProgram::derive_pool(const ProgramIds& ids,
                                                                 uint64_t seed,
                                                                 const PublicKey& mint_x,
                                                                 const PublicKey& mint_y,
                                                                 const PublicKey& token_program) {
    PoolAddresses pool;
    auto config = svm::find_program_address(Config::seeds(seed, mint_x, mint_y), ids.amm);
    RETURN_IF_ERROR(config);
    pool.config = config.value().first;
    pool.config_bump = config.value().second;

    auto mint_lp = svm::find_program_address(Config::lp_mint_seeds(pool.config), ids.amm);
    RETURN_IF_ERROR(mint_lp);
    pool.mint_lp = mint_lp.value().first;
    pool.lp_bump = mint_lp.value().second;

    auto vault_x = associated_address(ids, pool.config, mint_x, token_program);
    RETURN_IF_ERROR(vault_x);
    pool.vault_x = vault_x.value();
    auto vault_y = associated_address(ids, pool.config, mint_y, token_program);
    RETURN_IF_ERROR(vault_y);
    pool.vault_y = vault_y.value();
    return pool;
}

ProgramResult<Instruction> AmmProgram::initialize(const ProgramIds& ids,
                                                  const PublicKey& initializer,
                                                  const PublicKey& token_program,
                                                  uint64_t seed,
                                                  uint16_t fee,
                                                  const PublicKey& mint_x,
                                                  const PublicKey& mint_y,
                                                  const std::optional<PublicKey>& authority) {
    auto pool = derive_pool(ids, seed, mint_x, mint_y, token_program);
    RETURN_IF_ERROR(pool);
    const PoolAddresses& addresses = pool.value();

    ByteWriter writer(1 + INITIALIZE_WITH_AUTHORITY_PAYLOAD_LEN);
    writer.write_u8(static_cast<uint8_t>(AmmInstruction::Initialize))
          .write_u64(seed)
          .write_u16(fee)
          .write_pubkey(mint_x)
          .write_pubkey(mint_y)
          .write_u8(addresses.config_bump)
          .write_u8(addresses.lp_bump);
    if (authority) {
        writer.write_pubkey(*authority);
    }

    return Instruction{
        ids.amm,
        {AccountMeta::writable(initializer, true),
         AccountMeta::writable(addresses.mint_lp),
         AccountMeta::writable(addresses.config),
         AccountMeta::readonly(mint_x),
         AccountMeta::readonly(mint_y),
         AccountMeta::writable(addresses.vault_x),
         AccountMeta::writable(addresses.vault_y),
         AccountMeta::readonly(ids.system),
         AccountMeta::readonly(token_program)},
        writer.take()};
}

namespace {

ProgramResult<std::vector<AccountMeta>> liquidity_metas(const ProgramIds& ids,
                                                        const PublicKey& user,
                                                        const AmmProgram::PoolAddresses& pool,
                                                        const PublicKey& mint_x,
                                                        const PublicKey& mint_y,
                                                        const PublicKey& token_program) {
    auto user_x = associated_address(ids, user, mint_x, token_program);
    RETURN_IF_ERROR(user_x);
    auto user_y = associated_address(ids, user, mint_y, token_program);
    RETURN_IF_ERROR(user_y);
    auto user_lp = associated_address(ids, user, pool.mint_lp, token_program);
    RETURN_IF_ERROR(user_lp);
    return std::vector<AccountMeta>{
        AccountMeta::writable(user, true),
        AccountMeta::writable(pool.mint_lp),
        AccountMeta::writable(pool.vault_x),
        AccountMeta::writable(pool.vault_y),
        AccountMeta::writable(user_x.value()),
        AccountMeta::writable(user_y.value()),
        AccountMeta::writable(user_lp.value()),
        AccountMeta::readonly(pool.config),
        AccountMeta::readonly(token_program)};
}

ProgramResult<Instruction> liquidity_instruction(const ProgramIds& ids,
                                                 AmmProgram::AmmInstruction kind,
                                                 const PublicKey& user,
                                                 const AmmProgram::PoolAddresses& pool,
                                                 const PublicKey& mint_x,
                                                 const PublicKey& mint_y,
                                                 const PublicKey& token_program,
                                                 uint64_t amount,
                                                 uint64_t limit_x,
                                                 uint64_t limit_y,
                                                 int64_t expiration) {
    auto metas = liquidity_metas(ids, user, pool, mint_x, mint_y, token_program);
    RETURN_IF_ERROR(metas);
    std::vector<AccountMeta> accounts = metas.value();
    if (kind == AmmProgram::AmmInstruction::Deposit) {
        accounts.push_back(AccountMeta::readonly(ids.system));
    }

    ByteWriter writer(33);
    writer.write_u8(static_cast<uint8_t>(kind))
          .write_u64(amount)
          .write_u64(limit_x)
          .write_u64(limit_y)
          .write_i64(expiration);
    return Instruction{ids.amm, std::move(accounts), writer.take()};
}

} // namespace

ProgramResult<Instruction> AmmProgram::deposit(const ProgramIds& ids,
                                               const PublicKey& user,
                                               const PoolAddresses& pool,
                                               const PublicKey& mint_x,
                                               const PublicKey& mint_y,
                                               const PublicKey& token_program,
                                               uint64_t amount,
                                               uint64_t max_x,
                                               uint64_t max_y,
                                               int64_t expiration) {
    return liquidity_instruction(ids, AmmInstruction::Deposit, user, pool, mint_x, mint_y, token_program,
                                 amount, max_x, max_y, expiration);
}

ProgramResult<Instruction> AmmProgram::withdraw(const ProgramIds& ids,
                                                const PublicKey& user,
                                                const PoolAddresses& pool,
                                                const PublicKey& mint_x,
                                                const PublicKey& mint_y,
                                                const PublicKey& token_program,
                                                uint64_t amount,
                                                uint64_t min_x,
                                                uint64_t min_y,
                                                int64_t expiration) {
    return liquidity_instruction(ids, AmmInstruction::Withdraw, user, pool, mint_x, mint_y, token_program,
                                 amount, min_x, min_y, expiration);
}

ProgramResult<Instruction> AmmProgram::swap(const ProgramIds& ids,
                                            const PublicKey& user,
                                            const PoolAddresses& pool,
                                            const PublicKey& mint_x,
                                            const PublicKey& mint_y,
                                            const PublicKey& token_program,
                                            bool is_x,
                                            uint64_t amount,
                                            uint64_t min,
                                            int64_t expiration) {
    auto user_x = associated_address(ids, user, mint_x, token_program);
    RETURN_IF_ERROR(user_x);
    auto user_y = associated_address(ids, user, mint_y, token_program);
    RETURN_IF_ERROR(user_y);

    ByteWriter writer(1 + SWAP_PAYLOAD_LEN);
    writer.write_u8(static_cast<uint8_t>(AmmInstruction::Swap))
          .write_bool(is_x)
          .write_u64(amount)
          .write_u64(min)
          .write_i64(expiration);
    return Instruction{
        ids.amm,
        {AccountMeta::writable(user, true),
         AccountMeta::writable(user_x.value()),
         AccountMeta::writable(user_y.value()),
         AccountMeta::writable(pool.vault_x),
         AccountMeta::writable(pool.vault_y),
         AccountMeta::readonly(pool.config),
         AccountMeta::readonly(token_program)},
        writer.take()};
}

Instruction AmmProgram::set_state(const ProgramIds& ids,
                                  const PublicKey& authority,
                                  const PublicKey& config,
                                  AmmState state) {
    return Instruction{
        ids.amm,
        {AccountMeta::readonly(authority, true), AccountMeta::writable(config)},
        {static_cast<uint8_t>(AmmInstruction::SetState), static_cast<uint8_t>(state)}};
}

} // namespace amm
} // namespace programs
} // namespace pinion
