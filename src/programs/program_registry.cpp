#include "programs/program_registry.h"
#include "common/logging.h"
#include "programs/amm/amm_program.h"
#include "programs/escrow/escrow_program.h"
#include "programs/vault/vault_program.h"
#include "svm/rent_calculator.h"
#include "svm/spl_programs.h"
#include "svm/system_program.h"
#include "svm/token_program.h"

namespace pinion {
namespace programs {

void register_all_programs(svm::ExecutionEngine& engine, const common::ProgramIds& ids) {
    engine.register_builtin_program(std::make_unique<svm::SystemProgram>(ids.system));
    engine.register_builtin_program(
        std::make_unique<svm::TokenProgram>(ids.token, svm::TokenStandard::Legacy));
    engine.register_builtin_program(
        std::make_unique<svm::TokenProgram>(ids.token_2022, svm::TokenStandard::Extended));
    engine.register_builtin_program(std::make_unique<svm::SPLAssociatedTokenProgram>(ids));

    engine.register_builtin_program(std::make_unique<escrow::EscrowProgram>(ids));
    engine.register_builtin_program(std::make_unique<amm::AmmProgram>(ids));
    engine.register_builtin_program(std::make_unique<vault::VaultProgram>(ids));

    LOG_DEBUG("registry", "Registered 7 builtin programs");
}

void configure_engine(svm::ExecutionEngine& engine,
                      const common::RuntimeConfig& config,
                      const common::ProgramIds& ids) {
    engine.set_rent(svm::RentCalculator(svm::RentCalculator::RentConfig(
        config.rent.lamports_per_byte_year, config.rent.exemption_threshold)));
    engine.set_compute_budget(config.runtime.max_compute_units);
    engine.set_compute_units_per_instruction(config.runtime.compute_units_per_instruction);
    engine.set_max_invoke_depth(config.runtime.max_invoke_depth);
    engine.set_system_program_id(ids.system);
}

common::Result<std::shared_ptr<svm::ExecutionEngine>> create_engine(const common::RuntimeConfig& config) {
    auto validation = common::ConfigManager::validate(config);
    if (!validation.is_valid()) {
        LOG_CONFIG_ERROR("Rejected runtime configuration", "CONFIG_INVALID",
                         {{"field", validation.field_path}, {"reason", validation.message}});
        return common::Result<std::shared_ptr<svm::ExecutionEngine>>(validation.message);
    }
    common::ConfigManager::apply_logging(config);

    auto ids = common::ConfigManager::resolve_program_ids(config);
    if (ids.is_err()) {
        LOG_CONFIG_ERROR("Cannot resolve program ids", "CONFIG_PROGRAM_IDS", {{"reason", ids.error()}});
        return common::Result<std::shared_ptr<svm::ExecutionEngine>>(ids.error());
    }

    auto engine = std::make_shared<svm::ExecutionEngine>();
    configure_engine(*engine, config, ids.value());
    register_all_programs(*engine, ids.value());
    return common::Result<std::shared_ptr<svm::ExecutionEngine>>(engine);
}

} // namespace programs
} // namespace pinion
