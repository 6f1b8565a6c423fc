#pragma once

#include "common/config.h"
#include "svm/engine.h"

namespace pinion {
namespace programs {

/**
 * Register the host programs (system, both token programs, associated
 * token) and the application programs (escrow, AMM, vault) under the ids
 * in ids.
 */
void register_all_programs(svm::ExecutionEngine& engine, const common::ProgramIds& ids);

/// Apply rent, compute limits and the system program id from the configuration
void configure_engine(svm::ExecutionEngine& engine,
                      const common::RuntimeConfig& config,
                      const common::ProgramIds& ids);

/**
 * Validate config, apply its logging section, then configure and populate
 * a new engine under the resolved program ids. Fails with the validation
 * message of the first offending field.
 */
common::Result<std::shared_ptr<svm::ExecutionEngine>> create_engine(const common::RuntimeConfig& config);

} // namespace programs
} // namespace pinion
