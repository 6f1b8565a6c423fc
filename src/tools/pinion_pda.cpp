#include "common/base58.h"
#include "common/config.h"
#include "programs/amm/amm_state.h"
#include "programs/escrow/escrow_state.h"
#include "programs/vault/vault_program.h"
#include "svm/program_address.h"
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace pinion;
using namespace pinion::common;

namespace {

void print_usage() {
    std::cout << "Pinion derived address tool\n";
    std::cout << "Usage: pinion-pda [--config FILE] <command> [args]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  escrow <maker> <seed>               Escrow record of a maker\n";
    std::cout << "  config <seed> <mint_x> <mint_y>     AMM pool config\n";
    std::cout << "  lp-mint <config>                    LP mint of an AMM pool\n";
    std::cout << "  ata <wallet> <mint> [--token-2022]  Associated token account\n";
    std::cout << "  vault <owner>                       Lamport vault of an owner\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <path>  JSON configuration with the program ids\n";
    std::cout << "  --help           Show this help message\n";
}

bool parse_seed(const std::string& text, uint64_t& seed) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') {
        return false;
    }
    seed = static_cast<uint64_t>(value);
    return true;
}

bool parse_key(const std::string& text, PublicKey& key) {
    auto decoded = decode_pubkey(text);
    if (decoded.is_err()) {
        std::cerr << "Invalid address '" << text << "': " << decoded.error() << std::endl;
        return false;
    }
    key = decoded.value();
    return true;
}

int print_address(const svm::ProgramResult<std::pair<PublicKey, uint8_t>>& derived) {
    if (derived.is_err()) {
        std::cerr << "Derivation failed: " << derived.status().to_string() << std::endl;
        return 1;
    }
    std::cout << encode_base58(derived.value().first) << " " << static_cast<int>(derived.value().second)
              << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    bool token_2022 = false;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "--config requires a file path\n";
                return 1;
            }
            config_path = argv[++i];
        } else if (arg == "--token-2022") {
            token_2022 = true;
        } else if (arg == "--help") {
            print_usage();
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        print_usage();
        return 1;
    }

    RuntimeConfig config = ConfigManager::create_default();
    if (!config_path.empty()) {
        auto loaded = ConfigManager::load_from_file(config_path);
        if (!loaded) {
            std::cerr << "Failed to load configuration from " << config_path << std::endl;
            return 1;
        }
        config = *loaded;
    }
    const std::string problem = ConfigManager::validate_config(config);
    if (!problem.empty()) {
        std::cerr << "Invalid configuration: " << problem << std::endl;
        return 1;
    }
    ConfigManager::apply_logging(config);

    auto ids = ConfigManager::resolve_program_ids(config);
    if (ids.is_err()) {
        std::cerr << "Invalid program ids: " << ids.error() << std::endl;
        return 1;
    }
    const ProgramIds& program_ids = ids.value();

    const std::string& command = args[0];
    if (command == "escrow" && args.size() == 3) {
        PublicKey maker;
        uint64_t seed = 0;
        if (!parse_key(args[1], maker)) return 1;
        if (!parse_seed(args[2], seed)) {
            std::cerr << "Invalid seed '" << args[2] << "'\n";
            return 1;
        }
        return print_address(svm::find_program_address(
            programs::escrow::Escrow::seeds(maker, seed), program_ids.escrow));

    } else if (command == "config" && args.size() == 4) {
        uint64_t seed = 0;
        PublicKey mint_x;
        PublicKey mint_y;
        if (!parse_seed(args[1], seed)) {
            std::cerr << "Invalid seed '" << args[1] << "'\n";
            return 1;
        }
        if (!parse_key(args[2], mint_x) || !parse_key(args[3], mint_y)) return 1;
        return print_address(svm::find_program_address(
            programs::amm::Config::seeds(seed, mint_x, mint_y), program_ids.amm));

    } else if (command == "lp-mint" && args.size() == 2) {
        PublicKey config_address;
        if (!parse_key(args[1], config_address)) return 1;
        return print_address(svm::find_program_address(
            programs::amm::Config::lp_mint_seeds(config_address), program_ids.amm));

    } else if (command == "ata" && args.size() == 3) {
        PublicKey wallet;
        PublicKey mint;
        if (!parse_key(args[1], wallet) || !parse_key(args[2], mint)) return 1;
        const PublicKey& token_program = token_2022 ? program_ids.token_2022 : program_ids.token;
        return print_address(svm::find_associated_token_address(
            wallet, mint, token_program, program_ids.associated_token));

    } else if (command == "vault" && args.size() == 2) {
        PublicKey owner;
        if (!parse_key(args[1], owner)) return 1;
        return print_address(programs::vault::VaultProgram::derive(program_ids, owner));
    }

    std::cerr << "Unknown command or wrong number of arguments: " << command << "\n\n";
    print_usage();
    return 1;
}
