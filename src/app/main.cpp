/**
 * @file main.cpp
 * @brief flex_resolver command-line entry point.
 *
 * Wires the resolver against an inventory file:
 *   Config → Logger → InMemoryComputeClient → FlexScaleSetResolver → command
 */

#include "cloud/inventory_file.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "resolver/flex_resolver.hpp"
#include "telemetry/json_sink.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace flex_resolver;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitNotFound = 2;

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::filesystem::path inventory_path;
    std::string log_dir;
    std::string log_level;
    bool force_refresh = false;
    std::string command;
    std::vector<std::string> operands;
};

void print_usage() {
    std::cout << "Usage: flex_resolver [OPTIONS] <command> <name>...\n"
              << "Options:\n"
              << "  --config <path>       Configuration file (default: config/default.toml)\n"
              << "  --inventory <path>    Inventory file served as the compute API (required)\n"
              << "  --log-dir <path>      Log output directory (default: stderr)\n"
              << "  --log-level <level>   debug | info | warn | error\n"
              << "  --force-refresh       Bypass cached data on the first read\n"
              << "  --help, -h            Show this help message\n"
              << "Commands:\n"
              << "  node-scale-set <node>...        Scale set ID owning each node\n"
              << "  node-vm <node>...               VM backing each node\n"
              << "  vm-node <vm>...                 Node name of each VM\n"
              << "  scale-set-by-name <name>...     Scale set record by short name\n"
              << "  scale-set-id-by-name <name>...  Scale set ID by short name\n"
              << "  scale-set-by-id <id>...         Scale set record by ID\n"
              << "  inventory                       List cached flexible scale sets\n";
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--inventory" && i + 1 < argc) {
            args.inventory_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--force-refresh") {
            args.force_refresh = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(kExitOk);
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            args.operands.push_back(arg);
        }
    }
    return args;
}

std::string describe(const ScaleSetRecord& scale_set) {
    return scale_set.id + " (name=" + scale_set.name
         + ", resource_group=" + scale_set.resource_group
         + ", location=" + scale_set.location
         + ", mode=" + std::string(to_string(scale_set.orchestration_mode)) + ")";
}

std::string describe(const VMRecord& vm) {
    return vm.name + " (computer_name=" + vm.computer_name.value_or("-")
         + ", scale_set=" + vm.scale_set_id.value_or("-") + ")";
}

/// Print one result line; returns the exit code contribution.
template <typename T, typename Fmt>
int report(const std::string& operand, const Result<T>& result, Fmt&& format) {
    if (result) {
        std::cout << operand << '\t' << format(*result) << '\n';
        return kExitOk;
    }
    std::cerr << operand << '\t' << to_string(result.error().kind) << ": "
              << result.error().message << '\n';
    return result.is_not_found() ? kExitNotFound : kExitError;
}

int run_command(const CLIArgs& args, FlexScaleSetResolver& resolver) {
    auto crt = args.force_refresh ? CacheReadType::ForceRefresh : CacheReadType::Default;
    auto identity = [](const std::string& s) { return s; };

    if (args.command == "inventory") {
        auto snapshot = resolver.inventory(crt);
        if (!snapshot) {
            std::cerr << to_string(snapshot.error().kind) << ": " << snapshot.error().message << '\n';
            return kExitError;
        }
        for (const auto& [id, scale_set] : **snapshot) {
            std::cout << describe(scale_set) << '\n';
        }
        return kExitOk;
    }

    if (args.operands.empty()) {
        std::cerr << "Command " << args.command << " needs at least one operand\n";
        return kExitError;
    }

    int exit_code = kExitOk;
    auto merge = [&exit_code](int code) {
        if (code == kExitError || exit_code == kExitOk) exit_code = code;
    };

    for (const auto& operand : args.operands) {
        if (args.command == "node-scale-set") {
            merge(report(operand, resolver.scale_set_id_for_node(operand), identity));
        } else if (args.command == "node-vm") {
            merge(report(operand, resolver.vm_for_node(operand, crt),
                         [](const VMRecord& vm) { return describe(vm); }));
        } else if (args.command == "vm-node") {
            merge(report(operand, resolver.node_name_for_vm(operand), identity));
        } else if (args.command == "scale-set-by-name") {
            merge(report(operand, resolver.scale_set_by_name(operand),
                         [](const ScaleSetRecord& ss) { return describe(ss); }));
        } else if (args.command == "scale-set-id-by-name") {
            merge(report(operand, resolver.scale_set_id_by_name(operand), identity));
        } else if (args.command == "scale-set-by-id") {
            merge(report(operand, resolver.scale_set_by_id(operand, crt),
                         [](const ScaleSetRecord& ss) { return describe(ss); }));
        } else {
            std::cerr << "Unknown command: " << args.command << '\n';
            print_usage();
            return kExitError;
        }
    }
    return exit_code;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (args.command.empty() || args.inventory_path.empty()) {
        print_usage();
        return kExitError;
    }

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << "Unknown log level: " << config.telemetry.log_level << std::endl;
        return kExitError;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "flex_resolver",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        // stdout carries command results
        log_sink = std::make_unique<StderrSink>();
    }
    Logger logger(std::move(log_sink), *level, "flex_resolver");

    // ── Inventory ────────────────────────────
    auto client = load_inventory_file(args.inventory_path);
    if (!client) {
        logger.error("Failed to load inventory: " + client.error().message);
        std::cerr << "Failed to load inventory: " << client.error().message << std::endl;
        return kExitError;
    }
    logger.info("Inventory loaded: " + std::to_string((*client)->scale_set_count()) + " scale sets, "
                + std::to_string((*client)->vm_count()) + " VMs");

    auto options = ResolverOptions::from_config(config);
    FlexScaleSetResolver resolver(*client, options, logger);
    logger.info("Resolver ready (inventory TTL "
                + std::to_string(resolver.inventory_cache().ttl().count()) + "s, caching "
                + (options.disable_api_call_cache ? "disabled" : "enabled") + ")");

    int exit_code = run_command(args, resolver);

    logger.flush();
    return exit_code;
}
