/// @file main.cpp
/// @brief coframe_gen entry point - composes plugins and writes the model module
///
/// Pipeline:
/// - ProjectConfig: coframe.toml (or defaults when absent)
/// - PluginLoader: discovers plugin directories under every configured path
/// - DependencySorter / MergeEngine: composes declarations in dependency order
/// - TypeCatalog / TableResolver: resolves types, tables and references
/// - ModelGenerator: writes the SQLAlchemy module when stale

#include <coframe/codegen/generator.hpp>
#include <coframe/schema/schema.hpp>
#include <coframe/plugin/project_config.hpp>
#include <coframe/core/log.hpp>

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {

struct CommandLine {
    fs::path config_path;
    fs::path output;
    bool force = false;
    bool history = false;
    bool dump = false;
    bool check = false;
};

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH   Project configuration (default: ./coframe.toml)\n"
              << "  --output PATH   Override the generated module path\n"
              << "  --force         Regenerate even when the module is up to date\n"
              << "  --history       Print which plugins defined each key\n"
              << "  --dump          Print the composed document as JSON\n"
              << "  --check         Only report whether regeneration is needed\n"
              << "  --help, -h      Show this help message\n"
              << "  --version, -v   Show version information\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " --config examples/library/coframe.toml\n"
              << "  " << program_name << " --history --dump\n";
}

void print_version() {
    std::cout << "coframe_gen 0.1.0\n"
              << "coframe plugin schema composer\n";
}

coframe_core::Result<coframe_plugin::ProjectConfig> load_config(const CommandLine& cmd) {
    if (!cmd.config_path.empty()) {
        return coframe_plugin::ProjectConfig::load(cmd.config_path);
    }

    fs::path default_path = fs::current_path() / coframe_plugin::kProjectConfigFileName;
    if (fs::exists(default_path)) {
        return coframe_plugin::ProjectConfig::load(default_path);
    }
    return coframe_core::Ok(coframe_plugin::ProjectConfig::defaults(fs::current_path()));
}

int fail(const coframe_core::Error& error) {
    coframe_core::get_logger("cli")->error("{}", coframe_core::build_error_chain(error));
    coframe_core::shutdown_logging();
    return 1;
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    CommandLine cmd;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            print_version();
            return 0;
        } else if (arg == "--config" || arg == "--output") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
            (arg == "--config" ? cmd.config_path : cmd.output) = argv[++i];
        } else if (arg == "--force") {
            cmd.force = true;
        } else if (arg == "--history") {
            cmd.history = true;
        } else if (arg == "--dump") {
            cmd.dump = true;
        } else if (arg == "--check") {
            cmd.check = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    auto config = load_config(cmd);
    if (!config) {
        return fail(config.error());
    }
    if (!cmd.output.empty()) {
        config->output = cmd.output;
    }

    coframe_core::configure_logging(config->log_config());
    auto log = coframe_core::get_logger("cli");
    log->info("Project '{}' {}", config->name, config->version);

    auto schema = coframe_schema::compose_schema(*config);
    if (!schema) {
        return fail(schema.error());
    }

    if (cmd.history) {
        std::cout << schema->document().format_history();
    }
    if (cmd.dump) {
        std::cout << schema->document().to_json().dump(2) << "\n";
    }

    coframe_codegen::GeneratorOptions options;
    options.project_name = config->name;
    options.db_engine = config->db_engine;
    options.source_imports = config->source_imports;
    options.source_add = config->source_add;

    coframe_codegen::ModelGenerator generator(*schema, options);
    const bool stale = generator.should_regenerate(config->output);

    if (cmd.check) {
        log->info("{} is {}", config->output.string(), stale ? "out of date" : "up to date");
        coframe_core::shutdown_logging();
        return stale ? 1 : 0;
    }

    if (!stale && !cmd.force) {
        log->info("{} is up to date", config->output.string());
        coframe_core::shutdown_logging();
        return 0;
    }

    auto written = generator.write(config->output);
    if (!written) {
        return fail(written.error());
    }

    coframe_core::shutdown_logging();
    return 0;
}
