// FILE: cli/keystrap_cli.cpp
#include <getopt.h>

#include <iostream>
#include <string>

#include "cli/print_cli_help.hpp"
#include "cli/render_tables.hpp"
#include "cli/run_repl.hpp"
#include "cli/session.hpp"
#include "cli/state_json.hpp"
#include "cli_config.hpp"
#include "kernel/interaction.hpp"
#include "kernel/kernel.hpp"

int main(int argc, char** argv) {
    // Fast path: if only asking for help, skip config and extension loading.
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_cli_help();
            return 0;
        }
    }

    ks::Kernel kernel(ks::run_system_command);
    ks::InteractionService svc(kernel);

    CliConfig config;
    CliSession session;
    std::string custom_config_path;
    std::string preset;
    std::string manifest;
    std::string dump_manifest_path;
    std::string json_path;
    bool print_keys = false;
    bool print_extensions = false;
    bool start_repl = false;

    const char* const short_opts = "hP:m:kxj:R";
    const option long_opts[] = {
        {"help", no_argument, nullptr, 'h'},          {"preset", required_argument, nullptr, 'P'},
        {"manifest", required_argument, nullptr, 'm'}, {"keys", no_argument, nullptr, 'k'},
        {"extensions", no_argument, nullptr, 'x'},    {"json", required_argument, nullptr, 'j'},
        {"repl", no_argument, nullptr, 'R'},          {"config", required_argument, nullptr, 2001},
        {"dump-manifest", required_argument, nullptr, 2002},
        {"no-bootstrap", no_argument, nullptr, 2003},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'P': preset = optarg; break;
        case 'm': manifest = optarg; break;
        case 'k': print_keys = true; break;
        case 'x': print_extensions = true; break;
        case 'j': json_path = optarg; break;
        case 'R': start_repl = true; break;
        case 2001: custom_config_path = optarg; break;
        case 2002: dump_manifest_path = optarg; break;
        case 2003: session.bootstrap = false; break;
        default: print_cli_help(); return 1;
        }
    }

    std::string config_to_load = custom_config_path.empty() ? "config.yaml" : custom_config_path;
    load_or_create_config(config_to_load, config);

    // Command line wins over config; a preset given on the command line
    // also wins over a manifest named only in config.
    if (manifest.empty() && preset.empty()) manifest = config.manifest_path;
    if (preset.empty()) preset = config.preset;

    auto plan = resolve_plan(svc, manifest, preset);
    if (!plan) return 1;
    apply_config_settings(*plan, config);
    session.plan = std::move(*plan);

    try {
        if (!dump_manifest_path.empty()) {
            if (!svc.cmd_save_manifest(session.plan, dump_manifest_path)) {
                auto err = svc.cmd_last_error();
                std::cerr << "Error: " << (err ? err->message : "could not write manifest") << "\n";
                return 1;
            }
            std::cout << "Wrote plan '" << session.plan.name << "' to " << dump_manifest_path << "\n";
        }

        if (!run_session_startup(svc, session, config)) {
            auto err = svc.cmd_last_error();
            std::cerr << "Error: Startup aborted: " << (err ? err->message : "unknown error") << "\n";
            return 2;
        }

        if (print_extensions) {
            if (const auto& report = svc.cmd_last_report()) std::cout << render_extension_table(*report);
        }
        if (print_keys) {
            auto bindings = svc.cmd_bindings();
            if (bindings.empty()) std::cout << "No bindings registered.\n";
            else std::cout << render_key_table(bindings);
        }
        if (!json_path.empty()) {
            if (write_state_json(svc, json_path)) std::cout << "Wrote state to " << json_path << "\n";
            else std::cerr << "Error: Could not write " << json_path << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    if (start_repl) run_repl(svc, config, session);
    return 0;
}
