// FILE: cli/thumb_cli.cpp
#include <getopt.h>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "cli/print_cli_help.hpp"
#include "thumb_config.hpp"
#include "thumbnail/render_report.hpp"
#include "thumbnail/thumbnail_service.hpp"

using namespace tk;

static void print_load_errors(const PluginLoadResult& result) {
    for (const auto& e : result.errors)
        std::cerr << "Warning: plugin '" << e.path << "' [" << errc_name(e.code) << "]: " << e.message << "\n";
}

static void print_renderers(const ThumbnailService& svc) {
    auto renderers = svc.describe_renderers();
    if (renderers.empty()) {
        std::cout << "No renderers are registered." << std::endl;
        return;
    }
    std::cout << "Renderers (in discovery order):" << std::endl;
    for (const auto& [info, description] : renderers) {
        std::cout << "  - " << info.name << ": " << description;
        if (info.source != kBuiltinSource) std::cout << "  [plugin: " << fs::path(info.source).filename().string() << "]";
        std::cout << std::endl;
    }
}

int main(int argc, char** argv) {
    // Fast path: if only asking for help, avoid loading plugins.
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_cli_help();
            return 0;
        }
    }

    ThumbConfig config;
    std::string custom_config_path;

    const char* const short_opts = "ho:s:f:l";
    const option long_opts[] = {
        {"help", no_argument, nullptr, 'h'}, {"output", required_argument, nullptr, 'o'},
        {"size", required_argument, nullptr, 's'}, {"format", required_argument, nullptr, 'f'},
        {"list", no_argument, nullptr, 'l'}, {"config", required_argument, nullptr, 2001},
        {"plugins", required_argument, nullptr, 2002}, {"manifest", required_argument, nullptr, 2003},
        {"parallel", no_argument, nullptr, 2004}, {"report", required_argument, nullptr, 2005},
        {nullptr, 0, nullptr, 0}
    };

    // First pass: only the config path, so command-line flags override the file.
    int opt;
    opterr = 0;
    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        if (opt == 2001) { custom_config_path = optarg; }
    }
    optind = 1;
    opterr = 1;

    std::string config_to_load = custom_config_path.empty() ? "thumbkit.yaml" : custom_config_path;
    std::string warning;
    if (!load_or_create_config(config_to_load, config, &warning)) std::cerr << "Warning: " << warning << std::endl;

    bool list_only = false;
    std::optional<std::string> report_path;
    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'o': config.output_dir = optarg; break;
        case 's':
            if (!parse_thumbnail_size(optarg, config.max_width, config.max_height)) {
                std::cerr << "Error: invalid size '" << optarg << "'. Use N or WxH.\n";
                return 1;
            }
            break;
        case 'f': config.output_format = optarg; break;
        case 'l': list_only = true; break;
        case 2001: break;
        case 2002: config.plugin_dirs.push_back(optarg); break;
        case 2003: config.provider_manifests.push_back(optarg); break;
        case 2004: config.parallel_probe = true; break;
        case 2005: report_path = optarg; break;
        default: print_cli_help(); return 1;
        }
    }

    try {
        ThumbnailService svc;
        svc.set_config(config);
        svc.seed_builtin_renderers();
        print_load_errors(svc.load_configured_plugins());

        if (list_only) {
            print_renderers(svc);
            return 0;
        }
        if (optind >= argc) {
            std::cerr << "Error: no input files.\n";
            print_cli_help();
            return 1;
        }

        std::vector<RenderOutcome> outcomes;
        bool all_rendered = true;
        for (int i = optind; i < argc; ++i) {
            RenderOutcome outcome = svc.render_file(argv[i], config.output_dir);
            if (config.report_skipped_providers) {
                for (const auto& e : outcome.discovery.skipped) std::cerr << "Warning: skipped " << e.what() << "\n";
            }
            switch (outcome.status) {
            case RenderOutcome::Status::Rendered:
                std::cout << argv[i] << " -> " << outcome.output->string() << " (" << outcome.renderer << ")\n";
                break;
            case RenderOutcome::Status::Unsupported:
                std::cerr << "Unsupported: " << outcome.message << "\n";
                all_rendered = false;
                break;
            case RenderOutcome::Status::Failed:
                std::cerr << "Error: " << argv[i] << ": " << outcome.message << "\n";
                all_rendered = false;
                break;
            }
            outcomes.push_back(std::move(outcome));
        }

        if (report_path && !write_render_report(outcomes, *report_path))
            std::cerr << "Warning: could not write report to '" << *report_path << "'.\n";
        return all_rendered ? 0 : 3;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
}
