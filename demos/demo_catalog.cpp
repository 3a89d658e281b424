// demo_catalog.cpp
//
// Resolves the methodology catalog for the current directory and prints what
// was found. Run it with:
//
//     ./demo_catalog                 # diagnostics, agents, workflows
//     ./demo_catalog analyst         # content of one resource
//     ./demo_catalog bmm/analyst     # module-qualified lookup
//
// Configuration comes from ~/.bmr/config.toml, ./.bmr.toml and BMR_* variables.

#include <bmr/config.hpp>
#include <bmr/log.hpp>
#include <bmr/resolver.hpp>
#include <bmr/view.hpp>

#include <filesystem>
#include <iostream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace bmr;

static void print_resources(const char* title, const std::vector<Resource>& list) {
    std::cout << title << " (" << list.size() << "):\n";
    for (const auto& r : list) {
        std::cout << "  " << r.module << "/" << r.name
                  << "  " << r.relative_path
                  << "  [" << source_name(r.source) << "]\n";
    }
}

int main(int argc, char* argv[]) {
    log::set_color_enabled(isatty(STDERR_FILENO));

    auto cfg = load_effective_config(fs::current_path().string());
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 2;
    }
    log::set_level(cfg.value().log_level);

    if (argc > 1) {
        auto catalog = resolve_catalog(cfg.value());
        if (catalog.is_err()) {
            std::cerr << catalog.error().format() << "\n";
            return 1;
        }
        auto content = read_resource(catalog.value(), argv[1]);
        if (content.is_err()) {
            std::cerr << content.error().format() << "\n";
            return 1;
        }
        std::cout << content.value();
        return 0;
    }

    auto report = diagnostics(cfg.value());
    if (report.is_err()) {
        std::cerr << report.error().format() << "\n";
        return 1;
    }
    std::cout << report.value().format() << "\n";

    const auto& catalog = report.value().catalog;
    if (catalog.empty()) {
        log::warn("no installation found; see the trace above");
        return 1;
    }
    print_resources("agents", list_agents(catalog));
    print_resources("workflows", list_workflows(catalog));
    print_resources("tasks", list_tasks(catalog));
    return 0;
}
