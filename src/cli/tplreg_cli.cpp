#include "tplreg_cli.hpp"
#include "theme.hpp"
#include <managers/setup_service.hpp>
#include <iostream>
#include <algorithm>
#include <fmt/format.h>

namespace fs = std::filesystem;

// Accepts a project directory or the manifest file itself
bool TplregCLI::load_config(const std::string& path_arg) {
    fs::path target = path_arg.empty() ? fs::current_path() : fs::path(path_arg);

    auto result = fs::is_directory(target) ? Config::load(target) : Config::load_file(target);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return false;
    }
    config_ = result.value;
    std::cout << theme::info(fmt::format("Project {}", config_->project_dir().string()));
    return true;
}

int TplregCLI::run_check(const std::string& path_arg) {
    if (!load_config(path_arg)) return 1;

    auto print_warning = [](const std::string& msg) {
        std::cout << theme::warn(msg);
    };

    SetupService service(*config_, print_warning);

    std::cout << theme::section("Registering templates");
    auto reg = service.register_templates();
    if (reg.is_err()) {
        std::cout << theme::fail(reg.error);
        return 1;
    }
    std::cout << theme::ok(fmt::format("{} file template(s), {} inline template(s) in {} module(s)",
                                       service.registry().files().size(),
                                       service.registry().inlines().size(),
                                       service.modules().size()));

    std::cout << theme::section("Resolving views");
    auto views = service.resolve_views();
    if (views.is_err()) {
        std::cout << theme::fail(views.error);
        return 1;
    }
    for (const auto& b : service.view_bindings()) {
        std::cout << theme::step(fmt::format("{} {} {}", b.view, theme::dim("->"), b.target));
    }
    if (service.view_bindings().empty()) {
        std::cout << theme::dim("    No views declared.") << "\n";
    }

    std::cout << theme::section("Unassociated templates");
    size_t unassociated = service.report_unassociated(print_warning);
    if (unassociated == 0) {
        std::cout << theme::ok("Every template is used by a view.");
        return 0;
    }

    if (config_->manifest().strict) {
        std::cout << theme::fail(fmt::format("{} unassociated template(s) (strict mode)", unassociated));
        return 1;
    }
    std::cout << theme::info(fmt::format("{} unassociated template(s)", unassociated));
    return 0;
}

int TplregCLI::run_list(const std::string& path_arg) {
    if (!load_config(path_arg)) return 1;

    SetupService service(*config_, [](const std::string& msg) {
        std::cout << theme::warn(msg);
    });

    auto reg = service.register_templates();
    if (reg.is_err()) {
        std::cout << theme::fail(reg.error);
        return 1;
    }
    // Views claim their templates; a broken view doesn't hide the listing
    auto views = service.resolve_views();
    if (views.is_err()) {
        std::cout << theme::warn(views.error);
    }

    auto summaries = service.list_templates();
    if (summaries.empty()) {
        std::cout << theme::dim("  No templates registered.") << "\n";
        return 0;
    }

    size_t w0 = 8;
    for (const auto& s : summaries) {
        w0 = std::max(w0, s.key.size());
    }

    std::string row = fmt::format("  {{:<{}}} {{:<8}} {{:<6}} {{}}\n", w0 + 2);
    std::cout << "\n";
    std::cout << theme::color::DIM
              << fmt::format(fmt::runtime(row), "TEMPLATE", "ORIGIN", "USED", "REPR")
              << theme::color::RESET;
    for (const auto& s : summaries) {
        std::cout << fmt::format(fmt::runtime(row), s.key, s.origin,
                                 s.associated ? "yes" : "no", s.repr);
    }
    std::cout << "\n";
    return 0;
}
