#include "setup_service.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <views/view_templates.hpp>
#include <fmt/format.h>

TemplateFactoryRegistry make_factory_registry(const ManifestConfig& manifest) {
    TemplateFactoryRegistry factories;
    for (const auto& [ext, kind] : manifest.extensions) {
        if (!factories.add_kind(ext, kind)) {
            tplreg_log(fmt::format("make_factory_registry: unknown kind '{}' for '.{}'", kind, ext));
        }
    }
    return factories;
}

SetupService::SetupService(const Config& config, WarningCallback warn)
    : config_(config),
      registry_(std::make_unique<TemplateRegistry>(make_factory_registry(config.manifest()),
                                                   std::move(warn))) {
    for (const auto& m : config_.manifest().modules) {
        modules_.push_back(std::make_unique<FilesystemModule>(m.dotted_name, m.path,
                                                              m.is_package, m.template_dir));
    }
}

Result<void> SetupService::register_templates() {
    const auto& module_configs = config_.manifest().modules;
    try {
        for (const auto& module : modules_) {
            registry_->register_directory(*module);
        }
        for (size_t i = 0; i < modules_.size(); i++) {
            for (const auto& [name, source] : module_configs[i].inline_templates) {
                registry_->register_inline_template(*modules_[i], name,
                                                    std::make_shared<InlineTemplate>(source));
            }
        }
    } catch (const ConflictError& e) {
        tplreg_log(fmt::format("register_templates failed: {}", e.what()));
        return Result<void>::Err(e.what());
    }
    return Result<void>::Ok();
}

Result<void> SetupService::resolve_views() {
    const auto& module_configs = config_.manifest().modules;
    bindings_.clear();
    try {
        for (size_t i = 0; i < modules_.size(); i++) {
            for (const auto& view : module_configs[i].views) {
                TemplatePtr tmpl = resolve_view_template(*registry_, *modules_[i], view);
                bindings_.push_back({
                    fmt::format("{}.{}", modules_[i]->dotted_name(), view.name),
                    tmpl ? tmpl->repr() : "render()"
                });
            }
        }
    } catch (const ViewConfigError& e) {
        tplreg_log(fmt::format("resolve_views failed: {}", e.what()));
        return Result<void>::Err(e.what());
    }
    return Result<void>::Ok();
}

size_t SetupService::report_unassociated(const WarningCallback& warn) const {
    return registry_->check_unassociated(warn);
}

std::vector<TemplateSummary> SetupService::list_templates() const {
    std::vector<TemplateSummary> summaries;
    for (const auto& [path, entry] : registry_->files().entries()) {
        summaries.push_back({path, "file", entry.tmpl->repr(), entry.associated});
    }
    for (const auto& [key, entry] : registry_->inlines().entries()) {
        summaries.push_back({fmt::format("{}:{}", key.first, key.second), "inline",
                             entry.tmpl->repr(), entry.associated});
    }
    return summaries;
}
