#include "template_registry.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

TemplateRegistry::TemplateRegistry(TemplateFactoryRegistry factories, WarningCallback warn)
    : files_(std::move(factories), std::move(warn)),
      checker_(files_, inlines_) {
    files_.set_conflict_checker(&checker_);
    inlines_.set_conflict_checker(&checker_);
}

void TemplateRegistry::register_directory(const ModuleInfo& module) {
    files_.register_directory(module);
}

void TemplateRegistry::register_directory(const ModuleInfo& module,
                                          const std::string& template_dir_name) {
    files_.register_directory(module, template_dir_name);
}

void TemplateRegistry::register_inline_template(const ModuleInfo& module, const std::string& name,
                                                TemplatePtr tmpl) {
    inlines_.register_template(module, name, std::move(tmpl));
}

TemplatePtr TemplateRegistry::lookup(const ModuleInfo& module, const std::string& name,
                                     bool mark_as_associated) {
    try {
        return files_.lookup(module, name, mark_as_associated);
    } catch (const TemplateLookupError& file_error) {
        try {
            return inlines_.lookup(module, name, mark_as_associated);
        } catch (const TemplateLookupError&) {
            throw file_error;
        }
    }
}

std::set<std::string> TemplateRegistry::unassociated_file_templates() const {
    return files_.unassociated();
}

std::set<InlineTemplateKey> TemplateRegistry::unassociated_inline_templates() const {
    return inlines_.unassociated();
}

size_t TemplateRegistry::check_unassociated(const WarningCallback& warn) const {
    auto inline_keys = inlines_.unassociated();
    auto file_paths = files_.unassociated();

    for (const auto& [dotted_name, name] : inline_keys) {
        std::string msg = fmt::format(
            "Found the following unassociated template(s) when registering '{}': {}.  "
            "Define views that use the template(s).", dotted_name, name);
        tplreg_log("warning: " + msg);
        if (warn) warn(msg);
    }

    if (!file_paths.empty()) {
        std::string msg = fmt::format(
            "Found the following unassociated template(s) when registering views: {}.  "
            "Define views that use the template(s).", fmt::join(file_paths, ", "));
        tplreg_log("warning: " + msg);
        if (warn) warn(msg);
    }

    return inline_keys.size() + file_paths.size();
}

void TemplateRegistry::clear_all() {
    files_.clear();
    inlines_.clear();
    tplreg_log("clear_all: template registries reset");
}
