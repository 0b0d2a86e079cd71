#include "conflict_checker.hpp"
#include "file_template_registry.hpp"
#include "inline_template_registry.hpp"
#include <fmt/format.h>

ConflictChecker::ConflictChecker(const FileTemplateRegistry& files,
                                 const InlineTemplateRegistry& inlines)
    : files_(files), inlines_(inlines) {}

std::optional<TemplateConflict> ConflictChecker::find_file_conflict(
        const ModuleInfo& module, const std::string& name) const {
    fs::path dir = files_.template_dir(module);
    if (!files_.find_path(dir, name)) return std::nullopt;
    return TemplateConflict{name, module.dotted_name(), dir};
}

std::optional<TemplateConflict> ConflictChecker::find_inline_conflict(
        const ModuleInfo& module, const std::string& name,
        const fs::path& template_dir) const {
    if (!inlines_.contains(module, name)) return std::nullopt;
    return TemplateConflict{name, module.dotted_name(), template_dir};
}

std::string conflict_message(const TemplateConflict& conflict) {
    return fmt::format("Conflicting templates found for name '{}': the inline template "
                       "in module '{}' conflicts with the file template in directory '{}'",
                       conflict.template_name, conflict.module_name,
                       conflict.template_dir.string());
}
