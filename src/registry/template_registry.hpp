#pragma once

#include <string>
#include <set>
#include <core/types.hpp>
#include "module_info.hpp"
#include "template.hpp"
#include "file_template_registry.hpp"
#include "inline_template_registry.hpp"
#include "conflict_checker.hpp"

// Owns both template stores and the conflict checker between them.
//
// Used in two passes: register every template directory and inline template
// first, in any order; then resolve templates for views with lookup().
// Afterwards check_unassociated() reports templates no view claimed.
class TemplateRegistry {
public:
    explicit TemplateRegistry(TemplateFactoryRegistry factories = TemplateFactoryRegistry::with_defaults(),
                              WarningCallback warn = nullptr);

    TemplateRegistry(const TemplateRegistry&) = delete;
    TemplateRegistry& operator=(const TemplateRegistry&) = delete;

    // ── Registration ────────────────────────────────────────
    void register_directory(const ModuleInfo& module);
    void register_directory(const ModuleInfo& module, const std::string& template_dir_name);
    void register_inline_template(const ModuleInfo& module, const std::string& name, TemplatePtr tmpl);

    // ── Lookup ──────────────────────────────────────────────
    // File templates win over inline ones. If neither store has the name, the
    // file store's TemplateLookupError is rethrown.
    TemplatePtr lookup(const ModuleInfo& module, const std::string& name,
                       bool mark_as_associated = false);

    // ── Reporting ───────────────────────────────────────────
    std::set<std::string> unassociated_file_templates() const;
    std::set<InlineTemplateKey> unassociated_inline_templates() const;

    // Emits one warning per unassociated inline template and one for all
    // unassociated file templates. Returns the number of unassociated templates.
    size_t check_unassociated(const WarningCallback& warn) const;

    void clear_all();

    FileTemplateRegistry& files() { return files_; }
    const FileTemplateRegistry& files() const { return files_; }
    InlineTemplateRegistry& inlines() { return inlines_; }
    const InlineTemplateRegistry& inlines() const { return inlines_; }

private:
    FileTemplateRegistry files_;
    InlineTemplateRegistry inlines_;
    ConflictChecker checker_;
};
