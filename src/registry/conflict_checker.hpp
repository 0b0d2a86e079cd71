#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "module_info.hpp"

namespace fs = std::filesystem;

class FileTemplateRegistry;
class InlineTemplateRegistry;

// A (module, name) pair that already resolves in the other registry.
struct TemplateConflict {
    std::string template_name;
    std::string module_name;       // dotted name of the inline template's module
    fs::path template_dir;         // directory holding the file template
};

// Cross-checks the two registries before anything is inserted into either.
// Never mutates them.
class ConflictChecker {
public:
    ConflictChecker(const FileTemplateRegistry& files, const InlineTemplateRegistry& inlines);

    // Used when registering an inline template: is there a file template with
    // this base name in the module's template directory?
    std::optional<TemplateConflict> find_file_conflict(const ModuleInfo& module,
                                                       const std::string& name) const;

    // Used when registering a file template found in template_dir: is there an
    // inline template with this name in the module?
    std::optional<TemplateConflict> find_inline_conflict(const ModuleInfo& module,
                                                         const std::string& name,
                                                         const fs::path& template_dir) const;

private:
    const FileTemplateRegistry& files_;
    const InlineTemplateRegistry& inlines_;
};

// Error text shared by both registration paths.
std::string conflict_message(const TemplateConflict& conflict);
