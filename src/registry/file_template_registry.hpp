#pragma once

#include <string>
#include <map>
#include <set>
#include <utility>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include "module_info.hpp"
#include "template.hpp"

namespace fs = std::filesystem;

class ConflictChecker;

struct FileTemplateEntry {
    fs::path dir;                  // template directory the file was found in
    std::string name;              // base name, e.g. "index" for index.pt
    TemplatePtr tmpl;
    bool associated = false;
};

// Templates discovered on disk, keyed by absolute file path.
//
// At most one entry exists per (directory, base name). A directory is scanned
// as a whole: every check runs before the first insertion, so a scan that
// throws leaves the registry as it was.
class FileTemplateRegistry {
public:
    FileTemplateRegistry(TemplateFactoryRegistry factories, WarningCallback warn);

    void set_conflict_checker(const ConflictChecker* checker) { checker_ = checker; }

    // Scan the module's template directory (template_dir_name()).
    void register_directory(const ModuleInfo& module);

    // Scan module.resource_path(template_dir_name) and remember the name as the
    // module's template directory name; the directory itself is always resolved
    // against the module passed to lookup. Registering again under another name
    // moves the module's lookups there. Packages and missing directories are skipped.
    // Throws ConflictError.
    void register_directory(const ModuleInfo& module, const std::string& template_dir_name);

    // Throws TemplateLookupError if the module's template directory has no
    // template with this base name.
    TemplatePtr lookup(const ModuleInfo& module, const std::string& name,
                       bool mark_as_associated = false);

    // Unknown paths are ignored.
    void associate(const std::string& path);

    std::set<std::string> unassociated() const;

    // Directory the module's file templates are looked up in: the module's
    // resource path for the registered (or default) directory name.
    fs::path template_dir(const ModuleInfo& module) const;

    // Path of the template registered under (dir, name), if any.
    std::optional<std::string> find_path(const fs::path& dir, const std::string& name) const;

    const std::map<std::string, FileTemplateEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    void clear();

private:
    void warn(const std::string& msg) const;

    TemplateFactoryRegistry factories_;
    WarningCallback warn_;
    const ConflictChecker* checker_ = nullptr;

    std::map<std::string, FileTemplateEntry> entries_;                       // path -> entry
    std::map<std::pair<std::string, std::string>, std::string> by_name_;     // (dir, name) -> path
    std::map<std::string, std::string> dir_names_;                           // dotted name -> dir name
};
