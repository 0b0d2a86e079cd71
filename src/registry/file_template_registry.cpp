#include "file_template_registry.hpp"
#include "conflict_checker.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <system_error>
#include <vector>

// Files that live in template directories but are never templates
static bool is_ignored_file(const std::string& filename) {
    if (filename.empty() || filename[0] == '.') return true;
    if (filename.back() == '~') return true;
    std::string cache_ext = CACHE_FILE_EXTENSION;
    if (filename.size() >= cache_ext.size() &&
        filename.compare(filename.size() - cache_ext.size(), cache_ext.size(), cache_ext) == 0) {
        return true;
    }
    return false;
}

// Extension without the leading dot, "" if there is none
static std::string extension_of(const std::string& filename) {
    std::string ext = fs::path(filename).extension().string();
    if (!ext.empty()) ext = ext.substr(1);
    return ext;
}

static std::string same_name_message(const std::string& name, const fs::path& dir) {
    return fmt::format("Conflicting templates found for name '{}' in directory '{}': "
                       "multiple templates with the same name and different extensions.",
                       name, dir.string());
}

FileTemplateRegistry::FileTemplateRegistry(TemplateFactoryRegistry factories, WarningCallback warn)
    : factories_(std::move(factories)), warn_(std::move(warn)) {}

void FileTemplateRegistry::warn(const std::string& msg) const {
    tplreg_log("warning: " + msg);
    if (warn_) warn_(msg);
}

void FileTemplateRegistry::register_directory(const ModuleInfo& module) {
    register_directory(module, module.template_dir_name());
}

void FileTemplateRegistry::register_directory(const ModuleInfo& module,
                                              const std::string& template_dir_name) {
    // Packages don't own a template directory
    if (module.is_package()) {
        tplreg_log(fmt::format("register_directory: {} is a package, skipping", module.dotted_name()));
        return;
    }

    fs::path dir = module.resource_path(template_dir_name).lexically_normal();
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        tplreg_log(fmt::format("register_directory: {} has no directory {}",
                               module.dotted_name(), dir.string()));
        dir_names_[module.dotted_name()] = template_dir_name;
        return;
    }

    // Group recognised files by base name
    std::map<std::string, std::vector<std::string>> groups;
    for (const auto& filename : module.list_files(dir)) {
        if (is_ignored_file(filename)) continue;

        if (!factories_.factory_for(extension_of(filename))) {
            warn(fmt::format("File '{}' has an unrecognized extension in directory '{}'",
                             filename, dir.string()));
            continue;
        }
        groups[fs::path(filename).stem().string()].push_back(filename);
    }

    struct Pending {
        std::string path;
        std::string name;
        std::string filename;
        std::string ext;
    };
    std::vector<Pending> pending;

    for (const auto& [name, files] : groups) {
        if (files.size() > 1) {
            throw ConflictError(same_name_message(name, dir));
        }

        const std::string& filename = files.front();
        std::string path = (dir / filename).string();

        // Checked for already-registered files too: another module sharing
        // this directory may have registered them
        if (checker_) {
            auto conflict = checker_->find_inline_conflict(module, name, dir);
            if (conflict) {
                tplreg_log(fmt::format("register_directory: conflict on {} in {}", name, dir.string()));
                throw ConflictError(conflict_message(*conflict));
            }
        }

        auto existing = find_path(dir, name);
        if (existing) {
            if (*existing == path) continue;   // already registered, keep its flag
            throw ConflictError(same_name_message(name, dir));
        }

        pending.push_back({path, name, filename, extension_of(filename)});
    }

    // Build everything before touching the maps
    std::vector<std::pair<Pending, TemplatePtr>> built;
    built.reserve(pending.size());
    for (auto& p : pending) {
        const TemplateFactory* factory = factories_.factory_for(p.ext);
        TemplatePtr tmpl = (*factory)(p.filename, dir);
        if (!tmpl) {
            throw std::runtime_error(fmt::format("Template factory for '.{}' returned nothing for '{}'",
                                                 p.ext, p.path));
        }
        built.emplace_back(std::move(p), std::move(tmpl));
    }

    for (auto& [p, tmpl] : built) {
        by_name_[{dir.string(), p.name}] = p.path;
        entries_[p.path] = FileTemplateEntry{dir, p.name, std::move(tmpl), false};
    }
    dir_names_[module.dotted_name()] = template_dir_name;

    tplreg_log(fmt::format("register_directory: {} -> {} ({} new template(s))",
                           module.dotted_name(), dir.string(), built.size()));
}

TemplatePtr FileTemplateRegistry::lookup(const ModuleInfo& module, const std::string& name,
                                         bool mark_as_associated) {
    fs::path dir = template_dir(module);
    auto path = find_path(dir, name);
    if (!path) {
        throw TemplateLookupError(fmt::format("template '{}' in '{}' cannot be found",
                                              name, dir.string()));
    }
    if (mark_as_associated) {
        associate(*path);
    }
    return entries_.at(*path).tmpl;
}

void FileTemplateRegistry::associate(const std::string& path) {
    auto it = entries_.find(path);
    if (it == entries_.end()) {
        tplreg_log(fmt::format("associate: no file template at {}", path));
        return;
    }
    it->second.associated = true;
}

std::set<std::string> FileTemplateRegistry::unassociated() const {
    std::set<std::string> paths;
    for (const auto& [path, entry] : entries_) {
        if (!entry.associated) paths.insert(path);
    }
    return paths;
}

fs::path FileTemplateRegistry::template_dir(const ModuleInfo& module) const {
    auto it = dir_names_.find(module.dotted_name());
    std::string name = it != dir_names_.end() ? it->second : module.template_dir_name();
    return module.resource_path(name).lexically_normal();
}

std::optional<std::string> FileTemplateRegistry::find_path(const fs::path& dir,
                                                           const std::string& name) const {
    auto it = by_name_.find({dir.string(), name});
    if (it == by_name_.end()) return std::nullopt;
    return it->second;
}

void FileTemplateRegistry::clear() {
    entries_.clear();
    by_name_.clear();
    dir_names_.clear();
}
