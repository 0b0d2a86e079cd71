#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace fs = std::filesystem;

// What the registry needs to know about a module that owns templates.
class ModuleInfo {
public:
    virtual ~ModuleInfo() = default;

    virtual std::string dotted_name() const = 0;
    virtual bool is_package() const = 0;

    // Directory holding the module's resource of the given name.
    // The directory is not required to exist.
    virtual fs::path resource_path(const std::string& name) const = 0;

    // Names of the regular files directly inside dir, sorted.
    virtual std::vector<std::string> list_files(const fs::path& dir) const = 0;

    // Short name: last component of the dotted name.
    std::string name() const;

    // Template directory name: explicit override, else "<name>_templates".
    virtual std::string template_dir_name() const;
};

// Module backed by a directory on the local filesystem.
class FilesystemModule : public ModuleInfo {
public:
    FilesystemModule(std::string dotted_name, fs::path root,
                     bool is_package = false,
                     std::optional<std::string> template_dir = std::nullopt);

    std::string dotted_name() const override { return dotted_name_; }
    bool is_package() const override { return is_package_; }
    fs::path resource_path(const std::string& name) const override;
    std::vector<std::string> list_files(const fs::path& dir) const override;
    std::string template_dir_name() const override;

private:
    std::string dotted_name_;
    fs::path root_;
    bool is_package_;
    std::optional<std::string> template_dir_;
};
