#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load the manifest ./tplreg.yaml from dir
    static Result<Config> load(const fs::path& dir = fs::current_path());

    // Load a manifest from an explicit file; relative module paths resolve
    // against the file's directory
    static Result<Config> load_file(const fs::path& manifest_path);

    const ManifestConfig& manifest() const { return manifest_; }
    const fs::path& project_dir() const { return project_dir_; }

public:
    Config() = default;

private:
    ManifestConfig manifest_;
    fs::path project_dir_;
};

fs::path get_manifest_path(const fs::path& dir = fs::current_path());
