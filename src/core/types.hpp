#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Manifest structures
struct ViewConfig {
    std::string name;                            // view class name, e.g. "Index"
    std::optional<std::string> template_name;    // explicit template, defaults to lower-cased name
    bool has_render = false;                     // view renders itself
    bool is_form = false;                        // forms may carry both render and template
};

struct ModuleConfig {
    std::string dotted_name;                     // e.g. "app.blog"
    std::string path;                            // resource root (absolute after load)
    bool is_package = false;
    std::optional<std::string> template_dir;     // overrides "<name>_templates"
    std::map<std::string, std::string> inline_templates;   // name -> source
    std::vector<ViewConfig> views;
};

struct ManifestConfig {
    bool strict = false;                         // unassociated templates fail the check
    std::map<std::string, std::string> extensions;         // extension -> template kind
    std::vector<ModuleConfig> modules;
};

// Fire-and-forget sink for recoverable anomalies (unknown extensions, unused templates)
using WarningCallback = std::function<void(const std::string&)>;
