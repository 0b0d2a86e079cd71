#include "config.hpp"
#include "constants.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <set>
#include <stdexcept>

namespace fs = std::filesystem;

static const std::set<std::string> KNOWN_KINDS = {KIND_PAGE, KIND_TEXT};

fs::path get_manifest_path(const fs::path& dir) {
    return dir / MANIFEST_FILENAME;
}

static ViewConfig parse_view_config(const YAML::Node& node) {
    ViewConfig view;
    // "- Index" is shorthand for a view that uses the template "index"
    if (node.IsScalar()) {
        view.name = node.as<std::string>();
        return view;
    }
    view.name = node["name"].as<std::string>("");
    if (node["template"] && node["template"].IsScalar()) {
        view.template_name = node["template"].as<std::string>();
    }
    view.has_render = node["render"].as<bool>(false);
    view.is_form = node["form"].as<bool>(false);
    return view;
}

static ModuleConfig parse_module_config(const YAML::Node& node, const fs::path& base_dir) {
    ModuleConfig module;
    module.dotted_name = node["name"].as<std::string>("");
    if (module.dotted_name.empty()) {
        throw std::runtime_error("module entry without a 'name'");
    }

    fs::path path = node["path"].as<std::string>(".");
    if (path.is_relative()) path = base_dir / path;
    module.path = path.lexically_normal().string();

    module.is_package = node["package"].as<bool>(false);
    if (node["templatedir"] && node["templatedir"].IsScalar()) {
        module.template_dir = node["templatedir"].as<std::string>();
    }

    if (node["inline"] && node["inline"].IsMap()) {
        for (const auto& kv : node["inline"]) {
            module.inline_templates[kv.first.as<std::string>()] = kv.second.as<std::string>("");
        }
    }

    if (node["views"] && node["views"].IsSequence()) {
        for (const auto& v : node["views"]) {
            ViewConfig view = parse_view_config(v);
            if (view.name.empty()) {
                throw std::runtime_error(fmt::format("view without a 'name' in module '{}'",
                                                     module.dotted_name));
            }
            module.views.push_back(view);
        }
    }

    return module;
}

static ManifestConfig parse_manifest(const YAML::Node& root, const fs::path& base_dir) {
    ManifestConfig manifest;
    manifest.strict = root["strict"].as<bool>(false);

    if (root["extensions"] && root["extensions"].IsMap()) {
        for (const auto& kv : root["extensions"]) {
            std::string ext = kv.first.as<std::string>();
            if (!ext.empty() && ext[0] == '.') ext = ext.substr(1);
            std::string kind = kv.second.as<std::string>("");
            if (!KNOWN_KINDS.count(kind)) {
                throw std::runtime_error(fmt::format("unknown template kind '{}' for extension '{}'",
                                                     kind, ext));
            }
            manifest.extensions[ext] = kind;
        }
    }
    if (manifest.extensions.empty()) {
        manifest.extensions[DEFAULT_PAGE_EXTENSION] = KIND_PAGE;
    }

    if (root["modules"] && root["modules"].IsSequence()) {
        for (const auto& m : root["modules"]) {
            manifest.modules.push_back(parse_module_config(m, base_dir));
        }
    }

    return manifest;
}

Result<Config> Config::load_file(const fs::path& manifest_path) {
    if (!fs::exists(manifest_path)) {
        return Result<Config>::Err("Manifest not found at " + manifest_path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(manifest_path.string());

        Config config;
        config.project_dir_ = fs::absolute(manifest_path).parent_path();
        config.manifest_ = parse_manifest(root, config.project_dir_);

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse manifest: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& dir) {
    return load_file(get_manifest_path(dir));
}
