#pragma once

#include <string>
#include <vector>
#include <memory>
#include <core/config.hpp>
#include <core/types.hpp>
#include <registry/module_info.hpp>
#include <registry/template_registry.hpp>

// Pure data structs for UI consumption.

struct TemplateSummary {
    std::string key;          // file path, or "module:name" for inline templates
    std::string origin;       // "file" or "inline"
    std::string repr;
    bool associated = false;
};

struct ViewBinding {
    std::string view;         // "module.View"
    std::string target;       // template repr, or "render()" when the view renders itself
};

// Headless setup coordinator: owns the modules and the template registry for
// one manifest and drives the register -> associate -> report passes.
class SetupService {
public:
    explicit SetupService(const Config& config, WarningCallback warn = nullptr);

    // Pass 1: template directories of every module, then inline templates.
    Result<void> register_templates();

    // Pass 2: resolve (and claim) the template of every declared view.
    Result<void> resolve_views();

    // Pass 3: warn about templates no view claimed. Returns their count.
    size_t report_unassociated(const WarningCallback& warn) const;

    std::vector<TemplateSummary> list_templates() const;
    const std::vector<ViewBinding>& view_bindings() const { return bindings_; }

    TemplateRegistry& registry() { return *registry_; }
    const std::vector<std::unique_ptr<FilesystemModule>>& modules() const { return modules_; }

private:
    const Config& config_;
    std::unique_ptr<TemplateRegistry> registry_;
    std::vector<std::unique_ptr<FilesystemModule>> modules_;   // parallel to manifest().modules
    std::vector<ViewBinding> bindings_;
};

// Factory mapping described by the manifest's extensions section.
TemplateFactoryRegistry make_factory_registry(const ManifestConfig& manifest);
