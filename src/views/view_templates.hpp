#pragma once

#include <string>
#include <core/types.hpp>
#include <registry/module_info.hpp>
#include <registry/template_registry.hpp>

// Template name a view resolves to: its explicit template, else its lower-cased name.
std::string view_template_name(const ViewConfig& view);

// Find and claim the template for a view declared in module.
//
// Returns nullptr when the view renders itself. Throws ViewConfigError when
// the view has both a render method and a template (forms excepted), when it
// has neither, or when it names an explicit template while a template named
// after the view also exists.
TemplatePtr resolve_view_template(TemplateRegistry& registry, const ModuleInfo& module,
                                  const ViewConfig& view,
                                  const std::string& component = "view");
