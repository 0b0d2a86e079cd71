#include "view_templates.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <cctype>

std::string view_template_name(const ViewConfig& view) {
    if (view.template_name && !view.template_name->empty()) return *view.template_name;
    return to_lower(view.name);
}

static std::string capitalize(const std::string& s) {
    if (s.empty()) return s;
    std::string out = s;
    out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    return out;
}

TemplatePtr resolve_view_template(TemplateRegistry& registry, const ModuleInfo& module,
                                  const ViewConfig& view, const std::string& component) {
    std::string own_name = to_lower(view.name);
    std::string template_name = view_template_name(view);
    std::string qualified = fmt::format("{}.{}", module.dotted_name(), view.name);

    // An explicit template must not shadow one named after the view
    if (own_name != template_name) {
        bool shadowed = true;
        try {
            registry.lookup(module, own_name);
        } catch (const TemplateLookupError&) {
            shadowed = false;
        }
        if (shadowed) {
            throw ViewConfigError(fmt::format(
                "Multiple possible templates for {} '{}'. It uses template '{}', "
                "but there is also a template called '{}'.",
                component, qualified, template_name, own_name));
        }
    }

    TemplatePtr tmpl;
    try {
        tmpl = registry.lookup(module, template_name, true);
    } catch (const TemplateLookupError& e) {
        if (!view.has_render) {
            throw ViewConfigError(fmt::format("{} '{}' has no associated template or 'render' method.",
                                              capitalize(component), qualified));
        }
        tplreg_log(fmt::format("resolve_view_template: {} renders itself ({})", qualified, e.what()));
        return nullptr;
    }

    if (view.has_render && !view.is_form) {
        throw ViewConfigError(fmt::format(
            "Multiple possible ways to render {} '{}'. It has both a 'render' method "
            "as well as an associated template.", component, qualified));
    }

    tplreg_log(fmt::format("resolve_view_template: {} -> {}", qualified, tmpl->repr()));
    return tmpl;
}
