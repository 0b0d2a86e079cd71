#include "template.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>

std::string FileTemplate::repr() const {
    return fmt::format("<{} template {}>", kind(), path().string());
}

std::string PageTemplate::kind() const { return KIND_PAGE; }

std::string TextTemplate::kind() const { return KIND_TEXT; }

std::string InlineTemplate::repr() const {
    constexpr size_t preview_len = 40;
    std::string preview = source_.substr(0, preview_len);
    for (auto& c : preview) {
        if (c == '\n' || c == '\r') c = ' ';
    }
    if (source_.size() > preview_len) preview += "...";
    return fmt::format("<inline template \"{}\">", preview);
}

// Builtin kinds, keyed by the name used in the manifest
static TemplateFactory builtin_factory(const std::string& kind) {
    if (kind == KIND_PAGE) {
        return [](const std::string& filename, const fs::path& dir) -> TemplatePtr {
            return std::make_shared<PageTemplate>(filename, dir);
        };
    }
    if (kind == KIND_TEXT) {
        return [](const std::string& filename, const fs::path& dir) -> TemplatePtr {
            return std::make_shared<TextTemplate>(filename, dir);
        };
    }
    return nullptr;
}

TemplateFactoryRegistry TemplateFactoryRegistry::with_defaults() {
    TemplateFactoryRegistry reg;
    reg.add_kind(DEFAULT_PAGE_EXTENSION, KIND_PAGE);
    return reg;
}

void TemplateFactoryRegistry::add(const std::string& extension, TemplateFactory factory) {
    factories_[extension] = std::move(factory);
}

bool TemplateFactoryRegistry::add_kind(const std::string& extension, const std::string& kind) {
    auto factory = builtin_factory(kind);
    if (!factory) return false;
    add(extension, std::move(factory));
    return true;
}

const TemplateFactory* TemplateFactoryRegistry::factory_for(const std::string& extension) const {
    auto it = factories_.find(extension);
    if (it == factories_.end()) return nullptr;
    return &it->second;
}
