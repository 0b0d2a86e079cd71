#include "inline_template_registry.hpp"
#include "conflict_checker.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

void InlineTemplateRegistry::register_template(const ModuleInfo& module, const std::string& name,
                                               TemplatePtr tmpl) {
    InlineTemplateKey key{module.dotted_name(), name};
    if (entries_.count(key)) {
        return;
    }

    if (checker_) {
        auto conflict = checker_->find_file_conflict(module, name);
        if (conflict) {
            tplreg_log(fmt::format("register_template: conflict on {} in {}", name, key.first));
            throw ConflictError(conflict_message(*conflict));
        }
    }

    entries_[key] = InlineTemplateEntry{std::move(tmpl), false};
    tplreg_log(fmt::format("register_template: {}:{}", key.first, name));
}

TemplatePtr InlineTemplateRegistry::lookup(const ModuleInfo& module, const std::string& name,
                                           bool mark_as_associated) {
    auto it = entries_.find({module.dotted_name(), name});
    if (it == entries_.end()) {
        throw TemplateLookupError(fmt::format("inline template '{}' in '{}' cannot be found",
                                              name, module.dotted_name()));
    }
    if (mark_as_associated) {
        it->second.associated = true;
    }
    return it->second.tmpl;
}

void InlineTemplateRegistry::associate(const ModuleInfo& module, const std::string& name) {
    associate(InlineTemplateKey{module.dotted_name(), name});
}

void InlineTemplateRegistry::associate(const InlineTemplateKey& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        tplreg_log(fmt::format("associate: no inline template {}:{}", key.first, key.second));
        return;
    }
    it->second.associated = true;
}

std::set<InlineTemplateKey> InlineTemplateRegistry::unassociated() const {
    std::set<InlineTemplateKey> keys;
    for (const auto& [key, entry] : entries_) {
        if (!entry.associated) keys.insert(key);
    }
    return keys;
}

bool InlineTemplateRegistry::contains(const ModuleInfo& module, const std::string& name) const {
    return entries_.count({module.dotted_name(), name}) > 0;
}
