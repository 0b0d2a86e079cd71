#pragma once

#include <string>
#include <map>
#include <set>
#include <utility>
#include "module_info.hpp"
#include "template.hpp"

class ConflictChecker;

// (module dotted name, template name)
using InlineTemplateKey = std::pair<std::string, std::string>;

struct InlineTemplateEntry {
    TemplatePtr tmpl;
    bool associated = false;
};

// Templates declared in code, keyed by (module, name).
class InlineTemplateRegistry {
public:
    void set_conflict_checker(const ConflictChecker* checker) { checker_ = checker; }

    // Re-registering an existing key is a no-op. Throws ConflictError if the
    // module's template directory already holds a file template of that name.
    void register_template(const ModuleInfo& module, const std::string& name, TemplatePtr tmpl);

    // Throws TemplateLookupError.
    TemplatePtr lookup(const ModuleInfo& module, const std::string& name,
                       bool mark_as_associated = false);

    void associate(const ModuleInfo& module, const std::string& name);
    void associate(const InlineTemplateKey& key);

    std::set<InlineTemplateKey> unassociated() const;

    bool contains(const ModuleInfo& module, const std::string& name) const;

    const std::map<InlineTemplateKey, InlineTemplateEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    void clear() { entries_.clear(); }

private:
    const ConflictChecker* checker_ = nullptr;
    std::map<InlineTemplateKey, InlineTemplateEntry> entries_;
};
