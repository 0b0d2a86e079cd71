#pragma once

#include <stdexcept>
#include <string>

// Two templates would resolve to the same (module, name) pair.
class ConflictError : public std::runtime_error {
public:
    explicit ConflictError(const std::string& msg) : std::runtime_error(msg) {}
};

// A (module, name) pair did not resolve to any registered template.
class TemplateLookupError : public std::runtime_error {
public:
    explicit TemplateLookupError(const std::string& msg) : std::runtime_error(msg) {}
};

// A view is wired to its template in an unusable way.
class ViewConfigError : public std::runtime_error {
public:
    explicit ViewConfigError(const std::string& msg) : std::runtime_error(msg) {}
};
