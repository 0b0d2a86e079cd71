#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <filesystem>

namespace fs = std::filesystem;

// Opaque handle to something renderable. The registry only ever prints it.
class Template {
public:
    virtual ~Template() = default;
    virtual std::string repr() const = 0;
};

using TemplatePtr = std::shared_ptr<Template>;

// Template read from a file by a renderer later on. Only remembers where it lives.
class FileTemplate : public Template {
public:
    FileTemplate(std::string filename, fs::path dir)
        : filename_(std::move(filename)), dir_(std::move(dir)) {}

    const std::string& filename() const { return filename_; }
    const fs::path& dir() const { return dir_; }
    fs::path path() const { return dir_ / filename_; }

    virtual std::string kind() const = 0;
    std::string repr() const override;

private:
    std::string filename_;
    fs::path dir_;
};

class PageTemplate : public FileTemplate {
public:
    using FileTemplate::FileTemplate;
    std::string kind() const override;
};

class TextTemplate : public FileTemplate {
public:
    using FileTemplate::FileTemplate;
    std::string kind() const override;
};

// Template declared in code or in the manifest.
class InlineTemplate : public Template {
public:
    explicit InlineTemplate(std::string source) : source_(std::move(source)) {}

    std::string repr() const override;

private:
    std::string source_;
};

// Builds a template from (filename, directory).
using TemplateFactory = std::function<TemplatePtr(const std::string&, const fs::path&)>;

// Maps a file extension (without the leading dot) to its template factory.
class TemplateFactoryRegistry {
public:
    // Registry with the builtin "pt" -> page mapping.
    static TemplateFactoryRegistry with_defaults();

    void add(const std::string& extension, TemplateFactory factory);

    // Register one of the builtin kinds ("page", "text") for an extension.
    // Returns false if the kind is unknown.
    bool add_kind(const std::string& extension, const std::string& kind);

    // Returns nullptr if no factory handles the extension.
    const TemplateFactory* factory_for(const std::string& extension) const;

private:
    std::map<std::string, TemplateFactory> factories_;
};
