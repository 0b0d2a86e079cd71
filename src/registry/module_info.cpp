#include "module_info.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <algorithm>
#include <system_error>

std::string ModuleInfo::name() const {
    return last_dotted_component(dotted_name());
}

std::string ModuleInfo::template_dir_name() const {
    return name() + TEMPLATE_DIR_SUFFIX;
}

FilesystemModule::FilesystemModule(std::string dotted_name, fs::path root,
                                   bool is_package,
                                   std::optional<std::string> template_dir)
    : dotted_name_(std::move(dotted_name)),
      root_(fs::absolute(root).lexically_normal()),
      is_package_(is_package),
      template_dir_(std::move(template_dir)) {}

fs::path FilesystemModule::resource_path(const std::string& name) const {
    return root_ / name;
}

std::vector<std::string> FilesystemModule::list_files(const fs::path& dir) const {
    std::vector<std::string> files;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_regular_file(ec)) {
            files.push_back(entry.path().filename().string());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::string FilesystemModule::template_dir_name() const {
    if (template_dir_) return *template_dir_;
    return ModuleInfo::template_dir_name();
}
