#pragma once

#include <string>
#include <optional>
#include <core/config.hpp>

class TplregCLI {
public:
    // Register, resolve views and report. Returns the process exit code.
    int run_check(const std::string& path_arg = "");

    // Register and print every template with its association state.
    int run_list(const std::string& path_arg = "");

private:
    bool load_config(const std::string& path_arg);

    std::optional<Config> config_;
};
