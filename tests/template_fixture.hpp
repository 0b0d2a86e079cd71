#pragma once

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Scratch directory per test, removed afterwards. Module "app.blog" rooted at
// test_dir looks for its templates in test_dir/blog_templates.
class TemplateDirTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::vector<std::string> warnings;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = fs::temp_directory_path() /
                   (std::string("tplreg_test_") + info->test_suite_name() + "_" + info->name());
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_file(const std::string& rel_path, const std::string& content = "") {
        auto full = test_dir / rel_path;
        fs::create_directories(full.parent_path());
        std::ofstream(full) << content;
    }

    std::string path_of(const std::string& rel_path) const {
        return (test_dir / rel_path).lexically_normal().string();
    }

    auto warning_sink() {
        return [this](const std::string& msg) { warnings.push_back(msg); };
    }
};
