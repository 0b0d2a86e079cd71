#include "template_fixture.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>

class ConfigTest : public TemplateDirTest {};

TEST_F(ConfigTest, MissingManifest) {
    auto result = Config::load(test_dir);
    EXPECT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("Manifest not found"), std::string::npos);
}

TEST_F(ConfigTest, MalformedYaml) {
    write_file(MANIFEST_FILENAME, "modules: [\n  - name: {\n");
    auto result = Config::load(test_dir);
    EXPECT_TRUE(result.is_err());
}

TEST_F(ConfigTest, ParsesModulesAndViews) {
    write_file(MANIFEST_FILENAME,
        "strict: true\n"
        "extensions:\n"
        "  pt: page\n"
        "  .txt: text\n"
        "modules:\n"
        "  - name: app.blog\n"
        "    path: app/blog\n"
        "    templatedir: views\n"
        "    inline:\n"
        "      club: \"<h1>club</h1>\"\n"
        "    views:\n"
        "      - Index\n"
        "      - name: Edit\n"
        "        template: form\n"
        "        render: true\n"
        "        form: true\n"
        "  - name: app\n"
        "    path: /srv/app\n"
        "    package: true\n");

    auto result = Config::load(test_dir);
    ASSERT_TRUE(result.is_ok()) << result.error;
    const auto& m = result.value.manifest();

    EXPECT_EQ(result.value.project_dir(), test_dir);
    EXPECT_TRUE(m.strict);
    EXPECT_EQ(m.extensions.size(), 2u);
    EXPECT_EQ(m.extensions.at("txt"), "text");

    ASSERT_EQ(m.modules.size(), 2u);
    const auto& blog = m.modules[0];
    EXPECT_EQ(blog.dotted_name, "app.blog");
    EXPECT_EQ(blog.path, (test_dir / "app/blog").lexically_normal().string());
    EXPECT_FALSE(blog.is_package);
    ASSERT_TRUE(blog.template_dir.has_value());
    EXPECT_EQ(*blog.template_dir, "views");
    EXPECT_EQ(blog.inline_templates.at("club"), "<h1>club</h1>");

    ASSERT_EQ(blog.views.size(), 2u);
    EXPECT_EQ(blog.views[0].name, "Index");
    EXPECT_FALSE(blog.views[0].template_name.has_value());
    EXPECT_EQ(blog.views[1].template_name.value_or(""), "form");
    EXPECT_TRUE(blog.views[1].has_render);
    EXPECT_TRUE(blog.views[1].is_form);

    EXPECT_EQ(m.modules[1].path, "/srv/app");
    EXPECT_TRUE(m.modules[1].is_package);
}

TEST_F(ConfigTest, DefaultExtensionMapping) {
    write_file(MANIFEST_FILENAME, "modules:\n  - name: app.blog\n");
    auto result = Config::load(test_dir);
    ASSERT_TRUE(result.is_ok()) << result.error;

    const auto& exts = result.value.manifest().extensions;
    ASSERT_EQ(exts.size(), 1u);
    EXPECT_EQ(exts.at("pt"), "page");
    EXPECT_FALSE(result.value.manifest().strict);
}

TEST_F(ConfigTest, UnknownKindRejected) {
    write_file(MANIFEST_FILENAME, "extensions:\n  html: jinja\n");
    auto result = Config::load(test_dir);
    EXPECT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("jinja"), std::string::npos);
}

TEST_F(ConfigTest, ModuleWithoutNameRejected) {
    write_file(MANIFEST_FILENAME, "modules:\n  - path: app\n");
    auto result = Config::load(test_dir);
    EXPECT_TRUE(result.is_err());
}

TEST_F(ConfigTest, LoadFileResolvesAgainstManifestDirectory) {
    write_file("conf/site.yaml", "modules:\n  - name: app.blog\n    path: ../app\n");
    auto result = Config::load_file(test_dir / "conf/site.yaml");
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.project_dir(), test_dir / "conf");
    EXPECT_EQ(result.value.manifest().modules[0].path,
              (test_dir / "app").lexically_normal().string());
}
