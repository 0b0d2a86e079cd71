#include "template_fixture.hpp"
#include <views/view_templates.hpp>
#include <core/errors.hpp>

class ViewTemplatesTest : public TemplateDirTest {
protected:
    static ViewConfig view(const std::string& name) {
        ViewConfig v;
        v.name = name;
        return v;
    }
};

TEST_F(ViewTemplatesTest, TemplateNameDefaultsToLowerCasedView) {
    EXPECT_EQ(view_template_name(view("Index")), "index");

    ViewConfig v = view("Index");
    v.template_name = "layout";
    EXPECT_EQ(view_template_name(v), "layout");
}

TEST_F(ViewTemplatesTest, ResolvesAndClaimsTemplate) {
    write_file("blog_templates/index.pt");
    FilesystemModule module("app.blog", test_dir);
    TemplateRegistry reg;
    reg.register_directory(module);

    auto tmpl = resolve_view_template(reg, module, view("Index"));

    ASSERT_NE(tmpl, nullptr);
    EXPECT_TRUE(reg.unassociated_file_templates().empty());
}

TEST_F(ViewTemplatesTest, ResolvesInlineTemplate) {
    FilesystemModule module("app.blog", test_dir);
    TemplateRegistry reg;
    auto club = std::make_shared<InlineTemplate>("club");
    reg.register_inline_template(module, "club", club);

    EXPECT_EQ(resolve_view_template(reg, module, view("Club")), club);
    EXPECT_TRUE(reg.unassociated_inline_templates().empty());
}

TEST_F(ViewTemplatesTest, ExplicitTemplate) {
    write_file("blog_templates/layout.pt");
    FilesystemModule module("app.blog", test_dir);
    TemplateRegistry reg;
    reg.register_directory(module);

    ViewConfig v = view("Index");
    v.template_name = "layout";
    EXPECT_NE(resolve_view_template(reg, module, v), nullptr);
}

TEST_F(ViewTemplatesTest, ExplicitTemplateShadowingOwnNameFails) {
    write_file("blog_templates/layout.pt");
    write_file("blog_templates/index.pt");
    FilesystemModule module("app.blog", test_dir);
    TemplateRegistry reg;
    reg.register_directory(module);

    ViewConfig v = view("Index");
    v.template_name = "layout";
    try {
        resolve_view_template(reg, module, v);
        FAIL() << "expected ViewConfigError";
    } catch (const ViewConfigError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("Multiple possible templates"), std::string::npos);
        EXPECT_NE(msg.find("app.blog.Index"), std::string::npos);
    }
}

TEST_F(ViewTemplatesTest, RenderAndTemplateFails) {
    write_file("blog_templates/index.pt");
    FilesystemModule module("app.blog", test_dir);
    TemplateRegistry reg;
    reg.register_directory(module);

    ViewConfig v = view("Index");
    v.has_render = true;
    EXPECT_THROW(resolve_view_template(reg, module, v), ViewConfigError);
}

TEST_F(ViewTemplatesTest, FormMayHaveRenderAndTemplate) {
    write_file("blog_templates/edit.pt");
    FilesystemModule module("app.blog", test_dir);
    TemplateRegistry reg;
    reg.register_directory(module);

    ViewConfig v = view("Edit");
    v.has_render = true;
    v.is_form = true;
    EXPECT_NE(resolve_view_template(reg, module, v), nullptr);
}

TEST_F(ViewTemplatesTest, RenderOnlyViewHasNoTemplate) {
    FilesystemModule module("app.blog", test_dir);
    TemplateRegistry reg;
    reg.register_directory(module);

    ViewConfig v = view("Json");
    v.has_render = true;
    EXPECT_EQ(resolve_view_template(reg, module, v), nullptr);
}

TEST_F(ViewTemplatesTest, NeitherRenderNorTemplateFails) {
    FilesystemModule module("app.blog", test_dir);
    TemplateRegistry reg;
    reg.register_directory(module);

    try {
        resolve_view_template(reg, module, view("Index"));
        FAIL() << "expected ViewConfigError";
    } catch (const ViewConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("has no associated template or 'render' method"),
                  std::string::npos);
        EXPECT_EQ(std::string(e.what()).rfind("View ", 0), 0u);
    }
}
