#include <gtest/gtest.h>
#include <registry/inline_template_registry.hpp>
#include <registry/module_info.hpp>
#include <core/errors.hpp>

// Inline templates never touch the disk; the module root is never read.
static FilesystemModule blog_module() {
    return FilesystemModule("app.blog", "/nonexistent/app/blog");
}

TEST(InlineTemplateRegistry, RegisterAndLookup) {
    InlineTemplateRegistry reg;
    auto module = blog_module();
    auto tmpl = std::make_shared<InlineTemplate>("<h1>club</h1>");

    reg.register_template(module, "club", tmpl);

    EXPECT_EQ(reg.size(), 1u);
    EXPECT_TRUE(reg.contains(module, "club"));
    EXPECT_EQ(reg.lookup(module, "club"), tmpl);
}

TEST(InlineTemplateRegistry, LookupMissingNamesTemplateAndModule) {
    InlineTemplateRegistry reg;
    auto module = blog_module();

    try {
        reg.lookup(module, "club");
        FAIL() << "expected TemplateLookupError";
    } catch (const TemplateLookupError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("'club'"), std::string::npos);
        EXPECT_NE(msg.find("'app.blog'"), std::string::npos);
    }
}

TEST(InlineTemplateRegistry, ReRegisteringSameKeyIsNoOp) {
    InlineTemplateRegistry reg;
    auto module = blog_module();
    auto first = std::make_shared<InlineTemplate>("first");
    auto second = std::make_shared<InlineTemplate>("second");

    reg.register_template(module, "club", first);
    reg.associate(module, "club");
    EXPECT_NO_THROW(reg.register_template(module, "club", second));

    EXPECT_EQ(reg.size(), 1u);
    EXPECT_EQ(reg.lookup(module, "club"), first);
    EXPECT_TRUE(reg.unassociated().empty());
}

TEST(InlineTemplateRegistry, KeyedByModuleDottedName) {
    InlineTemplateRegistry reg;
    FilesystemModule blog("app.blog", "/nonexistent/a");
    FilesystemModule same_name("app.blog", "/nonexistent/b");
    FilesystemModule wiki("app.wiki", "/nonexistent/a");

    reg.register_template(blog, "club", std::make_shared<InlineTemplate>("x"));

    EXPECT_TRUE(reg.contains(same_name, "club"));
    EXPECT_FALSE(reg.contains(wiki, "club"));
    EXPECT_THROW(reg.lookup(wiki, "club"), TemplateLookupError);
}

TEST(InlineTemplateRegistry, UnassociatedTracksClaims) {
    InlineTemplateRegistry reg;
    auto module = blog_module();
    reg.register_template(module, "club", std::make_shared<InlineTemplate>("club"));
    reg.register_template(module, "cave", std::make_shared<InlineTemplate>("cave"));

    auto before = reg.unassociated();
    EXPECT_EQ(before.size(), 2u);
    EXPECT_TRUE(before.count({"app.blog", "club"}));

    reg.lookup(module, "club", true);
    auto after = reg.unassociated();
    EXPECT_EQ(after.size(), 1u);
    EXPECT_TRUE(after.count({"app.blog", "cave"}));

    reg.associate(module, "club");
    EXPECT_EQ(reg.unassociated(), after);
}

TEST(InlineTemplateRegistry, AssociateUnknownIsIgnored) {
    InlineTemplateRegistry reg;
    auto module = blog_module();

    EXPECT_NO_THROW(reg.associate(module, "club"));
    EXPECT_EQ(reg.size(), 0u);
}

TEST(InlineTemplateRegistry, InlineTemplateRepr) {
    InlineTemplate tmpl("<html>\n<body>hi</body>\n</html>");
    EXPECT_EQ(tmpl.repr(), "<inline template \"<html> <body>hi</body> </html>\">");
}
