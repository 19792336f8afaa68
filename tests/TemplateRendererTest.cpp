#include <gtest/gtest.h>

#include <memory>

#include "HttpError.hpp"
#include "TempDir.hpp"
#include "TemplateRenderer.hpp"

using namespace minnow;

TEST(TemplateRendererTest, SubstitutesVariables) {
    boost::json::object vars{{"title", "Hi"}, {"count", 3}, {"gone", nullptr}};
    EXPECT_EQ(FileTemplateRenderer::substitute("<h1>{{ title }}</h1>{{count}}", vars),
              "<h1>Hi</h1>3");
    EXPECT_EQ(FileTemplateRenderer::substitute("[{{ gone }}][{{ unknown }}]", vars), "[][]");
    EXPECT_EQ(FileTemplateRenderer::substitute("open {{ title", vars), "open {{ title");
}

TEST(TemplateRendererTest, RendersFromDirectory) {
    test::TempDir dir;
    dir.write("page.html", "Hello {{ name }}!");
    FileTemplateRenderer renderer(dir.path());
    EXPECT_EQ(renderer.render("page.html", {{"name", "Ada"}}), "Hello Ada!");
    EXPECT_THROW(renderer.render("missing.html", {}), NotFound);
    EXPECT_THROW(renderer.render("../page.html", {}), ForbiddenPath);
}

TEST(TemplateRendererTest, UnconfiguredTemplatesAreUnavailable) {
    Templates templates;
    EXPECT_FALSE(templates.available());
    try {
        templates.render("index.html");
        FAIL() << "expected TemplateUnavailable";
    } catch (const TemplateUnavailable& e) {
        EXPECT_EQ(e.status(), 500);
        EXPECT_EQ(e.kind(), ErrorKind::TemplateUnavailable);
    }

    test::TempDir dir;
    dir.write("index.html", "ok");
    templates.configure(std::make_shared<FileTemplateRenderer>(dir.path()));
    EXPECT_TRUE(templates.available());
    EXPECT_EQ(templates.render("index.html"), "ok");
}
