#include "fakes.hpp"
#include <diagram_integrations/block_integration.hpp>
#include <diagram_integrations/line_text.hpp>
#include <gtest/gtest.h>

namespace {

class IntegrationTest : public ::testing::Test {
protected:
    fakes::TempDir dir;
    fakes::FakeJobs jobs;
    fakes::FakeHost host;
    diagram_integrations::RendererList renderers = {
        std::make_shared<fakes::FakeRenderer>("mermaid", dir.path(), fakes::FakeRenderer::Mode::Ready),
        std::make_shared<fakes::FakeRenderer>("plantuml", dir.path(), fakes::FakeRenderer::Mode::Ready),
    };
};

TEST(LineTextTest, BlanksAreSpacesTabsAndCarriageReturns) {
    EXPECT_EQ(diagram_integrations::leading_blanks(" \t @code"), 3u);
    EXPECT_EQ(diagram_integrations::leading_blanks("@end"), 0u);
    EXPECT_EQ(diagram_integrations::leading_blanks("   "), 3u);
    EXPECT_EQ(diagram_integrations::trim_blanks("  @end \r"), "@end");
    EXPECT_EQ(diagram_integrations::trim_blanks(" \t\r"), "");
}

TEST_F(IntegrationTest, MarkdownFindsFencedDiagramsInOrder) {
    host.add_buffer(1, "markdown", {
        "# Title",                 // 0
        "",                        // 1
        "```mermaid",              // 2
        "graph TD",                // 3
        "  A --> B",               // 4
        "```",                     // 5
        "text",                    // 6
        "  ~~~~ plantuml",         // 7
        "Alice -> Bob",            // 8
        "  ~~~~",                  // 9
    });
    diagram_integrations::MarkdownIntegration markdown(renderers);

    const auto diagrams = markdown.query_buffer_diagrams(host, 1);
    ASSERT_EQ(diagrams.size(), 2u);

    EXPECT_EQ(diagrams[0].buffer_id, 1);
    EXPECT_EQ(diagrams[0].renderer_id, "mermaid");
    EXPECT_EQ(diagrams[0].source, "graph TD\n  A --> B\n");
    EXPECT_EQ(diagrams[0].range.start_row, 2);
    EXPECT_EQ(diagrams[0].range.start_col, 0);
    EXPECT_EQ(diagrams[0].range.end_row, 5);
    EXPECT_EQ(diagrams[0].image, nullptr);

    EXPECT_EQ(diagrams[1].renderer_id, "plantuml");
    EXPECT_EQ(diagrams[1].source, "Alice -> Bob\n");
    EXPECT_EQ(diagrams[1].range.start_row, 7);
    EXPECT_EQ(diagrams[1].range.start_col, 2);
    EXPECT_EQ(diagrams[1].range.end_row, 9);
}

TEST_F(IntegrationTest, MarkdownSkipsOtherLanguagesAndUnterminatedBlocks) {
    host.add_buffer(1, "markdown", {
        "```cpp",
        "```mermaid",   // content of the cpp block, not a fence opener
        "```",
        "```mermaid {theme=dark}",
        "graph LR",
        "````",         // longer closing fence is fine
        "```mermaid",
        "graph TD",
    });
    diagram_integrations::MarkdownIntegration markdown(renderers);

    const auto diagrams = markdown.query_buffer_diagrams(host, 1);
    ASSERT_EQ(diagrams.size(), 1u);
    EXPECT_EQ(diagrams[0].range.start_row, 3);
    EXPECT_EQ(diagrams[0].source, "graph LR\n");
}

TEST_F(IntegrationTest, MarkdownShorterClosingFenceDoesNotClose) {
    host.add_buffer(1, "markdown", {
        "````mermaid",
        "```",
        "graph TD",
        "````",
    });
    diagram_integrations::MarkdownIntegration markdown(renderers);
    const auto diagrams = markdown.query_buffer_diagrams(host, 1);
    ASSERT_EQ(diagrams.size(), 1u);
    EXPECT_EQ(diagrams[0].source, "```\ngraph TD\n");
    EXPECT_EQ(diagrams[0].range.end_row, 3);
}

TEST_F(IntegrationTest, NeorgRangeStartsBelowTheCodeTag) {
    host.add_buffer(4, "norg", {
        "* Heading",        // 0
        "  @code mermaid",  // 1
        "  graph TD",       // 2
        "  A-->B",          // 3
        "  @end",           // 4
        "@code lua",        // 5
        "print(1)",         // 6
        "@end",             // 7
        "@codeblock",       // 8
    });
    diagram_integrations::NeorgIntegration neorg(renderers);

    const auto diagrams = neorg.query_buffer_diagrams(host, 4);
    ASSERT_EQ(diagrams.size(), 1u);
    EXPECT_EQ(diagrams[0].renderer_id, "mermaid");
    EXPECT_EQ(diagrams[0].source, "  graph TD\n  A-->B\n");
    EXPECT_EQ(diagrams[0].range.start_row, 2);
    EXPECT_EQ(diagrams[0].range.start_col, 2);
    EXPECT_EQ(diagrams[0].range.end_row, 4);
}

TEST_F(IntegrationTest, DeclaresFiletypesAndRenderers) {
    diagram_integrations::MarkdownIntegration markdown(renderers);
    diagram_integrations::NeorgIntegration neorg(renderers);

    EXPECT_TRUE(markdown.handles_filetype("markdown"));
    EXPECT_FALSE(markdown.handles_filetype("norg"));
    EXPECT_TRUE(neorg.handles_filetype("norg"));
    EXPECT_EQ(markdown.find_renderer("plantuml"), renderers[1].get());
    EXPECT_EQ(markdown.find_renderer("d2"), nullptr);
}

TEST_F(IntegrationTest, BuiltinLookupByName) {
    EXPECT_EQ(diagram_integrations::builtin_integration_names().size(), 2u);
    auto markdown = diagram_integrations::make_builtin_integration("markdown", renderers);
    ASSERT_NE(markdown, nullptr);
    EXPECT_EQ(markdown->name(), "markdown");
    auto neorg = diagram_integrations::make_builtin_integration("neorg", renderers);
    ASSERT_NE(neorg, nullptr);
    EXPECT_EQ(neorg->filetypes(), std::vector<std::string>{ "norg" });
    EXPECT_EQ(diagram_integrations::make_builtin_integration("asciidoc", renderers), nullptr);
}

TEST_F(IntegrationTest, FirstMatchingIntegrationWins) {
    auto first = std::make_shared<fakes::FakeIntegration>("a", std::vector<std::string>{ "markdown" }, renderers);
    auto second = std::make_shared<fakes::FakeIntegration>("b", std::vector<std::string>{ "markdown", "norg" }, renderers);
    const diagram_model::IntegrationList list = { first, second };

    EXPECT_EQ(diagram_model::find_integration_for(list, "markdown"), first.get());
    EXPECT_EQ(diagram_model::find_integration_for(list, "norg"), second.get());
    EXPECT_EQ(diagram_model::find_integration_for(list, "text"), nullptr);
}

} // namespace
