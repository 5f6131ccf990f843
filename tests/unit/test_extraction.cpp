#include <gtest/gtest.h>
#include "../../src/core/types/errors.hpp"
#include "../../src/extraction/pipeline.hpp"
#include "../../src/extraction/renderer.hpp"

using namespace OpenCrawl::Extraction;
using OpenCrawl::Core::ExtractionError;

namespace {

const char* kArticlePage = R"(<!DOCTYPE html>
<html>
<head>
  <title>  Sample   Article </title>
  <meta name="description" content="A page about crawling">
  <meta name="keywords" content="crawl, fetch">
  <meta name="author" content="Jane Doe">
  <meta property="og:title" content="OG Sample">
  <meta property="og:image" content="https://cdn.example.com/og.png">
  <style>body { color: red; }</style>
  <script>var tracking = "do not extract";</script>
</head>
<body>
  <header><p>Site header with a long enough line of text</p></header>
  <nav><a href="/home">Home navigation link text</a></nav>
  <article>
    <h1>The article headline</h1>
    <p>Short.</p>
    <p>This paragraph is comfortably longer than fifty characters in total length.</p>
    <!-- hidden comment -->
    <p>Read <a href="/docs/intro#part2">the introduction</a> and <a href="/docs/intro">again</a>.</p>
    <p><a href="mailto:someone@example.com">Mail</a> <a href="#top">Top</a></p>
    <img src="/img/a.png" alt="Diagram A">
    <img src="https://other.example.org/b.jpg" alt="B">
    <img src="/img/a.png" alt="Diagram A again">
  </article>
  <footer><p>Copyright footer text that is long enough</p></footer>
</body>
</html>)";

ExtractionConfig config_for(ExtractionStrategy strategy, int min_text_length = 10) {
    ExtractionConfig config;
    config.strategy                 = strategy;
    config.cleaning.min_text_length = min_text_length;
    return config;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST(ExtractionTest, ParseStrategy) {
    EXPECT_EQ(parse_strategy("html"), ExtractionStrategy::Html);
    EXPECT_EQ(parse_strategy("CONTENT"), ExtractionStrategy::Content);
    EXPECT_EQ(parse_strategy("text"), ExtractionStrategy::Content);
    EXPECT_EQ(parse_strategy("Markdown"), ExtractionStrategy::Markdown);
    EXPECT_EQ(parse_strategy("md"), ExtractionStrategy::Markdown);
    EXPECT_THROW(parse_strategy("pdf"), std::invalid_argument);
    EXPECT_EQ(to_string(ExtractionStrategy::Content), "content");
}

TEST(ExtractionTest, RendererFactory) {
    for (auto strategy : {ExtractionStrategy::Html, ExtractionStrategy::Content, ExtractionStrategy::Markdown})
        EXPECT_EQ(make_renderer(strategy)->strategy(), strategy);
}

TEST(ExtractionTest, MetadataFromHead) {
    ExtractionPipeline pipeline(config_for(ExtractionStrategy::Content));
    auto               result = pipeline.extract(kArticlePage, "https://example.com/blog/post");

    EXPECT_EQ(result.metadata.at("title"), "Sample Article");
    EXPECT_EQ(result.metadata.at("description"), "A page about crawling");
    EXPECT_EQ(result.metadata.at("keywords"), "crawl, fetch");
    EXPECT_EQ(result.metadata.at("author"), "Jane Doe");
    EXPECT_EQ(result.metadata.at("og:title"), "OG Sample");
    EXPECT_EQ(result.metadata.at("og:image"), "https://cdn.example.com/og.png");
    EXPECT_EQ(result.metadata.count("og:description"), 0u);
}

TEST(ExtractionTest, MetadataDisabled) {
    auto config             = config_for(ExtractionStrategy::Content);
    config.extract_metadata = false;
    ExtractionPipeline pipeline(config);
    EXPECT_TRUE(pipeline.extract(kArticlePage, "https://example.com/").metadata.empty());
}

TEST(ExtractionTest, LinksAreAbsoluteAndDeduplicated) {
    ExtractionPipeline pipeline(config_for(ExtractionStrategy::Content));
    auto               result = pipeline.extract(kArticlePage, "https://example.com/blog/post");

    ASSERT_TRUE(result.links.has_value());
    EXPECT_EQ(*result.links,
              (std::vector<std::string>{"https://example.com/home", "https://example.com/docs/intro"}));
}

TEST(ExtractionTest, ImagesAreAbsoluteAndDeduplicated) {
    ExtractionPipeline pipeline(config_for(ExtractionStrategy::Content));
    auto               result = pipeline.extract(kArticlePage, "https://example.com/blog/post");

    ASSERT_TRUE(result.images.has_value());
    EXPECT_EQ(*result.images,
              (std::vector<std::string>{"https://example.com/img/a.png", "https://other.example.org/b.jpg"}));
}

TEST(ExtractionTest, LinksAndImagesCanBeDisabled) {
    auto config           = config_for(ExtractionStrategy::Content);
    config.extract_links  = false;
    config.extract_images = false;
    ExtractionPipeline pipeline(config);
    auto               result = pipeline.extract(kArticlePage, "https://example.com/");
    EXPECT_FALSE(result.links.has_value());
    EXPECT_FALSE(result.images.has_value());
}

TEST(ExtractionTest, BaseHrefIsHonored) {
    const char* html = R"(<html><head><base href="https://mirror.example.net/root/"></head>
<body><a href="page.html">A link with enough text</a><img src="pic.png"></body></html>)";
    ExtractionPipeline pipeline(config_for(ExtractionStrategy::Content));
    auto               result = pipeline.extract(html, "https://example.com/a/b");

    EXPECT_EQ(*result.links, (std::vector<std::string>{"https://mirror.example.net/root/page.html"}));
    EXPECT_EQ(*result.images, (std::vector<std::string>{"https://mirror.example.net/root/pic.png"}));
}

TEST(ExtractionTest, LinksWithUrlsInQueryAreResolved) {
    const char* html = R"(<html><body><a href="/login?next=https://example.com/x">Sign in to continue</a>
<img src="/thumb?src=http://cdn.example.org/a.png"></body></html>)";
    ExtractionPipeline pipeline(config_for(ExtractionStrategy::Content));
    auto               result = pipeline.extract(html, "https://example.com/page");

    EXPECT_EQ(*result.links, (std::vector<std::string>{"https://example.com/login?next=https://example.com/x"}));
    EXPECT_EQ(*result.images, (std::vector<std::string>{"https://example.com/thumb?src=http://cdn.example.org/a.png"}));
}

TEST(ExtractionTest, TitleOnlyFromHead) {
    const char* html = R"(<html><head><meta name="description" content="No title here"></head>
<body><svg><title>Icon</title></svg><p>Body text that is long enough.</p></body></html>)";
    ExtractionPipeline pipeline(config_for(ExtractionStrategy::Content));
    auto               result = pipeline.extract(html, "https://example.com/");

    EXPECT_EQ(result.metadata.count("title"), 0u);
    EXPECT_EQ(result.metadata.at("description"), "No title here");
}

TEST(ExtractionTest, ContentDropsShortBlocks) {
    ExtractionPipeline pipeline(config_for(ExtractionStrategy::Content, 50));
    auto               result = pipeline.extract(kArticlePage, "https://example.com/");

    EXPECT_EQ(result.strategy, ExtractionStrategy::Content);
    EXPECT_EQ(result.content, "This paragraph is comfortably longer than fifty characters in total length.");
}

TEST(ExtractionTest, ContentRemovesScriptsStylesAndComments) {
    ExtractionPipeline pipeline(config_for(ExtractionStrategy::Content, 0));
    auto               result = pipeline.extract(kArticlePage, "https://example.com/");

    EXPECT_FALSE(contains(result.content, "tracking"));
    EXPECT_FALSE(contains(result.content, "color: red"));
    EXPECT_FALSE(contains(result.content, "hidden comment"));
    EXPECT_TRUE(contains(result.content, "The article headline"));
    EXPECT_TRUE(contains(result.content, "Read the introduction and again."));
}

TEST(ExtractionTest, HtmlStrategyKeepsMarkupWithoutNoise) {
    ExtractionPipeline pipeline(config_for(ExtractionStrategy::Html, 0));
    auto               result = pipeline.extract(kArticlePage, "https://example.com/");

    EXPECT_TRUE(contains(result.content, "<article>"));
    EXPECT_TRUE(contains(result.content, "<h1>The article headline</h1>"));
    EXPECT_TRUE(contains(result.content, "<header>"));
    EXPECT_FALSE(contains(result.content, "<script"));
    EXPECT_FALSE(contains(result.content, "<style"));
    EXPECT_FALSE(contains(result.content, "<!--"));
}

TEST(ExtractionTest, StructuralTogglesRemoveRegions) {
    auto config                   = config_for(ExtractionStrategy::Html, 0);
    config.cleaning.strip_nav     = true;
    config.cleaning.strip_headers = true;
    config.cleaning.strip_footers = true;
    ExtractionPipeline pipeline(config);
    auto               result = pipeline.extract(kArticlePage, "https://example.com/");

    EXPECT_FALSE(contains(result.content, "<nav"));
    EXPECT_FALSE(contains(result.content, "<header"));
    EXPECT_FALSE(contains(result.content, "<footer"));
    EXPECT_EQ(*result.links, (std::vector<std::string>{"https://example.com/docs/intro"}));
}

TEST(ExtractionTest, RoleNavigationIsStrippedWithNav) {
    const char* html = R"(<html><body><div role="navigation"><p>Navigation menu entries here</p></div>
<p>Main body paragraph with sufficient text.</p></body></html>)";
    auto config               = config_for(ExtractionStrategy::Content, 0);
    config.cleaning.strip_nav = true;
    ExtractionPipeline pipeline(config);
    EXPECT_EQ(pipeline.extract(html, "").content, "Main body paragraph with sufficient text.");
}

TEST(ExtractionTest, CommentsAndScriptsKeptWhenTogglesOff) {
    auto config                    = config_for(ExtractionStrategy::Html, 0);
    config.cleaning.strip_scripts  = false;
    config.cleaning.strip_comments = false;
    ExtractionPipeline pipeline(config);
    auto               result = pipeline.extract(kArticlePage, "https://example.com/");

    EXPECT_TRUE(contains(result.content, "<script>"));
    EXPECT_TRUE(contains(result.content, "<!-- hidden comment -->"));
    EXPECT_FALSE(contains(result.content, "<style"));
}

TEST(ExtractionTest, MainRegionPreferredOverBody) {
    const char* html = R"(<html><body><p>Sidebar text outside of main region.</p>
<main><p>Main region paragraph that should be extracted.</p></main></body></html>)";
    ExtractionPipeline pipeline(config_for(ExtractionStrategy::Content, 0));
    EXPECT_EQ(pipeline.extract(html, "").content, "Main region paragraph that should be extracted.");
}

TEST(ExtractionTest, ArticleRegionWhenNoMain) {
    ExtractionPipeline pipeline(config_for(ExtractionStrategy::Content, 0));
    auto               result = pipeline.extract(kArticlePage, "https://example.com/");
    EXPECT_FALSE(contains(result.content, "Site header"));
    EXPECT_FALSE(contains(result.content, "Copyright footer"));
}

TEST(ExtractionTest, MarkdownHeadingsListsAndLinks) {
    const char* html = R"(<html><body><main>
<h1>Guide</h1>
<ul><li>First item</li><li>Second item</li></ul>
<p>See <a href="/more">more docs</a> here.</p>
</main></body></html>)";
    ExtractionPipeline pipeline(config_for(ExtractionStrategy::Markdown, 0));
    auto               result = pipeline.extract(html, "https://example.com/guide/");

    EXPECT_EQ(result.strategy, ExtractionStrategy::Markdown);
    EXPECT_TRUE(contains(result.content, "# Guide"));
    EXPECT_TRUE(contains(result.content, "First item"));
    EXPECT_TRUE(contains(result.content, "Second item"));
    EXPECT_TRUE(contains(result.content, "[more docs](https://example.com/more)"));
    EXPECT_FALSE(contains(result.content, "<h1>"));
}

TEST(ExtractionTest, MarkdownWithoutLinksKeepsAnchorText) {
    const char* html =
        R"(<html><body><p>See <a href="/more">more docs</a> here, with enough text.</p></body></html>)";
    auto config          = config_for(ExtractionStrategy::Markdown, 0);
    config.extract_links = false;
    ExtractionPipeline pipeline(config);
    auto               result = pipeline.extract(html, "https://example.com/");

    EXPECT_TRUE(contains(result.content, "more docs"));
    EXPECT_FALSE(contains(result.content, "]("));
}

TEST(ExtractionTest, MarkdownPreservesEmphasis) {
    const char* html =
        R"(<html><body><p>Some <em>emphasised</em> and <strong>strong</strong> words in a paragraph.</p></body></html>)";
    ExtractionPipeline pipeline(config_for(ExtractionStrategy::Markdown, 0));
    auto               result = pipeline.extract(html, "https://example.com/");

    EXPECT_TRUE(contains(result.content, "*emphasised*"));
    EXPECT_TRUE(contains(result.content, "**strong**"));
    EXPECT_FALSE(contains(result.content, "<em>"));
}

TEST(ExtractionTest, MarkdownRendersImagesInline) {
    const char* html = R"(<html><body><p>Diagram follows below here.</p><img src="/img/chart.png" alt="Chart"></body></html>)";
    ExtractionPipeline pipeline(config_for(ExtractionStrategy::Markdown, 0));
    auto               result = pipeline.extract(html, "https://example.com/docs/");

    EXPECT_TRUE(contains(result.content, "![Chart](https://example.com/img/chart.png)"));
}

TEST(ExtractionTest, MarkdownWithoutImagesKeepsAltText) {
    const char* html = R"(<html><body><p>Diagram follows below here.</p><img src="/img/chart.png" alt="Chart"></body></html>)";
    auto config           = config_for(ExtractionStrategy::Markdown, 0);
    config.extract_images = false;
    ExtractionPipeline pipeline(config);
    auto               result = pipeline.extract(html, "https://example.com/docs/");

    EXPECT_TRUE(contains(result.content, "Chart"));
    EXPECT_FALSE(contains(result.content, "!["));
    EXPECT_FALSE(contains(result.content, "chart.png"));
}

TEST(ExtractionTest, StrategyOverridePerCall) {
    ExtractionPipeline pipeline(config_for(ExtractionStrategy::Markdown, 0));
    auto               result = pipeline.extract(kArticlePage, "https://example.com/", ExtractionStrategy::Html);
    EXPECT_EQ(result.strategy, ExtractionStrategy::Html);
    EXPECT_TRUE(contains(result.content, "<article>"));
}

TEST(ExtractionTest, Deterministic) {
    for (auto strategy : {ExtractionStrategy::Html, ExtractionStrategy::Content, ExtractionStrategy::Markdown}) {
        ExtractionPipeline pipeline(config_for(strategy));
        EXPECT_EQ(pipeline.extract(kArticlePage, "https://example.com/x"),
                  pipeline.extract(kArticlePage, "https://example.com/x"));
    }
}

TEST(ExtractionTest, EmptyDocument) {
    ExtractionPipeline pipeline(config_for(ExtractionStrategy::Content));
    auto               result = pipeline.extract("", "https://example.com/");
    EXPECT_EQ(result.content, "");
    EXPECT_TRUE(result.links->empty());
    EXPECT_TRUE(result.images->empty());
}

TEST(ExtractionTest, OversizedDocumentIsRejected) {
    auto config               = config_for(ExtractionStrategy::Content);
    config.max_document_bytes = 64;
    ExtractionPipeline pipeline(config);
    EXPECT_THROW(pipeline.extract(std::string(1000, 'x'), "https://example.com/"), ExtractionError);
}
