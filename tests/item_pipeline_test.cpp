#include "crawlforge/crawl/item_pipeline.hpp"

#include "gtest/gtest.h"

#include <string>

using namespace crawlforge;

namespace {

auto make_item(std::string url, std::string title) -> JsonValue {
  JsonValue item = JsonValue::object_t{};
  item["url"] = std::move(url);
  item["title"] = std::move(title);
  return item;
}

} // namespace

TEST(ItemPipelineTest, StampsProvenance) {
  ItemPipeline pipeline({}, TaskId{"task-7"}, "example_spider");

  auto out = pipeline.process(make_item("https://example.com/1", "One"));
  ASSERT_TRUE(out.has_value());

  auto parsed = parse_json(*out);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*json_string(*parsed, "url"), "https://example.com/1");
  EXPECT_EQ(*json_string(*parsed, "title"), "One");
  EXPECT_EQ(*json_string(*parsed, "spider_name"), "example_spider");
  EXPECT_EQ(*json_string(*parsed, "task_id"), "task-7");
  const auto *crawled_at = json_string(*parsed, "crawled_at");
  ASSERT_NE(crawled_at, nullptr);
  EXPECT_FALSE(crawled_at->empty());
  EXPECT_EQ(pipeline.accepted(), 1U);
  EXPECT_EQ(pipeline.dropped(), 0U);
}

TEST(ItemPipelineTest, RejectsNonObjects) {
  ItemPipeline pipeline({}, TaskId{"t"}, "example_spider");
  auto out = pipeline.process(JsonValue::array_t{});
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), make_error_code(Error::InvalidArgument));
  EXPECT_EQ(pipeline.dropped(), 1U);
}

TEST(ItemPipelineTest, RejectsMissingOrNonHttpUrl) {
  ItemPipeline pipeline({}, TaskId{"t"}, "example_spider");

  JsonValue no_url = JsonValue::object_t{};
  no_url["title"] = "x";
  EXPECT_EQ(pipeline.process(no_url).error(),
            make_error_code(Error::InvalidArgument));
  EXPECT_EQ(pipeline.process(make_item("ftp://example.com/a", "x")).error(),
            make_error_code(Error::InvalidArgument));
  EXPECT_EQ(pipeline.dropped(), 2U);
  EXPECT_EQ(pipeline.accepted(), 0U);
}

TEST(ItemPipelineTest, UrlValidationCanBeDisabled) {
  ItemPipeline pipeline(PipelineOptions{.validate_urls = false},
                        TaskId{"t"}, "example_spider");
  EXPECT_TRUE(pipeline.process(make_item("not-a-url", "x")).has_value());
}

TEST(ItemPipelineTest, DropsDuplicatesByUrlAndTitle) {
  ItemPipeline pipeline({}, TaskId{"t"}, "example_spider");

  ASSERT_TRUE(pipeline.process(make_item("https://a.test/1", "A")).has_value());
  auto dup = pipeline.process(make_item("https://a.test/1", "A"));
  ASSERT_FALSE(dup.has_value());
  EXPECT_EQ(dup.error(), make_error_code(Error::AlreadyExists));

  // Same url, different title is a distinct item.
  EXPECT_TRUE(pipeline.process(make_item("https://a.test/1", "B")).has_value());
  EXPECT_EQ(pipeline.accepted(), 2U);
  EXPECT_EQ(pipeline.dropped(), 1U);
}

TEST(ItemPipelineTest, DeduplicationCanBeDisabled) {
  ItemPipeline pipeline(PipelineOptions{.deduplicate = false}, TaskId{"t"},
                        "example_spider");
  EXPECT_TRUE(pipeline.process(make_item("https://a.test/1", "A")).has_value());
  EXPECT_TRUE(pipeline.process(make_item("https://a.test/1", "A")).has_value());
  EXPECT_EQ(pipeline.accepted(), 2U);
}

TEST(ItemPipelineTest, PipelinesDoNotShareState) {
  ItemPipeline first({}, TaskId{"t1"}, "example_spider");
  ItemPipeline second({}, TaskId{"t2"}, "example_spider");
  ASSERT_TRUE(first.process(make_item("https://a.test/1", "A")).has_value());
  EXPECT_TRUE(second.process(make_item("https://a.test/1", "A")).has_value());
}
