/**
 * @file test_result.cpp
 * @brief Tests for result assembly, timestamps and the JSON codec
 */

#include <gtest/gtest.h>
#include "fanout/registry.hpp"
#include "fanout/result.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace fanout {
namespace testing {

namespace {

Timestamp at(long long secondsSinceEpoch, long long nanos) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::seconds(secondsSinceEpoch) + std::chrono::nanoseconds(nanos)));
}

}

TEST(TimestampTest, FormatsRfc3339WithNanoseconds) {
    // 2026-10-18T09:00:00Z
    EXPECT_EQ(formatTimestamp(at(1792314000, 123456789)), "2026-10-18T09:00:00.123456789Z");
    EXPECT_EQ(formatTimestamp(at(0, 0)), "1970-01-01T00:00:00.000000000Z");
}

TEST(TimestampTest, ParsesVariousFractions) {
    EXPECT_EQ(parseTimestamp("2026-10-18T09:00:00.123456789Z"), at(1792314000, 123456789));
    EXPECT_EQ(parseTimestamp("2026-10-18T09:00:00.5Z"), at(1792314000, 500000000));
    EXPECT_EQ(parseTimestamp("2026-10-18T09:00:00Z"), at(1792314000, 0));
    EXPECT_EQ(parseTimestamp("2026-10-18T09:00:00.25+00:00"), at(1792314000, 250000000));
}

TEST(TimestampTest, RejectsMalformed) {
    EXPECT_FALSE(parseTimestamp("").has_value());
    EXPECT_FALSE(parseTimestamp("2026-10-18 09:00:00Z").has_value());
    EXPECT_FALSE(parseTimestamp("2026-10-18T09:00:00.Z").has_value());
    EXPECT_FALSE(parseTimestamp("2026-10-18T09:00:00.1234567891Z").has_value());
    EXPECT_FALSE(parseTimestamp("2026-10-18T09:00:00+02:00").has_value());
    EXPECT_FALSE(parseTimestamp("2026-13-18T09:00:00Z").has_value());
    EXPECT_FALSE(parseTimestamp("+026-10-18T09:00:00Z").has_value());
    EXPECT_FALSE(parseTimestamp("2026-1-018T09:00:00Z").has_value());
    EXPECT_FALSE(parseTimestamp("2026-10-18T09:00:60Z").has_value());
}

// Test days are checked against the length of their month
TEST(TimestampTest, RejectsDayOutsideMonth) {
    EXPECT_FALSE(parseTimestamp("2026-02-31T00:00:00Z").has_value());
    EXPECT_FALSE(parseTimestamp("2026-04-31T00:00:00Z").has_value());
    EXPECT_FALSE(parseTimestamp("2026-02-29T00:00:00Z").has_value());
    EXPECT_TRUE(parseTimestamp("2028-02-29T00:00:00Z").has_value());
    EXPECT_TRUE(parseTimestamp("2000-02-29T00:00:00Z").has_value());
    EXPECT_FALSE(parseTimestamp("2100-02-29T00:00:00Z").has_value());
}

// Test the snapshot has one entry per task holding its stdout
TEST(ResultTest, AssemblesEveryTask) {
    Registry registry(std::vector<std::string>{"a", "b", "c"}, 3);
    registry.setStdout(2, "test\n");
    auto started = at(1792314000, 0);
    auto ended = at(1792314001, 5);

    auto result = assembleResult(registry, started, ended);
    EXPECT_EQ(result.metadata.started, started);
    EXPECT_EQ(result.metadata.ended, ended);
    ASSERT_EQ(result.tasks.size(), 3u);
    EXPECT_EQ(result.tasks.at(0).stdoutContent, "");
    EXPECT_EQ(result.tasks.at(1).stdoutContent, "");
    EXPECT_EQ(result.tasks.at(2).stdoutContent, "test\n");
}

TEST(ResultTest, JsonLayout) {
    Result result;
    result.metadata.started = at(1792314000, 1);
    result.metadata.ended = at(1792314002, 2);
    result.tasks[0].stdoutContent = "";
    result.tasks[1].stdoutContent = "line \"quoted\"\n";

    auto parsed = nlohmann::json::parse(serializeResult(result, OutputFormat::Json));
    EXPECT_EQ(parsed["metadata"]["started"], "2026-10-18T09:00:00.000000001Z");
    EXPECT_EQ(parsed["metadata"]["ended"], "2026-10-18T09:00:02.000000002Z");
    ASSERT_EQ(parsed["tasks"].size(), 2u);
    EXPECT_EQ(parsed["tasks"]["0"]["stdout"], "");
    EXPECT_EQ(parsed["tasks"]["1"]["stdout"], "line \"quoted\"\n");
}

// Test serialize -> parse -> serialize is byte-identical and loses no precision
TEST(ResultTest, JsonRoundTripIsStable) {
    Result result;
    result.metadata.started = at(1792314000, 987654321);
    result.metadata.ended = at(1792314001, 1);
    for (TaskId id = 0; id < 12; ++id) {
        result.tasks[id].stdoutContent = "out " + std::to_string(id) + "\n\ttabbed\n";
    }

    std::string first = serializeResult(result, OutputFormat::Json);
    Result parsed = parseResult(first, OutputFormat::Json);
    std::string second = serializeResult(parsed, OutputFormat::Json);

    EXPECT_EQ(first, second);
    EXPECT_EQ(parsed.metadata.started, result.metadata.started);
    EXPECT_EQ(parsed.metadata.ended, result.metadata.ended);
    ASSERT_EQ(parsed.tasks.size(), 12u);
    EXPECT_EQ(parsed.tasks.at(11).stdoutContent, "out 11\n\ttabbed\n");
}

// Test task entries are written in id order, not string order
TEST(ResultTest, TasksInIdOrder) {
    Result result;
    for (TaskId id = 0; id < 11; ++id) {
        result.tasks[id].stdoutContent = "";
    }
    std::string text = serializeResult(result, OutputFormat::Json);
    EXPECT_LT(text.find("\"2\""), text.find("\"10\""));
}

TEST(ResultTest, ParseRejectsMalformed) {
    EXPECT_THROW((void)parseResult("not json", OutputFormat::Json), ResultFormatError);
    EXPECT_THROW((void)parseResult("{}", OutputFormat::Json), ResultFormatError);
    EXPECT_THROW((void)parseResult(R"({"metadata":{"started":"x","ended":"y"},"tasks":{}})",
                                   OutputFormat::Json),
                 ResultFormatError);
    EXPECT_THROW((void)parseResult(R"({"metadata":{"started":"2026-10-18T09:00:00Z",)"
                                   R"("ended":"2026-10-18T09:00:00Z"},"tasks":{"a":{"stdout":""}}})",
                                   OutputFormat::Json),
                 ResultFormatError);
}

// Test task keys must be canonical so no two keys name the same task
TEST(ResultTest, ParseRejectsNonCanonicalKeys) {
    const std::string head =
        R"({"metadata":{"started":"2026-10-18T09:00:00Z","ended":"2026-10-18T09:00:00Z"},"tasks":)";
    EXPECT_THROW((void)parseResult(head + R"({"01":{"stdout":""}}})", OutputFormat::Json),
                 ResultFormatError);
    EXPECT_THROW((void)parseResult(head + R"({"1":{"stdout":"a"},"01":{"stdout":"b"}}})",
                                   OutputFormat::Json),
                 ResultFormatError);
    EXPECT_THROW((void)parseResult(head + R"({"-1":{"stdout":""}}})", OutputFormat::Json),
                 ResultFormatError);

    auto parsed = parseResult(head + R"({"0":{"stdout":"x"},"10":{"stdout":"y"}}})", OutputFormat::Json);
    ASSERT_EQ(parsed.tasks.size(), 2u);
    EXPECT_EQ(parsed.tasks.at(10).stdoutContent, "y");
}

TEST(ResultTest, YamlRoundTripIsStable) {
    Result result;
    result.metadata.started = at(1792314000, 987654321);
    result.metadata.ended = at(1792314001, 1);
    result.tasks[0].stdoutContent = "";
    result.tasks[1].stdoutContent = "test\n";
    result.tasks[2].stdoutContent = "key: value\n\t- \"quoted\"\n";

    std::string first = serializeResult(result, OutputFormat::Yaml);
    Result parsed = parseResult(first, OutputFormat::Yaml);
    std::string second = serializeResult(parsed, OutputFormat::Yaml);

    EXPECT_EQ(first, second);
    EXPECT_EQ(parsed.metadata.started, result.metadata.started);
    EXPECT_EQ(parsed.metadata.ended, result.metadata.ended);
    ASSERT_EQ(parsed.tasks.size(), 3u);
    EXPECT_EQ(parsed.tasks.at(0).stdoutContent, "");
    EXPECT_EQ(parsed.tasks.at(1).stdoutContent, "test\n");
    EXPECT_EQ(parsed.tasks.at(2).stdoutContent, "key: value\n\t- \"quoted\"\n");
    EXPECT_NE(first.find("2026-10-18T09:00:00.987654321Z"), std::string::npos);
}

TEST(ResultTest, YamlParseRejectsMalformed) {
    EXPECT_THROW((void)parseResult("tasks: [", OutputFormat::Yaml), ResultFormatError);
    EXPECT_THROW((void)parseResult("metadata: {}\ntasks: {}\n", OutputFormat::Yaml), ResultFormatError);
    EXPECT_THROW((void)parseResult("metadata:\n  started: 2026-10-18T09:00:00Z\n"
                                   "  ended: 2026-10-18T09:00:00Z\n"
                                   "tasks:\n  \"01\":\n    stdout: \"\"\n",
                                   OutputFormat::Yaml),
                 ResultFormatError);
}

TEST(OutputFormatTest, ParsesNames) {
    EXPECT_EQ(parseOutputFormat("json"), OutputFormat::Json);
    EXPECT_EQ(parseOutputFormat("yaml"), OutputFormat::Yaml);
    EXPECT_STREQ(toString(OutputFormat::Yaml), "yaml");
    EXPECT_FALSE(parseOutputFormat("xml").has_value());
    EXPECT_STREQ(toString(OutputFormat::Json), "json");
}

}
}
