/**
 * @file test_dotpath.cpp
 * @brief Tests for dot-path access into settings documents
 */

#include <gtest/gtest.h>
#include "ontodiff/DotPath.hpp"

using namespace ontodiff;

namespace {

Value settings() {
    return Value{
        {"analysis", {{"similarity_threshold", 0.8}, {"review_warning_threshold", 3}}},
        {"merge", {{"strategy", "ours"}}},
        {"models", Value::array({"sales.json", "finance.json"})},
        {"output", {{"indent", 2}}},
    };
}

} // anonymous namespace

TEST(DotPath, SplitSkipsEmptySegments) {
    EXPECT_EQ(split_dot_path("analysis.similarity_threshold"),
              (std::vector<std::string>{"analysis", "similarity_threshold"}));
    EXPECT_EQ(split_dot_path(".merge..strategy."), (std::vector<std::string>{"merge", "strategy"}));
    EXPECT_TRUE(split_dot_path("").empty());
    EXPECT_EQ(join_dot_path({"merge", "strategy"}), "merge.strategy");
}

TEST(DotPath, GetNested) {
    const Value data = settings();

    const Value* v = get_by_dot(data, "merge.strategy");
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(*v, "ours");
    EXPECT_EQ(*get_by_dot(data, "analysis.review_warning_threshold"), 3);
    EXPECT_EQ(*get_by_dot(data, "models.1"), "finance.json");
    EXPECT_EQ(get_by_dot(data, ""), &data);
}

TEST(DotPath, MissingKeyThrowsWithSegment) {
    const Value data = settings();
    try {
        get_by_dot(data, "merge.order");
        FAIL() << "expected KeyError";
    } catch (const KeyError& e) {
        EXPECT_EQ(e.path(), "merge.order");
        EXPECT_EQ(e.segment(), "order");
    }
    EXPECT_THROW(get_by_dot(data, "models.5"), KeyError);
    EXPECT_THROW(get_by_dot(data, "models.01"), KeyError);
}

TEST(DotPath, TraversingScalarIsTypeError) {
    const Value data = settings();
    try {
        get_by_dot(data, "merge.strategy.name");
        FAIL() << "expected TypeError";
    } catch (const TypeError& e) {
        EXPECT_EQ(e.expected(), "object or array");
        EXPECT_EQ(e.actual(), "string");
    }
}

TEST(DotPath, DefaultReturnedWhenMissing) {
    const Value data = settings();
    const Value fallback = "union";

    EXPECT_EQ(get_by_dot(data, "merge.fallback", fallback), &fallback);
    EXPECT_EQ(*get_by_dot(data, "merge.strategy", fallback), "ours");
}

TEST(DotPath, Contains) {
    const Value data = settings();
    EXPECT_TRUE(contains_dot(data, "output.indent"));
    EXPECT_TRUE(contains_dot(data, "models.0"));
    EXPECT_FALSE(contains_dot(data, "output.width"));
    EXPECT_FALSE(contains_dot(data, "models.2"));
}

TEST(DotPath, SetCreatesIntermediateObjects) {
    Value data = Value::object();
    set_by_dot(data, "validation.reject_duplicates", true);
    set_by_dot(data, "merge.strategy", "theirs");

    EXPECT_EQ(data["validation"]["reject_duplicates"], true);
    EXPECT_EQ(data["merge"]["strategy"], "theirs");
}

TEST(DotPath, SetWithoutCreateRequiresExistingPath) {
    Value data = settings();
    set_by_dot(data, "merge.strategy", "union", false);
    EXPECT_EQ(data["merge"]["strategy"], "union");

    EXPECT_THROW(set_by_dot(data, "logging.level", "debug", false), KeyError);
    EXPECT_THROW(set_by_dot(data, "merge.strategy.name", "x", false), TypeError);
}
