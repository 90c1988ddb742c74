/// @file test_descriptor.cpp
/// @brief Unit tests for descriptor parsing and validation.

#include "model/descriptor.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

using namespace frag_res;

namespace {

constexpr const char *kValid = R"({
  "fragments": [
    {"id": "f1", "size": 4096, "importance": 0.9, "reuse": 3, "timescale": "short"},
    {"id": "f2", "size": 8192, "importance": 0.5, "reuse": 1, "timescale": "long"}
  ],
  "nodes": [
    {"id": 0, "backing": true},
    {"id": 1, "capacity_budget": 8192, "predicted_interference": 0.2, "unit_budget": 4}
  ]
})";

void expect_error(std::string_view text, DescriptorErrc code,
                  const std::string &detail) {
  auto result = parse_descriptor_text(text);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, code) << result.error().message();
  EXPECT_EQ(result.error().detail, detail);
}

} // namespace

TEST(DescriptorTest, ParsesValidDocument) {
  auto desc = parse_descriptor_text(kValid);
  ASSERT_TRUE(desc.has_value()) << desc.error().message();

  ASSERT_EQ(desc->fragments.size(), 2u);
  EXPECT_EQ(desc->fragments[0].id, "f1");
  EXPECT_EQ(desc->fragments[0].size, 4096u);
  EXPECT_DOUBLE_EQ(desc->fragments[0].importance, 0.9);
  EXPECT_EQ(desc->fragments[0].reuse, 3u);
  EXPECT_EQ(desc->fragments[1].timescale, "long");

  ASSERT_EQ(desc->nodes.size(), 2u);
  EXPECT_TRUE(desc->nodes[0].backing);
  EXPECT_EQ(desc->nodes[1].id, 1u);
  EXPECT_EQ(desc->nodes[1].capacity_budget, 8192u);
  EXPECT_DOUBLE_EQ(desc->nodes[1].predicted_interference, 0.2);
  EXPECT_EQ(desc->nodes[1].unit_budget, std::optional<std::uint64_t>{4});
}

TEST(DescriptorTest, AcceptsLegacyAliases) {
  auto desc = parse_descriptor_text(R"({
    "fragments": [{"id": "f", "size": 1, "importance": 0, "reuse": 0}],
    "nodes": [{"id": 2, "hbm_budget": 100, "tlb_budget": 3,
               "pred_interference": 1.5}]
  })");
  ASSERT_TRUE(desc.has_value()) << desc.error().message();
  EXPECT_EQ(desc->nodes[0].capacity_budget, 100u);
  EXPECT_EQ(desc->nodes[0].unit_budget, std::optional<std::uint64_t>{3});
  EXPECT_DOUBLE_EQ(desc->nodes[0].predicted_interference, 1.5);
  EXPECT_TRUE(desc->fragments[0].timescale.empty());
}

TEST(DescriptorTest, RejectsSyntaxErrors) {
  expect_error("{not json", DescriptorErrc::Syntax, "<input>");
  expect_error("[]", DescriptorErrc::WrongType, "<root>");
}

TEST(DescriptorTest, RejectsMissingSections) {
  expect_error(R"({"nodes": []})", DescriptorErrc::MissingField, "fragments");
  expect_error(R"({"fragments": []})", DescriptorErrc::MissingField, "nodes");
  expect_error(R"({"fragments": {}, "nodes": []})", DescriptorErrc::WrongType,
               "fragments");
}

TEST(DescriptorTest, RejectsBadFragmentFields) {
  expect_error(R"({"fragments": [{"size": 1, "importance": 0, "reuse": 0}],
                   "nodes": []})",
               DescriptorErrc::MissingField, "fragments[0].id");
  expect_error(R"({"fragments": [{"id": "f", "size": 0, "importance": 0,
                   "reuse": 0}], "nodes": []})",
               DescriptorErrc::InvalidValue, "fragments[0].size");
  expect_error(R"({"fragments": [{"id": "f", "size": -5, "importance": 0,
                   "reuse": 0}], "nodes": []})",
               DescriptorErrc::InvalidValue, "fragments[0].size");
  expect_error(R"({"fragments": [{"id": "f", "size": "big", "importance": 0,
                   "reuse": 0}], "nodes": []})",
               DescriptorErrc::WrongType, "fragments[0].size");
  expect_error(R"({"fragments": [{"id": "f", "size": 1, "importance": 0,
                   "reuse": -1}], "nodes": []})",
               DescriptorErrc::InvalidValue, "fragments[0].reuse");
  expect_error(R"({"fragments": [{"id": "f", "size": 1, "importance": "x",
                   "reuse": 0}], "nodes": []})",
               DescriptorErrc::WrongType, "fragments[0].importance");
}

TEST(DescriptorTest, RejectsBadNodeFields) {
  expect_error(R"({"fragments": [], "nodes": [{"id": 1}]})",
               DescriptorErrc::MissingField, "nodes[0].capacity_budget");
  expect_error(R"({"fragments": [], "nodes": [{"id": -1,
                   "capacity_budget": 10}]})",
               DescriptorErrc::InvalidValue, "nodes[0].id");
  expect_error(R"({"fragments": [], "nodes": [{"id": 1,
                   "capacity_budget": 0}]})",
               DescriptorErrc::InvalidValue, "nodes[0].capacity_budget");
  expect_error(R"({"fragments": [], "nodes": [{"id": 1,
                   "capacity_budget": 10, "predicted_interference": -0.1}]})",
               DescriptorErrc::InvalidValue, "nodes[0].predicted_interference");
  expect_error(R"({"fragments": [], "nodes": [{"id": 1,
                   "capacity_budget": 10, "backing": "yes"}]})",
               DescriptorErrc::WrongType, "nodes[0].backing");
}

TEST(DescriptorTest, RejectsDuplicateIds) {
  auto frag = parse_descriptor_text(R"({
    "fragments": [{"id": "f", "size": 1, "importance": 0, "reuse": 0},
                  {"id": "f", "size": 2, "importance": 0, "reuse": 0}],
    "nodes": []})");
  ASSERT_FALSE(frag.has_value());
  EXPECT_EQ(frag.error().code, DescriptorErrc::DuplicateId);

  auto node = parse_descriptor_text(R"({
    "fragments": [],
    "nodes": [{"id": 1, "capacity_budget": 1},
              {"id": 1, "capacity_budget": 2}]})");
  ASSERT_FALSE(node.has_value());
  EXPECT_EQ(node.error().code, DescriptorErrc::DuplicateId);
  EXPECT_EQ(node.error().detail, "nodes[1].id = 1");
}

TEST(DescriptorTest, LoadFromFile) {
  auto path = std::filesystem::temp_directory_path() /
              "frag_res_test_descriptor.json";
  {
    std::ofstream out(path);
    out << kValid;
  }
  auto desc = load_descriptor(path);
  std::filesystem::remove(path);
  ASSERT_TRUE(desc.has_value()) << desc.error().message();
  EXPECT_EQ(desc->fragments.size(), 2u);
}

TEST(DescriptorTest, LoadMissingFile) {
  auto desc = load_descriptor("/nonexistent/frag_res/descriptor.json");
  ASSERT_FALSE(desc.has_value());
  EXPECT_EQ(desc.error().code, DescriptorErrc::Unreadable);
}
