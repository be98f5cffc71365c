// test_json_report.cpp - Unit tests for JSON serialization of diagnostics and graphs
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

#include "owncheck/report/json_report.hpp"
#include "owncheck/sema/decl_table.hpp"
#include "owncheck/sema/ownership_validator.hpp"
#include "owncheck/test_support/decl_builders.hpp"

using nlohmann::json;

namespace owncheck
{

using namespace test_support;

TEST(JsonReport, DiagnosticFields)
{
  const std::vector<TypeDeclaration> decls = {
    owning_class("A", {"B"}, {member("c", "C")}),
    owning_class("B", {}),
    owning_class("C", {}),
  };

  const json j = to_json(validate(decls));
  ASSERT_EQ(j["diagnostics"].size(), 1U);

  const auto & d = j["diagnostics"][0];
  EXPECT_EQ(d["severity"], "error");
  EXPECT_EQ(d["kind"], "DisjointOwnership");
  EXPECT_EQ(d["code"], "OWN006");
  EXPECT_EQ(d["subject"], "A");
  EXPECT_EQ(d["related"], "C");
  EXPECT_EQ(d["member"], "c");
  EXPECT_TRUE(d["help"].is_string());

  EXPECT_EQ(j["summary"]["errors"], 1);
  EXPECT_EQ(j["summary"]["warnings"], 0);
}

TEST(JsonReport, AbsentOptionalsAreNull)
{
  const std::vector<TypeDeclaration> decls = {
    owning_class("Node", {}),
    owning_class("Node", {}),
  };

  const json j = to_json(validate(decls));
  ASSERT_EQ(j["diagnostics"].size(), 1U);
  EXPECT_EQ(j["diagnostics"][0]["kind"], "DuplicateDeclaration");
  EXPECT_TRUE(j["diagnostics"][0]["related"].is_null());
  EXPECT_TRUE(j["diagnostics"][0]["member"].is_null());
}

TEST(JsonReport, EmptyList)
{
  const json j = to_json(std::vector<Diagnostic>{});
  EXPECT_TRUE(j["diagnostics"].is_array());
  EXPECT_EQ(j["diagnostics"].size(), 0U);
  EXPECT_EQ(j["summary"]["errors"], 0);
}

TEST(JsonReport, GraphDump)
{
  const std::vector<TypeDeclaration> decls = {
    owning_class("A", {"A", "B"}),
    owning_class("B", {"A", "B"}),
    plain_class("Leaf"),
    owning_struct("S", {"Leaf"}),
  };

  DeclTable table;
  table.build(decls);
  OwnershipGraph graph;
  graph.build(table);

  const json j = to_json(graph);
  ASSERT_EQ(j["nodes"].size(), 3U);
  EXPECT_EQ(j["nodes"][0]["name"], "A");
  EXPECT_EQ(j["nodes"][2]["annotated"], false);
  EXPECT_EQ(j["nodes"][0]["scc"], j["nodes"][1]["scc"]);
  EXPECT_EQ(j["edges"].size(), 4U);
  EXPECT_EQ(j["edges"][0]["from"], "A");
  EXPECT_EQ(j["edges"][0]["to"], "A");

  ASSERT_EQ(j["sccs"].size(), 2U);
  bool found_pair = false;
  for (const auto & scc : j["sccs"]) {
    if (scc.size() == 2U) {
      EXPECT_EQ(scc[0], "A");
      EXPECT_EQ(scc[1], "B");
      found_pair = true;
    }
  }
  EXPECT_TRUE(found_pair);
}

}  // namespace owncheck
