// tests/sema/test_ownership_validator.cpp - Unit tests for @owns validation
//
// Stored members must be covered by the owner's effective owns-list
// (transitive reachability in the ownership graph).

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "owncheck/sema/ownership_validator.hpp"
#include "owncheck/test_support/decl_builders.hpp"

using namespace owncheck;
using namespace owncheck::test_support;

TEST(SemaOwnershipValidator, EmptyInputHasNoDiagnostics)
{
  EXPECT_TRUE(validate({}).empty());
}

TEST(SemaOwnershipValidator, ChainWithStorageIsValid)
{
  const std::vector<TypeDeclaration> decls = {
    owning_class("A", {"B"}, {member("b", "B")}),
    owning_class("B", {"C"}, {member("c", "C")}),
    owning_class("C", {}),
  };

  EXPECT_TRUE(validate(decls).empty());
}

TEST(SemaOwnershipValidator, OwnershipIsTransitive)
{
  // A never lists C directly but owns it through B.
  const std::vector<TypeDeclaration> decls = {
    owning_class("A", {"B"}, {member("c", "C")}),
    owning_class("B", {"C"}),
    owning_class("C", {}),
  };

  EXPECT_TRUE(validate(decls).empty());
}

TEST(SemaOwnershipValidator, StoringOwnTypeIsAlwaysAllowed)
{
  const std::vector<TypeDeclaration> decls = {
    owning_class("Node", {}, {member("next", "Node")}),
  };

  EXPECT_TRUE(validate(decls).empty());
}

TEST(SemaOwnershipValidator, DisjointStoredTypeIsError)
{
  const std::vector<TypeDeclaration> decls = {
    owning_class("A", {"B"}, {member("c", "C")}),
    owning_class("B", {}),
    owning_class("C", {"D"}),
    owning_class("D", {}),
  };

  const auto diags = validate(decls);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags[0].kind, DiagnosticKind::DisjointOwnership);
  EXPECT_EQ(diags[0].severity, Severity::Error);
  EXPECT_EQ(diags[0].subject_type, "A");
  ASSERT_TRUE(diags[0].related_type.has_value());
  EXPECT_EQ(*diags[0].related_type, "C");
  ASSERT_TRUE(diags[0].member.has_value());
  EXPECT_EQ(*diags[0].member, "c");
  EXPECT_EQ(diags[0].code, "OWN006");
}

TEST(SemaOwnershipValidator, DisjointWithUndeclaredOwnedTypes)
{
  // B and D are not declared: each entry is reported once, and A/C stay disjoint.
  const std::vector<TypeDeclaration> decls = {
    owning_class("A", {"B"}, {member("c", "C")}),
    owning_class("C", {"D"}),
  };

  const auto diags = validate(decls);
  EXPECT_EQ(count_kind(diags, DiagnosticKind::DisjointOwnership), 1U);
  EXPECT_TRUE(has_diag(diags, DiagnosticKind::DisjointOwnership, "A", "C"));
  EXPECT_TRUE(has_diag(diags, DiagnosticKind::UnknownOwnedType, "A", "B"));
  EXPECT_TRUE(has_diag(diags, DiagnosticKind::UnknownOwnedType, "C", "D"));
}

TEST(SemaOwnershipValidator, ReverseOwnershipIsUnexpectedReference)
{
  // B owns A, so A holding B is related but not permitted.
  const std::vector<TypeDeclaration> decls = {
    owning_class("A", {}, {member("parent", "B")}),
    owning_class("B", {"A"}, {member("child", "A")}),
  };

  const auto diags = validate(decls);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags[0].kind, DiagnosticKind::UnexpectedReference);
  EXPECT_EQ(diags[0].subject_type, "A");
  EXPECT_EQ(*diags[0].related_type, "B");
}

TEST(SemaOwnershipValidator, SharedOwnedTypeIsUnexpectedReference)
{
  // Neither A nor C reaches the other, but both own B: the types are related.
  const std::vector<TypeDeclaration> decls = {
    owning_class("A", {"B"}, {member("c", "C")}),
    owning_class("B", {}),
    owning_class("C", {"B"}),
  };

  const auto diags = validate(decls);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags[0].kind, DiagnosticKind::UnexpectedReference);
  EXPECT_EQ(diags[0].subject_type, "A");
  EXPECT_EQ(*diags[0].related_type, "C");
  EXPECT_NE(diags[0].message.find("both only own 'B'"), std::string::npos);
}

TEST(SemaOwnershipValidator, SharedTypeDeeperDownIsUnexpectedReference)
{
  const std::vector<TypeDeclaration> decls = {
    owning_class("A", {"B"}, {member("c", "C")}),
    owning_class("B", {"Leaf"}),
    owning_class("C", {"D"}),
    owning_class("D", {"Leaf"}),
    owning_class("Leaf", {}),
  };

  const auto diags = validate(decls);
  EXPECT_EQ(count_kind(diags, DiagnosticKind::DisjointOwnership), 0U);
  EXPECT_TRUE(has_diag(diags, DiagnosticKind::UnexpectedReference, "A", "C"));
}

TEST(SemaOwnershipValidator, UnannotatedStoredTypeIsWarning)
{
  const std::vector<TypeDeclaration> decls = {
    owning_class("A", {"B"}, {member("b", "B")}),
    plain_class("B"),
  };

  const auto diags = validate(decls);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags[0].kind, DiagnosticKind::UnannotatedOwnedType);
  EXPECT_EQ(diags[0].severity, Severity::Warning);
  EXPECT_EQ(diags[0].subject_type, "A");
  EXPECT_EQ(*diags[0].related_type, "B");
}

TEST(SemaOwnershipValidator, UnannotatedOwnerIsNotChecked)
{
  const std::vector<TypeDeclaration> decls = {
    plain_class("A", {member("c", "C")}),
    owning_class("C", {}),
  };

  EXPECT_TRUE(validate(decls).empty());
}

TEST(SemaOwnershipValidator, UnknownOwnedTypeOncePerEntry)
{
  const std::vector<TypeDeclaration> decls = {
    owning_class("A", {"Ghost", "Phantom"}),
    owning_class("B", {"Ghost"}),
  };

  const auto diags = validate(decls);
  EXPECT_EQ(count_kind(diags, DiagnosticKind::UnknownOwnedType), 3U);
  EXPECT_TRUE(has_diag(diags, DiagnosticKind::UnknownOwnedType, "A", "Ghost"));
  EXPECT_TRUE(has_diag(diags, DiagnosticKind::UnknownOwnedType, "A", "Phantom"));
  EXPECT_TRUE(has_diag(diags, DiagnosticKind::UnknownOwnedType, "B", "Ghost"));
}

TEST(SemaOwnershipValidator, RepeatedOwnsEntryIsReportedOnce)
{
  // Declarations built in code may repeat an owns-list entry.
  const std::vector<TypeDeclaration> decls = {
    owning_class("A", {"Ghost", "B", "Ghost", "B"}, {member("b", "B")}),
    owning_class("B", {}),
  };

  const auto diags = validate(decls);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_TRUE(has_diag(diags, DiagnosticKind::UnknownOwnedType, "A", "Ghost"));
}

TEST(SemaOwnershipValidator, UnknownOwnedTypeInValueDeclaration)
{
  const std::vector<TypeDeclaration> decls = {
    owning_struct("Pair", {"Missing"}),
  };

  const auto diags = validate(decls);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags[0].kind, DiagnosticKind::UnknownOwnedType);
  EXPECT_EQ(diags[0].subject_type, "Pair");
}

TEST(SemaOwnershipValidator, UnknownMemberTypeIsError)
{
  const std::vector<TypeDeclaration> decls = {
    owning_class("A", {}, {member("x", "Nowhere")}),
  };

  const auto diags = validate(decls);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags[0].kind, DiagnosticKind::UnknownMemberType);
  EXPECT_EQ(*diags[0].related_type, "Nowhere");
}

TEST(SemaOwnershipValidator, DuplicateDeclarationKeepsFirst)
{
  // The first Node owns Leaf; the second (dropped) would not.
  const std::vector<TypeDeclaration> decls = {
    owning_class("Node", {"Leaf"}, {member("leaf", "Leaf")}),
    owning_class("Node", {}, {member("leaf", "Leaf")}),
    owning_class("Leaf", {}),
  };

  const auto diags = validate(decls);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags[0].kind, DiagnosticKind::DuplicateDeclaration);
  EXPECT_EQ(diags[0].subject_type, "Node");
}

TEST(SemaOwnershipValidator, RepeatedMemberTypeReportedOnce)
{
  const std::vector<TypeDeclaration> decls = {
    owning_class("A", {}, {member("c1", "C"), member("c2", "C")}),
    owning_class("C", {}),
  };

  const auto diags = validate(decls);
  EXPECT_EQ(count_kind(diags, DiagnosticKind::DisjointOwnership), 1U);
}

TEST(SemaOwnershipValidator, ProcessingContinuesAfterErrors)
{
  const std::vector<TypeDeclaration> decls = {
    owning_class("A", {"Ghost"}, {member("c", "C")}),
    owning_class("C", {}),
    owning_class("E", {}, {member("f", "F")}),
    plain_class("F"),
  };

  const auto diags = validate(decls);
  EXPECT_TRUE(has_diag(diags, DiagnosticKind::UnknownOwnedType, "A", "Ghost"));
  EXPECT_TRUE(has_diag(diags, DiagnosticKind::DisjointOwnership, "A", "C"));
  EXPECT_TRUE(has_diag(diags, DiagnosticKind::UnannotatedOwnedType, "E", "F"));
}

// ============================================================================
// Value types
// ============================================================================

TEST(SemaOwnershipValidatorValues, ValueMemberRequiresCarriedReferences)
{
  // Pair carries B; A stores a Pair, so A must own B.
  const std::vector<TypeDeclaration> decls = {
    owning_class("A", {}, {member("pair", "Pair")}),
    owning_struct("Pair", {"B"}),
    owning_class("B", {}),
  };

  const auto diags = validate(decls);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags[0].kind, DiagnosticKind::DisjointOwnership);
  EXPECT_EQ(diags[0].subject_type, "A");
  EXPECT_EQ(*diags[0].related_type, "B");
  EXPECT_EQ(*diags[0].member, "pair");
}

TEST(SemaOwnershipValidatorValues, ValueMemberCoveredByOwnsList)
{
  // The value type itself needs no owns-list entry; what it carries does.
  const std::vector<TypeDeclaration> decls = {
    owning_class("A", {"B"}, {member("pair", "Pair")}),
    owning_struct("Pair", {"B"}),
    owning_class("B", {}),
  };

  EXPECT_TRUE(validate(decls).empty());
}

TEST(SemaOwnershipValidatorValues, ListingValueTypeGrantsWhatItCarries)
{
  const std::vector<TypeDeclaration> decls = {
    owning_class("A", {"Pair"}, {member("b", "B")}),
    owning_struct("Pair", {"B"}),
    owning_class("B", {}),
  };

  EXPECT_TRUE(validate(decls).empty());
}

TEST(SemaOwnershipValidatorValues, NestedValueChain)
{
  const std::vector<TypeDeclaration> decls = {
    owning_class("A", {"B"}, {member("outer", "Outer")}),
    owning_struct("Outer", {"Inner"}),
    owning_struct("Inner", {"B", "C"}),
    owning_class("B", {}),
    owning_class("C", {}),
  };

  const auto diags = validate(decls);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_TRUE(has_diag(diags, DiagnosticKind::DisjointOwnership, "A", "C"));
}

TEST(SemaOwnershipValidatorValues, UnannotatedValueWarnsAtOuterOwner)
{
  const std::vector<TypeDeclaration> decls = {
    owning_class("A", {}, {member("blob", "Blob")}),
    plain_struct("Blob"),
  };

  const auto diags = validate(decls);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags[0].kind, DiagnosticKind::UnannotatedOwnedType);
  EXPECT_EQ(diags[0].severity, Severity::Warning);
  EXPECT_EQ(diags[0].subject_type, "A");
  EXPECT_EQ(*diags[0].related_type, "Blob");
}

TEST(SemaOwnershipValidatorValues, CyclicValueChainTerminates)
{
  const std::vector<TypeDeclaration> decls = {
    owning_class("A", {"B"}, {member("x", "X")}),
    owning_struct("X", {"Y", "B"}),
    owning_struct("Y", {"X"}),
    owning_class("B", {}),
  };

  EXPECT_TRUE(validate(decls).empty());
}

TEST(SemaOwnershipValidatorValues, DepthLimitStopsLongChains)
{
  const std::vector<TypeDeclaration> decls = {
    owning_class("A", {}, {member("v", "V1")}),
    owning_struct("V1", {"V2"}),
    owning_struct("V2", {"V3"}),
    owning_struct("V3", {"B"}),
    owning_class("B", {}),
  };

  ValidatorOptions options;
  options.max_value_chain_depth = 2;
  const auto diags = OwnershipValidator(options).validate(decls);

  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags[0].kind, DiagnosticKind::ValueChainTooDeep);
  EXPECT_EQ(diags[0].severity, Severity::Warning);
  EXPECT_EQ(*diags[0].related_type, "V3");

  // With the default limit the chain is followed to B.
  EXPECT_TRUE(has_diag(validate(decls), DiagnosticKind::DisjointOwnership, "A", "B"));
}

TEST(SemaOwnershipValidatorValues, ViaValueChainMemberIsChecked)
{
  const std::vector<TypeDeclaration> decls = {
    owning_class("A", {}, {member("inner", "C", true)}),
    owning_class("C", {}),
  };

  const auto diags = validate(decls);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags[0].kind, DiagnosticKind::DisjointOwnership);
  EXPECT_NE(diags[0].message.find("through a value type"), std::string::npos);
}

// ============================================================================
// Output order
// ============================================================================

TEST(SemaOwnershipValidator, OutputSortedBySubjectThenKind)
{
  const std::vector<TypeDeclaration> decls = {
    owning_class("Zed", {}, {member("a", "Alpha")}),
    owning_class("Alpha", {"Nope"}, {member("m", "Mu")}),
    plain_class("Mu"),
  };

  const auto diags = validate(decls);
  ASSERT_EQ(diags.size(), 3U);
  EXPECT_EQ(diags[0].subject_type, "Alpha");
  EXPECT_EQ(diags[0].kind, DiagnosticKind::UnknownOwnedType);
  EXPECT_EQ(diags[1].subject_type, "Alpha");
  EXPECT_EQ(diags[1].kind, DiagnosticKind::UnannotatedOwnedType);
  EXPECT_EQ(diags[2].subject_type, "Zed");
  EXPECT_EQ(diags[2].kind, DiagnosticKind::DisjointOwnership);
}

TEST(SemaOwnershipValidator, RepeatedRunsAreIdentical)
{
  const std::vector<TypeDeclaration> decls = {
    owning_class("A", {"B"}, {member("b", "B"), member("c", "C"), member("d", "D")}),
    owning_class("B", {"A"}, {member("a", "A")}),
    owning_class("C", {"Ghost"}),
    plain_class("D"),
  };

  const auto first = validate(decls);
  for (int i = 0; i < 5; ++i) {
    const auto again = validate(decls);
    ASSERT_EQ(again.size(), first.size());
    for (size_t k = 0; k < first.size(); ++k) {
      EXPECT_EQ(again[k].kind, first[k].kind);
      EXPECT_EQ(again[k].subject_type, first[k].subject_type);
      EXPECT_EQ(again[k].related_type, first[k].related_type);
      EXPECT_EQ(again[k].message, first[k].message);
    }
  }
}

TEST(SemaOwnershipValidator, BagOverloadReportsSuccess)
{
  const std::vector<TypeDeclaration> ok_decls = {
    owning_class("A", {"B"}, {member("b", "B")}),
    plain_class("B"),
  };
  DiagnosticBag diags;
  EXPECT_TRUE(OwnershipValidator{}.validate(ok_decls, diags));
  EXPECT_TRUE(diags.has_warnings());

  const std::vector<TypeDeclaration> bad_decls = {
    owning_class("A", {}, {member("c", "C")}),
    owning_class("C", {}),
  };
  EXPECT_FALSE(OwnershipValidator{}.validate(bad_decls, diags));
  EXPECT_EQ(diags.size(), 2U);
}

TEST(SemaOwnershipValidator, VeryLongChainValidates)
{
  // Each type owns and stores the next one; nothing may depend on call depth.
  constexpr int count = 200000;
  std::vector<TypeDeclaration> decls;
  decls.reserve(count);
  for (int i = 0; i < count; ++i) {
    const std::string name = "T" + std::to_string(i);
    if (i + 1 < count) {
      const std::string next = "T" + std::to_string(i + 1);
      decls.push_back(owning_class(name, {next}, {member("next", next)}));
    } else {
      decls.push_back(owning_class(name, {}));
    }
  }
  // The tail stores the head, which it does not own.
  decls.back().stored_members.push_back(member("head", "T0"));

  const auto diags = validate(decls);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags[0].kind, DiagnosticKind::UnexpectedReference);
  EXPECT_EQ(diags[0].subject_type, "T199999");
  EXPECT_EQ(*diags[0].related_type, "T0");
}
