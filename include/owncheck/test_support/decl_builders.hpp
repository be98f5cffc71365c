// owncheck/test_support/decl_builders.hpp - helpers for unit/integration tests
//
// Compact constructors for declaration sets, plus small query helpers over
// validator output.
//
#pragma once

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "owncheck/basic/diagnostic.hpp"
#include "owncheck/model/type_decl.hpp"

namespace owncheck::test_support
{

[[nodiscard]] inline StoredMember member(std::string name, std::string type, bool via = false)
{
  return StoredMember{std::move(name), std::move(type), via};
}

/// @owns(owns...) class name
[[nodiscard]] inline TypeDeclaration owning_class(
  std::string name, std::vector<std::string> owns, std::vector<StoredMember> members = {})
{
  TypeDeclaration d;
  d.name = std::move(name);
  d.kind = TypeKind::Reference;
  d.is_annotated = true;
  d.owns_list = std::move(owns);
  d.stored_members = std::move(members);
  return d;
}

/// class name (no @owns)
[[nodiscard]] inline TypeDeclaration plain_class(
  std::string name, std::vector<StoredMember> members = {})
{
  TypeDeclaration d;
  d.name = std::move(name);
  d.kind = TypeKind::Reference;
  d.stored_members = std::move(members);
  return d;
}

/// @owns(owns...) struct name
[[nodiscard]] inline TypeDeclaration owning_struct(
  std::string name, std::vector<std::string> owns, std::vector<StoredMember> members = {})
{
  TypeDeclaration d = owning_class(std::move(name), std::move(owns), std::move(members));
  d.kind = TypeKind::Value;
  return d;
}

/// struct name (no @owns)
[[nodiscard]] inline TypeDeclaration plain_struct(
  std::string name, std::vector<StoredMember> members = {})
{
  TypeDeclaration d = plain_class(std::move(name), std::move(members));
  d.kind = TypeKind::Value;
  return d;
}

[[nodiscard]] inline size_t count_kind(const std::vector<Diagnostic> & diags, DiagnosticKind kind)
{
  return static_cast<size_t>(std::count_if(
    diags.begin(), diags.end(), [kind](const Diagnostic & d) { return d.kind == kind; }));
}

/// True if some diagnostic of `kind` names (subject, related).
[[nodiscard]] inline bool has_diag(
  const std::vector<Diagnostic> & diags, DiagnosticKind kind, std::string_view subject,
  std::string_view related)
{
  return std::any_of(diags.begin(), diags.end(), [&](const Diagnostic & d) {
    return d.kind == kind && d.subject_type == subject && d.related_type &&
           *d.related_type == related;
  });
}

/**
 * Temporary directory removed on destruction.
 */
struct TempDir
{
  std::filesystem::path path;

  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  std::filesystem::path write(const std::string & relative, const std::string & content) const
  {
    const auto file = path / relative;
    std::filesystem::create_directories(file.parent_path());
    std::ofstream out(file);
    out << content;
    return file;
  }
};

}  // namespace owncheck::test_support
