// owncheck/model/decl_loader.cpp - Declaration set loading implementation
//
#include "owncheck/model/decl_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <optional>
#include <utility>

namespace owncheck
{

namespace
{

std::optional<StoredMember> parse_member(const YAML::Node & node, std::string & error)
{
  if (!node.IsMap()) {
    error = "member entry must be a map";
    return std::nullopt;
  }
  if (!node["name"] || !node["type"]) {
    error = "member must have both 'name' and 'type'";
    return std::nullopt;
  }

  StoredMember member;
  member.name = node["name"].as<std::string>();
  member.type = node["type"].as<std::string>();
  if (node["via_value_chain"]) {
    member.via_value_type_chain = node["via_value_chain"].as<bool>();
  }
  return member;
}

std::optional<TypeDeclaration> parse_declaration(const YAML::Node & node, std::string & error)
{
  if (!node.IsMap()) {
    error = "declaration entry must be a map";
    return std::nullopt;
  }
  if (!node["name"]) {
    error = "declaration must have a 'name'";
    return std::nullopt;
  }

  TypeDeclaration decl;
  decl.name = node["name"].as<std::string>();
  if (decl.name.empty()) {
    error = "declaration name must not be empty";
    return std::nullopt;
  }

  if (node["kind"]) {
    const auto kind_text = node["kind"].as<std::string>();
    const auto kind = parse_type_kind(kind_text);
    if (!kind) {
      error = "'" + decl.name + "': invalid kind '" + kind_text +
              "' (must be 'reference' or 'value')";
      return std::nullopt;
    }
    decl.kind = *kind;
  }

  // A present 'owns' key (even an empty or null one) marks the declaration annotated.
  if (const auto owns = node["owns"]) {
    decl.is_annotated = true;
    if (owns.IsSequence()) {
      for (const auto & entry : owns) {
        auto owned = entry.as<std::string>();
        if (!decl.lists(owned)) {
          decl.owns_list.push_back(std::move(owned));
        }
      }
    } else if (!owns.IsNull()) {
      error = "'" + decl.name + "': 'owns' must be a list";
      return std::nullopt;
    }
  }

  if (const auto members = node["members"]) {
    if (!members.IsSequence()) {
      error = "'" + decl.name + "': 'members' must be a list";
      return std::nullopt;
    }
    for (const auto & m : members) {
      std::string member_error;
      auto member = parse_member(m, member_error);
      if (!member) {
        error = "'" + decl.name + "': " + member_error;
        return std::nullopt;
      }
      decl.stored_members.push_back(std::move(*member));
    }
  }

  return decl;
}

DeclLoadResult parse_root(const YAML::Node & root)
{
  if (!root.IsMap() || !root["declarations"]) {
    return DeclLoadResult::fail("missing top-level 'declarations' list");
  }
  const auto & list = root["declarations"];
  if (list.IsNull()) {
    return DeclLoadResult::ok({});
  }
  if (!list.IsSequence()) {
    return DeclLoadResult::fail("'declarations' must be a list");
  }

  std::vector<TypeDeclaration> decls;
  decls.reserve(list.size());
  for (const auto & node : list) {
    std::string error;
    auto decl = parse_declaration(node, error);
    if (!decl) {
      return DeclLoadResult::fail("invalid declaration: " + error);
    }
    decls.push_back(std::move(*decl));
  }
  return DeclLoadResult::ok(std::move(decls));
}

}  // namespace

DeclLoadResult parse_declarations(const std::string & yaml_text)
{
  try {
    return parse_root(YAML::Load(yaml_text));
  } catch (const YAML::Exception & e) {
    return DeclLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

DeclLoadResult load_declarations(const std::filesystem::path & path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(path)) {
    return DeclLoadResult::fail("declaration file not found: " + path.string());
  }

  try {
    return parse_root(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception & e) {
    return DeclLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

}  // namespace owncheck
