// owncheck/driver/checker.cpp - Check driver implementation
//
#include "owncheck/driver/checker.hpp"

#include <iostream>
#include <iterator>
#include <utility>

#include "owncheck/model/decl_loader.hpp"
#include "owncheck/sema/ownership_validator.hpp"

namespace owncheck
{

CheckResult Checker::check_file(const std::filesystem::path & file, const CheckOptions & options)
{
  if (options.verbose) {
    std::cerr << "Loading: " << file.string() << "\n";
  }

  auto loaded = load_declarations(file);
  if (!loaded.success) {
    CheckResult result;
    result.input_errors.push_back(file.string() + ": " + loaded.error);
    return result;
  }

  return check_declarations(
    loaded.declarations, options,
    options.max_value_chain_depth.value_or(k_default_max_value_chain_depth));
}

CheckResult Checker::check_project(const ProjectConfig & config, const CheckOptions & options)
{
  CheckResult result;

  if (config.check.inputs.empty()) {
    result.input_errors.emplace_back("no inputs defined in project configuration");
    return result;
  }

  std::vector<TypeDeclaration> declarations;
  for (const auto & input_rel : config.check.inputs) {
    const auto input_path = config.project_root / input_rel;

    if (options.verbose) {
      std::cerr << "Loading: " << input_path.string() << "\n";
    }

    auto loaded = load_declarations(input_path);
    if (!loaded.success) {
      // Continue to collect more errors from other inputs
      result.input_errors.push_back(input_path.string() + ": " + loaded.error);
      continue;
    }
    declarations.insert(
      declarations.end(), std::make_move_iterator(loaded.declarations.begin()),
      std::make_move_iterator(loaded.declarations.end()));
  }

  if (!result.input_errors.empty()) {
    return result;
  }

  CheckOptions effective = options;
  effective.warnings_as_errors = options.warnings_as_errors || config.check.warnings_as_errors;
  return check_declarations(
    declarations, effective,
    options.max_value_chain_depth.value_or(config.check.max_value_chain_depth));
}

CheckResult Checker::check_declarations(
  const std::vector<TypeDeclaration> & declarations, const CheckOptions & options,
  size_t max_value_chain_depth)
{
  CheckResult result;
  result.declaration_count = declarations.size();

  if (options.verbose) {
    std::cerr << "Validating " << declarations.size() << " declaration(s)\n";
  }

  ValidatorOptions validator_options;
  validator_options.max_value_chain_depth = max_value_chain_depth;
  const OwnershipValidator validator(validator_options);

  // The bag carries every finding; finish() applies the warning policy.
  validator.validate(declarations, result.diagnostics);

  finish(result, options.warnings_as_errors);
  return result;
}

void Checker::finish(CheckResult & result, bool warnings_as_errors)
{
  if (warnings_as_errors) {
    result.diagnostics.promote_warnings();
  }
  result.success = result.input_errors.empty() && !result.diagnostics.has_errors();
}

}  // namespace owncheck
