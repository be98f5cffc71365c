// owncheck/basic/diagnostic.hpp - Diagnostic types for ownership validation
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace owncheck
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
};

/**
 * Diagnostic taxonomy.
 *
 * The declaration order is also the secondary sort key of the validator output.
 */
enum class DiagnosticKind : uint8_t {
  DuplicateDeclaration,
  UnknownOwnedType,
  UnknownMemberType,
  UnannotatedOwnedType,
  UnexpectedReference,
  DisjointOwnership,
  RetainCycleViolation,
  ValueChainTooDeep,
};

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;
[[nodiscard]] std::string_view to_string(DiagnosticKind kind) noexcept;

/// Stable code for a kind, e.g. "OWN005".
[[nodiscard]] std::string_view code_of(DiagnosticKind kind) noexcept;

/// Severity the validator assigns to a kind.
[[nodiscard]] Severity default_severity(DiagnosticKind kind) noexcept;

struct Diagnostic
{
  Severity severity = Severity::Error;
  DiagnosticKind kind = DiagnosticKind::UnexpectedReference;
  std::string code;  // e.g., "OWN005"
  std::string message;

  /// Declaration the finding is attributed to.
  std::string subject_type;
  /// Second type involved in the finding, if any.
  std::optional<std::string> related_type;
  /// Stored member that triggered the finding, if any.
  std::optional<std::string> member;

  std::optional<std::string> help_message;

  [[nodiscard]] bool is_error() const noexcept { return severity == Severity::Error; }
};

/**
 * Signals a broken internal invariant (e.g. an inconsistent SCC partition).
 *
 * Never used for problems in the user's declarations; those become Diagnostics.
 */
class InternalError : public std::logic_error
{
public:
  using std::logic_error::logic_error;
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic through a fluent interface and registers it with the bag
 * when destroyed (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_related(std::string type_name);

  DiagnosticBuilder & with_member(std::string member_name);

  DiagnosticBuilder & with_severity(Severity severity);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starter (severity and code follow from the kind)
  DiagnosticBuilder report(DiagnosticKind kind, std::string subject, std::string message);

  // Add
  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] std::vector<Diagnostic> of_kind(DiagnosticKind kind) const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;
  [[nodiscard]] size_t error_count() const;
  [[nodiscard]] size_t warning_count() const;

  // Utilities
  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);

  /// Stable sort by subject type name, then kind.
  void sort();

  /// Promote every warning to an error (--Werror).
  void promote_warnings();

  /// Move the collected diagnostics out, leaving the bag empty.
  [[nodiscard]] std::vector<Diagnostic> take();

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace owncheck
