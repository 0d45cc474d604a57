#pragma once

#include "strata/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace strata {

class Snapshot;

// ============================================================================
// Resource Keys
// ============================================================================
//
//   install-package          pkg:<name>
//   create-interpreter-env   env:<name>:python-version
//   mutate-path-variable     envvar:<name>
//   fetch-artifact           artifact:<dest>
//   set-permission           perm:<path>

constexpr const char* ENVVAR_KEY_PREFIX = "envvar:";

// The single resource key a step writes
std::string resource_key(const Step& step);

// Value recorded for install-package steps that pin no version
constexpr const char* PRESENT_VALUE = "present";

// ============================================================================
// Predicates
// ============================================================================

struct PredicateResult {
    bool holds = false;
    std::string detail;
};

// Evaluate a step's postcondition against a snapshot. Pure: no I/O, no
// mutation, same answer for the same inputs.
PredicateResult evaluate_postcondition(const Step& step, const Snapshot& snapshot);

// The step's declared postcondition, or one derived from its kind
// (e.g. "pkg:numpy == 1.26.4").
std::string describe_postcondition(const Step& step);

// Value the fetch-artifact step must end up with: "sha256" param, else the
// url fragment, else empty (presence only).
std::string expected_artifact_digest(const Step& step);

// [A-Za-z_][A-Za-z0-9_]*, the names a POSIX shell can export
bool is_environment_variable_name(const std::string& name);

// "755" / "0755" / "0o755" -> "0755"; nullopt for anything else
std::optional<std::string> normalize_mode(const std::string& mode);

// ============================================================================
// Path-List Composition
// ============================================================================

// Separator for a mutate-path-variable step: "separator" param or the
// platform path-list separator
std::string step_separator(const Step& step);

std::vector<std::string> split_path_list(const std::string& value, const std::string& separator);

std::string join_path_list(const std::vector<std::string>& segments, const std::string& separator);

// Append segment to a path list without duplicating it. If the segment is
// already present (after anchor, when one is given) the list is unchanged;
// if it sits before the anchor it is moved to the end.
std::string append_path_segment(const std::string& current,
                                 const std::string& segment,
                                 const std::string& anchor,
                                 const std::string& separator);

} // namespace strata
