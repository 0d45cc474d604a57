#pragma once

#include "strata/types.hpp"

#include <string>
#include <vector>

namespace strata {

// ============================================================================
// Provisioning Specification
// ============================================================================
//
// JSON document:
//
//   {
//     "$schema": "strata.spec.v1",
//     "name": "bim2sim-runtime",
//     "steps": [
//       { "id": "python", "kind": "create-interpreter-env",
//         "params": { "name": "sim", "python-version": "3.10" } },
//       { "id": "plugin-path", "kind": "mutate-path-variable",
//         "params": { "name": "PYTHONPATH", "segment": "/opt/plugins/teaser" },
//         "requires": ["python"] }
//     ]
//   }
//
// Step order in "steps" is the declaration order used for tie-breaking.

constexpr const char* SPEC_SCHEMA = "strata.spec.v1";

struct ProvisionSpec {
    std::string name;
    std::vector<Step> steps;
    std::string source_path;
};

struct SpecParseResult {
    bool ok = false;
    ProvisionError error;
    ProvisionSpec spec;
    std::vector<std::string> warnings;
};

// Parse and validate a specification document. Structural problems are
// SpecParseError, duplicate ids DuplicateStepError, missing or malformed
// kind parameters InvalidStepError. Prerequisite resolution is left to
// DependencyGraph::build.
SpecParseResult parse_spec(const std::string& json_str, const std::string& source_path = "");

SpecParseResult load_spec(const std::string& path);

// Serialize to the canonical document form; parse_spec(serialize_spec(s))
// yields a spec equal to s.
std::string serialize_spec(const ProvisionSpec& spec);

// Check required parameters for the step's kind.
ProvisionError validate_step(const Step& step);

bool operator==(const Step& a, const Step& b);
bool operator!=(const Step& a, const Step& b);

} // namespace strata
