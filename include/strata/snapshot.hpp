#pragma once

#include "strata/platform.hpp"
#include "strata/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace strata {

// ============================================================================
// Resource Effects
// ============================================================================

enum class EffectOp {
    Set,            // key = value
    AppendSegment,  // path-list append of value (after anchor) using separator
};

struct ResourceEffect {
    EffectOp op = EffectOp::Set;
    std::string key;
    std::string value;
    std::string anchor;
    std::string separator;
};

// ============================================================================
// Snapshot
// ============================================================================
//
// Authoritative record of provisioned resource state. The revision counter
// increases by exactly one per applied step. Provenance maps each step id
// that was applied, or found already satisfied, to the revision at which
// that happened. Failures keep the reason of a step's most recent failed
// attempt until the step next succeeds or is skipped.

class Snapshot {
public:
    Snapshot() = default;

    std::optional<std::string> get(const std::string& key) const;
    bool contains(const std::string& key) const;

    const ResourceMap& resources() const { return resources_; }
    uint64_t revision() const { return revision_; }
    const std::map<std::string, uint64_t>& provenance() const { return provenance_; }
    const std::map<std::string, std::string>& failures() const { return failures_; }
    const std::string& updated_at() const { return updated_at_; }

    bool was_applied(const std::string& step_id) const;
    std::optional<std::string> last_failure(const std::string& step_id) const;

    // Merge the effects of one successfully applied step.
    void apply_step_effects(const std::string& step_id, const std::vector<ResourceEffect>& effects);

    // The step's postcondition already held; recorded at the current
    // revision, which does not change.
    void mark_satisfied(const std::string& step_id);

    void record_failure(const std::string& step_id, const std::string& reason);

    // Record externally observed state. Does not touch the revision or
    // provenance; used for seeding and live observation.
    void seed(const std::string& key, const std::string& value);
    void forget(const std::string& key);

    bool operator==(const Snapshot& other) const {
        return revision_ == other.revision_ && resources_ == other.resources_ &&
               provenance_ == other.provenance_ && failures_ == other.failures_;
    }

private:
    friend struct SnapshotCodec;

    ResourceMap resources_;
    uint64_t revision_ = 0;
    std::map<std::string, uint64_t> provenance_;
    std::map<std::string, std::string> failures_;
    std::string updated_at_;
};

// ============================================================================
// Persistence
// ============================================================================

constexpr const char* SNAPSHOT_SCHEMA = "strata.snapshot.v2";

struct SnapshotLoadResult {
    bool ok = false;
    ProvisionError error;
    Snapshot snapshot;
};

// Parse a persisted snapshot. Older schemas are rejected with a
// SnapshotSchemaError that explains how to migrate.
SnapshotLoadResult parse_snapshot(const std::string& json_str, const std::string& source_path = "");

SnapshotLoadResult load_snapshot(const std::string& path);

std::string serialize_snapshot(const Snapshot& snapshot);

AtomicWriteResult save_snapshot(const std::string& path, const Snapshot& snapshot);

} // namespace strata
