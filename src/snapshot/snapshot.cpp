#include "strata/snapshot.hpp"
#include "strata/postcondition.hpp"

#include <nlohmann/json.hpp>

namespace strata {

namespace {

constexpr const char* LEGACY_SNAPSHOT_SCHEMAS[] = {
    "strata.snapshot.v1",
};

SnapshotLoadResult schema_error(const std::string& message, const std::string& source_path) {
    SnapshotLoadResult result;
    result.error.kind = ErrorKind::SnapshotSchemaError;
    result.error.message = source_path.empty() ? message : source_path + ": " + message;
    return result;
}

} // namespace

// ============================================================================
// Snapshot
// ============================================================================

std::optional<std::string> Snapshot::get(const std::string& key) const {
    auto it = resources_.find(key);
    if (it == resources_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Snapshot::contains(const std::string& key) const {
    return resources_.find(key) != resources_.end();
}

bool Snapshot::was_applied(const std::string& step_id) const {
    return provenance_.find(step_id) != provenance_.end();
}

void Snapshot::apply_step_effects(const std::string& step_id,
                                  const std::vector<ResourceEffect>& effects) {
    for (const auto& effect : effects) {
        switch (effect.op) {
            case EffectOp::Set:
                resources_[effect.key] = effect.value;
                break;
            case EffectOp::AppendSegment: {
                std::string current = get(effect.key).value_or("");
                resources_[effect.key] =
                    append_path_segment(current, effect.value, effect.anchor, effect.separator);
                break;
            }
        }
    }

    ++revision_;
    provenance_[step_id] = revision_;
    failures_.erase(step_id);
    updated_at_ = get_current_timestamp();
}

void Snapshot::mark_satisfied(const std::string& step_id) {
    provenance_.emplace(step_id, revision_);
    failures_.erase(step_id);
}

void Snapshot::record_failure(const std::string& step_id, const std::string& reason) {
    failures_[step_id] = reason;
    updated_at_ = get_current_timestamp();
}

std::optional<std::string> Snapshot::last_failure(const std::string& step_id) const {
    auto it = failures_.find(step_id);
    if (it == failures_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Snapshot::seed(const std::string& key, const std::string& value) {
    resources_[key] = value;
}

void Snapshot::forget(const std::string& key) {
    resources_.erase(key);
}

// ============================================================================
// Persistence
// ============================================================================

struct SnapshotCodec {
    static SnapshotLoadResult decode(const nlohmann::json& j, const std::string& source_path) {
        SnapshotLoadResult result;
        Snapshot& snap = result.snapshot;

        if (!j.contains("revision") || !j["revision"].is_number_unsigned()) {
            return schema_error("revision missing or not a non-negative integer", source_path);
        }
        snap.revision_ = j["revision"].get<uint64_t>();

        if (j.contains("updated_at") && j["updated_at"].is_string()) {
            snap.updated_at_ = j["updated_at"].get<std::string>();
        }

        if (j.contains("resources")) {
            if (!j["resources"].is_object()) {
                return schema_error("resources must be an object", source_path);
            }
            for (auto& [key, val] : j["resources"].items()) {
                if (!val.is_string()) {
                    return schema_error("resource " + key + " must be a string", source_path);
                }
                snap.resources_[key] = val.get<std::string>();
            }
        }

        if (j.contains("provenance")) {
            if (!j["provenance"].is_object()) {
                return schema_error("provenance must be an object", source_path);
            }
            for (auto& [step_id, val] : j["provenance"].items()) {
                if (!val.is_number_unsigned() || val.get<uint64_t>() > snap.revision_) {
                    return schema_error("provenance for " + step_id + " is not a valid revision",
                                        source_path);
                }
                snap.provenance_[step_id] = val.get<uint64_t>();
            }
        }

        if (j.contains("failures")) {
            if (!j["failures"].is_object()) {
                return schema_error("failures must be an object", source_path);
            }
            for (auto& [step_id, val] : j["failures"].items()) {
                if (!val.is_string()) {
                    return schema_error("failure for " + step_id + " must be a string",
                                        source_path);
                }
                snap.failures_[step_id] = val.get<std::string>();
            }
        }

        result.ok = true;
        return result;
    }

    static nlohmann::ordered_json encode(const Snapshot& snap) {
        nlohmann::ordered_json j;
        j["$schema"] = SNAPSHOT_SCHEMA;
        j["revision"] = snap.revision_;
        if (!snap.updated_at_.empty()) {
            j["updated_at"] = snap.updated_at_;
        }
        j["resources"] = nlohmann::ordered_json::object();
        for (const auto& [key, val] : snap.resources_) {
            j["resources"][key] = val;
        }
        j["provenance"] = nlohmann::ordered_json::object();
        for (const auto& [step_id, rev] : snap.provenance_) {
            j["provenance"][step_id] = rev;
        }
        if (!snap.failures_.empty()) {
            j["failures"] = nlohmann::ordered_json::object();
            for (const auto& [step_id, reason] : snap.failures_) {
                j["failures"][step_id] = reason;
            }
        }
        return j;
    }
};

SnapshotLoadResult parse_snapshot(const std::string& json_str, const std::string& source_path) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return schema_error(std::string("parse error: ") + e.what(), source_path);
    }

    if (!j.is_object()) {
        return schema_error("JSON must be an object", source_path);
    }

    if (!j.contains("$schema") || !j["$schema"].is_string()) {
        return schema_error("$schema missing", source_path);
    }

    std::string schema = j["$schema"].get<std::string>();
    if (schema != SNAPSHOT_SCHEMA) {
        for (const char* legacy : LEGACY_SNAPSHOT_SCHEMAS) {
            if (schema == legacy) {
                return schema_error(
                    "snapshot schema " + schema + " is no longer supported (current: " +
                        SNAPSHOT_SCHEMA + "); delete the file and re-run provision to "
                        "rebuild it from the live environment",
                    source_path);
            }
        }
        return schema_error("unknown snapshot schema " + schema + ", expected " + SNAPSHOT_SCHEMA,
                            source_path);
    }

    return SnapshotCodec::decode(j, source_path);
}

SnapshotLoadResult load_snapshot(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        return schema_error("cannot read snapshot", path);
    }
    return parse_snapshot(*content, path);
}

std::string serialize_snapshot(const Snapshot& snapshot) {
    return SnapshotCodec::encode(snapshot).dump(2) + "\n";
}

AtomicWriteResult save_snapshot(const std::string& path, const Snapshot& snapshot) {
    return atomic_write_file(path, serialize_snapshot(snapshot));
}

} // namespace strata
