#include "strata/postcondition.hpp"
#include "strata/materializer.hpp"
#include "strata/platform.hpp"
#include "strata/snapshot.hpp"

#include <algorithm>
#include <cctype>

namespace strata {

namespace {

PredicateResult equals(const Snapshot& snapshot, const std::string& key, const std::string& expected) {
    auto actual = snapshot.get(key);
    if (!actual) {
        return {false, key + " is absent, expected " + expected};
    }
    if (*actual != expected) {
        return {false, key + " is " + *actual + ", expected " + expected};
    }
    return {true, key + " == " + expected};
}

PredicateResult present(const Snapshot& snapshot, const std::string& key) {
    if (!snapshot.contains(key)) {
        return {false, key + " is absent"};
    }
    return {true, key + " is present"};
}

PredicateResult evaluate_path_segment(const Step& step, const Snapshot& snapshot) {
    std::string key = resource_key(step);
    std::string segment = step.param("segment");
    std::string anchor = step.param("after");

    auto value = snapshot.get(key);
    if (!value) {
        return {false, key + " is absent, expected segment " + segment};
    }

    auto segments = split_path_list(*value, step_separator(step));
    auto pos = std::find(segments.begin(), segments.end(), segment);
    if (pos == segments.end()) {
        return {false, key + " does not contain " + segment};
    }

    if (!anchor.empty()) {
        auto anchor_pos = std::find(segments.begin(), segments.end(), anchor);
        if (anchor_pos == segments.end()) {
            return {false, key + " does not contain anchor " + anchor};
        }
        if (anchor_pos > pos) {
            return {false, key + " has " + segment + " before " + anchor};
        }
        return {true, key + " contains " + segment + " after " + anchor};
    }

    return {true, key + " contains " + segment};
}

} // namespace

std::string resource_key(const Step& step) {
    switch (step.kind) {
        case ActionKind::InstallPackage:
            return "pkg:" + step.param("name");
        case ActionKind::CreateInterpreterEnv:
            return "env:" + step.param("name") + ":python-version";
        case ActionKind::MutatePathVariable:
            return ENVVAR_KEY_PREFIX + step.param("name");
        case ActionKind::FetchArtifact:
            return "artifact:" + step.param("dest");
        case ActionKind::SetPermission:
            return "perm:" + step.param("path");
    }
    return step.id;
}

PredicateResult evaluate_postcondition(const Step& step, const Snapshot& snapshot) {
    std::string key = resource_key(step);

    switch (step.kind) {
        case ActionKind::InstallPackage:
            if (step.param("version").empty()) {
                return present(snapshot, key);
            }
            return equals(snapshot, key, step.param("version"));

        case ActionKind::CreateInterpreterEnv:
            return equals(snapshot, key, step.param("python-version"));

        case ActionKind::MutatePathVariable:
            return evaluate_path_segment(step, snapshot);

        case ActionKind::FetchArtifact: {
            std::string digest = expected_artifact_digest(step);
            if (digest.empty()) {
                return present(snapshot, key);
            }
            return equals(snapshot, key, digest);
        }

        case ActionKind::SetPermission: {
            auto mode = normalize_mode(step.param("mode"));
            if (!mode) {
                return {false, "invalid mode " + step.param("mode")};
            }
            return equals(snapshot, key, *mode);
        }
    }

    return {false, "unsupported action kind"};
}

std::string describe_postcondition(const Step& step) {
    if (!step.postcondition.empty()) {
        return step.postcondition;
    }

    std::string key = resource_key(step);
    switch (step.kind) {
        case ActionKind::InstallPackage:
            if (step.param("version").empty()) return key + " present";
            return key + " == " + step.param("version");
        case ActionKind::CreateInterpreterEnv:
            return key + " == " + step.param("python-version");
        case ActionKind::MutatePathVariable:
            if (step.param("after").empty()) return key + " contains " + step.param("segment");
            return key + " contains " + step.param("segment") + " after " + step.param("after");
        case ActionKind::FetchArtifact: {
            std::string digest = expected_artifact_digest(step);
            if (digest.empty()) return key + " present";
            return key + " == " + digest;
        }
        case ActionKind::SetPermission:
            return key + " == " + normalize_mode(step.param("mode")).value_or(step.param("mode"));
    }
    return key;
}

std::string expected_artifact_digest(const Step& step) {
    std::string digest = step.param("sha256");
    if (digest.empty()) {
        digest = parse_artifact_reference(step.param("url")).sha256;
    }
    std::transform(digest.begin(), digest.end(), digest.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return digest;
}

bool is_environment_variable_name(const std::string& name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0]))) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return c == '_' || std::isalnum(c) != 0;
    });
}

std::optional<std::string> normalize_mode(const std::string& mode) {
    std::string digits = mode;
    if (digits.rfind("0o", 0) == 0 || digits.rfind("0O", 0) == 0) {
        digits = digits.substr(2);
    }
    if (digits.empty() || digits.size() > 4) {
        return std::nullopt;
    }
    for (char c : digits) {
        if (c < '0' || c > '7') {
            return std::nullopt;
        }
    }
    while (digits.size() < 4) {
        digits.insert(digits.begin(), '0');
    }
    return digits;
}

std::string step_separator(const Step& step) {
    std::string sep = step.param("separator");
    if (sep.empty()) {
        sep = std::string(1, path_list_separator());
    }
    return sep;
}

std::vector<std::string> split_path_list(const std::string& value, const std::string& separator) {
    std::vector<std::string> segments;
    if (separator.empty()) {
        if (!value.empty()) segments.push_back(value);
        return segments;
    }

    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find(separator, start);
        if (end == std::string::npos) end = value.size();
        if (end > start) {
            segments.push_back(value.substr(start, end - start));
        }
        start = end + separator.size();
    }
    return segments;
}

std::string join_path_list(const std::vector<std::string>& segments, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) result += separator;
        result += segments[i];
    }
    return result;
}

std::string append_path_segment(const std::string& current,
                                 const std::string& segment,
                                 const std::string& anchor,
                                 const std::string& separator) {
    auto segments = split_path_list(current, separator);

    auto pos = std::find(segments.begin(), segments.end(), segment);
    if (pos != segments.end()) {
        if (anchor.empty()) {
            return join_path_list(segments, separator);
        }
        auto anchor_pos = std::find(segments.begin(), segments.end(), anchor);
        if (anchor_pos == segments.end() || anchor_pos <= pos) {
            return join_path_list(segments, separator);
        }
        segments.erase(pos);
    }

    segments.push_back(segment);
    return join_path_list(segments, separator);
}

} // namespace strata
