#include "strata/types.hpp"

#include <sstream>

namespace strata {

std::optional<ActionKind> parse_action_kind(const std::string& s) {
    for (auto kind : all_action_kinds()) {
        if (s == action_kind_to_string(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

std::vector<ActionKind> all_action_kinds() {
    return {
        ActionKind::InstallPackage,
        ActionKind::CreateInterpreterEnv,
        ActionKind::MutatePathVariable,
        ActionKind::FetchArtifact,
        ActionKind::SetPermission,
    };
}

bool is_specification_error(ErrorKind e) {
    switch (e) {
        case ErrorKind::SpecParseError:
        case ErrorKind::DuplicateStepError:
        case ErrorKind::InvalidStepError:
        case ErrorKind::UnknownPrerequisiteError:
        case ErrorKind::CycleError:
            return true;
        default:
            return false;
    }
}

std::string ProvisionError::to_string() const {
    std::ostringstream out;
    out << error_kind_to_string(kind);
    if (!message.empty()) {
        out << ": " << message;
    }
    if (!step_ids.empty()) {
        out << " [steps: ";
        for (size_t i = 0; i < step_ids.size(); ++i) {
            if (i > 0) out << ", ";
            out << step_ids[i];
        }
        out << "]";
    }
    if (!relation.empty()) {
        out << " (" << relation << ")";
    }
    return out.str();
}

} // namespace strata
