#include "core/result.hpp"

namespace ek::core {

const char* to_string(ErrorCode code) noexcept {
    switch(code) {
        case ErrorCode::Validation: return "validation";
        case ErrorCode::UnknownAction: return "unknown_action";
        case ErrorCode::HostOperation: return "host_operation";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::UndoUnavailable: return "undo_unavailable";
        case ErrorCode::InvalidState: return "invalid_state";
    }
    return "unknown";
}

} // namespace ek::core
