#include "util/result.hpp"

namespace aurix {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                 return "None";
        case ErrorKind::WorkspaceUnavailable: return "WorkspaceUnavailable";
        case ErrorKind::ArtifactWriteFailed:  return "ArtifactWriteFailed";
        case ErrorKind::FlasherNotStartable:  return "FlasherNotStartable";
        case ErrorKind::FlasherFailed:        return "FlasherFailed";
        case ErrorKind::InvalidInput:         return "InvalidInput";
        case ErrorKind::ConfigInvalid:        return "ConfigInvalid";
    }
    return "Unknown";
}

} // namespace aurix
