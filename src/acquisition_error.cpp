#include "acquisition_error.h"

const char* error_kind_name(AcquisitionErrorKind kind) {
    switch (kind) {
        case AcquisitionErrorKind::UnavailableRadio: return "unavailable-radio";
        case AcquisitionErrorKind::NoMatch:          return "no-match";
        case AcquisitionErrorKind::Timeout:          return "timeout";
        case AcquisitionErrorKind::Disconnected:     return "disconnected";
        case AcquisitionErrorKind::MalformedMessage: return "malformed-message";
        case AcquisitionErrorKind::Transport:        return "transport";
    }
    return "unknown";
}
