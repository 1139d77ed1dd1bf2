#include "infer_bench/types.hpp"

namespace infer_bench {

const char* ToString(FailureKind kind) noexcept {
    switch (kind) {
        case FailureKind::Timeout:           return "timeout";
        case FailureKind::Network:           return "network";
        case FailureKind::HttpStatus:        return "http_status";
        case FailureKind::MalformedResponse: return "malformed_response";
        case FailureKind::Cancelled:         return "cancelled";
        case FailureKind::Internal:          return "internal";
    }
    return "unknown";
}

}
