#include "cache_backend.hpp"

namespace voicecache {

std::string backend_error_name(BackendError error) {
    switch (error) {
        case BackendError::None: return "none";
        case BackendError::Unreachable: return "unreachable";
        case BackendError::Timeout: return "timeout";
        case BackendError::Corrupt: return "corrupt";
        case BackendError::Rejected: return "rejected";
        default: return "unknown";
    }
}

}
