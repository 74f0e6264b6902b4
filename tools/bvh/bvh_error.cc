// Error reporting implementation

#include "bvh_error.h"

#include <sstream>

namespace bvh {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kNone:
            return "ok";
        case ErrorCode::kStructural:
            return "structural parse error";
        case ErrorCode::kNumeric:
            return "numeric parse error";
        case ErrorCode::kNameResolution:
            return "name resolution error";
        case ErrorCode::kPrecondition:
            return "precondition not met";
        case ErrorCode::kIo:
            return "i/o error";
    }
    return "unknown error";
}

std::string Error::ToString() const {
    if (code == ErrorCode::kStructural || code == ErrorCode::kNumeric) {
        std::ostringstream oss;
        oss << "Failed to parse BVH data at position " << offset
            << ". Expected " << expected << " around here: " << context;
        return oss.str();
    }
    if (message.empty()) {
        return ErrorCodeName(code);
    }
    return std::string(ErrorCodeName(code)) + ": " + message;
}

bool Fail(Error* error, ErrorCode code, const std::string& message) {
    if (error) {
        error->code = code;
        error->message = message;
    }
    return false;
}

}  // namespace bvh
