// Error reporting for BVH parsing, writing and decoding

#ifndef BVH_ERROR_H_
#define BVH_ERROR_H_

#include <cstddef>
#include <string>

namespace bvh {

enum class ErrorCode {
    kNone,
    kStructural,      // Grammar violation: keyword, brace, channel count
    kNumeric,         // Malformed integer or float at a known position
    kNameResolution,  // BVH joint name has no matching rig joint
    kPrecondition,    // API called out of order or with missing inputs
    kIo,              // File could not be read or written
};

struct Error {
    ErrorCode code = ErrorCode::kNone;

    // Parse errors only: cursor offset, what was expected there and a
    // window of text around the cursor
    size_t offset = 0;
    std::string expected;
    std::string context;

    // Free-form description for non-parse errors
    std::string message;

    bool ok() const { return code == ErrorCode::kNone; }

    std::string ToString() const;
};

const char* ErrorCodeName(ErrorCode code);

// Fills error (when non-null) and returns false, so call sites can write
// `return Fail(error, ...);`
bool Fail(Error* error, ErrorCode code, const std::string& message);

}  // namespace bvh

#endif  // BVH_ERROR_H_
