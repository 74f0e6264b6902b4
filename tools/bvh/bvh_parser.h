// BVH text parser
// Builds a Document from HIERARCHY and MOTION sections in a single pass

#ifndef BVH_PARSER_H_
#define BVH_PARSER_H_

#include <string>

#include "bvh_error.h"
#include "bvh_format.h"

namespace bvh {

class Scanner;

struct ParseOptions {
    // Replace the file's "Frame Time:" value, e.g. to force a capture rate
    bool override_frame_time = false;
    float frame_time = 1.0f / 60.0f;
};

class BvhParser {
 public:
    BvhParser();
    explicit BvhParser(const ParseOptions& options);
    ~BvhParser();

    // Parse a whole document. On failure *document is left untouched and
    // error() describes the first problem found.
    bool Parse(const std::string& text, Document* document);

    // Read a file and parse it
    bool Load(const char* filename, Document* document);

    const Error& error() const { return m_error; }

 private:
    bool ParseJoint(bool root, Joint* joint);
    bool ParseEndSite();
    bool ParseMotion(Document* document);

    // Records a failure at the current cursor when result is false
    bool Assure(const char* what, bool result,
                ErrorCode code = ErrorCode::kStructural);
    bool AssureLiteral(const char* literal);

    ParseOptions m_options;
    Scanner* m_scanner;
    Error m_error;
};

}  // namespace bvh

#endif  // BVH_PARSER_H_
