// Cursor over an immutable BVH text buffer
// Primitive token readers used by the hierarchy and motion parsers

#ifndef BVH_SCANNER_H_
#define BVH_SCANNER_H_

#include <cstddef>
#include <string>

#include "bvh_format.h"

namespace bvh {

// Folds a character for keyword comparison: letters to uppercase,
// tab/CR/LF to a space
constexpr char FoldChar(char c) {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A')
         : (c == '\t' || c == '\n' || c == '\r') ? ' '
         : c;
}

class Scanner {
 public:
    // The buffer must outlive the scanner
    explicit Scanner(const std::string& text);
    explicit Scanner(std::string&& text) = delete;

    size_t pos() const { return m_pos; }
    bool AtEnd() const { return m_pos >= m_text.size(); }
    size_t remaining() const { return AtEnd() ? 0 : m_text.size() - m_pos; }

    // Character at the cursor without consuming it. False at end of buffer.
    bool Peek(char* c) const;

    // Consumes `literal` case-insensitively. On mismatch the cursor is
    // left where it was.
    bool ExpectLiteral(const char* literal);

    // Skips spaces, tabs and newlines
    void SkipWhitespace();

    // Skips spaces and tabs only
    void SkipInlineWhitespace();

    // Skips inline whitespace then requires at least one newline character
    bool ExpectNewline();

    // Reads to the end of the line and trims. False if the result is empty.
    bool ReadLineString(std::string* text);

    // Optional sign followed by decimal digits. Fails on values that do not
    // fit an int. On failure *value is -1 and the cursor is not moved;
    // check the return value, not the sentinel.
    bool ReadInt(int* value);

    // Optional sign, digits, optional '.' or ',' then up to
    // kMaxFractionDigits fractional digits. On failure *value is NaN and
    // the cursor is not moved.
    bool ReadFloat(float* value);

    // Axis letter followed by "position" or "rotation"
    bool ReadChannel(ChannelKind* kind);

    // About 30 characters around the cursor, with the cursor marked
    std::string ContextWindow() const;

    static constexpr int kMaxFractionDigits = 128;

 private:
    const std::string& m_text;
    size_t m_pos;
};

}  // namespace bvh

#endif  // BVH_SCANNER_H_
