// BVH scanner implementation

#include "bvh_scanner.h"

#include <algorithm>
#include <limits>

namespace bvh {

namespace {

bool IsDigit(char c) {
    return c >= '0' && c <= '9';
}

bool IsNewline(char c) {
    return c == '\n' || c == '\r';
}

bool IsInlineSpace(char c) {
    return c == ' ' || c == '\t';
}

}  // anonymous namespace

Scanner::Scanner(const std::string& text)
    : m_text(text),
      m_pos(0) {
}

bool Scanner::Peek(char* c) const {
    *c = ' ';
    if (AtEnd()) {
        return false;
    }
    *c = m_text[m_pos];
    return true;
}

bool Scanner::ExpectLiteral(const char* literal) {
    const size_t start = m_pos;
    for (const char* c = literal; *c; ++c) {
        if (AtEnd() || FoldChar(*c) != FoldChar(m_text[m_pos])) {
            m_pos = start;
            return false;
        }
        ++m_pos;
    }
    return true;
}

void Scanner::SkipWhitespace() {
    while (!AtEnd() && (IsInlineSpace(m_text[m_pos]) || IsNewline(m_text[m_pos]))) {
        ++m_pos;
    }
}

void Scanner::SkipInlineWhitespace() {
    while (!AtEnd() && IsInlineSpace(m_text[m_pos])) {
        ++m_pos;
    }
}

bool Scanner::ExpectNewline() {
    bool found = false;
    SkipInlineWhitespace();
    while (!AtEnd() && IsNewline(m_text[m_pos])) {
        found = true;
        ++m_pos;
    }
    return found;
}

bool Scanner::ReadLineString(std::string* text) {
    const size_t start = m_pos;
    while (!AtEnd() && !IsNewline(m_text[m_pos])) {
        ++m_pos;
    }

    size_t first = start;
    size_t last = m_pos;
    while (first < last && IsInlineSpace(m_text[first])) {
        ++first;
    }
    while (last > first && IsInlineSpace(m_text[last - 1])) {
        --last;
    }
    text->assign(m_text, first, last - first);
    return !text->empty();
}

bool Scanner::ReadInt(int* value) {
    const size_t start = m_pos;
    bool negate = false;
    bool digit_found = false;
    int v = 0;

    // Sign
    if (!AtEnd() && m_text[m_pos] == '-') {
        negate = true;
        ++m_pos;
    } else if (!AtEnd() && m_text[m_pos] == '+') {
        ++m_pos;
    }

    while (!AtEnd() && IsDigit(m_text[m_pos])) {
        const int digit = m_text[m_pos++] - '0';
        if (v > (std::numeric_limits<int>::max() - digit) / 10) {
            m_pos = start;
            *value = -1;
            return false;
        }
        v = v * 10 + digit;
        digit_found = true;
    }

    if (!digit_found) {
        m_pos = start;
        *value = -1;
        return false;
    }
    *value = negate ? -v : v;
    return true;
}

bool Scanner::ReadFloat(float* value) {
    const size_t start = m_pos;
    bool negate = false;
    bool digit_found = false;
    float v = 0.0f;

    // Sign
    if (!AtEnd() && m_text[m_pos] == '-') {
        negate = true;
        ++m_pos;
    } else if (!AtEnd() && m_text[m_pos] == '+') {
        ++m_pos;
    }

    // Integer part
    while (!AtEnd() && IsDigit(m_text[m_pos])) {
        v = v * 10.0f + static_cast<float>(m_text[m_pos++] - '0');
        digit_found = true;
    }

    // Fractional part. Digits past the limit are consumed but ignored.
    if (!AtEnd() && (m_text[m_pos] == '.' || m_text[m_pos] == ',')) {
        ++m_pos;
        float fac = 0.1f;
        int digits = 0;
        while (!AtEnd() && IsDigit(m_text[m_pos])) {
            if (digits < kMaxFractionDigits) {
                v += fac * static_cast<float>(m_text[m_pos] - '0');
                fac *= 0.1f;
            }
            ++digits;
            ++m_pos;
            digit_found = true;
        }
    }

    if (!digit_found) {
        m_pos = start;
        *value = std::numeric_limits<float>::quiet_NaN();
        return false;
    }
    *value = negate ? -v : v;
    return true;
}

bool Scanner::ReadChannel(ChannelKind* kind) {
    if (m_pos + 1 >= m_text.size()) {
        return false;
    }

    const size_t start = m_pos;
    int axis;
    switch (FoldChar(m_text[m_pos])) {
        case 'X':
            axis = 0;
            break;
        case 'Y':
            axis = 1;
            break;
        case 'Z':
            axis = 2;
            break;
        default:
            return false;
    }
    ++m_pos;

    bool ok = false;
    switch (FoldChar(m_text[m_pos])) {
        case 'P':
            ++m_pos;
            ok = ExpectLiteral("osition");
            break;
        case 'R':
            ++m_pos;
            axis += 3;
            ok = ExpectLiteral("otation");
            break;
        default:
            break;
    }

    if (!ok) {
        m_pos = start;
        return false;
    }
    *kind = static_cast<ChannelKind>(axis);
    return true;
}

std::string Scanner::ContextWindow() const {
    std::string region;
    const size_t begin = m_pos > 15 ? m_pos - 15 : 0;
    const size_t end = std::min(m_text.size(), m_pos + 15);
    for (size_t i = begin; i < end; ++i) {
        if (i + 1 == m_pos) {
            region += ">>>";
        }
        region += m_text[i];
        if (i == m_pos + 1) {
            region += "<<<";
        }
    }
    return region;
}

}  // namespace bvh
