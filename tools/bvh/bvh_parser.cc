// BVH parser implementation

#include "bvh_parser.h"

#include <fstream>
#include <sstream>
#include <utility>

#include "ozz/base/log.h"

#include "bvh_scanner.h"

namespace bvh {

BvhParser::BvhParser()
    : m_scanner(nullptr) {
}

BvhParser::BvhParser(const ParseOptions& options)
    : m_options(options),
      m_scanner(nullptr) {
}

BvhParser::~BvhParser() {
}

bool BvhParser::Load(const char* filename, Document* document) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        m_error = Error();
        return Fail(&m_error, ErrorCode::kIo,
                    std::string("failed to open BVH file: ") + filename);
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (!file) {
        m_error = Error();
        return Fail(&m_error, ErrorCode::kIo,
                    std::string("failed to read BVH file: ") + filename);
    }

    const std::string text = contents.str();
    if (!Parse(text, document)) {
        return false;
    }

    ozz::log::LogV() << "Loaded BVH: " << CountChannels(document->root)
                     << " channels, " << document->frames << " frames at "
                     << document->frame_time << "s" << std::endl;
    return true;
}

bool BvhParser::Parse(const std::string& text, Document* document) {
    m_error = Error();

    Scanner scanner(text);
    m_scanner = &scanner;

    Document result;
    bool ok = false;
    m_scanner->SkipWhitespace();
    if (AssureLiteral("HIERARCHY") && ParseJoint(true, &result.root)) {
        ok = ParseMotion(&result);
    }
    m_scanner = nullptr;

    if (!ok) {
        return false;
    }
    *document = std::move(result);
    return true;
}

bool BvhParser::ParseJoint(bool root, Joint* joint) {
    Scanner& s = *m_scanner;

    s.SkipWhitespace();
    if (!AssureLiteral(root ? "ROOT" : "JOINT")) {
        return false;
    }
    if (!Assure("joint name", s.ReadLineString(&joint->name))) {
        return false;
    }

    s.SkipWhitespace();
    if (!AssureLiteral("{")) {
        return false;
    }
    s.SkipWhitespace();
    if (!AssureLiteral("OFFSET")) {
        return false;
    }
    s.SkipWhitespace();
    if (!Assure("offset X", s.ReadFloat(&joint->offset.x), ErrorCode::kNumeric)) {
        return false;
    }
    s.SkipWhitespace();
    if (!Assure("offset Y", s.ReadFloat(&joint->offset.y), ErrorCode::kNumeric)) {
        return false;
    }
    s.SkipWhitespace();
    if (!Assure("offset Z", s.ReadFloat(&joint->offset.z), ErrorCode::kNumeric)) {
        return false;
    }

    s.SkipWhitespace();
    if (!AssureLiteral("CHANNELS")) {
        return false;
    }
    s.SkipWhitespace();
    if (!Assure("channel number", s.ReadInt(&joint->channel_count),
                ErrorCode::kNumeric)) {
        return false;
    }
    if (!Assure("valid channel number",
                joint->channel_count >= 1 && joint->channel_count <= kNumChannelKinds)) {
        return false;
    }

    for (int i = 0; i < joint->channel_count; ++i) {
        s.SkipWhitespace();
        ChannelKind kind;
        if (!Assure("channel ID", s.ReadChannel(&kind))) {
            return false;
        }
        if (!Assure("unique channel ID", !joint->channels[kind].enabled)) {
            return false;
        }
        joint->channel_order[i] = kind;
        joint->channels[kind].enabled = true;
    }

    // Children until the closing brace
    char peek = ' ';
    do {
        s.SkipWhitespace();
        if (!Assure("child joint", s.Peek(&peek))) {
            return false;
        }
        peek = FoldChar(peek);
        switch (peek) {
            case 'J':
                joint->children.emplace_back();
                if (!ParseJoint(false, &joint->children.back())) {
                    return false;
                }
                break;
            case 'E':
                if (!ParseEndSite()) {
                    return false;
                }
                break;
            case '}':
                if (!AssureLiteral("}")) {
                    return false;
                }
                break;
            default:
                return Assure("child joint", false);
        }
    } while (peek != '}');

    return true;
}

bool BvhParser::ParseEndSite() {
    Scanner& s = *m_scanner;
    float ignored;

    if (!AssureLiteral("End Site")) {
        return false;
    }
    s.SkipWhitespace();
    if (!AssureLiteral("{")) {
        return false;
    }
    s.SkipWhitespace();
    if (!AssureLiteral("OFFSET")) {
        return false;
    }
    s.SkipWhitespace();
    if (!Assure("end site offset X", s.ReadFloat(&ignored), ErrorCode::kNumeric)) {
        return false;
    }
    s.SkipWhitespace();
    if (!Assure("end site offset Y", s.ReadFloat(&ignored), ErrorCode::kNumeric)) {
        return false;
    }
    s.SkipWhitespace();
    if (!Assure("end site offset Z", s.ReadFloat(&ignored), ErrorCode::kNumeric)) {
        return false;
    }
    s.SkipWhitespace();
    return AssureLiteral("}");
}

bool BvhParser::ParseMotion(Document* document) {
    Scanner& s = *m_scanner;

    s.SkipWhitespace();
    if (!AssureLiteral("MOTION")) {
        return false;
    }
    s.SkipWhitespace();
    if (!AssureLiteral("FRAMES:")) {
        return false;
    }
    s.SkipWhitespace();
    if (!Assure("frame number", s.ReadInt(&document->frames), ErrorCode::kNumeric)) {
        return false;
    }
    if (!Assure("non-negative frame number", document->frames >= 0)) {
        return false;
    }
    s.SkipWhitespace();
    if (!AssureLiteral("FRAME TIME:")) {
        return false;
    }
    s.SkipWhitespace();
    if (!Assure("frame time", s.ReadFloat(&document->frame_time), ErrorCode::kNumeric)) {
        return false;
    }

    if (m_options.override_frame_time) {
        document->frame_time = m_options.frame_time;
    }

    // One value array per declared channel, in MOTION column order
    const size_t frames = static_cast<size_t>(document->frames);
    std::vector<Channel*> columns;
    for (Joint* joint : FlattenJoints(&document->root)) {
        for (int i = 0; i < joint->channel_count; ++i) {
            columns.push_back(&joint->channels[joint->channel_order[i]]);
        }
    }

    // A motion line holds a newline and one character per value at least
    const size_t min_line_size = columns.size() + 1;
    if (!Assure("frame number matching the motion data",
                frames <= s.remaining() / min_line_size)) {
        return false;
    }
    for (Channel* channel : columns) {
        channel->values.assign(frames, 0.0f);
    }

    for (size_t frame = 0; frame < frames; ++frame) {
        if (!Assure("newline", s.ExpectNewline())) {
            return false;
        }
        for (Channel* column : columns) {
            s.SkipInlineWhitespace();
            if (!Assure("channel value", s.ReadFloat(&column->values[frame]),
                        ErrorCode::kNumeric)) {
                return false;
            }
        }
    }

    // More motion lines than declared frames
    s.SkipWhitespace();
    return Assure("end of motion data", s.AtEnd());
}

bool BvhParser::Assure(const char* what, bool result, ErrorCode code) {
    if (result) {
        return true;
    }
    m_error.code = code;
    m_error.offset = m_scanner->pos();
    m_error.expected = what;
    m_error.context = m_scanner->ContextWindow();
    m_error.message.clear();
    return false;
}

bool BvhParser::AssureLiteral(const char* literal) {
    return Assure(literal, m_scanner->ExpectLiteral(literal));
}

}  // namespace bvh
