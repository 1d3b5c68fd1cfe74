#include <mark_model/types.hpp>
#include <mark_model/mark_constants.hpp>

namespace mark_model {

const char* kind_name(MarkKind k) {
    switch (k) {
    case MarkKind::Circle: return "circle";
    case MarkKind::Square: return "square";
    case MarkKind::Triangle: return "triangle";
    case MarkKind::SCurve: return "s_curve";
    case MarkKind::NoteText: return "note_text";
    case MarkKind::MemoLine: return "memo_line";
    case MarkKind::MemoFreePath: return "memo_free";
    }
    return "unknown";
}

DefectInfo DefectInfo::initial() {
    DefectInfo info;
    info.member = std::string(defaults::default_member);
    return info;
}

} // namespace mark_model
