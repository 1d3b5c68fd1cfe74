#pragma once

#include <mark_geometry/types.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mark_model {

using mark_geometry::Point;
using mark_geometry::Rect;
using mark_geometry::Size;

using MarkId = std::uint64_t;

enum class MarkKind {
    Circle,
    Square,
    Triangle,
    SCurve,
    NoteText,
    MemoLine,
    MemoFreePath
};

constexpr bool is_memo(MarkKind k) {
    return k == MarkKind::MemoLine || k == MarkKind::MemoFreePath;
}

// Serializable marks are the defect items persisted through the save contract.
constexpr bool is_serializable(MarkKind k) {
    return !is_memo(k);
}

constexpr bool owns_leader_line(MarkKind k) {
    switch (k) {
    case MarkKind::Circle:
    case MarkKind::Square:
    case MarkKind::Triangle:
    case MarkKind::SCurve:
        return true;
    default:
        return false;
    }
}

constexpr bool owns_label(MarkKind k) {
    return owns_leader_line(k);
}

constexpr bool has_defect_record(MarkKind k) {
    return k == MarkKind::Circle;
}

const char* kind_name(MarkKind k);

struct DefectSize {
    std::string width_mm;
    std::string length_m;
    std::string count_ea;

    bool operator==(const DefectSize&) const = default;
};

struct DefectInfo {
    std::string member;
    std::string location;
    std::string defect_type;
    DefectSize size;
    bool progress = false;
    std::string remark;

    bool operator==(const DefectInfo&) const = default;

    // Record given to a freshly created circle.
    static DefectInfo initial();
};

struct LeaderLine {
    Point anchor;
    Point terminus;
    double opacity = 1.0;
    bool preview = false;
};

// Text attached at the bottom-right of a mark. `local_pos` is the top-left
// corner in the owning mark's local coordinates.
struct Label {
    std::string text;
    Point local_pos;
    Size size;
    bool editing = false;
};

struct Mark {
    MarkKind kind = MarkKind::Circle;

    Point pos;
    double scale = 1.0;
    double rotation = 0.0;
    bool visible = true;
    bool selected = false;

    std::string internal_id;
    std::optional<int> display_id;
    // Non-numeric display ids carried by files from older versions.
    std::string legacy_display_id;
    std::optional<DefectInfo> defect;

    std::optional<LeaderLine> leader;
    std::optional<Label> label;

    // Shape parameters; only the ones matching `kind` are meaningful.
    double radius = 0;
    double size = 0;
    double w = 0;
    double h = 0;
    double mid_radius = 0;
    double curve = 0;
    std::string text;
    Size text_size;
    // Memo strokes in scene coordinates (line: two points, path: every sample).
    std::vector<Point> points;
};

} // namespace mark_model
