#include <mark_loaders/mark_records.hpp>
#include <mark_model/label.hpp>
#include <mark_model/mark.hpp>
#include <spdlog/spdlog.h>
#include <cmath>
#include <limits>
#include <string>

namespace mark_loaders {

using mark_model::Mark;
using mark_model::MarkKind;
using mark_model::Point;

namespace {

nlohmann::json point_to_json(Point p) {
    return nlohmann::json::array({p.x, p.y});
}

std::optional<Point> point_from_json(const nlohmann::json& j) {
    if (!j.is_array() || j.size() < 2) return std::nullopt;
    if (!j[0].is_number() || !j[1].is_number()) return std::nullopt;
    return Point{j[0].get<double>(), j[1].get<double>()};
}

std::string text_field(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) return {};
    const auto& v = j[key];
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number()) return v.dump();
    return {};
}

// Missing numeric fields fall back to `fallback`; present but non-numeric
// fields make the whole record malformed.
bool number_field(const nlohmann::json& j, const char* key, double fallback, double& out) {
    if (!j.contains(key) || j[key].is_null()) {
        out = fallback;
        return true;
    }
    if (!j[key].is_number()) return false;
    out = j[key].get<double>();
    return true;
}

std::shared_ptr<spdlog::logger> loader_log() {
    auto logger = spdlog::get("editor");
    return logger ? logger : spdlog::default_logger();
}

// Circle numerals stay within [1, INT_MAX - 1] so the next free index always fits.
std::optional<int> display_id_from_json(const nlohmann::json& did) {
    constexpr double max_id = static_cast<double>(std::numeric_limits<int>::max() - 1);
    const double value = did.get<double>();
    if (!std::isfinite(value) || value < 1.0 || value > max_id) {
        loader_log()->warn("mark_record display_id_out_of_range value={}", did.dump());
        return std::nullopt;
    }
    return static_cast<int>(value);
}

} // namespace

const char* record_type_name(MarkKind kind) {
    switch (kind) {
    case MarkKind::Circle: return "CircleMark";
    case MarkKind::Square: return "SquareMark";
    case MarkKind::Triangle: return "TriangleMark";
    case MarkKind::SCurve: return "SCurveWithMidCircle";
    case MarkKind::NoteText: return "NoteText";
    case MarkKind::MemoLine: return "memo_line";
    case MarkKind::MemoFreePath: return "memo_free";
    }
    return "";
}

std::optional<MarkKind> kind_from_type_name(std::string_view name) {
    if (name == "CircleMark") return MarkKind::Circle;
    if (name == "SquareMark") return MarkKind::Square;
    if (name == "TriangleMark") return MarkKind::Triangle;
    if (name == "SCurveWithMidCircle" || name == "SCurveMark") return MarkKind::SCurve;
    if (name == "NoteText") return MarkKind::NoteText;
    return std::nullopt;
}

nlohmann::json defect_info_to_json(const mark_model::DefectInfo& info) {
    return {
        {"member", info.member},
        {"location", info.location},
        {"defect_type", info.defect_type},
        {"size", {
            {"width_mm", info.size.width_mm},
            {"length_m", info.size.length_m},
            {"count_ea", info.size.count_ea},
        }},
        {"progress", info.progress},
        {"remark", info.remark},
    };
}

mark_model::DefectInfo defect_info_from_json(const nlohmann::json& j) {
    mark_model::DefectInfo info;
    if (!j.is_object()) return info;
    info.member = text_field(j, "member");
    info.location = text_field(j, "location");
    info.defect_type = text_field(j, "defect_type");
    if (j.contains("size") && j["size"].is_object()) {
        const auto& s = j["size"];
        info.size.width_mm = text_field(s, "width_mm");
        info.size.length_m = text_field(s, "length_m");
        info.size.count_ea = text_field(s, "count_ea");
    }
    info.progress = j.contains("progress") && j["progress"].is_boolean() && j["progress"].get<bool>();
    info.remark = text_field(j, "remark");
    return info;
}

nlohmann::json mark_to_record(const Mark& mark) {
    nlohmann::json j;
    j["type"] = record_type_name(mark.kind);
    j["x"] = mark.pos.x;
    j["y"] = mark.pos.y;
    j["scale"] = mark.scale;
    j["rotation"] = mark.rotation;
    j["internal_id"] = mark.internal_id;

    if (mark.display_id)
        j["display_id"] = *mark.display_id;
    else if (!mark.legacy_display_id.empty())
        j["display_id"] = mark.legacy_display_id;
    else
        j["display_id"] = nullptr;

    if (mark.defect) j["defect_info"] = defect_info_to_json(*mark.defect);

    if (mark.leader) {
        j["line"] = {
            {"p1", point_to_json(mark.leader->anchor)},
            {"p2", point_to_json(mark.leader->terminus)},
        };
    }

    switch (mark.kind) {
    case MarkKind::Circle:
        j["radius"] = mark.radius;
        break;
    case MarkKind::Square:
    case MarkKind::Triangle:
        j["size"] = mark.size;
        break;
    case MarkKind::SCurve:
        j["w"] = mark.w;
        j["h"] = mark.h;
        break;
    case MarkKind::NoteText:
        j["text"] = mark.text;
        break;
    default:
        break;
    }
    return j;
}

std::optional<Mark> mark_from_record(const nlohmann::json& record, const mark_model::TextMeasure& measure) {
    if (!record.is_object()) return std::nullopt;
    if (!record.contains("type") || !record["type"].is_string()) return std::nullopt;
    auto kind = kind_from_type_name(record["type"].get<std::string>());
    if (!kind) return std::nullopt;

    double x = 0, y = 0, scale = 1, rotation = 0;
    if (!number_field(record, "x", 0.0, x)) return std::nullopt;
    if (!number_field(record, "y", 0.0, y)) return std::nullopt;
    if (!number_field(record, "scale", 1.0, scale)) return std::nullopt;
    if (!number_field(record, "rotation", 0.0, rotation)) return std::nullopt;

    Mark mark;
    switch (*kind) {
    case MarkKind::Circle: {
        double r = 0;
        if (!number_field(record, "radius", 0.0, r)) return std::nullopt;
        mark = mark_model::make_circle({x, y}, r);
        break;
    }
    case MarkKind::Square: {
        double s = 0;
        if (!number_field(record, "size", 0.0, s)) return std::nullopt;
        mark = mark_model::make_square({x, y}, s);
        break;
    }
    case MarkKind::Triangle: {
        double s = 0;
        if (!number_field(record, "size", 0.0, s)) return std::nullopt;
        mark = mark_model::make_triangle({x, y}, s);
        break;
    }
    case MarkKind::SCurve: {
        double w = 0, h = 0;
        if (!number_field(record, "w", 0.0, w)) return std::nullopt;
        if (!number_field(record, "h", 0.0, h)) return std::nullopt;
        mark = mark_model::make_scurve({x, y}, w, h);
        break;
    }
    case MarkKind::NoteText:
        mark = mark_model::make_note_text({x, y}, text_field(record, "text"), measure);
        break;
    default:
        return std::nullopt;
    }

    mark_model::set_scale(mark, scale);
    mark_model::set_rotation(mark, rotation);

    if (record.contains("internal_id") && record["internal_id"].is_string())
        mark.internal_id = record["internal_id"].get<std::string>();

    if (record.contains("display_id")) {
        const auto& did = record["display_id"];
        if (did.is_number())
            mark.display_id = display_id_from_json(did);
        else if (did.is_string())
            mark.legacy_display_id = did.get<std::string>();
    }

    if (record.contains("defect_info") && record["defect_info"].is_object())
        mark.defect = defect_info_from_json(record["defect_info"]);
    if (mark_model::has_defect_record(mark.kind) && !mark.defect)
        mark.defect = mark_model::DefectInfo{};

    return mark;
}

std::optional<std::pair<Point, Point>> record_line(const nlohmann::json& record) {
    if (!record.is_object() || !record.contains("line")) return std::nullopt;
    const auto& line = record["line"];
    if (!line.is_object() || !line.contains("p1") || !line.contains("p2")) return std::nullopt;
    auto p1 = point_from_json(line["p1"]);
    auto p2 = point_from_json(line["p2"]);
    if (!p1 || !p2) return std::nullopt;
    return std::make_pair(*p1, *p2);
}

nlohmann::json memo_to_record(const Mark& memo) {
    if (memo.kind == MarkKind::MemoLine) {
        const Point p1 = memo.points.empty() ? Point{} : memo.points.front();
        const Point p2 = memo.points.empty() ? Point{} : memo.points.back();
        return {
            {"type", "memo_line"},
            {"p1", point_to_json(p1)},
            {"p2", point_to_json(p2)},
        };
    }
    nlohmann::json pts = nlohmann::json::array();
    for (const auto& p : memo.points) pts.push_back(point_to_json(p));
    return {
        {"type", "memo_free"},
        {"pts", pts},
    };
}

std::optional<Mark> memo_from_record(const nlohmann::json& record) {
    if (!record.is_object() || !record.contains("type") || !record["type"].is_string())
        return std::nullopt;
    const auto type = record["type"].get<std::string>();

    if (type == "memo_line") {
        if (!record.contains("p1") || !record.contains("p2")) return std::nullopt;
        auto p1 = point_from_json(record["p1"]);
        auto p2 = point_from_json(record["p2"]);
        if (!p1 || !p2) return std::nullopt;
        return mark_model::make_memo_line(*p1, *p2);
    }

    if (type == "memo_free") {
        if (!record.contains("pts") || !record["pts"].is_array() || record["pts"].empty())
            return std::nullopt;
        std::optional<Mark> memo;
        for (const auto& pj : record["pts"]) {
            auto p = point_from_json(pj);
            if (!p) return std::nullopt;
            if (!memo)
                memo = mark_model::make_memo_free_path(*p);
            else
                mark_model::add_memo_point(*memo, *p);
        }
        return memo;
    }

    return std::nullopt;
}

} // namespace mark_loaders
