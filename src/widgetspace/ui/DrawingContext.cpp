#include <widgetspace/ui/DrawingContext.hpp>

#include <algorithm>
#include <cmath>

namespace WS::UI {

namespace {

auto edge_sign(Vec2 p, Vec2 a, Vec2 b) -> float {
    return (p.x - b.x) * (a.y - b.y) - (a.x - b.x) * (p.y - b.y);
}

// Winding-agnostic; points on an edge count as inside.
auto point_in_triangle(Vec2 p, Vec2 a, Vec2 b, Vec2 c) -> bool {
    auto const d1 = edge_sign(p, a, b);
    auto const d2 = edge_sign(p, b, c);
    auto const d3 = edge_sign(p, c, a);
    auto const has_negative = d1 < 0.0f || d2 < 0.0f || d3 < 0.0f;
    auto const has_positive = d1 > 0.0f || d2 > 0.0f || d3 > 0.0f;
    return !(has_negative && has_positive);
}

} // namespace

auto DrawingContext::clear() -> void {
    vertices_.clear();
    triangles_.clear();
    commands_.clear();
    clip_stack_.clear();
    committed_triangles_ = 0;
    nesting_             = 0;
}

auto DrawingContext::push_vertex(Vec2 position, Vec2 tex_coords, Color color) -> std::uint32_t {
    auto const index = static_cast<std::uint32_t>(vertices_.size());
    vertices_.push_back(Vertex{position, tex_coords, color});
    return index;
}

auto DrawingContext::push_triangle(std::uint32_t a, std::uint32_t b, std::uint32_t c) -> void {
    triangles_.push_back(Triangle{a, b, c});
}

auto DrawingContext::push_rect_filled(Rect const& rect, Color color) -> void {
    this->push_rect_filled(rect, Rect{0.0f, 0.0f, 1.0f, 1.0f}, color);
}

auto DrawingContext::push_rect_filled(Rect const& rect, Rect const& tex_coords, Color color) -> void {
    auto const top_left     = this->push_vertex(Vec2{rect.x, rect.y}, Vec2{tex_coords.x, tex_coords.y}, color);
    auto const top_right    = this->push_vertex(Vec2{rect.right(), rect.y}, Vec2{tex_coords.right(), tex_coords.y}, color);
    auto const bottom_right = this->push_vertex(Vec2{rect.right(), rect.bottom()}, Vec2{tex_coords.right(), tex_coords.bottom()}, color);
    auto const bottom_left  = this->push_vertex(Vec2{rect.x, rect.bottom()}, Vec2{tex_coords.x, tex_coords.bottom()}, color);
    this->push_triangle(top_left, top_right, bottom_right);
    this->push_triangle(top_left, bottom_right, bottom_left);
}

auto DrawingContext::push_rect(Rect const& rect, float thickness, Color color) -> void {
    auto const t = std::min({thickness, rect.w * 0.5f, rect.h * 0.5f});
    if (t <= 0.0f) {
        return;
    }
    this->push_rect_filled(Rect{rect.x, rect.y, rect.w, t}, color);
    this->push_rect_filled(Rect{rect.x, rect.bottom() - t, rect.w, t}, color);
    this->push_rect_filled(Rect{rect.x, rect.y + t, t, rect.h - t * 2.0f}, color);
    this->push_rect_filled(Rect{rect.right() - t, rect.y + t, t, rect.h - t * 2.0f}, color);
}

auto DrawingContext::push_line(Vec2 begin, Vec2 end, float thickness, Color color) -> void {
    auto const dx     = end.x - begin.x;
    auto const dy     = end.y - begin.y;
    auto const length = std::sqrt(dx * dx + dy * dy);
    if (length <= 0.0f || thickness <= 0.0f) {
        return;
    }
    auto const half   = thickness * 0.5f;
    auto const normal = Vec2{-dy / length * half, dx / length * half};
    auto const a      = this->push_vertex(begin + normal, Vec2{}, color);
    auto const b      = this->push_vertex(end + normal, Vec2{1.0f, 0.0f}, color);
    auto const c      = this->push_vertex(end - normal, Vec2{1.0f, 1.0f}, color);
    auto const d      = this->push_vertex(begin - normal, Vec2{0.0f, 1.0f}, color);
    this->push_triangle(a, b, c);
    this->push_triangle(a, c, d);
}

auto DrawingContext::commit(CommandKind kind, std::optional<TextureId> texture) -> bool {
    auto const pending = triangles_.size() - committed_triangles_;
    if (pending == 0) {
        return false;
    }

    Command command{};
    command.kind           = kind;
    command.texture        = texture;
    command.nesting        = nesting_;
    command.triangle_start = committed_triangles_;
    command.triangle_count = pending;
    if (!clip_stack_.empty()) {
        command.clip_command = clip_stack_.back();
    }

    auto const& first = vertices_[triangles_[committed_triangles_].a].position;
    Rect bounds{first.x, first.y, 0.0f, 0.0f};
    for (auto i = committed_triangles_; i < triangles_.size(); ++i) {
        auto const& tri = triangles_[i];
        bounds = bounds.extend_to(vertices_[tri.a].position);
        bounds = bounds.extend_to(vertices_[tri.b].position);
        bounds = bounds.extend_to(vertices_[tri.c].position);
    }
    command.bounds = bounds;

    if (kind == CommandKind::Clip) {
        clip_stack_.push_back(commands_.size());
    }
    commands_.push_back(command);
    committed_triangles_ = triangles_.size();
    return true;
}

auto DrawingContext::commit_clip_rect(Rect const& clip_rect) -> void {
    this->push_rect_filled(clip_rect, Colors::White);
    this->commit(CommandKind::Clip);
}

auto DrawingContext::revert_clip_geom() -> void {
    if (!clip_stack_.empty()) {
        clip_stack_.pop_back();
    }
}

auto DrawingContext::is_command_contains_point(Command const& command, Vec2 point) const -> bool {
    if (!command.bounds.contains(point)) {
        return false;
    }
    auto const end = std::min(command.triangle_start + command.triangle_count, triangles_.size());
    for (auto i = command.triangle_start; i < end; ++i) {
        auto const& tri = triangles_[i];
        if (point_in_triangle(point, vertices_[tri.a].position, vertices_[tri.b].position, vertices_[tri.c].position)) {
            return true;
        }
    }
    return false;
}

} // namespace WS::UI
