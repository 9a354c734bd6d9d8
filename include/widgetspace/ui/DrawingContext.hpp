#pragma once

#include <widgetspace/ui/Geometry.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace WS::UI {

enum class CommandKind : std::uint8_t {
    Geometry = 0,
    Clip     = 1,
};

using TextureId = std::uint64_t;

struct Vertex {
    Vec2  position{};
    Vec2  tex_coords{};
    Color color{};
};

struct Triangle {
    std::uint32_t a = 0;
    std::uint32_t b = 0;
    std::uint32_t c = 0;
};

struct Command {
    CommandKind                kind = CommandKind::Geometry;
    std::optional<TextureId>   texture{};
    std::uint8_t               nesting        = 0;
    std::size_t                triangle_start = 0;
    std::size_t                triangle_count = 0;
    // Clip command active when this one was committed.
    std::optional<std::size_t> clip_command{};
    Rect                       bounds{};
};

/*
 * Append-only command buffer filled during the draw traversal. Geometry is pushed
 * as pending triangles and turned into a command by commit(). Clip rects follow a
 * stack discipline: commit_clip_rect() pushes, revert_clip_geom() pops.
 */
class DrawingContext {
public:
    auto clear() -> void;

    auto set_nesting(std::uint8_t nesting) -> void { nesting_ = nesting; }
    [[nodiscard]] auto nesting() const -> std::uint8_t { return nesting_; }

    auto push_vertex(Vec2 position, Vec2 tex_coords, Color color) -> std::uint32_t;
    auto push_triangle(std::uint32_t a, std::uint32_t b, std::uint32_t c) -> void;
    auto push_rect_filled(Rect const& rect, Color color) -> void;
    auto push_rect_filled(Rect const& rect, Rect const& tex_coords, Color color) -> void;
    // Outline of the given thickness, drawn inside the rect.
    auto push_rect(Rect const& rect, float thickness, Color color) -> void;
    auto push_line(Vec2 begin, Vec2 end, float thickness, Color color) -> void;

    // Returns false when nothing was pending.
    auto commit(CommandKind kind, std::optional<TextureId> texture = std::nullopt) -> bool;

    auto commit_clip_rect(Rect const& clip_rect) -> void;
    auto revert_clip_geom() -> void;
    [[nodiscard]] auto clip_depth() const -> std::size_t { return clip_stack_.size(); }

    [[nodiscard]] auto commands() const -> std::vector<Command> const& { return commands_; }
    [[nodiscard]] auto vertices() const -> std::vector<Vertex> const& { return vertices_; }
    [[nodiscard]] auto triangles() const -> std::vector<Triangle> const& { return triangles_; }
    [[nodiscard]] auto pending_triangle_count() const -> std::size_t { return triangles_.size() - committed_triangles_; }

    [[nodiscard]] auto is_command_contains_point(Command const& command, Vec2 point) const -> bool;

private:
    std::vector<Vertex>      vertices_{};
    std::vector<Triangle>    triangles_{};
    std::vector<Command>     commands_{};
    std::vector<std::size_t> clip_stack_{};
    std::size_t              committed_triangles_ = 0;
    std::uint8_t             nesting_             = 0;
};

} // namespace WS::UI
