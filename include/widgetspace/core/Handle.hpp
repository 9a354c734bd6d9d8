#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace WS {

/*
 * Generation-checked reference into a Pool<T>. A default constructed handle is the
 * none sentinel; pools never hand out generation 0, so none never resolves.
 */
template <typename T>
class Handle {
public:
    constexpr Handle() = default;
    constexpr Handle(std::uint32_t index, std::uint32_t generation)
        : index_(index), generation_(generation) {}

    [[nodiscard]] static constexpr auto none() -> Handle {
        return Handle{};
    }

    [[nodiscard]] constexpr auto index() const -> std::uint32_t {
        return index_;
    }

    [[nodiscard]] constexpr auto generation() const -> std::uint32_t {
        return generation_;
    }

    [[nodiscard]] constexpr auto is_none() const -> bool {
        return generation_ == 0;
    }

    [[nodiscard]] constexpr auto is_some() const -> bool {
        return generation_ != 0;
    }

    [[nodiscard]] auto to_string() const -> std::string {
        if (is_none()) {
            return "none";
        }
        return std::to_string(index_) + ":" + std::to_string(generation_);
    }

    constexpr auto operator==(Handle const&) const -> bool = default;

private:
    std::uint32_t index_      = 0;
    std::uint32_t generation_ = 0;
};

} // namespace WS

template <typename T>
struct std::hash<WS::Handle<T>> {
    auto operator()(WS::Handle<T> const& handle) const noexcept -> std::size_t {
        return std::hash<std::uint64_t>{}((static_cast<std::uint64_t>(handle.generation()) << 32) | handle.index());
    }
};
