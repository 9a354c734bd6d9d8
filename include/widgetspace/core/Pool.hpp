#pragma once

#include <widgetspace/core/Error.hpp>
#include <widgetspace/core/Handle.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace WS {

/*
 * Sparse generational storage. Slots keep their generation when vacated by
 * take_at(), and bump it when released by free(), so handles issued before a free
 * never resolve to a later occupant.
 */
template <typename T>
class Pool {
public:
    Pool() = default;

    auto spawn(T payload) -> Handle<T> {
        if (!free_list_.empty()) {
            auto const index = free_list_.back();
            free_list_.pop_back();
            auto& record = records_[index];
            record.payload.emplace(std::move(payload));
            ++alive_count_;
            return Handle<T>{index, record.generation};
        }
        auto const index = static_cast<std::uint32_t>(records_.size());
        records_.push_back(Record{});
        records_.back().payload.emplace(std::move(payload));
        ++alive_count_;
        return Handle<T>{index, records_.back().generation};
    }

    auto free(Handle<T> handle) -> T {
        auto& record = this->checked_record(handle);
        T payload    = std::move(*record.payload);
        record.payload.reset();
        ++record.generation;
        if (record.generation == 0) {
            record.generation = 1;
        }
        free_list_.push_back(handle.index());
        --alive_count_;
        return payload;
    }

    [[nodiscard]] auto borrow(Handle<T> handle) -> T& {
        return *this->checked_record(handle).payload;
    }

    [[nodiscard]] auto borrow(Handle<T> handle) const -> T const& {
        return *this->checked_record(handle).payload;
    }

    [[nodiscard]] auto is_valid_handle(Handle<T> handle) const -> bool {
        if (handle.is_none() || handle.index() >= records_.size()) {
            return false;
        }
        auto const& record = records_[handle.index()];
        return record.generation == handle.generation() && record.payload.has_value();
    }

    // Like is_valid_handle, but also true while the slot is taken out.
    [[nodiscard]] auto is_current_handle(Handle<T> handle) const -> bool {
        return handle.is_some() && handle.index() < records_.size()
               && records_[handle.index()].generation == handle.generation();
    }

    // Vacates a slot without releasing it; the generation is left untouched.
    [[nodiscard]] auto take_at(std::size_t index) -> std::optional<T> {
        if (index >= records_.size() || !records_[index].payload) {
            return std::nullopt;
        }
        std::optional<T> taken{std::move(*records_[index].payload)};
        records_[index].payload.reset();
        --alive_count_;
        return taken;
    }

    auto put_back(std::size_t index, T payload) -> void {
        if (index >= records_.size()) {
            throw ContractViolation(Error::Code::InvalidHandle,
                                    "put_back index " + std::to_string(index) + " out of range");
        }
        auto& record = records_[index];
        if (record.payload) {
            throw ContractViolation(Error::Code::SlotOccupied,
                                    "put_back into occupied slot " + std::to_string(index));
        }
        record.payload.emplace(std::move(payload));
        ++alive_count_;
    }

    [[nodiscard]] auto handle_from_index(std::size_t index) const -> Handle<T> {
        if (index >= records_.size()) {
            return Handle<T>{};
        }
        return Handle<T>{static_cast<std::uint32_t>(index), records_[index].generation};
    }

    [[nodiscard]] auto capacity() const -> std::size_t {
        return records_.size();
    }

    [[nodiscard]] auto alive_count() const -> std::size_t {
        return alive_count_;
    }

    template <typename F>
    auto for_each(F&& func) -> void {
        for (std::size_t i = 0; i < records_.size(); ++i) {
            if (records_[i].payload) {
                func(Handle<T>{static_cast<std::uint32_t>(i), records_[i].generation}, *records_[i].payload);
            }
        }
    }

    template <typename F>
    auto for_each(F&& func) const -> void {
        for (std::size_t i = 0; i < records_.size(); ++i) {
            if (records_[i].payload) {
                func(Handle<T>{static_cast<std::uint32_t>(i), records_[i].generation}, *records_[i].payload);
            }
        }
    }

    auto clear() -> void {
        records_.clear();
        free_list_.clear();
        alive_count_ = 0;
    }

private:
    struct Record {
        std::uint32_t    generation = 1;
        std::optional<T> payload;
    };

    [[nodiscard]] auto checked_record(Handle<T> handle) const -> Record const& {
        if (handle.is_none()) {
            throw ContractViolation(Error::Code::InvalidHandle, "attempt to borrow the none handle");
        }
        if (handle.index() >= records_.size()) {
            throw ContractViolation(Error::Code::InvalidHandle,
                                    "handle " + handle.to_string() + " out of range");
        }
        auto const& record = records_[handle.index()];
        if (record.generation != handle.generation()) {
            throw ContractViolation(Error::Code::StaleHandle,
                                    "handle " + handle.to_string() + " is stale");
        }
        if (!record.payload) {
            throw ContractViolation(Error::Code::SlotVacant,
                                    "slot of handle " + handle.to_string() + " is vacant");
        }
        return record;
    }

    [[nodiscard]] auto checked_record(Handle<T> handle) -> Record& {
        return const_cast<Record&>(std::as_const(*this).checked_record(handle));
    }

    std::vector<Record>        records_{};
    std::vector<std::uint32_t> free_list_{};
    std::size_t                alive_count_ = 0;
};

} // namespace WS
