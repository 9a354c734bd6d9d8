#pragma once
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace WS {

// FIFO over a vector with a moving front index; consumed space is reclaimed lazily.
template <typename T>
class PopFrontQueue {
public:
    void push_back(T const& value) {
        this->vec.push_back(value);
    }

    void push_back(T&& value) {
        this->vec.push_back(std::move(value));
    }

    template <typename... Args>
    T& emplace_back(Args&&... args) {
        return this->vec.emplace_back(std::forward<Args>(args)...);
    }

    std::optional<T> pop_front() {
        if (this->isEmpty()) {
            return std::nullopt;
        }
        std::optional<T> front{std::move(this->vec[this->frontIndex])};
        this->frontIndex++;
        this->performGarbageCollectionIfNeeded();
        return front;
    }

    T& front() {
        return this->vec.at(this->frontIndex);
    }

    T const& front() const {
        return this->vec.at(this->frontIndex);
    }

    T& operator[](size_t index) {
        return this->vec.at(this->frontIndex + index);
    }

    T const& operator[](size_t index) const {
        return this->vec.at(this->frontIndex + index);
    }

    bool isEmpty() const {
        return this->frontIndex >= this->vec.size();
    }

    size_t size() const {
        return this->vec.size() - this->frontIndex;
    }

    void clear() {
        this->vec.clear();
        this->frontIndex = 0;
    }

    using iterator       = typename std::vector<T>::iterator;
    using const_iterator = typename std::vector<T>::const_iterator;

    iterator begin() {
        return this->vec.begin() + static_cast<std::ptrdiff_t>(this->frontIndex);
    }

    iterator end() {
        return this->vec.end();
    }

    const_iterator begin() const {
        return this->vec.cbegin() + static_cast<std::ptrdiff_t>(this->frontIndex);
    }

    const_iterator end() const {
        return this->vec.cend();
    }

private:
    std::vector<T> vec;
    size_t         frontIndex = 0;

    void performGarbageCollectionIfNeeded() {
        if (this->frontIndex == this->vec.size()) {
            this->clear();
        } else if (this->frontIndex > 32 && this->frontIndex * 2 > this->vec.size()) {
            this->vec.erase(this->vec.begin(), this->vec.begin() + static_cast<std::ptrdiff_t>(this->frontIndex));
            this->frontIndex = 0;
        }
    }
};

} // namespace WS
