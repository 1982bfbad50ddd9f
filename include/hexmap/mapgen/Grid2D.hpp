#pragma once
#include <vector>
#include <cassert>
#include <algorithm>
#include <cstddef>

namespace hexmap::mapgen {

// Row-major 2D grid indexed by (x, y) = (q, r).
//  - Contiguous memory for good locality.
//  - Debug-only bounds checks in at().
template <class T>
class Grid2D {
public:
    using value_type = T;

    Grid2D() = default;

    Grid2D(int w, int h)
        : w_(w), h_(h), data_(static_cast<std::size_t>(w) * static_cast<std::size_t>(h)) {}

    Grid2D(int w, int h, const T& init)
        : w_(w), h_(h), data_(static_cast<std::size_t>(w) * static_cast<std::size_t>(h), init) {}

    [[nodiscard]] int width()  const noexcept { return w_; }
    [[nodiscard]] int height() const noexcept { return h_; }
    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    T*       data()       noexcept { return data_.data(); }
    const T* data() const noexcept { return data_.data(); }

    auto begin()       noexcept { return data_.begin(); }
    auto end()         noexcept { return data_.end(); }
    auto begin() const noexcept { return data_.begin(); }
    auto end()   const noexcept { return data_.end(); }

    // Checked element access in debug builds; unchecked in release.
    T& at(int x, int y) noexcept {
#ifndef NDEBUG
        assert(x >= 0 && x < w_ && y >= 0 && y < h_);
#endif
        return data_[static_cast<std::size_t>(y) * static_cast<std::size_t>(w_) + static_cast<std::size_t>(x)];
    }
    const T& at(int x, int y) const noexcept {
#ifndef NDEBUG
        assert(x >= 0 && x < w_ && y >= 0 && y < h_);
#endif
        return data_[static_cast<std::size_t>(y) * static_cast<std::size_t>(w_) + static_cast<std::size_t>(x)];
    }

    [[nodiscard]] bool contains(int x, int y) const noexcept {
        return x >= 0 && x < w_ && y >= 0 && y < h_;
    }

    void fill(const T& v) { std::fill(data_.begin(), data_.end(), v); }

    friend bool operator==(const Grid2D& a, const Grid2D& b) {
        return a.w_ == b.w_ && a.h_ == b.h_ && a.data_ == b.data_;
    }

private:
    int w_ = 0;
    int h_ = 0;
    std::vector<T> data_;
};

} // namespace hexmap::mapgen
