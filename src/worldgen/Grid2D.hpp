#pragma once
#include <vector>
#include <cassert>
#include <algorithm>
#include <cstddef>

namespace islandgen::worldgen {

// Simple, cache-friendly row-major 2D grid.
//  - Contiguous memory (row-major) for good locality.
//  - Debug-only bounds checks in at().
//  - rowPtr(y) gives a raw pointer to the start of the y-th row (fast inner loops).
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

    [[nodiscard]] bool inBounds(int x, int y) const noexcept {
        return x >= 0 && y >= 0 && x < w_ && y < h_;
    }

    T*       data()       noexcept { return data_.data(); }
    const T* data() const noexcept { return data_.data(); }

    T* rowPtr(int y) noexcept {
        assert(y >= 0 && y < h_);
        return data_.data() + static_cast<std::size_t>(y) * static_cast<std::size_t>(w_);
    }
    const T* rowPtr(int y) const noexcept {
        assert(y >= 0 && y < h_);
        return data_.data() + static_cast<std::size_t>(y) * static_cast<std::size_t>(w_);
    }

    // Checked element access in debug builds; unchecked in release.
    T& at(int x, int y) noexcept {
        assert(inBounds(x, y));
        return data_[static_cast<std::size_t>(y) * static_cast<std::size_t>(w_) + static_cast<std::size_t>(x)];
    }
    const T& at(int x, int y) const noexcept {
        assert(inBounds(x, y));
        return data_[static_cast<std::size_t>(y) * static_cast<std::size_t>(w_) + static_cast<std::size_t>(x)];
    }

    void fill(const T& v) { std::fill(data_.begin(), data_.end(), v); }

    friend bool operator==(const Grid2D& a, const Grid2D& b) {
        return a.w_ == b.w_ && a.h_ == b.h_ && a.data_ == b.data_;
    }
    friend bool operator!=(const Grid2D& a, const Grid2D& b) { return !(a == b); }

private:
    int w_ = 0;
    int h_ = 0;
    std::vector<T> data_;
};

} // namespace islandgen::worldgen
