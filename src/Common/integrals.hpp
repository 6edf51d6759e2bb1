/**
 * @file integrals.hpp
 * @author remzerrr (remi.helleboid@gmail.com)
 * @brief Numerical integration utilities.
 * @version 0.1
 * @date 2025-10-12
 *
 *
 */

#pragma once
#include <algorithm>
#include <cassert>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace pbands::integrate {

template <typename T>
concept Real = std::is_floating_point_v<T>;

template <Real T>
inline bool is_strictly_increasing(std::span<const T> x) noexcept {
    for (std::size_t i = 1; i < x.size(); ++i) {
        if (!(x[i] > x[i - 1])) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Linear interpolation on a segment [x0,y0]-[x1,y1] at xq.
 * xq may lie outside [x0, x1], in which case the segment is extrapolated.
 *
 * @tparam T
 * @param x0
 * @param y0
 * @param x1
 * @param y1
 * @param xq
 * @return constexpr T
 */
template <Real T>
constexpr T lerp_on_segment(T x0, T y0, T x1, T y1, T xq) noexcept {
    const T dx = x1 - x0;
    if (dx == T(0)) {
        return y0;
    }
    const T t = (xq - x0) / dx;
    return std::fma(t, (y1 - y0), y0);
}

/**
 * @brief Segment index for value q in array x.
 * Values below x.front() map to the first segment, values above x.back() to the last one.
 *
 * @tparam T
 * @param x
 * @param q
 * @return std::size_t
 */
template <Real T>
inline std::size_t segment_index(std::span<const T> x, T q) {
    const auto it = std::lower_bound(x.begin(), x.end(), q);
    if (it == x.begin()) {
        return 0;
    }
    if (it == x.end()) {
        return x.size() - 2;
    }
    // x[idx - 1] < q <= x[idx]: an exact hit takes the left segment.
    const std::size_t idx = static_cast<std::size_t>(it - x.begin());
    return std::min<std::size_t>(idx - 1, x.size() - 2);
}

/**
 * @brief Compute the trapezoidal integral of a function given its samples.
 *
 * @tparam T
 * @param x
 * @param y
 * @return T
 */
template <Real T>
inline T trapz(std::span<const T> x, std::span<const T> y) {
    if (x.size() != y.size()) {
        throw std::invalid_argument("trapz: x and y must have the same size.");
    }
    const std::size_t n = x.size();
    if (n < 2) {
        return T(0);
    }
    assert(is_strictly_increasing(x) && "x must be strictly increasing.");

    T s = T(0);
    for (std::size_t i = 1; i < n; ++i) {
        const T dx = x[i] - x[i - 1];
        s += dx * (y[i] + y[i - 1]) / T(2);
    }
    return s;
}

template <Real T>
inline T trapz(const std::vector<T>& x, const std::vector<T>& y) {
    return trapz<T>(std::span<const T>(x), std::span<const T>(y));
}

}  // namespace pbands::integrate
