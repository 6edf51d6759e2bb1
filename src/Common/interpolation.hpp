/**
 * @file interpolation.hpp
 * @author remzerrr (remi.helleboid@gmail.com)
 * @brief Piecewise-linear interpolation with linear extrapolation.
 * @version 0.1
 * @date 2025-10-27
 *
 *
 */

#pragma once

#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "integrals.hpp"
#include "numerical_helper.hpp"

namespace pbands::interpolate {

/**
 * @brief Piecewise-linear function y(x) built from samples.
 *
 * Samples are sorted by abscissa at construction. Outside [x.front(), x.back()] the first and
 * last segments are extended linearly.
 *
 */
class LinearInterpolant {
 private:
    std::vector<double> m_x;
    std::vector<double> m_y;

 public:
    LinearInterpolant(const std::vector<double>& x, const std::vector<double>& y) {
        if (x.size() != y.size()) {
            throw std::invalid_argument("LinearInterpolant: x and y sizes differ (" + std::to_string(x.size()) +
                                        " != " + std::to_string(y.size()) + ").");
        }
        const std::vector<std::size_t> order = numerical::argsort(x);
        m_x.reserve(x.size());
        m_y.reserve(y.size());
        for (std::size_t idx : order) {
            m_x.push_back(x[idx]);
            m_y.push_back(y[idx]);
        }
        if (m_x.size() < 2) {
            throw std::invalid_argument("LinearInterpolant: at least 2 samples are required.");
        }
        if (!integrate::is_strictly_increasing(std::span<const double>(m_x))) {
            throw std::invalid_argument("LinearInterpolant: abscissae must be distinct.");
        }
    }

    double operator()(double xq) const {
        const std::span<const double> xs(m_x);
        const std::size_t             idx = integrate::segment_index(xs, xq);
        return integrate::lerp_on_segment(m_x[idx], m_y[idx], m_x[idx + 1], m_y[idx + 1], xq);
    }

    std::vector<double> operator()(const std::vector<double>& list_xq) const {
        std::vector<double> values;
        values.reserve(list_xq.size());
        for (double xq : list_xq) {
            values.push_back((*this)(xq));
        }
        return values;
    }

    const std::vector<double>& get_x() const { return m_x; }
    const std::vector<double>& get_y() const { return m_y; }
    std::size_t                size() const { return m_x.size(); }
};

}  // namespace pbands::interpolate
