/*
 * uregrid: Conservative Regridding between Grids and UGRID Meshes
 * Copyright (c) 2026 by the uregrid developers
 * 
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 * 
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 * 
 * You should have received a copy of the GNU Lesser General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#ifndef UREGRID_WEIGHT_ENGINE_HPP
#define UREGRID_WEIGHT_ENGINE_HPP

#include <vector>
#include <uregrid/EngineGeometry.hpp>

namespace uregrid {

/** Sparse (row, col, weight) triples, in the engine's element ids:
row = target element id, col = source element id. */
struct WeightTriples {
    std::vector<long> rows;
    std::vector<long> cols;
    std::vector<double> weights;

    size_t size() const { return weights.size(); }

    void reserve(size_t n)
    {
        rows.reserve(n);
        cols.reserve(n);
        weights.reserve(n);
    }

    void add(long row, long col, double weight)
    {
        rows.push_back(row);
        cols.push_back(col);
        weights.push_back(weight);
    }
};

/** Parameters controlling the generation of weights */
struct EngineParams {
    /** Leave out elements too degenerate to have an area, instead of
    failing on them. */
    bool ignore_degenerate;

    /** Print progress to stdout */
    bool verbose;

    EngineParams() : ignore_degenerate(true), verbose(false) {}

    EngineParams(bool _ignore_degenerate, bool _verbose) :
        ignore_degenerate(_ignore_degenerate), verbose(_verbose) {}
};

/** Computes conservative area-weighted regridding weights between two
geometries.  The weights for a target element sum to the fraction of
its area covered by the source geometry; target elements not covered
at all are left out.

Implementations release everything they allocate before returning,
and report failure through uregrid_error(ENGINE_FAILURE, ...). */
class WeightEngine {
public:
    EngineParams params;

    WeightEngine() {}
    explicit WeightEngine(EngineParams const &_params) : params(_params) {}
    virtual ~WeightEngine() {}

    virtual WeightTriples compute_weights(
        EngineGeometry const &src,
        EngineGeometry const &tgt) const = 0;
};

}    // namespace
#endif    // guard
