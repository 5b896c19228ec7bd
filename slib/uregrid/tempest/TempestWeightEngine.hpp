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

#ifndef UREGRID_TEMPEST_WEIGHT_ENGINE_HPP
#define UREGRID_TEMPEST_WEIGHT_ENGINE_HPP

#include <uregrid/WeightEngine.hpp>

namespace uregrid {
namespace tempest {

/** Computes first-order conservative weights with TempestRemap:
overlap mesh by exact intersection on the unit sphere, then a
finite-volume to finite-volume offline map.  Weights are overlap area
over target area.

Caller-supplied element areas (on the unit sphere) replace the
computed ones: w' = w * (A_tgt_calc / A_tgt) * (A_src / A_src_calc) */
class TempestWeightEngine : public WeightEngine {
public:
    TempestWeightEngine() {}
    explicit TempestWeightEngine(EngineParams const &_params) :
        WeightEngine(_params) {}

    WeightTriples compute_weights(
        EngineGeometry const &src,
        EngineGeometry const &tgt) const;
};

}}    // namespace
#endif    // guard
