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

#ifndef UREGRID_ENGINE_GEOMETRY_HPP
#define UREGRID_ENGINE_GEOMETRY_HPP

#include <vector>
#include <blitz/array.h>

namespace uregrid {

enum class EngineGeometryType {GRID, MESH};

/** A grid or mesh, normalized into the form a WeightEngine consumes.
All coordinates are geodetic degrees.  Element k of the geometry is
reported by the engine as element id (first_element_id + k). */
class EngineGeometry {
public:
    EngineGeometryType const type;

    /** Engine-side id of the geometry's first element */
    long first_element_id;

    /** Number of elements (grid cells or mesh faces) */
    long nelements;

    /** Caller-supplied area of each element, in element order.
    Empty if the engine should use the areas it computes itself. */
    std::vector<double> areas;

    explicit EngineGeometry(EngineGeometryType _type) :
        type(_type), first_element_id(0), nelements(0) {}
    virtual ~EngineGeometry() {}

    bool has_areas() const { return areas.size() > 0; }
};

/** Logically rectangular lon/lat grid; element k = j*nlon + i */
class EngineGrid : public EngineGeometry {
public:
    int nlat, nlon;

    /** The last column of corners is identified with the first. */
    bool periodic;

    /** Cell centers [nlat, nlon] */
    blitz::Array<double,2> center_lon, center_lat;

    /** Cell corners [nlat+1, ncorner_lon()].  Cell (j,i) has corners
    (j,i), (j,i+1), (j+1,i+1), (j+1,i); with column index taken modulo
    ncorner_lon() when periodic. */
    blitz::Array<double,2> corner_lon, corner_lat;

    EngineGrid() : EngineGeometry(EngineGeometryType::GRID),
        nlat(0), nlon(0), periodic(false) {}

    int ncorner_lon() const
        { return periodic ? nlon : nlon + 1; }

    /** Corner column for the i'th longitude band boundary */
    int corner_col(int i) const
        { return periodic ? (i % nlon) : i; }
};

/** Unstructured mesh; element k is face k. */
class EngineMesh : public EngineGeometry {
public:
    /** Node coordinates, (lon, lat) interleaved */
    std::vector<double> node_coords;

    /** Engine-side id of each element */
    std::vector<long> elem_ids;

    /** Number of nodes of each element */
    std::vector<int> elem_types;

    /** 0-based node references, elem_types[k] of them per element,
    in element order */
    std::vector<int> elem_conn;

    EngineMesh() : EngineGeometry(EngineGeometryType::MESH) {}

    long nnodes() const { return node_coords.size() / 2; }
};

}    // namespace
#endif    // guard
