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

#ifndef UREGRID_GRID_DESCRIPTOR_HPP
#define UREGRID_GRID_DESCRIPTOR_HPP

#include <uregrid/GeometryDescriptor.hpp>

namespace uregrid {

/** A logically rectangular grid, defined by 1-D center and boundary
coordinates along each axis.  Data arrays have natural shape
(nlat, nlon); element t = j*nlon + i. */
class GridDescriptor : public GeometryDescriptor {
protected:
    // Inputs; 0-based private copies, fixed after validation
    blitz::Array<double,1> _lons, _lats;
    blitz::Array<double,1> _lonb, _latb;
    std::string _sproj;
    bool _circular;
    blitz::Array<double,2> _areas;

public:
    /** Used only when reading with ncio() */
    GridDescriptor() : _circular(false) {}

    GridDescriptor(
        blitz::Array<double,1> const &lons,
        blitz::Array<double,1> const &lats,
        blitz::Array<double,1> const &lonb,
        blitz::Array<double,1> const &latb,
        std::string const &sproj = "",
        bool circular = false,
        blitz::Array<double,2> const &areas = blitz::Array<double,2>());

    /** Cell centers along each axis */
    blitz::Array<double,1> const &lons() const { return _lons; }
    blitz::Array<double,1> const &lats() const { return _lats; }

    /** Cell boundaries along each axis.  latb has nlat+1 entries; lonb
    has nlon+1, or nlon if circular. */
    blitz::Array<double,1> const &lonb() const { return _lonb; }
    blitz::Array<double,1> const &latb() const { return _latb; }

    /** The projection (as a Proj.4 String) that converts the
    coordinates here to geodetic lon/lat.  Empty if they are already
    in degrees. */
    std::string const &sproj() const { return _sproj; }

    /** The first and last longitude bands are adjacent. */
    bool circular() const { return _circular; }

    /** Optional per-cell areas [nlat, nlon]; empty if not supplied. */
    blitz::Array<double,2> const &areas() const { return _areas; }

    int nlon() const { return _lons.extent(0); }
    int nlat() const { return _lats.extent(0); }

    DescriptorType type() const { return DescriptorType::GRID; }
    long size() const { return (long)nlon() * nlat(); }

    /** Engine element ids for grids are 1-based. */
    long index_offset() const { return 1; }

    std::vector<int> shape() const { return {nlat(), nlon()}; }

    std::unique_ptr<EngineGeometry> to_engine_representation() const;

    void ncio(ibmisc::NcIO &ncio, std::string const &vname);

protected:
    /** Throws ConstructionError if the arrays are inconsistent */
    void validate() const;
};

}    // namespace
#endif    // guard
