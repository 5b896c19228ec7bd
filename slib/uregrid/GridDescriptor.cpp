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

#include <ibmisc/Proj2.hpp>
#include <uregrid/GridDescriptor.hpp>

using namespace ibmisc;
using namespace netCDF;

namespace uregrid {

/** 0-based private copy of a caller array */
template<int RANK>
static blitz::Array<double,RANK> copy0(blitz::Array<double,RANK> const &arr)
{
    blitz::Array<double,RANK> ret(arr.copy());
    ret.reindexSelf(blitz::TinyVector<int,RANK>(0));
    return ret;
}

GridDescriptor::GridDescriptor(
    blitz::Array<double,1> const &lons,
    blitz::Array<double,1> const &lats,
    blitz::Array<double,1> const &lonb,
    blitz::Array<double,1> const &latb,
    std::string const &sproj,
    bool circular,
    blitz::Array<double,2> const &areas)
: _lons(copy0(lons)), _lats(copy0(lats)),
    _lonb(copy0(lonb)), _latb(copy0(latb)),
    _sproj(sproj), _circular(circular)
{
    if (areas.size() > 0) _areas.reference(copy0(areas));
    validate();
}

void GridDescriptor::validate() const
{
    if (nlon() == 0 || nlat() == 0) (*uregrid_error)(CONSTRUCTION_ERROR,
        "GridDescriptor: empty coordinates (nlon=%d, nlat=%d)", nlon(), nlat());

    if (_latb.extent(0) != nlat()+1) (*uregrid_error)(CONSTRUCTION_ERROR,
        "GridDescriptor: %d latitudes need %d latitude bounds, got %d",
        nlat(), nlat()+1, _latb.extent(0));

    if (_circular) {
        if (_lonb.extent(0) != nlon() && _lonb.extent(0) != nlon()+1)
            (*uregrid_error)(CONSTRUCTION_ERROR,
            "GridDescriptor: %d circular longitudes need %d or %d longitude bounds, got %d",
            nlon(), nlon(), nlon()+1, _lonb.extent(0));
    } else {
        if (_lonb.extent(0) != nlon()+1) (*uregrid_error)(CONSTRUCTION_ERROR,
            "GridDescriptor: %d longitudes need %d longitude bounds, got %d",
            nlon(), nlon()+1, _lonb.extent(0));
    }

    if (_areas.size() > 0 && (_areas.extent(0) != nlat() || _areas.extent(1) != nlon()))
        (*uregrid_error)(CONSTRUCTION_ERROR,
        "GridDescriptor: areas have shape (%d, %d), expected (%d, %d)",
        _areas.extent(0), _areas.extent(1), nlat(), nlon());

    if (_sproj.size() > 0) {
        Proj2 proj(_sproj, Proj2::Direction::XY2LL);
        if (!proj.is_valid()) (*uregrid_error)(CONSTRUCTION_ERROR,
            "GridDescriptor: invalid projection '%s'", _sproj.c_str());
    }
}

/** Converts one point to geodetic degrees */
static void to_lonlat(Proj2 const *proj,
    double x, double y, double &lon, double &lat)
{
    if (!proj) {
        lon = x;
        lat = y;
        return;
    }
    if (proj->transform(x, y, lon, lat) != 0) (*uregrid_error)(CONSTRUCTION_ERROR,
        "GridDescriptor: cannot project point (%g, %g) with '%s'",
        x, y, proj->sproj.c_str());
}

std::unique_ptr<EngineGeometry> GridDescriptor::to_engine_representation() const
{
    std::unique_ptr<Proj2> proj;
    if (_sproj.size() > 0) proj.reset(new Proj2(_sproj, Proj2::Direction::XY2LL));

    std::unique_ptr<EngineGrid> grid(new EngineGrid());
    grid->first_element_id = index_offset();
    grid->nelements = size();
    grid->nlat = nlat();
    grid->nlon = nlon();
    grid->periodic = _circular;

    // Cell centers
    grid->center_lon.resize(nlat(), nlon());
    grid->center_lat.resize(nlat(), nlon());
    for (int j=0; j<nlat(); ++j) {
    for (int i=0; i<nlon(); ++i) {
        to_lonlat(proj.get(), _lons(i), _lats(j),
            grid->center_lon(j,i), grid->center_lat(j,i));
    }}

    // Cell corners; a circular grid drops its duplicate trailing bound
    int const ncorner_lon = grid->ncorner_lon();
    grid->corner_lon.resize(nlat()+1, ncorner_lon);
    grid->corner_lat.resize(nlat()+1, ncorner_lon);
    for (int j=0; j<nlat()+1; ++j) {
    for (int i=0; i<ncorner_lon; ++i) {
        to_lonlat(proj.get(), _lonb(i), _latb(j),
            grid->corner_lon(j,i), grid->corner_lat(j,i));
    }}

    if (_areas.size() > 0) {
        blitz::Array<double,1> areas1(flatten(_areas));
        grid->areas.reserve(size());
        for (int k=0; k<areas1.extent(0); ++k) grid->areas.push_back(areas1(k));
    }

    return std::unique_ptr<EngineGeometry>(grid.release());
}

void GridDescriptor::ncio(NcIO &ncio, std::string const &vname)
{
    NcVar info_v = get_or_add_var(ncio, vname + ".info", "int", {});
    if (ncio.rw == 'w') {
        std::string stype("GRID");
        get_or_put_att(info_v, ncio.rw, "type", stype);
        int n;
        n = nlon();
        get_or_put_att(info_v, ncio.rw, "nlon", "int", &n, 1);
        n = nlat();
        get_or_put_att(info_v, ncio.rw, "nlat", "int", &n, 1);
    }

    get_or_put_att(info_v, ncio.rw, "sproj", _sproj);
    if (ncio.rw == 'w') info_v.putAtt("sproj.comment",
        "Proj.4 string converting the coordinates here to geodetic "
        "lon/lat.  Empty if they are already in degrees.");
    get_or_put_att(info_v, ncio.rw, "circular", _circular);

    bool has_areas = (_areas.size() > 0);
    get_or_put_att(info_v, ncio.rw, "has_areas", has_areas);

    // Extents are ignored on read
    auto nlon_d = get_or_add_dim(ncio, vname + ".nlon", _lons.extent(0));
    auto nlat_d = get_or_add_dim(ncio, vname + ".nlat", _lats.extent(0));
    auto lonb_d = get_or_add_dim(ncio,
        vname + ".lon_boundaries.length", _lonb.extent(0));
    auto latb_d = get_or_add_dim(ncio,
        vname + ".lat_boundaries.length", _latb.extent(0));

    ncio_blitz_alloc(ncio, _lons, vname + ".lons", "double", {nlon_d});
    ncio_blitz_alloc(ncio, _lats, vname + ".lats", "double", {nlat_d});
    ncio_blitz_alloc(ncio, _lonb, vname + ".lon_boundaries", "double", {lonb_d});
    ncio_blitz_alloc(ncio, _latb, vname + ".lat_boundaries", "double", {latb_d});
    if (has_areas) ncio_blitz_alloc(ncio, _areas, vname + ".areas", "double",
        {nlat_d, nlon_d});

    if (ncio.rw == 'r') validate();
}

}    // namespace
