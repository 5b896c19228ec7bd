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

#include <sstream>
#include <uregrid/GeometryDescriptor.hpp>
#include <uregrid/GridDescriptor.hpp>
#include <uregrid/MeshDescriptor.hpp>

using namespace ibmisc;
using namespace netCDF;

namespace uregrid {

std::string shape_str(std::vector<int> const &shape)
{
    std::stringstream buf;
    buf << "(";
    for (size_t k=0; k<shape.size(); ++k) {
        if (k > 0) buf << ", ";
        buf << shape[k];
    }
    buf << ")";
    return buf.str();
}

std::unique_ptr<GeometryDescriptor> new_geometry_descriptor(
    NcIO &ncio, std::string const &vname)
{
    std::string stype;
    auto info_v = get_or_add_var(ncio, vname + ".info", "int", {});
    get_or_put_att(info_v, ncio.rw, "type", stype);

    if (stype == "GRID") return std::unique_ptr<GeometryDescriptor>(new GridDescriptor());
    if (stype == "MESH") return std::unique_ptr<GeometryDescriptor>(new MeshDescriptor());

    (*uregrid_error)(CONSTRUCTION_ERROR,
        "%s: unknown geometry type '%s'", vname.c_str(), stype.c_str());
    return std::unique_ptr<GeometryDescriptor>();
}

std::unique_ptr<GeometryDescriptor> read_geometry_descriptor(
    NcIO &ncio, std::string const &vname)
{
    std::unique_ptr<GeometryDescriptor> desc(new_geometry_descriptor(ncio, vname));
    desc->ncio(ncio, vname);
    return desc;
}

}    // namespace
