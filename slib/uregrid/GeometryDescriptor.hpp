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

#ifndef UREGRID_GEOMETRY_DESCRIPTOR_HPP
#define UREGRID_GEOMETRY_DESCRIPTOR_HPP

#include <memory>
#include <string>
#include <vector>
#include <blitz/array.h>
#include <ibmisc/netcdf.hpp>

#include <uregrid/error.hpp>
#include <uregrid/MaskedArray.hpp>
#include <uregrid/EngineGeometry.hpp>

namespace uregrid {

enum class DescriptorType {GRID, MESH};

/** Formats a shape as "(a, b, ...)" for error messages */
extern std::string shape_str(std::vector<int> const &shape);

/** Describes the geometry on one side of a regridding: a set of
elements (grid cells or mesh faces), how data arrays on those elements
are laid out, and how to present the geometry to a WeightEngine. */
class GeometryDescriptor {
public:
    virtual ~GeometryDescriptor() {}

    virtual DescriptorType type() const = 0;

    /** Number of elements */
    virtual long size() const = 0;

    /** Id the weight engine uses for element 0 */
    virtual long index_offset() const = 0;

    /** Natural shape of data arrays on this geometry */
    virtual std::vector<int> shape() const = 0;

    virtual std::unique_ptr<EngineGeometry> to_engine_representation() const = 0;

    virtual void ncio(ibmisc::NcIO &ncio, std::string const &vname) = 0;

    /** Row-major copy of an array of natural shape.  Lower bounds of
    arr are ignored; the result is 0-based. */
    template<class T, int RANK>
    blitz::Array<T,1> flatten(blitz::Array<T,RANK> const &arr) const;

    /** Inverse of flatten(): a fresh 0-based array of natural shape */
    template<class T, int RANK>
    blitz::Array<T,RANK> unflatten(blitz::Array<T,1> const &flat) const;

    template<class T, int RANK>
    MaskedArray<T,1> flatten(MaskedArray<T,RANK> const &arr) const
        { return MaskedArray<T,1>(flatten(arr.value), flatten(arr.mask)); }

    template<class T, int RANK>
    MaskedArray<T,RANK> unflatten(MaskedArray<T,1> const &flat) const
        { return MaskedArray<T,RANK>(unflatten<T,RANK>(flat.value), unflatten<bool,RANK>(flat.mask)); }

protected:
    template<int RANK>
    void check_rank(char const *op) const;
};

/** Creates a descriptor of the type stored in a file, ready to be
read with its ncio() */
extern std::unique_ptr<GeometryDescriptor> new_geometry_descriptor(
    ibmisc::NcIO &ncio, std::string const &vname);

/** Reads a complete descriptor from a file */
extern std::unique_ptr<GeometryDescriptor> read_geometry_descriptor(
    ibmisc::NcIO &ncio, std::string const &vname);

// ----------------------------------------------------------
namespace detail {

/** Advances a multi-index in row-major order within [lb, ub].
@return false once the index has wrapped all the way around. */
template<int RANK>
bool next_index(blitz::TinyVector<int,RANK> &ix,
    blitz::TinyVector<int,RANK> const &lb,
    blitz::TinyVector<int,RANK> const &ub)
{
    for (int k=RANK-1; k>=0; --k) {
        if (++ix[k] <= ub[k]) return true;
        ix[k] = lb[k];
    }
    return false;
}

}

template<int RANK>
void GeometryDescriptor::check_rank(char const *op) const
{
    std::vector<int> const shp(shape());
    if (RANK != (int)shp.size()) (*uregrid_error)(ARRAY_SHAPE_ERROR,
        "%s: array has rank %d, geometry has shape %s",
        op, RANK, shape_str(shp).c_str());
}

template<class T, int RANK>
blitz::Array<T,1> GeometryDescriptor::flatten(blitz::Array<T,RANK> const &arr) const
{
    check_rank<RANK>("flatten");
    std::vector<int> const shp(shape());
    for (int k=0; k<RANK; ++k) {
        if (arr.extent(k) != shp[k]) {
            std::vector<int> ashp(RANK);
            for (int l=0; l<RANK; ++l) ashp[l] = arr.extent(l);
            (*uregrid_error)(ARRAY_SHAPE_ERROR,
                "flatten: array has shape %s, expected %s",
                shape_str(ashp).c_str(), shape_str(shp).c_str());
        }
    }

    blitz::Array<T,1> ret(size());
    if (size() == 0) return ret;
    blitz::TinyVector<int,RANK> const lb(arr.lbound());
    blitz::TinyVector<int,RANK> const ub(arr.ubound());
    blitz::TinyVector<int,RANK> ix(lb);
    long n = 0;
    do {
        ret(n++) = arr(ix);
    } while (detail::next_index<RANK>(ix, lb, ub));
    return ret;
}

template<class T, int RANK>
blitz::Array<T,RANK> GeometryDescriptor::unflatten(blitz::Array<T,1> const &flat) const
{
    check_rank<RANK>("unflatten");
    if (flat.extent(0) != size()) (*uregrid_error)(ARRAY_SHAPE_ERROR,
        "unflatten: flat array has length %d, expected %ld",
        flat.extent(0), size());

    std::vector<int> const shp(shape());
    blitz::TinyVector<int,RANK> extent;
    for (int k=0; k<RANK; ++k) extent[k] = shp[k];
    blitz::Array<T,RANK> ret(extent);
    if (size() == 0) return ret;

    blitz::TinyVector<int,RANK> const lb(ret.lbound());
    blitz::TinyVector<int,RANK> const ub(ret.ubound());
    blitz::TinyVector<int,RANK> ix(lb);
    int n = flat.lbound(0);
    do {
        ret(ix) = flat(n++);
    } while (detail::next_index<RANK>(ix, lb, ub));
    return ret;
}

}    // namespace
#endif    // guard
