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

#ifndef UREGRID_MASKEDARRAY_HPP
#define UREGRID_MASKEDARRAY_HPP

#include <blitz/array.h>
#include <uregrid/error.hpp>

namespace uregrid {

/** A value array paired with a validity mask of the same shape.
mask(i) == true means element i is masked out, and value(i) carries
no meaning. */
template<class T, int RANK>
struct MaskedArray {
    blitz::Array<T,RANK> value;
    blitz::Array<bool,RANK> mask;

    MaskedArray() {}

    /** Allocates an array with nothing masked. */
    explicit MaskedArray(blitz::TinyVector<int,RANK> const &shape) :
        value(shape), mask(shape)
    {
        value = 0;
        mask = false;
    }

    /** References (does not copy) the given value and mask arrays. */
    MaskedArray(
        blitz::Array<T,RANK> const &_value,
        blitz::Array<bool,RANK> const &_mask)
    : value(_value), mask(_mask)
    {
        for (int k=0; k<RANK; ++k) {
            if (value.extent(k) != mask.extent(k)) (*uregrid_error)(CONSTRUCTION_ERROR,
                "MaskedArray: value and mask differ in extent of dimension %d: %d vs %d",
                k, value.extent(k), mask.extent(k));
        }
    }

    blitz::TinyVector<int,RANK> shape() const
        { return value.shape(); }

    /** Number of unmasked elements */
    long count() const
    {
        long n = 0;
        for (auto ii=mask.begin(); ii != mask.end(); ++ii)
            if (!*ii) ++n;
        return n;
    }
};

}    // namespace
#endif    // guard
