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

#ifndef UREGRID_WEIGHT_MATRIX_HPP
#define UREGRID_WEIGHT_MATRIX_HPP

#include <array>
#include <string>
#include <ibmisc/netcdf.hpp>

#include <uregrid/error.hpp>
#include <uregrid/eigen_types.hpp>
#include <uregrid/WeightEngine.hpp>

namespace uregrid {

/** Builds the zero-based weight matrix from engine triples:
M(row - offsets[0], col - offsets[1]) += weight
@param shape (target size, source size)
@param offsets (target index_offset(), source index_offset()) */
extern EigenSparseMatrixT weights_to_matrix(
    WeightTriples const &triples,
    std::array<long,2> const &shape,
    std::array<long,2> const &offsets);

/** Row sums of a weight matrix: the fraction of each target element
covered by the source geometry. */
extern EigenColVectorT weight_sums(EigenSparseMatrixT const &M);

/** Reads or writes a weight matrix as (row, col, weight) triples.
When writing, M must stay alive until ncio is closed. */
extern void ncio_weights(ibmisc::NcIO &ncio,
    EigenSparseMatrixT &M, std::string const &vname);

namespace detail {

inline void check_precomputed_shape(long rows, long cols, std::array<long,2> const &shape)
{
    if (rows != shape[0] || cols != shape[1]) (*uregrid_error)(WEIGHT_SHAPE_ERROR,
        "Expected precomputed weights to have shape (%ld, %ld), got shape (%ld, %ld) instead.",
        shape[0], shape[1], rows, cols);
}

template<class Derived>
EigenSparseMatrixT precomputed_to_matrix(
    Eigen::SparseMatrixBase<Derived> const &W,
    std::array<long,2> const &shape)
{
    check_precomputed_shape(W.rows(), W.cols(), shape);
    EigenSparseMatrixT M(W.derived());
    M.makeCompressed();
    return M;
}

template<class Derived>
EigenSparseMatrixT precomputed_to_matrix(
    Eigen::DenseBase<Derived> const &W,
    std::array<long,2> const &shape)
{
    (*uregrid_error)(WEIGHT_SHAPE_ERROR,
        "Precomputed weights must be given as a sparse matrix.");
    return EigenSparseMatrixT();
}

}

/** Validates caller-supplied weights and converts them to a weight
matrix.  Only sparse matrices of exactly the given shape are accepted.
@param shape (target size, source size) */
template<class Derived>
EigenSparseMatrixT precomputed_to_matrix(
    Eigen::EigenBase<Derived> const &W,
    std::array<long,2> const &shape)
{
    return detail::precomputed_to_matrix(W.derived(), shape);
}

}    // namespace
#endif    // guard
