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

#ifndef UREGRID_REGRIDDER_HPP
#define UREGRID_REGRIDDER_HPP

#include <memory>
#include <ibmisc/netcdf.hpp>

#include <uregrid/eigen_types.hpp>
#include <uregrid/MaskedArray.hpp>
#include <uregrid/GeometryDescriptor.hpp>
#include <uregrid/WeightEngine.hpp>
#include <uregrid/WeightMatrix.hpp>

namespace uregrid {

/** Conservatively regrids data from a source geometry to a target
geometry.  The weight matrix is built once at construction; regrid()
may then be called any number of times. */
class Regridder {
    std::unique_ptr<GeometryDescriptor> _src;
    std::unique_ptr<GeometryDescriptor> _tgt;

    /** Weights, shape (tgt.size(), src.size()) */
    EigenSparseMatrixT _M;

    /** Row sums of _M */
    EigenColVectorT _weight_sums;

public:
    /** Computes the weights with an engine.  Engine failures propagate
    as EngineFailure. */
    Regridder(
        std::unique_ptr<GeometryDescriptor> src,
        std::unique_ptr<GeometryDescriptor> tgt,
        WeightEngine const &engine);

    /** Uses precomputed weights, which must be a sparse matrix of
    shape (tgt.size(), src.size()); otherwise WeightShapeError. */
    template<class Derived>
    Regridder(
        std::unique_ptr<GeometryDescriptor> src,
        std::unique_ptr<GeometryDescriptor> tgt,
        Eigen::EigenBase<Derived> const &precomputed_weights)
    : _src(std::move(src)), _tgt(std::move(tgt))
    {
        check_descriptors();
        set_weights(precomputed_to_matrix(precomputed_weights, shape()));
    }

    GeometryDescriptor const &src() const { return *_src; }
    GeometryDescriptor const &tgt() const { return *_tgt; }
    EigenSparseMatrixT const &weight_matrix() const { return _M; }
    EigenColVectorT const &weight_sums() const { return _weight_sums; }

    /** Shape of the weight matrix */
    std::array<long,2> shape() const
        { return {{_tgt->size(), _src->size()}}; }

    /** Regrids flattened source data.
    @param src Source values, one per source element.
    @param mdtol Largest fraction of a target element that may be
        uncovered by the source before it is masked; clamped to [1e-8, 1].
    @return Target values, one per target element.  Masked elements
        have value 0. */
    MaskedArray<double,1> regrid_flat(
        blitz::Array<double,1> const &src, double mdtol = 1.0) const;

    /** Regrids an array of the source geometry's natural shape into
    an array of the target geometry's natural shape. */
    template<int TGT_RANK, int SRC_RANK>
    MaskedArray<double,TGT_RANK> regrid(
        blitz::Array<double,SRC_RANK> const &src, double mdtol = 1.0) const
    {
        return _tgt->unflatten<double,TGT_RANK>(
            regrid_flat(_src->flatten(src), mdtol));
    }

    /** Writes the descriptors and weights.  Read back with
    load_regridder(). */
    void ncio(ibmisc::NcIO &ncio, std::string const &vname);

protected:
    void check_descriptors() const;
    void set_weights(EigenSparseMatrixT &&M);
};

/** Reads a Regridder written by Regridder::ncio(); the weights are
re-validated against the descriptors. */
extern std::unique_ptr<Regridder> load_regridder(
    ibmisc::NcIO &ncio, std::string const &vname);

}    // namespace
#endif    // guard
