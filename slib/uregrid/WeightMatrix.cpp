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

#include <functional>
#include <uregrid/WeightMatrix.hpp>

using namespace ibmisc;
using namespace netCDF;

namespace uregrid {

EigenSparseMatrixT weights_to_matrix(
    WeightTriples const &triples,
    std::array<long,2> const &shape,
    std::array<long,2> const &offsets)
{
    std::vector<EigenTripletT> tuples;
    tuples.reserve(triples.size());
    for (size_t k=0; k<triples.size(); ++k) {
        long const row = triples.rows[k] - offsets[0];
        long const col = triples.cols[k] - offsets[1];
        if (row < 0 || row >= shape[0] || col < 0 || col >= shape[1])
            (*uregrid_error)(CONSTRUCTION_ERROR,
            "Weight (%ld, %ld) out of range: ids must be in [%ld, %ld) x [%ld, %ld)",
            triples.rows[k], triples.cols[k],
            offsets[0], offsets[0] + shape[0],
            offsets[1], offsets[1] + shape[1]);
        tuples.push_back(EigenTripletT(row, col, triples.weights[k]));
    }

    // Duplicates are summed
    EigenSparseMatrixT M(shape[0], shape[1]);
    M.setFromTriplets(tuples.begin(), tuples.end());
    M.makeCompressed();
    return M;
}

EigenColVectorT weight_sums(EigenSparseMatrixT const &M)
{
    return M * EigenColVectorT::Ones(M.cols());
}

// ------------------------------------------------------------
static void nc_write_weights(NcFile *nc, EigenSparseMatrixT const *M, std::string const &vname)
{
    std::vector<int> rows, cols;
    std::vector<double> vals;
    rows.reserve(M->nonZeros());
    cols.reserve(M->nonZeros());
    vals.reserve(M->nonZeros());
    for (int k=0; k<M->outerSize(); ++k) {
    for (EigenSparseMatrixT::InnerIterator ii(*M, k); ii; ++ii) {
        rows.push_back(ii.row());
        cols.push_back(ii.col());
        vals.push_back(ii.value());
    }}
    if (vals.size() == 0) return;

    nc->getVar(vname + ".rows").putVar(&rows[0]);
    nc->getVar(vname + ".cols").putVar(&cols[0]);
    nc->getVar(vname + ".values").putVar(&vals[0]);
}

void ncio_weights(NcIO &ncio, EigenSparseMatrixT &M, std::string const &vname)
{
    NcVar info_v = get_or_add_var(ncio, vname + ".info", "int", {});
    long shape[2] = {M.rows(), M.cols()};
    get_or_put_att(info_v, ncio.rw, "shape", "int64", shape, 2);
    if (ncio.rw == 'w') info_v.putAtt("shape.comment",
        "(target size, source size).  Weights are stored as zero-based "
        "(row, col, value) triples.");

    if (ncio.rw == 'w') {
        // Extents are ignored on read
        NcDim nnz_d = get_or_add_dim(ncio, vname + ".nnz", M.nonZeros());
        get_or_add_var(ncio, vname + ".rows", "int", {nnz_d});
        get_or_add_var(ncio, vname + ".cols", "int", {nnz_d});
        get_or_add_var(ncio, vname + ".values", "double", {nnz_d});
        ncio += std::bind(&nc_write_weights, ncio.nc, &M, vname);
    } else {
        auto rows(nc_read_blitz<int,1>(ncio.nc, vname + ".rows"));
        auto cols(nc_read_blitz<int,1>(ncio.nc, vname + ".cols"));
        auto vals(nc_read_blitz<double,1>(ncio.nc, vname + ".values"));

        WeightTriples triples;
        triples.reserve(vals.extent(0));
        for (int k=0; k<vals.extent(0); ++k)
            triples.add(rows(k), cols(k), vals(k));
        M = weights_to_matrix(triples, {{shape[0], shape[1]}}, {{0, 0}});
    }
}

}    // namespace
