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

#include <algorithm>
#include <uregrid/Regridder.hpp>

using namespace ibmisc;
using namespace netCDF;

namespace uregrid {

/** mdtol values below this are raised to it, so fully covered
elements survive rounding in their weight sums at mdtol=0 */
static double const MDTOL_MIN = 1e-8;

Regridder::Regridder(
    std::unique_ptr<GeometryDescriptor> src,
    std::unique_ptr<GeometryDescriptor> tgt,
    WeightEngine const &engine)
: _src(std::move(src)), _tgt(std::move(tgt))
{
    check_descriptors();

    WeightTriples triples;
    {
        std::unique_ptr<EngineGeometry> src_eg(_src->to_engine_representation());
        std::unique_ptr<EngineGeometry> tgt_eg(_tgt->to_engine_representation());
        triples = engine.compute_weights(*src_eg, *tgt_eg);
    }

    set_weights(weights_to_matrix(triples, shape(),
        {{_tgt->index_offset(), _src->index_offset()}}));
}

void Regridder::check_descriptors() const
{
    if (!_src || !_tgt) (*uregrid_error)(CONSTRUCTION_ERROR,
        "Regridder: source and target descriptors are required");
}

void Regridder::set_weights(EigenSparseMatrixT &&M)
{
    _M = std::move(M);
    _weight_sums = uregrid::weight_sums(_M);
}

MaskedArray<double,1> Regridder::regrid_flat(
    blitz::Array<double,1> const &src, double mdtol) const
{
    if (src.extent(0) != _src->size()) (*uregrid_error)(ARRAY_SHAPE_ERROR,
        "regrid: source array has %d elements, source geometry has %ld",
        src.extent(0), _src->size());

    mdtol = std::min(1.0, std::max(MDTOL_MIN, mdtol));

    EigenColVectorT src_e(_src->size());
    for (int k=0; k<src.extent(0); ++k) src_e(k) = src(src.lbound(0) + k);
    EigenColVectorT const tgt_e(_M * src_e);

    // Average over the covered part of each target element
    MaskedArray<double,1> ret(blitz::shape((int)_tgt->size()));
    for (long t=0; t<_tgt->size(); ++t) {
        double const ws = _weight_sums(t);
        if (ws > 0 && ws >= 1.0 - mdtol) {
            ret.value(t) = tgt_e(t) / ws;
        } else {
            ret.mask(t) = true;
        }
    }
    return ret;
}

void Regridder::ncio(NcIO &ncio, std::string const &vname)
{
    if (ncio.rw != 'w') (*uregrid_error)(CONSTRUCTION_ERROR,
        "Regridder::ncio() only writes; read with load_regridder()");

    NcVar info_v = get_or_add_var(ncio, vname + ".info", "int", {});
    int version = 1;
    get_or_put_att(info_v, ncio.rw, "version", "int", &version, 1);

    _src->ncio(ncio, vname + ".src");
    _tgt->ncio(ncio, vname + ".tgt");
    ncio_weights(ncio, _M, vname + ".weights");
}

std::unique_ptr<Regridder> load_regridder(NcIO &ncio, std::string const &vname)
{
    NcVar info_v = get_or_add_var(ncio, vname + ".info", "int", {});
    int version;
    get_or_put_att(info_v, ncio.rw, "version", "int", &version, 1);
    if (version != 1) (*uregrid_error)(CONSTRUCTION_ERROR,
        "%s: unsupported regridder file version %d", vname.c_str(), version);

    std::unique_ptr<GeometryDescriptor> src(read_geometry_descriptor(ncio, vname + ".src"));
    std::unique_ptr<GeometryDescriptor> tgt(read_geometry_descriptor(ncio, vname + ".tgt"));
    EigenSparseMatrixT M;
    ncio_weights(ncio, M, vname + ".weights");

    return std::unique_ptr<Regridder>(
        new Regridder(std::move(src), std::move(tgt), M));
}

}    // namespace
