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

#include <uregrid/MeshDescriptor.hpp>

using namespace ibmisc;
using namespace netCDF;

namespace uregrid {

MeshDescriptor::MeshDescriptor(
    blitz::Array<double,2> const &node_coords,
    MaskedArray<int,2> const &face_nodes,
    int node_start_index,
    long elem_start_index,
    blitz::Array<double,1> const &areas)
: _node_start_index(node_start_index), _elem_start_index(elem_start_index)
{
    // Take 0-based private copies
    _node_coords.reference(node_coords.copy());
    _node_coords.reindexSelf(blitz::TinyVector<int,2>(0,0));
    _face_nodes.value.reference(face_nodes.value.copy());
    _face_nodes.value.reindexSelf(blitz::TinyVector<int,2>(0,0));
    _face_nodes.mask.reference(face_nodes.mask.copy());
    _face_nodes.mask.reindexSelf(blitz::TinyVector<int,2>(0,0));
    if (areas.size() > 0) {
        _areas.reference(areas.copy());
        _areas.reindexSelf(blitz::TinyVector<int,1>(0));
    }

    realize();
}

void MeshDescriptor::realize()
{
    if (_node_coords.extent(1) != 2) (*uregrid_error)(CONSTRUCTION_ERROR,
        "MeshDescriptor: node_coords has shape (%d, %d), expected (nnode, 2)",
        _node_coords.extent(0), _node_coords.extent(1));

    if (_face_nodes.value.extent(0) != _face_nodes.mask.extent(0) ||
        _face_nodes.value.extent(1) != _face_nodes.mask.extent(1))
    {
        (*uregrid_error)(CONSTRUCTION_ERROR,
            "MeshDescriptor: connectivity has shape (%d, %d) but its mask has shape (%d, %d)",
            _face_nodes.value.extent(0), _face_nodes.value.extent(1),
            _face_nodes.mask.extent(0), _face_nodes.mask.extent(1));
    }

    if (_node_start_index != 0 && _node_start_index != 1) (*uregrid_error)(CONSTRUCTION_ERROR,
        "MeshDescriptor: node_start_index must be 0 or 1, got %d", _node_start_index);

    if (_areas.size() > 0 && _areas.extent(0) != nfaces()) (*uregrid_error)(CONSTRUCTION_ERROR,
        "MeshDescriptor: %ld areas given for %ld faces", (long)_areas.extent(0), nfaces());

    _elem_types.clear();
    _elem_conn.clear();
    _elem_types.reserve(nfaces());
    for (int f=0; f<nfaces(); ++f) {
        int nvalid = 0;
        for (int k=0; k<_face_nodes.value.extent(1); ++k) {
            if (_face_nodes.mask(f,k)) continue;

            int const node = _face_nodes.value(f,k) - _node_start_index;
            if (node < 0 || node >= nnodes()) (*uregrid_error)(CONSTRUCTION_ERROR,
                "MeshDescriptor: face %d references node %d, outside [%d, %ld)",
                f, _face_nodes.value(f,k), _node_start_index, _node_start_index + nnodes());

            _elem_conn.push_back(node);
            ++nvalid;
        }
        _elem_types.push_back(nvalid);
    }
}

std::unique_ptr<EngineGeometry> MeshDescriptor::to_engine_representation() const
{
    std::unique_ptr<EngineMesh> mesh(new EngineMesh());
    mesh->first_element_id = index_offset();
    mesh->nelements = size();

    mesh->node_coords.reserve(nnodes() * 2);
    for (int n=0; n<nnodes(); ++n) {
        mesh->node_coords.push_back(_node_coords(n,0));
        mesh->node_coords.push_back(_node_coords(n,1));
    }

    mesh->elem_ids.reserve(size());
    for (long k=0; k<size(); ++k) mesh->elem_ids.push_back(_elem_start_index + k);
    mesh->elem_types = _elem_types;
    mesh->elem_conn = _elem_conn;

    if (_areas.size() > 0) {
        mesh->areas.reserve(size());
        for (int k=0; k<_areas.extent(0); ++k) mesh->areas.push_back(_areas(k));
    }

    return std::unique_ptr<EngineGeometry>(mesh.release());
}

void MeshDescriptor::ncio(NcIO &ncio, std::string const &vname)
{
    NcVar info_v = get_or_add_var(ncio, vname + ".info", "int", {});
    if (ncio.rw == 'w') {
        std::string stype("MESH");
        get_or_put_att(info_v, ncio.rw, "type", stype);
    }
    get_or_put_att(info_v, ncio.rw, "node_start_index", "int", &_node_start_index, 1);
    get_or_put_att(info_v, ncio.rw, "elem_start_index", "int64", &_elem_start_index, 1);

    bool has_areas = (_areas.size() > 0);
    get_or_put_att(info_v, ncio.rw, "has_areas", has_areas);

    // Extents are ignored on read
    auto nnode_d = get_or_add_dim(ncio, vname + ".nnode", _node_coords.extent(0));
    auto nface_d = get_or_add_dim(ncio, vname + ".nface", _face_nodes.value.extent(0));
    auto max_nodes_d = get_or_add_dim(ncio,
        vname + ".max_nodes_per_face", _face_nodes.value.extent(1));
    auto two_d = get_or_add_dim(ncio, "two", 2);

    ncio_blitz_alloc(ncio, _node_coords, vname + ".node_coords", "double",
        {nnode_d, two_d});

    // Masked connectivity slots are stored as fill_value
    int fill_value = FILL_VALUE;
    if (ncio.rw == 'w') {
        _face_nodes_filled.resize(_face_nodes.value.shape());
        _face_nodes_filled = blitz::where(_face_nodes.mask, fill_value, _face_nodes.value);
    }
    NcVar fnc_v = ncio_blitz_alloc(ncio, _face_nodes_filled,
        vname + ".face_node_connectivity", "int", {nface_d, max_nodes_d});
    get_or_put_att(fnc_v, ncio.rw, "fill_value", "int", &fill_value, 1);
    if (ncio.rw == 'r') {
        _face_nodes.value.reference(_face_nodes_filled.copy());
        _face_nodes.mask.resize(_face_nodes.value.shape());
        _face_nodes.mask = (_face_nodes.value == fill_value);
    }

    if (has_areas) ncio_blitz_alloc(ncio, _areas, vname + ".areas", "double", {nface_d});

    if (ncio.rw == 'r') realize();
}

}    // namespace
