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

#ifndef UREGRID_MESH_DESCRIPTOR_HPP
#define UREGRID_MESH_DESCRIPTOR_HPP

#include <uregrid/GeometryDescriptor.hpp>

namespace uregrid {

/** An unstructured (UGRID-style) mesh of polygonal faces.  Data
arrays have natural shape (nface). */
class MeshDescriptor : public GeometryDescriptor {
public:
    /** Value stored in files for masked face_nodes slots */
    static int const FILL_VALUE = -1;

protected:
    // Inputs; 0-based private copies, fixed after realize()
    blitz::Array<double,2> _node_coords;
    MaskedArray<int,2> _face_nodes;
    int _node_start_index;
    long _elem_start_index;
    blitz::Array<double,1> _areas;

    // Derived from _face_nodes
    std::vector<int> _elem_types;
    std::vector<int> _elem_conn;

    // Buffer for writing _face_nodes
    blitz::Array<int,2> _face_nodes_filled;

public:
    /** Used only when reading with ncio() */
    MeshDescriptor() : _node_start_index(0), _elem_start_index(0) {}

    MeshDescriptor(
        blitz::Array<double,2> const &node_coords,
        MaskedArray<int,2> const &face_nodes,
        int node_start_index,
        long elem_start_index = 0,
        blitz::Array<double,1> const &areas = blitz::Array<double,1>());

    /** Node (lon, lat) in degrees [nnode, 2] */
    blitz::Array<double,2> const &node_coords() const { return _node_coords; }

    /** Node references of each face [nface, max_nodes_per_face].
    Faces with fewer nodes mask their trailing slots. */
    MaskedArray<int,2> const &face_nodes() const { return _face_nodes; }

    /** Id of the first node in face_nodes (0 or 1) */
    int node_start_index() const { return _node_start_index; }

    /** Id the weight engine uses for face 0 */
    long elem_start_index() const { return _elem_start_index; }

    /** Optional per-face areas [nface]; empty if not supplied. */
    blitz::Array<double,1> const &areas() const { return _areas; }

    long nnodes() const { return _node_coords.extent(0); }
    long nfaces() const { return _face_nodes.value.extent(0); }

    /** Number of valid nodes of each face */
    std::vector<int> const &elem_types() const { return _elem_types; }

    /** Valid node references of all faces, in face order, 0-based */
    std::vector<int> const &elem_conn() const { return _elem_conn; }

    DescriptorType type() const { return DescriptorType::MESH; }
    long size() const { return nfaces(); }
    long index_offset() const { return _elem_start_index; }
    std::vector<int> shape() const { return {(int)nfaces()}; }

    std::unique_ptr<EngineGeometry> to_engine_representation() const;

    void ncio(ibmisc::NcIO &ncio, std::string const &vname);

protected:
    /** Validates the inputs and computes _elem_types and _elem_conn */
    void realize();
};

}    // namespace
#endif    // guard
