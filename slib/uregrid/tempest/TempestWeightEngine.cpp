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

#include <cmath>
#include <cstdio>
#include <array>
#include <algorithm>
#include <exception>

// TempestRemap
#include "Exception.h"
#include "DataArray1D.h"
#include "Mesh.h"
#include "OfflineMap.h"
#include "SparseMatrix.h"
#include "TempestRemapAPI.h"

#include <uregrid/error.hpp>
#include <uregrid/tempest/TempestWeightEngine.hpp>

namespace uregrid {
namespace tempest {

static double const D2R = M_PI / 180.;

/** Faces whose (unit sphere) vector area is smaller than this are
degenerate */
static double const AREA_EPS = 1e-18;

typedef std::array<double,3> Vec3;

static Vec3 lonlat_to_xyz(double lon_deg, double lat_deg)
{
    double const lon = lon_deg * D2R;
    double const lat = lat_deg * D2R;
    return {{std::cos(lat) * std::cos(lon), std::cos(lat) * std::sin(lon), std::sin(lat)}};
}

/** A Tempest mesh built from an EngineGeometry.  Tempest faces are a
subset of the geometry's elements, since degenerate ones are left out. */
struct TempestMesh {
    Mesh mesh;

    /** Element (0-based) each Tempest face came from */
    std::vector<long> face_elements;

    Vec3 node_xyz(int ix) const
    {
        Node const &node(mesh.nodes[ix]);
        return {{node.x, node.y, node.z}};
    }

    void set_node(int ix, double lon, double lat)
    {
        Vec3 const p(lonlat_to_xyz(lon, lat));
        Node &node(mesh.nodes[ix]);
        node.x = p[0];
        node.y = p[1];
        node.z = p[2];
    }

    /** Adds a face for an element, oriented counter-clockwise as
    seen from outside the sphere.
    @return false if the element was degenerate, and not added. */
    bool add_face(long element, std::vector<int> const &nodes);
};

bool TempestMesh::add_face(long element, std::vector<int> const &nodes)
{
    // Drop repeated nodes (eg: cell corners at the poles)
    std::vector<int> poly;
    poly.reserve(nodes.size());
    for (int ix : nodes) {
        if (poly.size() == 0 || node_xyz(poly.back()) != node_xyz(ix))
            poly.push_back(ix);
    }
    while (poly.size() > 1 && node_xyz(poly.front()) == node_xyz(poly.back()))
        poly.pop_back();
    if (poly.size() < 3) return false;

    // Vector area, projected on the face's mean direction
    Vec3 area {{0,0,0}};
    Vec3 center {{0,0,0}};
    for (size_t k=0; k<poly.size(); ++k) {
        Vec3 const a(node_xyz(poly[k]));
        Vec3 const b(node_xyz(poly[(k+1) % poly.size()]));
        area[0] += a[1]*b[2] - a[2]*b[1];
        area[1] += a[2]*b[0] - a[0]*b[2];
        area[2] += a[0]*b[1] - a[1]*b[0];
        for (int l=0; l<3; ++l) center[l] += a[l];
    }
    double const cnorm = std::sqrt(center[0]*center[0] + center[1]*center[1] + center[2]*center[2]);
    if (cnorm == 0) return false;
    double const signed_area =
        (area[0]*center[0] + area[1]*center[1] + area[2]*center[2]) / cnorm;
    if (std::abs(signed_area) < AREA_EPS) return false;
    if (signed_area < 0) std::reverse(poly.begin(), poly.end());

    Face face(poly.size());
    for (size_t k=0; k<poly.size(); ++k) face.SetNode(k, poly[k]);
    mesh.faces.push_back(face);
    face_elements.push_back(element);
    return true;
}

// -----------------------------------------------------------
static void degenerate(EngineParams const &params, char const *side, long element)
{
    if (!params.ignore_degenerate) (*uregrid_error)(ENGINE_FAILURE,
        "%s element %ld is degenerate", side, element);
}

static void grid_to_tempest(EngineGrid const &grid,
    EngineParams const &params, char const *side, TempestMesh &tm)
{
    int const ncol = grid.ncorner_lon();
    tm.mesh.nodes.resize((grid.nlat+1) * ncol);
    for (int j=0; j<grid.nlat+1; ++j) {
    for (int i=0; i<ncol; ++i) {
        tm.set_node(j*ncol + i, grid.corner_lon(j,i), grid.corner_lat(j,i));
    }}

    for (int j=0; j<grid.nlat; ++j) {
    for (int i=0; i<grid.nlon; ++i) {
        int const i0 = grid.corner_col(i);
        int const i1 = grid.corner_col(i+1);
        long const element = (long)j*grid.nlon + i;
        if (!tm.add_face(element,
            {j*ncol + i0, j*ncol + i1, (j+1)*ncol + i1, (j+1)*ncol + i0}))
        {
            degenerate(params, side, element);
        }
    }}
}

static void mesh_to_tempest(EngineMesh const &emesh,
    EngineParams const &params, char const *side, TempestMesh &tm)
{
    tm.mesh.nodes.resize(emesh.nnodes());
    for (long n=0; n<emesh.nnodes(); ++n)
        tm.set_node(n, emesh.node_coords[2*n], emesh.node_coords[2*n+1]);

    size_t off = 0;
    for (long k=0; k<emesh.nelements; ++k) {
        std::vector<int> nodes(
            emesh.elem_conn.begin() + off,
            emesh.elem_conn.begin() + off + emesh.elem_types[k]);
        off += emesh.elem_types[k];
        if (!tm.add_face(k, nodes)) degenerate(params, side, k);
    }
}

static void to_tempest(EngineGeometry const &geom,
    EngineParams const &params, char const *side, TempestMesh &tm)
{
    switch(geom.type) {
        case EngineGeometryType::GRID :
            grid_to_tempest(dynamic_cast<EngineGrid const &>(geom), params, side, tm);
            break;
        case EngineGeometryType::MESH :
            mesh_to_tempest(dynamic_cast<EngineMesh const &>(geom), params, side, tm);
            break;
    }

    if (geom.has_areas() && (long)geom.areas.size() != geom.nelements)
        (*uregrid_error)(ENGINE_FAILURE,
        "%s geometry has %ld areas for %ld elements",
        side, (long)geom.areas.size(), geom.nelements);

    if (params.verbose) printf("    %s: %ld elements, %ld faces\n",
        side, geom.nelements, (long)tm.face_elements.size());
}

static void prepare(Mesh &mesh)
{
    mesh.RemoveZeroEdges();
    mesh.RemoveCoincidentNodes();
    mesh.ConstructEdgeMap();
    mesh.ConstructReverseNodeArray();
    mesh.CalculateFaceAreas(false);
}

// -----------------------------------------------------------
WeightTriples TempestWeightEngine::compute_weights(
    EngineGeometry const &src,
    EngineGeometry const &tgt) const
{
    if (params.verbose) printf("BEGIN TempestWeightEngine::compute_weights()\n");

    TempestMesh tsrc, ttgt;
    to_tempest(src, params, "source", tsrc);
    to_tempest(tgt, params, "target", ttgt);

    WeightTriples ret;
    if (tsrc.face_elements.size() == 0 || ttgt.face_elements.size() == 0) {
        if (params.verbose) printf("END TempestWeightEngine::compute_weights(): nothing overlaps\n");
        return ret;
    }

    // Engine objects live only inside this block
    DataArray1D<int> rows, cols;
    DataArray1D<double> vals;
    int err = 0;
    char const *stage = "";
    std::string engine_msg;
    try {
        prepare(tsrc.mesh);
        prepare(ttgt.mesh);

        stage = "GenerateOverlapWithMeshes";
        Mesh overlap;
        err = GenerateOverlapWithMeshes(tsrc.mesh, ttgt.mesh, overlap,
            "", "NetCDF4", "exact",
            false,             // fHasConcaveFaces
            true,              // fAllowNoOverlap: unmapped faces are ignored
            params.verbose);   // fVerbose

        if (err == 0) {
            stage = "GenerateOfflineMapWithMeshes";
            OfflineMap map;
            err = GenerateOfflineMapWithMeshes(map, tsrc.mesh, ttgt.mesh, overlap,
                "", "",        // Input / output metadata
                "fv", "fv",    // Input / output discretization
                1, 1);         // Input / output order
            if (err == 0) map.GetSparseMatrix().GetEntries(rows, cols, vals);
        }
    } catch(::Exception &e) {
        engine_msg = e.ToString();
    } catch(std::exception &e) {
        engine_msg = e.what();
    }
    if (engine_msg.size() > 0) (*uregrid_error)(ENGINE_FAILURE,
        "%s", engine_msg.c_str());
    if (err != 0) (*uregrid_error)(ENGINE_FAILURE,
        "TempestRemap %s() failed with code %d", stage, err);

    // Convert Tempest faces back to element ids
    ret.reserve(vals.GetRows());
    for (size_t k=0; k<vals.GetRows(); ++k) {
        int const tf = rows[k];
        int const sf = cols[k];
        long const te = ttgt.face_elements[tf];
        long const se = tsrc.face_elements[sf];
        double w = vals[k];

        if (tgt.has_areas()) {
            // Elements with no area receive nothing
            if (tgt.areas[te] <= 0) continue;
            w *= ttgt.mesh.vecFaceArea[tf] / tgt.areas[te];
        }
        if (src.has_areas()) w *= src.areas[se] / tsrc.mesh.vecFaceArea[sf];

        ret.add(tgt.first_element_id + te, src.first_element_id + se, w);
    }

    if (params.verbose) printf("END TempestWeightEngine::compute_weights(): %ld weights\n",
        (long)ret.size());
    return ret;
}

}}    // namespace
