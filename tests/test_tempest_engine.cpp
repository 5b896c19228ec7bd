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

// https://github.com/google/googletest/blob/master/googletest/docs/Primer.md

#include <gtest/gtest.h>
#include <uregrid/Regridder.hpp>
#include <uregrid/GridDescriptor.hpp>
#include <uregrid/MeshDescriptor.hpp>
#include <uregrid/tempest/TempestWeightEngine.hpp>

using namespace uregrid;

class TempestWeightEngineTest : public ::testing::Test {
protected:

    TempestWeightEngineTest() {}

    /** Lon/lat grid with 10-degree cells */
    std::unique_ptr<GeometryDescriptor> make_grid(
        double lon0, int nlon, double lat0, int nlat, double dlon=10., double dlat=10.)
    {
        blitz::Array<double,1> lons(nlon), lats(nlat), lonb(nlon+1), latb(nlat+1);
        for (int i=0; i<nlon+1; ++i) lonb(i) = lon0 + i*dlon;
        for (int j=0; j<nlat+1; ++j) latb(j) = lat0 + j*dlat;
        for (int i=0; i<nlon; ++i) lons(i) = .5 * (lonb(i) + lonb(i+1));
        for (int j=0; j<nlat; ++j) lats(j) = .5 * (latb(j) + latb(j+1));
        return std::unique_ptr<GeometryDescriptor>(
            new GridDescriptor(lons, lats, lonb, latb));
    }
};

TEST_F(TempestWeightEngineTest, split_cell)
{
    // Two source cells exactly tile one target cell
    tempest::TempestWeightEngine engine;
    Regridder rg(make_grid(0., 2, 0., 1), make_grid(0., 1, 0., 1, 20.), engine);

    EigenSparseMatrixT const &M(rg.weight_matrix());
    EXPECT_EQ(1, M.rows());
    EXPECT_EQ(2, M.cols());
    EXPECT_NEAR(.5, M.coeff(0,0), 1e-8);
    EXPECT_NEAR(.5, M.coeff(0,1), 1e-8);
    EXPECT_NEAR(1., rg.weight_sums()(0), 1e-8);

    blitz::Array<double,2> src(1,2);
    src = 1., 3.;
    MaskedArray<double,2> tgt(rg.regrid<2>(src, 0.));
    EXPECT_FALSE(tgt.mask(0,0));
    EXPECT_NEAR(2., tgt.value(0,0), 1e-8);
}

TEST_F(TempestWeightEngineTest, partial_coverage)
{
    // Target cell [10,30] is half covered by the source [0,20]
    tempest::TempestWeightEngine engine;
    Regridder rg(make_grid(0., 2, 0., 1), make_grid(10., 1, 0., 1, 20.), engine);

    EXPECT_NEAR(.5, rg.weight_sums()(0), 1e-8);
    EXPECT_NEAR(.5, rg.weight_matrix().coeff(0,1), 1e-8);
    EXPECT_NEAR(0., rg.weight_matrix().coeff(0,0), 1e-8);

    blitz::Array<double,2> src(1,2);
    src = 1., 3.;
    EXPECT_FALSE(rg.regrid<2>(src, 0.6).mask(0,0));
    EXPECT_TRUE(rg.regrid<2>(src, 0.4).mask(0,0));
    EXPECT_NEAR(3., rg.regrid<2>(src, 1.).value(0,0), 1e-8);
}

TEST_F(TempestWeightEngineTest, disjoint_source_faces)
{
    // Source cells in [20,60] overlap no target face and are ignored
    tempest::TempestWeightEngine engine;
    Regridder rg(make_grid(0., 6, 0., 1), make_grid(0., 1, 0., 1, 20.), engine);

    EXPECT_NEAR(1., rg.weight_sums()(0), 1e-8);
    EXPECT_NEAR(.5, rg.weight_matrix().coeff(0,0), 1e-8);
    EXPECT_NEAR(.5, rg.weight_matrix().coeff(0,1), 1e-8);
    for (int s=2; s<6; ++s) EXPECT_EQ(0., rg.weight_matrix().coeff(0,s));
}

TEST_F(TempestWeightEngineTest, mesh_to_grid)
{
    // Same two cells, as a mesh with 1-based nodes and a masked slot
    blitz::Array<double,2> coords(6,2);
    coords = 0., 0.,
             10., 0.,
             20., 0.,
             0., 10.,
             10., 10.,
             20., 10.;
    MaskedArray<int,2> face_nodes(blitz::shape(2,5));
    face_nodes.value = 1, 2, 5, 4, 0,
                       2, 3, 6, 5, 0;
    face_nodes.mask = false, false, false, false, true,
                      false, false, false, false, true;
    std::unique_ptr<GeometryDescriptor> mesh(new MeshDescriptor(coords, face_nodes, 1, 0));

    tempest::TempestWeightEngine engine;
    Regridder rg(std::move(mesh), make_grid(0., 1, 0., 1, 20.), engine);
    EXPECT_NEAR(.5, rg.weight_matrix().coeff(0,0), 1e-8);
    EXPECT_NEAR(.5, rg.weight_matrix().coeff(0,1), 1e-8);
}

TEST_F(TempestWeightEngineTest, reference_weights)
{
    // A triangle and a quadrilateral split along the diagonal lat = lon
    blitz::Array<double,2> coords(5,2);
    coords = 0., 0.,
             0., 1.,
             1., 0.,
             1., 1.,
             1., 2.;
    MaskedArray<int,2> face_nodes(blitz::shape(2,4));
    face_nodes.value = 0, 2, 3, -1,
                       3, 0, 1, 4;
    face_nodes.mask = false, false, false, true,
                      false, false, false, false;
    std::unique_ptr<GeometryDescriptor> mesh(new MeshDescriptor(coords, face_nodes, 0, 0));

    // 2 longitudes by 3 latitudes
    blitz::Array<double,1> lons(2), lats(3), lonb(3), latb(4);
    lons = 0., 1./3.;
    lats = 0., .5, 1.;
    lonb = 0., 1./3., 2./3.;
    latb = 0., .5, 1., 1.5;
    std::unique_ptr<GeometryDescriptor> grid(new GridDescriptor(lons, lats, lonb, latb));

    tempest::TempestWeightEngine engine;
    Regridder rg(std::move(mesh), std::move(grid), engine);
    EigenSparseMatrixT const &M(rg.weight_matrix());
    ASSERT_EQ(6, M.rows());
    ASSERT_EQ(2, M.cols());

    // Conservative reference weights, indexed by (j, i) of the target
    // cell and the source face; target row t = j*nlon + i.
    double const ref[3][2][2] = {
        {{0.3333836384685291, 0.6666163615314712},    // j=0, i=0
         {0.9167189586203999, 0.0832810413795998}},   // j=0, i=1
        {{0., 1.0},                                   // j=1, i=0
         {0.08339316630404843, 0.9166068336959516}},  // j=1, i=1
        {{0., 0.3335106008404508},                    // j=2, i=0
         {0., 0.9168310094376751}}};                  // j=2, i=1
    for (int j=0; j<3; ++j) {
    for (int i=0; i<2; ++i) {
    for (int s=0; s<2; ++s) {
        EXPECT_NEAR(ref[j][i][s], M.coeff(j*2 + i, s), 5e-4);
    }}}
}

TEST_F(TempestWeightEngineTest, clockwise_face)
{
    // Clockwise node order describes the same area
    blitz::Array<double,2> coords(4,2);
    coords = 0., 0.,
             20., 0.,
             20., 10.,
             0., 10.;
    MaskedArray<int,2> face_nodes(blitz::shape(1,4));
    face_nodes.value = 0, 3, 2, 1;
    face_nodes.mask = false;
    std::unique_ptr<GeometryDescriptor> mesh(new MeshDescriptor(coords, face_nodes, 0, 0));

    tempest::TempestWeightEngine engine;
    Regridder rg(std::move(mesh), make_grid(0., 2, 0., 1), engine);
    EXPECT_NEAR(1., rg.weight_sums()(0), 1e-8);
    EXPECT_NEAR(1., rg.weight_sums()(1), 1e-8);
}

TEST_F(TempestWeightEngineTest, degenerate)
{
    // Face 1 repeats a node: only 2 distinct nodes
    blitz::Array<double,2> coords(4,2);
    coords = 0., 0.,
             20., 0.,
             20., 10.,
             0., 10.;
    MaskedArray<int,2> face_nodes(blitz::shape(2,4));
    face_nodes.value = 0, 1, 2, 3,
                       0, 1, 1, 0;
    face_nodes.mask = false;

    {
        std::unique_ptr<GeometryDescriptor> mesh(new MeshDescriptor(coords, face_nodes, 0, 0));
        tempest::TempestWeightEngine engine;
        Regridder rg(std::move(mesh), make_grid(0., 2, 0., 1), engine);
        EXPECT_EQ(2, rg.weight_matrix().cols());
        EXPECT_NEAR(1., rg.weight_sums()(0), 1e-8);

        // Nothing comes from the degenerate face
        for (int t=0; t<2; ++t) EXPECT_EQ(0., rg.weight_matrix().coeff(t,1));
    }

    {
        std::unique_ptr<GeometryDescriptor> mesh(new MeshDescriptor(coords, face_nodes, 0, 0));
        tempest::TempestWeightEngine engine(EngineParams(false, false));
        EXPECT_THROW(Regridder(std::move(mesh), make_grid(0., 2, 0., 1), engine), EngineFailure);
    }
}

TEST_F(TempestWeightEngineTest, user_areas)
{
    // Weights scale with the caller-supplied source areas
    blitz::Array<double,1> lons(2), lats(1), lonb(3), latb(2);
    lons = 5., 15.;
    lats = 5.;
    lonb = 0., 10., 20.;
    latb = 0., 10.;

    tempest::TempestWeightEngine engine;
    EigenSparseMatrixT M[2];
    for (int k=0; k<2; ++k) {
        blitz::Array<double,2> areas(1,2);
        areas = (k+1) * .03, (k+1) * .03;
        std::unique_ptr<GeometryDescriptor> src(
            new GridDescriptor(lons, lats, lonb, latb, "", false, areas));
        Regridder rg(std::move(src), make_grid(0., 1, 0., 1, 20.), engine);
        M[k] = rg.weight_matrix();
    }

    EXPECT_NEAR(2. * M[0].coeff(0,0), M[1].coeff(0,0), 1e-10);
    EXPECT_NEAR(2. * M[0].coeff(0,1), M[1].coeff(0,1), 1e-10);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
