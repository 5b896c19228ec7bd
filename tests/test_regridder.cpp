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

#include <cstdio>
#include <gtest/gtest.h>
#include <uregrid/Regridder.hpp>
#include <uregrid/GridDescriptor.hpp>
#include <uregrid/MeshDescriptor.hpp>

using namespace ibmisc;
using namespace uregrid;

/** Regrids from a small mesh to a small grid, with known weights */
class RegridderTest : public ::testing::Test {
protected:

    std::vector<std::string> tmpfiles;

    RegridderTest() {}

    virtual ~RegridderTest()
    {
        for (auto ii(tmpfiles.begin()); ii != tmpfiles.end(); ++ii) {
            ::remove(ii->c_str());
        }
    }

    /** 5 nodes; a triangle (4th slot masked) and a quadrilateral */
    std::unique_ptr<GeometryDescriptor> make_mesh()
    {
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
        return std::unique_ptr<GeometryDescriptor>(
            new MeshDescriptor(coords, face_nodes, 0, 0));
    }

    /** 3 longitudes by 2 latitudes */
    std::unique_ptr<GeometryDescriptor> make_grid()
    {
        blitz::Array<double,1> lons(3), lats(2), lonb(4), latb(3);
        lons = 1./6., 1./2., 5./6.;
        lats = 1./2., 3./2.;
        lonb = 0., 1./3., 2./3., 1.;
        latb = 0., 1., 2.;
        return std::unique_ptr<GeometryDescriptor>(
            new GridDescriptor(lons, lats, lonb, latb));
    }

    /** Fixed weights, shape (grid, mesh).  They are taken as given
    and not computed from the geometry of make_grid(). */
    Eigen::SparseMatrix<double> make_weights()
    {
        int const rows[] = {0, 0, 1, 2, 3, 3, 4, 4, 5};
        int const cols[] = {0, 1, 1, 1, 0, 1, 0, 1, 1};
        double const vals[] = {
            0.3333836384685291, 0.6666163615314712, 1.0,
            0.3335106008404508, 0.9167189586203999, 0.0832810413795998,
            0.08339316630404843, 0.9166068336959516, 0.9168310094376751};
        std::vector<EigenTripletT> tuples;
        for (int k=0; k<9; ++k) tuples.push_back(EigenTripletT(rows[k], cols[k], vals[k]));
        Eigen::SparseMatrix<double> W(6,2);
        W.setFromTriplets(tuples.begin(), tuples.end());
        return W;
    }

    std::unique_ptr<Regridder> make_regridder()
    {
        return std::unique_ptr<Regridder>(
            new Regridder(make_mesh(), make_grid(), make_weights()));
    }

    blitz::Array<double,1> make_src()
    {
        blitz::Array<double,1> src(2);
        src = 3., 2.;
        return src;
    }
};

static double const expected[2][3] = {
    {2.333383638468529, 2.0, 2.0},
    {2.9167189586204008, 2.083393166304049, 2.0}};

TEST_F(RegridderTest, regrid)
{
    std::unique_ptr<Regridder> rg(make_regridder());
    MaskedArray<double,2> tgt(rg->regrid<2>(make_src()));

    ASSERT_EQ(2, tgt.value.extent(0));
    ASSERT_EQ(3, tgt.value.extent(1));
    for (int j=0; j<2; ++j) {
    for (int i=0; i<3; ++i) {
        EXPECT_FALSE(tgt.mask(j,i));
        EXPECT_NEAR(expected[j][i], tgt.value(j,i), 1e-12);
    }}
}

TEST_F(RegridderTest, mdtol)
{
    std::unique_ptr<Regridder> rg(make_regridder());

    // Elements more than half uncovered are masked
    MaskedArray<double,2> half(rg->regrid<2>(make_src(), 0.5));
    for (int j=0; j<2; ++j) {
    for (int i=0; i<3; ++i) {
        bool const masked = (j == 0 && i == 2);
        EXPECT_EQ(masked, half.mask(j,i));
        if (masked) EXPECT_EQ(0., half.value(j,i));
        else EXPECT_NEAR(expected[j][i], half.value(j,i), 1e-12);
    }}

    // Elements not fully covered are masked
    MaskedArray<double,2> none(rg->regrid<2>(make_src(), 0.));
    for (int j=0; j<2; ++j) {
    for (int i=0; i<3; ++i) {
        bool const masked = (i == 2);
        EXPECT_EQ(masked, none.mask(j,i));
        if (!masked) EXPECT_NEAR(expected[j][i], none.value(j,i), 1e-12);
    }}
}

TEST_F(RegridderTest, mdtol_monotonic)
{
    std::unique_ptr<Regridder> rg(make_regridder());
    double const mdtols[] = {-1., 0., 1e-9, .05, .1, .5, .6667, .9, 1., 2.};
    int const n = sizeof(mdtols) / sizeof(double);

    for (int a=0; a<n-1; ++a) {
        MaskedArray<double,1> lo(rg->regrid_flat(make_src(), mdtols[a]));
        MaskedArray<double,1> hi(rg->regrid_flat(make_src(), mdtols[a+1]));
        for (int t=0; t<6; ++t) {
            // Masked at the higher tolerance implies masked at the lower
            if (hi.mask(t)) EXPECT_TRUE(lo.mask(t)) << "t=" << t << " mdtol=" << mdtols[a];
        }
    }
}

TEST_F(RegridderTest, fully_covered_exact)
{
    std::unique_ptr<Regridder> rg(make_regridder());
    EigenSparseMatrixT const &M(rg->weight_matrix());
    blitz::Array<double,1> src(make_src());

    // Row 1 sums to exactly 1
    ASSERT_EQ(1.0, rg->weight_sums()(1));
    double const avg = M.coeff(1,0) * src(0) + M.coeff(1,1) * src(1);
    for (double mdtol : {1e-10, .1, .5, 1.}) {
        MaskedArray<double,1> tgt(rg->regrid_flat(src, mdtol));
        EXPECT_FALSE(tgt.mask(1));
        EXPECT_EQ(avg, tgt.value(1));
    }
}

TEST_F(RegridderTest, uncovered_always_masked)
{
    // Target element 2 has no weights at all
    Eigen::SparseMatrix<double> W(make_weights());
    W.coeffRef(2,1) = 0;
    W.prune(0.0);
    Regridder rg(make_mesh(), make_grid(), W);

    MaskedArray<double,1> tgt(rg.regrid_flat(make_src(), 1.));
    EXPECT_TRUE(tgt.mask(2));
    EXPECT_EQ(0., tgt.value(2));
    EXPECT_EQ(5, tgt.count());
}

TEST_F(RegridderTest, shapes)
{
    std::unique_ptr<Regridder> rg(make_regridder());
    EXPECT_EQ(6, rg->weight_matrix().rows());
    EXPECT_EQ(2, rg->weight_matrix().cols());
    EXPECT_EQ(6, rg->tgt().size());
    EXPECT_EQ(2, rg->src().size());

    blitz::Array<double,1> src3(3);
    src3 = 1., 2., 3.;
    EXPECT_THROW(rg->regrid<2>(src3), ArrayShapeError);
    EXPECT_THROW(rg->regrid_flat(src3), ArrayShapeError);

    blitz::Array<double,2> src2(1,2);
    src2 = 1., 2.;
    EXPECT_THROW(rg->regrid<2>(src2), ArrayShapeError);

    // Target is a grid; asking for a 1-D result is a shape error
    EXPECT_THROW(rg->regrid<1>(make_src()), ArrayShapeError);
}

TEST_F(RegridderTest, precomputed_validation)
{
    // Transposed
    Eigen::SparseMatrix<double> Wt(make_weights().transpose());
    EXPECT_THROW(Regridder(make_mesh(), make_grid(), Wt), WeightShapeError);

    // Dense
    EigenDenseMatrixT Wd(make_weights().toDense());
    EXPECT_THROW(Regridder(make_mesh(), make_grid(), Wd), WeightShapeError);
}

TEST_F(RegridderTest, repeated_calls_independent)
{
    std::unique_ptr<Regridder> rg(make_regridder());
    MaskedArray<double,1> a(rg->regrid_flat(make_src(), 0.));
    MaskedArray<double,1> b(rg->regrid_flat(make_src(), 1.));
    MaskedArray<double,1> c(rg->regrid_flat(make_src(), 0.));
    for (int t=0; t<6; ++t) {
        EXPECT_EQ(a.mask(t), c.mask(t));
        EXPECT_EQ(a.value(t), c.value(t));
        EXPECT_FALSE(b.mask(t));
    }
}

TEST_F(RegridderTest, ncio)
{
    std::unique_ptr<Regridder> rg(make_regridder());

    std::string fname("__regridder_test.nc");
    tmpfiles.push_back(fname);
    ::remove(fname.c_str());
    {
        NcIO ncio(fname, 'w');
        rg->ncio(ncio, "regridder");
        ncio.close();
    }

    std::unique_ptr<Regridder> rg2;
    {
        NcIO ncio(fname, 'r');
        rg2 = load_regridder(ncio, "regridder");

        // Reading goes through load_regridder() only
        EXPECT_THROW(rg->ncio(ncio, "regridder"), ConstructionError);
        ncio.close();
    }

    EXPECT_EQ(DescriptorType::MESH, rg2->src().type());
    EXPECT_EQ(DescriptorType::GRID, rg2->tgt().type());
    MaskedArray<double,2> tgt(rg2->regrid<2>(make_src(), 0.5));
    for (int j=0; j<2; ++j) {
    for (int i=0; i<3; ++i) {
        EXPECT_EQ(j == 0 && i == 2, tgt.mask(j,i));
        if (!tgt.mask(j,i)) EXPECT_NEAR(expected[j][i], tgt.value(j,i), 1e-12);
    }}
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
