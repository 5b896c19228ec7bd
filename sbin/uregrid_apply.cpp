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

#include <iostream>
#include <string>
#include <boost/filesystem.hpp>
#include <tclap/CmdLine.h>

#include <ibmisc/netcdf.hpp>

#include <uregrid/Regridder.hpp>

using namespace uregrid;
using namespace ibmisc;
using namespace netCDF;

struct ParseArgs {
    std::string fname_regridder;
    std::string fname_data;
    std::string vname;
    std::string fname_out;    // OUT: Name of regridded data file to write
    double mdtol;

    ParseArgs(int argc, char **argv);
};

ParseArgs::ParseArgs(int argc, char **argv)
{
    try {
        TCLAP::CmdLine cmd("Regrids one variable with a regridder file "
            "written by uregrid_weights.", ' ', "<no-version>");

        TCLAP::UnlabeledValueArg<std::string> fname_regridder_a("regridder",
            "Name of regridder file",
            true, "", "regridder file", cmd);

        TCLAP::UnlabeledValueArg<std::string> fname_data_a("data",
            "Name of file containing data on the source geometry",
            true, "", "data file", cmd);

        TCLAP::UnlabeledValueArg<std::string> vname_a("var",
            "Variable to regrid",
            true, "", "variable name", cmd);

        TCLAP::ValueArg<std::string> fname_out_a("o", "out",
            "Name of file to write",
            false, "", "output file", cmd);

        TCLAP::ValueArg<double> mdtol_a("", "mdtol",
            "Largest fraction of a target element that may be uncovered "
            "before it is masked",
            false, 1.0, "fraction", cmd);

        cmd.parse( argc, argv );

        fname_regridder = fname_regridder_a.getValue();
        fname_data = fname_data_a.getValue();
        vname = vname_a.getValue();
        fname_out = fname_out_a.getValue();
        mdtol = mdtol_a.getValue();
    } catch (TCLAP::ArgException &e) { // catch any exceptions
        std::cerr << "error: " << e.error() << " for arg " << e.argId() << std::endl;
        exit(1);
    }
}

template<int SRC_RANK>
static blitz::Array<double,1> read_src(
    std::string const &fname, std::string const &vname, Regridder const &regridder)
{
    NcIO ncio(fname, 'r');
    blitz::Array<double,SRC_RANK> src(nc_read_blitz<double,SRC_RANK>(ncio.nc, vname));
    ncio.close();
    return regridder.src().flatten(src);
}

template<int TGT_RANK>
static void write_tgt(
    std::string const &fname, std::string const &vname, Regridder const &regridder,
    MaskedArray<double,1> const &flat, std::vector<std::string> const &dim_names)
{
    MaskedArray<double,TGT_RANK> tgt(regridder.tgt().unflatten<double,TGT_RANK>(flat));
    blitz::Array<short,TGT_RANK> mask(tgt.mask.shape());
    mask = blitz::where(tgt.mask, 1, 0);

    NcIO ncio(fname, 'w');
    auto dims(get_or_add_dims(ncio, tgt.value, dim_names));
    NcVar value_v = ncio_blitz(ncio, tgt.value, vname, "double", dims);
    value_v.putAtt("comment", "Regridded value; 0 where masked");
    NcVar mask_v = ncio_blitz(ncio, mask, vname + ".mask", "short", dims);
    mask_v.putAtt("comment", "1 where the target element is not covered well enough");
    ncio.close();
}

int main(int argc, char **argv)
{
    ParseArgs args(argc, argv);

    printf("------------- Read regridder: %s\n", args.fname_regridder.c_str());
    std::unique_ptr<Regridder> regridder;
    {
        NcIO ncio(args.fname_regridder, 'r');
        regridder = load_regridder(ncio, "regridder");
        ncio.close();
    }
    printf("Regridder: %ld -> %ld elements, %ld weights\n",
        regridder->src().size(), regridder->tgt().size(),
        (long)regridder->weight_matrix().nonZeros());

    printf("------------- Read %s from %s\n", args.vname.c_str(), args.fname_data.c_str());
    blitz::Array<double,1> src;
    switch(regridder->src().type()) {
        case DescriptorType::GRID :
            src.reference(read_src<2>(args.fname_data, args.vname, *regridder));
            break;
        case DescriptorType::MESH :
            src.reference(read_src<1>(args.fname_data, args.vname, *regridder));
            break;
    }

    printf("--------------- Regridding (mdtol=%g)\n", args.mdtol);
    MaskedArray<double,1> tgt(regridder->regrid_flat(src, args.mdtol));
    printf("%ld of %ld target elements valued\n", tgt.count(), regridder->tgt().size());

    std::string fname(args.fname_out);
    if (fname == "") {
        boost::filesystem::path const pdata(args.fname_data);
        fname = pdata.stem().string() + "-regridded.nc";
    }

    printf("--------------- Writing to %s\n", fname.c_str());
    switch(regridder->tgt().type()) {
        case DescriptorType::GRID :
            write_tgt<2>(fname, args.vname, *regridder, tgt, {"nlat", "nlon"});
            break;
        case DescriptorType::MESH :
            write_tgt<1>(fname, args.vname, *regridder, tgt, {"nface"});
            break;
    }
}
