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

#include <uregrid/GeometryDescriptor.hpp>
#include <uregrid/Regridder.hpp>
#include <uregrid/tempest/TempestWeightEngine.hpp>

using namespace uregrid;
using namespace ibmisc;
using namespace netCDF;

struct ParseArgs {
    std::string fname_src;
    std::string fname_tgt;
    std::string fname_out;    // OUT: Name of regridder file to write
    bool keep_degenerate;
    bool verbose;

    ParseArgs(int argc, char **argv);
};

ParseArgs::ParseArgs(int argc, char **argv)
{
    try {
        TCLAP::CmdLine cmd("Computes conservative regridding weights between "
            "two geometries, and writes them as a regridder file.", ' ', "<no-version>");

        TCLAP::UnlabeledValueArg<std::string> fname_src_a("src",
            "Name of file containing the source geometry (variable 'descriptor')",
            true, "", "source geometry file", cmd);

        TCLAP::UnlabeledValueArg<std::string> fname_tgt_a("tgt",
            "Name of file containing the target geometry (variable 'descriptor')",
            true, "", "target geometry file", cmd);

        TCLAP::ValueArg<std::string> fname_out_a("o", "out",
            "Name of regridder file to write",
            false, "", "regridder file", cmd);

        TCLAP::SwitchArg keep_degenerate_a("", "keep-degenerate",
            "Fail on degenerate elements, instead of leaving them out", cmd);

        TCLAP::SwitchArg verbose_a("v", "verbose",
            "Print progress of the weight computation", cmd);

        cmd.parse( argc, argv );

        fname_src = fname_src_a.getValue();
        fname_tgt = fname_tgt_a.getValue();
        fname_out = fname_out_a.getValue();
        keep_degenerate = keep_degenerate_a.getValue();
        verbose = verbose_a.getValue();
    } catch (TCLAP::ArgException &e) { // catch any exceptions
        std::cerr << "error: " << e.error() << " for arg " << e.argId() << std::endl;
        exit(1);
    }
}

static std::unique_ptr<GeometryDescriptor> read_descriptor(std::string const &fname)
{
    NcIO ncio(fname, 'r');
    std::unique_ptr<GeometryDescriptor> desc(read_geometry_descriptor(ncio, "descriptor"));
    ncio.close();
    printf("    %s: %ld elements\n", fname.c_str(), desc->size());
    return desc;
}

int main(int argc, char **argv)
{
    ParseArgs args(argc, argv);

    printf("------------- Read source geometry: %s\n", args.fname_src.c_str());
    std::unique_ptr<GeometryDescriptor> src(read_descriptor(args.fname_src));
    printf("------------- Read target geometry: %s\n", args.fname_tgt.c_str());
    std::unique_ptr<GeometryDescriptor> tgt(read_descriptor(args.fname_tgt));

    printf("--------------- Computing weights\n");
    tempest::TempestWeightEngine engine(
        EngineParams(!args.keep_degenerate, args.verbose));
    Regridder regridder(std::move(src), std::move(tgt), engine);
    printf("%ld weights\n", (long)regridder.weight_matrix().nonZeros());

    std::string fname(args.fname_out);
    if (fname == "") {
        boost::filesystem::path const psrc(args.fname_src), ptgt(args.fname_tgt);
        fname = psrc.stem().string() + "-" + ptgt.stem().string() + ".nc";
    }

    printf("--------------- Writing regridder to %s\n", fname.c_str());
    NcIO ncio(fname, 'w');
    regridder.ncio(ncio, "regridder");
    ncio.close();
}
