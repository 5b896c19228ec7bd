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

#include <cstdio>
#include <cstdarg>
#include <vector>
#include <uregrid/error.hpp>

namespace uregrid {

void default_error(int retcode, const char *format, ...)
{
    va_list arglist, arglist2;

    va_start(arglist, format);
    va_copy(arglist2, arglist);
    int const len = vsnprintf(nullptr, 0, format, arglist);
    va_end(arglist);

    std::vector<char> buf(len > 0 ? len+1 : 1, '\0');
    vsnprintf(&buf[0], buf.size(), format, arglist2);
    va_end(arglist2);
    std::string msg(&buf[0]);
    fprintf(stderr, "%s\n", msg.c_str());

    switch(retcode) {
        case CONSTRUCTION_ERROR :
            throw ConstructionError(msg);
        case WEIGHT_SHAPE_ERROR :
            throw WeightShapeError(msg);
        case ARRAY_SHAPE_ERROR :
            throw ArrayShapeError(msg);
        case ENGINE_FAILURE :
            throw EngineFailure(msg);
        default :
            throw uregrid::Exception(msg);
    }
}

error_ptr uregrid_error = &default_error;

}   // Namespace
