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
#include <uregrid/error.hpp>

using namespace uregrid;

class ErrorTest : public ::testing::Test {};

TEST_F(ErrorTest, exception_types)
{
    EXPECT_THROW((*uregrid_error)(CONSTRUCTION_ERROR, "x"), ConstructionError);
    EXPECT_THROW((*uregrid_error)(WEIGHT_SHAPE_ERROR, "x"), WeightShapeError);
    EXPECT_THROW((*uregrid_error)(ARRAY_SHAPE_ERROR, "x"), ArrayShapeError);
    EXPECT_THROW((*uregrid_error)(ENGINE_FAILURE, "x"), EngineFailure);
    EXPECT_THROW((*uregrid_error)(-99, "x"), uregrid::Exception);
}

TEST_F(ErrorTest, formatted_message)
{
    try {
        (*uregrid_error)(CONSTRUCTION_ERROR, "face %d references node %d", 3, 17);
        FAIL();
    } catch(ConstructionError &e) {
        EXPECT_EQ(std::string("face 3 references node 17"), e.what());
    }
}

TEST_F(ErrorTest, long_message_kept_whole)
{
    // Engine messages can be arbitrarily long
    std::string engine_msg(10000, 'e');
    engine_msg += "END";
    try {
        (*uregrid_error)(ENGINE_FAILURE, "%s", engine_msg.c_str());
        FAIL();
    } catch(EngineFailure &e) {
        EXPECT_EQ(engine_msg, e.what());
    }
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
