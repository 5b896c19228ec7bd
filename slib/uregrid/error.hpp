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

#ifndef UREGRID_ERROR_HPP
#define UREGRID_ERROR_HPP

#include <string>
#include <everytrace.hpp>

/** @defgroup uregrid uregrid.hpp
@brief Basic stuff common to all uregrid */
namespace uregrid {

/** Base of everything uregrid throws.  Carries the formatted message
that was passed to uregrid_error. */
class Exception : public everytrace::Exception {
    std::string _msg;
public:
    explicit Exception(std::string const &msg) : _msg(msg) {}
    virtual ~Exception() {}

    virtual const char *what() const noexcept
        { return _msg.c_str(); }
};

/** Malformed descriptor input (shape mismatch, out-of-range connectivity). */
class ConstructionError : public Exception {
public:
    explicit ConstructionError(std::string const &msg) : Exception(msg) {}
};

/** Precomputed weights of the wrong type or shape. */
class WeightShapeError : public Exception {
public:
    explicit WeightShapeError(std::string const &msg) : Exception(msg) {}
};

/** Data array does not conform to its geometry. */
class ArrayShapeError : public Exception {
public:
    explicit ArrayShapeError(std::string const &msg) : Exception(msg) {}
};

/** The external weight engine reported a failure. */
class EngineFailure : public Exception {
public:
    explicit EngineFailure(std::string const &msg) : Exception(msg) {}
};

/** Values for the retcode argument of uregrid_error; each selects the
type of exception thrown by the default handler. */
enum ErrorCode {
    CONSTRUCTION_ERROR = -1,
    WEIGHT_SHAPE_ERROR = -2,
    ARRAY_SHAPE_ERROR = -3,
    ENGINE_FAILURE = -4
};

typedef void (*error_ptr)(int retcode, char const *format, ...);

/** Prints the message to stderr, then throws the Exception subclass
selected by retcode.  User or other library can change if needed. */
extern void default_error(int retcode, char const *format, ...);

/** Use default_error by default. */
extern error_ptr uregrid_error;

}   // namespace
/** @} */

#endif // Guard
