/*
 * The nanobind imports for the _objwatch module. Only the binding sources include this header, the runtime itself
 * has no Python dependency.
 */

#ifndef OBJWATCH_PY_OBJWATCH_H
#define OBJWATCH_PY_OBJWATCH_H

#include <nanobind/nanobind.h>

#include <nanobind/stl/function.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <nanobind/stl/vector.h>

#include <objwatch/objwatch_base.h>
#include <objwatch/types/value.h>

namespace nb = nanobind;
using namespace nb::literals;

namespace objwatch {

    /**
     * Convert a Python object into a Value: None, bool, int, float, str, tuple or one of the runtime's objects.
     * @throws TypeError for anything else
     */
    OBJWATCH_EXPORT Value value_from_python(nb::handle obj);

    OBJWATCH_EXPORT nb::object value_to_python(const Value &value);

    /**
     * Owning handle to an object reported to a callback. Objects that are already known to Python come back as their
     * existing wrapper. An object that is deallocating (dict Deallocated, code Destroyed) is reported by its ObjectId.
     */
    OBJWATCH_EXPORT nb::object object_to_python(const Object &object);

} // namespace objwatch

#endif // OBJWATCH_PY_OBJWATCH_H
