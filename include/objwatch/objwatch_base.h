/*
 * The core imports for objwatch. Use this to ensure the correct import order can be maintained.
 * The Python bindings pull in nanobind separately (see objwatch/python/py_objwatch.h) so that the
 * watcher core can be embedded in a host runtime without a Python dependency.
 */

#ifndef OBJWATCH_BASE_H
#define OBJWATCH_BASE_H

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <objwatch/objwatch_export.h>
#include <objwatch/objwatch_forward_declarations.h>

#endif //OBJWATCH_BASE_H
