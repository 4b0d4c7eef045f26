/*
 * The entry point into the python _objwatch module exposing the watcher runtime to python.
 *
 * Objects are handed to Python as shared pointers and keep their Runtime alive. Watcher callbacks receive owning
 * handles too, so a callback may keep its argument; an object that is already deallocating is reported by its
 * ObjectId.
 */
#include <objwatch/python/py_objwatch.h>
#include <objwatch/runtime/watcher_errors.h>
#include <objwatch/util/errors.h>

namespace objwatch {
    void export_object_model(nb::module_ &);

    void export_runtime(nb::module_ &);
} // namespace objwatch

NB_MODULE(_objwatch, m) {
    m.doc() = "Mutation watchers for dicts, types, code and function objects";

    // Host object errors map onto the matching Python built-ins; the watcher errors keep the default
    // translation (std::invalid_argument -> ValueError, std::runtime_error -> RuntimeError).
    nb::register_exception_translator([](const std::exception_ptr &p, void *) {
        try {
            std::rethrow_exception(p);
        } catch (const objwatch::KeyError &e) {
            PyErr_SetString(PyExc_KeyError, e.what());
        } catch (const objwatch::AttributeError &e) {
            PyErr_SetString(PyExc_AttributeError, e.what());
        } catch (const objwatch::TypeError &e) {
            PyErr_SetString(PyExc_TypeError, e.what());
        }
    }, nullptr);

    objwatch::export_object_model(m);
    objwatch::export_runtime(m);
}
