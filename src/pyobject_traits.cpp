#include "pyobject_traits.hpp"
#include <string>
#include "errors.hpp"

namespace rpds {

uint64_t Hasher<py::object>::operator()(const py::object& key) const {
    Py_hash_t h = PyObject_Hash(key.ptr());
    if (h == -1) {
        py::error_already_set err;
        if (err.matches(PyExc_TypeError)) {
            throw UnhashableValue(py::str(err.value()).cast<std::string>());
        }
        throw err;
    }
    return hashutils::mix(static_cast<uint64_t>(h));
}

bool Equal<py::object>::operator()(const py::object& k1, const py::object& k2) const {
    // Fast path: same object
    if (k1.is(k2)) return true;

    int result = PyObject_RichCompareBool(k1.ptr(), k2.ptr(), Py_EQ);
    if (result == -1) {
        throw py::error_already_set();
    }
    return result == 1;
}

}  // namespace rpds
