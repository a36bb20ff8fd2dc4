#pragma once

#include <pybind11/pybind11.h>
#include <cstdint>
#include "hash_trie_map.hpp"
#include "hash_trie_set.hpp"
#include "hash_utils.hpp"
#include "persistent_list.hpp"

namespace py = pybind11;

namespace rpds {

// Python hashing: PyObject_Hash, so tuples, frozensets and the rpds types
// hash recursively. A TypeError from Python becomes UnhashableValue.
template <>
struct Hasher<py::object> {
    uint64_t operator()(const py::object& key) const;
};

// Python equality: identity first, then rich comparison
template <>
struct Equal<py::object> {
    bool operator()(const py::object& k1, const py::object& k2) const;
};

using PyHashTrieMap = HashTrieMap<py::object, py::object>;
using PyHashTrieSet = HashTrieSet<py::object>;
using PyList = List<py::object>;

}  // namespace rpds
