#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <exception>
#include <sstream>
#include <string>
#include <vector>
#include "errors.hpp"
#include "pyobject_traits.hpp"

namespace py = pybind11;

using rpds::PyHashTrieMap;
using rpds::PyHashTrieSet;
using rpds::PyList;

namespace {

// KeyError(key), so that str(error) is repr(key) as with dict
[[noreturn]] void raiseKeyError(const py::object& key) {
    PyErr_SetObject(PyExc_KeyError, key.ptr());
    throw py::error_already_set();
}

std::string reprOf(const py::handle& obj) {
    return py::repr(obj).cast<std::string>();
}

/**
 * Python iterator over a persistent collection
 *
 * Holds its own copy of the collection, so the nodes being walked stay
 * alive even if the Python object it came from is collected.
 */
template <typename Collection, typename Projection>
class CollectionIterator {
private:
    Collection coll_;
    typename Collection::const_iterator iter_;

public:
    explicit CollectionIterator(const Collection& coll) : coll_(coll), iter_(coll_.begin()) {}

    py::object next() {
        if (iter_ == coll_.end()) {
            throw py::stop_iteration();
        }
        py::object result = Projection{}(*iter_);
        ++iter_;
        return result;
    }
};

struct KeyOf {
    py::object operator()(const PyHashTrieMap::EntryT& entry) const { return entry.key; }
};

struct ValueOf {
    py::object operator()(const PyHashTrieMap::EntryT& entry) const { return entry.value; }
};

struct ItemOf {
    py::object operator()(const PyHashTrieMap::EntryT& entry) const {
        return py::make_tuple(entry.key, entry.value);
    }
};

struct Identity {
    py::object operator()(const py::object& elem) const { return elem; }
};

using KeyIterator = CollectionIterator<PyHashTrieMap, KeyOf>;
using ValueIterator = CollectionIterator<PyHashTrieMap, ValueOf>;
using ItemIterator = CollectionIterator<PyHashTrieMap, ItemOf>;
using SetIterator = CollectionIterator<PyHashTrieSet, Identity>;
using ListIterator = CollectionIterator<PyList, Identity>;

std::vector<py::object> collect(const py::handle& iterable) {
    std::vector<py::object> items;
    for (auto item : iterable) {
        items.push_back(py::reinterpret_borrow<py::object>(item));
    }
    return items;
}

// Accepts a HashTrieMap, anything with items(), or an iterable of pairs
PyHashTrieMap mapFromObject(const py::object& value) {
    if (value.is_none()) {
        return PyHashTrieMap();
    }
    if (py::isinstance<PyHashTrieMap>(value)) {
        return value.cast<const PyHashTrieMap&>();
    }

    py::object pairs = py::hasattr(value, "items") ? value.attr("items")() : value;
    PyHashTrieMap result;
    for (auto item : pairs) {
        py::sequence kv = py::reinterpret_borrow<py::object>(item).cast<py::sequence>();
        if (kv.size() != 2) {
            throw py::value_error("HashTrieMap() expects pairs of (key, value)");
        }
        result = result.insert(kv[0], kv[1]);
    }
    return result;
}

PyHashTrieSet setFromObject(const py::object& value) {
    if (value.is_none()) {
        return PyHashTrieSet();
    }
    if (py::isinstance<PyHashTrieSet>(value)) {
        return value.cast<const PyHashTrieSet&>();
    }
    std::vector<py::object> items = collect(value);
    return PyHashTrieSet(items.begin(), items.end());
}

PyList listFromObject(const py::handle& value) {
    std::vector<py::object> items = collect(value);
    return PyList(items.begin(), items.end());
}

std::string mapRepr(const PyHashTrieMap& m) {
    std::ostringstream oss;
    oss << "HashTrieMap({";
    bool first = true;
    for (const auto& entry : m) {
        if (!first) oss << ", ";
        first = false;
        oss << reprOf(entry.key) << ": " << reprOf(entry.value);
    }
    oss << "})";
    return oss.str();
}

std::string setRepr(const PyHashTrieSet& s) {
    std::ostringstream oss;
    oss << "HashTrieSet({";
    bool first = true;
    for (const auto& elem : s) {
        if (!first) oss << ", ";
        first = false;
        oss << reprOf(elem);
    }
    oss << "})";
    return oss.str();
}

std::string listRepr(const PyList& l) {
    std::ostringstream oss;
    oss << "List([";
    bool first = true;
    for (const auto& elem : l) {
        if (!first) oss << ", ";
        first = false;
        oss << reprOf(elem);
    }
    oss << "])";
    return oss.str();
}

template <typename T>
Py_hash_t pyHash(const T& value) {
    return static_cast<Py_hash_t>(value.hash());
}

}  // namespace

PYBIND11_MODULE(rpds, m) {
    m.doc() = "Persistent hash-trie map, hash-trie set and cons list implemented in C++";

    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const rpds::KeyNotFound& e) {
            PyErr_SetString(PyExc_KeyError, e.what());
        } catch (const rpds::EmptyCollectionAccess& e) {
            PyErr_SetString(PyExc_IndexError, e.what());
        } catch (const rpds::UnhashableValue& e) {
            PyErr_SetString(PyExc_TypeError, e.what());
        }
    });

    // Expose iterators as Python iterators
    py::class_<KeyIterator>(m, "KeyIterator")
        .def("__iter__", [](KeyIterator& it) -> KeyIterator& { return it; })
        .def("__next__", &KeyIterator::next);

    py::class_<ValueIterator>(m, "ValueIterator")
        .def("__iter__", [](ValueIterator& it) -> ValueIterator& { return it; })
        .def("__next__", &ValueIterator::next);

    py::class_<ItemIterator>(m, "ItemIterator")
        .def("__iter__", [](ItemIterator& it) -> ItemIterator& { return it; })
        .def("__next__", &ItemIterator::next);

    py::class_<SetIterator>(m, "SetIterator")
        .def("__iter__", [](SetIterator& it) -> SetIterator& { return it; })
        .def("__next__", &SetIterator::next);

    py::class_<ListIterator>(m, "ListIterator")
        .def("__iter__", [](ListIterator& it) -> ListIterator& { return it; })
        .def("__next__", &ListIterator::next);

    py::class_<PyHashTrieMap>(m, "HashTrieMap")
        .def(py::init([](const py::object& value, const py::kwargs& kwargs) {
                 PyHashTrieMap result = mapFromObject(value);
                 for (auto item : kwargs) {
                     result = result.insert(py::reinterpret_borrow<py::object>(item.first),
                                            py::reinterpret_borrow<py::object>(item.second));
                 }
                 return result;
             }),
             py::arg("value") = py::none(),
             "Create a HashTrieMap from a mapping or an iterable of (key, value) pairs.")

        .def("insert", &PyHashTrieMap::insert,
             py::arg("key"), py::arg("value"),
             "Associate key with value, returning new map.\n\n"
             "Args:\n"
             "    key: The key (must be hashable)\n"
             "    value: The value\n\n"
             "Returns:\n"
             "    A new HashTrieMap with the association added")

        .def("remove",
             [](const PyHashTrieMap& self, const py::object& key) {
                 try {
                     return self.remove(key);
                 } catch (const rpds::KeyNotFound&) {
                     raiseKeyError(key);
                 }
             },
             py::arg("key"),
             "Remove key, returning new map. Raises KeyError if key is absent.")

        .def("discard", &PyHashTrieMap::discard,
             py::arg("key"),
             "Remove key if present, returning new map.")

        .def("get",
             [](const PyHashTrieMap& self, const py::object& key, const py::object& defaultValue) {
                 return self.get(key, defaultValue);
             },
             py::arg("key"), py::arg("default") = py::none(),
             "Get value for key, or default if not found.")

        .def("update",
             [](const PyHashTrieMap& self, const py::object& other) {
                 return self.update(mapFromObject(other));
             },
             py::arg("other"),
             "Merge another mapping, returning new map. Values from other win.")

        // Python protocols
        .def("__getitem__",
             [](const PyHashTrieMap& self, const py::object& key) -> py::object {
                 const py::object* value = self.get(key);
                 if (value == nullptr) {
                     raiseKeyError(key);
                 }
                 return *value;
             },
             py::arg("key"))

        .def("__contains__", &PyHashTrieMap::contains, py::arg("key"))
        .def("__len__", &PyHashTrieMap::size)
        .def("__iter__", [](const PyHashTrieMap& self) { return KeyIterator(self); })
        .def("keys", [](const PyHashTrieMap& self) { return KeyIterator(self); })
        .def("values", [](const PyHashTrieMap& self) { return ValueIterator(self); })
        .def("items", [](const PyHashTrieMap& self) { return ItemIterator(self); })

        .def("__eq__",
             [](const PyHashTrieMap& self, const py::object& other) -> bool {
                 if (!py::isinstance<PyHashTrieMap>(other)) {
                     return false;
                 }
                 return self == other.cast<const PyHashTrieMap&>();
             },
             py::arg("other"))

        .def("__ne__",
             [](const PyHashTrieMap& self, const py::object& other) -> bool {
                 if (!py::isinstance<PyHashTrieMap>(other)) {
                     return true;
                 }
                 return self != other.cast<const PyHashTrieMap&>();
             },
             py::arg("other"))

        .def("__hash__", &pyHash<PyHashTrieMap>)
        .def("__repr__", &mapRepr)

        // Pickle support
        .def(py::pickle(
            [](const PyHashTrieMap& self) {  // __getstate__
                py::list items;
                for (const auto& entry : self) {
                    items.append(py::make_tuple(entry.key, entry.value));
                }
                return items;
            },
            [](const py::list& items) {  // __setstate__
                return mapFromObject(items);
            }));

    // isinstance(HashTrieMap(), Mapping) holds, as it does for dict
    py::module_::import("collections.abc").attr("Mapping").attr("register")(m.attr("HashTrieMap"));

    py::class_<PyHashTrieSet>(m, "HashTrieSet")
        .def(py::init(&setFromObject),
             py::arg("value") = py::none(),
             "Create a HashTrieSet from an iterable.")

        .def("insert", &PyHashTrieSet::insert,
             py::arg("value"),
             "Add element to set, returning new set.\n\n"
             "Args:\n"
             "    value: The element to add (must be hashable)\n\n"
             "Returns:\n"
             "    A new HashTrieSet with the element added")

        .def("remove",
             [](const PyHashTrieSet& self, const py::object& value) {
                 try {
                     return self.remove(value);
                 } catch (const rpds::KeyNotFound&) {
                     raiseKeyError(value);
                 }
             },
             py::arg("value"),
             "Remove element, returning new set. Raises KeyError if absent.")

        .def("discard", &PyHashTrieSet::discard,
             py::arg("value"),
             "Remove element if present, returning new set.")

        // Set operations
        .def("union", &PyHashTrieSet::unionWith, py::arg("other"))
        .def("intersection", &PyHashTrieSet::intersection, py::arg("other"))
        .def("difference", &PyHashTrieSet::difference, py::arg("other"))
        .def("symmetric_difference", &PyHashTrieSet::symmetricDifference, py::arg("other"))
        .def("__or__", &PyHashTrieSet::unionWith, py::arg("other"))
        .def("__and__", &PyHashTrieSet::intersection, py::arg("other"))
        .def("__sub__", &PyHashTrieSet::difference, py::arg("other"))
        .def("__xor__", &PyHashTrieSet::symmetricDifference, py::arg("other"))

        // Set predicates
        .def("issubset", &PyHashTrieSet::isSubset, py::arg("other"))
        .def("issuperset", &PyHashTrieSet::isSuperset, py::arg("other"))
        .def("isdisjoint", &PyHashTrieSet::isDisjoint, py::arg("other"))

        .def("__contains__", &PyHashTrieSet::contains, py::arg("value"))
        .def("__len__", &PyHashTrieSet::size)
        .def("__iter__", [](const PyHashTrieSet& self) { return SetIterator(self); })

        .def("__eq__",
             [](const PyHashTrieSet& self, const py::object& other) -> bool {
                 if (!py::isinstance<PyHashTrieSet>(other)) {
                     return false;
                 }
                 return self == other.cast<const PyHashTrieSet&>();
             },
             py::arg("other"))

        .def("__ne__",
             [](const PyHashTrieSet& self, const py::object& other) -> bool {
                 if (!py::isinstance<PyHashTrieSet>(other)) {
                     return true;
                 }
                 return self != other.cast<const PyHashTrieSet&>();
             },
             py::arg("other"))

        .def("__hash__", &pyHash<PyHashTrieSet>)
        .def("__repr__", &setRepr)

        .def(py::pickle(
            [](const PyHashTrieSet& self) {
                py::list items;
                for (const auto& elem : self) {
                    items.append(elem);
                }
                return items;
            },
            [](const py::list& items) {
                return setFromObject(items);
            }));

    py::class_<PyList>(m, "List")
        .def(py::init([](const py::args& args) {
                 if (args.size() == 1) {
                     py::object iterable = args[0];
                     return listFromObject(iterable);
                 }
                 return listFromObject(args);
             }),
             "Create a List from an iterable, or from the arguments themselves.\n\n"
             "Example:\n"
             "    List([1, 2, 3]) == List(1, 2, 3)")

        .def("push_front", &PyList::pushFront,
             py::arg("value"),
             "Prepend value, returning new list.\n\n"
             "Complexity: O(1)")

        .def_property_readonly("first",
             [](const PyList& self) { return self.first(); },
             "The first element. Raises IndexError on an empty list.")

        .def_property_readonly("rest", &PyList::rest,
             "The list without its first element. Raises IndexError on an empty list.")

        .def("reverse", &PyList::reverse)

        .def("__len__", &PyList::size)
        .def("__bool__", [](const PyList& self) { return !self.empty(); })
        .def("__iter__", [](const PyList& self) { return ListIterator(self); })

        .def("__eq__",
             [](const PyList& self, const py::object& other) -> bool {
                 if (!py::isinstance<PyList>(other)) {
                     return false;
                 }
                 return self == other.cast<const PyList&>();
             },
             py::arg("other"))

        .def("__ne__",
             [](const PyList& self, const py::object& other) -> bool {
                 if (!py::isinstance<PyList>(other)) {
                     return true;
                 }
                 return self != other.cast<const PyList&>();
             },
             py::arg("other"))

        .def("__hash__", &pyHash<PyList>)
        .def("__repr__", &listRepr)

        .def(py::pickle(
            [](const PyList& self) {
                py::list items;
                for (const auto& elem : self) {
                    items.append(elem);
                }
                return items;
            },
            [](const py::list& items) {
                return listFromObject(items);
            }));
}
