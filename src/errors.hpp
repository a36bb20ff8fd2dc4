#pragma once

#include <stdexcept>
#include <string>

namespace rpds {

// Raised by remove()/at() when the key is absent
class KeyNotFound : public std::out_of_range {
public:
    explicit KeyNotFound(const std::string& what = "key not found")
        : std::out_of_range(what) {}
};

// Raised by first()/rest() on an empty List
class EmptyCollectionAccess : public std::out_of_range {
public:
    explicit EmptyCollectionAccess(const std::string& what)
        : std::out_of_range(what) {}
};

// Raised when a key cannot produce a hash
class UnhashableValue : public std::invalid_argument {
public:
    explicit UnhashableValue(const std::string& what)
        : std::invalid_argument(what) {}
};

}  // namespace rpds
