#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace rpds {

// Constants for HAMT structure
constexpr uint32_t HASH_BITS = 5;
constexpr uint32_t HASH_MASK = (1 << HASH_BITS) - 1;  // 0b11111
constexpr uint32_t HASH_WIDTH = 64;                   // bits in a key hash

// Utility functions for popcount (bit counting)
#if defined(__GNUC__) || defined(__clang__)
    inline uint32_t popcount(uint32_t x) {
        return static_cast<uint32_t>(__builtin_popcount(x));
    }
#else
    // Fallback implementation
    inline uint32_t popcount(uint32_t x) {
        x = x - ((x >> 1) & 0x55555555);
        x = (x & 0x33333333) + ((x >> 2) & 0x33333333);
        return (((x + (x >> 4)) & 0x0F0F0F0F) * 0x01010101) >> 24;
    }
#endif

// Slot bit for the hash chunk at the given shift. Only valid for shift < HASH_WIDTH.
inline uint32_t bitpos(uint64_t hash, uint32_t shift) {
    return 1u << static_cast<uint32_t>((hash >> shift) & HASH_MASK);
}

namespace hashutils {
    constexpr uint64_t SEED = 0x9e3779b97f4a7c15ULL;

    // splitmix64 finalizer
    inline uint64_t mix(uint64_t x) {
        x ^= x >> 30;
        x *= 0xbf58476d1ce4e5b9ULL;
        x ^= x >> 27;
        x *= 0x94d049bb133111ebULL;
        x ^= x >> 31;
        return x;
    }

    // Order-dependent combination of two hashes
    inline uint64_t combine(uint64_t seed, uint64_t h) {
        return mix(seed ^ (h + SEED + (seed << 6) + (seed >> 2)));
    }

    // FNV-1a over raw bytes
    inline uint64_t bytes(const void* data, size_t len) {
        const auto* p = static_cast<const unsigned char*>(data);
        uint64_t h = 0xcbf29ce484222325ULL;
        for (size_t i = 0; i < len; ++i) {
            h ^= p[i];
            h *= 0x100000001b3ULL;
        }
        return mix(h);
    }
}

template <typename>
struct always_false : std::false_type {};

/**
 * Hasher - deterministic 64-bit hash for a key type
 *
 * Specialized below for scalars, strings and the standard sequence/product
 * types (recursively), and for any type exposing `uint64_t hash() const`,
 * which is how the rpds containers nest inside each other as keys.
 */
template <typename T, typename Enable = void>
struct Hasher {
    static_assert(always_false<T>::value, "rpds::Hasher has no specialization for this key type");
};

template <typename T>
struct Hasher<T, std::enable_if_t<std::is_integral_v<T> || std::is_enum_v<T>>> {
    uint64_t operator()(T value) const {
        return hashutils::mix(static_cast<uint64_t>(value));
    }
};

template <typename T>
struct Hasher<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    uint64_t operator()(T value) const {
        double d = (value == 0) ? 0.0 : static_cast<double>(value);  // -0.0 == 0.0
        uint64_t bits;
        std::memcpy(&bits, &d, sizeof(bits));
        return hashutils::mix(bits);
    }
};

template <>
struct Hasher<std::string_view> {
    uint64_t operator()(std::string_view s) const {
        return hashutils::bytes(s.data(), s.size());
    }
};

template <>
struct Hasher<std::string> {
    uint64_t operator()(const std::string& s) const {
        return hashutils::bytes(s.data(), s.size());
    }
};

template <>
struct Hasher<const char*> {
    uint64_t operator()(const char* s) const {
        return hashutils::bytes(s, std::strlen(s));
    }
};

template <typename T>
struct Hasher<T, std::void_t<decltype(std::declval<const T&>().hash())>> {
    uint64_t operator()(const T& value) const {
        return static_cast<uint64_t>(value.hash());
    }
};

template <typename A, typename B>
struct Hasher<std::pair<A, B>> {
    uint64_t operator()(const std::pair<A, B>& p) const {
        uint64_t h = hashutils::combine(hashutils::SEED, Hasher<A>{}(p.first));
        return hashutils::combine(h, Hasher<B>{}(p.second));
    }
};

template <typename... Ts>
struct Hasher<std::tuple<Ts...>> {
    uint64_t operator()(const std::tuple<Ts...>& t) const {
        uint64_t h = hashutils::combine(hashutils::SEED, sizeof...(Ts));
        std::apply([&h](const Ts&... elems) {
            ((h = hashutils::combine(h, Hasher<Ts>{}(elems))), ...);
        }, t);
        return h;
    }
};

template <typename T, typename Alloc>
struct Hasher<std::vector<T, Alloc>> {
    uint64_t operator()(const std::vector<T, Alloc>& v) const {
        uint64_t h = hashutils::combine(hashutils::SEED, v.size());
        for (const auto& elem : v) {
            h = hashutils::combine(h, Hasher<T>{}(elem));
        }
        return h;
    }
};

template <typename T, size_t N>
struct Hasher<std::array<T, N>> {
    uint64_t operator()(const std::array<T, N>& a) const {
        uint64_t h = hashutils::combine(hashutils::SEED, N);
        for (const auto& elem : a) {
            h = hashutils::combine(h, Hasher<T>{}(elem));
        }
        return h;
    }
};

template <typename T>
struct Hasher<std::optional<T>> {
    uint64_t operator()(const std::optional<T>& o) const {
        return o ? hashutils::combine(hashutils::SEED, Hasher<T>{}(*o)) : hashutils::SEED;
    }
};

template <typename... Ts>
struct Hasher<std::variant<Ts...>> {
    uint64_t operator()(const std::variant<Ts...>& v) const {
        uint64_t h = std::visit([](const auto& alt) {
            return Hasher<std::decay_t<decltype(alt)>>{}(alt);
        }, v);
        return hashutils::combine(v.index(), h);
    }
};

// Key equality consistent with Hasher
template <typename T>
struct Equal {
    bool operator()(const T& a, const T& b) const {
        return a == b;
    }
};

}  // namespace rpds
