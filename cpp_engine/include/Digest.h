#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

namespace scout {

// FNV-1a32 helpers shared by config blocks and state digests.
inline std::uint32_t fnv1a32_update(std::uint32_t h, const void* data, std::size_t len) {
    const std::uint8_t* p = reinterpret_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<std::uint32_t>(p[i]);
        h *= 16777619u;
    }
    return h;
}

inline std::uint32_t fnv1a32_begin() { return 2166136261u; }

inline std::uint32_t fnv1a32_add_u32(std::uint32_t h, std::uint32_t v) {
    return fnv1a32_update(h, &v, sizeof(v));
}
inline std::uint32_t fnv1a32_add_i32(std::uint32_t h, std::int32_t v) {
    return fnv1a32_update(h, &v, sizeof(v));
}
inline std::uint32_t fnv1a32_add_i64(std::uint32_t h, std::int64_t v) {
    return fnv1a32_update(h, &v, sizeof(v));
}
inline std::uint32_t fnv1a32_add_f64(std::uint32_t h, double v) {
    std::uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(v), "unexpected double size");
    std::memcpy(&bits, &v, sizeof(v));
    return fnv1a32_update(h, &bits, sizeof(bits));
}
inline std::uint32_t fnv1a32_add_str(std::uint32_t h, const std::string& s) {
    h = fnv1a32_add_u32(h, static_cast<std::uint32_t>(s.size()));
    return fnv1a32_update(h, s.data(), s.size());
}

} // namespace scout
