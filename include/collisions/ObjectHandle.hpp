/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef OBJECT_HANDLE_HPP
#define OBJECT_HANDLE_HPP

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include "collisions/CollisionPolicy.hpp"

namespace BumperEngine {

// (group, slot) address of an object; stable until the slot is killed
struct ObjectHandle {
    ObjectGroup group{ObjectGroup::NonColliding};
    uint32_t index{0};

    constexpr ObjectHandle() = default;
    constexpr ObjectHandle(ObjectGroup g, uint32_t i) : group(g), index(i) {}

    // Packed key, ordered by group then slot
    constexpr uint64_t key() const {
        return (static_cast<uint64_t>(group) << 32) | index;
    }

    constexpr bool operator==(const ObjectHandle&) const = default;
    constexpr auto operator<=>(const ObjectHandle& other) const {
        return key() <=> other.key();
    }
};

inline std::ostream& operator<<(std::ostream& os, const ObjectHandle& handle) {
    return os << handle.group << '#' << handle.index;
}

struct ObjectHandleHash {
    size_t operator()(const ObjectHandle& h) const noexcept {
        return std::hash<uint64_t>{}(h.key());
    }
};

} // namespace BumperEngine

#endif // OBJECT_HANDLE_HPP
