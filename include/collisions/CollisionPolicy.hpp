/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_POLICY_HPP
#define COLLISION_POLICY_HPP

#include <cstdint>
#include <ostream>

namespace BumperEngine {

// Disjoint object stores; the value is the group byte of an ObjectHandle
enum class ObjectGroup : uint8_t {
    NonColliding = 0, // rendered, never tested
    Trigger = 1,      // reports overlaps, never displaced
    Physical = 2      // resolved against other physical objects
};

inline constexpr uint8_t OBJECT_GROUP_COUNT = 3;

std::ostream& operator<<(std::ostream& os, ObjectGroup group);

// SOLID/PUSHABLE bitset carried by every physical object
class CollisionFlags {
public:
    static constexpr uint8_t PUSHABLE = 0b01;
    static constexpr uint8_t SOLID = 0b10;
    static constexpr uint8_t ALL = PUSHABLE | SOLID;

    constexpr CollisionFlags() = default;
    constexpr explicit CollisionFlags(uint8_t bits) : m_bits(bits) {}

    constexpr uint8_t bits() const { return m_bits; }
    constexpr bool isSolid() const { return (m_bits & SOLID) == SOLID; }
    constexpr bool isPushable() const { return (m_bits & PUSHABLE) == PUSHABLE; }
    constexpr bool isPushableSolid() const { return (m_bits & ALL) == ALL; }

    // At least one bit set and nothing outside SOLID|PUSHABLE
    constexpr bool isValid() const { return m_bits != 0 && (m_bits & ~ALL) == 0; }

    constexpr bool operator==(const CollisionFlags&) const = default;

private:
    uint8_t m_bits{0};
};

/**
 * @brief Declared collision participation of an object
 *
 * None and Trigger carry no flags. Colliding must carry a valid
 * CollisionFlags value; validate() throws std::invalid_argument otherwise.
 */
class CollisionPolicy {
public:
    enum class Kind : uint8_t { None = 0, Trigger, Colliding };

    static CollisionPolicy none() { return CollisionPolicy(Kind::None, CollisionFlags{}); }
    static CollisionPolicy trigger() { return CollisionPolicy(Kind::Trigger, CollisionFlags{}); }
    static CollisionPolicy solid() {
        return CollisionPolicy(Kind::Colliding, CollisionFlags(CollisionFlags::SOLID));
    }
    static CollisionPolicy pushable() {
        return CollisionPolicy(Kind::Colliding, CollisionFlags(CollisionFlags::PUSHABLE));
    }
    static CollisionPolicy pushableSolid() {
        return CollisionPolicy(Kind::Colliding, CollisionFlags(CollisionFlags::ALL));
    }
    static CollisionPolicy colliding(CollisionFlags flags) {
        return CollisionPolicy(Kind::Colliding, flags);
    }

    Kind kind() const { return m_kind; }
    CollisionFlags flags() const { return m_flags; }
    ObjectGroup group() const;

    bool isNone() const { return m_kind == Kind::None; }
    bool isTrigger() const { return m_kind == Kind::Trigger; }
    bool isColliding() const { return m_kind == Kind::Colliding; }
    bool isSolid() const { return isColliding() && m_flags.isSolid(); }
    bool isPushable() const { return isColliding() && m_flags.isPushable(); }
    bool isPushableSolid() const { return isColliding() && m_flags.isPushableSolid(); }

    bool isValid() const;
    void validate() const;

    bool operator==(const CollisionPolicy&) const = default;

private:
    CollisionPolicy(Kind kind, CollisionFlags flags) : m_kind(kind), m_flags(flags) {}

    Kind m_kind{Kind::None};
    CollisionFlags m_flags{};
};

} // namespace BumperEngine

#endif // COLLISION_POLICY_HPP
