/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/CollisionPolicy.hpp"
#include "core/Logger.hpp"
#include <format>
#include <stdexcept>

namespace BumperEngine {

std::ostream& operator<<(std::ostream& os, ObjectGroup group) {
    switch (group) {
    case ObjectGroup::NonColliding:
        return os << "NonColliding";
    case ObjectGroup::Trigger:
        return os << "Trigger";
    case ObjectGroup::Physical:
        return os << "Physical";
    }
    return os << "Unknown";
}

ObjectGroup CollisionPolicy::group() const {
    switch (m_kind) {
    case Kind::Trigger:
        return ObjectGroup::Trigger;
    case Kind::Colliding:
        return ObjectGroup::Physical;
    case Kind::None:
    default:
        return ObjectGroup::NonColliding;
    }
}

bool CollisionPolicy::isValid() const {
    return m_kind != Kind::Colliding || m_flags.isValid();
}

void CollisionPolicy::validate() const {
    if (isValid()) {
        return;
    }
    std::string message;
    if (m_flags.bits() == 0) {
        message = "Colliding policy must be SOLID, PUSHABLE or both (flags=0x00)";
    } else {
        message = std::format("Invalid colliding mask 0x{:02x}", m_flags.bits());
    }
    OBJECTSTORE_ERROR(message);
    throw std::invalid_argument(message);
}

} // namespace BumperEngine
