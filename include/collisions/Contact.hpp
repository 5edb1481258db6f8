/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONTACT_HPP
#define CONTACT_HPP

#include "collisions/ObjectHandle.hpp"
#include "collisions/TagType.hpp"
#include "utils/Vector2D.hpp"

namespace BumperEngine {

/**
 * @brief One overlap reported to game code
 *
 * Displacement contacts: amount is how far a moved to get clear of b and
 * otherAmount how far b moved; each is a single-axis vector, zero for an
 * object that was not pushed.
 * Trigger contacts: amount is the per-axis overlap, otherAmount is zero.
 */
template<TagType Tag>
struct Contact {
    ObjectHandle a;
    Tag tagA;
    ObjectHandle b;
    Tag tagB;
    Vector2D amount;
    Vector2D otherAmount;
};

} // namespace BumperEngine

#endif // CONTACT_HPP
