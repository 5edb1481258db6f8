/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef OBJECT_STORE_HPP
#define OBJECT_STORE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "collisions/AABB.hpp"
#include "collisions/CollisionPolicy.hpp"
#include "collisions/ObjectHandle.hpp"
#include "collisions/TagType.hpp"
#include "core/Logger.hpp"

namespace BumperEngine {

template<TagType Tag> class ObjectStore;

/**
 * @brief A simulated object: box, velocity, tag and an opaque render payload
 *
 * A body with no tag is dead. Dead bodies keep their slot until recycled.
 */
template<TagType Tag>
class Body {
public:
    const AABB& aabb() const { return m_aabb; }
    void setAABB(const AABB& aabb) { m_aabb = aabb; }

    const Vector2D& pos() const { return m_aabb.center; }
    void setPos(const Vector2D& p) { m_aabb.center = p; }

    const Vector2D& vel() const { return m_velocity; }
    void setVel(const Vector2D& v) { m_velocity = v; }

    const std::optional<Tag>& tag() const { return m_tag; }
    bool isAlive() const { return m_tag.has_value(); }

    // Renderer-facing data (sprite cel, texture id); never read by the engine
    uint64_t userData() const { return m_userData; }
    void setUserData(uint64_t data) { m_userData = data; }

private:
    friend class ObjectStore<Tag>;

    AABB m_aabb{};
    Vector2D m_velocity{};
    std::optional<Tag> m_tag{};
    uint64_t m_userData{0};
};

/**
 * @brief Three disjoint object groups addressed by (group, slot) handles
 *
 * Objects are placed by their declared CollisionPolicy: None into the
 * non-colliding group, Trigger into the trigger group, Colliding into the
 * physical group together with its CollisionFlags. Killing an object only
 * marks its slot dead, so handles held elsewhere stay cheap to re-validate.
 *
 * Usage:
 *   ObjectStore<MyTag> store;
 *   auto wall = store.create(MyTag::Wall, AABB(8, 120, 16, 240), CollisionPolicy::solid());
 *   if (auto* body = store.getMut(wall)) body->setVel({1.0f, 0.0f});
 */
template<TagType Tag>
class ObjectStore {
public:
    struct Slot {
        Body<Tag> body;
        CollisionFlags flags{}; // meaningful in the physical group only
    };

    ObjectStore() {
        for (auto& group : m_groups) {
            group.reserve(32);
        }
    }

    /**
     * @brief Appends a new object to the group selected by policy
     * @throws std::invalid_argument for an invalid policy or a negative size
     */
    ObjectHandle create(const Tag& tag, const AABB& aabb, const CollisionPolicy& policy,
                        uint64_t userData = 0) {
        checkCreation(tag, aabb, policy);
        auto& group = m_groups[groupIndex(policy.group())];
        group.push_back(makeSlot(tag, aabb, policy, userData));
        ++m_structuralChanges;
        return ObjectHandle(policy.group(), static_cast<uint32_t>(group.size() - 1));
    }

    /**
     * @brief Reuses the first dead slot of the policy's group, or appends
     * @throws std::invalid_argument for an invalid policy or a negative size
     */
    ObjectHandle recycle(const Tag& tag, const AABB& aabb, const CollisionPolicy& policy,
                         uint64_t userData = 0) {
        checkCreation(tag, aabb, policy);
        auto& group = m_groups[groupIndex(policy.group())];
        for (size_t i = 0; i < group.size(); ++i) {
            if (!group[i].body.isAlive()) {
                group[i] = makeSlot(tag, aabb, policy, userData);
                ++m_structuralChanges;
                return ObjectHandle(policy.group(), static_cast<uint32_t>(i));
            }
        }
        return create(tag, aabb, policy, userData);
    }

    /**
     * @brief Marks the slot dead: zero box and velocity, no tag
     * @return false when the handle is out of range or already dead
     */
    bool kill(const ObjectHandle& handle) {
        Slot* slot = findSlot(handle);
        if (slot == nullptr) {
            OBJECTSTORE_WARN(std::format("kill() on unknown handle {}#{}",
                                         static_cast<int>(handle.group), handle.index));
            return false;
        }
        if (!slot->body.isAlive()) {
            return false;
        }
        slot->body = Body<Tag>{};
        slot->flags = CollisionFlags{};
        ++m_structuralChanges;
        return true;
    }

    // Null for dead or out-of-range handles
    const Body<Tag>* get(const ObjectHandle& handle) const {
        const Slot* slot = findSlot(handle);
        return (slot && slot->body.isAlive()) ? &slot->body : nullptr;
    }

    Body<Tag>* getMut(const ObjectHandle& handle) {
        Slot* slot = findSlot(handle);
        return (slot && slot->body.isAlive()) ? &slot->body : nullptr;
    }

    /**
     * @brief Checked access for code that must not touch a dead object
     * @throws std::out_of_range when the handle is unknown or dead
     */
    Body<Tag>& at(const ObjectHandle& handle) {
        Body<Tag>* body = getMut(handle);
        if (body == nullptr) {
            std::string message = std::format(
                "Access to dead or unknown object (group {}, slot {}, {} slots in group)",
                static_cast<int>(handle.group), handle.index,
                groupIndex(handle.group) < m_groups.size()
                    ? m_groups[groupIndex(handle.group)].size() : 0);
            OBJECTSTORE_ERROR(message);
            throw std::out_of_range(message);
        }
        return *body;
    }

    const Body<Tag>& at(const ObjectHandle& handle) const {
        return const_cast<ObjectStore*>(this)->at(handle);
    }

    bool isAlive(const ObjectHandle& handle) const { return get(handle) != nullptr; }

    // Flags of a live physical object
    std::optional<CollisionFlags> flags(const ObjectHandle& handle) const {
        if (handle.group != ObjectGroup::Physical) return std::nullopt;
        const Slot* slot = findSlot(handle);
        if (slot == nullptr || !slot->body.isAlive()) return std::nullopt;
        return slot->flags;
    }

    /**
     * @brief Visits every live object, group by group
     *
     * fn(ObjectHandle, Body<Tag>&) may kill, recycle or create objects; the
     * slot count and liveness are re-read for every slot.
     */
    template<typename Fn>
    void forEachLive(Fn&& fn) {
        for (uint8_t g = 0; g < OBJECT_GROUP_COUNT; ++g) {
            forEachLiveIn(static_cast<ObjectGroup>(g), fn);
        }
    }

    template<typename Fn>
    void forEachLiveIn(ObjectGroup group, Fn&& fn) {
        auto& slots = m_groups[groupIndex(group)];
        for (size_t i = 0; i < slots.size(); ++i) {
            if (slots[i].body.isAlive()) {
                fn(ObjectHandle(group, static_cast<uint32_t>(i)), slots[i].body);
            }
        }
    }

    template<typename Fn>
    void forEachLive(Fn&& fn) const {
        for (uint8_t g = 0; g < OBJECT_GROUP_COUNT; ++g) {
            const auto& slots = m_groups[g];
            for (size_t i = 0; i < slots.size(); ++i) {
                if (slots[i].body.isAlive()) {
                    fn(ObjectHandle(static_cast<ObjectGroup>(g), static_cast<uint32_t>(i)),
                       slots[i].body);
                }
            }
        }
    }

    template<typename Fn>
    void forEachWithTag(const Tag& tag, Fn&& fn) {
        forEachLive([&](const ObjectHandle& handle, Body<Tag>& body) {
            if (body.tag() == tag) {
                fn(handle, body);
            }
        });
    }

    // Snapshot of matching handles; safe to kill while walking it
    std::vector<ObjectHandle> handlesWithTag(const Tag& tag) const {
        std::vector<ObjectHandle> out;
        forEachLive([&](const ObjectHandle& handle, const Body<Tag>& body) {
            if (body.tag() == tag) {
                out.push_back(handle);
            }
        });
        return out;
    }

    size_t countWithTag(const Tag& tag) const {
        size_t count = 0;
        forEachLive([&](const ObjectHandle&, const Body<Tag>& body) {
            if (body.tag() == tag) ++count;
        });
        return count;
    }

    size_t liveCount(ObjectGroup group) const {
        size_t count = 0;
        for (const auto& slot : m_groups[groupIndex(group)]) {
            if (slot.body.isAlive()) ++count;
        }
        return count;
    }

    size_t liveCount() const {
        size_t count = 0;
        for (uint8_t g = 0; g < OBJECT_GROUP_COUNT; ++g) {
            count += liveCount(static_cast<ObjectGroup>(g));
        }
        return count;
    }

    size_t slotCount(ObjectGroup group) const { return m_groups[groupIndex(group)].size(); }

    // Raw slot access for the collision pipeline
    std::vector<Slot>& slots(ObjectGroup group) { return m_groups[groupIndex(group)]; }
    const std::vector<Slot>& slots(ObjectGroup group) const { return m_groups[groupIndex(group)]; }

    // Bumped by every create, recycle and kill
    uint64_t structuralChanges() const { return m_structuralChanges; }

    void clear() {
        for (auto& group : m_groups) {
            group.clear();
        }
        ++m_structuralChanges;
    }

private:
    static size_t groupIndex(ObjectGroup group) { return static_cast<size_t>(group); }

    static Slot makeSlot(const Tag& tag, const AABB& aabb, const CollisionPolicy& policy,
                         uint64_t userData) {
        Slot slot;
        slot.body.m_aabb = aabb;
        slot.body.m_tag = tag;
        slot.body.m_userData = userData;
        slot.flags = policy.isColliding() ? policy.flags() : CollisionFlags{};
        return slot;
    }

    void checkCreation(const Tag& tag, const AABB& aabb, const CollisionPolicy& policy) const {
        if (!policy.isValid()) {
            std::string message = std::format(
                "Refusing to create {}: colliding flags 0x{:02x} must be SOLID, PUSHABLE or both",
                describeTag(tag), policy.flags().bits());
            OBJECTSTORE_ERROR(message);
            throw std::invalid_argument(message);
        }
        if (aabb.size.getX() < 0.0f || aabb.size.getY() < 0.0f) {
            std::string message = std::format(
                "Refusing to create {}: negative box size ({}, {})",
                describeTag(tag), aabb.size.getX(), aabb.size.getY());
            OBJECTSTORE_ERROR(message);
            throw std::invalid_argument(message);
        }
    }

    Slot* findSlot(const ObjectHandle& handle) {
        size_t g = groupIndex(handle.group);
        if (g >= m_groups.size() || handle.index >= m_groups[g].size()) {
            return nullptr;
        }
        return &m_groups[g][handle.index];
    }

    const Slot* findSlot(const ObjectHandle& handle) const {
        return const_cast<ObjectStore*>(this)->findSlot(handle);
    }

    std::array<std::vector<Slot>, OBJECT_GROUP_COUNT> m_groups;
    uint64_t m_structuralChanges{0};
};

} // namespace BumperEngine

#endif // OBJECT_STORE_HPP
