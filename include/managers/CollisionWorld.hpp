/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_WORLD_HPP
#define COLLISION_WORLD_HPP

/* CollisionWorld owns the objects of a game and runs the per-tick collision
 * pipeline over them:
 *
 *   Integrate -> IndexUpdate -> Resolve -> VelocityClamp -> GatherTriggers
 *             -> Dispatch -> IndexOptimize -> ClearBuffers
 *
 * Resolve runs a fixed number of passes. Each pass regenerates physical
 * contacts from the current positions, sorts them deepest first and pushes
 * pushable objects out of solid ones. Triggers are gathered afterwards from
 * the resolved positions and never move anything.
 *
 * The broad phase is a SpatialGrid above bruteForceThreshold indexed objects
 * and a plain all-pairs loop below it. Both paths feed the same exact overlap
 * test and produce the same contact sequence.
 */

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <format>
#include <initializer_list>
#include <span>
#include <string_view>
#include <utility>
#include <vector>
#include <boost/container/small_vector.hpp>

#include "collisions/AABB.hpp"
#include "collisions/CollisionPolicy.hpp"
#include "collisions/CollisionSettings.hpp"
#include "collisions/Contact.hpp"
#include "collisions/ContactBuffer.hpp"
#include "collisions/ContactResolver.hpp"
#include "collisions/ObjectHandle.hpp"
#include "collisions/ObjectStore.hpp"
#include "collisions/SpatialGrid.hpp"
#include "collisions/TagType.hpp"
#include "core/Logger.hpp"

namespace BumperEngine {

template<TagType Tag> class CollisionWorld;

/**
 * @brief Game-side receiver of the per-tick contact streams
 *
 * The spans are only valid for the duration of the call. Handlers may kill,
 * recycle, create or move objects through the world; the contacts already
 * delivered keep their handles, so re-check liveness before touching one.
 */
template<TagType Tag>
class ContactListener {
public:
    virtual ~ContactListener() = default;

    // Displacement contacts, larger-or-equal tag first
    virtual void handleDisplacements(CollisionWorld<Tag>& world,
                                     std::span<const Contact<Tag>> contacts) = 0;

    // Trigger contacts, smaller-or-equal tag first
    virtual void handleTriggers(CollisionWorld<Tag>& world,
                                std::span<const Contact<Tag>> contacts) = 0;
};

enum class TickPhase : uint8_t {
    Idle,
    Integrate,
    IndexUpdate,
    Resolve,
    VelocityClamp,
    GatherTriggers,
    Dispatch,
    IndexOptimize,
    ClearBuffers
};

inline std::string_view tickPhaseName(TickPhase phase) {
    switch (phase) {
        case TickPhase::Idle: return "Idle";
        case TickPhase::Integrate: return "Integrate";
        case TickPhase::IndexUpdate: return "IndexUpdate";
        case TickPhase::Resolve: return "Resolve";
        case TickPhase::VelocityClamp: return "VelocityClamp";
        case TickPhase::GatherTriggers: return "GatherTriggers";
        case TickPhase::Dispatch: return "Dispatch";
        case TickPhase::IndexOptimize: return "IndexOptimize";
        case TickPhase::ClearBuffers: return "ClearBuffers";
    }
    return "Unknown";
}

// What the last step() did
struct TickStats {
    uint64_t tick{0};
    size_t iterationsRun{0};
    boost::container::small_vector<size_t, 8> contactsPerPass; // queued physical contacts
    size_t displacementContacts{0};
    size_t triggerContacts{0};
    size_t physicalCandidates{0};
    size_t triggerCandidates{0};
    bool usedGrid{false};
    bool rebuiltGrid{false};
    size_t reclaimedSlots{0};
};

template<TagType Tag>
class CollisionWorld {
public:
    using BodyType = Body<Tag>;
    using ContactType = Contact<Tag>;
    using Listener = ContactListener<Tag>;

    explicit CollisionWorld(const CollisionSettings& settings = CollisionSettings{})
        : m_settings(settings)
        , m_grid(settings.fineCellSize, settings.coarseCellFactor)
        , m_queue(ContactOrder::LargerTagFirst)
        , m_displacements(ContactOrder::LargerTagFirst)
        , m_triggers(ContactOrder::SmallerTagFirst) {
        m_settings.validate();
        m_candidates.reserve(128);
        COLLISION_INFO(std::format("CollisionWorld created (cells {}/{}, {} iterations)",
                                   m_settings.fineCellSize,
                                   m_settings.fineCellSize * static_cast<float>(m_settings.coarseCellFactor),
                                   m_settings.iterations));
    }

    // ---- Objects ----

    ObjectHandle create(const Tag& tag, const AABB& aabb, const CollisionPolicy& policy,
                        uint64_t userData = 0) {
        return m_store.create(tag, aabb, policy, userData);
    }
    ObjectHandle recycle(const Tag& tag, const AABB& aabb, const CollisionPolicy& policy,
                         uint64_t userData = 0) {
        return m_store.recycle(tag, aabb, policy, userData);
    }
    bool kill(const ObjectHandle& handle) { return m_store.kill(handle); }

    const BodyType* get(const ObjectHandle& handle) const { return m_store.get(handle); }
    BodyType* getMut(const ObjectHandle& handle) { return m_store.getMut(handle); }
    BodyType& at(const ObjectHandle& handle) { return m_store.at(handle); }
    const BodyType& at(const ObjectHandle& handle) const { return m_store.at(handle); }
    bool isAlive(const ObjectHandle& handle) const { return m_store.isAlive(handle); }

    template<typename Fn>
    void forEachLive(Fn&& fn) { m_store.forEachLive(std::forward<Fn>(fn)); }

    template<typename Fn>
    void forEachWithTag(const Tag& tag, Fn&& fn) { m_store.forEachWithTag(tag, std::forward<Fn>(fn)); }

    std::vector<ObjectHandle> handlesWithTag(const Tag& tag) const { return m_store.handlesWithTag(tag); }

    ObjectStore<Tag>& store() { return m_store; }
    const ObjectStore<Tag>& store() const { return m_store; }
    const SpatialGrid& grid() const { return m_grid; }

    // ---- Simulation ----

    /**
     * @brief Runs one fixed simulation step
     * @param dt step length in seconds; velocities are units per second
     * @param listener receives both contact streams during Dispatch
     */
    void step(float dt, Listener& listener) { runTick(dt, &listener); }

    // Step without anyone listening; contacts are still generated and cleared
    void step(float dt) { runTick(dt, nullptr); }

    TickPhase currentPhase() const { return m_phase; }
    const TickStats& lastTickStats() const { return m_lastStats; }
    uint64_t getTickCount() const { return m_tickCount; }

    // Objects that take part in overlap tests (trigger and physical groups)
    size_t getIndexedCount() const {
        return m_store.liveCount(ObjectGroup::Trigger) + m_store.liveCount(ObjectGroup::Physical);
    }

    // Sorted live handles whose box overlaps area, trigger and physical groups only
    void queryArea(const AABB& area, std::vector<ObjectHandle>& out) const {
        out.clear();
        for (ObjectGroup group : {ObjectGroup::Trigger, ObjectGroup::Physical}) {
            const auto& slots = m_store.slots(group);
            for (size_t i = 0; i < slots.size(); ++i) {
                if (slots[i].body.isAlive() && overlap(slots[i].body.aabb(), area)) {
                    out.emplace_back(group, static_cast<uint32_t>(i));
                }
            }
        }
    }

    // ---- Configuration ----

    const CollisionSettings& getSettings() const { return m_settings; }

    /**
     * @brief Replaces every setting at once
     * @throws std::invalid_argument if settings.validate() fails; nothing changes then
     */
    void applySettings(const CollisionSettings& settings) {
        settings.validate();
        bool cellsChanged = settings.fineCellSize != m_settings.fineCellSize ||
                            settings.coarseCellFactor != m_settings.coarseCellFactor;
        m_settings = settings;
        if (cellsChanged) {
            m_grid.configure(m_settings.fineCellSize, m_settings.coarseCellFactor);
            m_gridValid = false;
        }
    }

    void setIterations(size_t iterations) {
        CollisionSettings next = m_settings;
        next.iterations = iterations;
        applySettings(next);
    }
    size_t getIterations() const { return m_settings.iterations; }

    void setOverlapEpsilon(float epsilon) {
        CollisionSettings next = m_settings;
        next.overlapEpsilon = epsilon;
        applySettings(next);
    }
    float getOverlapEpsilon() const { return m_settings.overlapEpsilon; }

    void setCellSizes(float fineCellSize, int32_t coarseFactor) {
        CollisionSettings next = m_settings;
        next.fineCellSize = fineCellSize;
        next.coarseCellFactor = coarseFactor;
        applySettings(next);
    }

    void setBruteForceThreshold(size_t count) { m_settings.bruteForceThreshold = count; }
    size_t getBruteForceThreshold() const { return m_settings.bruteForceThreshold; }

    void setShrinkInterval(size_t ticks) { m_settings.shrinkInterval = ticks; }
    size_t getShrinkInterval() const { return m_settings.shrinkInterval; }

    void logCollisionStatistics() const {
        COLLISION_INFO("Collision Statistics:");
        COLLISION_INFO(std::format("  Objects: {} non-colliding, {} triggers, {} physical",
                                   m_store.liveCount(ObjectGroup::NonColliding),
                                   m_store.liveCount(ObjectGroup::Trigger),
                                   m_store.liveCount(ObjectGroup::Physical)));
        COLLISION_INFO(std::format("  Last tick {}: {} passes, {} displacements, {} triggers ({})",
                                   m_lastStats.tick, m_lastStats.iterationsRun,
                                   m_lastStats.displacementContacts, m_lastStats.triggerContacts,
                                   m_lastStats.usedGrid ? "grid" : "all pairs"));
        if (m_lastStats.usedGrid) {
            m_grid.logStatistics();
        }
    }

private:
    using CandidatePair = SpatialGrid::CandidatePair;

    void runTick(float dt, Listener* listener) {
        m_lastStats = TickStats{};
        m_lastStats.tick = ++m_tickCount;
        clearBuffers();

        m_phase = TickPhase::Integrate;
        integrate(dt);

        m_phase = TickPhase::IndexUpdate;
        updateIndex();

        m_phase = TickPhase::Resolve;
        resolve();

        m_phase = TickPhase::VelocityClamp;
        clampVelocities();

        m_phase = TickPhase::GatherTriggers;
        gatherTriggers();

        m_phase = TickPhase::Dispatch;
        m_lastStats.displacementContacts = m_displacements.size();
        m_lastStats.triggerContacts = m_triggers.size();
        if (listener != nullptr) {
            listener->handleDisplacements(*this, m_displacements.view());
            listener->handleTriggers(*this, m_triggers.view());
        }

        m_phase = TickPhase::IndexOptimize;
        optimizeIndex();

        m_phase = TickPhase::ClearBuffers;
        clearBuffers();

        m_phase = TickPhase::Idle;
    }

    void integrate(float dt) {
        m_store.forEachLive([dt](const ObjectHandle&, BodyType& body) {
            if (!body.vel().isZero()) {
                body.setPos(body.pos() + body.vel() * dt);
            }
        });
    }

    static SpatialGrid::BodyClass bodyClassOf(ObjectGroup group) {
        return group == ObjectGroup::Trigger ? SpatialGrid::BodyClass::Trigger
                                             : SpatialGrid::BodyClass::Physical;
    }

    void updateIndex() {
        size_t indexed = getIndexedCount();
        uint64_t changes = m_store.structuralChanges() - m_lastStructuralChanges;
        m_lastStructuralChanges = m_store.structuralChanges();

        m_useGrid = indexed > m_settings.bruteForceThreshold;
        m_lastStats.usedGrid = m_useGrid;
        if (!m_useGrid) {
            if (m_gridValid) {
                m_grid.clear();
                m_gridValid = false;
            }
            return;
        }

        if (!m_gridValid ||
            static_cast<float>(changes) > m_settings.rebuildFraction * static_cast<float>(indexed)) {
            rebuildGrid();
            return;
        }

        // Incremental: refresh live objects, drop the dead
        for (ObjectGroup group : {ObjectGroup::Trigger, ObjectGroup::Physical}) {
            auto& slots = m_store.slots(group);
            for (size_t i = 0; i < slots.size(); ++i) {
                ObjectHandle handle(group, static_cast<uint32_t>(i));
                if (slots[i].body.isAlive()) {
                    m_grid.update(handle, slots[i].body.aabb(), bodyClassOf(group));
                } else if (m_grid.contains(handle)) {
                    m_grid.remove(handle);
                }
            }
        }
    }

    void rebuildGrid() {
        m_gridItems.clear();
        for (ObjectGroup group : {ObjectGroup::Trigger, ObjectGroup::Physical}) {
            const auto& slots = m_store.slots(group);
            for (size_t i = 0; i < slots.size(); ++i) {
                if (slots[i].body.isAlive()) {
                    m_gridItems.push_back(SpatialGrid::Item{ObjectHandle(group, static_cast<uint32_t>(i)),
                                                            slots[i].body.aabb(), bodyClassOf(group)});
                }
            }
        }
        m_grid.rebuild(m_gridItems);
        m_gridValid = true;
        m_lastStats.rebuiltGrid = true;
        COLLISION_DEBUG(std::format("Rebuilt broad phase: {} objects in {} fine cells",
                                    m_grid.getObjectCount(), m_grid.getFineCellCount()));
    }

    // Candidate pairs in handle order from whichever broad phase is active
    void collectCandidates(SpatialGrid::PairKind kind, std::vector<CandidatePair>& out) {
        if (m_useGrid) {
            m_grid.collectPairs(kind, out);
            return;
        }

        out.clear();
        m_liveHandles.clear();
        for (ObjectGroup group : {ObjectGroup::Trigger, ObjectGroup::Physical}) {
            const auto& slots = m_store.slots(group);
            for (size_t i = 0; i < slots.size(); ++i) {
                if (slots[i].body.isAlive()) {
                    m_liveHandles.emplace_back(group, static_cast<uint32_t>(i));
                }
            }
        }
        for (size_t i = 0; i < m_liveHandles.size(); ++i) {
            for (size_t j = i + 1; j < m_liveHandles.size(); ++j) {
                bool bothPhysical = m_liveHandles[i].group == ObjectGroup::Physical &&
                                    m_liveHandles[j].group == ObjectGroup::Physical;
                if (bothPhysical == (kind == SpatialGrid::PairKind::Physical)) {
                    out.emplace_back(m_liveHandles[i], m_liveHandles[j]);
                }
            }
        }
    }

    void resolve() {
        for (size_t pass = 0; pass < m_settings.iterations; ++pass) {
            m_queue.clear();
            collectCandidates(SpatialGrid::PairKind::Physical, m_candidates);
            m_lastStats.physicalCandidates += m_candidates.size();

            for (const auto& [h1, h2] : m_candidates) {
                const BodyType* b1 = m_store.get(h1);
                const BodyType* b2 = m_store.get(h2);
                auto f1 = m_store.flags(h1);
                auto f2 = m_store.flags(h2);
                if (!b1 || !b2 || !f1 || !f2 || !ContactResolver::canResolve(*f1, *f2)) {
                    continue; // dead, or a pair that can never move
                }
                if (auto amount = overlap(b1->aabb(), b2->aabb())) {
                    m_queue.push(h1, *b1->tag(), h2, *b2->tag(), *amount, Vector2D());
                }
            }

            m_lastStats.contactsPerPass.push_back(m_queue.size());
            if (m_queue.empty()) {
                break;
            }
            ++m_lastStats.iterationsRun;
            m_queue.sortByPenetration();

            m_moved.clear();
            for (const ContactType& contact : m_queue) {
                BodyType* a = m_store.getMut(contact.a);
                BodyType* b = m_store.getMut(contact.b);
                if (!a || !b) {
                    continue;
                }
                // Earlier contacts of this pass may have moved either box
                auto displacement = ContactResolver::resolve(a->aabb(), *m_store.flags(contact.a),
                                                             b->aabb(), *m_store.flags(contact.b),
                                                             m_settings.overlapEpsilon);
                if (!displacement) {
                    continue;
                }
                if (!displacement->a.isZero()) {
                    a->setPos(a->pos() + displacement->a);
                    m_moved.push_back(contact.a);
                }
                if (!displacement->b.isZero()) {
                    b->setPos(b->pos() + displacement->b);
                    m_moved.push_back(contact.b);
                }
                m_displacements.push(contact.a, contact.tagA, contact.b, contact.tagB,
                                     displacement->a, displacement->b);
            }

            if (m_moved.empty()) {
                break; // every remaining overlap is within epsilon
            }
            if (m_useGrid) {
                for (const ObjectHandle& handle : m_moved) {
                    m_grid.update(handle, m_store.at(handle).aabb(), SpatialGrid::BodyClass::Physical);
                }
            }
        }
    }

    void clampVelocities() {
        auto clampAxis = [this](const ObjectHandle& handle, const Vector2D& correction) {
            BodyType* body = m_store.getMut(handle);
            if (body == nullptr || correction.isZero()) {
                return;
            }
            Vector2D vel = body->vel();
            if (vel.getX() * correction.getX() < 0.0f) vel.setX(0.0f);
            if (vel.getY() * correction.getY() < 0.0f) vel.setY(0.0f);
            body->setVel(vel);
        };
        for (const ContactType& contact : m_displacements) {
            clampAxis(contact.a, contact.amount);
            clampAxis(contact.b, contact.otherAmount);
        }
    }

    void gatherTriggers() {
        collectCandidates(SpatialGrid::PairKind::Trigger, m_candidates);
        m_lastStats.triggerCandidates = m_candidates.size();
        for (const auto& [h1, h2] : m_candidates) {
            const BodyType* b1 = m_store.get(h1);
            const BodyType* b2 = m_store.get(h2);
            if (!b1 || !b2) {
                continue;
            }
            if (auto amount = overlap(b1->aabb(), b2->aabb())) {
                m_triggers.push(h1, *b1->tag(), h2, *b2->tag(), *amount, Vector2D());
            }
        }
    }

    void optimizeIndex() {
        if (!m_useGrid || m_settings.shrinkInterval == 0 ||
            m_tickCount % m_settings.shrinkInterval != 0) {
            return;
        }
        m_lastStats.reclaimedSlots = m_grid.shrink(m_settings.fragmentationThreshold);
        if (m_lastStats.reclaimedSlots > 0) {
            COLLISION_DEBUG(std::format("Broad phase compacted, {} slots reclaimed",
                                        m_lastStats.reclaimedSlots));
        }
    }

    void clearBuffers() {
        m_queue.clear();
        m_displacements.clear();
        m_triggers.clear();
        m_candidates.clear();
        m_moved.clear();
    }

    CollisionSettings m_settings;
    ObjectStore<Tag> m_store;
    SpatialGrid m_grid;

    ContactBuffer<Tag> m_queue;         // physical contacts of the current pass
    ContactBuffer<Tag> m_displacements; // what Resolve moved this tick
    ContactBuffer<Tag> m_triggers;

    std::vector<CandidatePair> m_candidates;
    std::vector<ObjectHandle> m_liveHandles;
    std::vector<ObjectHandle> m_moved;
    std::vector<SpatialGrid::Item> m_gridItems;

    bool m_useGrid{false};
    bool m_gridValid{false};
    uint64_t m_lastStructuralChanges{0};
    uint64_t m_tickCount{0};
    TickPhase m_phase{TickPhase::Idle};
    TickStats m_lastStats;
};

} // namespace BumperEngine

#endif // COLLISION_WORLD_HPP
