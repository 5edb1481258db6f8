/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/AABB.hpp"
#include "collisions/CollisionPolicy.hpp"
#include "collisions/CollisionSettings.hpp"
#include "core/FixedStepClock.hpp"
#include "core/Logger.hpp"
#include "managers/CollisionWorld.hpp"
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <format>
#include <random>
#include <span>
#include <string>
#include <string_view>

using namespace BumperEngine;

#ifndef BUMPER_APP_NAME
#define BUMPER_APP_NAME "BumperDemo"
#endif

namespace {

const std::string GAME_NAME{BUMPER_APP_NAME};

constexpr float W{320.0f};
constexpr float H{240.0f};
constexpr float GUY_SPEED{240.0f};   // units per second
constexpr float GUY_SIZE{16.0f};
constexpr float APPLE_SIZE{16.0f};
constexpr size_t MAX_APPLES{8};
constexpr float FRAME_TIME{1.0f / 60.0f};

// Sprite cels carried as render payload
constexpr uint64_t CEL_BACKDROP{0};
constexpr uint64_t CEL_GUY{1};
constexpr uint64_t CEL_WALL{2};
constexpr uint64_t CEL_APPLE{3};

// Trigger contacts put the smaller tag first, so Guy/Apple arrives as (Guy, Apple)
enum class CharaTag : uint8_t { Wall, Guy, Apple, Deco };

class AppleCatcher final : public ContactListener<CharaTag> {
public:
    explicit AppleCatcher(uint32_t seed) : m_rng(seed) {}

    void setup(CollisionWorld<CharaTag>& world) {
        world.create(CharaTag::Deco, AABB(W / 2.0f, H / 2.0f, W, H),
                     CollisionPolicy::none(), CEL_BACKDROP);
        m_guy = world.create(CharaTag::Guy, AABB(W / 2.0f, 24.0f, GUY_SIZE, GUY_SIZE),
                             CollisionPolicy::pushable(), CEL_GUY);
        // floor, left wall, right wall
        world.create(CharaTag::Wall, AABB(W / 2.0f, 8.0f, W, 16.0f), CollisionPolicy::solid(), CEL_WALL);
        world.create(CharaTag::Wall, AABB(8.0f, H / 2.0f, 16.0f, H), CollisionPolicy::solid(), CEL_WALL);
        world.create(CharaTag::Wall, AABB(W - 8.0f, H / 2.0f, 16.0f, H), CollisionPolicy::solid(), CEL_WALL);
    }

    // Game logic ahead of each simulation step
    void update(CollisionWorld<CharaTag>& world) {
        steerGuy(world);

        if (m_appleTimer > 0) {
            --m_appleTimer;
        } else if (world.store().countWithTag(CharaTag::Apple) < MAX_APPLES) {
            std::uniform_real_distribution<float> xDist(24.0f, W - 24.0f);
            std::uniform_real_distribution<float> fallDist(60.0f, 240.0f);
            std::uniform_int_distribution<uint32_t> timerDist(30, 89);

            ObjectHandle apple = world.recycle(CharaTag::Apple,
                                               AABB(xDist(m_rng), H + 8.0f, APPLE_SIZE, APPLE_SIZE),
                                               CollisionPolicy::trigger(), CEL_APPLE);
            world.at(apple).setVel(Vector2D(0.0f, -fallDist(m_rng)));
            ++m_spawned;
            m_appleTimer = timerDist(m_rng);
        }
    }

    void handleDisplacements(CollisionWorld<CharaTag>&,
                             std::span<const Contact<CharaTag>> contacts) override {
        m_wallBumps += contacts.size();
    }

    void handleTriggers(CollisionWorld<CharaTag>& world,
                        std::span<const Contact<CharaTag>> contacts) override {
        for (const auto& contact : contacts) {
            if (contact.tagA == CharaTag::Guy && contact.tagB == CharaTag::Apple) {
                if (world.kill(contact.b)) {
                    ++m_score;
                    DEMO_DEBUG(std::format("Caught apple, score {}", m_score));
                }
            } else if (contact.tagA == CharaTag::Wall && contact.tagB == CharaTag::Apple) {
                // Hit the floor; may already be eaten this tick
                if (world.kill(contact.b)) {
                    ++m_missed;
                }
            }
        }
    }

    uint32_t getScore() const { return m_score; }
    uint32_t getMissed() const { return m_missed; }
    uint32_t getSpawned() const { return m_spawned; }
    size_t getWallBumps() const { return m_wallBumps; }

private:
    // Chases the lowest apple; stands still when there is none
    void steerGuy(CollisionWorld<CharaTag>& world) {
        Body<CharaTag>* guy = world.getMut(m_guy);
        if (guy == nullptr) {
            return;
        }

        const Body<CharaTag>* target = nullptr;
        world.forEachWithTag(CharaTag::Apple, [&](const ObjectHandle&, Body<CharaTag>& apple) {
            if (target == nullptr || apple.pos().getY() < target->pos().getY()) {
                target = &apple;
            }
        });

        float dir = 0.0f;
        if (target != nullptr) {
            float dx = target->pos().getX() - guy->pos().getX();
            if (dx > 2.0f) {
                dir = 1.0f;
            } else if (dx < -2.0f) {
                dir = -1.0f;
            }
        }
        guy->setVel(Vector2D(dir * GUY_SPEED, 0.0f));
    }

    std::mt19937 m_rng;
    ObjectHandle m_guy{};
    uint32_t m_appleTimer{0};
    uint32_t m_score{0};
    uint32_t m_missed{0};
    uint32_t m_spawned{0};
    size_t m_wallBumps{0};
};

struct DemoOptions {
    float seconds{30.0f};
    uint32_t seed{1};
    bool realtime{false};
};

DemoOptions parseOptions(int argc, char* argv[]) {
    DemoOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg == "--realtime") {
            options.realtime = true;
        } else if (arg == "--seconds" && i + 1 < argc) {
            options.seconds = std::stof(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            options.seed = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else {
            DEMO_WARN(std::format("Ignoring unknown argument '{}'", arg));
        }
    }
    return options;
}

} // namespace

int main(int argc, char* argv[]) {
    DemoOptions options;
    try {
        options = parseOptions(argc, argv);
    } catch (const std::exception& e) {
        DEMO_CRITICAL(std::format("Bad command line: {}", e.what()));
        return EXIT_FAILURE;
    }

    DEMO_INFO(std::format("Initializing {} ({} s, seed {}, {})", GAME_NAME, options.seconds,
                          options.seed, options.realtime ? "realtime" : "headless"));

    CollisionSettings settings;
    settings.bruteForceThreshold = 8;
    CollisionWorld<CharaTag> world(settings);
    FixedStepClock clock(FRAME_TIME, 0.002f, 5);
    AppleCatcher game(options.seed);

    try {
        game.setup(world);
    } catch (const std::exception& e) {
        DEMO_CRITICAL(std::format("Level setup failed: {}", e.what()));
        return EXIT_FAILURE;
    }

    // Headless runs feed the clock jittery frame times around 60 Hz
    std::mt19937 frameRng(options.seed ^ 0x9e3779b9u);
    std::uniform_real_distribution<float> jitter(-0.0012f, 0.0012f);

    float simulated = 0.0f;
    size_t frames = 0;
    try {
        clock.reset();
        while (simulated < options.seconds) {
            size_t steps = options.realtime ? clock.tick() : clock.advance(FRAME_TIME + jitter(frameRng));

            for (size_t i = 0; i < steps; ++i) {
                game.update(world);
                world.step(clock.getDeltaTime(), game);
                simulated += clock.getDeltaTime();
            }
            ++frames;

            if (options.realtime) {
                clock.waitForFrame(FRAME_TIME);
            }
        }
    } catch (const std::exception& e) {
        DEMO_CRITICAL(std::format("Simulation aborted on tick {}: {}", world.getTickCount(), e.what()));
        return EXIT_FAILURE;
    }

    DEMO_INFO(std::format("{} frames, {} ticks, {} clock stalls", frames, world.getTickCount(),
                          clock.getStallCount()));
    DEMO_INFO(std::format("Score {} of {} apples ({} missed), {} wall contacts", game.getScore(),
                          game.getSpawned(), game.getMissed(), game.getWallBumps()));
    world.logCollisionStatistics();

    DEMO_INFO(std::format("{} shutting down", GAME_NAME));
    return EXIT_SUCCESS;
}
