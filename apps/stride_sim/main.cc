#include "stride/core/CharacterConfig.hh"
#include "stride/core/JoltPhysicsWorld.hh"
#include "stride/core/Log.hh"
#include "stride/core/MovementController.hh"
#include "stride/core/MovementFSM.hh"
#include "stride/core/Mover.hh"
#include "stride/core/ZoneProvider.hh"

#include <charconv>
#include <exception>
#include <iostream>
#include <memory>
#include <string_view>
#include <unordered_map>

namespace {

constexpr const char* kAppName = "stride_sim";
constexpr const char* kAppVersion = "0.1.0";

constexpr float kTickRate = 60.0f;
constexpr int kDefaultTicks = 600;

// Seconds of standing still before the scripted walk begins
constexpr float kIdleTime = 0.5f;
constexpr float kRollTime = 1.0f;

void printUsage() {
    std::cout << "Usage: " << kAppName << " [config.toml] [ticks]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --version    Display version information" << std::endl;
    std::cout << "  --help       Display this help message" << std::endl;
}

bool parseTicks(std::string_view text, int& ticks) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value <= 0)
        return false;
    ticks = value;
    return true;
}

// Test course: floor, a low step, and a ladder up to a platform
struct Course {
    std::shared_ptr<stride::ClimbZone> ladder;
    std::unordered_map<stride::ColliderHandle, stride::ClimbZonePtr> climbTriggers;
};

stride::Result<Course> buildCourse(stride::JoltPhysicsWorld& world, float pivotHeight) {
    using namespace stride;

    const struct {
        Vec3f position;
        Vec3f halfExtents;
        const char* name;
    } solids[] = {
        {Vec3f(0.0f, -0.5f, 5.0f), Vec3f(10.0f, 0.5f, 15.0f), "floor"},
        {Vec3f(0.0f, 0.1f, 3.0f), Vec3f(2.0f, 0.1f, 0.5f), "step"},
        {Vec3f(0.0f, 1.5f, 10.0f), Vec3f(3.0f, 1.5f, 2.0f), "platform"},
    };

    for (const auto& solid : solids) {
        auto created = world.createStaticBox(solid.position, solid.halfExtents);
        if (created.isError())
            return Result<Course>::error(created.code(), std::string(solid.name) + ": " + created.message());
    }

    Course course;
    course.ladder = std::make_shared<ClimbZone>();
    course.ladder->transform = Transformf(Vec3f(0.0f, 0.0f, 8.0f));
    course.ladder->startOffset = LocalVec3f(0.0f, pivotHeight, -0.5f);
    course.ladder->endOffset = LocalVec3f(0.0f, 3.0f + pivotHeight, 0.6f);

    auto trigger = world.createTriggerBox(Vec3f(0.0f, 2.5f, 7.9f), Vec3f(1.0f, 2.5f, 1.15f));
    if (trigger.isError())
        return Result<Course>::error(trigger.code(), "ladder trigger: " + trigger.message());
    course.climbTriggers[trigger.value()] = course.ladder;

    return Result<Course>::ok(std::move(course));
}

int run(const char* configPath, int ticks) {
    using namespace stride;

    CharacterConfig config;
    if (configPath != nullptr) {
        auto loaded = loadCharacterConfig(std::filesystem::path(configPath));
        if (loaded.isError()) {
            STRIDE_LOG_CRITICAL("Failed to load character config: {}", loaded.message());
            return 1;
        }
        config = loaded.value();
        STRIDE_LOG_INFO("Loaded character config from {}", configPath);
    }

    JoltPhysicsWorld world;
    world.init();

    // Height of the body origin above the feet
    const float pivotHeight = config.mover.colliderHeight * (0.5f - config.mover.colliderOffset.y);

    auto course = buildCourse(world, pivotHeight);
    if (course.isError()) {
        STRIDE_LOG_CRITICAL("Failed to build course: {}", course.message());
        return 1;
    }

    auto created = world.createCharacterBody(Vec3f(0.0f, pivotHeight, 0.0f), ColliderShape{});
    if (created.isError()) {
        STRIDE_LOG_CRITICAL("Failed to create character body: {}", created.message());
        return 1;
    }
    JoltCharacterBody* body = created.value();

    Mover mover(world, *body, config.mover);
    MovementController controller(mover, config.controller);
    ZoneProvider zones;

    int tick = 0;

    auto logVector = [&tick](const char* what, const char* key) {
        return [what, key, &tick](Event& e) {
            Vec3f v = e.getAnyData<Vec3f>(key);
            STRIDE_MOVEMENT_INFO("[{}] {} ({:.2f}, {:.2f}, {:.2f})", tick, what, v.x, v.y, v.z);
        };
    };
    controller.events().addEventListener(events::kJump, logVector("jump", "momentum"));
    controller.events().addEventListener(events::kLand, logVector("land", "momentum"));
    controller.events().addEventListener(events::kRollCrash, logVector("roll crash at", "point"));
    controller.events().addEventListener(events::kLadderEnter, [&tick](Event&) {
        STRIDE_MOVEMENT_INFO("[{}] ladder enter", tick);
    });
    controller.events().addEventListener(events::kLadderExit, [&tick](Event&) {
        STRIDE_MOVEMENT_INFO("[{}] ladder exit", tick);
    });
    controller.events().addEventListener(events::kFreeClimbEnter, [&tick](Event&) {
        STRIDE_MOVEMENT_INFO("[{}] free climb enter", tick);
    });

    const float dt = 1.0f / kTickRate;
    const int rollTick = static_cast<int>(kRollTime * kTickRate);
    ControllerState previous = controller.state();

    for (tick = 0; tick < ticks; ++tick) {
        const float time = static_cast<float>(tick) * dt;

        // Forward stays held over the top landing and off the platform's far edge
        ControllerInput input;
        if (time >= kIdleTime)
            input.vertical = 1.0f;
        input.rollPressed = tick == rollTick;

        ZoneSnapshot snapshot = zones.snapshot();
        controller.tick(dt, input, snapshot);
        world.step(dt);

        ContactReport report = world.takeContacts(body->collider());
        for (ColliderHandle trigger : report.triggersEntered) {
            auto it = course.value().climbTriggers.find(trigger);
            if (it != course.value().climbTriggers.end())
                zones.enterClimbZone(it->second);
        }
        for (ColliderHandle trigger : report.triggersExited) {
            auto it = course.value().climbTriggers.find(trigger);
            if (it != course.value().climbTriggers.end())
                zones.exitClimbZone(it->second);
        }
        controller.onCollisionEnter(report.entered);
        controller.onCollisionStay(report.stayed);

        if (controller.state() != previous) {
            Vec3f p = body->pose().getPosition();
            STRIDE_MOVEMENT_INFO("[{}] {} -> {} at ({:.2f}, {:.2f}, {:.2f})", tick,
                                 MovementFSM::stateToString(previous), MovementFSM::stateToString(controller.state()),
                                 p.x, p.y, p.z);
            previous = controller.state();
        }
    }

    Vec3f p = body->pose().getPosition();
    STRIDE_LOG_INFO("Finished {} ticks in state {} at ({:.2f}, {:.2f}, {:.2f})", ticks,
                    MovementFSM::stateToString(controller.state()), p.x, p.y, p.z);

    world.shutdown();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    stride::log::init();
    STRIDE_LOG_INFO("Starting {} {}", kAppName, kAppVersion);

    const char* configPath = nullptr;
    int ticks = kDefaultTicks;
    int positional = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg == "--version") {
            std::cout << kAppName << " version " << kAppVersion << std::endl;
            stride::log::shutdown();
            return 0;
        }
        if (arg == "--help") {
            printUsage();
            stride::log::shutdown();
            return 0;
        }

        if (positional == 0) {
            configPath = argv[i];
        } else if (positional == 1) {
            if (!parseTicks(arg, ticks)) {
                STRIDE_LOG_CRITICAL("Invalid tick count '{}'", arg);
                stride::log::shutdown();
                return 1;
            }
        } else {
            printUsage();
            stride::log::shutdown();
            return 1;
        }
        ++positional;
    }

    int result = 1;
    try {
        result = run(configPath, ticks);
    } catch (const std::exception& e) {
        STRIDE_LOG_CRITICAL("Fatal exception: {}", e.what());
    }

    stride::log::shutdown();
    return result;
}
