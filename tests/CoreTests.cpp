#include "gw/audio/AudioController.hpp"
#include "gw/audio/SoundEffect.hpp"
#include "gw/content/ContentManager.hpp"
#include "gw/core/Core.hpp"
#include "gw/core/Error.hpp"
#include "gw/core/Logger.hpp"
#include "gw/scenes/Scene.hpp"

#include "TestPlatform.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using gwtest::TestPlatform;

class TestCore : public gw::core::Core {
public:
    explicit TestCore(std::unique_ptr<TestPlatform> platform, int width = 800, int height = 600)
        : gw::core::Core("Game", width, height, false, std::move(platform)) {}

    int loadContentCount = 0;
    int onUpdateCount = 0;
    int onDrawCount = 0;
    int onUnloadCount = 0;

protected:
    void LoadContent() override { ++loadContentCount; }
    void OnUpdate(const gw::core::GameTime&) override { ++onUpdateCount; }
    void OnDraw(const gw::core::GameTime&) override { ++onDrawCount; }
    void OnUnloadContent() override { ++onUnloadCount; }
};

struct CoreFixture {
    TestPlatform* platform = nullptr;
    std::unique_ptr<TestCore> core;

    CoreFixture() {
        auto owned = std::make_unique<TestPlatform>();
        platform = owned.get();
        core = std::make_unique<TestCore>(std::move(owned));
    }
};

using EventLog = std::vector<std::string>;

class RecordingScene : public gw::scenes::Scene {
public:
    RecordingScene(gw::core::Core& core, const std::string& name, EventLog& log)
        : gw::scenes::Scene(core, name), m_log(log) {}

    ~RecordingScene() override { m_log.push_back(GetName() + ".Destroyed"); }

    void Initialize() override {
        m_log.push_back(GetName() + ".Initialize");
        if (onInitialize) {
            onInitialize(*this);
        }
        gw::scenes::Scene::Initialize();
    }
    void LoadContent() override { m_log.push_back(GetName() + ".LoadContent"); }
    void UnloadContent() override {
        m_log.push_back(GetName() + ".Dispose");
        gw::scenes::Scene::UnloadContent();
    }
    void Update(const gw::core::GameTime&) override {
        m_log.push_back(GetName() + ".Update");
        if (onUpdate) {
            onUpdate(*this);
        }
    }
    void Draw(const gw::core::GameTime&) override { m_log.push_back(GetName() + ".Draw"); }

    gw::core::Core& CoreRef() const { return GetCore(); }

    std::function<void(RecordingScene&)> onInitialize;
    std::function<void(RecordingScene&)> onUpdate;

private:
    EventLog& m_log;
};

class ThrowingScene : public RecordingScene {
public:
    ThrowingScene(gw::core::Core& core, EventLog& log) : RecordingScene(core, "Broken", log) {}

    void UnloadContent() override { throw std::runtime_error("unload failed"); }
};

std::size_t CountOf(const EventLog& log, const std::string& entry) {
    return static_cast<std::size_t>(std::count(log.begin(), log.end(), entry));
}

std::ptrdiff_t IndexOf(const EventLog& log, const std::string& entry) {
    auto it = std::find(log.begin(), log.end(), entry);
    return it == log.end() ? -1 : std::distance(log.begin(), it);
}

gw::core::GameTime Frame(int index) {
    gw::core::GameTime time;
    time.elapsedSeconds = 1.0 / 60.0;
    time.totalSeconds = index / 60.0;
    return time;
}

} // namespace

TEST_CASE("Core allows a single live instance", "[core]") {
    REQUIRE(gw::core::Core::Instance() == nullptr);

    {
        CoreFixture fixture;
        REQUIRE(gw::core::Core::Instance() == fixture.core.get());

        REQUIRE_THROWS_AS(TestCore(std::make_unique<TestPlatform>()), gw::core::InvalidOperationError);
        REQUIRE(gw::core::Core::Instance() == fixture.core.get());
    }

    REQUIRE(gw::core::Core::Instance() == nullptr);

    CoreFixture again;
    REQUIRE(gw::core::Core::Instance() == again.core.get());
}

TEST_CASE("Core checks for a live instance before building anything", "[core]") {
    CoreFixture fixture;
    fixture.core->Initialize();

    // The duplicate check runs ahead of the size check and of every member.
    REQUIRE_THROWS_AS(TestCore(std::make_unique<TestPlatform>(), 0, 0), gw::core::InvalidOperationError);

    REQUIRE(gw::core::Core::Instance() == fixture.core.get());
    REQUIRE(fixture.platform->openCount == 1);
    REQUIRE(fixture.core->Graphics().PreferredBackBufferWidth() == 800);
    REQUIRE(fixture.core->Content().RootDirectory() == std::filesystem::path("Content"));
}

TEST_CASE("Core logs instead of throwing when the active scene fails to dispose", "[core]") {
    EventLog log;
    std::vector<std::string> errors;
    const auto token = gw::core::Logger::RegisterListener(
        [&errors](gw::core::LogLevel level, const std::string& line) {
            if (level == gw::core::LogLevel::Error) {
                errors.push_back(line);
            }
        });

    {
        CoreFixture fixture;
        fixture.core->Initialize();
        auto scene = std::make_shared<ThrowingScene>(*fixture.core, log);
        fixture.core->ChangeScene(scene);
        fixture.core->Update(Frame(1));
        scene.reset();

        REQUIRE_NOTHROW(fixture.core.reset());
    }
    gw::core::Logger::UnregisterListener(token);

    REQUIRE(gw::core::Core::Instance() == nullptr);
    REQUIRE(CountOf(log, "Broken.Destroyed") == 1);
    REQUIRE(errors.size() == 1);
    REQUIRE(errors.front().find("[Core] Disposing scene 'Broken' failed: unload failed") != std::string::npos);
}

TEST_CASE("Core rejects a non-positive back buffer", "[core]") {
    REQUIRE_THROWS_AS(TestCore(std::make_unique<TestPlatform>(), 0, 600), std::invalid_argument);
    REQUIRE_THROWS_AS(TestCore(std::make_unique<TestPlatform>(), 800, -1), std::invalid_argument);
    REQUIRE(gw::core::Core::Instance() == nullptr);
}

TEST_CASE("Core stores construction parameters", "[core]") {
    CoreFixture fixture;
    auto& core = *fixture.core;

    REQUIRE(core.Title() == "Game");
    REQUIRE(core.ExitOnEscape());
    REQUIRE(core.IsMouseVisible());
    REQUIRE(core.Content().RootDirectory() == std::filesystem::path("Content"));
    REQUIRE(core.ActiveScene() == nullptr);
    REQUIRE(core.PendingScene() == nullptr);
    REQUIRE_FALSE(core.IsInitialized());
    REQUIRE(core.Graphics().Applied().backBufferWidth == 800);
    REQUIRE(core.Graphics().Applied().backBufferHeight == 600);
    REQUIRE_FALSE(core.Graphics().Applied().isFullScreen);
}

TEST_CASE("Core requires Initialize before Update", "[core]") {
    CoreFixture fixture;
    REQUIRE_THROWS_AS(fixture.core->Update(Frame(1)), gw::core::InvalidOperationError);
    REQUIRE_THROWS_AS(fixture.core->Audio(), gw::core::InvalidOperationError);
}

TEST_CASE("Core Initialize creates the devices and loads content", "[core]") {
    CoreFixture fixture;
    auto& core = *fixture.core;
    core.Initialize();

    REQUIRE(core.IsInitialized());
    REQUIRE(fixture.platform->windowOpen);
    REQUIRE(fixture.platform->windowTitle == "Game");
    REQUIRE(fixture.platform->input != nullptr);
    REQUIRE(fixture.platform->graphicsDevice != nullptr);
    REQUIRE(&core.GraphicsDevice() == fixture.platform->graphicsDevice);
    REQUIRE(core.GraphicsDevice().GetViewport().width == 800);
    REQUIRE(core.GraphicsDevice().GetViewport().height == 600);
    REQUIRE(core.Content().Services()->graphicsDevice == fixture.platform->graphicsDevice);
    REQUIRE(core.Content().Services()->audioDevice == fixture.platform->audioDevice);
    REQUIRE_FALSE(core.Audio().IsDisposed());
    REQUIRE(core.loadContentCount == 1);

    core.Initialize();
    REQUIRE(fixture.platform->openCount == 1);
    REQUIRE(core.loadContentCount == 1);
}

TEST_CASE("Core switches scenes at frame boundaries", "[core][scenes]") {
    EventLog log;
    CoreFixture fixture;
    auto& core = *fixture.core;
    core.Initialize();

    auto sceneA = std::make_shared<RecordingScene>(core, "A", log);
    core.ChangeScene(sceneA);
    REQUIRE(core.PendingScene() == sceneA);
    REQUIRE(core.ActiveScene() == nullptr);

    core.Update(Frame(1));
    REQUIRE(CountOf(log, "A.Initialize") == 1);
    REQUIRE(CountOf(log, "A.LoadContent") == 1);
    REQUIRE(CountOf(log, "A.Update") == 1);
    REQUIRE(CountOf(log, "A.Dispose") == 0);
    REQUIRE(core.ActiveScene() == sceneA);
    REQUIRE(core.PendingScene() == nullptr);

    std::weak_ptr<RecordingScene> weakA = sceneA;
    sceneA.reset();

    core.ChangeScene(std::make_shared<RecordingScene>(core, "B", log));
    core.Update(Frame(2));

    REQUIRE(CountOf(log, "A.Dispose") == 1);
    REQUIRE(CountOf(log, "B.Initialize") == 1);
    REQUIRE(CountOf(log, "B.Update") == 1);
    REQUIRE(CountOf(log, "A.Update") == 1);

    // The old scene is disposed and destroyed before the new one loads.
    REQUIRE(IndexOf(log, "A.Dispose") < IndexOf(log, "A.Destroyed"));
    REQUIRE(IndexOf(log, "A.Destroyed") < IndexOf(log, "B.Initialize"));
    REQUIRE(weakA.expired());
    REQUIRE(core.ActiveScene()->GetName() == "B");
}

TEST_CASE("Core ChangeScene keeps only the latest request", "[core][scenes]") {
    EventLog log;
    CoreFixture fixture;
    auto& core = *fixture.core;
    core.Initialize();

    core.ChangeScene(std::make_shared<RecordingScene>(core, "A", log));
    core.ChangeScene(std::make_shared<RecordingScene>(core, "B", log));
    core.Update(Frame(1));

    REQUIRE(CountOf(log, "A.Initialize") == 0);
    REQUIRE(CountOf(log, "B.Initialize") == 1);
    REQUIRE(core.ActiveScene()->GetName() == "B");

    core.Update(Frame(2));
    REQUIRE(CountOf(log, "B.Initialize") == 1);
    REQUIRE(CountOf(log, "B.Update") == 2);
}

TEST_CASE("Core ignores a request for the active scene", "[core][scenes]") {
    EventLog log;
    CoreFixture fixture;
    auto& core = *fixture.core;
    core.Initialize();

    auto sceneA = std::make_shared<RecordingScene>(core, "A", log);
    core.ChangeScene(sceneA);
    core.Update(Frame(1));

    core.ChangeScene(sceneA);
    REQUIRE(core.PendingScene() == nullptr);

    auto sceneB = std::make_shared<RecordingScene>(core, "B", log);
    core.ChangeScene(sceneB);
    core.ChangeScene(sceneA);
    REQUIRE(core.PendingScene() == sceneB);

    core.Update(Frame(2));
    REQUIRE(CountOf(log, "A.Initialize") == 1);
    REQUIRE(CountOf(log, "A.Dispose") == 1);
    REQUIRE(core.ActiveScene() == sceneB);
}

TEST_CASE("Core ChangeScene with nullptr cancels the pending scene", "[core][scenes]") {
    EventLog log;
    CoreFixture fixture;
    auto& core = *fixture.core;
    core.Initialize();

    core.ChangeScene(std::make_shared<RecordingScene>(core, "A", log));
    core.ChangeScene(nullptr);
    REQUIRE(core.PendingScene() == nullptr);

    core.Update(Frame(1));
    REQUIRE(CountOf(log, "A.Initialize") == 0);
    REQUIRE(core.ActiveScene() == nullptr);
}

TEST_CASE("Core lets a scene request the next scene from Update", "[core][scenes]") {
    EventLog log;
    CoreFixture fixture;
    auto& core = *fixture.core;
    core.Initialize();

    auto sceneA = std::make_shared<RecordingScene>(core, "A", log);
    sceneA->onUpdate = [&log](RecordingScene& self) {
        self.CoreRef().ChangeScene(std::make_shared<RecordingScene>(self.CoreRef(), "B", log));
    };
    core.ChangeScene(sceneA);
    sceneA.reset();

    core.Update(Frame(1));
    // A keeps running for the rest of the frame that requested the switch.
    REQUIRE(CountOf(log, "A.Dispose") == 0);
    REQUIRE(core.PendingScene() != nullptr);

    core.Update(Frame(2));
    REQUIRE(CountOf(log, "A.Dispose") == 1);
    REQUIRE(core.ActiveScene()->GetName() == "B");
}

TEST_CASE("Core Update runs input, audio, escape check, transition and scene in order", "[core]") {
    EventLog log;
    CoreFixture fixture;
    auto& core = *fixture.core;
    core.Initialize();

    gwtest::TempDir dir("groundwork_core_audio");
    std::ofstream(dir.Path() / "blip.wav") << "RIFF";
    auto blip = gw::audio::SoundEffect::FromFile(*fixture.platform->audioDevice, dir.Path() / "blip.wav");
    auto instance = core.Audio().PlaySoundEffect(*blip);
    REQUIRE(instance);
    fixture.platform->audioDevice->FinishChannel(instance->Channel());
    REQUIRE(core.Audio().ActiveInstanceCount() == 1);

    struct Observed {
        bool escapeDown = false;
        bool exitRequested = false;
        std::size_t trackedInstances = 99;
        int hookCalls = -1;
    };
    Observed atInitialize;
    Observed atUpdate;
    auto observe = [&core](Observed& into) {
        into.escapeDown = core.Input().Keyboard().IsKeyDown(gw::input::Key::Escape);
        into.exitRequested = core.IsExitRequested();
        into.trackedInstances = core.Audio().ActiveInstanceCount();
        into.hookCalls = core.onUpdateCount;
    };

    auto scene = std::make_shared<RecordingScene>(core, "A", log);
    scene->onInitialize = [&](RecordingScene&) { observe(atInitialize); };
    scene->onUpdate = [&](RecordingScene&) { observe(atUpdate); };
    core.ChangeScene(scene);

    fixture.platform->SetKey(gw::input::Key::Escape, true);
    core.Update(Frame(1));

    // The transition saw refreshed input, pruned audio and the exit request.
    REQUIRE(atInitialize.escapeDown);
    REQUIRE(atInitialize.trackedInstances == 0);
    REQUIRE(atInitialize.exitRequested);

    // The scene updated after its Initialize and before the OnUpdate hook.
    REQUIRE(IndexOf(log, "A.Initialize") < IndexOf(log, "A.Update"));
    REQUIRE(atUpdate.escapeDown);
    REQUIRE(atUpdate.exitRequested);
    REQUIRE(atUpdate.hookCalls == 0);
    REQUIRE(core.onUpdateCount == 1);
}

TEST_CASE("Core requests exit once per frame while Escape is down", "[core]") {
    CoreFixture fixture;
    auto& core = *fixture.core;
    core.Initialize();

    SECTION("enabled") {
        fixture.platform->SetKey(gw::input::Key::Escape, true);
        core.Update(Frame(1));
        REQUIRE(fixture.platform->requestCloseCount == 1);
        REQUIRE(core.IsExitRequested());

        core.Update(Frame(2));
        REQUIRE(fixture.platform->requestCloseCount == 2);

        fixture.platform->SetKey(gw::input::Key::Escape, false);
        core.Update(Frame(3));
        REQUIRE(fixture.platform->requestCloseCount == 2);
    }

    SECTION("disabled") {
        core.SetExitOnEscape(false);
        fixture.platform->SetKey(gw::input::Key::Escape, true);
        core.Update(Frame(1));
        core.Update(Frame(2));
        REQUIRE(fixture.platform->requestCloseCount == 0);
        REQUIRE_FALSE(core.IsExitRequested());
    }
}

TEST_CASE("Core Draw delegates to the active scene only", "[core]") {
    EventLog log;
    CoreFixture fixture;
    auto& core = *fixture.core;
    core.Initialize();

    REQUIRE_NOTHROW(core.Draw(Frame(0)));
    REQUIRE(fixture.platform->graphicsDevice->drawCalls.empty());
    REQUIRE(core.onDrawCount == 1);

    core.ChangeScene(std::make_shared<RecordingScene>(core, "A", log));
    REQUIRE_NOTHROW(core.Draw(Frame(0)));
    // Pending scenes are not drawn.
    REQUIRE(CountOf(log, "A.Draw") == 0);

    core.Update(Frame(1));
    core.Draw(Frame(1));
    REQUIRE(CountOf(log, "A.Draw") == 1);
    REQUIRE(core.onDrawCount == 3);
}

TEST_CASE("Core UnloadContent disposes audio but keeps the active scene", "[core]") {
    EventLog log;
    {
        CoreFixture fixture;
        auto& core = *fixture.core;
        core.Initialize();
        core.ChangeScene(std::make_shared<RecordingScene>(core, "A", log));
        core.Update(Frame(1));

        core.UnloadContent();
        REQUIRE(core.Audio().IsDisposed());
        REQUIRE(fixture.platform->audioDevice->closeCount == 1);
        REQUIRE(core.onUnloadCount == 1);
        REQUIRE(CountOf(log, "A.Dispose") == 0);
        REQUIRE_FALSE(core.ActiveScene()->IsDisposed());
    }
    // Destroying the Core releases the scene that was still active.
    REQUIRE(CountOf(log, "A.Dispose") == 1);
    REQUIRE(CountOf(log, "A.Destroyed") == 1);
}

TEST_CASE("Core forwards title and cursor changes to an open window", "[core]") {
    CoreFixture fixture;
    auto& core = *fixture.core;

    core.SetMouseVisible(false);
    REQUIRE(fixture.platform->mouseVisible);

    core.Initialize();
    REQUIRE_FALSE(fixture.platform->mouseVisible);

    core.SetTitle("Renamed");
    REQUIRE(core.Title() == "Renamed");
    REQUIRE(fixture.platform->windowTitle == "Renamed");
}

TEST_CASE("Core Tick runs the scheduled fixed steps then draws once", "[core][clock]") {
    EventLog log;
    CoreFixture fixture;
    auto& core = *fixture.core;
    core.Initialize();

    core.ChangeScene(std::make_shared<RecordingScene>(core, "A", log));

    fixture.platform->now += 2.0 / 60.0;
    core.Tick();
    REQUIRE(CountOf(log, "A.Update") == 2);
    REQUIRE(CountOf(log, "A.Draw") == 1);
    REQUIRE(fixture.platform->presentCount == 1);
    REQUIRE(core.Clock().CurrentTime().isRunningSlowly);

    fixture.platform->now += 1.0 / 60.0;
    core.Tick();
    REQUIRE(CountOf(log, "A.Update") == 3);
    REQUIRE(CountOf(log, "A.Draw") == 2);
    REQUIRE_FALSE(core.Clock().CurrentTime().isRunningSlowly);
}

TEST_CASE("Core Run loops until Exit and unloads", "[core]") {
    EventLog log;
    CoreFixture fixture;
    auto& core = *fixture.core;
    fixture.platform->secondsPerPoll = 1.0 / 60.0;

    int updates = 0;
    auto scene = std::make_shared<RecordingScene>(core, "A", log);
    scene->onUpdate = [&updates](RecordingScene& self) {
        if (++updates == 5) {
            self.CoreRef().Exit();
        }
    };
    core.ChangeScene(scene);
    scene.reset();

    REQUIRE(core.Run() == EXIT_SUCCESS);
    REQUIRE(updates == 5);
    REQUIRE(core.loadContentCount == 1);
    REQUIRE(core.onUnloadCount == 1);
    REQUIRE(core.Audio().IsDisposed());
}
