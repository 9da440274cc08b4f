#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <glm/mat4x4.hpp>

#include "gw/audio/AudioDevice.hpp"
#include "gw/graphics/GraphicsDevice.hpp"
#include "gw/graphics/GraphicsDeviceManager.hpp"
#include "gw/input/Keys.hpp"
#include "gw/platform/GamePlatform.hpp"

namespace gwtest {

// Records every call instead of talking to a GPU.
class RecordingGraphicsDevice : public gw::graphics::GraphicsDevice {
public:
    struct DrawCall {
        gw::graphics::TextureHandle texture = gw::graphics::kInvalidTexture;
        std::vector<gw::graphics::SpriteVertex> vertices;
        std::size_t spriteCount = 0;
        glm::mat4 transform{1.0f};
        gw::graphics::BlendState blendState = gw::graphics::BlendState::AlphaBlend;
    };

    void Clear(const gw::graphics::Color& color) override { clears.push_back(color); }

    void SetViewport(const gw::graphics::Viewport& viewport) override { m_viewport = viewport; }
    gw::graphics::Viewport GetViewport() const override { return m_viewport; }

    gw::graphics::TextureHandle CreateTexture(int width, int height,
                                              const std::vector<std::uint8_t>& rgbaPixels) override;
    void DestroyTexture(gw::graphics::TextureHandle texture) override;

    void DrawSprites(gw::graphics::TextureHandle texture,
                     const gw::graphics::SpriteVertex* vertices,
                     std::size_t spriteCount,
                     const glm::mat4& transform,
                     gw::graphics::BlendState blendState) override;

    std::size_t LiveTextureCount() const { return liveTextures.size(); }

    bool failTextureCreation = false;
    std::vector<gw::graphics::Color> clears;
    std::vector<DrawCall> drawCalls;
    std::unordered_set<gw::graphics::TextureHandle> liveTextures;
    std::vector<gw::graphics::TextureHandle> destroyedTextures;

private:
    gw::graphics::Viewport m_viewport;
    gw::graphics::TextureHandle m_nextTexture = 1;
};

// In-memory mixer. Files must exist on disk to load. A channel plays until
// FinishChannel() or StopVoice(), and the lowest free channel is handed to the
// next sound, like SDL_mixer does.
class FakeAudioDevice : public gw::audio::AudioDevice {
public:
    explicit FakeAudioDevice(bool available = true) : m_available(available) {}

    bool IsAvailable() const override { return m_available; }
    std::string LastError() const override { return m_lastError; }

    gw::audio::SoundHandle LoadSound(const std::filesystem::path& path) override;
    void ReleaseSound(gw::audio::SoundHandle sound) override;
    gw::audio::MusicHandle LoadMusic(const std::filesystem::path& path) override;
    void ReleaseMusic(gw::audio::MusicHandle music) override;

    gw::audio::Voice PlaySound(gw::audio::SoundHandle sound, float volume, float pan, bool loop) override;
    bool IsVoicePlaying(const gw::audio::Voice& voice) const override;
    void StopVoice(const gw::audio::Voice& voice) override;
    void SetVoiceVolume(const gw::audio::Voice& voice, float volume) override;
    void PauseChannels() override { channelsPaused = true; }
    void ResumeChannels() override { channelsPaused = false; }

    bool PlayMusic(gw::audio::MusicHandle music, bool repeat) override;
    void StopMusic() override { currentMusic = gw::audio::kInvalidMusic; }
    void PauseMusic() override { musicPaused = true; }
    void ResumeMusic() override { musicPaused = false; }
    void SetMusicVolume(float volume) override { musicVolume = volume; }

    void Close() override;

    void FinishChannel(int channel) { channelVolumes.erase(channel); }

    std::unordered_set<gw::audio::SoundHandle> loadedSounds;
    std::unordered_set<gw::audio::MusicHandle> loadedMusic;
    // Busy channels only.
    std::unordered_map<int, float> channelVolumes;
    std::unordered_map<int, std::uint32_t> channelSerials;
    gw::audio::MusicHandle currentMusic = gw::audio::kInvalidMusic;
    bool musicRepeat = false;
    bool musicPaused = false;
    bool channelsPaused = false;
    float musicVolume = 1.0f;
    int closeCount = 0;

private:
    bool m_available = true;
    std::string m_lastError;
    bool OwnsChannel(const gw::audio::Voice& voice) const;

    std::uint32_t m_nextHandle = 1;
    std::uint32_t m_nextSerial = 1;
};

// Headless platform: no window system, time advances only when told to.
class TestPlatform : public gw::platform::GamePlatform {
public:
    bool OpenWindow(const gw::graphics::PresentationParameters& parameters,
                    const std::string& title) override;
    void CloseWindow() override { windowOpen = false; }
    bool IsWindowOpen() const override { return windowOpen; }

    void ApplyPresentation(const gw::graphics::PresentationParameters& parameters) override;
    void SetWindowTitle(const std::string& title) override { windowTitle = title; }
    void SetMouseVisible(bool visible) override { mouseVisible = visible; }

    void PollEvents() override {
        ++pollCount;
        now += secondsPerPoll;
    }
    bool ShouldClose() const override { return closeRequested; }
    void RequestClose() override;
    void Present() override { ++presentCount; }

    double GetTimeSeconds() const override { return now; }

    void AttachInput(gw::input::InputSystem* inputSystem) override { input = inputSystem; }

    std::unique_ptr<gw::graphics::GraphicsDevice> CreateGraphicsDevice() override;
    std::unique_ptr<gw::audio::AudioDevice> CreateAudioDevice() override;

    // Feeds the attached input system the way a window callback would.
    void SetKey(gw::input::Key key, bool pressed);

    bool failOpenWindow = false;
    bool audioAvailable = true;
    bool windowOpen = false;
    bool closeRequested = false;
    bool mouseVisible = true;
    std::string windowTitle;
    gw::graphics::PresentationParameters lastPresentation;
    int openCount = 0;
    int applyCount = 0;
    int requestCloseCount = 0;
    int pollCount = 0;
    int presentCount = 0;
    double now = 0.0;
    // Added to the clock on every PollEvents so Run() makes progress.
    double secondsPerPoll = 0.0;
    gw::input::InputSystem* input = nullptr;
    RecordingGraphicsDevice* graphicsDevice = nullptr;
    FakeAudioDevice* audioDevice = nullptr;
};

// Writes a minimal uncompressed 32-bit TGA that stb_image can decode.
void WriteTga(const std::filesystem::path& path, int width, int height, std::uint8_t gray);

class TempDir {
public:
    explicit TempDir(const std::string& name);
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

} // namespace gwtest
