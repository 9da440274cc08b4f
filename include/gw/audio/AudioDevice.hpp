#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace gw::audio {

using SoundHandle = std::uint32_t;
using MusicHandle = std::uint32_t;
constexpr SoundHandle kInvalidSound = 0;
constexpr MusicHandle kInvalidMusic = 0;
constexpr int kInvalidChannel = -1;

// One playback started by PlaySound(). Mixers hand a finished channel to the
// next sound, so the serial tells that later playback apart from this one.
struct Voice {
    int channel = kInvalidChannel;
    std::uint32_t serial = 0;

    bool IsValid() const { return channel != kInvalidChannel; }
};

/**
 * @brief Mixer backend: short samples played on channels plus one streamed
 * music track.
 *
 * An unavailable device (no output, failed open) keeps answering: loads
 * return invalid handles and playback calls do nothing.
 */
class AudioDevice {
public:
    virtual ~AudioDevice() = default;

    virtual bool IsAvailable() const = 0;
    virtual std::string LastError() const = 0;

    virtual SoundHandle LoadSound(const std::filesystem::path& path) = 0;
    virtual void ReleaseSound(SoundHandle sound) = 0;
    virtual MusicHandle LoadMusic(const std::filesystem::path& path) = 0;
    virtual void ReleaseMusic(MusicHandle music) = 0;

    // Volume in [0, 1], pan in [-1, 1]. Returns an invalid voice on failure.
    virtual Voice PlaySound(SoundHandle sound, float volume, float pan, bool loop) = 0;
    // The voice calls below do nothing once another playback owns the channel.
    virtual bool IsVoicePlaying(const Voice& voice) const = 0;
    virtual void StopVoice(const Voice& voice) = 0;
    virtual void SetVoiceVolume(const Voice& voice, float volume) = 0;
    virtual void PauseChannels() = 0;
    virtual void ResumeChannels() = 0;

    virtual bool PlayMusic(MusicHandle music, bool repeat) = 0;
    virtual void StopMusic() = 0;
    virtual void PauseMusic() = 0;
    virtual void ResumeMusic() = 0;
    virtual void SetMusicVolume(float volume) = 0;

    // Halts everything and releases the output. Loaded handles stay releasable.
    virtual void Close() = 0;
};

} // namespace gw::audio
