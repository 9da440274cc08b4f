#pragma once
#include <filesystem>
#include <memory>
#include <string>

#include "gw/audio/AudioDevice.hpp"

namespace gw::audio {

class AudioController;

// A decoded sample resident in the mixer. Released when the last owner drops it.
class SoundEffect {
public:
    SoundEffect(AudioDevice& device, SoundHandle handle, std::string name);
    ~SoundEffect();

    SoundEffect(const SoundEffect&) = delete;
    SoundEffect& operator=(const SoundEffect&) = delete;

    // Throws ContentLoadError when the device is unavailable or decoding fails.
    static std::shared_ptr<SoundEffect> FromFile(AudioDevice& device,
                                                 const std::filesystem::path& path);

    SoundHandle Handle() const { return m_handle; }
    const std::string& Name() const { return m_name; }

private:
    AudioDevice* m_device = nullptr;
    SoundHandle m_handle = kInvalidSound;
    std::string m_name;
};

/**
 * @brief One playback of a SoundEffect on a mixer channel.
 *
 * Volume is relative to the controller's sound effect volume. Once stopped an
 * instance never plays again; start a new one instead.
 */
class SoundEffectInstance {
public:
    SoundEffectInstance(AudioDevice& device, Voice voice, float volume, float pan, bool looped);

    bool IsPlaying() const;
    bool IsStopped() const { return !IsPlaying(); }
    bool IsLooped() const { return m_looped; }
    float Volume() const { return m_volume; }
    float Pan() const { return m_pan; }
    int Channel() const { return m_voice.channel; }
    const Voice& GetVoice() const { return m_voice; }

    void SetVolume(float volume);
    void Stop();

private:
    friend class AudioController;

    void ApplyMasterVolume(float masterVolume);
    void Detach();

    AudioDevice* m_device = nullptr;
    Voice m_voice;
    float m_volume = 1.0f;
    float m_masterVolume = 1.0f;
    float m_pan = 0.0f;
    bool m_looped = false;
    bool m_stopped = false;
};

} // namespace gw::audio
