#pragma once
#include <cstddef>
#include <memory>
#include <vector>

#include "gw/audio/AudioDevice.hpp"
#include "gw/audio/Song.hpp"
#include "gw/audio/SoundEffect.hpp"

namespace gw::audio {

/**
 * @brief Owns the audio device and tracks every sound effect it starts.
 *
 * Volumes are in [0, 1]. While muted the getters report 0 and setters only
 * update the value restored by UnmuteAudio(). After Dispose() every call is
 * ignored with a warning.
 */
class AudioController {
public:
    explicit AudioController(std::unique_ptr<AudioDevice> device);
    ~AudioController();

    AudioController(const AudioController&) = delete;
    AudioController& operator=(const AudioController&) = delete;

    // Drops instances that finished playing.
    void Update();

    std::shared_ptr<SoundEffectInstance> PlaySoundEffect(const SoundEffect& soundEffect,
                                                         float volume = 1.0f,
                                                         float pan = 0.0f,
                                                         bool isLooped = false);
    void PlaySong(const Song& song, bool isRepeating = true);

    void PauseAudio();
    void ResumeAudio();
    void MuteAudio();
    void UnmuteAudio();
    void ToggleMute();

    float SongVolume() const;
    void SetSongVolume(float volume);
    float SoundEffectVolume() const;
    void SetSoundEffectVolume(float volume);

    bool IsMuted() const { return m_muted; }
    bool IsPaused() const { return m_paused; }
    bool IsDisposed() const { return m_disposed; }
    std::size_t ActiveInstanceCount() const { return m_activeInstances.size(); }

    AudioDevice* GetDevice() const { return m_device.get(); }

    // Stops every instance and the song, then closes the device. Idempotent.
    void Dispose();

private:
    bool CheckUsable(const char* operation) const;
    void ApplyVolumes();

    std::unique_ptr<AudioDevice> m_device;
    std::vector<std::shared_ptr<SoundEffectInstance>> m_activeInstances;
    float m_songVolume = 1.0f;
    float m_soundEffectVolume = 1.0f;
    bool m_muted = false;
    bool m_paused = false;
    bool m_disposed = false;
};

} // namespace gw::audio
