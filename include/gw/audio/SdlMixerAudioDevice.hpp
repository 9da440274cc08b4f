#pragma once
#include <array>
#include <cstdint>
#include <unordered_map>

#include "gw/audio/AudioDevice.hpp"

struct Mix_Chunk;
typedef struct _Mix_Music Mix_Music;

namespace gw::audio {

class SdlMixerAudioDevice final : public AudioDevice {
public:
    static constexpr int kFrequency = 44100;
    static constexpr int kChunkSize = 2048;
    static constexpr int kChannelCount = 32;

    // Never throws; failure to open leaves the device unavailable.
    SdlMixerAudioDevice();
    ~SdlMixerAudioDevice() override;

    SdlMixerAudioDevice(const SdlMixerAudioDevice&) = delete;
    SdlMixerAudioDevice& operator=(const SdlMixerAudioDevice&) = delete;

    bool IsAvailable() const override { return m_available; }
    std::string LastError() const override { return m_lastError; }

    SoundHandle LoadSound(const std::filesystem::path& path) override;
    void ReleaseSound(SoundHandle sound) override;
    MusicHandle LoadMusic(const std::filesystem::path& path) override;
    void ReleaseMusic(MusicHandle music) override;

    Voice PlaySound(SoundHandle sound, float volume, float pan, bool loop) override;
    bool IsVoicePlaying(const Voice& voice) const override;
    void StopVoice(const Voice& voice) override;
    void SetVoiceVolume(const Voice& voice, float volume) override;
    void PauseChannels() override;
    void ResumeChannels() override;

    bool PlayMusic(MusicHandle music, bool repeat) override;
    void StopMusic() override;
    void PauseMusic() override;
    void ResumeMusic() override;
    void SetMusicVolume(float volume) override;

    void Close() override;

private:
    // True while the voice is the latest playback started on its channel.
    bool OwnsChannel(const Voice& voice) const;

    bool m_available = false;
    bool m_subsystemStarted = false;
    std::string m_lastError;
    std::unordered_map<SoundHandle, Mix_Chunk*> m_sounds;
    std::unordered_map<MusicHandle, Mix_Music*> m_music;
    std::uint32_t m_nextHandle = 1;
    std::array<std::uint32_t, kChannelCount> m_channelSerials{};
    std::uint32_t m_nextSerial = 1;
};

} // namespace gw::audio
