#include "gw/audio/SdlMixerAudioDevice.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>

#include <SDL2/SDL.h>
#include <SDL2/SDL_mixer.h>

#include "gw/core/Logger.hpp"

namespace gw::audio {

namespace {

int ToMixVolume(float volume) {
    const float clamped = std::clamp(volume, 0.0f, 1.0f);
    return static_cast<int>(clamped * static_cast<float>(MIX_MAX_VOLUME) + 0.5f);
}

} // namespace

SdlMixerAudioDevice::SdlMixerAudioDevice() {
    if (SDL_InitSubSystem(SDL_INIT_AUDIO) != 0) {
        m_lastError = SDL_GetError();
        core::Logger::Warning("[Audio] SDL audio init failed, running without sound: {}", m_lastError);
        return;
    }
    m_subsystemStarted = true;

    if (Mix_OpenAudio(kFrequency, MIX_DEFAULT_FORMAT, 2, kChunkSize) != 0) {
        m_lastError = Mix_GetError();
        core::Logger::Warning("[Audio] Mix_OpenAudio failed, running without sound: {}", m_lastError);
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        m_subsystemStarted = false;
        return;
    }

    Mix_AllocateChannels(kChannelCount);
    m_available = true;
    core::Logger::Info("[Audio] Mixer opened ({} Hz, {} channels)", kFrequency, kChannelCount);
}

SdlMixerAudioDevice::~SdlMixerAudioDevice() {
    Close();
    for (auto& [handle, chunk] : m_sounds) {
        Mix_FreeChunk(chunk);
    }
    m_sounds.clear();
    for (auto& [handle, music] : m_music) {
        Mix_FreeMusic(music);
    }
    m_music.clear();
}

SoundHandle SdlMixerAudioDevice::LoadSound(const std::filesystem::path& path) {
    if (!m_available) {
        m_lastError = "audio device unavailable";
        return kInvalidSound;
    }
    Mix_Chunk* chunk = Mix_LoadWAV(path.string().c_str());
    if (!chunk) {
        m_lastError = Mix_GetError();
        return kInvalidSound;
    }
    const SoundHandle handle = m_nextHandle++;
    m_sounds.emplace(handle, chunk);
    return handle;
}

void SdlMixerAudioDevice::ReleaseSound(SoundHandle sound) {
    auto it = m_sounds.find(sound);
    if (it == m_sounds.end()) {
        return;
    }
    if (m_available) {
        // A chunk must not be freed while a channel still plays it.
        for (int channel = 0; channel < kChannelCount; ++channel) {
            if (Mix_GetChunk(channel) == it->second) {
                Mix_HaltChannel(channel);
            }
        }
    }
    Mix_FreeChunk(it->second);
    m_sounds.erase(it);
}

MusicHandle SdlMixerAudioDevice::LoadMusic(const std::filesystem::path& path) {
    if (!m_available) {
        m_lastError = "audio device unavailable";
        return kInvalidMusic;
    }
    Mix_Music* music = Mix_LoadMUS(path.string().c_str());
    if (!music) {
        m_lastError = Mix_GetError();
        return kInvalidMusic;
    }
    const MusicHandle handle = m_nextHandle++;
    m_music.emplace(handle, music);
    return handle;
}

void SdlMixerAudioDevice::ReleaseMusic(MusicHandle music) {
    auto it = m_music.find(music);
    if (it == m_music.end()) {
        return;
    }
    // Mix_FreeMusic halts the track itself if it is the one playing.
    Mix_FreeMusic(it->second);
    m_music.erase(it);
}

Voice SdlMixerAudioDevice::PlaySound(SoundHandle sound, float volume, float pan, bool loop) {
    if (!m_available) {
        return {};
    }
    auto it = m_sounds.find(sound);
    if (it == m_sounds.end()) {
        m_lastError = "unknown sound handle";
        return {};
    }

    const int channel = Mix_PlayChannel(-1, it->second, loop ? -1 : 0);
    if (channel < 0 || channel >= kChannelCount) {
        m_lastError = Mix_GetError();
        return {};
    }

    Mix_Volume(channel, ToMixVolume(volume));
    const float p = std::clamp(pan, -1.0f, 1.0f);
    const auto left = static_cast<std::uint8_t>(255.0f * (p > 0.0f ? 1.0f - p : 1.0f));
    const auto right = static_cast<std::uint8_t>(255.0f * (p < 0.0f ? 1.0f + p : 1.0f));
    // Panning is a channel effect and outlives the chunk; always reset it.
    Mix_SetPanning(channel, left, right);

    const Voice voice{channel, m_nextSerial++};
    m_channelSerials[static_cast<std::size_t>(channel)] = voice.serial;
    return voice;
}

bool SdlMixerAudioDevice::IsVoicePlaying(const Voice& voice) const {
    return OwnsChannel(voice) && Mix_Playing(voice.channel) != 0;
}

void SdlMixerAudioDevice::StopVoice(const Voice& voice) {
    if (OwnsChannel(voice)) {
        Mix_HaltChannel(voice.channel);
    }
}

void SdlMixerAudioDevice::SetVoiceVolume(const Voice& voice, float volume) {
    if (OwnsChannel(voice)) {
        Mix_Volume(voice.channel, ToMixVolume(volume));
    }
}

void SdlMixerAudioDevice::PauseChannels() {
    if (m_available) {
        Mix_Pause(-1);
    }
}

void SdlMixerAudioDevice::ResumeChannels() {
    if (m_available) {
        Mix_Resume(-1);
    }
}

bool SdlMixerAudioDevice::PlayMusic(MusicHandle music, bool repeat) {
    if (!m_available) {
        return false;
    }
    auto it = m_music.find(music);
    if (it == m_music.end()) {
        m_lastError = "unknown music handle";
        return false;
    }
    if (Mix_PlayMusic(it->second, repeat ? -1 : 1) != 0) {
        m_lastError = Mix_GetError();
        return false;
    }
    return true;
}

void SdlMixerAudioDevice::StopMusic() {
    if (m_available) {
        Mix_HaltMusic();
    }
}

void SdlMixerAudioDevice::PauseMusic() {
    if (m_available) {
        Mix_PauseMusic();
    }
}

void SdlMixerAudioDevice::ResumeMusic() {
    if (m_available) {
        Mix_ResumeMusic();
    }
}

void SdlMixerAudioDevice::SetMusicVolume(float volume) {
    if (m_available) {
        Mix_VolumeMusic(ToMixVolume(volume));
    }
}

void SdlMixerAudioDevice::Close() {
    if (m_available) {
        Mix_HaltChannel(-1);
        Mix_HaltMusic();
        Mix_CloseAudio();
        m_channelSerials.fill(0);
        m_available = false;
        core::Logger::Debug("[Audio] Mixer closed");
    }
    if (m_subsystemStarted) {
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        m_subsystemStarted = false;
    }
}

bool SdlMixerAudioDevice::OwnsChannel(const Voice& voice) const {
    return m_available && voice.channel >= 0 && voice.channel < kChannelCount &&
           voice.serial != 0 &&
           m_channelSerials[static_cast<std::size_t>(voice.channel)] == voice.serial;
}

} // namespace gw::audio
