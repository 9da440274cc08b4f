#include "gw/audio/AudioController.hpp"

#include <algorithm>
#include <utility>

#include "gw/core/Logger.hpp"

namespace gw::audio {

AudioController::AudioController(std::unique_ptr<AudioDevice> device)
    : m_device(std::move(device)) {
    if (!m_device) {
        core::Logger::Warning("[Audio] No audio device supplied; audio calls will be ignored");
    } else if (!m_device->IsAvailable()) {
        core::Logger::Warning("[Audio] Audio device unavailable: {}", m_device->LastError());
    }
    ApplyVolumes();
}

AudioController::~AudioController() {
    Dispose();
}

void AudioController::Update() {
    if (m_disposed) {
        return;
    }
    m_activeInstances.erase(
        std::remove_if(m_activeInstances.begin(), m_activeInstances.end(),
                       [](const std::shared_ptr<SoundEffectInstance>& instance) {
                           return instance->IsStopped();
                       }),
        m_activeInstances.end());
}

std::shared_ptr<SoundEffectInstance> AudioController::PlaySoundEffect(const SoundEffect& soundEffect,
                                                                      float volume,
                                                                      float pan,
                                                                      bool isLooped) {
    if (!CheckUsable("PlaySoundEffect")) {
        return nullptr;
    }
    const float effective = m_muted ? 0.0f : m_soundEffectVolume;
    const float clampedVolume = std::clamp(volume, 0.0f, 1.0f);
    const Voice voice = m_device->PlaySound(soundEffect.Handle(), clampedVolume * effective,
                                            pan, isLooped);
    if (!voice.IsValid()) {
        core::Logger::Warning("[Audio] Could not play '{}': {}", soundEffect.Name(),
                              m_device->LastError());
        return nullptr;
    }

    auto instance = std::make_shared<SoundEffectInstance>(*m_device, voice, clampedVolume,
                                                          pan, isLooped);
    instance->m_masterVolume = effective;
    m_activeInstances.push_back(instance);
    return instance;
}

void AudioController::PlaySong(const Song& song, bool isRepeating) {
    if (!CheckUsable("PlaySong")) {
        return;
    }
    if (!m_device->PlayMusic(song.Handle(), isRepeating)) {
        core::Logger::Warning("[Audio] Could not play song '{}': {}", song.Name(),
                              m_device->LastError());
        return;
    }
    m_device->SetMusicVolume(SongVolume());
    core::Logger::Debug("[Audio] Playing song '{}' (repeat={})", song.Name(), isRepeating);
}

void AudioController::PauseAudio() {
    if (!CheckUsable("PauseAudio")) {
        return;
    }
    m_device->PauseMusic();
    m_device->PauseChannels();
    m_paused = true;
}

void AudioController::ResumeAudio() {
    if (!CheckUsable("ResumeAudio")) {
        return;
    }
    m_device->ResumeMusic();
    m_device->ResumeChannels();
    m_paused = false;
}

void AudioController::MuteAudio() {
    if (!CheckUsable("MuteAudio")) {
        return;
    }
    m_muted = true;
    ApplyVolumes();
}

void AudioController::UnmuteAudio() {
    if (!CheckUsable("UnmuteAudio")) {
        return;
    }
    m_muted = false;
    ApplyVolumes();
}

void AudioController::ToggleMute() {
    if (m_muted) {
        UnmuteAudio();
    } else {
        MuteAudio();
    }
}

float AudioController::SongVolume() const {
    return m_muted ? 0.0f : m_songVolume;
}

void AudioController::SetSongVolume(float volume) {
    if (!CheckUsable("SetSongVolume")) {
        return;
    }
    m_songVolume = std::clamp(volume, 0.0f, 1.0f);
    ApplyVolumes();
}

float AudioController::SoundEffectVolume() const {
    return m_muted ? 0.0f : m_soundEffectVolume;
}

void AudioController::SetSoundEffectVolume(float volume) {
    if (!CheckUsable("SetSoundEffectVolume")) {
        return;
    }
    m_soundEffectVolume = std::clamp(volume, 0.0f, 1.0f);
    ApplyVolumes();
}

void AudioController::Dispose() {
    if (m_disposed) {
        return;
    }
    for (auto& instance : m_activeInstances) {
        instance->Stop();
        instance->Detach();
    }
    m_activeInstances.clear();

    if (m_device) {
        m_device->StopMusic();
        m_device->Close();
    }
    m_disposed = true;
    core::Logger::Debug("[Audio] Controller disposed");
}

bool AudioController::CheckUsable(const char* operation) const {
    if (m_disposed) {
        core::Logger::Warning("[Audio] {} called after the audio controller was disposed", operation);
        return false;
    }
    return m_device != nullptr;
}

void AudioController::ApplyVolumes() {
    if (!m_device) {
        return;
    }
    m_device->SetMusicVolume(SongVolume());
    const float effectVolume = SoundEffectVolume();
    for (auto& instance : m_activeInstances) {
        instance->ApplyMasterVolume(effectVolume);
    }
}

} // namespace gw::audio
