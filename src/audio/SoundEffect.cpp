#include "gw/audio/SoundEffect.hpp"

#include <algorithm>
#include <utility>

#include "gw/core/Error.hpp"

namespace gw::audio {

SoundEffect::SoundEffect(AudioDevice& device, SoundHandle handle, std::string name)
    : m_device(&device), m_handle(handle), m_name(std::move(name)) {}

SoundEffect::~SoundEffect() {
    if (m_device && m_handle != kInvalidSound) {
        m_device->ReleaseSound(m_handle);
    }
}

std::shared_ptr<SoundEffect> SoundEffect::FromFile(AudioDevice& device,
                                                   const std::filesystem::path& path) {
    const std::string name = path.string();
    if (!device.IsAvailable()) {
        throw core::ContentLoadError("SoundEffect", name, "audio device unavailable");
    }
    const SoundHandle handle = device.LoadSound(path);
    if (handle == kInvalidSound) {
        throw core::ContentLoadError("SoundEffect", name, device.LastError());
    }
    return std::make_shared<SoundEffect>(device, handle, path.stem().string());
}

SoundEffectInstance::SoundEffectInstance(AudioDevice& device, Voice voice, float volume,
                                         float pan, bool looped)
    : m_device(&device),
      m_voice(voice),
      m_volume(std::clamp(volume, 0.0f, 1.0f)),
      m_pan(std::clamp(pan, -1.0f, 1.0f)),
      m_looped(looped),
      m_stopped(!voice.IsValid()) {}

bool SoundEffectInstance::IsPlaying() const {
    return !m_stopped && m_device && m_device->IsVoicePlaying(m_voice);
}

void SoundEffectInstance::SetVolume(float volume) {
    m_volume = std::clamp(volume, 0.0f, 1.0f);
    if (IsPlaying()) {
        m_device->SetVoiceVolume(m_voice, m_volume * m_masterVolume);
    }
}

void SoundEffectInstance::Stop() {
    if (IsPlaying()) {
        m_device->StopVoice(m_voice);
    }
    m_stopped = true;
}

void SoundEffectInstance::ApplyMasterVolume(float masterVolume) {
    m_masterVolume = masterVolume;
    if (IsPlaying()) {
        m_device->SetVoiceVolume(m_voice, m_volume * m_masterVolume);
    }
}

void SoundEffectInstance::Detach() {
    m_stopped = true;
    m_device = nullptr;
}

} // namespace gw::audio
