#include "gw/audio/Song.hpp"

#include <utility>

#include "gw/core/Error.hpp"

namespace gw::audio {

Song::Song(AudioDevice& device, MusicHandle handle, std::string name)
    : m_device(&device), m_handle(handle), m_name(std::move(name)) {}

Song::~Song() {
    if (m_device && m_handle != kInvalidMusic) {
        m_device->ReleaseMusic(m_handle);
    }
}

std::shared_ptr<Song> Song::FromFile(AudioDevice& device, const std::filesystem::path& path) {
    const std::string name = path.string();
    if (!device.IsAvailable()) {
        throw core::ContentLoadError("Song", name, "audio device unavailable");
    }
    const MusicHandle handle = device.LoadMusic(path);
    if (handle == kInvalidMusic) {
        throw core::ContentLoadError("Song", name, device.LastError());
    }
    return std::make_shared<Song>(device, handle, path.stem().string());
}

} // namespace gw::audio
