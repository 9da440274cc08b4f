#pragma once
#include <filesystem>
#include <memory>
#include <string>

#include "gw/audio/AudioDevice.hpp"

namespace gw::audio {

// A streamed music track. Only one song plays at a time.
class Song {
public:
    Song(AudioDevice& device, MusicHandle handle, std::string name);
    ~Song();

    Song(const Song&) = delete;
    Song& operator=(const Song&) = delete;

    // Throws ContentLoadError when the device is unavailable or opening fails.
    static std::shared_ptr<Song> FromFile(AudioDevice& device,
                                          const std::filesystem::path& path);

    MusicHandle Handle() const { return m_handle; }
    const std::string& Name() const { return m_name; }

private:
    AudioDevice* m_device = nullptr;
    MusicHandle m_handle = kInvalidMusic;
    std::string m_name;
};

} // namespace gw::audio
