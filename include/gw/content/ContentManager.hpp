#pragma once
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace gw {

namespace graphics {
class GraphicsDevice;
class Texture2D;
}
namespace audio {
class AudioDevice;
class SoundEffect;
class Song;
}

namespace content {

// Devices the loaders need. Shared between every ContentManager of a Core and
// filled in once the devices exist.
struct ContentServices {
    graphics::GraphicsDevice* graphicsDevice = nullptr;
    audio::AudioDevice* audioDevice = nullptr;
};

/**
 * @brief Loads assets by name relative to a root directory and caches them.
 *
 * Supported types: graphics::Texture2D, audio::SoundEffect and audio::Song.
 * A name resolves to `root/name` first, then to `root/name` plus each known
 * extension of the requested type. Loading the same name twice returns the
 * same object until it is unloaded.
 */
class ContentManager {
public:
    static constexpr const char* kDefaultRootDirectory = "Content";

    explicit ContentManager(std::filesystem::path rootDirectory = kDefaultRootDirectory,
                            std::shared_ptr<ContentServices> services = nullptr);
    ~ContentManager();

    ContentManager(const ContentManager&) = delete;
    ContentManager& operator=(const ContentManager&) = delete;

    // Throws ContentLoadError when the asset is missing or cannot be decoded,
    // InvalidOperationError when disposed or the required device is absent.
    template <typename T>
    std::shared_ptr<T> Load(const std::string& assetName);

    template <typename T>
    bool IsLoaded(const std::string& assetName) const;

    // Drops every cached asset. Objects still referenced elsewhere stay alive.
    void Unload();
    bool UnloadAsset(const std::string& assetName);
    void Dispose();

    bool IsDisposed() const { return m_disposed; }
    std::size_t LoadedAssetCount() const;

    const std::filesystem::path& RootDirectory() const { return m_rootDirectory; }
    void SetRootDirectory(std::filesystem::path rootDirectory);

    const std::shared_ptr<ContentServices>& Services() const { return m_services; }

private:
    template <typename T>
    using Cache = std::unordered_map<std::string, std::shared_ptr<T>>;

    template <typename T>
    Cache<T>& CacheFor();
    template <typename T>
    const Cache<T>& CacheFor() const;

    std::filesystem::path ResolvePath(const std::string& assetName,
                                      const char* assetType,
                                      const std::vector<std::string>& extensions) const;

    std::filesystem::path m_rootDirectory;
    std::shared_ptr<ContentServices> m_services;
    Cache<graphics::Texture2D> m_textures;
    Cache<audio::SoundEffect> m_soundEffects;
    Cache<audio::Song> m_songs;
    bool m_disposed = false;
};

} // namespace content
} // namespace gw
