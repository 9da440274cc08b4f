#include "gw/content/ContentManager.hpp"

#include <system_error>
#include <utility>

#include "gw/audio/Song.hpp"
#include "gw/audio/SoundEffect.hpp"
#include "gw/core/Error.hpp"
#include "gw/core/Logger.hpp"
#include "gw/graphics/Texture2D.hpp"

namespace gw::content {

namespace {

bool IsRegularFile(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

} // namespace

template <typename T>
struct ContentTraits;

template <>
struct ContentTraits<graphics::Texture2D> {
    static constexpr const char* Name = "Texture2D";

    static const std::vector<std::string>& Extensions() {
        static const std::vector<std::string> extensions{".png", ".jpg", ".jpeg", ".bmp", ".tga"};
        return extensions;
    }

    static std::shared_ptr<graphics::Texture2D> Create(const ContentServices& services,
                                                       const std::string& assetName,
                                                       const std::filesystem::path& path) {
        if (!services.graphicsDevice) {
            throw core::InvalidOperationError("Loading a Texture2D requires a graphics device");
        }
        try {
            return graphics::Texture2D::FromFile(*services.graphicsDevice, path);
        } catch (const core::GraphicsError& e) {
            throw core::ContentLoadError(Name, assetName, std::string(e.details()));
        }
    }
};

template <>
struct ContentTraits<audio::SoundEffect> {
    static constexpr const char* Name = "SoundEffect";

    static const std::vector<std::string>& Extensions() {
        static const std::vector<std::string> extensions{".wav", ".ogg", ".mp3", ".flac"};
        return extensions;
    }

    static std::shared_ptr<audio::SoundEffect> Create(const ContentServices& services,
                                                      const std::string& assetName,
                                                      const std::filesystem::path& path) {
        if (!services.audioDevice) {
            throw core::InvalidOperationError("Loading a SoundEffect requires an audio device");
        }
        try {
            return audio::SoundEffect::FromFile(*services.audioDevice, path);
        } catch (const core::ContentLoadError& e) {
            throw core::ContentLoadError(Name, assetName, std::string(e.details()));
        }
    }
};

template <>
struct ContentTraits<audio::Song> {
    static constexpr const char* Name = "Song";

    static const std::vector<std::string>& Extensions() {
        static const std::vector<std::string> extensions{".ogg", ".mp3", ".wav", ".flac"};
        return extensions;
    }

    static std::shared_ptr<audio::Song> Create(const ContentServices& services,
                                               const std::string& assetName,
                                               const std::filesystem::path& path) {
        if (!services.audioDevice) {
            throw core::InvalidOperationError("Loading a Song requires an audio device");
        }
        try {
            return audio::Song::FromFile(*services.audioDevice, path);
        } catch (const core::ContentLoadError& e) {
            throw core::ContentLoadError(Name, assetName, std::string(e.details()));
        }
    }
};

template <>
ContentManager::Cache<graphics::Texture2D>& ContentManager::CacheFor<graphics::Texture2D>() {
    return m_textures;
}
template <>
const ContentManager::Cache<graphics::Texture2D>& ContentManager::CacheFor<graphics::Texture2D>() const {
    return m_textures;
}
template <>
ContentManager::Cache<audio::SoundEffect>& ContentManager::CacheFor<audio::SoundEffect>() {
    return m_soundEffects;
}
template <>
const ContentManager::Cache<audio::SoundEffect>& ContentManager::CacheFor<audio::SoundEffect>() const {
    return m_soundEffects;
}
template <>
ContentManager::Cache<audio::Song>& ContentManager::CacheFor<audio::Song>() {
    return m_songs;
}
template <>
const ContentManager::Cache<audio::Song>& ContentManager::CacheFor<audio::Song>() const {
    return m_songs;
}

ContentManager::ContentManager(std::filesystem::path rootDirectory,
                               std::shared_ptr<ContentServices> services)
    : m_rootDirectory(std::move(rootDirectory)),
      m_services(services ? std::move(services) : std::make_shared<ContentServices>()) {}

ContentManager::~ContentManager() {
    Dispose();
}

template <typename T>
std::shared_ptr<T> ContentManager::Load(const std::string& assetName) {
    using Traits = ContentTraits<T>;
    if (m_disposed) {
        throw core::InvalidOperationError("ContentManager::Load called after Dispose");
    }
    if (assetName.empty()) {
        throw core::ContentLoadError(Traits::Name, assetName, "asset name is empty");
    }

    auto& cache = CacheFor<T>();
    if (auto it = cache.find(assetName); it != cache.end()) {
        return it->second;
    }

    const auto path = ResolvePath(assetName, Traits::Name, Traits::Extensions());
    auto asset = Traits::Create(*m_services, assetName, path);
    cache.emplace(assetName, asset);
    core::Logger::Debug("[ContentManager] Loaded {} '{}' from {}", Traits::Name, assetName, path.string());
    return asset;
}

template <typename T>
bool ContentManager::IsLoaded(const std::string& assetName) const {
    const auto& cache = CacheFor<T>();
    return cache.find(assetName) != cache.end();
}

template std::shared_ptr<graphics::Texture2D> ContentManager::Load<graphics::Texture2D>(const std::string&);
template std::shared_ptr<audio::SoundEffect> ContentManager::Load<audio::SoundEffect>(const std::string&);
template std::shared_ptr<audio::Song> ContentManager::Load<audio::Song>(const std::string&);
template bool ContentManager::IsLoaded<graphics::Texture2D>(const std::string&) const;
template bool ContentManager::IsLoaded<audio::SoundEffect>(const std::string&) const;
template bool ContentManager::IsLoaded<audio::Song>(const std::string&) const;

void ContentManager::Unload() {
    const std::size_t count = LoadedAssetCount();
    m_textures.clear();
    m_soundEffects.clear();
    m_songs.clear();
    if (count > 0) {
        core::Logger::Debug("[ContentManager] Unloaded {} asset(s) from {}", count, m_rootDirectory.string());
    }
}

bool ContentManager::UnloadAsset(const std::string& assetName) {
    const std::size_t removed = m_textures.erase(assetName)
                              + m_soundEffects.erase(assetName)
                              + m_songs.erase(assetName);
    return removed > 0;
}

void ContentManager::Dispose() {
    if (m_disposed) {
        return;
    }
    Unload();
    m_disposed = true;
}

std::size_t ContentManager::LoadedAssetCount() const {
    return m_textures.size() + m_soundEffects.size() + m_songs.size();
}

void ContentManager::SetRootDirectory(std::filesystem::path rootDirectory) {
    if (LoadedAssetCount() > 0) {
        core::Logger::Warning("[ContentManager] Root directory changed to {} with assets still cached",
                              rootDirectory.string());
    }
    m_rootDirectory = std::move(rootDirectory);
}

std::filesystem::path ContentManager::ResolvePath(const std::string& assetName,
                                                  const char* assetType,
                                                  const std::vector<std::string>& extensions) const {
    const std::filesystem::path exact = m_rootDirectory / assetName;
    if (IsRegularFile(exact)) {
        return exact;
    }
    for (const auto& extension : extensions) {
        std::filesystem::path candidate = exact;
        candidate += extension;
        if (IsRegularFile(candidate)) {
            return candidate;
        }
    }
    throw core::ContentLoadError(assetType, assetName,
                                 "file not found under '" + m_rootDirectory.string() + "'");
}

} // namespace gw::content
