#pragma once
#include <memory>
#include <string>

#include "gw/core/GameTime.hpp"

namespace gw {

namespace core {
class Core;
}
namespace content {
class ContentManager;
}

namespace scenes {

/**
 * @brief Base class for a game screen driven by the Core.
 *
 * Each scene owns a ContentManager rooted at the Core's content root, so
 * everything it loads is released when the scene is disposed. Scenes only
 * receive Update and Draw while active; the Core disposes the outgoing scene
 * between frames.
 */
class Scene {
public:
    explicit Scene(core::Core& core, std::string name = "Unnamed Scene");
    virtual ~Scene();

    Scene(const Scene&) = delete;
    Scene& operator=(const Scene&) = delete;

    // Loads content; runs once when the scene becomes active.
    virtual void Initialize();
    virtual void LoadContent() {}
    // Releases everything loaded through Content().
    virtual void UnloadContent();

    virtual void Update(const core::GameTime& gameTime) { (void)gameTime; }
    virtual void Draw(const core::GameTime& gameTime) { (void)gameTime; }

    // Unloads content and disposes the content manager. Idempotent.
    void Dispose();

    const std::string& GetName() const { return m_name; }
    bool IsInitialized() const { return m_initialized; }
    bool IsDisposed() const { return m_disposed; }

protected:
    core::Core& GetCore() const { return m_core; }
    content::ContentManager& Content() const { return *m_content; }

private:
    core::Core& m_core;
    std::unique_ptr<content::ContentManager> m_content;
    std::string m_name;
    bool m_initialized = false;
    bool m_disposed = false;
};

} // namespace scenes
} // namespace gw
