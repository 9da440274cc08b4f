#include "gw/scenes/Scene.hpp"

#include <utility>

#include "gw/content/ContentManager.hpp"
#include "gw/core/Core.hpp"
#include "gw/core/Logger.hpp"

namespace gw {
namespace scenes {

Scene::Scene(core::Core& core, std::string name)
    : m_core(core),
      m_content(std::make_unique<content::ContentManager>(core.Content().RootDirectory(),
                                                          core.Content().Services())),
      m_name(std::move(name)) {}

Scene::~Scene() = default;

void Scene::Initialize() {
    if (m_initialized) {
        core::Logger::Warning("[Scene] '{}' initialized twice; ignoring", m_name);
        return;
    }
    core::Logger::Debug("[Scene] Initializing '{}'", m_name);
    LoadContent();
    m_initialized = true;
}

void Scene::UnloadContent() {
    m_content->Unload();
}

void Scene::Dispose() {
    if (m_disposed) {
        return;
    }
    UnloadContent();
    m_content->Dispose();
    m_disposed = true;
    core::Logger::Debug("[Scene] Disposed '{}'", m_name);
}

} // namespace scenes
} // namespace gw
