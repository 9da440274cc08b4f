#pragma once

// Entry points a game needs to derive from Core and write scenes.
// Include the specific module headers for anything beyond that.

// Application bootstrap
#include "gw/core/Core.hpp"
#include "gw/core/Error.hpp"
#include "gw/core/Logger.hpp"

// Scenes and their content
#include "gw/scenes/Scene.hpp"
#include "gw/content/ContentManager.hpp"

// 2D drawing
#include "gw/graphics/SpriteBatch.hpp"
#include "gw/graphics/Texture2D.hpp"

// Audio
#include "gw/audio/AudioController.hpp"
