#include "config.hpp"
#include "core/corridor.hpp"
#include "modules/backend_module.hpp"
#include "modules/debug_module.hpp"
#include "modules/maze_module.hpp"
#include "modules/render_module.hpp"
#include <raylib.h>

static const char* CONFIG_PATH = "resources/config.json";

int main() {
  AppConfig config;
  if (!ConfigLoader::load(config, CONFIG_PATH)) {
    TraceLog(LOG_WARNING, "corridor: could not load '%s', using defaults", CONFIG_PATH);
  }

  // Module order matters:
  //   Backend first (runner, input resources, AppExit).
  //   Render before Debug so the overlay is drawn over the scene.
  //   Debug before Maze so the game can add its panel rows.
  corridor::App::create()
      .insert_resource(std::move(config))
      .add_module<BackendModule>()
      .add_module<RenderModule>()
      .add_module<DebugModule>()
      .add_module<MazeModule>()
      .run();

  return 0;
}
