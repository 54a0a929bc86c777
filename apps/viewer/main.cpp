#include <raylib.h>
#include <utility>
#include <vector>
#include <hcr/level.hpp>
#include <hcr/session_runner.hpp>
#include <hcr/viewer/app.hpp>

using namespace hcr;

// Usage: hcr_viewer [levels.csv]
int main(int argc, char** argv) {
  std::vector<LevelParams> catalog = level_catalog();
  if (argc > 1) {
    if (auto loaded = load_level_catalog_csv(argv[1]); !loaded) {
      TraceLog(LOG_WARNING, "HCR: cannot open level catalog '%s', using built-in levels", argv[1]);
    } else if (loaded->empty()) {
      TraceLog(LOG_WARNING, "HCR: no usable rows in '%s', using built-in levels", argv[1]);
    } else {
      TraceLog(LOG_INFO, "HCR: loaded %d levels from '%s'", static_cast<int>(loaded->size()), argv[1]);
      catalog = std::move(*loaded);
    }
  }

  SessionRunner runner(std::move(catalog));
  runner.start_level(0);

  ViewerApp app(runner);
  return app.run();
}
