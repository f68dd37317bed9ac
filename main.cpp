#include "JsonLineReporter.hpp"
#include "PushupConfig.hpp"
#include "PushupSession.hpp"
#include "SerialDataSource.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

// Live counting from the pose estimator bridge.
// Expected line format (one per line), e.g.:
// {"t_ms":0,"keypoints":[{"x":0.41,"y":0.52,"visibility":0.93}, ... 12 or 33 entries]}
// {"t_ms":33,"keypoints":null}   <- no subject in view
//
// Usage: pushup_serial <device> [baud] [config.json]
int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <device> [baud] [config.json]\n";
    return 1;
  }

  std::string device = argv[1];
  unsigned int baud = 115200;
  std::string config_path;
  if (argc > 2) baud = static_cast<unsigned int>(std::strtoul(argv[2], nullptr, 10));
  if (argc > 3) config_path = argv[3];

  try {
    PushupConfig cfg = config_path.empty() ? PushupConfig{} : loadConfig(config_path);
    std::cerr << "Config: " << configToJson(cfg).dump() << "\n";

    SerialDataSource source(device, baud);
    JsonLineReporter reporter(std::cout);

    PoseFrame f{};
    if (!source.next(f)) {
      std::cerr << "Stream closed before the first frame\n";
      return 1;
    }

    PushupSession session(cfg, f.t_ms);
    session.setListener(&reporter);
    session.update(f);
    int64_t last_t = f.t_ms;

    // Serial timing is driven by the device, so no manual sleeps here.
    // The workout ends when the bridge closes the stream.
    while (source.next(f)) {
      last_t = f.t_ms;
      session.update(f);
    }

    if (source.skippedLines() > 0) {
      std::cerr << "Skipped " << source.skippedLines() << " malformed lines\n";
    }

    reporter.writeSummary(session.stop(last_t));
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error in main: " << e.what() << "\n";
    return 1;
  }
}
