#include "JsonDataSource.hpp"
#include "JsonLineReporter.hpp"
#include "PushupConfig.hpp"
#include "PushupSession.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// Usage: pushup_replay [frames.json] [config.json] [--fast]
int main(int argc, char** argv) {
  std::string frames_path = "data/sample_pose_frames.json";
  std::string config_path;
  bool fast = false;

  std::vector<std::string> positional;
  for (int i = 1; i < argc; i++) {
    if (std::strcmp(argv[i], "--fast") == 0) {
      fast = true;
    } else {
      positional.push_back(argv[i]);
    }
  }
  if (positional.size() > 0) frames_path = positional[0];
  if (positional.size() > 1) config_path = positional[1];

  try {
    PushupConfig cfg = config_path.empty() ? PushupConfig{} : loadConfig(config_path);
    std::cerr << "Config: " << configToJson(cfg).dump() << "\n";

    JsonDataSource source(frames_path);
    std::cerr << "Replaying " << source.size() << " frames from " << frames_path << "\n";

    JsonLineReporter reporter(std::cout);

    PoseFrame f{};
    if (!source.next(f)) throw std::runtime_error("No frames in " + frames_path);

    // session clock starts at the first frame
    PushupSession session(cfg, f.t_ms);
    session.setListener(&reporter);
    session.update(f);
    int64_t last_t = f.t_ms;

    while (source.next(f)) {
      // simulate real-time spacing based on t_ms in the JSON
      if (!fast) {
        int64_t dt = f.t_ms - last_t;
        if (dt > 0) {
          std::this_thread::sleep_for(std::chrono::milliseconds(dt));
        }
      }
      last_t = f.t_ms;

      session.update(f);
    }

    SessionSummary summary = session.stop(last_t);
    reporter.writeSummary(summary);

    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
