#include <atomic>
#include <csignal>
#include <iostream>
#include <mutex>
#include <string>
#include <pthread.h>
#include "config/config.h"
#include "core/errors.h"
#include "core/sensor_manager.h"
#include "io/archive.h"
#include "io/frame_server.h"

namespace {

void usage() {
  std::cout << "usage: radarbay_node --config <yaml> [--radar-config <file>] [--record-dir <dir>] [--no-record]"
            << std::endl;
}

} // namespace

int main(int argc, char** argv) {
  std::string cfgPath = "./config/node.yaml";
  std::string radarConfig, recordDir;
  bool noRecord = false;

  for (int i=1;i<argc;++i){
    std::string a = argv[i];
    if(a=="--config" && i+1<argc) cfgPath = argv[++i];
    else if(a=="--radar-config" && i+1<argc) radarConfig = argv[++i];
    else if(a=="--record-dir" && i+1<argc) recordDir = argv[++i];
    else if(a=="--no-record") noRecord = true;
    else if(a=="--help" || a=="-h") { usage(); return 0; }
    else { std::cerr << "[Node] unknown argument: " << a << std::endl; usage(); return 1; }
  }

  sigset_t sigs;
  sigemptyset(&sigs);
  sigaddset(&sigs, SIGINT);
  sigaddset(&sigs, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

  try {
    AppConfig appcfg = load_app_config(cfgPath);
    if (!radarConfig.empty()) appcfg.sensor.radar_config = radarConfig;
    if (!recordDir.empty()) appcfg.recording.dir = recordDir;
    if (noRecord) appcfg.recording.enabled = false;

    const Handshake hs{appcfg.session.x_extent, appcfg.session.y_extent, appcfg.session.sensor_height};

    ArchiveWriter recorder;
    if (appcfg.recording.enabled) {
      recorder.open(next_recording_path(appcfg.recording.dir), hs);
    }

    FrameServer server(appcfg.network, hs);
    if (!server.start()) {
      throw StorageError("cannot serve frames on " + appcfg.network.listen + ":" +
                         std::to_string(appcfg.network.port));
    }

    std::mutex errMu;
    std::string storageError;
    std::atomic<bool> failed{false};

    SensorManager sensors(appcfg.sensor);
    const bool started = sensors.start([&](const Frame& f) {
      if (recorder.isOpen() && !failed) {
        try {
          recorder.append(f);
        } catch (const StorageError& e) {
          std::lock_guard<std::mutex> lk(errMu);
          storageError = std::string(e.what()) + " after " + std::to_string(recorder.framesWritten()) +
                         " recorded frames";
          failed = true;
          return;
        }
      }
      server.publish(f);
    });
    if (!started) {
      throw ConfigError("sensor '" + appcfg.sensor.id + "' (type " + appcfg.sensor.type + ") did not start");
    }

    const timespec poll_interval{0, 200 * 1000 * 1000};
    while (!failed && sensors.isRunning()) {
      const int sig = sigtimedwait(&sigs, nullptr, &poll_interval);
      if (sig == SIGINT || sig == SIGTERM) {
        std::cout << "[Node] signal " << sig << ", stopping" << std::endl;
        break;
      }
    }

    sensors.stop();
    server.stop();
    recorder.close();

    if (failed) {
      std::lock_guard<std::mutex> lk(errMu);
      throw StorageError(storageError);
    }
    const auto st = server.stats();
    std::cout << "[Node] done: frames=" << sensors.framesProduced() << " sent=" << st.sent
              << " dropped=" << st.dropped << " clients=" << st.clients << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "[Node] fatal: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
