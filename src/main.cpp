#include <crow.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>
#include <pthread.h>
#include "config/config.h"
#include "core/errors.h"
#include "core/pipeline.h"
#include "core/session_source.h"
#include "io/nng_bus.h"
#include "io/rest_handlers.h"
#include "io/snapshot.h"
#include "io/ws_handlers.h"

namespace {

float parseFloatArg(const std::string& flag, const std::string& v) {
  try {
    return std::stof(v);
  } catch (const std::exception&) {
    throw ConfigError(flag + " expects a number, got '" + v + "'");
  }
}

// "ip" or "ip:port"
void parseLiveTarget(const std::string& v, SessionConfig& s) {
  const auto pos = v.find(':');
  s.host = v.substr(0, pos);
  if (pos != std::string::npos) {
    try {
      s.port = std::stoi(v.substr(pos + 1));
    } catch (const std::exception&) {
      throw ConfigError("--live: invalid port in '" + v + "'");
    }
    if (s.port <= 0 || s.port > 65535) throw ConfigError("--live: port out of range in '" + v + "'");
  }
}

void usage() {
  std::cout << "usage: radarbay_viewer --config <yaml> [--live <ipv4[:port]> | --playback <file>]\n"
               "                       [--x <m>] [--y <m>] [--height <m>] [--no-pacing] [--listen host:port]\n"
               "                       [--summary <json>]"
            << std::endl;
}

} // namespace

int main(int argc, char** argv) {
  std::string cfgPath = "./config/default.yaml";
  std::string httpListen = "";
  std::string live, playback, xArg, yArg, hArg, summaryPath;
  bool noPacing = false;

  for (int i=1;i<argc;++i){
    std::string a = argv[i];
    if(a=="--config" && i+1<argc) cfgPath = argv[++i];
    else if(a=="--listen" && i+1<argc) httpListen = argv[++i];
    else if(a=="--live" && i+1<argc) live = argv[++i];
    else if(a=="--playback" && i+1<argc) playback = argv[++i];
    else if(a=="--x" && i+1<argc) xArg = argv[++i];
    else if(a=="--y" && i+1<argc) yArg = argv[++i];
    else if(a=="--height" && i+1<argc) hArg = argv[++i];
    else if(a=="--summary" && i+1<argc) summaryPath = argv[++i];
    else if(a=="--no-pacing") noPacing = true;
    else if(a=="--help" || a=="-h") { usage(); return 0; }
    else { std::cerr << "[Viewer] unknown argument: " << a << std::endl; usage(); return 1; }
  }

  // SIGINT/SIGTERM are taken by a watcher thread, not by Crow or the loop.
  sigset_t sigs;
  sigemptyset(&sigs);
  sigaddset(&sigs, SIGINT);
  sigaddset(&sigs, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

  try {
    AppConfig appcfg = load_app_config(cfgPath);

    if (!live.empty() && !playback.empty()) throw ConfigError("--live and --playback are exclusive");
    if (!live.empty()) {
      appcfg.session.mode = SessionMode::Live;
      parseLiveTarget(live, appcfg.session);
    }
    if (!playback.empty()) {
      appcfg.session.mode = SessionMode::Playback;
      appcfg.session.archive = playback;
    }
    if (!xArg.empty()) {
      appcfg.session.x_extent = parseFloatArg("--x", xArg);
      appcfg.session.x_explicit = true;
    }
    if (!yArg.empty()) {
      appcfg.session.y_extent = parseFloatArg("--y", yArg);
      appcfg.session.y_explicit = true;
    }
    if (!hArg.empty()) {
      appcfg.session.sensor_height = parseFloatArg("--height", hArg);
      appcfg.session.height_explicit = true;
    }
    if (noPacing) appcfg.playback.realtime_pacing = false;
    if (!summaryPath.empty()) appcfg.summary.path = summaryPath;

    auto source = SessionSource::open(appcfg);
    OccupancyPipeline pipeline(appcfg);

    SnapshotStore store;
    store.setConfig(appcfg);

    std::vector<std::unique_ptr<NngBus>> buses;
    for (const auto& sink : appcfg.sinks) {
      auto bus = std::make_unique<NngBus>();
      bus->startPublisher(sink);
      if (bus->isEnabled()) buses.push_back(std::move(bus));
    }

    // Initialize CrowCpp application
    crow::SimpleApp app;
    app.signal_clear();

    LiveWs ws(store);
    RestApi rest(store);
    rest.registerRoutes(app);
    ws.registerWebSocketRoutes(app);

    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    auto parseListenAddress = [&](const std::string& url) {
      auto pos = url.find(":");
      if (pos != std::string::npos) {
        host = url.substr(0, pos);
        port = static_cast<uint16_t>(std::stoi(url.substr(pos + 1)));
      }
    };
    if (!httpListen.empty()) parseListenAddress(httpListen);
    else if (!appcfg.ui.listen.empty()) parseListenAddress(appcfg.ui.listen);

    std::cout << "[App] Starting HTTP server on host:" << host << " port:" << port << std::endl;
    app.bindaddr(host).port(port).multithreaded();
    auto server = app.run_async();

    std::atomic<bool> done{false};
    std::thread sigThread([&] {
      const timespec poll_interval{0, 200 * 1000 * 1000};
      while (!done) {
        const int sig = sigtimedwait(&sigs, nullptr, &poll_interval);
        if (sig == SIGINT || sig == SIGTERM) {
          std::cout << "[App] signal " << sig << ", stopping" << std::endl;
          source->requestStop();
          return;
        }
      }
    });

    auto finish = [&] {
      done = true;
      if (sigThread.joinable()) sigThread.join();
      app.stop();
      server.wait();
      for (auto& bus : buses) bus->stop();
    };

    // Summary of whatever was processed, also when the session gave up.
    auto report = [&] {
      const SessionSummary summary = pipeline.summary();
      store.setSummary(summary);
      ws.broadcast(to_compact(summary_to_json(summary)));
      std::cout << "[App] summary: " << summary.frames << " frames over " << summary.duration
                << " s, " << summary.targets << " targets, " << summary.heatmap.spots.size()
                << " hot spots" << std::endl;
      for (const auto& b : summary.bays) {
        std::cout << "[App]   bay " << b.id << ": occupied " << b.occupancy * 100.0f << "% ("
                  << b.occupied_frames << " frames), " << b.entries << " arrivals" << std::endl;
      }
      if (!appcfg.summary.path.empty()) {
        try {
          write_summary(appcfg.summary.path, summary);
          std::cout << "[App] summary written to " << appcfg.summary.path << std::endl;
        } catch (const StorageError& e) {
          std::cerr << "[App] " << e.what() << std::endl;
        }
      }
    };

    try {
      while (auto frame = source->nextFrame()) {
        try {
          const Handshake meta = source->metadata();
          if (meta != pipeline.metadata()) pipeline.setMetadata(meta);

          const FrameResult r = pipeline.process(*frame);
          store.update(r, source->mode(), source->stats(), pipeline.stats());
          ws.pushFrame(r);
          for (auto& bus : buses) bus->publishFrame(r);
        } catch (const std::exception& e) {
          std::cerr << "[Viewer] Error in frame seq=" << frame->seq << ": " << e.what() << std::endl;
        }
      }
    } catch (...) {
      report();
      finish();
      throw;
    }

    const auto st = source->stats();
    std::cout << "[App] session ended: frames=" << st.frames << " dropped=" << st.dropped
              << " malformed=" << st.malformed << " reconnects=" << st.reconnects
              << " occupied=" << pipeline.tracker().occupiedCount() << "/"
              << pipeline.tracker().bays().size() << std::endl;
    report();
    source->close();
    finish();
  } catch (const std::exception& e) {
    std::cerr << "[App] fatal: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
