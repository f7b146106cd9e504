#pragma once
#include <crow.h>
#include "io/snapshot.h"

// Read-only REST surface of the viewer:
//   GET /api/v1/bays, GET /api/v1/stats, GET /api/v1/config, GET /api/v1/summary
class RestApi {
   SnapshotStore& store_;

  public:
    explicit RestApi(SnapshotStore& store) : store_(store) {}

    void registerRoutes(crow::SimpleApp& app);

  private:
    crow::response getBays();
    crow::response getStats();
    crow::response getConfig();
    crow::response getSummary();
};
