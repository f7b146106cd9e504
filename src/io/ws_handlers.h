#pragma once
#include <crow.h>
#include <json/json.h>
#include <mutex>
#include <string_view>
#include <unordered_set>
#include "core/pipeline.h"
#include "io/snapshot.h"

// WebSocket endpoint /ws. Pushes a "frame-lite" and a "bays" message per
// processed frame and one "summary" when the session ends; a new connection
// first receives the current bays and the summary if there is one.
class LiveWs {
   SnapshotStore& store_;
 public:
   explicit LiveWs(SnapshotStore& store) : store_(store) {}

   void registerWebSocketRoutes(crow::SimpleApp& app);

   void handleNewConnection(crow::websocket::connection& conn);
   void handleConnectionClosed(crow::websocket::connection& conn, const std::string& reason);
   void handleNewMessage(crow::websocket::connection& conn, const std::string& data, bool is_binary);

   void broadcast(std::string_view msg);
   void pushFrame(const FrameResult& r);
   size_t connectionCount() const;

 private:
   void sendSnapshotTo(crow::websocket::connection& conn);

   mutable std::mutex mtx_;
   std::unordered_set<crow::websocket::connection*> conns_;
};
