#include "ws_handlers.h"
#include <iostream>

void LiveWs::registerWebSocketRoutes(crow::SimpleApp& app) {
  CROW_WEBSOCKET_ROUTE(app, "/ws")
    .onopen([this](crow::websocket::connection& conn) {
      handleNewConnection(conn);
    })
    // Newer Crow releases pass a close code after the reason.
    .onclose([this](crow::websocket::connection& conn, const std::string& reason, auto&&...) {
      handleConnectionClosed(conn, reason);
    })
    .onmessage([this](crow::websocket::connection& conn, const std::string& data, bool is_binary) {
      handleNewMessage(conn, data, is_binary);
    });
}

void LiveWs::handleNewConnection(crow::websocket::connection& conn) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    conns_.insert(&conn);
  }
  std::cout << "[LiveWs] client connected (" << connectionCount() << " total)" << std::endl;
  sendSnapshotTo(conn);
}

void LiveWs::handleConnectionClosed(crow::websocket::connection& conn, const std::string& reason) {
  std::lock_guard<std::mutex> lk(mtx_);
  conns_.erase(&conn);
  std::cout << "[LiveWs] client closed: " << reason << std::endl;
}

void LiveWs::handleNewMessage(crow::websocket::connection& conn, const std::string& data, bool is_binary) {
  if (is_binary) return;

  Json::CharReaderBuilder b;
  std::unique_ptr<Json::CharReader> r(b.newCharReader());
  Json::Value j;
  std::string errs;
  const bool ok = r->parse(data.data(), data.data() + data.size(), &j, &errs);
  if (!ok || !j.isObject()) {
    Json::Value res;
    res["type"] = "error"; res["message"] = "expected a JSON object";
    conn.send_text(to_compact(res));
    return;
  }

  const auto t = j.get("type", "").asString();
  if (t == "bays.requestSnapshot") {
    sendSnapshotTo(conn);
    return;
  }
  if (t == "stats.request") {
    Json::Value res = store_.stats();
    res["type"] = "stats";
    conn.send_text(to_compact(res));
    return;
  }
  Json::Value res;
  res["type"] = "error"; res["ref"] = t; res["message"] = "unknown message type";
  conn.send_text(to_compact(res));
}

void LiveWs::sendSnapshotTo(crow::websocket::connection& conn) {
  Json::Value j = store_.bays();
  j["type"] = "bays";
  j["changes"] = Json::arrayValue;
  conn.send_text(to_compact(j));

  const Json::Value summary = store_.summary();
  if (!summary.empty()) conn.send_text(to_compact(summary));
}

void LiveWs::broadcast(std::string_view msg) {
  const std::string text{msg};
  std::lock_guard<std::mutex> lk(mtx_);
  for (auto* c : conns_) {
    c->send_text(text);
  }
}

void LiveWs::pushFrame(const FrameResult& r) {
  broadcast(to_compact(frame_lite_to_json(r)));
  broadcast(to_compact(bays_message(r)));
}

size_t LiveWs::connectionCount() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return conns_.size();
}
