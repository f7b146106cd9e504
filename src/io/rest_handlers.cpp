#include "rest_handlers.h"
#include <json/json.h>

namespace {

crow::response json_response(const Json::Value& body) {
  crow::response resp(200, body.toStyledString());
  resp.add_header("Content-Type", "application/json");
  return resp;
}

} // namespace

void RestApi::registerRoutes(crow::SimpleApp& app) {
  CROW_ROUTE(app, "/api/v1/bays").methods("GET"_method)([this]() {
    return getBays();
  });

  CROW_ROUTE(app, "/api/v1/stats").methods("GET"_method)([this]() {
    return getStats();
  });

  CROW_ROUTE(app, "/api/v1/config").methods("GET"_method)([this]() {
    return getConfig();
  });

  CROW_ROUTE(app, "/api/v1/summary").methods("GET"_method)([this]() {
    return getSummary();
  });
}

crow::response RestApi::getBays() {
  return json_response(store_.bays());
}

crow::response RestApi::getStats() {
  return json_response(store_.stats());
}

crow::response RestApi::getConfig() {
  return json_response(store_.config());
}

crow::response RestApi::getSummary() {
  return json_response(store_.summary());
}
