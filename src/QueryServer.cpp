#include "QueryServer.h"

#include <WiFi.h>

#include "Log.h"

static constexpr const char* TAG = "web";

QueryServer::QueryServer() : _server(80) {}

bool QueryServer::begin(IngestionPipeline* pipeline, const std::string& ssid, const std::string& password) {
  _pipeline = pipeline;

  const char* pass = password.empty() ? nullptr : password.c_str();
  if (!WiFi.softAP(ssid.c_str(), pass)) {
    PD_LOGE(TAG, "softAP '%s' failed, query surface disabled", ssid.c_str());
    return false;
  }

  _server.on("/pwndetector", HTTP_GET, [this](AsyncWebServerRequest *request) {
    request->send(200, "application/json", _pipeline->query().c_str());
  });

  _server.onNotFound([](AsyncWebServerRequest *request) {
    request->send(404, "text/plain", "not found");
  });

  _server.begin();
  PD_LOGI(TAG, "query at http://%s/pwndetector", WiFi.softAPIP().toString().c_str());
  return true;
}
