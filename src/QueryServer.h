#pragma once

#include <string>

#include <ESPAsyncWebServer.h>

#include "IngestionPipeline.h"

// Read-only snapshot endpoint on the soft AP.
class QueryServer {
public:
  QueryServer();
  bool begin(IngestionPipeline* pipeline, const std::string& ssid, const std::string& password);

private:
  AsyncWebServer _server;
  IngestionPipeline* _pipeline = nullptr;
};
