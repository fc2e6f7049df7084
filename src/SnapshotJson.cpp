#include "SnapshotJson.h"

#include <ArduinoJson.h>

static void put_fix(JsonObject o, const LocationFix& f) {
  o["Latitude"] = f.latitude;
  o["Longitude"] = f.longitude;
  o["Altitude"] = f.altitude;
  o["Time"] = f.fix_time;
  o["Satellites"] = f.satellites;
}

static void put_gps(JsonObject o, const DeviceRecord& r) {
  if (r.has_fix) put_fix(o["gps"].to<JsonObject>(), r.fix);
  else o["gps"] = nullptr;
}

static void put_snapshot(JsonDocument& doc, const RegistrySnapshot& snap, const std::string& timestamp) {
  doc["timestamp"] = timestamp;

  JsonArray pwn = doc["pwnagotchis"].to<JsonArray>();
  for (const DeviceRecord& r : snap.pwn) {
    JsonObject o = pwn.add<JsonObject>();
    o["mac"] = r.address;
    o["name"] = r.name;
    o["rssi"] = r.rssi;
    o["last_seen"] = r.last_seen_s;
    put_gps(o, r);
  }

  JsonArray flippers = doc["flippers"].to<JsonArray>();
  for (const DeviceRecord& r : snap.flippers) {
    JsonObject o = flippers.add<JsonObject>();
    o["mac"] = r.address;
    o["name"] = r.name;
    o["type"] = CategoryName(r.category);
    o["rssi"] = r.rssi;
    o["last_seen"] = r.last_seen_s;
    put_gps(o, r);
  }
}

std::string BuildDetectionLine(const RegistrySnapshot& snap, const std::string& timestamp) {
  JsonDocument doc;
  put_snapshot(doc, snap, timestamp);

  std::string out;
  serializeJson(doc, out);
  return out;
}

std::string BuildQueryResponse(const RegistrySnapshot& snap,
                               const std::string& timestamp,
                               const LocationFix* current) {
  JsonDocument doc;
  put_snapshot(doc, snap, timestamp);

  if (current) put_fix(doc["current_gps"].to<JsonObject>(), *current);
  else doc["current_gps"] = nullptr;

  JsonObject counts = doc["counts"].to<JsonObject>();
  counts["pwnagotchis"] = snap.pwn.size();
  counts["flippers"] = snap.flippers.size();

  std::string out;
  serializeJson(doc, out);
  return out;
}

std::string BuildFixDocument(const LocationFix& fix) {
  JsonDocument doc;
  put_fix(doc.to<JsonObject>(), fix);

  std::string out;
  serializeJson(doc, out);
  return out;
}
