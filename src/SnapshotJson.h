#pragma once

#include <string>

#include "Device.h"

// One NDJSON detection line (no trailing newline):
// {"timestamp":..., "pwnagotchis":[...], "flippers":[...]}
std::string BuildDetectionLine(const RegistrySnapshot& snap, const std::string& timestamp);

// Detection shape plus "current_gps" (fix or null) and "counts".
std::string BuildQueryResponse(const RegistrySnapshot& snap,
                               const std::string& timestamp,
                               const LocationFix* current);

// {"Latitude":..,"Longitude":..,"Altitude":..,"Time":..,"Satellites":..}
std::string BuildFixDocument(const LocationFix& fix);
