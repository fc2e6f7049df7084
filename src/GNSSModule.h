#ifndef GNSSMODULE_H
#define GNSSMODULE_H

#include <Arduino.h>
#include <TinyGPS++.h>
#include <HardwareSerial.h>

#include "LocationCorrelator.h"

struct GnssFixSnapshot {
  int mode;             // 0/1 none, 2 = 2D, 3 = 3D
  double lat, lon;
  double alt_m;
  int sats;
  char time_iso[32];    // "YYYY-MM-DDTHH:MM:SS.ccZ" or ""
  uint32_t last_update_ms;
};

// UART GNSS receiver decoded by TinyGPS++ on a background task.
class GNSSModule : public LocationSource {
private:
    TinyGPSPlus gps;
    TinyGPSCustom gsaModeGP;   // $GPGSA field 2: 1 none, 2 2D, 3 3D
    TinyGPSCustom gsaModeGN;   // same on multi-constellation receivers
    HardwareSerial* gpsSerial;
    bool isInitialized;

    // GPS UART configuration
    int rxPin;
    int txPin;
    uint32_t baudRate;

public:
    GNSSModule();
    ~GNSSModule() override;

    // Initialize GPS with specified pins and baud rate
    void begin(uint32_t baud = 9600, int rx = 1, int tx = 2);
    GnssFixSnapshot snapshot() const;

    // LocationSource
    bool available() const override;
    bool fetch(RawFix& out, uint32_t timeout_ms) override;
    const char* describe() const override { return "gnss-uart"; }

private:
    static void taskThunk(void* arg);
    void taskLoop();
    int currentMode();

    // shared state
    mutable portMUX_TYPE _mux = portMUX_INITIALIZER_UNLOCKED;
    GnssFixSnapshot _snap{};
    TaskHandle_t _task = nullptr;
};

#endif // GNSSMODULE_H
