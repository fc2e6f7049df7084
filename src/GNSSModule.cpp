#include "GNSSModule.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "freertos/portmacro.h"

#include <stdlib.h>
#include <string.h>

#include "Log.h"

static constexpr const char* TAG = "gps";

static constexpr unsigned long DEBUG_INTERVAL_MS = 5000;
static constexpr uint32_t SNAPSHOT_PERIOD_MS = 200;
static constexpr uint32_t FIX_MAX_AGE_MS = 3000;   // older location => treat as lost

// Constructor
GNSSModule::GNSSModule()
    : gsaModeGP(gps, "GPGSA", 2),
      gsaModeGN(gps, "GNGSA", 2),
      gpsSerial(nullptr),
      isInitialized(false),
      rxPin(1),
      txPin(2),
      baudRate(9600) {
}

// Destructor
GNSSModule::~GNSSModule() {
    if (_task) {
        vTaskDelete(_task);
        _task = nullptr;
    }
    if (gpsSerial) {
        gpsSerial->end();
        delete gpsSerial;
    }
}

// Initialize GPS module
void GNSSModule::begin(uint32_t baud, int rx, int tx) {
    baudRate = baud;
    rxPin = rx;
    txPin = tx;

    // Create and configure hardware serial for GPS
    gpsSerial = new HardwareSerial(2);  // Use UART2
    gpsSerial->setRxBufferSize(4096);   // 2–8 KB is reasonable
    gpsSerial->begin(baudRate, SERIAL_8N1, rxPin, txPin);

    isInitialized = true;

    PD_LOGI(TAG, "GNSS on UART2 rx=%d tx=%d baud=%u (first fix may take 30-60s)",
            rxPin, txPin, (unsigned)baudRate);

    // Start GPS in the background:
    xTaskCreatePinnedToCore(&GNSSModule::taskThunk, "gnss_task",
                        4096, this, 5, &_task, 1);
}

void GNSSModule::taskThunk(void* arg) {
  static_cast<GNSSModule*>(arg)->taskLoop();
}

GnssFixSnapshot GNSSModule::snapshot() const {
  GnssFixSnapshot out;
  portENTER_CRITICAL(&_mux);
  out = _snap;
  portEXIT_CRITICAL(&_mux);
  return out;
}

int GNSSModule::currentMode() {
  if (!gps.location.isValid() || gps.location.age() > FIX_MAX_AGE_MS) return 0;

  // Prefer the receiver's own opinion from GSA
  TinyGPSCustom* gsa = nullptr;
  if (gsaModeGN.isValid() && gsaModeGN.age() <= FIX_MAX_AGE_MS) gsa = &gsaModeGN;
  else if (gsaModeGP.isValid() && gsaModeGP.age() <= FIX_MAX_AGE_MS) gsa = &gsaModeGP;

  if (gsa) {
    const int m = atoi(gsa->value());
    if (m >= 1 && m <= 3) return m;
  }

  // No GSA: infer from what GGA/RMC gave us
  return gps.altitude.isValid() ? 3 : 2;
}

void GNSSModule::taskLoop() {
  uint32_t lastLogMs = 0;

  for (;;) {
    // Drain UART frequently
    while (gpsSerial && gpsSerial->available() > 0) {
      char c = (char)gpsSerial->read();
      gps.encode(c);
    }

    const uint32_t nowMs = millis();
    if ((int32_t)(nowMs - _snap.last_update_ms) >= (int32_t)SNAPSHOT_PERIOD_MS) {
      GnssFixSnapshot s{};
      s.mode = currentMode();
      if (s.mode >= 2) {
        s.lat = gps.location.lat();
        s.lon = gps.location.lng();
      }
      s.alt_m = gps.altitude.isValid() ? gps.altitude.meters() : 0.0;
      s.sats = gps.satellites.isValid() ? (int)gps.satellites.value() : 0;
      if (gps.date.isValid() && gps.time.isValid()) {
        snprintf(s.time_iso, sizeof(s.time_iso), "%04d-%02d-%02dT%02d:%02d:%02d.%02dZ",
                 gps.date.year(), gps.date.month(), gps.date.day(),
                 gps.time.hour(), gps.time.minute(), gps.time.second(), gps.time.centisecond());
      }
      s.last_update_ms = nowMs;

      portENTER_CRITICAL(&_mux);
      _snap = s;
      portEXIT_CRITICAL(&_mux);
    }

    // Optional: very throttled logging
    if ((int32_t)(nowMs - lastLogMs) >= (int32_t)DEBUG_INTERVAL_MS) {
      lastLogMs = nowMs;
      PD_LOGD(TAG, "mode=%d sats=%d chars=%lu pass=%lu fail=%lu",
              currentMode(),
              gps.satellites.isValid() ? (int)gps.satellites.value() : 0,
              (unsigned long)gps.charsProcessed(),
              (unsigned long)gps.passedChecksum(),
              (unsigned long)gps.failedChecksum());
    }

    vTaskDelay(pdMS_TO_TICKS(10)); // yield
  }
}

// A receiver that has not sent anything yet is still the source we use;
// until it streams, fetch() just reports mode 0.
bool GNSSModule::available() const {
  return isInitialized;
}

bool GNSSModule::fetch(RawFix& out, uint32_t timeout_ms) {
  if (!isInitialized) return false;

  const GnssFixSnapshot s = snapshot();

  // The task refreshes every SNAPSHOT_PERIOD_MS; a snapshot older than the
  // caller's budget means the task is stuck and the data can't be trusted.
  if ((uint32_t)(millis() - s.last_update_ms) > timeout_ms) return false;

  out.mode = s.mode;
  out.lat = s.lat;
  out.lon = s.lon;
  out.alt = s.alt_m;
  out.time = s.time_iso;
  out.satellites = s.sats;
  return true;
}
