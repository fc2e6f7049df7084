// StatusDisplay.h
#pragma once

#include <cstdint>
#include <string>

#include <M5Cardputer.h>
#include "IngestionPipeline.h"

// Draws the rotated detection text and runs the new-device pulse.
class StatusDisplay
{
public:
  StatusDisplay(const std::string &version);
  ~StatusDisplay();

  void begin(IngestionPipeline* pipeline);
  void update();
  void handleKeyboard(Keyboard_Class& kb);

private:
  // UI timing (ms)
  static constexpr uint32_t FLASH_MS      = 600;  // total pulse length
  static constexpr uint32_t FLASH_TOGGLE  = 150;  // invert period inside a pulse
  static constexpr uint32_t TOAST_MS      = 1500;

  // Sprite
  void createSprite();
  void destroySprite();
  void pushFrame();

  // Drawing
  void drawFrame(bool inverted);
  void drawFooter(uint16_t fg, uint16_t bg);
  void applyFont();

  void toast(const char* msg);

private:
  std::string _version;

  IngestionPipeline* _pipeline = nullptr;

  // Sprite
  LGFX_Sprite* _spr = nullptr;
  bool _sprInit = false;
  int  _w = 0;
  int  _h = 0;

  // Pulse state, driven from update() only
  bool     _flashing = false;
  uint32_t _flash_start_ms = 0;

  // Short status message after a key press
  std::string _toast;
  uint32_t    _toast_ms = 0;
};
