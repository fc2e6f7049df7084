// StatusDisplay.cpp
#include "StatusDisplay.h"

#include "Log.h"

#include <vector>

static constexpr const char* TAG = "ui";

// ------------------------------------------------------------

StatusDisplay::StatusDisplay(const std::string &version) : _version(version) {}
StatusDisplay::~StatusDisplay() { destroySprite(); }

void StatusDisplay::begin(IngestionPipeline* pipeline)
{
  _pipeline = pipeline;
  createSprite();
}

void StatusDisplay::createSprite()
{
  if (_sprInit) return;

  auto& lcd = M5Cardputer.Display;
  _w = lcd.width();
  _h = lcd.height();

  destroySprite();

  _spr = new LGFX_Sprite(&lcd);
  _spr->setColorDepth(16);
  _spr->setTextWrap(false);

  _spr->createSprite(_w, _h);

  if (_spr->getBuffer() == nullptr) {
    PD_LOGE(TAG, "sprite alloc failed (%dx%d) free=%u", _w, _h, (unsigned)ESP.getFreeHeap());
    destroySprite();
    return;
  }

  _sprInit = true;
  PD_LOGI(TAG, "sprite OK (%dx%d) free=%u", _w, _h, (unsigned)ESP.getFreeHeap());
}

void StatusDisplay::destroySprite()
{
  if (_spr) {
    _spr->deleteSprite();
    delete _spr;
    _spr = nullptr;
  }
  _sprInit = false;
}

void StatusDisplay::pushFrame()
{
  if (!_sprInit) return;
  M5Cardputer.Display.startWrite();
  _spr->pushSprite(0, 0);
  M5Cardputer.Display.endWrite();
}

void StatusDisplay::applyFont()
{
  switch (_pipeline->config().font_size)
  {
    case FontSize::Medium: _spr->setFont(&fonts::Font2);       _spr->setTextSize(1); break;
    case FontSize::Bold:   _spr->setFont(&fonts::FreeSansBold9pt7b); _spr->setTextSize(1); break;
    case FontSize::Small:
    default:               _spr->setFont(&fonts::Font0);       _spr->setTextSize(1); break;
  }
}

// ------------------------------------------------------------

void StatusDisplay::update()
{
  if (!_pipeline || !_sprInit) return;

  const uint32_t ms = millis();

  // Pick up a pending pulse; the ingestion side never waits for us
  if (_pipeline->flashSignal().consume()) {
    _flashing = true;
    _flash_start_ms = ms;
    M5Cardputer.Speaker.tone(2000, 80);
  }

  bool inverted = false;
  if (_flashing) {
    const uint32_t dt = ms - _flash_start_ms;
    if (dt >= FLASH_MS) _flashing = false;
    else inverted = ((dt / FLASH_TOGGLE) % 2) == 0;
  }

  drawFrame(inverted);
  pushFrame();
}

void StatusDisplay::drawFrame(bool inverted)
{
  const uint16_t fg = inverted ? TFT_BLACK : TFT_WHITE;
  const uint16_t bg = inverted ? TFT_WHITE : TFT_BLACK;

  _spr->fillScreen(bg);
  applyFont();
  _spr->setTextColor(fg, bg);

  const DetectorConfig& cfg = _pipeline->config();
  const std::vector<std::string> lines = _pipeline->displayLines();

  const int lh = _spr->fontHeight() + 2;
  int y = cfg.ui_y;
  for (const std::string& line : lines) {
    if (y + lh > _h - 10) break;   // keep the footer row free
    _spr->setCursor(cfg.ui_x, y);
    _spr->print(line.c_str());
    y += lh;
  }

  drawFooter(fg, bg);
}

void StatusDisplay::drawFooter(uint16_t fg, uint16_t bg)
{
  _spr->setFont(&fonts::Font0);
  _spr->setTextSize(1);
  _spr->setTextColor(fg, bg);

  const int footerY = _h - 9;
  const uint32_t ms = millis();

  if (!_toast.empty() && (ms - _toast_ms) < TOAST_MS) {
    _spr->setCursor(0, footerY);
    _spr->print(_toast.c_str());
    return;
  }

  _spr->setCursor(0, footerY);
  _spr->print(_version.c_str());

  const char* right = _pipeline->notifyEnabled() ? "notify:on" : "notify:off";
  const int rightW = _spr->textWidth(right);
  _spr->setCursor(_w - rightW, footerY);
  _spr->print(right);
}

void StatusDisplay::toast(const char* msg)
{
  _toast = msg;
  _toast_ms = millis();
}

// ------------------------------------------------------------

void StatusDisplay::handleKeyboard(Keyboard_Class& kb)
{
  if (!_pipeline) return;

  if (kb.isKeyPressed('r')) {
    _pipeline->reset();
    toast("registry cleared");
  } else if (kb.isKeyPressed('n')) {
    const bool on = !_pipeline->notifyEnabled();
    _pipeline->setNotify(on);
    toast(on ? "notifications on" : "notifications off");
  }
}
