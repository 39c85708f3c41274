/**
 * @file st77xx.cpp
 * @brief ST77xx display implementation.
 */

#include "st77xx.h"


ST77xxDisplay::ST77xxDisplay(ST77xxBus& bus, const ST77xxConfig& config)
    : panel(bus, config),
      mode(config.mode),
      framebuffer(nullptr)
{
    if (mode == ST77xxMode::Direct) {
        canvas.reset(new ST77xxDirectGfx(panel));
        return;
    }

    ST77xxPixelFormat format = (mode == ST77xxMode::Monochrome) ? ST77xxPixelFormat::Mono
                                                                 : ST77xxPixelFormat::RGB565;
    framebuffer = new ST77xxFramebuffer(config.width, config.height, format);
    canvas.reset(framebuffer);
}


bool ST77xxDisplay::init() {
    // Frame buffer first: no point waking a panel we cannot draw for
    if (!hasFramebufferMemory()) {
        return false;
    }

    return panel.init();
}


bool ST77xxDisplay::show() {
    if (framebuffer == nullptr || !panel.isActive()) {
        return false;
    }

    return framebuffer->present(panel);
}


void ST77xxDisplay::rect(int16_t x, int16_t y, int16_t w, int16_t h, uint16_t color, bool fill) {
    if (fill) {
        canvas->fillRect(x, y, w, h, color);
    } else {
        canvas->drawRect(x, y, w, h, color);
    }
}


void ST77xxDisplay::circle(int16_t cx, int16_t cy, int16_t radius, uint16_t color, bool fill) {
    if (fill) {
        canvas->fillCircle(cx, cy, radius, color);
    } else {
        canvas->drawCircle(cx, cy, radius, color);
    }
}


void ST77xxDisplay::triangle(int16_t x0, int16_t y0, int16_t x1, int16_t y1,
                             int16_t x2, int16_t y2, uint16_t color, bool fill) {
    if (fill) {
        canvas->fillTriangle(x0, y0, x1, y1, x2, y2, color);
    } else {
        canvas->drawTriangle(x0, y0, x1, y1, x2, y2, color);
    }
}
