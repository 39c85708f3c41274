/**
 * @file st77xx_direct.cpp
 * @brief Direct-to-controller drawing surface.
 */

#include "st77xx_direct.h"


ST77xxDirectGfx::ST77xxDirectGfx(ST77xxPanel& panel)
    : ST77xxGfx(panel.getWidth(), panel.getHeight()),
      panel(panel)
{
}


void ST77xxDirectGfx::writePixel(int16_t x, int16_t y, uint16_t color) {
    if (!panel.setWindow(x, y, x, y)) return;

    uint8_t buf[2];
    st77xxPutColor(buf, color);
    panel.writePixels(buf, sizeof(buf));
}


void ST77xxDirectGfx::writeFillRect(int16_t x, int16_t y, int16_t w, int16_t h, uint16_t color) {
    if (!panel.setWindow(x, y, x + w - 1, y + h - 1)) return;
    panel.writeColor(color, (uint32_t)w * h);
}


void ST77xxDirectGfx::writeImage(int16_t x, int16_t y, int16_t w, int16_t h,
                                 const uint8_t* data, size_t stride) {
    if (!panel.setWindow(x, y, x + w - 1, y + h - 1)) return;

    size_t rowBytes = (size_t)w * ST77XX_BYTES_PER_PIXEL;

    // Whole rows back to back: one transfer
    if (stride == rowBytes) {
        panel.writePixels(data, rowBytes * h);
        return;
    }

    // Clipped block (or repeated row): the window wraps at its right edge,
    // so sending the visible part of each row in turn fills it exactly
    for (int16_t row = 0; row < h && !panel.hasFault(); row++) {
        panel.writePixels(data + row * stride, rowBytes);
    }
}
