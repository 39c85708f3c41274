/**
 * @file st77xx_gfx.cpp
 * @brief Shape, text and image primitives with clipping.
 */

#include "st77xx_gfx.h"
#include <stdlib.h>
#include <vector>


/*
 * =============================================================================
 * CONSTRUCTOR
 * =============================================================================
 */
ST77xxGfx::ST77xxGfx(uint16_t width, uint16_t height)
    : width(width),
      height(height),
      font(&ST77xxFont5x7::instance())
{
    glyph.fill(ST77XX_BLACK);
}


void ST77xxGfx::setFont(const ST77xxFont* f) {
    font = (f != nullptr) ? f : &ST77xxFont5x7::instance();
}


/*
 * =============================================================================
 * PIXELS AND SPANS
 * =============================================================================
 */

void ST77xxGfx::drawPixel(int16_t x, int16_t y, uint16_t color) {
    plot(x, y, color);
}


void ST77xxGfx::drawHLine(int16_t x, int16_t y, int16_t w, uint16_t color) {
    fillRect(x, y, w, 1, color);
}


void ST77xxGfx::drawVLine(int16_t x, int16_t y, int16_t h, uint16_t color) {
    fillRect(x, y, 1, h, color);
}


void ST77xxGfx::fillRect(int16_t x, int16_t y, int16_t w, int16_t h, uint16_t color) {
    span(x, y, w, h, color);
}


void ST77xxGfx::plot(int32_t x, int32_t y, uint16_t color) {
    if (x < 0 || x >= width || y < 0 || y >= height) return;
    writePixel(x, y, color);
}


void ST77xxGfx::span(int32_t x, int32_t y, int32_t w, int32_t h, uint16_t color) {
    if (w <= 0 || h <= 0) return;

    int32_t x0 = x;
    int32_t y0 = y;
    int32_t x1 = x + w - 1;
    int32_t y1 = y + h - 1;

    if (x1 < 0 || y1 < 0 || x0 >= width || y0 >= height) return;
    if (x0 < 0) x0 = 0;
    if (y0 < 0) y0 = 0;
    if (x1 >= width) x1 = width - 1;
    if (y1 >= height) y1 = height - 1;

    writeFillRect(x0, y0, x1 - x0 + 1, y1 - y0 + 1, color);
}


void ST77xxGfx::fillScreen(uint16_t color) {
    writeFillRect(0, 0, width, height, color);
}


/*
 * =============================================================================
 * LINES
 * =============================================================================
 *
 * Horizontal and vertical lines are one window + one burst of color bytes.
 * Everything else goes through Bresenham, one pixel per step.
 */

void ST77xxGfx::drawLine(int16_t x0, int16_t y0, int16_t x1, int16_t y1, uint16_t color) {
    if (y0 == y1) {
        if (x0 > x1) { int16_t t = x0; x0 = x1; x1 = t; }
        span(x0, y0, (int32_t)x1 - x0 + 1, 1, color);
        return;
    }
    if (x0 == x1) {
        if (y0 > y1) { int16_t t = y0; y0 = y1; y1 = t; }
        span(x0, y0, 1, (int32_t)y1 - y0 + 1, color);
        return;
    }

    // Bresenham's line algorithm
    int32_t x = x0;
    int32_t y = y0;
    int32_t dx = abs((int32_t)x1 - x0);
    int32_t dy = abs((int32_t)y1 - y0);
    int32_t sx = (x0 < x1) ? 1 : -1;
    int32_t sy = (y0 < y1) ? 1 : -1;
    int32_t err = dx - dy;

    while (true) {
        plot(x, y, color);

        if (x == x1 && y == y1) break;

        int32_t e2 = 2 * err;
        if (e2 > -dy) { err -= dy; x += sx; }
        if (e2 < dx) { err += dx; y += sy; }
    }
}


/*
 * =============================================================================
 * RECTANGLES
 * =============================================================================
 */

void ST77xxGfx::drawRect(int16_t x, int16_t y, int16_t w, int16_t h, uint16_t color) {
    if (w <= 0 || h <= 0) return;

    span(x, y, w, 1, color);                        // Top
    span(x, (int32_t)y + h - 1, w, 1, color);       // Bottom
    span(x, y, 1, h, color);                        // Left
    span((int32_t)x + w - 1, y, 1, h, color);       // Right
}


/*
 * =============================================================================
 * CIRCLES
 * =============================================================================
 *
 * Midpoint circle: walk one octant from the top, mirror each point into the
 * other seven.
 *
 *             -y
 *          \  |  /
 *        7  \ | /  0
 *     -x ────(c)──── +x
 *        4  / | \  3
 *          /  |  \
 *             +y
 *
 * The filled version uses the same walk, but joins each mirrored pair with a
 * horizontal span (4 spans per step) instead of plotting 8 points.
 */

void ST77xxGfx::drawCircle(int16_t cx, int16_t cy, int16_t radius, uint16_t color) {
    if (radius < 0) return;
    if (radius == 0) {
        plot(cx, cy, color);
        return;
    }

    int32_t f = 1 - radius;
    int32_t ddFx = 1;
    int32_t ddFy = -2 * (int32_t)radius;
    int32_t x = 0;
    int32_t y = radius;

    // The four axis extremes
    plot(cx - radius, cy, color);
    plot(cx + radius, cy, color);
    plot(cx, cy - radius, color);
    plot(cx, cy + radius, color);

    while (x < y) {
        if (f >= 0) {
            y--;
            ddFy += 2;
            f += ddFy;
        }
        x++;
        ddFx += 2;
        f += ddFx;

        plot(cx + x, cy + y, color);
        plot(cx - x, cy + y, color);
        plot(cx + x, cy - y, color);
        plot(cx - x, cy - y, color);
        plot(cx + y, cy + x, color);
        plot(cx - y, cy + x, color);
        plot(cx + y, cy - x, color);
        plot(cx - y, cy - x, color);
    }
}


void ST77xxGfx::fillCircle(int16_t cx, int16_t cy, int16_t radius, uint16_t color) {
    if (radius < 0) return;

    int32_t f = 1 - radius;
    int32_t ddFx = 1;
    int32_t ddFy = -2 * (int32_t)radius;
    int32_t x = 0;
    int32_t y = radius;

    span(cx - radius, cy, 2 * radius + 1, 1, color);     // Diameter

    while (x < y) {
        if (f >= 0) {
            y--;
            ddFy += 2;
            f += ddFy;
        }
        x++;
        ddFx += 2;
        f += ddFx;

        span(cx - x, cy + y, 2 * x + 1, 1, color);      // Lower cap
        span(cx - x, cy - y, 2 * x + 1, 1, color);      // Upper cap
        span(cx - y, cy + x, 2 * y + 1, 1, color);      // Lower body
        span(cx - y, cy - x, 2 * y + 1, 1, color);      // Upper body
    }
}


/*
 * =============================================================================
 * TRIANGLES
 * =============================================================================
 *
 * Scanline fill. With the vertices sorted top to bottom (y0 <= y1 <= y2):
 *
 *              (x0,y0)
 *                /\
 *               /  \        upper half: edges 0-1 and 0-2
 *      (x1,y1) /____\ ...
 *              \_    \      lower half: edges 1-2 and 0-2
 *                \_   \
 *                  \__ \
 *                     (x2,y2)
 *
 * Each edge advances by dx/dy per row. An edge with no height has nothing to
 * walk and gets slope 0, so flat-topped, flat-bottomed and collinear
 * triangles never divide by zero.
 */

namespace {

int32_t edgeX(int32_t xa, int32_t ya, int32_t xb, int32_t yb, int32_t y) {
    int32_t dy = yb - ya;
    if (dy == 0) return xa;
    return xa + (int32_t)((int64_t)(xb - xa) * (y - ya) / dy);
}

template <typename T>
void swapValues(T& a, T& b) {
    T t = a;
    a = b;
    b = t;
}

}  // namespace


void ST77xxGfx::drawTriangle(int16_t x0, int16_t y0, int16_t x1, int16_t y1,
                             int16_t x2, int16_t y2, uint16_t color) {
    drawLine(x0, y0, x1, y1, color);
    drawLine(x1, y1, x2, y2, color);
    drawLine(x2, y2, x0, y0, color);
}


void ST77xxGfx::fillTriangle(int16_t x0, int16_t y0, int16_t x1, int16_t y1,
                             int16_t x2, int16_t y2, uint16_t color) {
    // Sort by Y (y0 <= y1 <= y2)
    if (y0 > y1) { swapValues(y0, y1); swapValues(x0, x1); }
    if (y1 > y2) { swapValues(y1, y2); swapValues(x1, x2); }
    if (y0 > y1) { swapValues(y0, y1); swapValues(x0, x1); }

    // All three on one row
    if (y0 == y2) {
        int16_t a = x0;
        int16_t b = x0;
        if (x1 < a) a = x1;
        if (x1 > b) b = x1;
        if (x2 < a) a = x2;
        if (x2 > b) b = x2;
        span(a, y0, (int32_t)b - a + 1, 1, color);
        return;
    }

    // Row y1 belongs to the upper half only when the bottom is flat
    int32_t last = (y1 == y2) ? y1 : y1 - 1;
    int32_t y = y0;

    for (; y <= last; y++) {
        int32_t a = edgeX(x0, y0, x1, y1, y);
        int32_t b = edgeX(x0, y0, x2, y2, y);
        if (a > b) swapValues(a, b);
        span(a, y, b - a + 1, 1, color);
    }

    for (; y <= y2; y++) {
        int32_t a = edgeX(x1, y1, x2, y2, y);
        int32_t b = edgeX(x0, y0, x2, y2, y);
        if (a > b) swapValues(a, b);
        span(a, y, b - a + 1, 1, color);
    }
}


/*
 * =============================================================================
 * TEXT
 * =============================================================================
 *
 * Each character is painted into the 8x8 glyph cell, then the cell goes out
 * as one block. A cell hanging over the panel edge is clipped: only its
 * visible columns/rows are sent, nothing wraps around.
 *
 * Scaled text (size > 1) is sent as 8 scaled rows per character. Each row is
 * 8*size pixels wide and repeated size times.
 */

uint16_t ST77xxGfx::drawChar(int16_t x, int16_t y, char c, uint16_t color, uint16_t bg, uint8_t size) {
    if (size == 0) size = 1;

    font->renderGlyph(c, glyph, bg, color);

    if (size == 1) {
        blit(x, y, ST77XX_GLYPH_SIZE, ST77XX_GLYPH_SIZE, glyph.data,
             ST77XX_GLYPH_SIZE * ST77XX_BYTES_PER_PIXEL);
        return ST77XX_GLYPH_SIZE;
    }

    int32_t scaledWidth = ST77XX_GLYPH_SIZE * size;
    std::vector<uint8_t> row(scaledWidth * ST77XX_BYTES_PER_PIXEL);

    for (int r = 0; r < ST77XX_GLYPH_SIZE; r++) {
        for (int col = 0; col < ST77XX_GLYPH_SIZE; col++) {
            uint16_t pixel = glyph.get(col, r);
            for (int k = 0; k < size; k++) {
                st77xxPutColor(&row[(col * size + k) * 2], pixel);
            }
        }
        blit(x, (int32_t)y + r * size, scaledWidth, size, row.data(), 0);
    }

    return scaledWidth;
}


void ST77xxGfx::drawString(int16_t x, int16_t y, const char* str, uint16_t color, uint16_t bg, uint8_t size) {
    if (str == nullptr) return;
    if (size == 0) size = 1;

    int32_t cursorX = x;
    int32_t cursorY = y;

    while (*str) {
        if (*str == '\n') {
            cursorY += ST77XX_GLYPH_SIZE * size;
            cursorX = x;
        } else {
            // Keep going past the right edge: drawChar clips each cell
            if (cursorX < width && cursorY < height) {
                drawChar(cursorX, cursorY, *str, color, bg, size);
            }
            cursorX += ST77XX_GLYPH_SIZE * size;
        }
        str++;
    }
}


/*
 * =============================================================================
 * IMAGES
 * =============================================================================
 */

void ST77xxGfx::drawImage(int16_t x, int16_t y, int16_t w, int16_t h, const uint8_t* data) {
    if (w <= 0) return;
    blit(x, y, w, h, data, (size_t)w * ST77XX_BYTES_PER_PIXEL);
}


void ST77xxGfx::blit(int32_t x, int32_t y, int32_t w, int32_t h, const uint8_t* data, size_t stride) {
    if (data == nullptr || w <= 0 || h <= 0) return;

    int32_t x0 = x;
    int32_t y0 = y;
    int32_t x1 = x + w - 1;
    int32_t y1 = y + h - 1;

    if (x1 < 0 || y1 < 0 || x0 >= width || y0 >= height) return;

    int32_t skipX = 0;
    int32_t skipY = 0;
    if (x0 < 0) { skipX = -x0; x0 = 0; }
    if (y0 < 0) { skipY = -y0; y0 = 0; }
    if (x1 >= width) x1 = width - 1;
    if (y1 >= height) y1 = height - 1;

    const uint8_t* first = data + skipY * stride + skipX * ST77XX_BYTES_PER_PIXEL;
    writeImage(x0, y0, x1 - x0 + 1, y1 - y0 + 1, first, stride);
}
