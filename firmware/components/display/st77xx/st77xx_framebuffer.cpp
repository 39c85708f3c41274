/**
 * @file st77xx_framebuffer.cpp
 * @brief RGB565 / monochrome frame buffer and its flush.
 */

#include "st77xx_framebuffer.h"
#include <new>
#include <string.h>


/*
 * =============================================================================
 * CONSTRUCTOR
 * =============================================================================
 */
ST77xxFramebuffer::ST77xxFramebuffer(uint16_t width, uint16_t height, ST77xxPixelFormat format)
    : ST77xxGfx(width, height),
      format(format),
      stride(0),
      bufferSize(0)
{
    if (format == ST77xxPixelFormat::Mono) {
        stride = (width + 7) / 8;
        rowBuffer.reset(new (std::nothrow) uint8_t[stride * sizeof(ST77xxMonoRun)]);
        st77xxMonoTable();      // Build the lookup table now, not on first flush
    } else {
        stride = (size_t)width * ST77XX_BYTES_PER_PIXEL;
    }

    bufferSize = stride * height;
    buffer.reset(new (std::nothrow) uint8_t[bufferSize]);

    if (buffer) {
        memset(buffer.get(), 0x00, bufferSize);     // Black
    }
}


/*
 * =============================================================================
 * BUFFER ACCESS
 * =============================================================================
 *
 * To find the storage for pixel (x, y):
 *
 *     RGB565:  byte = y * stride + x * 2         (2 bytes, big-endian)
 *     Mono:    byte = y * stride + x / 8,  bit = 0x80 >> (x % 8)
 */

void ST77xxFramebuffer::setMonoPixel(int16_t x, int16_t y, bool on) {
    size_t byteIndex = (size_t)y * stride + x / 8;
    uint8_t bitMask = 0x80 >> (x % 8);

    if (on) {
        buffer[byteIndex] |= bitMask;   // Set bit (pixel on)
    } else {
        buffer[byteIndex] &= ~bitMask;  // Clear bit (pixel off)
    }
}


uint16_t ST77xxFramebuffer::getPixel(int16_t x, int16_t y) const {
    if (!buffer || x < 0 || x >= getWidth() || y < 0 || y >= getHeight()) return 0;

    if (format == ST77xxPixelFormat::Mono) {
        uint8_t bits = buffer[(size_t)y * stride + x / 8];
        return (bits & (0x80 >> (x % 8))) ? ST77XX_WHITE : ST77XX_BLACK;
    }

    return st77xxGetColor(&buffer[(size_t)y * stride + x * 2]);
}


/*
 * =============================================================================
 * DRAWING (RAM ONLY)
 * =============================================================================
 */

void ST77xxFramebuffer::writePixel(int16_t x, int16_t y, uint16_t color) {
    if (!buffer) return;

    if (format == ST77xxPixelFormat::Mono) {
        setMonoPixel(x, y, color != 0);
    } else {
        st77xxPutColor(&buffer[(size_t)y * stride + x * 2], color);
    }
}


void ST77xxFramebuffer::writeFillRect(int16_t x, int16_t y, int16_t w, int16_t h, uint16_t color) {
    if (!buffer) return;

    if (format == ST77xxPixelFormat::Mono) {
        bool on = (color != 0);
        for (int16_t row = y; row < y + h; row++) {
            for (int16_t col = x; col < x + w; col++) {
                setMonoPixel(col, row, on);
            }
        }
        return;
    }

    // Build the first row, copy it down
    uint8_t* first = &buffer[(size_t)y * stride + x * 2];
    for (int16_t i = 0; i < w; i++) {
        st77xxPutColor(first + i * 2, color);
    }

    size_t rowBytes = (size_t)w * ST77XX_BYTES_PER_PIXEL;
    for (int16_t row = 1; row < h; row++) {
        memcpy(first + row * stride, first, rowBytes);
    }
}


void ST77xxFramebuffer::writeImage(int16_t x, int16_t y, int16_t w, int16_t h,
                                   const uint8_t* data, size_t srcStride) {
    if (!buffer) return;

    for (int16_t row = 0; row < h; row++) {
        const uint8_t* src = data + row * srcStride;

        if (format == ST77xxPixelFormat::Mono) {
            for (int16_t col = 0; col < w; col++) {
                setMonoPixel(x + col, y + row, st77xxGetColor(src + col * 2) != 0);
            }
        } else {
            memcpy(&buffer[(size_t)(y + row) * stride + x * 2], src, (size_t)w * ST77XX_BYTES_PER_PIXEL);
        }
    }
}


/*
 * =============================================================================
 * PRESENT - SEND FRAME BUFFER TO DISPLAY
 * =============================================================================
 */
bool ST77xxFramebuffer::present(ST77xxPanel& panel) const {
    if (!isValid()) return false;
    if (panel.getWidth() != getWidth() || panel.getHeight() != getHeight()) return false;

    if (!panel.setWindow(0, 0, getWidth() - 1, getHeight() - 1)) return false;

    if (format == ST77xxPixelFormat::RGB565) {
        panel.writePixels(buffer.get(), bufferSize);
        return !panel.hasFault();
    }

    /*
     * Monochrome: expand one row into rowBuffer, send it, next row.
     * The last byte of a row may carry padding bits past the right edge,
     * so only width * 2 bytes of each expanded row are sent.
     */
    const ST77xxMonoRun* table = st77xxMonoTable();
    size_t rowBytes = (size_t)getWidth() * ST77XX_BYTES_PER_PIXEL;

    for (uint16_t row = 0; row < getHeight() && !panel.hasFault(); row++) {
        const uint8_t* src = &buffer[(size_t)row * stride];
        uint8_t* dst = rowBuffer.get();

        for (size_t i = 0; i < stride; i++) {
            memcpy(dst + i * sizeof(ST77xxMonoRun), table[src[i]].bytes, sizeof(ST77xxMonoRun));
        }

        panel.writePixels(rowBuffer.get(), rowBytes);
    }

    return !panel.hasFault();
}
