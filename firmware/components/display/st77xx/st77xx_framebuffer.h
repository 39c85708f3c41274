/**
 * @file st77xx_framebuffer.h
 * @brief RAM drawing surface for ST77xx displays, flushed in one go.
 *
 * @details
 * Draw everything into ESP32 RAM, then send it all at once with present():
 *
 *     1. Draw to buffer        2. present()
 *     ┌───────────┐            ┌───────────┐
 *     │  Hello!   │            │  Hello!   │
 *     │   ┌─┐     │     →      │   ┌─┐     │
 *     │   └─┘     │            │   └─┘     │
 *     └───────────┘            └───────────┘
 *      In ESP32 RAM             On the panel
 *
 * Nothing touches the bus until present(), which sets ONE full-panel window
 * and streams the whole frame. No tearing from half-drawn shapes, and a
 * circle costs the same bus time as a blank screen.
 */

/*
 * =============================================================================
 * TWO PIXEL FORMATS
 * =============================================================================
 *
 * RGB565 (ST77xxMode::Framebuffer)
 *     2 bytes per pixel, stored big-endian exactly as they go on the wire.
 *     240x240 → 115200 bytes. Full color.
 *
 * MONOCHROME (ST77xxMode::Monochrome)
 *     1 bit per pixel, 8 horizontal pixels per byte, MSB = leftmost.
 *     Each row starts on a fresh byte.
 *     240x240 → 7200 bytes. Black and white only.
 *
 *         byte:  1 0 1 1 0 0 0 0
 *         pixel: ■ □ ■ ■ □ □ □ □
 *
 *     Any non-zero color sets the bit. present() expands one row at a time
 *     through the 256-entry lookup table (bit 1 → 0xFFFF, bit 0 → 0x0000),
 *     so only a single expanded row ever exists in RAM.
 *
 * =============================================================================
 */

#pragma once

#include <stdint.h>
#include <stddef.h>
#include <memory>
#include "st77xx_gfx.h"
#include "st77xx_panel.h"


/**
 * @brief Storage format of an ST77xxFramebuffer.
 */
enum class ST77xxPixelFormat : uint8_t {
    RGB565,
    Mono
};


/**
 * @class ST77xxFramebuffer
 * @brief ST77xxGfx that draws into an owned RAM buffer.
 */
class ST77xxFramebuffer : public ST77xxGfx {

public:

    /**
     * @brief Allocate a cleared (black) frame buffer.
     *
     * @param width Width in pixels.
     * @param height Height in pixels.
     * @param format RGB565 or 1-bit monochrome.
     */
    ST77xxFramebuffer(uint16_t width, uint16_t height, ST77xxPixelFormat format);


    /**
     * @brief Whether the buffers could be allocated.
     */
    bool isValid() const { return buffer != nullptr && (format != ST77xxPixelFormat::Mono || rowBuffer != nullptr); }


    /**
     * @brief Storage format.
     */
    ST77xxPixelFormat getFormat() const { return format; }


    /**
     * @brief Raw buffer contents.
     */
    const uint8_t* data() const { return buffer.get(); }


    /**
     * @brief Raw buffer size in bytes.
     */
    size_t size() const { return bufferSize; }


    /**
     * @brief Bytes per buffer row.
     */
    size_t getStride() const { return stride; }


    /**
     * @brief Read a pixel back as RGB565 (monochrome: 0xFFFF or 0x0000).
     *
     * @return The color, or 0 for coordinates off the buffer.
     */
    uint16_t getPixel(int16_t x, int16_t y) const;


    /**
     * @brief Send the whole buffer to the panel through one window.
     *
     * @return true if the panel accepted the window and every byte.
     */
    bool present(ST77xxPanel& panel) const;


protected:

    void writePixel(int16_t x, int16_t y, uint16_t color) override;
    void writeFillRect(int16_t x, int16_t y, int16_t w, int16_t h, uint16_t color) override;
    void writeImage(int16_t x, int16_t y, int16_t w, int16_t h,
                    const uint8_t* data, size_t stride) override;


private:

    ST77xxPixelFormat format;
    size_t stride;
    size_t bufferSize;
    std::unique_ptr<uint8_t[]> buffer;
    std::unique_ptr<uint8_t[]> rowBuffer;      // One expanded row (mono only)


    void setMonoPixel(int16_t x, int16_t y, bool on);
};
