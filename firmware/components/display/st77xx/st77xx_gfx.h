/**
 * @file st77xx_gfx.h
 * @brief Drawing primitives shared by every ST77xx drawing surface.
 *
 * @details
 * ST77xxGfx owns the shape algorithms and the clipping. Subclasses only
 * provide three already-clipped writes:
 *
 *     writePixel()     one pixel
 *     writeFillRect()  solid rectangle (spans are 1-pixel rectangles)
 *     writeImage()     RGB565 block
 *
 * Two subclasses exist:
 *
 *     ST77xxDirectGfx     writes go straight to the controller
 *     ST77xxFramebuffer   writes go to RAM, show() sends everything at once
 *
 * Because clipping happens here and nowhere else, both produce exactly the
 * same picture for the same calls.
 */

/*
 * =============================================================================
 * COORDINATE SYSTEM
 * =============================================================================
 *
 *     (0,0) ────────────────→ X (0 .. width-1)
 *       │
 *       │
 *       ↓
 *       Y (0 .. height-1)
 *
 * Anything outside the panel is silently clipped. Drawing partly off-screen
 * is fine and never an error.
 *
 * =============================================================================
 */

#pragma once

#include <stdint.h>
#include <stddef.h>
#include "st77xx_color.h"
#include "st77xx_font.h"


/**
 * @class ST77xxGfx
 * @brief Clipped 2D raster primitives over an abstract pixel sink.
 */
class ST77xxGfx {

public:

    /**
     * @brief Create a drawing surface of the given size.
     */
    ST77xxGfx(uint16_t width, uint16_t height);


    virtual ~ST77xxGfx() = default;


    /**
     * @brief Get surface width.
     */
    uint16_t getWidth() const { return width; }


    /**
     * @brief Get surface height.
     */
    uint16_t getHeight() const { return height; }


    /**
     * @brief Use another glyph source for text (nullptr = built-in 5x7).
     *
     * @param font Font, must outlive this surface.
     */
    void setFont(const ST77xxFont* font);


    /**
     * @brief Draw a single pixel.
     *
     * @param x X coordinate.
     * @param y Y coordinate.
     * @param color RGB565 color value.
     */
    void drawPixel(int16_t x, int16_t y, uint16_t color);


    /**
     * @brief Draw a horizontal line.
     *
     * @param x Starting X position.
     * @param y Y position.
     * @param w Line width in pixels.
     * @param color RGB565 color value.
     */
    void drawHLine(int16_t x, int16_t y, int16_t w, uint16_t color);


    /**
     * @brief Draw a vertical line.
     *
     * @param x X position.
     * @param y Starting Y position.
     * @param h Line height in pixels.
     * @param color RGB565 color value.
     */
    void drawVLine(int16_t x, int16_t y, int16_t h, uint16_t color);


    /**
     * @brief Draw a line between two points (both ends included).
     */
    void drawLine(int16_t x0, int16_t y0, int16_t x1, int16_t y1, uint16_t color);


    /**
     * @brief Draw a rectangle outline.
     */
    void drawRect(int16_t x, int16_t y, int16_t w, int16_t h, uint16_t color);


    /**
     * @brief Draw a filled rectangle.
     */
    void fillRect(int16_t x, int16_t y, int16_t w, int16_t h, uint16_t color);


    /**
     * @brief Fill the whole surface with one color.
     */
    void fillScreen(uint16_t color);


    /**
     * @brief Draw a circle outline.
     *
     * @param cx Center X.
     * @param cy Center Y.
     * @param radius Circle radius (0 = single pixel).
     * @param color RGB565 color value.
     */
    void drawCircle(int16_t cx, int16_t cy, int16_t radius, uint16_t color);


    /**
     * @brief Draw a filled circle.
     */
    void fillCircle(int16_t cx, int16_t cy, int16_t radius, uint16_t color);


    /**
     * @brief Draw a triangle outline.
     */
    void drawTriangle(int16_t x0, int16_t y0, int16_t x1, int16_t y1,
                      int16_t x2, int16_t y2, uint16_t color);


    /**
     * @brief Draw a filled triangle.
     */
    void fillTriangle(int16_t x0, int16_t y0, int16_t x1, int16_t y1,
                      int16_t x2, int16_t y2, uint16_t color);


    /**
     * @brief Draw a single character in an 8x8 cell.
     *
     * @param x Top-left X position.
     * @param y Top-left Y position.
     * @param c Character to draw.
     * @param color Text color (RGB565).
     * @param bg Background color (RGB565).
     * @param size Scale factor (1 = 8x8 cell, 2 = 16x16, ...).
     *
     * @return Horizontal advance in pixels.
     */
    uint16_t drawChar(int16_t x, int16_t y, char c, uint16_t color, uint16_t bg, uint8_t size = 1);


    /**
     * @brief Draw a string ('\n' starts a new line at the starting x).
     */
    void drawString(int16_t x, int16_t y, const char* str, uint16_t color,
                    uint16_t bg = ST77XX_BLACK, uint8_t size = 1);


    /**
     * @brief Copy a block of RGB565 pixels (big-endian, row-major).
     *
     * @param x Top-left X position.
     * @param y Top-left Y position.
     * @param w Block width.
     * @param h Block height.
     * @param data w*h*2 bytes.
     */
    void drawImage(int16_t x, int16_t y, int16_t w, int16_t h, const uint8_t* data);


protected:

    /**
     * @brief Write one pixel that is known to be on the surface.
     */
    virtual void writePixel(int16_t x, int16_t y, uint16_t color) = 0;


    /**
     * @brief Fill a non-empty rectangle that is fully on the surface.
     */
    virtual void writeFillRect(int16_t x, int16_t y, int16_t w, int16_t h, uint16_t color) = 0;


    /**
     * @brief Copy a non-empty block that is fully on the surface.
     *
     * @param stride Bytes between row starts in data (0 = repeat one row).
     */
    virtual void writeImage(int16_t x, int16_t y, int16_t w, int16_t h,
                            const uint8_t* data, size_t stride) = 0;


private:

    uint16_t width;
    uint16_t height;
    const ST77xxFont* font;
    ST77xxGlyphCell glyph;


    /**
     * @brief Clip a pixel against the surface.
     */
    void plot(int32_t x, int32_t y, uint16_t color);


    /**
     * @brief Clip a rectangle against the surface.
     */
    void span(int32_t x, int32_t y, int32_t w, int32_t h, uint16_t color);


    /**
     * @brief Clip a block against the surface and forward the visible part.
     */
    void blit(int32_t x, int32_t y, int32_t w, int32_t h, const uint8_t* data, size_t stride);
};
