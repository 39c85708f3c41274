/**
 * @file st77xx.h
 * @brief ST77xx TFT display driver (ST7789 / ST7735 family).
 *
 * @details
 * This is the one header an application includes. It ties together:
 *
 *     ST77xxBus          how bytes reach the chip (SPI + DC/RST/CS lines)
 *     ST77xxPanel        the controller command set and init sequence
 *     ST77xxGfx          lines, circles, text, images, ... (with clipping)
 *
 * ST77xxDisplay picks the drawing surface from ST77xxConfig::mode:
 *
 *     Direct        every shape goes to the panel immediately
 *     Framebuffer   shapes go to an RGB565 buffer in RAM, show() sends it
 *     Monochrome    shapes go to a 1-bit buffer in RAM, show() sends it
 *
 * The drawing calls are the same in every mode.
 */

/*
 * =============================================================================
 * BEGINNER'S GUIDE: ST77xx TFT DISPLAYS
 * =============================================================================
 *
 * WHAT IS IT?
 * -----------
 * The ST7789 and ST7735 are controller chips glued to the back of small color
 * TFT panels (0.96" to 2.0"). You send them pixels over SPI and they keep the
 * picture on the glass. Your ESP32 does not have to refresh anything.
 *
 *
 * THE WIRING:
 * -----------
 *     ESP32                   Display Module
 *     ─────                   ──────────────
 *     3.3V ────────────────── VCC
 *     GND ─────────────────── GND
 *     GPIO (MOSI) ─────────── SDA / DIN / MOSI
 *     GPIO (SCK) ──────────── SCL / CLK / SCK
 *     GPIO ────────────────── CS   (optional, some modules tie it LOW)
 *     GPIO ────────────────── DC / RS
 *     GPIO ────────────────── RST  (optional)
 *     GPIO ────────────────── BLK / BL (backlight, optional)
 *
 *
 * COMMANDS VS DATA:
 * -----------------
 * The DC pin tells the chip what the bytes on SPI mean:
 *
 *     DC = LOW   → this byte is a COMMAND   (e.g. 0x2C "memory write")
 *     DC = HIGH  → these bytes are DATA     (parameters or pixels)
 *
 *
 * HOW A PIXEL GETS DRAWN:
 * -----------------------
 *     1. CASET  columns x0..x1     ┐
 *     2. RASET  rows    y0..y1     ├── "the addressing window"
 *     3. RAMWR                     ┘
 *     4. color bytes, 2 per pixel, left→right, top→bottom
 *
 *
 * COLORS (RGB565):
 * ----------------
 *     Bit:  15 14 13 12 11 | 10  9  8  7  6  5 | 4  3  2  1  0
 *           R  R  R  R  R  | G   G  G  G  G  G | B  B  B  B  B
 *
 *     Use ST77xxDisplay::color(r, g, b) to convert from 0-255 values.
 *
 * =============================================================================
 */

#pragma once

#include <stdint.h>
#include <memory>
#include "st77xx_bus.h"
#include "st77xx_color.h"
#include "st77xx_config.h"
#include "st77xx_panel.h"
#include "st77xx_gfx.h"
#include "st77xx_direct.h"
#include "st77xx_framebuffer.h"


/**
 * @class ST77xxDisplay
 * @brief ST77xx display: controller plus the selected drawing surface.
 *
 * @note The bus must outlive the display.
 *
 * Example:
 * @code
 *     ST77xxSpiBus bus(GPIO_NUM_23, GPIO_NUM_18, GPIO_NUM_5, GPIO_NUM_16, GPIO_NUM_17);
 *     bus.init();
 *
 *     ST77xxConfig config;
 *     config.width = 240;
 *     config.height = 240;
 *     config.inversion = true;
 *
 *     ST77xxDisplay display(bus, config);
 *     display.init();
 *     display.fillScreen(ST77XX_BLACK);
 *     display.drawString(10, 10, "Hello!", ST77XX_WHITE);
 * @endcode
 */
class ST77xxDisplay {

public:

    /**
     * @brief Create a display. Nothing is sent until init().
     *
     * @param bus Transport to the controller.
     * @param config Geometry, orientation and drawing mode.
     */
    ST77xxDisplay(ST77xxBus& bus, const ST77xxConfig& config);

    // The drawing surface keeps a reference to the panel member
    ST77xxDisplay(const ST77xxDisplay&) = delete;
    ST77xxDisplay& operator=(const ST77xxDisplay&) = delete;


    /**
     * @brief Run the full power-up sequence.
     *
     * Also clears a latched bus fault.
     *
     * @return true on success, false on a bus fault or if the frame buffer
     *         could not be allocated.
     */
    bool init();


    /**
     * @brief Send the frame buffer to the panel.
     *
     * @return false in Direct mode, before init() or on a bus fault.
     */
    bool show();


    /**
     * @brief Alias of show().
     */
    bool present() { return show(); }


    /*
     * =========================================================================
     * CONTROLLER
     * =========================================================================
     */

    /**
     * @brief Enter or leave sleep mode.
     */
    void setSleep(bool sleep) { panel.setSleep(sleep); }


    /**
     * @brief Turn color inversion on or off.
     */
    void setInversion(bool invert) { panel.setInversion(invert); }


    /**
     * @brief Re-apply scan direction and color order.
     */
    void setOrientation(const ST77xxOrientation& orientation) { panel.setOrientation(orientation); }


    /**
     * @brief Switch the panel output on or off (RAM is kept).
     */
    void setDisplayOn(bool on) { panel.setDisplayOn(on); }


    /**
     * @brief Fill the controller RAM directly, bypassing any frame buffer.
     */
    void rawFill(uint16_t color) { panel.rawFill(color); }


    bool isActive() const { return panel.isActive(); }
    bool hasFault() const { return panel.hasFault(); }

    /**
     * @brief false only when a buffered mode could not allocate its frame buffer.
     */
    bool hasFramebufferMemory() const { return framebuffer == nullptr || framebuffer->isValid(); }
    uint16_t getWidth() const { return panel.getWidth(); }
    uint16_t getHeight() const { return panel.getHeight(); }
    ST77xxMode getMode() const { return mode; }


    /**
     * @brief The controller itself, for register-level access.
     */
    ST77xxPanel& getPanel() { return panel; }


    /**
     * @brief The active drawing surface.
     */
    ST77xxGfx& gfx() { return *canvas; }


    /**
     * @brief Convert RGB888 to RGB565.
     */
    static uint16_t color(uint8_t r, uint8_t g, uint8_t b) { return st77xxColor565(r, g, b); }


    /*
     * =========================================================================
     * DRAWING
     * =========================================================================
     */

    void setFont(const ST77xxFont* font) { canvas->setFont(font); }

    void drawPixel(int16_t x, int16_t y, uint16_t color) { canvas->drawPixel(x, y, color); }
    void drawHLine(int16_t x, int16_t y, int16_t w, uint16_t color) { canvas->drawHLine(x, y, w, color); }
    void drawVLine(int16_t x, int16_t y, int16_t h, uint16_t color) { canvas->drawVLine(x, y, h, color); }

    void drawLine(int16_t x0, int16_t y0, int16_t x1, int16_t y1, uint16_t color) {
        canvas->drawLine(x0, y0, x1, y1, color);
    }

    void drawRect(int16_t x, int16_t y, int16_t w, int16_t h, uint16_t color) { canvas->drawRect(x, y, w, h, color); }
    void fillRect(int16_t x, int16_t y, int16_t w, int16_t h, uint16_t color) { canvas->fillRect(x, y, w, h, color); }
    void fillScreen(uint16_t color) { canvas->fillScreen(color); }

    void drawCircle(int16_t cx, int16_t cy, int16_t radius, uint16_t color) { canvas->drawCircle(cx, cy, radius, color); }
    void fillCircle(int16_t cx, int16_t cy, int16_t radius, uint16_t color) { canvas->fillCircle(cx, cy, radius, color); }

    void drawTriangle(int16_t x0, int16_t y0, int16_t x1, int16_t y1, int16_t x2, int16_t y2, uint16_t color) {
        canvas->drawTriangle(x0, y0, x1, y1, x2, y2, color);
    }

    void fillTriangle(int16_t x0, int16_t y0, int16_t x1, int16_t y1, int16_t x2, int16_t y2, uint16_t color) {
        canvas->fillTriangle(x0, y0, x1, y1, x2, y2, color);
    }

    uint16_t drawChar(int16_t x, int16_t y, char c, uint16_t color, uint16_t bg, uint8_t size = 1) {
        return canvas->drawChar(x, y, c, color, bg, size);
    }

    void drawString(int16_t x, int16_t y, const char* str, uint16_t color,
                    uint16_t bg = ST77XX_BLACK, uint8_t size = 1) {
        canvas->drawString(x, y, str, color, bg, size);
    }

    void drawImage(int16_t x, int16_t y, int16_t w, int16_t h, const uint8_t* data) {
        canvas->drawImage(x, y, w, h, data);
    }


    /**
     * @brief Rectangle, outline or filled.
     */
    void rect(int16_t x, int16_t y, int16_t w, int16_t h, uint16_t color, bool fill = false);


    /**
     * @brief Circle, outline or filled.
     */
    void circle(int16_t cx, int16_t cy, int16_t radius, uint16_t color, bool fill = false);


    /**
     * @brief Triangle, outline or filled.
     */
    void triangle(int16_t x0, int16_t y0, int16_t x1, int16_t y1,
                  int16_t x2, int16_t y2, uint16_t color, bool fill = false);


private:

    ST77xxPanel panel;
    ST77xxMode mode;
    std::unique_ptr<ST77xxGfx> canvas;
    ST77xxFramebuffer* framebuffer;        // Same object as canvas, or nullptr in Direct mode
};
