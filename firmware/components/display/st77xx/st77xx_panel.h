/**
 * @file st77xx_panel.h
 * @brief ST77xx controller protocol and addressing window.
 *
 * @details
 * Encodes the small ST77xx command subset this driver needs and the
 * power-up sequence. Knows nothing about shapes or fonts: it sets windows
 * and streams color bytes into them.
 */

/*
 * =============================================================================
 * HOW PIXELS GET INTO THE CONTROLLER
 * =============================================================================
 *
 * The controller has its own RAM. To write pixels we open a "window" and
 * then stream colors into it. The controller fills the window left to right,
 * top to bottom, and wraps at the right edge of the window:
 *
 *     CASET  x0, x1      (column range, 2 bytes each, big-endian)
 *     RASET  y0, y1      (row range)
 *     RAMWR              (start writing)
 *     data   c0 c1 c2 ... (2 bytes per pixel)
 *
 *         x0        x1
 *     y0  ┌──────────┐
 *         │ c0 c1 c2 │ →
 *         │ c3 c4 ...│ →
 *     y1  └──────────┘
 *
 * Window coordinates are clamped to the panel before they are sent. A window
 * that ends up empty (start past end, or completely off the glass) is
 * dropped: nothing goes on the wire.
 *
 * =============================================================================
 * FAULTS
 * =============================================================================
 *
 * There is no way to read anything back, so the only error we ever see is
 * the SPI driver refusing a transfer. When that happens the panel latches a
 * fault and ignores every later write until init() is run again.
 *
 * =============================================================================
 */

#pragma once

#include <stdint.h>
#include <stddef.h>
#include "st77xx_bus.h"
#include "st77xx_config.h"


/*
 * =============================================================================
 * ST77XX COMMAND DEFINITIONS
 * =============================================================================
 */

#define ST77XX_NOP          0x00
#define ST77XX_SWRESET      0x01    // Software reset
#define ST77XX_SLPIN        0x10    // Sleep in
#define ST77XX_SLPOUT       0x11    // Sleep out
#define ST77XX_NORON        0x13    // Normal display mode on
#define ST77XX_INVOFF       0x20    // Inversion off
#define ST77XX_INVON        0x21    // Inversion on
#define ST77XX_DISPOFF      0x28    // Display off
#define ST77XX_DISPON       0x29    // Display on
#define ST77XX_CASET        0x2A    // Column address set
#define ST77XX_RASET        0x2B    // Row address set
#define ST77XX_RAMWR        0x2C    // Memory write
#define ST77XX_MADCTL       0x36    // Memory access control
#define ST77XX_COLMOD       0x3A    // Interface pixel format

// MADCTL bits
#define ST77XX_MADCTL_MY    0x80    // Row address order
#define ST77XX_MADCTL_MX    0x40    // Column address order
#define ST77XX_MADCTL_MV    0x20    // Row/column exchange
#define ST77XX_MADCTL_ML    0x10    // Vertical refresh order
#define ST77XX_MADCTL_BGR   0x08    // BGR color filter panel
#define ST77XX_MADCTL_MH    0x04    // Horizontal refresh order
#define ST77XX_MADCTL_RGB   0x00

// COLMOD values
#define ST77XX_COLOR_MODE_65K     0x50
#define ST77XX_COLOR_MODE_262K    0x60
#define ST77XX_COLOR_MODE_12BIT   0x03
#define ST77XX_COLOR_MODE_16BIT   0x05
#define ST77XX_COLOR_MODE_18BIT   0x06
#define ST77XX_COLOR_MODE_16M     0x07


/**
 * @class ST77xxPanel
 * @brief Register-level driver for one ST77xx controller.
 */
class ST77xxPanel {

public:

    /**
     * @brief Bind a panel to its transport.
     *
     * @param bus Transport, must outlive the panel.
     * @param config Geometry, orientation and chip-select policy.
     */
    ST77xxPanel(ST77xxBus& bus, const ST77xxConfig& config);


    /**
     * @brief Run the full power-up sequence and clear the panel to black.
     *
     * @details
     * Also the recovery path after a transport fault: it clears the fault
     * latch before starting.
     *
     * @return true if every step reached the bus.
     */
    bool init();


    /**
     * @brief Toggle the RST line (HIGH, LOW, HIGH with 50/50/150ms waits).
     */
    void hardReset();


    /**
     * @brief Send SWRESET and wait 150ms.
     */
    void softReset();


    /**
     * @brief Enter (true) or leave (false) sleep mode.
     */
    void setSleep(bool sleep);


    /**
     * @brief Invert display colors.
     */
    void setInversion(bool invert);


    /**
     * @brief Write COLMOD.
     *
     * Register-level access. Only the RGB interface bits (0x70) are taken from
     * mode, the control interface stays at 16 bits per pixel since every
     * streaming path sends two bytes per pixel.
     */
    void setColorMode(uint8_t mode);


    /**
     * @brief Compose and write MADCTL.
     *
     * @param landscape Exchange rows and columns (MV).
     * @param mirrorX Mirror columns (MX).
     * @param mirrorY Mirror rows (MY).
     * @param bgr BGR color order.
     */
    void setMemoryAccessControl(bool landscape, bool mirrorX, bool mirrorY, bool bgr);


    /**
     * @brief Same as setMemoryAccessControl() from an orientation struct.
     */
    void setOrientation(const ST77xxOrientation& orientation);


    /**
     * @brief Turn the display output on or off (RAM is kept).
     */
    void setDisplayOn(bool on);


    /**
     * @brief Clamp a window to the panel, send CASET/RASET/RAMWR.
     *
     * @return true if the window is armed and data may follow.
     */
    bool setWindow(int16_t x0, int16_t y0, int16_t x1, int16_t y1);


    /**
     * @brief Stream raw RGB565 bytes into the armed window.
     */
    void writePixels(const uint8_t* data, size_t len);


    /**
     * @brief Stream one color repeated count times into the armed window.
     */
    void writeColor(uint16_t color, uint32_t count);


    /**
     * @brief Fill the whole panel RAM with one color.
     */
    void rawFill(uint16_t color);


    bool isActive() const { return active; }
    bool isSleeping() const { return sleeping; }
    bool hasFault() const { return fault; }

    uint16_t getWidth() const { return width; }
    uint16_t getHeight() const { return height; }
    int16_t getXOffset() const { return xOffset; }
    int16_t getYOffset() const { return yOffset; }


    /**
     * @brief Work out the RAM offset for a configuration.
     *
     * @details
     * Explicit offsets are used as given, negative ones come from the panel
     * presets. Anything that would address past the controller RAM falls
     * back to (0, 0).
     */
    static void resolveOffset(const ST77xxConfig& config, int16_t* x, int16_t* y);


private:

    ST77xxBus& bus;
    ST77xxConfig config;

    uint16_t width;
    uint16_t height;
    int16_t xOffset;
    int16_t yOffset;

    bool active;
    bool sleeping;
    bool fault;


    /**
     * @brief Send a command (+ parameters) unless a fault is latched.
     */
    void sendCommand(uint8_t cmd, const uint8_t* data = nullptr, size_t len = 0);


    /**
     * @brief Send data bytes unless a fault is latched.
     */
    void sendData(const uint8_t* data, size_t len);


    /**
     * @brief Emit an already-clamped window.
     */
    void armWindow(uint16_t x0, uint16_t y0, uint16_t x1, uint16_t y1);
};
