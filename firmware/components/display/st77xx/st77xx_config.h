/**
 * @file st77xx_config.h
 * @brief Configuration for an ST77xx display instance.
 *
 * @details
 * Everything here is fixed when the display is constructed. Orientation and
 * inversion are written to the controller during init() and can be
 * re-applied later, but the geometry never changes.
 */

/*
 * =============================================================================
 * DISPLAY MEMORY OFFSET
 * =============================================================================
 *
 * The ST7789 has RAM for 240x320 pixels. Smaller glass only shows part of it:
 *
 *     Controller RAM (240 x 320)
 *     ┌──────────────────────────┐
 *     │        yOffset           │
 *     │   ┌──────────────┐       │
 *     │ x │  visible     │       │
 *     │ O │  panel       │       │
 *     │ f │  (135x240)   │       │
 *     │ f │              │       │
 *     │   └──────────────┘       │
 *     └──────────────────────────┘
 *
 * Leave xOffset/yOffset at -1 to use the known preset for the panel size:
 *
 *     128x160 → (0, 0)      1.8" ST7735
 *     240x240 → (0, 0)      1.3" ST7789
 *     240x320 → (0, 0)      2.0" ST7789
 *     135x240 → (52, 40)    1.14" ST7789
 *     240x280 → (0, 20)     1.69" ST7789V2
 *
 * Unknown sizes, or offsets that would run past the controller RAM, fall back
 * to (0, 0). If the picture looks shifted or wrapped, set the offset by hand.
 *
 * =============================================================================
 */

#pragma once

#include <stdint.h>
#include "st77xx_bus.h"


/**
 * @brief Addressable controller RAM (portrait). Landscape swaps the two.
 */
#define ST77XX_RAM_COLUMNS  240
#define ST77XX_RAM_ROWS     320


/**
 * @brief How pixels reach the controller.
 */
enum class ST77xxMode : uint8_t {
    Direct,         // Window-set + write per pixel/span, no RAM buffer
    Framebuffer,    // RGB565 buffer in RAM (w*h*2 bytes), flushed by show()
    Monochrome      // 1-bit buffer in RAM (w*h/8 bytes), expanded on show()
};


/**
 * @brief Scan direction and color order (MADCTL).
 */
struct ST77xxOrientation {
    bool landscape = false;     // Swap rows/columns (MV)
    bool mirrorX = false;       // Mirror columns (MX)
    bool mirrorY = false;       // Mirror rows (MY)
    bool bgr = false;           // Panel wired BGR instead of RGB
};


/**
 * @brief Full configuration of one display.
 */
struct ST77xxConfig {
    uint16_t width = 240;
    uint16_t height = 240;
    int16_t xOffset = -1;       // -1 = use panel preset
    int16_t yOffset = -1;       // -1 = use panel preset
    ST77xxOrientation orientation;
    bool inversion = false;
    ST77xxMode mode = ST77xxMode::Direct;
    ST77xxChipSelect chipSelect = ST77xxChipSelect::HoldActive;
};
