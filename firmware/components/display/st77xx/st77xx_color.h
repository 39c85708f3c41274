/**
 * @file st77xx_color.h
 * @brief RGB565 color helpers for the ST77xx driver.
 *
 * @details
 * The controller runs in 16-bit mode (COLMOD 0x55). Every pixel goes on the
 * wire as two bytes, high byte first.
 *
 *     Bit:   15 14 13 12 11 | 10  9  8  7  6  5 | 4  3  2  1  0
 *            R  R  R  R  R  | G   G  G  G  G  G | B  B  B  B  B
 *
 * Monochrome framebuffers store 1 bit per pixel and are expanded to RGB565
 * only while they are streamed out, through a 256-entry lookup table.
 */

#pragma once

#include <stdint.h>
#include <stddef.h>


/**
 * @brief Common RGB565 colors
 */
#define ST77XX_BLACK     0x0000
#define ST77XX_WHITE     0xFFFF
#define ST77XX_RED       0xF800
#define ST77XX_GREEN     0x07E0
#define ST77XX_BLUE      0x001F
#define ST77XX_YELLOW    0xFFE0
#define ST77XX_CYAN      0x07FF
#define ST77XX_MAGENTA   0xF81F
#define ST77XX_ORANGE    0xFD20
#define ST77XX_GRAY      0x8410


/**
 * @brief Bytes per RGB565 pixel on the wire.
 */
#define ST77XX_BYTES_PER_PIXEL  2


/**
 * @brief Convert 24-bit RGB to RGB565.
 *
 * @param r Red (0-255).
 * @param g Green (0-255).
 * @param b Blue (0-255).
 * @return RGB565 color value.
 */
uint16_t st77xxColor565(uint8_t r, uint8_t g, uint8_t b);


/**
 * @brief Store a color big-endian (wire order) at dst[0], dst[1].
 */
inline void st77xxPutColor(uint8_t* dst, uint16_t color) {
    dst[0] = (uint8_t)(color >> 8);
    dst[1] = (uint8_t)(color & 0xFF);
}


/**
 * @brief Read a big-endian color back from src[0], src[1].
 */
inline uint16_t st77xxGetColor(const uint8_t* src) {
    return (uint16_t)((src[0] << 8) | src[1]);
}


/**
 * @brief One monochrome byte expanded to 8 RGB565 pixels.
 */
struct ST77xxMonoRun {
    uint8_t bytes[8 * ST77XX_BYTES_PER_PIXEL];
};


/**
 * @brief Lookup table mapping every byte value to its expanded pixel run.
 *
 * @details
 * Bit 7 is the leftmost pixel. A set bit becomes 0xFFFF (white), a clear
 * bit 0x0000 (black). The table is built on first use and never changes.
 *
 * @return Reference to the 256-entry table.
 */
const ST77xxMonoRun* st77xxMonoTable();
