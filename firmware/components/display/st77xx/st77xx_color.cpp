/**
 * @file st77xx_color.cpp
 * @brief RGB565 packing and the monochrome expansion table.
 */

#include "st77xx_color.h"


uint16_t st77xxColor565(uint8_t r, uint8_t g, uint8_t b) {
    return ((r & 0xF8) << 8) | ((g & 0xFC) << 3) | (b >> 3);
}


/*
 * =============================================================================
 * MONOCHROME EXPANSION TABLE
 * =============================================================================
 *
 * One framebuffer byte holds 8 horizontal pixels:
 *
 *     0b10110000  →  ■ □ ■ ■ □ □ □ □
 *
 * Expanding it bit by bit on every flush costs a branch per pixel. Instead
 * each of the 256 possible bytes maps to its ready-made 16-byte run, and the
 * flush becomes a memcpy per byte.
 */

namespace {

struct MonoTableBuilder {
    ST77xxMonoRun runs[256];

    MonoTableBuilder() {
        for (int value = 0; value < 256; value++) {
            for (int bit = 0; bit < 8; bit++) {
                uint8_t level = (value & (0x80 >> bit)) ? 0xFF : 0x00;
                runs[value].bytes[bit * 2] = level;
                runs[value].bytes[bit * 2 + 1] = level;
            }
        }
    }
};

}  // namespace


const ST77xxMonoRun* st77xxMonoTable() {
    static const MonoTableBuilder table;
    return table.runs;
}
