/**
 * @file st77xx_font.h
 * @brief Glyph source for ST77xx text rendering.
 *
 * @details
 * Text is drawn one 8x8 cell at a time. A font only has to paint a character
 * into that cell using the two colors it is given; the driver then pushes the
 * whole cell to the display in one transfer.
 *
 *     Cell (8x8, RGB565, row-major):
 *
 *         col: 0 1 2 3 4 5 6 7
 *     row 0    . ■ ■ ■ . . . .
 *     row 1    ■ . . . ■ . . .
 *     row 2    ■ . . . ■ . . .
 *     ...
 *
 * The built-in ST77xxFont5x7 uses the classic 5x7 column font, placed in the
 * top-left of the cell. Columns 5-7 and row 7 stay background, which gives
 * the spacing between characters and lines.
 */

#pragma once

#include <stdint.h>
#include "st77xx_color.h"


#define ST77XX_GLYPH_SIZE   8


/**
 * @brief The tiny 8x8 RGB565 scratch buffer every character goes through.
 */
struct ST77xxGlyphCell {
    uint8_t data[ST77XX_GLYPH_SIZE * ST77XX_GLYPH_SIZE * ST77XX_BYTES_PER_PIXEL];

    void fill(uint16_t color) {
        for (int i = 0; i < ST77XX_GLYPH_SIZE * ST77XX_GLYPH_SIZE; i++) {
            st77xxPutColor(&data[i * 2], color);
        }
    }

    void set(int col, int row, uint16_t color) {
        st77xxPutColor(&data[(row * ST77XX_GLYPH_SIZE + col) * 2], color);
    }

    uint16_t get(int col, int row) const {
        return st77xxGetColor(&data[(row * ST77XX_GLYPH_SIZE + col) * 2]);
    }
};


/**
 * @class ST77xxFont
 * @brief Anything that can paint a character into a glyph cell.
 */
class ST77xxFont {

public:

    virtual ~ST77xxFont() = default;


    /**
     * @brief Paint one character.
     *
     * @param c Character to render.
     * @param cell Destination cell, fully overwritten.
     * @param bg Background color (RGB565).
     * @param fg Foreground color (RGB565).
     */
    virtual void renderGlyph(char c, ST77xxGlyphCell& cell, uint16_t bg, uint16_t fg) const = 0;
};


/**
 * @class ST77xxFont5x7
 * @brief Built-in 5x7 font, printable ASCII (32-126).
 *
 * @details
 * Characters outside that range are drawn as '?'.
 */
class ST77xxFont5x7 : public ST77xxFont {

public:

    void renderGlyph(char c, ST77xxGlyphCell& cell, uint16_t bg, uint16_t fg) const override;


    /**
     * @brief Shared instance used when no other font is set.
     */
    static const ST77xxFont5x7& instance();
};
