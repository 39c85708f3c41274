/**
 * @file st77xx_direct.h
 * @brief Drawing surface that writes straight to the controller.
 *
 * @details
 * No frame buffer: every pixel, span or block opens its own window on the
 * controller and streams its colors right away.
 *
 *     drawPixel(10, 20, RED):
 *         CASET 10..10, RASET 20..20, RAMWR, 0xF8 0x00
 *
 *     fillRect(0, 0, 240, 10, BLUE):
 *         CASET 0..239, RASET 0..9, RAMWR, 0x00 0x1F × 2400
 *
 * Costs almost no RAM. The price is one window setup (3 commands, 8
 * parameter bytes) per pixel for diagonal lines and circle outlines, which
 * dominates on a slow bus.
 */

#pragma once

#include "st77xx_gfx.h"
#include "st77xx_panel.h"


/**
 * @class ST77xxDirectGfx
 * @brief ST77xxGfx that streams every write to an ST77xxPanel.
 */
class ST77xxDirectGfx : public ST77xxGfx {

public:

    /**
     * @param panel Controller to draw on, must outlive this surface.
     */
    explicit ST77xxDirectGfx(ST77xxPanel& panel);


protected:

    void writePixel(int16_t x, int16_t y, uint16_t color) override;
    void writeFillRect(int16_t x, int16_t y, int16_t w, int16_t h, uint16_t color) override;
    void writeImage(int16_t x, int16_t y, int16_t w, int16_t h,
                    const uint8_t* data, size_t stride) override;


private:

    ST77xxPanel& panel;
};
