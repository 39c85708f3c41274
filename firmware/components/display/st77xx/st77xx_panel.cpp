/**
 * @file st77xx_panel.cpp
 * @brief ST77xx controller protocol implementation.
 */

#include "st77xx_panel.h"
#include "st77xx_color.h"


/*
 * =============================================================================
 * CONSTRUCTOR
 * =============================================================================
 */
ST77xxPanel::ST77xxPanel(ST77xxBus& bus, const ST77xxConfig& config)
    : bus(bus),
      config(config),
      width(config.width),
      height(config.height),
      xOffset(0),
      yOffset(0),
      active(false),
      sleeping(false),
      fault(false)
{
    resolveOffset(config, &xOffset, &yOffset);
}


void ST77xxPanel::resolveOffset(const ST77xxConfig& config, int16_t* x, int16_t* y) {
    int16_t ox = config.xOffset;
    int16_t oy = config.yOffset;

    if (ox < 0 || oy < 0) {
        ox = 0;
        oy = 0;
        if (config.width == 135 && config.height == 240) {
            ox = 52;
            oy = 40;
        } else if (config.width == 240 && config.height == 280) {
            oy = 20;
        }
        // 128x160, 240x240, 240x320 and anything unknown: no offset
    }

    int32_t ramColumns = ST77XX_RAM_COLUMNS;
    int32_t ramRows = ST77XX_RAM_ROWS;
    if (config.orientation.landscape) {
        ramColumns = ST77XX_RAM_ROWS;
        ramRows = ST77XX_RAM_COLUMNS;
    }

    if (ox + (int32_t)config.width > ramColumns || oy + (int32_t)config.height > ramRows) {
        ox = 0;
        oy = 0;
    }

    *x = ox;
    *y = oy;
}


/*
 * =============================================================================
 * INITIALIZATION
 * =============================================================================
 *
 * The order and the waits come from the controller datasheet. Skipping a
 * step or shortening a delay can leave the panel showing garbage or nothing.
 */
bool ST77xxPanel::init() {
    fault = false;
    active = false;
    sleeping = false;

    /*
     * -------------------------------------------------------------------------
     * STEP 1: Chip select (held LOW forever unless the bus is shared)
     * -------------------------------------------------------------------------
     */
    bus.setChipSelectMode(config.chipSelect);
    bus.selectDevice();

    /*
     * -------------------------------------------------------------------------
     * STEP 2: Resets
     * -------------------------------------------------------------------------
     */
    hardReset();
    softReset();

    /*
     * -------------------------------------------------------------------------
     * STEP 3: Wake up, pixel format, scan direction, inversion
     * -------------------------------------------------------------------------
     */
    setSleep(false);

    setColorMode(ST77XX_COLOR_MODE_65K | ST77XX_COLOR_MODE_16BIT);
    bus.delayMs(50);

    setOrientation(config.orientation);
    setInversion(config.inversion);
    bus.delayMs(10);

    sendCommand(ST77XX_NORON);      // Normal display mode on
    bus.delayMs(10);

    /*
     * -------------------------------------------------------------------------
     * STEP 4: Clear RAM, then switch the output on
     * -------------------------------------------------------------------------
     */
    armWindow(0, 0, width - 1, height - 1);
    writeColor(ST77XX_BLACK, (uint32_t)width * height);

    sendCommand(ST77XX_DISPON);
    bus.delayMs(500);

    active = !fault;
    return active;
}


void ST77xxPanel::hardReset() {
    if (!bus.hasResetLine()) return;

    bus.setResetLevel(true);
    bus.delayMs(50);
    bus.setResetLevel(false);
    bus.delayMs(50);
    bus.setResetLevel(true);
    bus.delayMs(150);
}


void ST77xxPanel::softReset() {
    sendCommand(ST77XX_SWRESET);
    bus.delayMs(150);
}


/*
 * =============================================================================
 * LOW-LEVEL WRITES
 * =============================================================================
 */

void ST77xxPanel::sendCommand(uint8_t cmd, const uint8_t* data, size_t len) {
    if (fault) return;
    if (!bus.writeCommand(cmd, data, len)) {
        fault = true;
    }
}


void ST77xxPanel::sendData(const uint8_t* data, size_t len) {
    if (fault) return;
    if (!bus.writeData(data, len)) {
        fault = true;
    }
}


/*
 * =============================================================================
 * CONTROLLER SETTINGS
 * =============================================================================
 */

void ST77xxPanel::setSleep(bool sleep) {
    sendCommand(sleep ? ST77XX_SLPIN : ST77XX_SLPOUT);
    sleeping = sleep;
}


void ST77xxPanel::setInversion(bool invert) {
    sendCommand(invert ? ST77XX_INVON : ST77XX_INVOFF);
}


void ST77xxPanel::setColorMode(uint8_t mode) {
    uint8_t value = (mode & 0x70) | ST77XX_COLOR_MODE_16BIT;
    sendCommand(ST77XX_COLMOD, &value, 1);
}


void ST77xxPanel::setMemoryAccessControl(bool landscape, bool mirrorX, bool mirrorY, bool bgr) {
    uint8_t value = ST77XX_MADCTL_RGB;
    if (landscape) value |= ST77XX_MADCTL_MV;
    if (mirrorX) value |= ST77XX_MADCTL_MX;
    if (mirrorY) value |= ST77XX_MADCTL_MY;
    if (bgr) value |= ST77XX_MADCTL_BGR;

    sendCommand(ST77XX_MADCTL, &value, 1);
}


void ST77xxPanel::setOrientation(const ST77xxOrientation& orientation) {
    setMemoryAccessControl(orientation.landscape, orientation.mirrorX,
                           orientation.mirrorY, orientation.bgr);
}


void ST77xxPanel::setDisplayOn(bool on) {
    sendCommand(on ? ST77XX_DISPON : ST77XX_DISPOFF);
}


/*
 * =============================================================================
 * ADDRESSING WINDOW
 * =============================================================================
 */

bool ST77xxPanel::setWindow(int16_t x0, int16_t y0, int16_t x1, int16_t y1) {
    if (!active || fault) return false;

    // Malformed or completely off the glass
    if (x0 > x1 || y0 > y1) return false;
    if (x1 < 0 || y1 < 0 || x0 >= width || y0 >= height) return false;

    // Clamp what is left
    if (x0 < 0) x0 = 0;
    if (y0 < 0) y0 = 0;
    if (x1 >= width) x1 = width - 1;
    if (y1 >= height) y1 = height - 1;

    armWindow(x0, y0, x1, y1);
    return !fault;
}


void ST77xxPanel::armWindow(uint16_t x0, uint16_t y0, uint16_t x1, uint16_t y1) {
    // Apply offset
    x0 += xOffset;
    x1 += xOffset;
    y0 += yOffset;
    y1 += yOffset;

    uint8_t columns[4] = {(uint8_t)(x0 >> 8), (uint8_t)(x0 & 0xFF),
                          (uint8_t)(x1 >> 8), (uint8_t)(x1 & 0xFF)};
    uint8_t rows[4] = {(uint8_t)(y0 >> 8), (uint8_t)(y0 & 0xFF),
                       (uint8_t)(y1 >> 8), (uint8_t)(y1 & 0xFF)};

    sendCommand(ST77XX_CASET, columns, sizeof(columns));
    sendCommand(ST77XX_RASET, rows, sizeof(rows));
    sendCommand(ST77XX_RAMWR);
}


/*
 * =============================================================================
 * PIXEL STREAMING
 * =============================================================================
 */

void ST77xxPanel::writePixels(const uint8_t* data, size_t len) {
    sendData(data, len);
}


void ST77xxPanel::writeColor(uint16_t color, uint32_t count) {
    uint8_t buf[512];
    const uint32_t pixelsPerChunk = sizeof(buf) / ST77XX_BYTES_PER_PIXEL;

    uint32_t prepared = (count < pixelsPerChunk) ? count : pixelsPerChunk;
    for (uint32_t i = 0; i < prepared; i++) {
        st77xxPutColor(&buf[i * 2], color);
    }

    while (count > 0 && !fault) {
        uint32_t n = (count < pixelsPerChunk) ? count : pixelsPerChunk;
        sendData(buf, n * ST77XX_BYTES_PER_PIXEL);
        count -= n;
    }
}


void ST77xxPanel::rawFill(uint16_t color) {
    if (setWindow(0, 0, width - 1, height - 1)) {
        writeColor(color, (uint32_t)width * height);
    }
}
