#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "st77xx_panel.h"
#include "st77xx_color.h"
#include "fake_bus.h"


static ST77xxConfig panelConfig(uint16_t width, uint16_t height) {
    ST77xxConfig config;
    config.width = width;
    config.height = height;
    return config;
}


static std::vector<uint8_t> window(int start, int end) {
    return {(uint8_t)(start >> 8), (uint8_t)(start & 0xFF), (uint8_t)(end >> 8), (uint8_t)(end & 0xFF)};
}


/*
 * =============================================================================
 * INITIALIZATION
 * =============================================================================
 */

TEST(PanelInitTest, CommandAndDelayOrder) {
    FakeBus bus;
    ST77xxPanel panel(bus, panelConfig(240, 240));

    ASSERT_TRUE(panel.init());
    EXPECT_TRUE(panel.isActive());
    EXPECT_FALSE(panel.hasFault());

    std::vector<std::string> expected = {
        "RST 1", "DELAY 50", "RST 0", "DELAY 50", "RST 1", "DELAY 150",
        "CMD 01", "DELAY 150",
        "CMD 11",
        "CMD 3A", "DELAY 50",
        "CMD 36",
        "CMD 20", "DELAY 10",
        "CMD 13", "DELAY 10",
        "CMD 2A", "CMD 2B", "CMD 2C",
        "CMD 29", "DELAY 500",
    };
    EXPECT_EQ(bus.trace, expected);
}


TEST(PanelInitTest, RegisterValues) {
    FakeBus bus;
    ST77xxConfig config = panelConfig(240, 240);
    config.inversion = true;
    config.orientation.landscape = true;
    config.orientation.mirrorY = true;
    ST77xxPanel panel(bus, config);

    ASSERT_TRUE(panel.init());

    ASSERT_NE(bus.lastCommand(ST77XX_COLMOD), nullptr);
    EXPECT_EQ(bus.lastCommand(ST77XX_COLMOD)->params, std::vector<uint8_t>{0x55});

    ASSERT_NE(bus.lastCommand(ST77XX_MADCTL), nullptr);
    EXPECT_EQ(bus.lastCommand(ST77XX_MADCTL)->params,
              std::vector<uint8_t>{ST77XX_MADCTL_MV | ST77XX_MADCTL_MY});

    EXPECT_NE(bus.lastCommand(ST77XX_INVON), nullptr);
    EXPECT_EQ(bus.lastCommand(ST77XX_INVOFF), nullptr);
}


TEST(PanelInitTest, ClearsVisibleRamToBlack) {
    FakeBus bus;
    ST77xxPanel panel(bus, panelConfig(135, 240));

    ASSERT_TRUE(panel.init());

    for (int y = 0; y < 240; y++) {
        for (int x = 0; x < 135; x++) {
            ASSERT_EQ(bus.pixel(panel, x, y), ST77XX_BLACK) << x << "," << y;
        }
    }

    // Outside the glass is untouched
    EXPECT_EQ(bus.ram(0, 0), 0x1234);

    const FakeBus::Command* write = bus.lastCommand(ST77XX_RAMWR);
    ASSERT_NE(write, nullptr);
    EXPECT_EQ(write->pixelBytes, 135u * 240u * 2u);
}


TEST(PanelInitTest, NoResetLineSkipsHardReset) {
    FakeBus bus;
    bus.resetLine = false;
    ST77xxPanel panel(bus, panelConfig(240, 240));

    ASSERT_TRUE(panel.init());
    ASSERT_GE(bus.trace.size(), 2u);
    EXPECT_EQ(bus.trace[0], "CMD 01");
    EXPECT_EQ(bus.trace[1], "DELAY 150");
}


/*
 * =============================================================================
 * OFFSETS
 * =============================================================================
 */

static void expectOffset(const ST77xxConfig& config, int16_t x, int16_t y) {
    int16_t ox = -1;
    int16_t oy = -1;
    ST77xxPanel::resolveOffset(config, &ox, &oy);
    EXPECT_EQ(ox, x) << config.width << "x" << config.height;
    EXPECT_EQ(oy, y) << config.width << "x" << config.height;
}


TEST(PanelOffsetTest, Presets) {
    expectOffset(panelConfig(135, 240), 52, 40);
    expectOffset(panelConfig(240, 280), 0, 20);
    expectOffset(panelConfig(128, 160), 0, 0);
    expectOffset(panelConfig(240, 240), 0, 0);
    expectOffset(panelConfig(240, 320), 0, 0);
    expectOffset(panelConfig(200, 100), 0, 0);
}


TEST(PanelOffsetTest, ExplicitOffsetIsKeptWhenItFits) {
    ST77xxConfig config = panelConfig(240, 240);
    config.xOffset = 0;
    config.yOffset = 80;
    expectOffset(config, 0, 80);
}


TEST(PanelOffsetTest, OffsetPastControllerRamFallsBackToZero) {
    ST77xxConfig config = panelConfig(240, 320);
    config.xOffset = 10;
    config.yOffset = 0;
    expectOffset(config, 0, 0);

    // 40 + 240 rows no longer fit once rows and columns swap
    ST77xxConfig landscape = panelConfig(135, 240);
    landscape.orientation.landscape = true;
    expectOffset(landscape, 0, 0);
}


/*
 * =============================================================================
 * ADDRESSING WINDOW
 * =============================================================================
 */

TEST(PanelWindowTest, OffsetIsAddedOnce) {
    FakeBus bus;
    ST77xxPanel panel(bus, panelConfig(135, 240));
    ASSERT_TRUE(panel.init());

    ASSERT_TRUE(panel.setWindow(100, 200, 134, 239));
    EXPECT_EQ(bus.lastCommand(ST77XX_CASET)->params, window(152, 186));
    EXPECT_EQ(bus.lastCommand(ST77XX_RASET)->params, window(240, 279));
}


TEST(PanelWindowTest, HighByteOfAddress) {
    FakeBus bus;
    ST77xxPanel panel(bus, panelConfig(240, 280));
    ASSERT_TRUE(panel.init());

    ASSERT_TRUE(panel.setWindow(0, 250, 239, 279));
    EXPECT_EQ(bus.lastCommand(ST77XX_CASET)->params, window(0, 239));
    EXPECT_EQ(bus.lastCommand(ST77XX_RASET)->params, std::vector<uint8_t>({0x01, 0x0E, 0x01, 0x2B}));
}


TEST(PanelWindowTest, FirstPixelLandsAtWindowOrigin) {
    FakeBus bus;
    ST77xxPanel panel(bus, panelConfig(135, 240));
    ASSERT_TRUE(panel.init());

    const uint8_t red[2] = {0xF8, 0x00};
    ASSERT_TRUE(panel.setWindow(5, 7, 9, 9));
    panel.writePixels(red, sizeof(red));

    EXPECT_EQ(bus.ram(5 + 52, 7 + 40), ST77XX_RED);
    EXPECT_EQ(bus.pixel(panel, 6, 7), ST77XX_BLACK);
    EXPECT_EQ(bus.pixel(panel, 4, 7), ST77XX_BLACK);
}


TEST(PanelWindowTest, PartlyOffPanelIsClamped) {
    FakeBus bus;
    ST77xxPanel panel(bus, panelConfig(240, 240));
    ASSERT_TRUE(panel.init());

    ASSERT_TRUE(panel.setWindow(-5, -5, 10, 10));
    EXPECT_EQ(bus.lastCommand(ST77XX_CASET)->params, window(0, 10));
    EXPECT_EQ(bus.lastCommand(ST77XX_RASET)->params, window(0, 10));

    ASSERT_TRUE(panel.setWindow(230, 235, 300, 400));
    EXPECT_EQ(bus.lastCommand(ST77XX_CASET)->params, window(230, 239));
    EXPECT_EQ(bus.lastCommand(ST77XX_RASET)->params, window(235, 239));
}


TEST(PanelWindowTest, MalformedOrOffPanelIsDropped) {
    FakeBus bus;
    ST77xxPanel panel(bus, panelConfig(240, 240));
    ASSERT_TRUE(panel.init());
    bus.clearLog();

    EXPECT_FALSE(panel.setWindow(10, 0, 5, 5));
    EXPECT_FALSE(panel.setWindow(0, 10, 5, 5));
    EXPECT_FALSE(panel.setWindow(240, 0, 250, 5));
    EXPECT_FALSE(panel.setWindow(0, 240, 5, 250));
    EXPECT_FALSE(panel.setWindow(-10, -10, -1, -1));

    EXPECT_EQ(bus.windowSets, 0);
    EXPECT_TRUE(bus.commands.empty());
    EXPECT_FALSE(panel.hasFault());
}


TEST(PanelWindowTest, RefusedBeforeInit) {
    FakeBus bus;
    ST77xxPanel panel(bus, panelConfig(240, 240));

    EXPECT_FALSE(panel.setWindow(0, 0, 10, 10));
    EXPECT_EQ(bus.attempts, 0);
}


TEST(PanelWindowTest, RawFillCoversWholePanel) {
    FakeBus bus;
    ST77xxPanel panel(bus, panelConfig(240, 280));
    ASSERT_TRUE(panel.init());
    bus.clearLog();

    panel.rawFill(ST77XX_BLUE);

    EXPECT_EQ(bus.windowSets, 1);
    EXPECT_EQ(bus.pixel(panel, 0, 0), ST77XX_BLUE);
    EXPECT_EQ(bus.pixel(panel, 239, 279), ST77XX_BLUE);
    EXPECT_EQ(bus.ram(0, 19), 0x1234);
    EXPECT_EQ(bus.ram(0, 300), 0x1234);
}


/*
 * =============================================================================
 * CONTROLLER SETTINGS
 * =============================================================================
 */

TEST(PanelControlTest, RuntimeRegisterWrites) {
    FakeBus bus;
    ST77xxPanel panel(bus, panelConfig(240, 240));
    ASSERT_TRUE(panel.init());
    bus.clearLog();

    panel.setSleep(true);
    EXPECT_TRUE(panel.isSleeping());
    panel.setSleep(false);
    EXPECT_FALSE(panel.isSleeping());

    panel.setInversion(true);
    panel.setDisplayOn(false);
    panel.setDisplayOn(true);

    ST77xxOrientation orientation;
    orientation.landscape = true;
    orientation.mirrorX = true;
    orientation.bgr = true;
    panel.setOrientation(orientation);

    panel.setColorMode(0xFF);

    std::vector<std::string> expected = {"CMD 10", "CMD 11", "CMD 21", "CMD 28", "CMD 29", "CMD 36", "CMD 3A"};
    EXPECT_EQ(bus.trace, expected);

    EXPECT_EQ(bus.lastCommand(ST77XX_MADCTL)->params,
              std::vector<uint8_t>{ST77XX_MADCTL_MV | ST77XX_MADCTL_MX | ST77XX_MADCTL_BGR});
    EXPECT_EQ(bus.lastCommand(ST77XX_COLMOD)->params, std::vector<uint8_t>{0x75});
}


TEST(PanelControlTest, ColorModeKeepsTwoBytesPerPixel) {
    FakeBus bus;
    ST77xxPanel panel(bus, panelConfig(240, 240));
    ASSERT_TRUE(panel.init());

    panel.setColorMode(ST77XX_COLOR_MODE_262K | ST77XX_COLOR_MODE_18BIT);
    EXPECT_EQ(bus.lastCommand(ST77XX_COLMOD)->params,
              std::vector<uint8_t>{ST77XX_COLOR_MODE_262K | ST77XX_COLOR_MODE_16BIT});

    panel.setColorMode(ST77XX_COLOR_MODE_65K | ST77XX_COLOR_MODE_12BIT);
    EXPECT_EQ(bus.lastCommand(ST77XX_COLMOD)->params, std::vector<uint8_t>{0x55});
}


/*
 * =============================================================================
 * TRANSPORT FAULTS
 * =============================================================================
 */

TEST(PanelFaultTest, FailedWriteLatchesUntilInit) {
    FakeBus bus;
    ST77xxPanel panel(bus, panelConfig(240, 240));
    ASSERT_TRUE(panel.init());

    bus.failAfter = bus.attempts;       // Next transmit fails
    panel.rawFill(ST77XX_RED);
    EXPECT_TRUE(panel.hasFault());

    // Everything after the failure is suppressed
    int attempts = bus.attempts;
    const uint8_t red[2] = {0xF8, 0x00};
    EXPECT_FALSE(panel.setWindow(0, 0, 0, 0));
    panel.writePixels(red, sizeof(red));
    panel.writeColor(ST77XX_RED, 100);
    panel.setInversion(true);
    EXPECT_EQ(bus.attempts, attempts);

    // Full re-init clears it
    bus.failAfter = -1;
    EXPECT_TRUE(panel.init());
    EXPECT_FALSE(panel.hasFault());
    EXPECT_TRUE(panel.setWindow(0, 0, 0, 0));
}


TEST(PanelFaultTest, FaultDuringInit) {
    FakeBus bus;
    bus.failAfter = 0;
    ST77xxPanel panel(bus, panelConfig(240, 240));

    EXPECT_FALSE(panel.init());
    EXPECT_FALSE(panel.isActive());
    EXPECT_TRUE(panel.hasFault());
    EXPECT_EQ(bus.attempts, 1);
}


TEST(PanelFaultTest, FaultInTheMiddleOfAStreamStopsIt) {
    FakeBus bus;
    ST77xxPanel panel(bus, panelConfig(240, 240));
    ASSERT_TRUE(panel.init());

    // Window (3 commands, 2 with parameters) goes through, then 2 data chunks
    bus.failAfter = bus.attempts + 5 + 2;
    panel.rawFill(ST77XX_GREEN);

    EXPECT_TRUE(panel.hasFault());
    EXPECT_EQ(bus.attempts, bus.failAfter + 1);
}


/*
 * =============================================================================
 * CHIP SELECT
 * =============================================================================
 */

TEST(PanelChipSelectTest, HoldActiveAssertsOnce) {
    FakeBus bus;
    ST77xxPanel panel(bus, panelConfig(240, 240));
    ASSERT_TRUE(panel.init());
    panel.rawFill(ST77XX_RED);

    EXPECT_EQ(bus.csAsserts, 1);
    EXPECT_TRUE(bus.csActive);
    EXPECT_FALSE(bus.transmitWithoutCs);
}


TEST(PanelChipSelectTest, PerTransactionTogglesAroundEveryWrite) {
    FakeBus bus;
    ST77xxConfig config = panelConfig(240, 240);
    config.chipSelect = ST77xxChipSelect::PerTransaction;
    ST77xxPanel panel(bus, config);

    ASSERT_TRUE(panel.init());
    EXPECT_FALSE(bus.csActive);
    EXPECT_FALSE(bus.transmitWithoutCs);

    int asserts = bus.csAsserts;
    bus.clearLog();
    panel.setInversion(true);
    EXPECT_EQ(bus.csAsserts, asserts + 1);
    EXPECT_FALSE(bus.csActive);
}
