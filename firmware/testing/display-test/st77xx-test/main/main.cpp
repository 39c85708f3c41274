/**
 * @file main.cpp
 * @brief ST77xx TFT display test application (ESP-IDF).
 *
 * @details
 * Demonstrates the ST77xx component:
 * - Display initialization
 * - Color fills
 * - Text rendering (normal and upscaled)
 * - Drawing primitives (lines, rectangles, circles, triangles)
 * - Image blit
 * - Frame buffer and monochrome modes
 */

#include <stdio.h>
#include <math.h>
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "esp_log.h"
#include "esp_random.h"
#include "st77xx.h"
#include "st77xx_spi_bus.h"


static const char* TAG = "ST77XX_TEST";


#ifndef ST77XX_WIDTH
#define ST77XX_WIDTH 240
#endif
#ifndef ST77XX_HEIGHT
#define ST77XX_HEIGHT 240
#endif
#ifndef ST77XX_INVERSION
#define ST77XX_INVERSION 1
#endif
#ifndef ST77XX_MOSI
#define ST77XX_MOSI 23
#endif
#ifndef ST77XX_SCK
#define ST77XX_SCK 18
#endif
#ifndef ST77XX_CS
#define ST77XX_CS 5
#endif
#ifndef ST77XX_DC
#define ST77XX_DC 16
#endif
#ifndef ST77XX_RST
#define ST77XX_RST 17
#endif
#ifndef ST77XX_BLK
#define ST77XX_BLK 4
#endif


/*
 * 16x16 test sprite (RGB565, big-endian), filled in at startup.
 */
static uint8_t sprite[16 * 16 * 2];

static void buildSprite() {
    for (int y = 0; y < 16; y++) {
        for (int x = 0; x < 16; x++) {
            uint16_t color = ST77xxDisplay::color(x * 16, y * 16, 255 - x * 8);
            if ((x - 8) * (x - 8) + (y - 8) * (y - 8) > 56) {
                color = ST77XX_BLACK;
            }
            st77xxPutColor(&sprite[(y * 16 + x) * 2], color);
        }
    }
}


static ST77xxConfig makeConfig(ST77xxMode mode) {
    ST77xxConfig config;
    config.width = ST77XX_WIDTH;
    config.height = ST77XX_HEIGHT;
    config.inversion = ST77XX_INVERSION;
    config.mode = mode;
    return config;
}


extern "C" void app_main(void) {
    ESP_LOGI(TAG, "=== ST77xx TFT Test ===");
    ESP_LOGI(TAG, "Size: %dx%d", ST77XX_WIDTH, ST77XX_HEIGHT);
    ESP_LOGI(TAG, "MOSI=%d, SCK=%d, CS=%d, DC=%d, RST=%d, BLK=%d",
             ST77XX_MOSI, ST77XX_SCK, ST77XX_CS, ST77XX_DC, ST77XX_RST, ST77XX_BLK);

    /*
     * -------------------------------------------------------------------------
     * CREATE AND INITIALIZE BUS + DISPLAY
     * -------------------------------------------------------------------------
     */
    ST77xxSpiBus bus(
        (gpio_num_t)ST77XX_MOSI,
        (gpio_num_t)ST77XX_SCK,
        (gpio_num_t)ST77XX_CS,
        (gpio_num_t)ST77XX_DC,
        (gpio_num_t)ST77XX_RST,
        (gpio_num_t)ST77XX_BLK
    );

    if (!bus.init()) {
        ESP_LOGE(TAG, "SPI bus init failed!");
        return;
    }

    ST77xxDisplay display(bus, makeConfig(ST77xxMode::Direct));

    if (!display.init()) {
        ESP_LOGE(TAG, "Display init failed!");
        return;
    }

    buildSprite();
    ESP_LOGI(TAG, "Display initialized. Running tests...");

    const int16_t w = display.getWidth();
    const int16_t h = display.getHeight();

    while (1) {

        /*
         * ---------------------------------------------------------------------
         * TEST 1: Color Fills
         * ---------------------------------------------------------------------
         */
        ESP_LOGI(TAG, "Test 1: Colors");

        uint16_t colors[] = {ST77XX_RED, ST77XX_GREEN, ST77XX_BLUE, ST77XX_YELLOW, ST77XX_CYAN, ST77XX_MAGENTA};
        const char* colorNames[] = {"Red", "Green", "Blue", "Yellow", "Cyan", "Magenta"};

        for (int i = 0; i < 6; i++) {
            display.rawFill(colors[i]);
            display.drawString(20, h / 2 - 8, colorNames[i], ST77XX_WHITE, colors[i], 2);
            vTaskDelay(pdMS_TO_TICKS(500));
        }

        /*
         * ---------------------------------------------------------------------
         * TEST 2: Text
         * ---------------------------------------------------------------------
         */
        ESP_LOGI(TAG, "Test 2: Text");

        display.fillScreen(ST77XX_BLACK);

        const char* upscaled[] = {"START", "TEST", "NOW..."};
        for (int i = 0; i < 3; i++) {
            uint8_t level = 15 + 80 * i;
            display.drawString(20 * i, 20 * i, upscaled[i], ST77xxDisplay::color(level, level, level),
                               ST77XX_BLACK, 3);
        }

        // Starts off the left edge and runs past the right one
        int16_t x = -15;
        int16_t y = 80;
        for (int i = 0; i < 15; i++) {
            x += 2;
            y += 8;
            display.drawString(x, y, "Text drawing,Hello!", ST77XX_WHITE, ST77XX_BLACK);
        }

        vTaskDelay(pdMS_TO_TICKS(2000));

        /*
         * ---------------------------------------------------------------------
         * TEST 3: Lines
         * ---------------------------------------------------------------------
         */
        ESP_LOGI(TAG, "Test 3: Lines");

        display.fillScreen(ST77XX_BLACK);

        int16_t cx = w / 2;
        int16_t cy = h / 2;
        for (int angle = 0; angle < 360; angle += 15) {
            float rad = angle * 3.14159f / 180.0f;
            int16_t ex = cx + (int16_t)(w * cosf(rad));
            int16_t ey = cy + (int16_t)(h * sinf(rad));
            uint16_t color = ST77xxDisplay::color(angle * 255 / 360, 100, 255 - angle * 255 / 360);
            display.drawLine(cx, cy, ex, ey, color);
        }

        vTaskDelay(pdMS_TO_TICKS(2000));

        /*
         * ---------------------------------------------------------------------
         * TEST 4: Rectangles
         * ---------------------------------------------------------------------
         */
        ESP_LOGI(TAG, "Test 4: Rectangles");

        display.fillScreen(ST77XX_BLACK);

        bool fill = true;
        for (int i = 0; i < 100; i++) {
            uint32_t r = esp_random();
            display.rect(r & 0xFF, (r >> 8) & 0xFF, (r >> 16) & 0x3F, (r >> 22) & 0x3F,
                         ST77xxDisplay::color(r >> 24, r >> 4, r), fill);
            fill = !fill;
        }

        vTaskDelay(pdMS_TO_TICKS(2000));

        /*
         * ---------------------------------------------------------------------
         * TEST 5: Circles
         * ---------------------------------------------------------------------
         */
        ESP_LOGI(TAG, "Test 5: Circles");

        display.fillScreen(ST77XX_BLACK);

        for (int r = 10; r <= 90; r += 10) {
            display.circle(cx, cy, r, ST77xxDisplay::color(r * 2, 50, 255 - r * 2));
        }
        vTaskDelay(pdMS_TO_TICKS(1000));

        display.circle(cx - 40, cy, 35, ST77XX_RED, true);
        display.circle(cx + 40, cy, 35, ST77XX_BLUE, true);
        display.circle(cx, cy, 0, ST77XX_WHITE, true);

        vTaskDelay(pdMS_TO_TICKS(2000));

        /*
         * ---------------------------------------------------------------------
         * TEST 6: Triangles
         * ---------------------------------------------------------------------
         */
        ESP_LOGI(TAG, "Test 6: Triangles");

        display.fillScreen(ST77XX_BLACK);

        display.triangle(cx, 10, 10, h - 10, w - 10, h - 10, ST77XX_GREEN, true);
        display.triangle(cx, 30, 30, h - 30, w - 30, h - 30, ST77XX_WHITE);
        display.triangle(0, 0, 50, 50, 100, 100, ST77XX_YELLOW, true);     // Collinear

        vTaskDelay(pdMS_TO_TICKS(2000));

        /*
         * ---------------------------------------------------------------------
         * TEST 7: Images
         * ---------------------------------------------------------------------
         */
        ESP_LOGI(TAG, "Test 7: Images");

        display.fillScreen(ST77XX_BLACK);

        for (int i = 0; i < 20; i++) {
            uint32_t r = esp_random();
            int16_t ix = (int16_t)((r & 0xFF) % w) - 8;
            int16_t iy = (int16_t)(((r >> 8) & 0xFF) % h) - 8;
            display.drawImage(ix, iy, 16, 16, sprite);
        }

        vTaskDelay(pdMS_TO_TICKS(2000));

        /*
         * ---------------------------------------------------------------------
         * TEST 8: Frame Buffer (draw off-screen, show() once per frame)
         * ---------------------------------------------------------------------
         */
        ESP_LOGI(TAG, "Test 8: Frame buffer");

        {
            ST77xxDisplay buffered(bus, makeConfig(ST77xxMode::Framebuffer));
            if (!buffered.hasFramebufferMemory()) {
                ESP_LOGE(TAG, "Failed to allocate frame buffer (%d bytes needed)", w * h * 2);
            } else if (!buffered.init()) {
                ESP_LOGE(TAG, "Frame buffer init failed, bus fault");
            } else {
                int16_t ballX = cx, ballY = cy, ballDX = 4, ballDY = 3, ballR = 15;
                TickType_t start = xTaskGetTickCount();

                for (int frame = 0; frame < 100; frame++) {
                    buffered.fillScreen(ST77XX_BLACK);
                    buffered.drawRect(0, 0, w, h, ST77XX_WHITE);
                    buffered.fillCircle(ballX, ballY, ballR, ST77XX_RED);
                    buffered.drawCircle(ballX, ballY, ballR, ST77XX_WHITE);

                    if (!buffered.show()) {
                        ESP_LOGE(TAG, "show() failed, bus fault");
                        break;
                    }

                    ballX += ballDX;
                    ballY += ballDY;
                    if (ballX - ballR <= 0 || ballX + ballR >= w) ballDX = -ballDX;
                    if (ballY - ballR <= 0 || ballY + ballR >= h) ballDY = -ballDY;
                }

                ESP_LOGI(TAG, "100 frames in %lu ms",
                         (unsigned long)pdTICKS_TO_MS(xTaskGetTickCount() - start));
            }
        }

        /*
         * ---------------------------------------------------------------------
         * TEST 9: Monochrome (1 bit per pixel)
         * ---------------------------------------------------------------------
         */
        ESP_LOGI(TAG, "Test 9: Monochrome");

        {
            ST77xxDisplay mono(bus, makeConfig(ST77xxMode::Monochrome));
            if (!mono.hasFramebufferMemory()) {
                ESP_LOGE(TAG, "Failed to allocate monochrome buffer (%d bytes needed)", ((w + 7) / 8) * h);
            } else if (!mono.init()) {
                ESP_LOGE(TAG, "Monochrome init failed, bus fault");
            } else {
                mono.fillScreen(ST77XX_BLACK);
                mono.drawString(10, 10, "1-bit mode", ST77XX_WHITE, ST77XX_BLACK, 2);
                for (int i = 0; i < 10; i++) {
                    mono.drawLine(0, 40 + i * 8, w - 1, h - 1 - i * 8, ST77XX_WHITE);
                }
                mono.circle(cx, cy + 30, 40, ST77XX_WHITE);
                if (!mono.show()) {
                    ESP_LOGE(TAG, "show() failed, bus fault");
                } else {
                    vTaskDelay(pdMS_TO_TICKS(2000));
                }
            }
        }

        // The buffered displays re-ran init(), bring the direct one back
        if (!display.init()) {
            ESP_LOGE(TAG, "Display re-init failed!");
            return;
        }

        /*
         * ---------------------------------------------------------------------
         * FINAL: Complete message
         * ---------------------------------------------------------------------
         */
        ESP_LOGI(TAG, "All tests complete!");

        display.fillScreen(ST77XX_BLACK);
        display.fillRect(20, cy - 60, w - 40, 120, ST77XX_GREEN);
        display.fillRect(30, cy - 50, w - 60, 100, ST77XX_BLACK);
        display.drawString(45, cy - 30, "All Tests", ST77XX_WHITE, ST77XX_BLACK, 2);
        display.drawString(45, cy, "Complete!", ST77XX_GREEN, ST77XX_BLACK, 2);

        vTaskDelay(pdMS_TO_TICKS(1000));
    }
}
