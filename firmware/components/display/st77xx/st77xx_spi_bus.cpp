/**
 * @file st77xx_spi_bus.cpp
 * @brief ESP-IDF SPI transport implementation.
 */

#include "st77xx_spi_bus.h"
#include <esp_log.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

static const char* TAG = "ST77xxBus";


/*
 * =============================================================================
 * CONSTRUCTOR / DESTRUCTOR
 * =============================================================================
 */
ST77xxSpiBus::ST77xxSpiBus(gpio_num_t mosiPin, gpio_num_t sckPin, gpio_num_t csPin,
                           gpio_num_t dcPin, gpio_num_t rstPin, gpio_num_t blkPin,
                           spi_host_device_t spiHost, int clockHz, size_t maxTransferBytes)
    : mosiPin(mosiPin),
      sckPin(sckPin),
      csPin(csPin),
      dcPin(dcPin),
      rstPin(rstPin),
      blkPin(blkPin),
      spiHost(spiHost),
      clockHz(clockHz),
      maxTransferBytes(maxTransferBytes),
      spiDevice(nullptr),
      initialized(false)
{
}


ST77xxSpiBus::~ST77xxSpiBus() {
    if (initialized && spiDevice) {
        spi_bus_remove_device(spiDevice);
        spi_bus_free(spiHost);
    }
}


/*
 * =============================================================================
 * INITIALIZATION
 * =============================================================================
 */
bool ST77xxSpiBus::init() {
    ESP_LOGI(TAG, "Initializing SPI bus (MOSI=%d, SCK=%d, CS=%d, DC=%d, RST=%d, BLK=%d, %d Hz)",
             mosiPin, sckPin, csPin, dcPin, rstPin, blkPin, clockHz);

    /*
     * -------------------------------------------------------------------------
     * STEP 1: Configure control pins (DC, RST, CS, BLK)
     * -------------------------------------------------------------------------
     */
    gpio_config_t io_conf = {};
    io_conf.mode = GPIO_MODE_OUTPUT;
    io_conf.pull_up_en = GPIO_PULLUP_DISABLE;
    io_conf.pull_down_en = GPIO_PULLDOWN_DISABLE;
    io_conf.intr_type = GPIO_INTR_DISABLE;

    io_conf.pin_bit_mask = (1ULL << dcPin);
    esp_err_t err = gpio_config(&io_conf);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "DC pin config failed: %s", esp_err_to_name(err));
        return false;
    }

    if (rstPin != GPIO_NUM_NC) {
        io_conf.pin_bit_mask = (1ULL << rstPin);
        err = gpio_config(&io_conf);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "RST pin config failed: %s", esp_err_to_name(err));
            return false;
        }
        gpio_set_level(rstPin, 1);      // Not in reset
    }

    if (csPin != GPIO_NUM_NC) {
        io_conf.pin_bit_mask = (1ULL << csPin);
        err = gpio_config(&io_conf);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "CS pin config failed: %s", esp_err_to_name(err));
            return false;
        }
        gpio_set_level(csPin, 1);       // Deselected
    }

    if (blkPin != GPIO_NUM_NC) {
        io_conf.pin_bit_mask = (1ULL << blkPin);
        err = gpio_config(&io_conf);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "BLK pin config failed: %s", esp_err_to_name(err));
            return false;
        }
        gpio_set_level(blkPin, 1);      // Backlight on
    }

    /*
     * -------------------------------------------------------------------------
     * STEP 2: Configure SPI bus
     * -------------------------------------------------------------------------
     */
    spi_bus_config_t busConfig = {};
    busConfig.mosi_io_num = mosiPin;
    busConfig.miso_io_num = -1;         // Not used
    busConfig.sclk_io_num = sckPin;
    busConfig.quadwp_io_num = -1;
    busConfig.quadhd_io_num = -1;
    busConfig.max_transfer_sz = maxTransferBytes;

    err = spi_bus_initialize(spiHost, &busConfig, SPI_DMA_CH_AUTO);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "SPI bus init failed: %s", esp_err_to_name(err));
        return false;
    }

    /*
     * -------------------------------------------------------------------------
     * STEP 3: Add SPI device (CS driven by us, not the driver)
     * -------------------------------------------------------------------------
     */
    spi_device_interface_config_t devConfig = {};
    devConfig.clock_speed_hz = clockHz;
    devConfig.mode = 0;                 // SPI mode 0
    devConfig.spics_io_num = -1;
    devConfig.queue_size = 7;

    err = spi_bus_add_device(spiHost, &devConfig, &spiDevice);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "SPI device add failed: %s", esp_err_to_name(err));
        spi_bus_free(spiHost);
        return false;
    }

    initialized = true;
    ESP_LOGI(TAG, "SPI bus ready");
    return true;
}


/*
 * =============================================================================
 * CONTROL LINES
 * =============================================================================
 */

void ST77xxSpiBus::setDataMode(bool data) {
    gpio_set_level(dcPin, data ? 1 : 0);
}


void ST77xxSpiBus::setChipSelect(bool active) {
    if (csPin == GPIO_NUM_NC) return;
    gpio_set_level(csPin, active ? 0 : 1);     // Active LOW
}


void ST77xxSpiBus::setResetLevel(bool high) {
    if (rstPin == GPIO_NUM_NC) return;
    gpio_set_level(rstPin, high ? 1 : 0);
}


void ST77xxSpiBus::setBacklight(bool on) {
    if (blkPin == GPIO_NUM_NC) return;
    gpio_set_level(blkPin, on ? 1 : 0);
}


void ST77xxSpiBus::delayMs(uint32_t ms) {
    vTaskDelay(pdMS_TO_TICKS(ms));
}


/*
 * =============================================================================
 * DATA TRANSFER
 * =============================================================================
 *
 * Large writes are split into DMA-sized chunks. The first failing chunk
 * aborts the rest of the write.
 */
bool ST77xxSpiBus::transmit(const uint8_t* data, size_t len) {
    if (!initialized) {
        ESP_LOGE(TAG, "transmit before init()");
        return false;
    }

    while (len > 0) {
        size_t chunk = (len < maxTransferBytes) ? len : maxTransferBytes;

        spi_transaction_t trans = {};
        trans.length = chunk * 8;
        trans.tx_buffer = data;

        esp_err_t err = spi_device_polling_transmit(spiDevice, &trans);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "SPI transmit failed (%u bytes): %s", (unsigned)chunk, esp_err_to_name(err));
            return false;
        }

        data += chunk;
        len -= chunk;
    }

    return true;
}
