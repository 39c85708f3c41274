/**
 * @file st77xx_spi_bus.h
 * @brief ESP-IDF SPI transport for ST77xx displays.
 *
 * @details
 * Drives the SPI master peripheral plus the DC, RST, CS and backlight GPIOs.
 * CS is a plain GPIO (not the SPI driver's own CS) so the panel can keep it
 * asserted across a whole command + data sequence.
 *
 *     ESP32                      Display
 *     ─────                      ───────
 *     MOSI ───────────────────── SDA
 *     SCK  ───────────────────── SCL
 *     CS   (GPIO, active LOW) ── CS
 *     DC   (GPIO) ────────────── DC
 *     RST  (GPIO, optional) ──── RST
 *     BLK  (GPIO, optional) ──── BLK
 *
 * Use GPIO_NUM_NC for any optional line that is not wired.
 */

#pragma once

#include <driver/spi_master.h>
#include <driver/gpio.h>
#include <stdint.h>
#include <stddef.h>
#include "st77xx_bus.h"


/**
 * @class ST77xxSpiBus
 * @brief ST77xxBus over the ESP-IDF spi_master driver.
 *
 * Example:
 * @code
 *     ST77xxSpiBus bus(GPIO_NUM_23, GPIO_NUM_18, GPIO_NUM_5,
 *                      GPIO_NUM_16, GPIO_NUM_17, GPIO_NUM_4);
 *     if (!bus.init()) {
 *         // SPI bus or device could not be set up
 *     }
 * @endcode
 */
class ST77xxSpiBus : public ST77xxBus {

public:

    /**
     * @brief Create the transport. Nothing is configured until init().
     *
     * @param mosiPin SPI MOSI (SDA).
     * @param sckPin SPI clock (SCL).
     * @param csPin Chip select, GPIO_NUM_NC if tied LOW on the module.
     * @param dcPin Data/command select.
     * @param rstPin Reset, GPIO_NUM_NC if not wired.
     * @param blkPin Backlight, GPIO_NUM_NC if not wired.
     * @param spiHost SPI peripheral (default: SPI2_HOST).
     * @param clockHz SPI clock (default: 40 MHz).
     * @param maxTransferBytes Largest single DMA transfer (default: 4092).
     */
    ST77xxSpiBus(gpio_num_t mosiPin, gpio_num_t sckPin, gpio_num_t csPin,
                 gpio_num_t dcPin, gpio_num_t rstPin = GPIO_NUM_NC,
                 gpio_num_t blkPin = GPIO_NUM_NC,
                 spi_host_device_t spiHost = SPI2_HOST,
                 int clockHz = 40 * 1000 * 1000,
                 size_t maxTransferBytes = 4092);


    /**
     * @brief Release the SPI device and bus.
     */
    ~ST77xxSpiBus();


    /**
     * @brief Configure the GPIOs and bring up the SPI bus.
     *
     * @return true on success, false if the SPI driver refused.
     */
    bool init();


    /**
     * @brief Turn the backlight on or off (no-op without a BLK pin).
     */
    void setBacklight(bool on);


    void setResetLevel(bool high) override;
    bool hasResetLine() const override { return rstPin != GPIO_NUM_NC; }
    void delayMs(uint32_t ms) override;


protected:

    void setDataMode(bool data) override;
    void setChipSelect(bool active) override;
    bool transmit(const uint8_t* data, size_t len) override;


private:

    gpio_num_t mosiPin;
    gpio_num_t sckPin;
    gpio_num_t csPin;
    gpio_num_t dcPin;
    gpio_num_t rstPin;
    gpio_num_t blkPin;
    spi_host_device_t spiHost;
    int clockHz;
    size_t maxTransferBytes;

    spi_device_handle_t spiDevice;
    bool initialized;
};
