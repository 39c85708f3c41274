/**
 * @file st77xx_bus.h
 * @brief Transport adapter between the ST77xx driver and the hardware.
 *
 * @details
 * The ST77xx controllers are write-only in this driver: no MISO, no status
 * reads. Everything the driver needs from the hardware is:
 *
 *     - a byte stream (SPI MOSI + SCK)
 *     - the DC line   (LOW = command byte, HIGH = parameter/pixel data)
 *     - the RST line  (hardware reset)
 *     - the CS line   (chip select, active LOW)
 *     - a millisecond delay
 *
 * ST77xxBus turns those into one primitive, write(command, data), and leaves
 * the actual pin/SPI work to a subclass (ST77xxSpiBus on ESP-IDF).
 */

/*
 * =============================================================================
 * SIGNALING CONTRACT
 * =============================================================================
 *
 *     write(0x2A, {0x00,0x00,0x00,0xEF}):
 *
 *     DC:   ────┐         ┌─────────────────────────
 *               └─────────┘
 *     MOSI:     [  0x2A  ][ 0x00 ][ 0x00 ][ 0x00 ][ 0xEF ]
 *               command    data (parameters)
 *
 * CHIP SELECT:
 *     HoldActive      CS is pulled LOW once during init and left there.
 *                     Saves two GPIO writes per transaction. Fine as long as
 *                     nothing else sits on the same SPI bus.
 *     PerTransaction  CS goes LOW before every write() and HIGH after it.
 *                     Use this when the bus is shared (SD card, touch, ...).
 *
 * =============================================================================
 */

#pragma once

#include <stdint.h>
#include <stddef.h>


/**
 * @brief How the chip-select line is driven.
 */
enum class ST77xxChipSelect : uint8_t {
    HoldActive,         // Asserted once, left active for the device lifetime
    PerTransaction      // Asserted/released around every write()
};


/**
 * @class ST77xxBus
 * @brief Abstract byte-stream + control-line transport.
 *
 * @details
 * Subclasses implement the raw line and SPI operations. The command/data
 * sequencing lives here so every transport follows the same contract.
 * A failed transmit is reported as false and the rest of that write() is
 * abandoned; nothing is retried.
 */
class ST77xxBus {

public:

    virtual ~ST77xxBus() = default;


    /**
     * @brief Send a command byte, optionally followed by parameter bytes.
     *
     * @param command Command byte (sent with DC LOW).
     * @param data Parameter bytes (sent with DC HIGH), may be nullptr.
     * @param len Number of parameter bytes.
     * @return true if every byte was handed to the bus.
     */
    bool writeCommand(uint8_t command, const uint8_t* data = nullptr, size_t len = 0);


    /**
     * @brief Send data bytes only (DC HIGH), e.g. pixel streams after RAMWR.
     *
     * @return true if every byte was handed to the bus.
     */
    bool writeData(const uint8_t* data, size_t len);


    /**
     * @brief Select how the CS line is driven (default: HoldActive).
     */
    void setChipSelectMode(ST77xxChipSelect mode) { csMode = mode; }


    /**
     * @brief Current chip-select policy.
     */
    ST77xxChipSelect chipSelectMode() const { return csMode; }


    /**
     * @brief Assert CS for the rest of the device lifetime (HoldActive only).
     */
    void selectDevice();


    /**
     * @brief Drive the RST line.
     *
     * @param high true = released (HIGH), false = in reset (LOW).
     */
    virtual void setResetLevel(bool high) = 0;


    /**
     * @brief Whether a RST line is wired at all.
     */
    virtual bool hasResetLine() const { return true; }


    /**
     * @brief Block for the given number of milliseconds.
     */
    virtual void delayMs(uint32_t ms) = 0;


protected:

    /**
     * @brief Drive the DC line (true = data, false = command).
     */
    virtual void setDataMode(bool data) = 0;


    /**
     * @brief Drive the CS line (true = selected / LOW).
     */
    virtual void setChipSelect(bool active) = 0;


    /**
     * @brief Clock bytes out on the bus.
     *
     * @return true on success, false on a transport fault.
     */
    virtual bool transmit(const uint8_t* data, size_t len) = 0;


private:

    ST77xxChipSelect csMode = ST77xxChipSelect::HoldActive;

    bool sendPhases(const uint8_t* command, const uint8_t* data, size_t len);
};
