/**
 * @file st77xx_bus.cpp
 * @brief Command/data sequencing shared by every ST77xx transport.
 */

#include "st77xx_bus.h"


bool ST77xxBus::writeCommand(uint8_t command, const uint8_t* data, size_t len) {
    return sendPhases(&command, data, len);
}


bool ST77xxBus::writeData(const uint8_t* data, size_t len) {
    if (data == nullptr || len == 0) return true;
    return sendPhases(nullptr, data, len);
}


void ST77xxBus::selectDevice() {
    if (csMode == ST77xxChipSelect::HoldActive) {
        setChipSelect(true);
    }
}


bool ST77xxBus::sendPhases(const uint8_t* command, const uint8_t* data, size_t len) {
    bool perTransaction = (csMode == ST77xxChipSelect::PerTransaction);
    if (perTransaction) setChipSelect(true);

    bool ok = true;

    if (command != nullptr) {
        setDataMode(false);     // Command mode
        ok = transmit(command, 1);
    }

    if (ok && data != nullptr && len > 0) {
        setDataMode(true);      // Data mode
        ok = transmit(data, len);
    }

    if (perTransaction) setChipSelect(false);
    return ok;
}
