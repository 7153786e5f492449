/**
 * @file spi_bus_transport.h
 * @brief Chunking and busy-polling logic shared by every SPI backend.
 *
 * @details
 * BusTransport describes WHAT the driver can ask for. SpiBusTransport
 * describes HOW that maps onto four raw line operations:
 *
 *     setLine()       drive RST / DC / PWR
 *     readBusyLine()  sample BUSY (true = busy)
 *     transmit()      one SPI transaction
 *     uptimeMs()      monotonic clock for timeouts
 *
 * A backend (EspSpiBus on the ESP32) only fills in those primitives and
 * delayMs(). The chunk splitting and the timeout loop live here once.
 */

#pragma once

#include "bus_transport.h"


/**
 * @class SpiBusTransport
 * @brief BusTransport implemented on top of raw SPI/GPIO primitives.
 */
class SpiBusTransport : public BusTransport {

public:

    /**
     * @brief Output lines a backend must be able to drive.
     */
    enum Line {
        LINE_RESET,     ///< RST, active-low pulse
        LINE_DC,        ///< Data/Command select, low = command
        LINE_POWER      ///< Panel power enable, active-high (optional)
    };


    /**
     * @param maxTransferSize Largest single SPI transaction in bytes (> 0).
     */
    explicit SpiBusTransport(size_t maxTransferSize);

    virtual ~SpiBusTransport() {}

    esp_err_t writeCommandByte(uint8_t code) override;

    esp_err_t writeDataChunk(const uint8_t* data, size_t len,
                             size_t* written = nullptr) override;

    esp_err_t waitWhileBusy(uint32_t pollMs, uint32_t timeoutMs) override;

    esp_err_t pulseReset(uint32_t settleMs) override;

    esp_err_t setPowerEnable(bool on) override;

    size_t maxTransferSize() const override { return maxChunk; }


protected:

    /**
     * @brief Drive one output line high or low.
     */
    virtual esp_err_t setLine(Line line, bool high) = 0;


    /**
     * @brief True while the controller holds BUSY high.
     */
    virtual bool readBusyLine() = 0;


    /**
     * @brief One SPI transaction. len never exceeds maxTransferSize().
     */
    virtual esp_err_t transmit(const uint8_t* data, size_t len) = 0;


    /**
     * @brief Milliseconds since an arbitrary fixed point.
     */
    virtual uint32_t uptimeMs() = 0;


    /**
     * @brief Whether a power-enable line is wired.
     */
    virtual bool hasPowerLine() const = 0;


private:

    size_t maxChunk;
};
