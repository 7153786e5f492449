/**
 * @file bus_transport.h
 * @brief Abstract SPI/GPIO capability used by the e-paper driver.
 *
 * @details
 * The EPaper driver never touches spi_master or gpio directly. It talks
 * to a BusTransport, which gives it exactly what the controller protocol
 * needs:
 *
 *     writeCommandByte()  DC low, one byte
 *     writeDataChunk()    DC high, payload split into bounded transactions
 *     waitWhileBusy()     poll BUSY until the controller is idle
 *     pulseReset()        RST low -> high
 *     setPowerEnable()    optional panel power switch
 *     delayMs()           settle delays between steps
 *
 * On hardware the implementation is EspSpiBus. In the test apps it is a
 * recording fake, so the whole command protocol can be checked without
 * a panel attached.
 */

#pragma once

#include <esp_err.h>
#include <stddef.h>
#include <stdint.h>


/**
 * @class BusTransport
 * @brief Exclusive access to one SPI device plus the RST/DC/BUSY/PWR lines.
 *
 * @note Not thread safe. One EPaper owns one BusTransport.
 */
class BusTransport {

public:

    virtual ~BusTransport() {}


    /**
     * @brief Send a single command opcode (DC = command level).
     *
     * @return ESP_OK, or the bus error.
     */
    virtual esp_err_t writeCommandByte(uint8_t code) = 0;


    /**
     * @brief Send command parameters or image data (DC = data level).
     *
     * The payload is split into transactions no larger than
     * maxTransferSize(). The first failing transaction aborts the call.
     *
     * @param data Bytes to send.
     * @param len Number of bytes.
     * @param written If not null, receives the byte offset reached
     *                (equals len on success).
     *
     * @return ESP_OK, or the bus error of the failing chunk.
     */
    virtual esp_err_t writeDataChunk(const uint8_t* data, size_t len,
                                     size_t* written = nullptr) = 0;


    /**
     * @brief Block until the BUSY line reads idle.
     *
     * @param pollMs Sleep between two samples.
     * @param timeoutMs Give up after this long.
     *
     * @return ESP_OK, or ESP_ERR_TIMEOUT if BUSY never cleared.
     */
    virtual esp_err_t waitWhileBusy(uint32_t pollMs, uint32_t timeoutMs) = 0;


    /**
     * @brief Pulse the reset line low then high, waiting settleMs after each edge.
     */
    virtual esp_err_t pulseReset(uint32_t settleMs) = 0;


    /**
     * @brief Drive the power-enable line. Succeeds silently if not wired.
     */
    virtual esp_err_t setPowerEnable(bool on) = 0;


    /**
     * @brief Blocking delay.
     */
    virtual void delayMs(uint32_t ms) = 0;


    /**
     * @brief Largest payload sent in one SPI transaction.
     */
    virtual size_t maxTransferSize() const = 0;
};
