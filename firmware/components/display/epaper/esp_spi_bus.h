/**
 * @file esp_spi_bus.h
 * @brief ESP-IDF SPI master + GPIO backend for the e-paper bus.
 *
 * @details
 * Owns the SPI host, the SPI device handle and the control GPIOs for the
 * lifetime of the object. Nothing else in the firmware may touch these
 * pins while an EspSpiBus exists.
 *
 * @par Bus contract
 * - SPI mode 0, 8-bit words, MSB first
 * - 2 MHz clock (the controller tolerates up to ~20 MHz, 2 MHz is safe
 *   on long jumper wires)
 * - max_transfer_sz <= 4096 bytes per transaction
 * - CS driven by the SPI master, DC/RST/PWR by GPIO, BUSY is an input
 */

#pragma once

#include "spi_bus_transport.h"
#include <driver/spi_master.h>
#include <driver/gpio.h>


/**
 * @brief Pin roles of the e-paper connector.
 */
struct EPaperPins {
    gpio_num_t mosi;
    gpio_num_t sck;
    gpio_num_t cs;
    gpio_num_t dc;      ///< low = command, high = data
    gpio_num_t rst;     ///< active-low reset
    gpio_num_t busy;    ///< input, high = busy
    gpio_num_t power;   ///< active-high power enable, GPIO_NUM_NC if absent
};


/**
 * @brief Immutable configuration of one EspSpiBus.
 */
struct EspSpiBusConfig {
    EPaperPins pins;
    spi_host_device_t host;
    int clockHz;
    size_t maxTransferSize;
};


/**
 * @brief Defaults for a 7.5" 800x480 panel on SPI2.
 */
#define ESP_SPI_BUS_DEFAULT_CLOCK_HZ    (2 * 1000 * 1000)
#define ESP_SPI_BUS_MAX_TRANSFER_SIZE   4096


/**
 * @class EspSpiBus
 * @brief SpiBusTransport backed by driver/spi_master.h and driver/gpio.h.
 */
class EspSpiBus : public SpiBusTransport {

public:

    explicit EspSpiBus(const EspSpiBusConfig& config);

    /**
     * @brief Remove the SPI device, free the bus and release the pins.
     */
    ~EspSpiBus();

    /**
     * @brief Configure GPIOs and bring up the SPI bus/device.
     *
     * @return ESP_OK (also when already set up), or the spi_master/gpio error.
     */
    esp_err_t begin();

    /** True once begin() has attached the SPI device. */
    bool isReady() const { return spiDevice != nullptr; }

    void delayMs(uint32_t ms) override;


protected:

    esp_err_t setLine(Line line, bool high) override;

    bool readBusyLine() override;

    esp_err_t transmit(const uint8_t* data, size_t len) override;

    uint32_t uptimeMs() override;

    bool hasPowerLine() const override { return config.pins.power != GPIO_NUM_NC; }


private:

    EspSpiBusConfig config;
    spi_device_handle_t spiDevice;
    bool busInitialized;

    EspSpiBus(const EspSpiBus&) = delete;
    EspSpiBus& operator=(const EspSpiBus&) = delete;
};
