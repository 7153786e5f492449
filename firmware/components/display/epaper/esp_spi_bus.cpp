/**
 * @file esp_spi_bus.cpp
 * @brief ESP-IDF SPI/GPIO backend implementation.
 */

#include "esp_spi_bus.h"
#include <esp_log.h>
#include <esp_timer.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>


static const char* TAG = "EPAPER_BUS";


/*
 * =============================================================================
 * CONSTRUCTOR / DESTRUCTOR
 * =============================================================================
 *
 * Stores config only. Hardware setup happens in begin().
 */
EspSpiBus::EspSpiBus(const EspSpiBusConfig& config)
    : SpiBusTransport(config.maxTransferSize),
      config(config),
      spiDevice(nullptr),
      busInitialized(false)
{
}


EspSpiBus::~EspSpiBus() {
    if (spiDevice) {
        spi_bus_remove_device(spiDevice);
        spiDevice = nullptr;
    }
    if (busInitialized) {
        spi_bus_free(config.host);
        busInitialized = false;
    }
    gpio_reset_pin(config.pins.dc);
    gpio_reset_pin(config.pins.rst);
    gpio_reset_pin(config.pins.busy);
    if (hasPowerLine()) gpio_reset_pin(config.pins.power);
}


/*
 * =============================================================================
 * BEGIN
 * =============================================================================
 */
esp_err_t EspSpiBus::begin() {
    if (isReady()) {
        ESP_LOGW(TAG, "begin() called twice, bus already set up");
        return ESP_OK;
    }

    ESP_LOGI(TAG, "Bus setup (MOSI=%d, SCK=%d, CS=%d, DC=%d, RST=%d, BUSY=%d, PWR=%d)",
             config.pins.mosi, config.pins.sck, config.pins.cs, config.pins.dc,
             config.pins.rst, config.pins.busy, config.pins.power);

    if (config.maxTransferSize == 0 || config.maxTransferSize > ESP_SPI_BUS_MAX_TRANSFER_SIZE) {
        ESP_LOGE(TAG, "maxTransferSize must be 1..%d (got %u)",
                 ESP_SPI_BUS_MAX_TRANSFER_SIZE, (unsigned)config.maxTransferSize);
        return ESP_ERR_INVALID_ARG;
    }

    /*
     * -------------------------------------------------------------------------
     * STEP 1: Control pins
     * -------------------------------------------------------------------------
     * DC, RST and PWR are outputs. Set the idle level BEFORE switching the
     * pin to output so the controller never sees a glitch on RST.
     */
    gpio_set_level(config.pins.dc, 1);
    gpio_set_level(config.pins.rst, 1);

    gpio_config_t io_conf = {};
    io_conf.mode = GPIO_MODE_OUTPUT;
    io_conf.pull_up_en = GPIO_PULLUP_DISABLE;
    io_conf.pull_down_en = GPIO_PULLDOWN_DISABLE;
    io_conf.intr_type = GPIO_INTR_DISABLE;
    io_conf.pin_bit_mask = (1ULL << config.pins.dc) | (1ULL << config.pins.rst);
    if (hasPowerLine()) {
        gpio_set_level(config.pins.power, 0);
        io_conf.pin_bit_mask |= (1ULL << config.pins.power);
    }

    esp_err_t err = gpio_config(&io_conf);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Output pin config failed: %s", esp_err_to_name(err));
        return err;
    }

    // BUSY pin (input!)
    io_conf.mode = GPIO_MODE_INPUT;
    io_conf.pin_bit_mask = (1ULL << config.pins.busy);
    err = gpio_config(&io_conf);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "BUSY pin config failed: %s", esp_err_to_name(err));
        return err;
    }

    /*
     * -------------------------------------------------------------------------
     * STEP 2: SPI bus
     * -------------------------------------------------------------------------
     * max_transfer_sz caps every transaction. SpiBusTransport splits frames
     * to match, so this is also the chunk size.
     */
    spi_bus_config_t busConfig = {};
    busConfig.mosi_io_num = config.pins.mosi;
    busConfig.miso_io_num = -1;
    busConfig.sclk_io_num = config.pins.sck;
    busConfig.quadwp_io_num = -1;
    busConfig.quadhd_io_num = -1;
    busConfig.max_transfer_sz = (int)config.maxTransferSize;

    err = spi_bus_initialize(config.host, &busConfig, SPI_DMA_CH_AUTO);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "SPI bus init failed: %s", esp_err_to_name(err));
        return err;
    }
    busInitialized = true;

    /*
     * -------------------------------------------------------------------------
     * STEP 3: SPI device
     * -------------------------------------------------------------------------
     */
    spi_device_interface_config_t devConfig = {};
    devConfig.clock_speed_hz = config.clockHz;
    devConfig.mode = 0;
    devConfig.spics_io_num = config.pins.cs;
    devConfig.queue_size = 1;

    err = spi_bus_add_device(config.host, &devConfig, &spiDevice);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "SPI device add failed: %s", esp_err_to_name(err));
        spi_bus_free(config.host);
        busInitialized = false;
        spiDevice = nullptr;
        return err;
    }

    ESP_LOGI(TAG, "SPI ready (%d Hz, mode 0, %u byte chunks)",
             config.clockHz, (unsigned)config.maxTransferSize);
    return ESP_OK;
}


/*
 * =============================================================================
 * RAW PRIMITIVES
 * =============================================================================
 */

esp_err_t EspSpiBus::setLine(Line line, bool high) {
    gpio_num_t pin;
    switch (line) {
        case LINE_RESET: pin = config.pins.rst;   break;
        case LINE_DC:    pin = config.pins.dc;    break;
        case LINE_POWER: pin = config.pins.power; break;
        default:         return ESP_ERR_INVALID_ARG;
    }
    return gpio_set_level(pin, high ? 1 : 0);
}


bool EspSpiBus::readBusyLine() {
    return gpio_get_level(config.pins.busy) == 1;
}


esp_err_t EspSpiBus::transmit(const uint8_t* data, size_t len) {
    if (!isReady()) return ESP_ERR_INVALID_STATE;

    spi_transaction_t trans = {};
    trans.length = len * 8;
    trans.tx_buffer = data;
    return spi_device_polling_transmit(spiDevice, &trans);
}


void EspSpiBus::delayMs(uint32_t ms) {
    vTaskDelay(pdMS_TO_TICKS(ms));
}


uint32_t EspSpiBus::uptimeMs() {
    return (uint32_t)(esp_timer_get_time() / 1000);
}
