/**
 * @file epaper.h
 * @brief 7.5" 800x480 monochrome E-Paper panel driver for ESP32 (ESP-IDF).
 *
 * @details
 * This component drives the panel controller through its command
 * protocol: power-up and reset, register setup, full-frame transfer,
 * refresh and deep sleep. It does not draw anything. Frames arrive
 * already packed (see epaper_bitmap.h and the frame_codec component).
 *
 * @note
 * All hardware access goes through a BusTransport, so the same driver
 * runs against EspSpiBus on the board and against a recording fake in
 * the test app.
 *
 * @par Supported hardware
 * - 7.5" 800x480 B/W panels (TRMNL / Waveshare 7.5" V2 class)
 * - Other geometries with the same command set (pass a PanelGeometry)
 */

/*
 * =============================================================================
 * BEGINNER'S GUIDE: DRIVING THE PANEL
 * =============================================================================
 *
 * =============================================================================
 * THE STATE MACHINE
 * =============================================================================
 *
 *                 init()                 sleep()
 *     UNINITIALIZED ─────► AWAKE ──────────────► ASLEEP
 *           ▲              │  ▲                    │
 *           │ init failed  │  │ displayFull()      │ init()
 *           └──────────────┘  └────┘               │ (full re-init)
 *                             ▲                    │
 *                             └────────────────────┘
 *
 *     Only AWAKE accepts frames. A sleeping controller has lost its
 *     register setup, so waking it means reset + every init command again.
 *
 * =============================================================================
 * WHY WRITE THE FRAME TWICE?
 * =============================================================================
 *
 *     The controller keeps two RAM planes:
 *
 *         0x10  "previous image"
 *         0x13  "new image"
 *
 *     During refresh it compares them pixel by pixel and picks a drive
 *     waveform per pixel. If both planes agreed somewhere, that pixel
 *     would not be driven at all, and old content would ghost through.
 *
 *     So we write the INVERSE of the frame as "previous":
 *
 *         previous = ~frame      (every pixel differs)
 *         new      =  frame
 *
 *     Every pixel is now "changed" and gets the full waveform. Clean
 *     redraw, no ghosting.
 *
 * =============================================================================
 * BUSY PIN
 * =============================================================================
 *
 *     BUSY HIGH → controller working (reset, refresh), don't send
 *     BUSY LOW  → ready
 *
 *     A full refresh takes 3-20 seconds depending on temperature.
 *     We poll every 10ms and give up after 30 seconds.
 *
 * =============================================================================
 * USAGE EXAMPLE
 * =============================================================================
 *
 *     EspSpiBus bus(busConfig);
 *     bus.begin();
 *
 *     EPaper display(bus, PanelGeometry{EPAPER_WIDTH, EPAPER_HEIGHT});
 *     display.init();
 *     display.displayFull(bitmap);   // slow, returns after refresh
 *     display.sleep();               // panel keeps the image unpowered
 *
 * =============================================================================
 */

#pragma once

#include "bus_transport.h"
#include "epaper_bitmap.h"
#include <esp_err.h>


/**
 * @brief Driver error codes, typed by the phase that failed.
 */
#define EPAPER_ERR_BASE             0xA700
#define EPAPER_ERR_INIT_FAILED      (EPAPER_ERR_BASE + 1)   ///< init() sequence failed
#define EPAPER_ERR_TRANSFER_FAILED  (EPAPER_ERR_BASE + 2)   ///< frame/command write failed
#define EPAPER_ERR_REFRESH_TIMEOUT  (EPAPER_ERR_BASE + 3)   ///< BUSY never cleared after refresh
#define EPAPER_ERR_SLEEP_FAILED     (EPAPER_ERR_BASE + 4)   ///< deep sleep command failed


/**
 * @brief Name of an EPAPER_ERR_* code, or esp_err_to_name() for anything else.
 */
const char* epaperErrToName(esp_err_t err);


/**
 * @brief Controller state as seen by the driver.
 */
enum EPaperState {
    EPAPER_UNINITIALIZED,
    EPAPER_AWAKE,
    EPAPER_ASLEEP
};


/**
 * @class EPaper
 * @brief Panel controller protocol over a BusTransport.
 */
class EPaper {

public:

    /**
     * @brief Construct a driver. No bus traffic happens here.
     *
     * @param bus Transport this driver uses exclusively. Must outlive the driver.
     * @param geometry Panel size, fixed for the driver's lifetime.
     */
    EPaper(BusTransport& bus, const PanelGeometry& geometry);


    /**
     * @brief Puts an awake panel to sleep.
     */
    ~EPaper();


    /**
     * @brief Power up, reset and configure the controller.
     *
     * Valid from UNINITIALIZED or ASLEEP.
     *
     * @return ESP_OK,
     *         ESP_ERR_INVALID_STATE if already AWAKE,
     *         ESP_ERR_INVALID_ARG if the geometry is invalid or wider or
     *         taller than MAX_DIMENSION,
     *         EPAPER_ERR_INIT_FAILED on any bus error or BUSY timeout
     *         (state becomes UNINITIALIZED).
     */
    esp_err_t init();


    /**
     * @brief Write a full frame and refresh the panel.
     *
     * @note This is SLOW (seconds). Returns once the refresh is done.
     *
     * @return ESP_OK,
     *         ESP_ERR_INVALID_STATE unless AWAKE (no bus traffic),
     *         ESP_ERR_INVALID_SIZE if the bitmap size does not match (no bus traffic),
     *         ESP_ERR_NO_MEM if no transfer block could be allocated (no bus traffic),
     *         EPAPER_ERR_TRANSFER_FAILED on a bus error,
     *         EPAPER_ERR_REFRESH_TIMEOUT if BUSY never cleared.
     *         The panel stays AWAKE in every case.
     */
    esp_err_t displayFull(const Bitmap& bitmap);


    /**
     * @brief Refresh the panel to all white.
     */
    esp_err_t clear();


    /**
     * @brief Enter deep sleep and cut panel power.
     *
     * @return ESP_OK (also when already ASLEEP),
     *         ESP_ERR_INVALID_STATE if never initialized,
     *         EPAPER_ERR_SLEEP_FAILED on a bus error. The state stays AWAKE
     *         if the sleep command itself failed, ASLEEP if only the
     *         power line failed afterwards.
     */
    esp_err_t sleep();


    EPaperState state() const { return panelState; }

    const PanelGeometry& geometry() const { return panelGeometry; }

    /**
     * @brief Bus-level error behind the last failed operation.
     */
    esp_err_t lastBusError() const { return busError; }


    /** Poll interval while waiting on BUSY. */
    static constexpr uint32_t BUSY_POLL_MS = 10;

    /** Controller reset normally completes in < 1s. */
    static constexpr uint32_t RESET_TIMEOUT_MS = 5000;

    /** Full refresh budget. Cold panels can take 20s. */
    static constexpr uint32_t REFRESH_TIMEOUT_MS = 30000;

    /** RAM window registers are 16-bit, so W-1 and H-1 must fit. */
    static constexpr uint32_t MAX_DIMENSION = 65536;


private:

    BusTransport& bus;
    PanelGeometry panelGeometry;
    EPaperState panelState;
    esp_err_t busError;


    /**
     * @brief Send a command followed by its parameter bytes.
     */
    esp_err_t sendCommand(uint8_t cmd, const uint8_t* params = nullptr, size_t len = 0);


    /**
     * @brief Send 0x10 and the inverted frame in maxTransferSize() blocks.
     */
    esp_err_t writePreviousPlane(const Bitmap& bitmap);


    /**
     * @brief The register setup after soft reset.
     */
    esp_err_t configureController();


    /**
     * @brief Log, release power and fall back to UNINITIALIZED.
     */
    esp_err_t failInit(const char* step, esp_err_t err);


    EPaper(const EPaper&) = delete;
    EPaper& operator=(const EPaper&) = delete;
};
