/**
 * @file app_config.h
 * @brief Build-time configuration of the TRMNL display firmware.
 *
 * @details
 * Every value can be overridden from the build, e.g.
 *
 *     -DTRMNL_API_KEY=\"abc123\" -DTRMNL_DARK_MODE=1
 */

#pragma once


/*
 * -----------------------------------------------------------------------------
 * Network / server
 * -----------------------------------------------------------------------------
 */
#ifndef TRMNL_WIFI_SSID
#define TRMNL_WIFI_SSID         "trmnl"
#endif
#ifndef TRMNL_WIFI_PASSWORD
#define TRMNL_WIFI_PASSWORD     ""
#endif
#ifndef TRMNL_WIFI_TIMEOUT_MS
#define TRMNL_WIFI_TIMEOUT_MS   20000
#endif
#ifndef TRMNL_BASE_URL
#define TRMNL_BASE_URL          "https://usetrmnl.com"
#endif
#ifndef TRMNL_API_KEY
#define TRMNL_API_KEY           ""
#endif


/*
 * -----------------------------------------------------------------------------
 * Rendering
 * -----------------------------------------------------------------------------
 * TRMNL_DARK_MODE swaps black and white without touching the threshold.
 */
#ifndef TRMNL_DARK_MODE
#define TRMNL_DARK_MODE         0
#endif
#ifndef TRMNL_THRESHOLD
#define TRMNL_THRESHOLD         128
#endif
#ifndef TRMNL_RETRY_DELAY_SEC
#define TRMNL_RETRY_DELAY_SEC   60
#endif


/*
 * -----------------------------------------------------------------------------
 * Panel wiring (ESP32 DevKit defaults)
 * -----------------------------------------------------------------------------
 * EPAPER_PWR = -1 when the panel has no power switch.
 */
#ifndef EPAPER_MOSI
#define EPAPER_MOSI     23
#endif
#ifndef EPAPER_SCK
#define EPAPER_SCK      18
#endif
#ifndef EPAPER_CS
#define EPAPER_CS       5
#endif
#ifndef EPAPER_DC
#define EPAPER_DC       17
#endif
#ifndef EPAPER_RST
#define EPAPER_RST      16
#endif
#ifndef EPAPER_BUSY
#define EPAPER_BUSY     4
#endif
#ifndef EPAPER_PWR
#define EPAPER_PWR      -1
#endif
