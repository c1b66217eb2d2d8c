#pragma once

#include <cstdint>

#include "JobConfig.hpp"

// BLE configuration
extern const char* BLE_DEVICE_NAME;
extern const char* PRINTER_NAME;         // Substring matched against the advertised name
extern const char* PRINTER_ADDRESS;      // Empty to scan by name

// Print session policy
extern const int PRINT_FLOW_CONTROL_WINDOW;
extern const uint32_t PRINT_STATUS_WAIT_TIMEOUT_MS;
extern const bool PRINT_SKIP_STATUS_WAIT;
extern const uint32_t PRINT_WRITE_SLOT_TIMEOUT_MS;
extern const uint32_t PRINT_COMPLETION_TIMEOUT_MS;
extern const uint32_t PRINT_ACK_DRAIN_GRACE_MS;
extern const uint16_t PRINT_COPIES;

// Test page geometry
extern const uint16_t PRINT_HEAD_WIDTH_DOTS;   // 384 on 58 mm heads
extern const uint16_t TEST_PATTERN_ROWS;

// Session policy assembled from the values above
JobConfig makeJobConfig();
