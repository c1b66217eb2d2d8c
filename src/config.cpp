#include "config.hpp"

// Default values can be overridden at build time using PlatformIO build flags, e.g.:
// build_flags =
//   -DPRINTER_NAME_VALUE=\"LX-D02\"
//   -DPRINTER_ADDRESS_VALUE=\"aa:bb:cc:dd:ee:ff\"
//   -DPRINT_FLOW_CONTROL_WINDOW_VALUE=4
//   -DPRINT_COMPLETION_TIMEOUT_MS_VALUE=20000

#ifndef BLE_DEVICE_NAME_VALUE
#define BLE_DEVICE_NAME_VALUE "LxPrint-ESP32"
#endif

#ifndef PRINTER_NAME_VALUE
#define PRINTER_NAME_VALUE "LX-D01"
#endif

#ifndef PRINTER_ADDRESS_VALUE
#define PRINTER_ADDRESS_VALUE ""
#endif

#ifndef PRINT_FLOW_CONTROL_WINDOW_VALUE
#define PRINT_FLOW_CONTROL_WINDOW_VALUE 2
#endif

#ifndef PRINT_STATUS_WAIT_TIMEOUT_MS_VALUE
#define PRINT_STATUS_WAIT_TIMEOUT_MS_VALUE 1000
#endif

#ifndef PRINT_SKIP_STATUS_WAIT_VALUE
#define PRINT_SKIP_STATUS_WAIT_VALUE false
#endif

#ifndef PRINT_WRITE_SLOT_TIMEOUT_MS_VALUE
#define PRINT_WRITE_SLOT_TIMEOUT_MS_VALUE 2000
#endif

#ifndef PRINT_COMPLETION_TIMEOUT_MS_VALUE
#define PRINT_COMPLETION_TIMEOUT_MS_VALUE 10000
#endif

#ifndef PRINT_ACK_DRAIN_GRACE_MS_VALUE
#define PRINT_ACK_DRAIN_GRACE_MS_VALUE 500
#endif

#ifndef PRINT_COPIES_VALUE
#define PRINT_COPIES_VALUE 1
#endif

#ifndef PRINT_HEAD_WIDTH_DOTS_VALUE
#define PRINT_HEAD_WIDTH_DOTS_VALUE 384
#endif

#ifndef TEST_PATTERN_ROWS_VALUE
#define TEST_PATTERN_ROWS_VALUE 120
#endif

const char* BLE_DEVICE_NAME = BLE_DEVICE_NAME_VALUE;
const char* PRINTER_NAME = PRINTER_NAME_VALUE;
const char* PRINTER_ADDRESS = PRINTER_ADDRESS_VALUE;

const int PRINT_FLOW_CONTROL_WINDOW = PRINT_FLOW_CONTROL_WINDOW_VALUE;
const uint32_t PRINT_STATUS_WAIT_TIMEOUT_MS = PRINT_STATUS_WAIT_TIMEOUT_MS_VALUE;
const bool PRINT_SKIP_STATUS_WAIT = PRINT_SKIP_STATUS_WAIT_VALUE;
const uint32_t PRINT_WRITE_SLOT_TIMEOUT_MS = PRINT_WRITE_SLOT_TIMEOUT_MS_VALUE;
const uint32_t PRINT_COMPLETION_TIMEOUT_MS = PRINT_COMPLETION_TIMEOUT_MS_VALUE;
const uint32_t PRINT_ACK_DRAIN_GRACE_MS = PRINT_ACK_DRAIN_GRACE_MS_VALUE;
const uint16_t PRINT_COPIES = PRINT_COPIES_VALUE;

const uint16_t PRINT_HEAD_WIDTH_DOTS = PRINT_HEAD_WIDTH_DOTS_VALUE;
const uint16_t TEST_PATTERN_ROWS = TEST_PATTERN_ROWS_VALUE;

JobConfig makeJobConfig() {
    JobConfig config;
    config.flowControlWindow = PRINT_FLOW_CONTROL_WINDOW;
    config.statusWaitTimeoutMs = PRINT_STATUS_WAIT_TIMEOUT_MS;
    config.skipStatusWait = PRINT_SKIP_STATUS_WAIT;
    config.writeSlotTimeoutMs = PRINT_WRITE_SLOT_TIMEOUT_MS;
    config.completionWaitTimeoutMs = PRINT_COMPLETION_TIMEOUT_MS;
    config.ackDrainGraceMs = PRINT_ACK_DRAIN_GRACE_MS;
    config.copies = PRINT_COPIES;
    return config;
}
