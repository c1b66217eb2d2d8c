#pragma once

/**
 * LxPrint - Layered driver for LX-series BLE thermal printers
 *
 * Architecture:
 *
 *   [Application Layer]
 *           |
 *   [PrinterDriver]      - printImage() entry point, one job per transport
 *           |
 *   [JobStateMachine]    - status wait, start, block streaming, completion ACK
 *           |            \
 *   [FrameCodec]     [FlowController] - wire frames / write pacing
 *           |
 *   [Transport : IPrinterTransport] - BLE write + notify
 *
 * Print sequence on the wire:
 *   device -> 5A 02 ...            status (optional)
 *   host   -> 5A 04 <n> <copies>   start
 *   host   -> 55 00 <i> <16 bytes> block i, for i = 0 .. n-1
 *   device -> 5A 06 <n> ...        complete, repeated until acknowledged
 *   host   -> 5A 04 <n> 0100       ack
 *
 * Usage (ESP32):
 *   1. Create BLECentralTransport with configuration
 *   2. init() and connect()
 *   3. Create PrinterDriver with the transport and a JobConfig
 *   4. printImage(raster)
 */

#include "PrintTypes.hpp"
#include "IPrinterTransport.hpp"
#include "FrameCodec.hpp"
#include "FlowController.hpp"
#include "JobConfig.hpp"
#include "PrintJob.hpp"
#include "JobStateMachine.hpp"
#include "PrinterDriver.hpp"
#include "TestPattern.hpp"

// The BLE transport needs the ESP32 Arduino core
#ifdef ARDUINO
#include "BLECentralTransport.hpp"
#endif
