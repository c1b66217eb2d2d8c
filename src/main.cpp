#include <Arduino.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

// LxPrint layered printer driver
#include "LxPrint.hpp"

#include "config.hpp"

// Printer stack (layered architecture)
// Layer 1: BLE Transport - handles BLE connection and I/O
// Layer 2: Printer Driver - runs print jobs over the transport
static BLECentralTransport* printerTransport = nullptr;
static PrinterDriver* printerDriver = nullptr;

// Print jobs run in their own task so the serial console can cancel them
static TaskHandle_t printTaskHandle = nullptr;
static constexpr uint32_t PRINT_TASK_STACK_SIZE = 8192;

void disconnectPrinter() {
  if (printerDriver != nullptr) {
    printerDriver->cancel();
    delete printerDriver;
    printerDriver = nullptr;
  }

  if (printerTransport != nullptr) {
    printerTransport->deinit();
    delete printerTransport;
    printerTransport = nullptr;
  }
}

bool initPrinter() {
  BLECentralTransport::Config config;
  config.deviceName = BLE_DEVICE_NAME;
  config.peerName = PRINTER_NAME;
  config.peerAddress = PRINTER_ADDRESS;

  printerTransport = new BLECentralTransport(config);

  if (!printerTransport->init()) {
    Serial.println("ERROR: BLE initialization failed");
    disconnectPrinter();
    return false;
  }

  if (!printerTransport->connect()) {
    Serial.printf("Printer connection failed: %s\n", printerTransport->getLastError().c_str());
    disconnectPrinter();
    return false;
  }

  printerDriver = new PrinterDriver(*printerTransport, makeJobConfig());
  Serial.printf("Printer ready at %s\n", printerTransport->getCachedAddress().c_str());
  return true;
}

bool reconnectPrinter() {
  if (printerTransport == nullptr) {
    return initPrinter();
  }

  if (printerDriver != nullptr && printerDriver->isBusy()) {
    Serial.println("Cannot reconnect while printing");
    return false;
  }

  printerTransport->disconnect();
  if (!printerTransport->connect()) {
    Serial.printf("Reconnect failed: %s\n", printerTransport->getLastError().c_str());
    return false;
  }
  return true;
}

void printTask(void* param) {
  std::vector<uint8_t> raster = makeTestPattern(PRINT_HEAD_WIDTH_DOTS, TEST_PATTERN_ROWS);
  Serial.printf("Printing test pattern: %u dots x %u rows (%u bytes)\n",
                (unsigned)PRINT_HEAD_WIDTH_DOTS, (unsigned)TEST_PATTERN_ROWS, (unsigned)raster.size());

  unsigned long start = millis();
  PrintError err = printerDriver->printImage(raster);

  if (err == PrintError::None) {
    Serial.printf("Print complete in %lu ms\n", millis() - start);
  } else {
    Serial.printf("Print failed: %s (%s)\n", printErrorString(err), printerDriver->getLastError().c_str());
  }

  printTaskHandle = nullptr;
  vTaskDelete(nullptr);
}

void startPrint() {
  if (printerDriver == nullptr || !printerTransport->isConnected()) {
    Serial.println("Printer not connected, press 'r' to reconnect");
    return;
  }

  if (printTaskHandle != nullptr) {
    Serial.println("A print is already running");
    return;
  }

  if (xTaskCreate(printTask, "print", PRINT_TASK_STACK_SIZE, nullptr, 1, &printTaskHandle) != pdPASS) {
    printTaskHandle = nullptr;
    Serial.println("ERROR: could not start print task");
  }
}

void printHelp() {
  Serial.println("Commands: p = print test pattern, c = cancel, s = scan, r = reconnect, h = help");
}

void setup() {
  Serial.begin(115200);
  delay(500);

  Serial.println();
  Serial.println("LxPrint BLE printer driver");

  if (initPrinter()) {
    startPrint();
  }
  printHelp();
}

void loop() {
  if (Serial.available() > 0) {
    char command = static_cast<char>(Serial.read());

    switch (command) {
      case 'p':
        startPrint();
        break;
      case 'c':
        if (printerDriver != nullptr) {
          printerDriver->cancel();
        }
        break;
      case 's':
        if (printTaskHandle != nullptr) {
          Serial.println("Cannot scan while printing");
        } else if (printerTransport != nullptr) {
          printerTransport->scanDevices();
        }
        break;
      case 'r':
        if (printTaskHandle == nullptr) {
          reconnectPrinter();
        }
        break;
      case 'h':
        printHelp();
        break;
      default:
        break;
    }
  }

  delay(20);
}
