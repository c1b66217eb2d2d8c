#pragma once

#include "IPrinterTransport.hpp"
#include <BLEDevice.h>
#include <BLEClient.h>
#include <BLEUtils.h>
#include <Arduino.h>
#include <string>

/**
 * BLECentralTransport - ESP32 BLE central bound to an LX-series printer
 *
 * Owns everything the print core leaves to its transport:
 * - bringing up the ESP32 BLE controller
 * - finding the printer by cached address or by advertised name
 * - resolving service FFE6 with its FFE1 write and FFE2 notify characteristics
 * - turning on FFE2 notifications
 *
 * Only one instance may exist at a time; the BLE library delivers
 * notifications through a static callback.
 */
class BLECentralTransport : public IPrinterTransport {
public:
    // LX-D0x printer GATT layout
    static constexpr const char* PRINTER_SERVICE_UUID = "0000ffe6-0000-1000-8000-00805f9b34fb";
    static constexpr const char* PRINTER_WRITE_CHAR_UUID = "0000ffe1-0000-1000-8000-00805f9b34fb";   // Write Without Response
    static constexpr const char* PRINTER_NOTIFY_CHAR_UUID = "0000ffe2-0000-1000-8000-00805f9b34fb";  // Notify

    struct Config {
        const char* deviceName = "LxPrint-ESP32";
        const char* peerName = "LX-D01";       // Substring of the advertised name
        const char* peerAddress = "";          // Skip the scan when set
        int scanSeconds = 10;
        int diagnosticScanSeconds = 5;
        int serviceDiscoveryRetries = 3;
        int serviceDiscoveryRetryDelayMs = 500;
        int deinitCleanupDelayMs = 100;
        int clientCleanupDelayMs = 100;
        int notifyRegistrationDelayMs = 200;
        int writeYieldMs = 1;
    };

    explicit BLECentralTransport(const Config& config);
    ~BLECentralTransport() override;

    BLECentralTransport(const BLECentralTransport&) = delete;
    BLECentralTransport& operator=(const BLECentralTransport&) = delete;

    // IPrinterTransport
    bool writeWithoutResponse(const uint8_t* data, size_t len) override;
    bool isConnected() const override;
    void setRxCallback(RxCallback callback) override;
    void setStateCallback(StateCallback callback) override;
    void setWriteCompleteCallback(WriteCompleteCallback callback) override;
    void clearCallbacks() override;

    /**
     * Start the BLE controller. Does nothing if it is already running.
     * @return false if the controller failed to start
     */
    bool init();

    // Drop the link and stop the controller
    void deinit();

    bool isInitialized() const { return m_bleInitialized; }

    /**
     * Attach to the printer: cached address first, then a name scan.
     * On success notifications are enabled and the state callback fires.
     * @return false with getLastError() set when no printer could be attached
     */
    bool connect();

    void disconnect();

    /**
     * Log every advertiser in range, marking the ones that look like the printer
     */
    void scanDevices();

    // Address of the last printer attached, or the configured one
    const std::string& getCachedAddress() const { return m_cachedAddress; }

    const String& getLastError() const { return m_lastError; }

private:
    class ClientCallbacks;

    static void notifyCallback(BLERemoteCharacteristic* characteristic,
                               uint8_t* data, size_t length, bool isNotify);

    bool matchesPrinterName(const std::string& advertisedName) const;
    BLEScanResults runScan(int seconds, uint16_t interval, uint16_t window);

    bool connectToAddress(const BLEAddress& address, esp_ble_addr_type_t addrType);
    BLERemoteService* findPrinterService();
    bool attachPrinterService();
    void enableNotifications(BLERemoteCharacteristic* notifyChar);
    void releaseClient();

    static BLECentralTransport* s_instance;

    Config m_config;
    bool m_bleInitialized = false;
    volatile bool m_connected = false;

    BLEClient* m_client = nullptr;
    BLERemoteCharacteristic* m_writeCharacteristic = nullptr;
    BLERemoteCharacteristic* m_notifyCharacteristic = nullptr;

    RxCallback m_rxCallback;
    StateCallback m_stateCallback;
    WriteCompleteCallback m_writeCompleteCallback;

    std::string m_cachedAddress;
    String m_lastError;

    ClientCallbacks* m_clientCallbacks = nullptr;
};
