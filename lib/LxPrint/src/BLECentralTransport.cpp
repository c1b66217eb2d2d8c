#include "BLECentralTransport.hpp"
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <vector>

// Define static constexpr members for pre-C++17 ODR compliance
constexpr const char* BLECentralTransport::PRINTER_SERVICE_UUID;
constexpr const char* BLECentralTransport::PRINTER_WRITE_CHAR_UUID;
constexpr const char* BLECentralTransport::PRINTER_NOTIFY_CHAR_UUID;

BLECentralTransport* BLECentralTransport::s_instance = nullptr;

// Link-loss handling: the notify stream ends with the connection
class BLECentralTransport::ClientCallbacks : public BLEClientCallbacks {
public:
    explicit ClientCallbacks(BLECentralTransport* owner) : m_owner(owner) {}

    void onConnect(BLEClient* client) override {
        Serial.println("BLECentralTransport: link up");
    }

    void onDisconnect(BLEClient* client) override {
        Serial.println("BLECentralTransport: link lost");
        const bool hadPrinter = m_owner->m_connected;
        m_owner->m_connected = false;
        m_owner->m_writeCharacteristic = nullptr;
        m_owner->m_notifyCharacteristic = nullptr;
        if (hadPrinter && m_owner->m_stateCallback) {
            m_owner->m_stateCallback(false);
        }
    }

private:
    BLECentralTransport* m_owner;
};

BLECentralTransport::BLECentralTransport(const Config& config)
    : m_config(config)
    , m_clientCallbacks(new ClientCallbacks(this))
{
    s_instance = this;
    if (m_config.peerAddress != nullptr) {
        m_cachedAddress = m_config.peerAddress;
    }
}

BLECentralTransport::~BLECentralTransport() {
    clearCallbacks();
    deinit();
    delete m_clientCallbacks;
    if (s_instance == this) {
        s_instance = nullptr;
    }
}

bool BLECentralTransport::init() {
    if (m_bleInitialized) {
        return true;
    }

    BLEDevice::init(m_config.deviceName);
    if (!BLEDevice::getInitialized()) {
        m_lastError = "BLE controller did not start";
        Serial.printf("BLECentralTransport: %s (is Bluetooth enabled in sdkconfig?)\n", m_lastError.c_str());
        return false;
    }

    m_bleInitialized = true;
    Serial.printf("BLECentralTransport: central '%s' up, %u bytes heap free\n",
                  m_config.deviceName, (unsigned)ESP.getFreeHeap());
    return true;
}

void BLECentralTransport::deinit() {
    disconnect();
    if (!m_bleInitialized) {
        return;
    }
    delay(m_config.deinitCleanupDelayMs);
    BLEDevice::deinit();
    m_bleInitialized = false;
    Serial.println("BLECentralTransport: central down");
}

bool BLECentralTransport::writeWithoutResponse(const uint8_t* data, size_t len) {
    BLERemoteCharacteristic* target = m_writeCharacteristic;
    if (!m_connected || target == nullptr) {
        return false;
    }

    // writeValue() takes a mutable buffer
    std::vector<uint8_t> frame(data, data + len);
    target->writeValue(frame.data(), frame.size(), false);

    // Give the BLE host task a tick to move the packet to the controller
    vTaskDelay(pdMS_TO_TICKS(m_config.writeYieldMs));

    if (m_writeCompleteCallback) {
        m_writeCompleteCallback();
    }
    return true;
}

bool BLECentralTransport::isConnected() const {
    return m_connected;
}

void BLECentralTransport::setRxCallback(RxCallback callback) {
    m_rxCallback = std::move(callback);
}

void BLECentralTransport::setStateCallback(StateCallback callback) {
    m_stateCallback = std::move(callback);
}

void BLECentralTransport::setWriteCompleteCallback(WriteCompleteCallback callback) {
    m_writeCompleteCallback = std::move(callback);
}

void BLECentralTransport::clearCallbacks() {
    m_rxCallback = nullptr;
    m_stateCallback = nullptr;
    m_writeCompleteCallback = nullptr;
}

void BLECentralTransport::notifyCallback(BLERemoteCharacteristic* characteristic,
                                         uint8_t* data, size_t length, bool isNotify) {
    BLECentralTransport* self = s_instance;
    if (self == nullptr || length == 0 || !self->m_rxCallback) {
        return;
    }
    self->m_rxCallback(data, length);
}

bool BLECentralTransport::matchesPrinterName(const std::string& advertisedName) const {
    return !advertisedName.empty() && advertisedName.find(m_config.peerName) != std::string::npos;
}

BLEScanResults BLECentralTransport::runScan(int seconds, uint16_t interval, uint16_t window) {
    BLEScan* scan = BLEDevice::getScan();
    scan->setActiveScan(true);
    scan->setInterval(interval);
    scan->setWindow(window);
    return scan->start(seconds, false);
}

void BLECentralTransport::scanDevices() {
    if (!init()) {
        Serial.println("BLECentralTransport: scan skipped, BLE not available");
        return;
    }

    Serial.printf("BLECentralTransport: listing advertisers for %d s\n", m_config.diagnosticScanSeconds);
    BLEScanResults results = runScan(m_config.diagnosticScanSeconds, 100, 99);

    const int found = results.getCount();
    for (int i = 0; i < found; i++) {
        BLEAdvertisedDevice device = results.getDevice(i);
        const std::string name = device.getName();
        Serial.printf("  %-20s %s  %4d dBm%s\n",
                      name.empty() ? "-" : name.c_str(),
                      device.getAddress().toString().c_str(),
                      device.getRSSI(),
                      matchesPrinterName(name) ? "  printer" : "");
    }
    Serial.printf("BLECentralTransport: %d advertiser(s)\n", found);

    BLEDevice::getScan()->clearResults();
}

void BLECentralTransport::releaseClient() {
    m_writeCharacteristic = nullptr;
    m_notifyCharacteristic = nullptr;
    if (m_client == nullptr) {
        return;
    }
    if (m_client->isConnected()) {
        m_client->disconnect();
    }
    delete m_client;
    m_client = nullptr;
    delay(m_config.clientCleanupDelayMs);
}

BLERemoteService* BLECentralTransport::findPrinterService() {
    for (int attempt = 1; attempt <= m_config.serviceDiscoveryRetries; attempt++) {
        BLERemoteService* service = m_client->getService(PRINTER_SERVICE_UUID);
        if (service != nullptr) {
            return service;
        }
        Serial.printf("BLECentralTransport: service FFE6 not listed (attempt %d/%d)\n",
                      attempt, m_config.serviceDiscoveryRetries);
        if (attempt < m_config.serviceDiscoveryRetries) {
            delay(m_config.serviceDiscoveryRetryDelayMs);
        }
    }
    return nullptr;
}

void BLECentralTransport::enableNotifications(BLERemoteCharacteristic* notifyChar) {
    notifyChar->registerForNotify(notifyCallback, true, true);

    // Some LX firmware only notifies after an explicit CCCD write
    BLERemoteDescriptor* cccd = notifyChar->getDescriptor(BLEUUID((uint16_t)0x2902));
    if (cccd == nullptr) {
        Serial.println("BLECentralTransport: no CCCD on FFE2, relying on registerForNotify");
    } else {
        uint8_t enable[] = {0x01, 0x00};
        cccd->writeValue(enable, sizeof(enable), true);
    }

    delay(m_config.notifyRegistrationDelayMs);
}

bool BLECentralTransport::attachPrinterService() {
    BLERemoteService* service = findPrinterService();
    if (service == nullptr) {
        m_lastError = "printer service FFE6 not found";
        return false;
    }

    BLERemoteCharacteristic* writeChar = service->getCharacteristic(PRINTER_WRITE_CHAR_UUID);
    if (writeChar == nullptr || !writeChar->canWriteNoResponse()) {
        m_lastError = "FFE1 missing or not write-without-response";
        return false;
    }

    BLERemoteCharacteristic* notifyChar = service->getCharacteristic(PRINTER_NOTIFY_CHAR_UUID);
    if (notifyChar == nullptr || !notifyChar->canNotify()) {
        m_lastError = "FFE2 missing or not notifiable";
        return false;
    }

    enableNotifications(notifyChar);
    m_writeCharacteristic = writeChar;
    m_notifyCharacteristic = notifyChar;
    return true;
}

bool BLECentralTransport::connectToAddress(const BLEAddress& address, esp_ble_addr_type_t addrType) {
    releaseClient();

    m_client = BLEDevice::createClient();
    m_client->setClientCallbacks(m_clientCallbacks);

    const std::string target = address.toString();
    Serial.printf("BLECentralTransport: connecting to %s\n", target.c_str());

    if (!m_client->connect(address, addrType)) {
        m_lastError = "connect to ";
        m_lastError += target.c_str();
        m_lastError += " failed";
        Serial.printf("BLECentralTransport: %s\n", m_lastError.c_str());
        releaseClient();
        return false;
    }

    // 20-byte data frames fit the default 23-byte ATT MTU
    Serial.printf("BLECentralTransport: link MTU %d\n", m_client->getMTU());

    if (!attachPrinterService()) {
        Serial.printf("BLECentralTransport: %s\n", m_lastError.c_str());
        releaseClient();
        return false;
    }

    m_cachedAddress = target;
    m_connected = true;
    m_lastError = "";

    if (m_stateCallback) {
        m_stateCallback(true);
    }
    return true;
}

bool BLECentralTransport::connect() {
    m_connected = false;
    if (!init()) {
        return false;
    }

    if (!m_cachedAddress.empty()) {
        if (connectToAddress(BLEAddress(m_cachedAddress), BLE_ADDR_TYPE_PUBLIC)) {
            return true;
        }
        Serial.printf("BLECentralTransport: %s unreachable, falling back to scan\n", m_cachedAddress.c_str());
    }

    Serial.printf("BLECentralTransport: looking for '%s' for %d s\n", m_config.peerName, m_config.scanSeconds);
    BLEScanResults results = runScan(m_config.scanSeconds, 200, 160);

    bool attached = false;
    int candidates = 0;
    for (int i = 0; i < results.getCount() && !attached; i++) {
        BLEAdvertisedDevice device = results.getDevice(i);
        if (!matchesPrinterName(device.getName())) {
            continue;
        }
        candidates++;
        Serial.printf("BLECentralTransport: candidate '%s' %d dBm\n", device.getName().c_str(), device.getRSSI());
        attached = connectToAddress(device.getAddress(), device.getAddressType());
    }
    BLEDevice::getScan()->clearResults();

    if (!attached && candidates == 0) {
        m_lastError = "no advertiser named like '";
        m_lastError += m_config.peerName;
        m_lastError += "'";
        Serial.printf("BLECentralTransport: %s\n", m_lastError.c_str());
    }
    return attached;
}

void BLECentralTransport::disconnect() {
    if (m_client != nullptr && m_client->isConnected()) {
        Serial.println("BLECentralTransport: closing printer link");
    }
    releaseClient();
    m_connected = false;
}
