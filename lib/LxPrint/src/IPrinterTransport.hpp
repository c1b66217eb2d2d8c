#pragma once

#include <atomic>
#include <cstdint>
#include <cstddef>
#include <functional>

/**
 * IPrinterTransport - Interface for the printer's BLE write/notify pair
 *
 * This interface abstracts the two GATT operations the print protocol needs:
 * a write-without-response on the printer's write characteristic and the
 * notification stream from its notify characteristic. Discovery, connection
 * and notification enablement belong to the implementation, not the caller.
 */
class IPrinterTransport {
public:
    // Callback for one inbound notification (always a complete frame on BLE)
    using RxCallback = std::function<void(const uint8_t* data, size_t len)>;

    // Callback for transport state changes; false means the notification stream is closed
    using StateCallback = std::function<void(bool connected)>;

    // Callback fired once per accepted write after the bytes left the local queue
    using WriteCompleteCallback = std::function<void()>;

    virtual ~IPrinterTransport() = default;

    /**
     * Fire-and-forget write to the printer's write characteristic
     * @param data Pointer to frame bytes
     * @param len Length of frame
     * @return true if the write was accepted by the local stack
     */
    virtual bool writeWithoutResponse(const uint8_t* data, size_t len) = 0;

    /**
     * Check if transport is connected
     * @return true if connected
     */
    virtual bool isConnected() const = 0;

    /**
     * Set callback for received notifications
     * @param callback Function to call for every notification
     */
    virtual void setRxCallback(RxCallback callback) = 0;

    /**
     * Set callback for connection state changes
     * @param callback Function to call when connection state changes
     */
    virtual void setStateCallback(StateCallback callback) = 0;

    /**
     * Set callback for write completion
     * @param callback Function to call when a write has left the local queue
     */
    virtual void setWriteCompleteCallback(WriteCompleteCallback callback) = 0;

    /**
     * Clear all callbacks to prevent use-after-free.
     * Must be called before deleting higher-layer objects.
     */
    virtual void clearCallbacks() = 0;

    /**
     * Reserve this transport's callbacks for one owner
     * @param owner Identity of the caller
     * @return true if the transport was free or already bound to owner
     */
    bool bindOwner(const void* owner) {
        const void* expected = nullptr;
        return m_owner.compare_exchange_strong(expected, owner) || expected == owner;
    }

    // Release the binding; ignored unless owner holds it
    void unbindOwner(const void* owner) {
        const void* expected = owner;
        m_owner.compare_exchange_strong(expected, nullptr);
    }

    bool isBound() const { return m_owner.load() != nullptr; }

private:
    std::atomic<const void*> m_owner{nullptr};
};
