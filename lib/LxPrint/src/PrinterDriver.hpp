#pragma once

#include "IPrinterTransport.hpp"
#include "JobConfig.hpp"
#include "JobStateMachine.hpp"
#include "PrintTypes.hpp"
#include <array>
#include <cstdint>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * PrinterDriver - Entry point for printing on an LX-series BLE printer
 *
 * Construct it from a transport that is already connected with
 * notifications enabled. Each printImage() call builds a fresh session,
 * runs it to completion and discards it. One job runs at a time per
 * transport; a second caller gets PrintError::JobInProgress.
 *
 * Only one driver can be bound to a transport. A driver constructed on a
 * transport that already has one stays unbound and refuses every job with
 * PrintError::JobInProgress.
 *
 * A Status frame the printer sends while no job is running is kept until
 * the link drops and handed to the next job.
 *
 * Usage:
 *   PrinterDriver driver(transport, config);
 *   PrintError err = driver.printImage(raster.data(), raster.size());
 *   if (err != PrintError::None) { ... driver.getLastError() ... }
 */
class PrinterDriver {
public:
    /**
     * Construct PrinterDriver and take over the transport callbacks,
     * unless another driver is already bound to the transport
     * @param transport Connected printer transport
     * @param config Session policy used for every job
     */
    explicit PrinterDriver(IPrinterTransport& transport, const JobConfig& config = JobConfig());
    ~PrinterDriver();

    PrinterDriver(const PrinterDriver&) = delete;
    PrinterDriver& operator=(const PrinterDriver&) = delete;

    /**
     * Print one rasterized image and wait for the printer to confirm it
     * @param image Image bytes, sent as-is in 16-byte blocks
     * @param len Length of image
     * @return PrintError::None on success, otherwise the failure cause
     */
    PrintError printImage(const uint8_t* image, size_t len);
    PrintError printImage(const std::vector<uint8_t>& image);

    /**
     * Cancel the running job, if any. Safe to call from any thread.
     */
    void cancel();

    bool isBusy() const;

    // False if another driver held the transport at construction
    bool isBound() const { return m_bound; }

    /**
     * Capability words from the last job's Status frame
     * @return true if the last job saw a Status frame
     */
    bool statusReceived() const;
    std::array<uint16_t, JobStateMachine::STATUS_WORD_COUNT> statusWords() const;

    /**
     * Replace the session policy. Ignored while a job is running.
     * @return true if the config was applied
     */
    bool setConfig(const JobConfig& config);
    JobConfig getConfig() const;

    /**
     * Get last error message
     * @return Detail of the last failed job, empty after a success
     */
    std::string getLastError() const;

private:
    void onNotification(const uint8_t* data, size_t len);
    void onStateChanged(bool connected);
    void onWriteComplete();

    IPrinterTransport& m_transport;
    bool m_bound = false;

    mutable std::mutex m_mutex;
    JobConfig m_config;
    std::unique_ptr<JobStateMachine> m_active;
    std::string m_lastError;

    // Most recent Status frame seen with no job running; cleared on disconnect
    std::vector<uint8_t> m_idleStatus;

    bool m_statusReceived = false;
    std::array<uint16_t, JobStateMachine::STATUS_WORD_COUNT> m_statusWords{};
};
