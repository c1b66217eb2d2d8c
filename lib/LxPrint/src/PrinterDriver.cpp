#include "PrinterDriver.hpp"
#include "LxLog.hpp"
#include "FrameCodec.hpp"
#include "PrintJob.hpp"

PrinterDriver::PrinterDriver(IPrinterTransport& transport, const JobConfig& config)
    : m_transport(transport)
    , m_config(config)
{
    m_bound = m_transport.bindOwner(this);
    if (!m_bound) {
        LXPRINT_LOG_ERROR("PrinterDriver: transport already has a driver, this one will not print\n");
        return;
    }

    // Route transport events to whichever session is active
    m_transport.setRxCallback([this](const uint8_t* data, size_t len) {
        onNotification(data, len);
    });

    m_transport.setStateCallback([this](bool connected) {
        onStateChanged(connected);
    });

    m_transport.setWriteCompleteCallback([this]() {
        onWriteComplete();
    });
}

PrinterDriver::~PrinterDriver() {
    if (m_bound) {
        m_transport.clearCallbacks();
        m_transport.unbindOwner(this);
    }
}

void PrinterDriver::onNotification(const uint8_t* data, size_t len) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_active) {
        m_active->onNotification(data, len);
        return;
    }

    ControlFrame frame;
    if (FrameCodec::decodeControl(data, len, frame) == DecodeError::None && frame.opcode == Opcode::Status) {
        m_idleStatus.assign(data, data + len);
        LXPRINT_LOG_DEBUG_BYTES("PrinterDriver: status kept for next job ", data, len);
    } else {
        LXPRINT_LOG_DEBUG_BYTES("PrinterDriver: no job, dropped ", data, len);
    }
}

void PrinterDriver::onStateChanged(bool connected) {
    std::lock_guard<std::mutex> lock(m_mutex);
    LXPRINT_LOG_INFO("PrinterDriver: transport %s\n", connected ? "connected" : "disconnected");
    if (connected) {
        return;
    }
    m_idleStatus.clear();
    if (m_active) {
        m_active->onStreamClosed();
    }
}

void PrinterDriver::onWriteComplete() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_active) {
        m_active->onWriteComplete();
    }
}

PrintError PrinterDriver::printImage(const std::vector<uint8_t>& image) {
    return printImage(image.empty() ? nullptr : image.data(), image.size());
}

PrintError PrinterDriver::printImage(const uint8_t* image, size_t len) {
    JobStateMachine* machine = nullptr;
    PrintJob job;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (!m_bound) {
            m_lastError = "transport is bound to another driver";
            LXPRINT_LOG_WARN("PrinterDriver: print rejected, %s\n", m_lastError.c_str());
            return PrintError::JobInProgress;
        }

        if (m_active) {
            LXPRINT_LOG_WARN("PrinterDriver: print rejected, a job is already running\n");
            return PrintError::JobInProgress;
        }

        PrintError err = PrintJob::fromImage(image, len, m_config.copies, job);
        if (err != PrintError::None) {
            m_lastError = printErrorString(err);
            return err;
        }

        if (!m_transport.isConnected()) {
            m_lastError = "transport not connected";
            LXPRINT_LOG_ERROR("PrinterDriver: %s\n", m_lastError.c_str());
            return PrintError::TransportError;
        }

        m_active = std::make_unique<JobStateMachine>(m_transport, m_config);
        machine = m_active.get();
        if (!m_idleStatus.empty()) {
            machine->onNotification(m_idleStatus.data(), m_idleStatus.size());
        }
    }

    PrintError result = machine->run(job);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lastError = (result == PrintError::None) ? std::string() : machine->getLastError();
        m_statusReceived = machine->statusReceived();
        m_statusWords = machine->statusWords();
        m_active.reset();
    }

    if (result == PrintError::None) {
        LXPRINT_LOG_INFO("PrinterDriver: printed %u blocks\n", static_cast<unsigned>(job.blockCount()));
    } else {
        LXPRINT_LOG_ERROR("PrinterDriver: print failed: %s\n", printErrorString(result));
    }
    return result;
}

void PrinterDriver::cancel() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_active) {
        m_active->cancel();
    }
}

bool PrinterDriver::isBusy() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active != nullptr;
}

bool PrinterDriver::statusReceived() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_statusReceived;
}

std::array<uint16_t, JobStateMachine::STATUS_WORD_COUNT> PrinterDriver::statusWords() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_statusWords;
}

bool PrinterDriver::setConfig(const JobConfig& config) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_active) {
        LXPRINT_LOG_WARN("PrinterDriver: config change ignored while printing\n");
        return false;
    }
    m_config = config;
    return true;
}

JobConfig PrinterDriver::getConfig() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}

std::string PrinterDriver::getLastError() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastError;
}
