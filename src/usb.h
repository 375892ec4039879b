#pragma once

#include <cstdint>
#include <string>

#include <libusb.h>

#include "transfer.h"

// Lamzu USB identifiers
static constexpr uint16_t LAMZU_VID = 0x3554;
static constexpr uint16_t LAMZU_PIDS[] = {
    0xf50d,   // Atlantis, wired
    0xf50f,   // Atlantis, 4K dongle
};

// Control transfer parameters (host -> device)
static constexpr uint8_t  CTRL_REQUEST_TYPE = 0x21;    // host-to-device, class, interface
static constexpr uint8_t  CTRL_REQUEST      = 0x09;    // HID SET_REPORT
static constexpr uint16_t CTRL_VALUE        = 0x0300 | REPORT_ID;   // feature report 8

// Replies from other reports can be queued in front of ours.
static constexpr int MAX_FOREIGN_REPLIES = 3;

struct UsbSettings {
    int          interface   = 1;      // HID interface carrying report 8
    uint8_t      endpoint_in = 0x82;   // its interrupt IN endpoint
};

// -----------------------------------------------------------------------
// UsbTransport
//
// Sends each frame as a SET_REPORT control transfer and reads the reply
// from the interrupt IN endpoint. The kernel driver is detached from the
// interface while open and reattached on close().
// -----------------------------------------------------------------------

class UsbTransport : public Transport {
public:
    explicit UsbTransport(UsbSettings settings = {});
    ~UsbTransport() override;

    // Non-copyable
    UsbTransport(const UsbTransport&) = delete;
    UsbTransport& operator=(const UsbTransport&) = delete;

    // Open the first connected Lamzu mouse.
    // Throws TransportError if none is found or it cannot be claimed.
    void open();

    // Release the interface and reattach the kernel driver.
    void close();

    bool is_open() const { return _handle != nullptr; }

    // "3554:f50d"
    std::string device_id() const;

    RawFrame exchange(const RawFrame& request, unsigned int timeout_ms) override;

private:
    UsbSettings           _settings;
    libusb_context*       _ctx      = nullptr;
    libusb_device_handle* _handle   = nullptr;
    uint16_t              _pid      = 0;
    bool                  _detached = false;

    void _send(const RawFrame& frame, unsigned int timeout_ms);
    void _recv(RawFrame& frame, unsigned int timeout_ms);
};
