#include "usb.h"

#include <iomanip>
#include <sstream>

#include "errors.h"

static std::string usb_error(const std::string& what, int r) {
    return what + ": " + libusb_strerror(static_cast<libusb_error>(r));
}

static bool is_lamzu_pid(uint16_t pid) {
    for (uint16_t p : LAMZU_PIDS)
        if (p == pid) return true;
    return false;
}

UsbTransport::UsbTransport(UsbSettings settings) : _settings(settings) {
    int r = libusb_init(&_ctx);
    if (r < 0)
        throw TransportError(usb_error("libusb_init failed", r));
}

UsbTransport::~UsbTransport() {
    close();
    if (_ctx) {
        libusb_exit(_ctx);
        _ctx = nullptr;
    }
}

void UsbTransport::open() {
    libusb_device** list = nullptr;
    ssize_t n = libusb_get_device_list(_ctx, &list);
    if (n < 0)
        throw TransportError(usb_error("Could not list USB devices", static_cast<int>(n)));

    int open_error = 0;
    for (ssize_t i = 0; i < n && !_handle; ++i) {
        libusb_device_descriptor desc;
        if (libusb_get_device_descriptor(list[i], &desc) < 0) continue;
        if (desc.idVendor != LAMZU_VID || !is_lamzu_pid(desc.idProduct)) continue;

        int r = libusb_open(list[i], &_handle);
        if (r < 0) {
            open_error = r;
            _handle    = nullptr;
            continue;
        }
        _pid = desc.idProduct;
    }
    libusb_free_device_list(list, 1);

    if (!_handle) {
        if (open_error)
            throw TransportError(usb_error("Found a Lamzu mouse but could not open it "
                                           "(try sudo or install the udev rule)", open_error));
        throw TransportError("No Lamzu mouse found, is it plugged in?");
    }

    int iface = _settings.interface;
    _detached = false;

    if (libusb_kernel_driver_active(_handle, iface) == 1) {
        int r = libusb_detach_kernel_driver(_handle, iface);
        if (r < 0) {
            close();
            throw TransportError(usb_error("Failed to detach kernel driver from interface " +
                                           std::to_string(iface), r));
        }
        _detached = true;
    }

    int r = libusb_claim_interface(_handle, iface);
    if (r < 0) {
        close();
        throw TransportError(usb_error("Failed to claim interface " + std::to_string(iface), r));
    }
}

void UsbTransport::close() {
    if (!_handle) return;

    libusb_release_interface(_handle, _settings.interface);
    if (_detached) {
        libusb_attach_kernel_driver(_handle, _settings.interface);
        _detached = false;
    }

    libusb_close(_handle);
    _handle = nullptr;
}

std::string UsbTransport::device_id() const {
    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(4) << LAMZU_VID << ":"
       << std::setw(4) << _pid;
    return ss.str();
}

RawFrame UsbTransport::exchange(const RawFrame& request, unsigned int timeout_ms) {
    if (!_handle)
        throw TransportError("Device is not open");

    _send(request, timeout_ms);

    // Skip replies that belong to another report or command.
    for (int i = 0; i < MAX_FOREIGN_REPLIES; ++i) {
        RawFrame reply{};
        _recv(reply, timeout_ms);
        if (reply[0] == REPORT_ID && reply[1] == request[1])
            return reply;
    }

    throw TransportError("No reply to " + std::string(command_name(request[1])) + " after " +
                         std::to_string(MAX_FOREIGN_REPLIES) + " reports");
}

// --- private helpers ---

void UsbTransport::_send(const RawFrame& frame, unsigned int timeout_ms) {
    // libusb_control_transfer takes a non-const buffer even for OUT transfers
    RawFrame buf = frame;

    int r = libusb_control_transfer(
        _handle,
        CTRL_REQUEST_TYPE,
        CTRL_REQUEST,
        CTRL_VALUE,
        static_cast<uint16_t>(_settings.interface),
        buf.data(),
        FRAME_SIZE,
        timeout_ms);

    if (r < 0)
        throw TransportError(usb_error("Control transfer (send) failed", r));
    if (r != FRAME_SIZE)
        throw TransportError("Incomplete send: " + std::to_string(r) + " of " +
                             std::to_string(FRAME_SIZE) + " bytes");
}

void UsbTransport::_recv(RawFrame& frame, unsigned int timeout_ms) {
    int transferred = 0;
    int r = libusb_interrupt_transfer(
        _handle,
        _settings.endpoint_in,
        frame.data(),
        FRAME_SIZE,
        &transferred,
        timeout_ms);

    if (r == LIBUSB_ERROR_TIMEOUT)
        throw TransportError("Timed out after " + std::to_string(timeout_ms) +
                             " ms waiting for a reply");
    if (r < 0)
        throw TransportError(usb_error("Interrupt transfer (recv) failed", r));
    if (transferred != FRAME_SIZE)
        throw TransportError("Incomplete receive: got " + std::to_string(transferred) +
                             " bytes, expected " + std::to_string(FRAME_SIZE));
}
