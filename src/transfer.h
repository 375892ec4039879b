#pragma once

#include <cstdint>

#include "data.h"
#include "frame.h"

// -----------------------------------------------------------------------
// Transport
//
// One blocking request/response exchange of a 17-byte report. The device
// has no request ids: a reply is simply "the next report". Implementations
// throw TransportError on timeout, short transfer or I/O failure.
// A transport must not be used from two threads at once.
// -----------------------------------------------------------------------

class Transport {
public:
    virtual ~Transport() = default;

    virtual RawFrame exchange(const RawFrame& request, unsigned int timeout_ms) = 0;
};

// Defaults are overridable from the [device] section of the settings file.
struct TransferOptions {
    unsigned int timeout_ms  = 2000;
    int          max_retries = 1;      // extra attempts per frame on TransportError
    bool         verbose     = false;  // hex dump every exchanged frame
};

// A full profile is 692 windows of 10 bytes; more iterations than that
// means the device keeps returning short replies.
static constexpr int MAX_TRANSFER_FRAMES =
    (PROFILE_SIZE + FRAME_PAYLOAD_MAX - 1) / FRAME_PAYLOAD_MAX;

enum class TransferState {
    Idle,
    Reading,
    Merging,
    Writing,
};

const char* transfer_state_name(TransferState state);

// -----------------------------------------------------------------------
// TransferPlanner
//
// Moves whole profiles between the device's active profile slot and a
// ProfileBlob, 10 bytes per frame at increasing addresses. Every method
// either completes or throws; the caller never receives a partial blob.
//
// A write that fails midway leaves the device with a partially written
// profile. There is no rollback: the device has no transactions and a
// running write cannot be cancelled.
// -----------------------------------------------------------------------

class TransferPlanner {
public:
    explicit TransferPlanner(Transport& transport, TransferOptions options = {});

    // Non-copyable
    TransferPlanner(const TransferPlanner&) = delete;
    TransferPlanner& operator=(const TransferPlanner&) = delete;

    // Read the whole active profile.
    ProfileBlob read_profile();

    // Overwrite the whole active profile.
    void write_profile(const ProfileBlob& blob);

    // Read, apply `patch`, write back the full blob. Returns the profile as
    // written.
    Profile write_partial(const PartialProfile& patch);

    // Index (0-3) of the profile currently addressed by read/write.
    uint8_t active_profile();
    void    set_active_profile(uint8_t index);

    TransferState state() const { return _state; }

    // Address of the next frame while Reading / Writing.
    uint16_t next_address() const { return _next_addr; }

    // Frames sent by the last read_profile() / write_profile().
    int frames_sent() const { return _frames; }

private:
    Transport&      _transport;
    TransferOptions _options;
    TransferState   _state     = TransferState::Idle;
    uint16_t        _next_addr = 0;
    int             _frames    = 0;

    // Send one request and return the validated reply (same command and
    // address, no device error). Retries only on TransportError.
    Frame _request(Command command, uint16_t address, const Bytes& payload);
};
