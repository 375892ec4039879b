#include "transfer.h"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "errors.h"
#include "layout.h"

const char* transfer_state_name(TransferState state) {
    switch (state) {
        case TransferState::Idle:    return "Idle";
        case TransferState::Reading: return "Reading";
        case TransferState::Merging: return "Merging";
        case TransferState::Writing: return "Writing";
    }
    return "?";
}

static std::string hex_addr(uint16_t addr) {
    std::ostringstream ss;
    ss << "0x" << std::hex << std::setw(4) << std::setfill('0') << addr;
    return ss.str();
}

namespace {

// Puts the planner back to Idle however the operation ends.
class StateGuard {
public:
    StateGuard(TransferState& state, uint16_t& addr) : _state(state), _addr(addr) {}
    ~StateGuard() {
        _state = TransferState::Idle;
        _addr  = 0;
    }

    StateGuard(const StateGuard&) = delete;
    StateGuard& operator=(const StateGuard&) = delete;

private:
    TransferState& _state;
    uint16_t&      _addr;
};

}  // namespace

TransferPlanner::TransferPlanner(Transport& transport, TransferOptions options)
    : _transport(transport), _options(options) {}

// -----------------------------------------------------------------------
// Single exchange
// -----------------------------------------------------------------------

Frame TransferPlanner::_request(Command command, uint16_t address, const Bytes& payload) {
    const RawFrame request = encode_frame(command, address, payload);
    const uint8_t  cmd     = static_cast<uint8_t>(command);

    for (int attempt = 0;; ++attempt) {
        if (_options.verbose)
            std::cerr << "    --> " << format_frame(request) << "\n";

        RawFrame raw;
        try {
            raw = _transport.exchange(request, _options.timeout_ms);
        } catch (const TransportError& e) {
            if (attempt >= _options.max_retries)
                throw;
            std::cerr << "Warning: " << e.what() << "; retrying "
                      << command_name(cmd) << " at " << hex_addr(address) << "\n";
            continue;
        }

        if (_options.verbose)
            std::cerr << "    <-- " << format_frame(raw) << "\n";

        Frame reply = decode_frame(raw);
        reply.check();

        if (reply.command != cmd) {
            throw ProtocolError(std::string("expected reply to ") + command_name(cmd) +
                                ", got " + command_name(reply.command));
        }

        bool addressed = command == Command::GetProfileData ||
                         command == Command::SetProfileData;
        if (addressed && reply.address != address) {
            throw ProtocolError("reply for " + hex_addr(reply.address) +
                                " while waiting for " + hex_addr(address));
        }

        return reply;
    }
}

// -----------------------------------------------------------------------
// Profile transfers
// -----------------------------------------------------------------------

ProfileBlob TransferPlanner::read_profile() {
    StateGuard guard(_state, _next_addr);

    // Assembled locally; only handed out once complete.
    ProfileBlob blob{};
    _state     = TransferState::Reading;
    _next_addr = 0;
    _frames    = 0;

    while (_next_addr < PROFILE_SIZE) {
        if (_frames >= MAX_TRANSFER_FRAMES) {
            throw ProtocolError("profile read stalled at " + hex_addr(_next_addr) +
                                " after " + std::to_string(_frames) + " frames");
        }

        size_t want = std::min<size_t>(FRAME_PAYLOAD_MAX, PROFILE_SIZE - _next_addr);
        Frame reply = _request(Command::GetProfileData, _next_addr, Bytes(want, 0));
        ++_frames;

        // Trust the device-reported length, but never past the window asked for.
        if (reply.payload.size() > want) {
            throw ProtocolError("reply at " + hex_addr(_next_addr) + " carries " +
                                std::to_string(reply.payload.size()) + " bytes, requested " +
                                std::to_string(want));
        }

        std::copy(reply.payload.begin(), reply.payload.end(), blob.begin() + _next_addr);
        _next_addr = static_cast<uint16_t>(_next_addr + reply.payload.size());
    }

    return blob;
}

void TransferPlanner::write_profile(const ProfileBlob& blob) {
    StateGuard guard(_state, _next_addr);

    _state     = TransferState::Writing;
    _next_addr = 0;
    _frames    = 0;

    while (_next_addr < PROFILE_SIZE) {
        size_t len = std::min<size_t>(FRAME_PAYLOAD_MAX, PROFILE_SIZE - _next_addr);
        Bytes chunk(blob.begin() + _next_addr, blob.begin() + _next_addr + len);

        _request(Command::SetProfileData, _next_addr, chunk);
        ++_frames;
        _next_addr = static_cast<uint16_t>(_next_addr + len);
    }
}

Profile TransferPlanner::write_partial(const PartialProfile& patch) {
    ProfileBlob current = read_profile();

    Profile merged;
    ProfileBlob updated;
    {
        StateGuard guard(_state, _next_addr);
        _state  = TransferState::Merging;
        merged  = merge(profile_from_bytes(current), patch);
        updated = profile_to_bytes(merged);
    }

    write_profile(updated);
    return merged;
}

// -----------------------------------------------------------------------
// Active profile
// -----------------------------------------------------------------------

uint8_t TransferPlanner::active_profile() {
    Frame reply = _request(Command::GetActiveProfile, 0, {});
    if (reply.payload.empty())
        throw ProtocolError("GetActiveProfile reply carries no data");
    if (reply.payload[0] >= NUM_PROFILES)
        throw OutOfRange("active profile", reply.payload[0]);
    return reply.payload[0];
}

void TransferPlanner::set_active_profile(uint8_t index) {
    if (index >= NUM_PROFILES)
        throw OutOfRange("active profile", index);
    _request(Command::SetActiveProfile, 0, {index});
}
