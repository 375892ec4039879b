#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "data.h"

// -----------------------------------------------------------------------
// Lamzu 17-byte report layout (report id 8, same for request and reply)
//
//  Byte  | Role
//  ------|------------------------------------------------------------------
//   0    | Report id, always 0x08 (not covered by the checksum)
//   1    | Command (see enum Command)
//   2    | Error code, 0x00 = OK (replies only)
//   3-4  | Profile address, big-endian
//   5    | Payload length (0..10)
//   6-15 | Payload, zero padded past the length
//   16   | Checksum over bytes [1..15]: 0xFF - (seed + sum) & 0xFF
//        | seed = 181 when the address is in the combo/macro area
//        |        (0x0100..0x1AFF), 171 otherwise
// -----------------------------------------------------------------------

static constexpr int     FRAME_SIZE        = 17;
static constexpr int     FRAME_PAYLOAD_MAX = 10;
static constexpr uint8_t REPORT_ID         = 0x08;

enum class Command : uint8_t {
    SetProfileData   = 0x07,   // write payload to active profile at address
    GetProfileData   = 0x08,   // read `length` bytes of active profile at address
    GetActiveProfile = 0x0e,
    SetActiveProfile = 0x0f,
};

using RawFrame = std::array<uint8_t, FRAME_SIZE>;

struct Frame {
    uint8_t  command = 0;
    uint8_t  error   = 0;
    uint16_t address = 0;
    Bytes    payload;      // exactly `length` bytes

    bool ok() const { return error == 0; }

    // Throws DeviceError if the device flagged an error.
    void check() const;
};

// Checksum seed used for a frame addressing `address`.
uint8_t frame_checksum_seed(uint16_t address);

// Build a raw report. Throws ProtocolError if payload exceeds 10 bytes.
RawFrame encode_frame(uint8_t command, uint8_t error, uint16_t address,
                      const Bytes& payload);
RawFrame encode_frame(Command command, uint16_t address, const Bytes& payload);

// Parse a raw report.
// Throws ChecksumMismatch on a bad checksum and ProtocolError on a wrong
// report id or a length byte above 10. A non-zero error code is NOT a
// decode failure; inspect Frame::error or call Frame::check().
Frame decode_frame(const RawFrame& raw);

// Hex dump "08 07 00 ..." for logs.
std::string format_frame(const RawFrame& raw);

const char* command_name(uint8_t command);
