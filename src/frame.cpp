#include "frame.h"

#include <iomanip>
#include <sstream>

#include "checksum.h"
#include "errors.h"

static constexpr int OFF_COMMAND  = 1;
static constexpr int OFF_ERROR    = 2;
static constexpr int OFF_ADDR_HI  = 3;
static constexpr int OFF_ADDR_LO  = 4;
static constexpr int OFF_LENGTH   = 5;
static constexpr int OFF_PAYLOAD  = 6;
static constexpr int OFF_CHECKSUM = FRAME_SIZE - 1;

void Frame::check() const {
    if (error != 0)
        throw DeviceError(error, address);
}

uint8_t frame_checksum_seed(uint16_t address) {
    if (address >= COMBO_BASE && address < PROFILE_SIZE)
        return CHECKSUM_SEED_MACRO;
    return CHECKSUM_SEED_SETTING;
}

RawFrame encode_frame(uint8_t command, uint8_t error, uint16_t address,
                      const Bytes& payload) {
    if (payload.size() > FRAME_PAYLOAD_MAX) {
        throw ProtocolError("frame payload of " + std::to_string(payload.size()) +
                            " bytes exceeds " + std::to_string(FRAME_PAYLOAD_MAX));
    }

    RawFrame f{};
    f[0]           = REPORT_ID;
    f[OFF_COMMAND] = command;
    f[OFF_ERROR]   = error;
    f[OFF_ADDR_HI] = static_cast<uint8_t>(address >> 8);
    f[OFF_ADDR_LO] = static_cast<uint8_t>(address & 0xFF);
    f[OFF_LENGTH]  = static_cast<uint8_t>(payload.size());
    for (size_t i = 0; i < payload.size(); ++i)
        f[OFF_PAYLOAD + i] = payload[i];

    f[OFF_CHECKSUM] = compute_checksum(&f[OFF_COMMAND], OFF_CHECKSUM - OFF_COMMAND,
                                       frame_checksum_seed(address));
    return f;
}

RawFrame encode_frame(Command command, uint16_t address, const Bytes& payload) {
    return encode_frame(static_cast<uint8_t>(command), 0, address, payload);
}

Frame decode_frame(const RawFrame& raw) {
    if (raw[0] != REPORT_ID) {
        std::ostringstream ss;
        ss << "unexpected report id 0x" << std::hex << std::setw(2)
           << std::setfill('0') << static_cast<int>(raw[0]);
        throw ProtocolError(ss.str());
    }

    Frame f;
    f.command = raw[OFF_COMMAND];
    f.error   = raw[OFF_ERROR];
    f.address = static_cast<uint16_t>((raw[OFF_ADDR_HI] << 8) | raw[OFF_ADDR_LO]);

    uint8_t expected = compute_checksum(&raw[OFF_COMMAND], OFF_CHECKSUM - OFF_COMMAND,
                                        frame_checksum_seed(f.address));
    if (expected != raw[OFF_CHECKSUM])
        throw ChecksumMismatch(std::string("frame ") + command_name(f.command),
                               expected, raw[OFF_CHECKSUM]);

    uint8_t len = raw[OFF_LENGTH];
    if (len > FRAME_PAYLOAD_MAX)
        throw ProtocolError("frame length byte " + std::to_string(len) +
                            " exceeds " + std::to_string(FRAME_PAYLOAD_MAX));

    f.payload.assign(raw.begin() + OFF_PAYLOAD, raw.begin() + OFF_PAYLOAD + len);
    return f;
}

std::string format_frame(const RawFrame& raw) {
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (int i = 0; i < FRAME_SIZE; ++i) {
        ss << std::setw(2) << static_cast<int>(raw[i]);
        if (i < FRAME_SIZE - 1) ss << " ";
    }
    return ss.str();
}

const char* command_name(uint8_t command) {
    switch (static_cast<Command>(command)) {
        case Command::SetProfileData:   return "SetProfileData";
        case Command::GetProfileData:   return "GetProfileData";
        case Command::GetActiveProfile: return "GetActiveProfile";
        case Command::SetActiveProfile: return "SetActiveProfile";
    }
    return "Unknown";
}
