#include "errors.h"

#include <iomanip>
#include <sstream>

static std::string hex_byte(unsigned v) {
    std::ostringstream ss;
    ss << "0x" << std::hex << std::setw(2) << std::setfill('0') << v;
    return ss.str();
}

static std::string hex_word(unsigned v) {
    std::ostringstream ss;
    ss << "0x" << std::hex << std::setw(4) << std::setfill('0') << v;
    return ss.str();
}

LamzuError::LamzuError(const std::string& message)
    : std::runtime_error(message), _message(message) {}

void LamzuError::set_location(const std::string& field, uint16_t offset) {
    _field  = field;
    _offset = offset;
    _message = field + " @" + hex_word(offset) + ": " + std::runtime_error::what();
}

ChecksumMismatch::ChecksumMismatch(const std::string& context,
                                   uint8_t expected, uint8_t actual)
    : LamzuError("checksum mismatch in " + context + " (expected " +
                 hex_byte(expected) + ", got " + hex_byte(actual) + ")"),
      _expected(expected), _actual(actual) {}

OutOfRange::OutOfRange(const std::string& field, long value)
    : LamzuError("value " + std::to_string(value) + " out of range for " + field),
      _value(value) {}

CountOutOfRange::CountOutOfRange(const std::string& field, unsigned value, unsigned max)
    : LamzuError(field + " count " + std::to_string(value) +
                 " exceeds maximum of " + std::to_string(max)),
      _value(value), _max(max) {}

InvalidFlags::InvalidFlags(const std::string& context, uint8_t flags)
    : LamzuError("invalid flags " + hex_byte(flags) + " in " + context),
      _flags(flags) {}

DeviceError::DeviceError(uint8_t code, uint16_t address)
    : LamzuError("device reported error " + hex_byte(code) +
                 " at address " + hex_word(address)),
      _code(code), _address(address) {}

TransportError::TransportError(const std::string& message)
    : LamzuError(message) {}

ProtocolError::ProtocolError(const std::string& message)
    : LamzuError(message) {}

ConfigError::ConfigError(const std::string& message, int line)
    : LamzuError(line > 0 ? message + " at line " + std::to_string(line) : message),
      _line(line) {}
