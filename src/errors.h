#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

// -----------------------------------------------------------------------
// Error taxonomy
//
// Every failure in the codec / transfer layers is thrown as a subclass of
// LamzuError so callers can catch either the specific kind or all of them.
// Decoders never substitute defaults for bad data.
// -----------------------------------------------------------------------

class LamzuError : public std::runtime_error {
public:
    explicit LamzuError(const std::string& message);

    const char* what() const noexcept override { return _message.c_str(); }

    // Attach the profile field and blob offset the error was raised for.
    // Used by profile_from_bytes() before rethrowing.
    void set_location(const std::string& field, uint16_t offset);

    const std::string& field() const { return _field; }
    uint16_t offset() const { return _offset; }
    bool has_location() const { return !_field.empty(); }

private:
    std::string _message;
    std::string _field;
    uint16_t    _offset = 0;
};

// Stored checksum does not match the recomputed one.
class ChecksumMismatch : public LamzuError {
public:
    ChecksumMismatch(const std::string& context, uint8_t expected, uint8_t actual);

    uint8_t expected() const { return _expected; }
    uint8_t actual() const { return _actual; }

private:
    uint8_t _expected;
    uint8_t _actual;
};

// A decoded or to-be-encoded value is outside its documented domain.
class OutOfRange : public LamzuError {
public:
    OutOfRange(const std::string& field, long value);

    long value() const { return _value; }

private:
    long _value;
};

// A length / event count byte exceeds the slot capacity.
class CountOutOfRange : public LamzuError {
public:
    CountOutOfRange(const std::string& field, unsigned value, unsigned max);

    unsigned value() const { return _value; }
    unsigned max() const { return _max; }

private:
    unsigned _value;
    unsigned _max;
};

// Key event flags select more than one (or no valid) interpretation.
class InvalidFlags : public LamzuError {
public:
    InvalidFlags(const std::string& context, uint8_t flags);

    uint8_t flags() const { return _flags; }

private:
    uint8_t _flags;
};

// The device answered with a non-zero error code.
class DeviceError : public LamzuError {
public:
    DeviceError(uint8_t code, uint16_t address);

    uint8_t code() const { return _code; }
    uint16_t address() const { return _address; }

private:
    uint8_t  _code;
    uint16_t _address;
};

// The transport failed to complete one exchange (timeout, short read,
// USB error). Recoverable for a single retry of the same frame.
class TransportError : public LamzuError {
public:
    explicit TransportError(const std::string& message);
};

// Invariant violation in the frame sequence: bad length byte, address
// overrun, mismatched reply, runaway transfer loop.
class ProtocolError : public LamzuError {
public:
    explicit ProtocolError(const std::string& message);
};

// Syntax or value error in an INI profile / settings file.
class ConfigError : public LamzuError {
public:
    ConfigError(const std::string& message, int line);

    int line() const { return _line; }

private:
    int _line;
};
