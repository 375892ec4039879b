#pragma once

#include <cstdint>
#include <string>

#include "data.h"

// -----------------------------------------------------------------------
// Setting codecs for the 0x0000-0x00FF area
//
// Every setting is its data bytes followed by one checksum byte computed
// with seed 171:
//
//   scalar   [value][cksum]                        2 bytes
//   DPI      [x][y][reserved][cksum]               4 bytes
//   color    [r][g][b][cksum]                      4 bytes
//   action   [type][arg1][arg2][cksum]             4 bytes
//
// Decoders take a pointer to exactly that many bytes and throw
// ChecksumMismatch / OutOfRange; `field` names the setting in messages.
// -----------------------------------------------------------------------

static constexpr uint16_t SCALAR_WIDTH = 2;

static constexpr uint16_t DPI_MIN  = 50;
static constexpr uint16_t DPI_MAX  = 50 * 256;
static constexpr uint16_t DPI_STEP = 50;

// data ++ [checksum(data, 171)]
Bytes append_checksum(const Bytes& data);

// Validate the trailing checksum of a `width`-byte setting and return the
// data bytes in front of it.
Bytes strip_checksum(const uint8_t* src, uint16_t width, const std::string& field);

// Plain byte, no domain check.
Bytes   encode_u8(uint8_t value);
uint8_t decode_u8(const uint8_t* src, const std::string& field);

// Byte restricted to [lo, hi].
Bytes   encode_ranged(uint8_t value, uint8_t lo, uint8_t hi, const std::string& field);
uint8_t decode_ranged(const uint8_t* src, uint8_t lo, uint8_t hi, const std::string& field);

// Toggle stored as 0 / 1.
Bytes encode_flag(bool value);
bool  decode_flag(const uint8_t* src, const std::string& field);

// One-hot report rate mask (1, 2, 4, 8).
Bytes      encode_report_rate(ReportRate rate);
ReportRate decode_report_rate(const uint8_t* src);

// Lift-off distance: 1 or 2.
Bytes   encode_lift_off(uint8_t distance);
uint8_t decode_lift_off(const uint8_t* src);

// Peak performance timer, stored in units of 10 seconds.
Bytes    encode_peak_time(uint16_t seconds);
uint16_t decode_peak_time(const uint8_t* src);

// raw v <-> 50 * (v + 1) DPI, so raw 0 is 50 DPI.
uint8_t  dpi_to_raw(uint16_t dpi);
uint16_t dpi_from_raw(uint8_t raw);

Bytes     encode_dpi_preset(const DpiPreset& dpi);
DpiPreset decode_dpi_preset(const uint8_t* src, const std::string& field);

Bytes encode_color(const Color& color);
Color decode_color(const uint8_t* src, const std::string& field);

Bytes        encode_button_action(const ButtonAction& action);
ButtonAction decode_button_action(const uint8_t* src, const std::string& field);
