#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

// -----------------------------------------------------------------------
// Sum-complement checksum
//
//   acc      = (seed + sum(bytes)) & 0xFF
//   checksum = 0xFF - acc
//
// Two seeds are in use: 171 for every plain setting (and for frames that
// address the settings area), 181 for key-combo / macro data.
// -----------------------------------------------------------------------

static constexpr uint8_t CHECKSUM_SEED_SETTING = 171;
static constexpr uint8_t CHECKSUM_SEED_MACRO   = 181;

uint8_t compute_checksum(const uint8_t* data, size_t len, uint8_t seed);
uint8_t compute_checksum(const std::vector<uint8_t>& bytes, uint8_t seed);

bool verify_checksum(const uint8_t* data, size_t len, uint8_t seed, uint8_t claimed);
bool verify_checksum(const std::vector<uint8_t>& bytes, uint8_t seed, uint8_t claimed);
