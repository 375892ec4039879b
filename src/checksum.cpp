#include "checksum.h"

uint8_t compute_checksum(const uint8_t* data, size_t len, uint8_t seed) {
    uint8_t acc = seed;
    for (size_t i = 0; i < len; ++i)
        acc = static_cast<uint8_t>(acc + data[i]);
    return static_cast<uint8_t>(0xFF - acc);
}

uint8_t compute_checksum(const std::vector<uint8_t>& bytes, uint8_t seed) {
    return compute_checksum(bytes.data(), bytes.size(), seed);
}

bool verify_checksum(const uint8_t* data, size_t len, uint8_t seed, uint8_t claimed) {
    return compute_checksum(data, len, seed) == claimed;
}

bool verify_checksum(const std::vector<uint8_t>& bytes, uint8_t seed, uint8_t claimed) {
    return verify_checksum(bytes.data(), bytes.size(), seed, claimed);
}
