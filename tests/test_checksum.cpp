#include <gtest/gtest.h>

#include <vector>

#include "checksum.h"

TEST(ChecksumTest, EmptyInputIsComplementOfSeed) {
  std::vector<uint8_t> none;
  EXPECT_EQ(compute_checksum(none, CHECKSUM_SEED_SETTING), 0xFF - 171);
  EXPECT_EQ(compute_checksum(none, CHECKSUM_SEED_MACRO), 0xFF - 181);
}

TEST(ChecksumTest, SingleByte) {
  EXPECT_EQ(compute_checksum(std::vector<uint8_t>{0x01}, CHECKSUM_SEED_SETTING), 83);
}

TEST(ChecksumTest, AccumulatorWrapsModulo256) {
  // 171 + 0xFF + 0xFF = 681 -> 169
  EXPECT_EQ(compute_checksum(std::vector<uint8_t>{0xFF, 0xFF}, CHECKSUM_SEED_SETTING), 86);
}

TEST(ChecksumTest, SeedPlusDataPlusChecksumIs0xFF) {
  std::vector<uint8_t> data = {0x12, 0x34, 0x56, 0x78, 0x9A};
  uint8_t cs = compute_checksum(data, CHECKSUM_SEED_MACRO);

  uint8_t acc = CHECKSUM_SEED_MACRO;
  for (uint8_t b : data) acc = static_cast<uint8_t>(acc + b);
  EXPECT_EQ(static_cast<uint8_t>(acc + cs), 0xFF);
}

TEST(ChecksumTest, VerifyDetectsSingleByteChange) {
  std::vector<uint8_t> data = {0x01, 0x20, 0x03};
  uint8_t cs = compute_checksum(data, CHECKSUM_SEED_SETTING);
  EXPECT_TRUE(verify_checksum(data, CHECKSUM_SEED_SETTING, cs));

  data[1] ^= 0x01;
  EXPECT_FALSE(verify_checksum(data, CHECKSUM_SEED_SETTING, cs));
}

TEST(ChecksumTest, SeedMatters) {
  std::vector<uint8_t> data = {0x05, 0x00, 0x00};
  EXPECT_NE(compute_checksum(data, CHECKSUM_SEED_SETTING),
            compute_checksum(data, CHECKSUM_SEED_MACRO));
}
