#include <algorithm>
#include <cstring>
#include <utility>
#include <vector>

#include "gtest/gtest.h"

#include "bk_programmer.h"
#include "fake_bk_device.h"

namespace esphome {
namespace bk_flasher {

using bk_test::FakeBkDevice;
using bk_test::SentCommand;
using Bytes = std::vector<uint8_t>;

static Bytes pattern_image(size_t len, uint32_t seed = 1) {
  Bytes img(len);
  uint32_t x = seed;
  for (auto &b : img) {
    x = x * 1103515245u + 12345u;
    b = static_cast<uint8_t>(x >> 16);
  }
  return img;
}

static std::vector<SentCommand> flash_ops(const FakeBkDevice &dev) {
  std::vector<SentCommand> ops;
  for (const auto &c : dev.commands)
    if (c.flash && (c.id == hci::FLASH_CMD_SECTOR_ERASE || c.id == hci::FLASH_CMD_SECTOR_WRITE))
      ops.push_back(c);
  return ops;
}

TEST(BkCrc32, KnownVector) {
  const char *s = "123456789";
  EXPECT_EQ(crc32_update(0, reinterpret_cast<const uint8_t *>(s), std::strlen(s)), 0xCBF43926u);
}

TEST(BkCrc32, ChunkSizeInvariant) {
  Bytes img = pattern_image(10000);
  uint32_t whole = crc32_update(CRC32_SEED, img.data(), img.size());
  EXPECT_EQ(image_crc32(img.data(), img.size(), 1), whole);
  EXPECT_EQ(image_crc32(img.data(), img.size(), 256), whole);
  EXPECT_EQ(image_crc32(img.data(), img.size(), 4096), whole);
}

TEST(BkCrc32, ZeroSector) {
  Bytes zeros(hci::SECTOR_SIZE, 0x00);
  EXPECT_EQ(image_crc32(zeros.data(), zeros.size()), 0xFFFFFFFFu);
}

TEST(BkSectors, PartitionAndPadding) {
  for (size_t len : {size_t(1), size_t(4095), size_t(4096), size_t(4097), size_t(10000)}) {
    Bytes img = pattern_image(len, static_cast<uint32_t>(len));
    size_t n = sector_count(len);
    EXPECT_EQ(n, (len + 4095) / 4096);
    Bytes joined;
    for (size_t i = 0; i < n; i++) {
      Bytes s = sector_at(img, i);
      ASSERT_EQ(s.size(), hci::SECTOR_SIZE);
      joined.insert(joined.end(), s.begin(), s.end());
    }
    EXPECT_TRUE(std::all_of(joined.begin() + len, joined.end(), [](uint8_t b) { return b == 0xFF; }));
    joined.resize(len);
    EXPECT_EQ(joined, img);
  }
}

class BkProgrammerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    proto_.set_timeouts(bk_test::fast_timeouts());
    prog_.set_connect_retries(3);
    prog_.set_show_progress(false);
  }

  FakeBkDevice dev_;
  BkLink link_{&dev_};
  BkProtocol proto_{link_};
  BkProgrammer prog_{proto_};
};

TEST_F(BkProgrammerTest, RejectsEmptyImage) {
  ProgrammingResult res = prog_.flash({}, 0);
  EXPECT_EQ(res.outcome, FlashOutcome::ABORTED);
  EXPECT_EQ(res.failed_step, FlashStep::PREPARE);
  EXPECT_TRUE(dev_.commands.empty());
}

TEST_F(BkProgrammerTest, SingleZeroSector) {
  Bytes img(hci::SECTOR_SIZE, 0x00);
  ProgrammingResult res = prog_.flash(img, 0);
  EXPECT_EQ(res.outcome, FlashOutcome::VERIFIED);
  EXPECT_EQ(res.local_crc, 0xFFFFFFFFu);
  EXPECT_EQ(res.device_crc, 0xFFFFFFFFu);
  EXPECT_EQ(res.sectors_written, 1u);
  EXPECT_EQ(res.sectors_skipped, 0u);
  EXPECT_EQ(res.bytes_written, hci::SECTOR_SIZE);
  EXPECT_EQ(res.flash_id, dev_.flash_id);

  auto ops = flash_ops(dev_);
  ASSERT_EQ(ops.size(), 2u);
  EXPECT_EQ(ops[0].id, hci::FLASH_CMD_SECTOR_ERASE);
  EXPECT_EQ(ops[0].addr(), 0u);
  EXPECT_EQ(ops[1].id, hci::FLASH_CMD_SECTOR_WRITE);
  EXPECT_EQ(ops[1].addr(), 0u);
  EXPECT_EQ(Bytes(ops[1].params.begin() + 4, ops[1].params.end()), img);
  EXPECT_EQ(dev_.commands.back().id, hci::CMD_REBOOT);
}

TEST_F(BkProgrammerTest, SequenceOrder) {
  Bytes img = pattern_image(100);
  prog_.flash(img, 0, 921600);
  std::vector<std::pair<bool, uint8_t>> seq;
  for (const auto &c : dev_.commands)
    seq.emplace_back(c.flash, c.id);
  std::vector<std::pair<bool, uint8_t>> want = {
      {false, hci::CMD_LINK_CHECK},        {false, hci::CMD_STAY_ROM},
      {false, hci::CMD_SET_BAUDRATE},      {true, hci::FLASH_CMD_SPI_OPERATE},
      {true, hci::FLASH_CMD_SECTOR_ERASE}, {true, hci::FLASH_CMD_SECTOR_WRITE},
      {false, hci::CMD_CHECK_CRC32},       {false, hci::CMD_REBOOT},
  };
  EXPECT_EQ(seq, want);
  EXPECT_EQ(dev_.get_baud_rate(), 921600u);
}

TEST_F(BkProgrammerTest, SkipsBlankTailSector) {
  Bytes img = pattern_image(5000);
  std::fill(img.begin() + 4096, img.end(), 0xFF);
  ProgrammingResult res = prog_.flash(img, 0);
  EXPECT_EQ(res.outcome, FlashOutcome::VERIFIED);
  EXPECT_EQ(res.sectors_written, 1u);
  EXPECT_EQ(res.sectors_skipped, 1u);
  EXPECT_EQ(dev_.count(true, hci::FLASH_CMD_SECTOR_ERASE), 1u);
  EXPECT_EQ(dev_.count(true, hci::FLASH_CMD_SECTOR_WRITE), 1u);
}

TEST_F(BkProgrammerTest, WritesTailSectorWithData) {
  Bytes img = pattern_image(5000);
  std::fill(img.begin() + 4096, img.end(), 0xFF);
  img[4500] = 0x00;
  ProgrammingResult res = prog_.flash(img, 0);
  EXPECT_EQ(res.outcome, FlashOutcome::VERIFIED);
  EXPECT_EQ(res.sectors_written, 2u);
  auto ops = flash_ops(dev_);
  ASSERT_EQ(ops.size(), 4u);
  EXPECT_EQ(ops[2].addr(), 0x1000u);
  // Tail is padded with FF on the wire.
  EXPECT_EQ(ops[3].params.size(), 4u + hci::SECTOR_SIZE);
  EXPECT_EQ(ops[3].params.back(), 0xFF);
}

TEST_F(BkProgrammerTest, WriteFailureAbortsWithAddress) {
  Bytes img = pattern_image(3 * hci::SECTOR_SIZE);
  dev_.fail_write_at = 0x1000;
  dev_.write_status = 0x01;
  ProgrammingResult res = prog_.flash(img, 0);
  EXPECT_EQ(res.outcome, FlashOutcome::ABORTED);
  EXPECT_EQ(res.failed_step, FlashStep::WRITE);
  EXPECT_EQ(res.failed_address, 0x1000u);
  EXPECT_EQ(res.sectors_written, 1u);
  // Nothing follows the failed write.
  const SentCommand &last = dev_.commands.back();
  EXPECT_TRUE(last.flash);
  EXPECT_EQ(last.id, hci::FLASH_CMD_SECTOR_WRITE);
  EXPECT_EQ(last.addr(), 0x1000u);
  EXPECT_EQ(dev_.count(false, hci::CMD_REBOOT), 0u);
}

TEST_F(BkProgrammerTest, EraseTimeoutAborts) {
  dev_.silent_flash.insert(hci::FLASH_CMD_SECTOR_ERASE);
  ProgrammingResult res = prog_.flash(pattern_image(100), 0x11000);
  EXPECT_EQ(res.outcome, FlashOutcome::ABORTED);
  EXPECT_EQ(res.failed_step, FlashStep::ERASE);
  EXPECT_EQ(res.failed_address, 0x11000u);
  EXPECT_EQ(dev_.count(true, hci::FLASH_CMD_SECTOR_WRITE), 0u);
}

TEST_F(BkProgrammerTest, HandshakeFailureAborts) {
  dev_.silent_common.insert(hci::CMD_LINK_CHECK);
  ProgrammingResult res = prog_.flash(pattern_image(100), 0);
  EXPECT_EQ(res.outcome, FlashOutcome::ABORTED);
  EXPECT_EQ(res.failed_step, FlashStep::CONNECT);
  EXPECT_EQ(prog_.get_handshake().get_state(), HandshakeState::FAILED);
  EXPECT_EQ(dev_.count(false, hci::CMD_STAY_ROM), 0u);
}

TEST_F(BkProgrammerTest, OptionalStepsOnlyWarn) {
  dev_.silent_common.insert(hci::CMD_STAY_ROM);
  dev_.silent_common.insert(hci::CMD_SET_BAUDRATE);
  dev_.silent_flash.insert(hci::FLASH_CMD_SPI_OPERATE);
  ProgrammingResult res = prog_.flash(pattern_image(100), 0, 921600);
  EXPECT_EQ(res.outcome, FlashOutcome::VERIFIED);
  EXPECT_EQ(res.flash_id, 0u);
  EXPECT_EQ(res.baud, 115200u);
  EXPECT_EQ(dev_.get_baud_rate(), 115200u);
}

TEST_F(BkProgrammerTest, SameBaudIsNotRenegotiated) {
  prog_.flash(pattern_image(100), 0, 115200);
  EXPECT_EQ(dev_.count(false, hci::CMD_SET_BAUDRATE), 0u);
}

TEST_F(BkProgrammerTest, MissingDeviceCrcIsInconclusive) {
  dev_.silent_common.insert(hci::CMD_CHECK_CRC32);
  ProgrammingResult res = prog_.flash(pattern_image(100), 0);
  EXPECT_EQ(res.outcome, FlashOutcome::INCONCLUSIVE);
  EXPECT_FALSE(res.has_device_crc);
  EXPECT_TRUE(res.completed());
  EXPECT_EQ(dev_.count(false, hci::CMD_REBOOT), 1u);
}

TEST_F(BkProgrammerTest, CorruptedFlashIsMismatch) {
  dev_.corrupt_at = 10;
  ProgrammingResult res = prog_.flash(pattern_image(100), 0);
  EXPECT_EQ(res.outcome, FlashOutcome::MISMATCH);
  EXPECT_NE(res.local_crc, res.device_crc);
  EXPECT_EQ(dev_.count(false, hci::CMD_REBOOT), 1u);
}

TEST_F(BkProgrammerTest, CrcRangeIsInclusive) {
  Bytes img = pattern_image(5000);
  prog_.flash(img, 0x11000);
  const SentCommand *crc = nullptr;
  for (const auto &c : dev_.commands)
    if (!c.flash && c.id == hci::CMD_CHECK_CRC32)
      crc = &c;
  ASSERT_NE(crc, nullptr);
  EXPECT_EQ(hci::get_u32_le(crc->params.data()), 0x11000u);
  EXPECT_EQ(hci::get_u32_le(crc->params.data() + 4), 0x11000u + 5000u - 1u);
}

TEST_F(BkProgrammerTest, ReflashGivesSameDeviceCrc) {
  Bytes img = pattern_image(3 * hci::SECTOR_SIZE + 17);
  ProgrammingResult first = prog_.flash(img, 0x2000);
  ProgrammingResult second = prog_.flash(img, 0x2000);
  ASSERT_EQ(first.outcome, FlashOutcome::VERIFIED);
  ASSERT_EQ(second.outcome, FlashOutcome::VERIFIED);
  EXPECT_EQ(first.device_crc, second.device_crc);
}

TEST_F(BkProgrammerTest, ConnectDelegatesToHandshake) {
  dev_.startup_before_ack = 1;
  EXPECT_TRUE(prog_.connect(5));
  EXPECT_EQ(prog_.get_handshake().get_state(), HandshakeState::CONNECTED);
}

// Startup frame and ack to the same link check: the second ack must not be
// mistaken for the reply to a later command.
static void double_answer_first_link_check(FakeBkDevice &dev) {
  dev.hook = [&dev](const SentCommand &cmd) {
    if (cmd.flash || cmd.id != hci::CMD_LINK_CHECK || dev.count(false, hci::CMD_LINK_CHECK) != 1)
      return false;
    dev.inject(hci::encode_common_response(hci::CMD_STARTUP));
    dev.inject(hci::encode_common_response(hci::RSP_LINK_CHECK, {0x00}));
    return true;
  };
}

TEST_F(BkProgrammerTest, StartupRaceKeepsRepliesAligned) {
  double_answer_first_link_check(dev_);
  ProgrammingResult res = prog_.flash(Bytes(hci::SECTOR_SIZE, 0x00), 0, 921600);
  EXPECT_EQ(res.outcome, FlashOutcome::VERIFIED);
  EXPECT_EQ(res.flash_id, dev_.flash_id);
  EXPECT_EQ(res.device_crc, 0xFFFFFFFFu);
}

TEST_F(BkProgrammerTest, StartupRaceStillReportsWriteFailure) {
  double_answer_first_link_check(dev_);
  dev_.fail_write_at = 0;
  dev_.write_status = 0x01;
  ProgrammingResult res = prog_.flash(Bytes(hci::SECTOR_SIZE, 0x00), 0);
  EXPECT_EQ(res.outcome, FlashOutcome::ABORTED);
  EXPECT_EQ(res.failed_step, FlashStep::WRITE);
  EXPECT_EQ(res.failed_address, 0u);
  EXPECT_EQ(res.sectors_written, 0u);
  EXPECT_EQ(dev_.count(false, hci::CMD_CHECK_CRC32), 0u);
}

}  // namespace bk_flasher
}  // namespace esphome
