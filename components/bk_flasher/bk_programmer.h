// bk_programmer.h - sector-by-sector flashing and CRC verification of a BK72xx image
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "bk_handshake.h"
#include "bk_protocol.h"

namespace esphome {
namespace bk_flasher {

constexpr uint32_t CRC32_SEED = 0xFFFFFFFF;

// Running CRC-32 in zlib's convention: crc32_update(0, ...) is the plain CRC-32.
uint32_t crc32_update(uint32_t crc, const uint8_t *data, size_t len);
// CRC the boot ROM reports for the same bytes, fed in chunk-sized steps.
uint32_t image_crc32(const uint8_t *data, size_t len, size_t chunk = 256);

size_t sector_count(size_t image_len);
// Sector index of the image, right-padded with 0xFF to a full sector.
std::vector<uint8_t> sector_at(const std::vector<uint8_t> &image, size_t index);
bool is_erased(const uint8_t *data, size_t len);

enum class FlashStep : uint8_t {
  PREPARE = 0,
  CONNECT,
  STAY_ROM,
  SET_BAUD,
  FLASH_ID,
  ERASE,
  WRITE,
  VERIFY,
  REBOOT,
};

enum class FlashOutcome : uint8_t {
  VERIFIED = 0,
  MISMATCH,
  INCONCLUSIVE,
  ABORTED,
};

const char *flash_step_to_string(FlashStep step);
const char *flash_outcome_to_string(FlashOutcome outcome);

struct ProgrammingResult {
  FlashOutcome outcome{FlashOutcome::ABORTED};
  FlashStep failed_step{FlashStep::PREPARE};
  uint32_t failed_address{0};
  uint32_t bytes_written{0};
  uint32_t sectors_written{0};
  uint32_t sectors_skipped{0};
  uint32_t elapsed_ms{0};
  uint32_t flash_id{0};
  uint32_t baud{0};
  uint32_t local_crc{0};
  uint32_t device_crc{0};
  bool has_device_crc{false};

  bool completed() const { return outcome != FlashOutcome::ABORTED; }
};

class BkProgrammer {
 public:
  explicit BkProgrammer(BkProtocol &proto) : proto_(proto), handshake_(proto) {}

  void set_connect_retries(uint16_t r){ connect_retries_ = r; }
  void set_verbose(bool v){ handshake_.set_verbose(v); }
  void set_show_progress(bool v){ show_progress_ = v; }
  void set_progress_step(uint8_t s){ progress_step_ = s ? s : 5; }

  bool connect(uint16_t retries){ return handshake_.connect(retries); }
  // Programs image at start_address. fast_baud of 0 keeps the current rate.
  ProgrammingResult flash(const std::vector<uint8_t> &image, uint32_t start_address, uint32_t fast_baud = 0);

  const BkHandshake &get_handshake() const { return handshake_; }

 private:
  void update_progress_(uint32_t done, uint32_t expected, uint32_t &last_pc, uint32_t addr, uint32_t started);
  ProgrammingResult &abort_(ProgrammingResult &res, FlashStep step, uint32_t addr);

  BkProtocol &proto_;
  BkHandshake handshake_;
  uint16_t connect_retries_{20};
  bool show_progress_{true};
  uint8_t progress_step_{5};
};

}  // namespace bk_flasher
}  // namespace esphome
