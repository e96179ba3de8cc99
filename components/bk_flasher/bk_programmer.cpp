#include "bk_programmer.h"

#include <algorithm>

#include "esphome/core/hal.h"
#include "esphome/core/log.h"

namespace esphome {
namespace bk_flasher {

static const char *const TAG = "bk_flasher.programmer";

static uint32_t crc32_table_[256];
static bool crc32_table_ready_ = false;

static void crc32_init_table_() {
  for (uint32_t i = 0; i < 256; i++) {
    uint32_t c = i;
    for (int j = 0; j < 8; j++)
      c = (c & 1) ? (c >> 1) ^ 0xEDB88320 : (c >> 1);
    crc32_table_[i] = c;
  }
  crc32_table_ready_ = true;
}

uint32_t crc32_update(uint32_t crc, const uint8_t *data, size_t len) {
  if (!crc32_table_ready_)
    crc32_init_table_();
  uint32_t c = crc ^ 0xFFFFFFFF;
  for (size_t i = 0; i < len; i++)
    c = crc32_table_[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  return c ^ 0xFFFFFFFF;
}

uint32_t image_crc32(const uint8_t *data, size_t len, size_t chunk) {
  if (chunk == 0)
    chunk = len ? len : 1;
  uint32_t crc = CRC32_SEED;
  for (size_t off = 0; off < len; off += chunk)
    crc = crc32_update(crc, data + off, std::min(chunk, len - off));
  return crc;
}

size_t sector_count(size_t image_len) {
  return (image_len + hci::SECTOR_SIZE - 1) / hci::SECTOR_SIZE;
}

std::vector<uint8_t> sector_at(const std::vector<uint8_t> &image, size_t index) {
  std::vector<uint8_t> sector(hci::SECTOR_SIZE, hci::ERASED_BYTE);
  size_t off = index * hci::SECTOR_SIZE;
  if (off < image.size()) {
    size_t n = std::min<size_t>(hci::SECTOR_SIZE, image.size() - off);
    std::copy(image.begin() + off, image.begin() + off + n, sector.begin());
  }
  return sector;
}

bool is_erased(const uint8_t *data, size_t len) {
  return std::all_of(data, data + len, [](uint8_t b) { return b == hci::ERASED_BYTE; });
}

const char *flash_step_to_string(FlashStep step) {
  switch (step) {
    case FlashStep::PREPARE:
      return "prepare";
    case FlashStep::CONNECT:
      return "connect";
    case FlashStep::STAY_ROM:
      return "stay_rom";
    case FlashStep::SET_BAUD:
      return "set_baud";
    case FlashStep::FLASH_ID:
      return "flash_id";
    case FlashStep::ERASE:
      return "erase";
    case FlashStep::WRITE:
      return "write";
    case FlashStep::VERIFY:
      return "verify";
    case FlashStep::REBOOT:
    default:
      return "reboot";
  }
}

const char *flash_outcome_to_string(FlashOutcome outcome) {
  switch (outcome) {
    case FlashOutcome::VERIFIED:
      return "verified";
    case FlashOutcome::MISMATCH:
      return "crc mismatch";
    case FlashOutcome::INCONCLUSIVE:
      return "verify inconclusive";
    case FlashOutcome::ABORTED:
    default:
      return "aborted";
  }
}

ProgrammingResult &BkProgrammer::abort_(ProgrammingResult &res, FlashStep step, uint32_t addr) {
  res.outcome = FlashOutcome::ABORTED;
  res.failed_step = step;
  res.failed_address = addr;
  ESP_LOGE(TAG, "Flashing aborted at %s (0x%08X)", flash_step_to_string(step), (unsigned) addr);
  return res;
}

void BkProgrammer::update_progress_(uint32_t done, uint32_t expected, uint32_t &last_pc, uint32_t addr,
                                    uint32_t started) {
  uint32_t elapsed = millis() - started;
  uint32_t kbps = elapsed ? (uint32_t) ((uint64_t) done * 1000 / 1024 / elapsed) : 0;
  ESP_LOGD(TAG, "Sector 0x%08X done, %u KB/s", (unsigned) addr, (unsigned) kbps);
  if (!show_progress_ || expected == 0)
    return;
  uint32_t pc = (uint64_t) done * 100 / expected;
  if (pc >= last_pc + progress_step_) {
    last_pc = pc - (pc % progress_step_);
    ESP_LOGI(TAG, "Progress: %u%% (%u/%u) @0x%08X %u KB/s", (unsigned) pc, (unsigned) done, (unsigned) expected,
             (unsigned) addr, (unsigned) kbps);
  }
}

ProgrammingResult BkProgrammer::flash(const std::vector<uint8_t> &image, uint32_t start_address, uint32_t fast_baud) {
  ProgrammingResult res;
  BkLink &link = proto_.link();
  if (image.empty()) {
    ESP_LOGE(TAG, "Refusing to flash an empty image");
    return abort_(res, FlashStep::PREPARE, start_address);
  }
  if (!link.is_open()) {
    ESP_LOGE(TAG, "No UART attached");
    return abort_(res, FlashStep::PREPARE, start_address);
  }
  ESP_LOGI(TAG, "Flashing %u bytes at 0x%08X", (unsigned) image.size(), (unsigned) start_address);

  if (!handshake_.connect(connect_retries_))
    return abort_(res, FlashStep::CONNECT, start_address);

  if (!proto_.stay_rom())
    ESP_LOGW(TAG, "No answer to stay-in-ROM, continuing");

  if (fast_baud != 0 && fast_baud != link.get_baud()) {
    if (proto_.set_baudrate(fast_baud)) {
      ESP_LOGI(TAG, "Switched to %u baud", (unsigned) fast_baud);
    } else {
      ESP_LOGW(TAG, "Baud switch failed, continuing at %u", (unsigned) link.get_baud());
    }
  }
  res.baud = link.get_baud();

  res.flash_id = proto_.read_flash_id();
  if (res.flash_id != 0) {
    ESP_LOGI(TAG, "Flash ID: 0x%08X", (unsigned) res.flash_id);
  } else {
    ESP_LOGW(TAG, "Could not read flash ID");
  }

  const size_t count = sector_count(image.size());
  const uint32_t total = count * hci::SECTOR_SIZE;
  uint32_t last_pc = 0;
  uint32_t started = millis();
  for (size_t i = 0; i < count; i++) {
    const uint32_t addr = start_address + i * hci::SECTOR_SIZE;
    std::vector<uint8_t> sector = sector_at(image, i);
    if (is_erased(sector.data(), sector.size())) {
      res.sectors_skipped++;
      ESP_LOGV(TAG, "Sector 0x%08X is blank, skipped", (unsigned) addr);
    } else {
      if (!proto_.sector_erase(addr))
        return abort_(res, FlashStep::ERASE, addr);
      if (!proto_.sector_write(addr, sector.data(), sector.size()))
        return abort_(res, FlashStep::WRITE, addr);
      res.sectors_written++;
      res.bytes_written += hci::SECTOR_SIZE;
    }
    update_progress_((i + 1) * hci::SECTOR_SIZE, total, last_pc, addr, started);
  }
  res.elapsed_ms = millis() - started;
  ESP_LOGI(TAG, "Wrote %u sector(s), skipped %u, in %u ms", (unsigned) res.sectors_written,
           (unsigned) res.sectors_skipped, (unsigned) res.elapsed_ms);

  res.local_crc = image_crc32(image.data(), image.size());
  const uint32_t end = start_address + image.size() - 1;
  res.has_device_crc = proto_.check_crc32(start_address, end, res.device_crc);
  if (!res.has_device_crc) {
    res.outcome = FlashOutcome::INCONCLUSIVE;
    ESP_LOGW(TAG, "Device gave no CRC, local CRC=0x%08X", (unsigned) res.local_crc);
  } else if (res.device_crc == res.local_crc) {
    res.outcome = FlashOutcome::VERIFIED;
    ESP_LOGI(TAG, "CRC verified: 0x%08X", (unsigned) res.local_crc);
  } else {
    res.outcome = FlashOutcome::MISMATCH;
    ESP_LOGE(TAG, "CRC mismatch: local=0x%08X device=0x%08X", (unsigned) res.local_crc, (unsigned) res.device_crc);
  }

  ESP_LOGI(TAG, "Rebooting target");
  proto_.reboot();
  return res;
}

}  // namespace bk_flasher
}  // namespace esphome
