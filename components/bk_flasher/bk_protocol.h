// bk_protocol.h - BK boot ROM commands built on the HCI codec and a BkLink session
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "bk_hci.h"
#include "bk_link.h"

namespace esphome {
namespace bk_flasher {

// Per-command response windows, in milliseconds.
struct BkTimeouts {
  uint32_t link_check_ms{2000};
  uint32_t stay_rom_ms{2000};
  uint32_t set_baud_ms{2000};
  uint32_t flash_id_ms{3000};
  uint32_t erase_ms{5000};
  uint32_t write_ms{10000};
  uint32_t crc_ms{30000};
  // Handshake probing
  uint32_t probe_ms{300};
  uint32_t probe_gap_ms{50};
  uint32_t startup_ack_ms{1000};
  // Added to the ROM's own delay before the local UART is retuned.
  uint32_t baud_settle_ms{50};
};

class BkProtocol {
 public:
  explicit BkProtocol(BkLink &link) : link_(link) {}

  void set_timeouts(const BkTimeouts &t){ timeouts_ = t; }
  const BkTimeouts &get_timeouts() const { return timeouts_; }
  BkLink &link(){ return link_; }

  bool send_common(uint8_t cmd_id, const std::vector<uint8_t> &params = {});
  bool send_flash(uint8_t flash_cmd_id, const std::vector<uint8_t> &params = {});
  // Waits for one response. A different command id than expected is logged and still returned.
  bool recv(hci::Response &out, uint32_t timeout_ms, int expected_cmd = -1);

  bool link_check();
  bool stay_rom();
  bool set_baudrate(uint32_t baud, uint8_t delay_ms = 5);
  void reboot();
  // The commands below only accept the reply to the command just sent.
  // JEDEC id of the attached SPI flash, 0 when unknown.
  uint32_t read_flash_id();
  bool sector_erase(uint32_t addr);
  bool sector_write(uint32_t addr, const uint8_t *data, size_t len);
  // CRC over [start, end] inclusive. False when the ROM gives no usable answer.
  bool check_crc32(uint32_t start, uint32_t end, uint32_t &crc);

 protected:
  // Like recv(), but skips frames of another shape or command id until the deadline.
  bool recv_exact_(hci::Response &out, uint32_t timeout_ms, hci::FrameShape shape, uint8_t cmd_id);
  bool flash_status_ok_(const hci::Response &rsp, uint8_t flash_cmd_id, const char *what, uint32_t addr);

  BkLink &link_;
  BkTimeouts timeouts_{};
};

}  // namespace bk_flasher
}  // namespace esphome
