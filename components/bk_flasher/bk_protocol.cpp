#include "bk_protocol.h"

#include "esphome/core/hal.h"
#include "esphome/core/log.h"

namespace esphome {
namespace bk_flasher {

static const char *const TAG = "bk_flasher.protocol";

bool BkProtocol::send_common(uint8_t cmd_id, const std::vector<uint8_t> &params) {
  return link_.write(hci::encode_common(cmd_id, params));
}

bool BkProtocol::send_flash(uint8_t flash_cmd_id, const std::vector<uint8_t> &params) {
  return link_.write(hci::encode_flash(flash_cmd_id, params));
}

bool BkProtocol::recv(hci::Response &out, uint32_t timeout_ms, int expected_cmd) {
  if (!link_.recv_frame(out, timeout_ms))
    return false;
  if (expected_cmd >= 0 && out.cmd_id != static_cast<uint8_t>(expected_cmd)) {
    ESP_LOGD(TAG, "Expected cmd 0x%02X, got 0x%02X (%s frame)", (unsigned) expected_cmd, (unsigned) out.cmd_id,
             hci::frame_shape_to_string(out.shape));
  }
  return true;
}

bool BkProtocol::recv_exact_(hci::Response &out, uint32_t timeout_ms, hci::FrameShape shape, uint8_t cmd_id) {
  uint32_t start = millis();
  while (true) {
    uint32_t elapsed = millis() - start;
    if (elapsed >= timeout_ms)
      return false;
    if (!link_.recv_frame(out, timeout_ms - elapsed))
      return false;
    if (out.shape == shape && out.cmd_id == cmd_id)
      return true;
    // A reply left over from an earlier exchange; this command's reply is still due.
    ESP_LOGD(TAG, "Dropping stale %s frame cmd=0x%02X while waiting for 0x%02X", hci::frame_shape_to_string(out.shape),
             (unsigned) out.cmd_id, (unsigned) cmd_id);
  }
}

bool BkProtocol::link_check() {
  link_.flush_input();
  if (!send_common(hci::CMD_LINK_CHECK))
    return false;
  hci::Response rsp;
  return recv(rsp, timeouts_.link_check_ms, hci::RSP_LINK_CHECK);
}

bool BkProtocol::stay_rom() {
  if (!send_common(hci::CMD_STAY_ROM, {hci::STAY_ROM_MAGIC}))
    return false;
  hci::Response rsp;
  return recv(rsp, timeouts_.stay_rom_ms, hci::CMD_STAY_ROM);
}

bool BkProtocol::set_baudrate(uint32_t baud, uint8_t delay_ms) {
  std::vector<uint8_t> params;
  hci::put_u32_le(params, baud);
  params.push_back(delay_ms);
  if (!send_common(hci::CMD_SET_BAUDRATE, params))
    return false;
  hci::Response rsp;
  if (!recv(rsp, timeouts_.set_baud_ms, hci::CMD_SET_BAUDRATE)) {
    ESP_LOGW(TAG, "No ack for baud %u, staying at %u", (unsigned) baud, (unsigned) link_.get_baud());
    return false;
  }
  // The ROM switches after delay_ms; follow it only once that has passed.
  link_.delay_ms(delay_ms + timeouts_.baud_settle_ms);
  return link_.set_baud(baud);
}

void BkProtocol::reboot() {
  send_common(hci::CMD_REBOOT, {hci::REBOOT_MAGIC});
}

uint32_t BkProtocol::read_flash_id() {
  if (!send_flash(hci::FLASH_CMD_SPI_OPERATE, {hci::JEDEC_READ_ID, 0x00, 0x00, 0x00}))
    return 0;
  hci::Response rsp;
  if (!recv_exact_(rsp, timeouts_.flash_id_ms, hci::FrameShape::FLASH, hci::FLASH_CMD_SPI_OPERATE))
    return 0;
  if (rsp.payload.size() < 4)
    return 0;
  return hci::get_u32_be(rsp.payload.data());
}

bool BkProtocol::flash_status_ok_(const hci::Response &rsp, uint8_t flash_cmd_id, const char *what, uint32_t addr) {
  if (rsp.shape != hci::FrameShape::FLASH) {
    ESP_LOGE(TAG, "%s @0x%08X: unexpected %s frame cmd=0x%02X", what, (unsigned) addr,
             hci::frame_shape_to_string(rsp.shape), (unsigned) rsp.cmd_id);
    return false;
  }
  if (rsp.cmd_id != flash_cmd_id) {
    ESP_LOGE(TAG, "%s @0x%08X: answered by flash cmd 0x%02X", what, (unsigned) addr, (unsigned) rsp.cmd_id);
    return false;
  }
  if (rsp.status != 0) {
    ESP_LOGE(TAG, "%s @0x%08X failed, status=0x%02X", what, (unsigned) addr, (unsigned) rsp.status);
    return false;
  }
  return true;
}

bool BkProtocol::sector_erase(uint32_t addr) {
  std::vector<uint8_t> params;
  hci::put_u32_le(params, addr);
  if (!send_flash(hci::FLASH_CMD_SECTOR_ERASE, params))
    return false;
  hci::Response rsp;
  if (!recv_exact_(rsp, timeouts_.erase_ms, hci::FrameShape::FLASH, hci::FLASH_CMD_SECTOR_ERASE)) {
    ESP_LOGE(TAG, "Erase @0x%08X: no response", (unsigned) addr);
    return false;
  }
  return flash_status_ok_(rsp, hci::FLASH_CMD_SECTOR_ERASE, "Erase", addr);
}

bool BkProtocol::sector_write(uint32_t addr, const uint8_t *data, size_t len) {
  if (data == nullptr || len != hci::SECTOR_SIZE) {
    ESP_LOGE(TAG, "Sector write @0x%08X needs %u bytes, got %u", (unsigned) addr, (unsigned) hci::SECTOR_SIZE,
             (unsigned) len);
    return false;
  }
  std::vector<uint8_t> params;
  params.reserve(4 + len);
  hci::put_u32_le(params, addr);
  params.insert(params.end(), data, data + len);
  if (!send_flash(hci::FLASH_CMD_SECTOR_WRITE, params))
    return false;
  hci::Response rsp;
  if (!recv_exact_(rsp, timeouts_.write_ms, hci::FrameShape::FLASH, hci::FLASH_CMD_SECTOR_WRITE)) {
    ESP_LOGE(TAG, "Write @0x%08X: no response", (unsigned) addr);
    return false;
  }
  return flash_status_ok_(rsp, hci::FLASH_CMD_SECTOR_WRITE, "Write", addr);
}

bool BkProtocol::check_crc32(uint32_t start, uint32_t end, uint32_t &crc) {
  std::vector<uint8_t> params;
  hci::put_u32_le(params, start);
  hci::put_u32_le(params, end);
  if (!send_common(hci::CMD_CHECK_CRC32, params))
    return false;
  hci::Response rsp;
  if (!recv_exact_(rsp, timeouts_.crc_ms, hci::FrameShape::COMMON, hci::CMD_CHECK_CRC32)) {
    ESP_LOGW(TAG, "CRC 0x%08X..0x%08X: no response", (unsigned) start, (unsigned) end);
    return false;
  }
  if (rsp.payload.size() < 4) {
    ESP_LOGW(TAG, "CRC response too short (%u bytes)", (unsigned) rsp.raw.size());
    return false;
  }
  crc = hci::get_u32_le(rsp.payload.data());
  return true;
}

}  // namespace bk_flasher
}  // namespace esphome
