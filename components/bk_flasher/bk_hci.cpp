#include "bk_hci.h"

#include "esphome/core/log.h"

namespace esphome {
namespace bk_flasher {
namespace hci {

static const char *const TAG = "bk_flasher.hci";

std::vector<uint8_t> encode_common(uint8_t cmd_id, const std::vector<uint8_t> &params) {
  std::vector<uint8_t> out;
  out.reserve(5 + params.size());
  out.push_back(CMD_TYPE);
  out.push_back(OGF_LO);
  out.push_back(OGF_HI);
  out.push_back(static_cast<uint8_t>(1 + params.size()));
  out.push_back(cmd_id);
  out.insert(out.end(), params.begin(), params.end());
  return out;
}

std::vector<uint8_t> encode_flash(uint8_t flash_cmd_id, const std::vector<uint8_t> &params) {
  const uint16_t len = static_cast<uint16_t>(1 + params.size());
  std::vector<uint8_t> out;
  out.reserve(8 + params.size());
  out.push_back(CMD_TYPE);
  out.push_back(OGF_LO);
  out.push_back(OGF_HI);
  out.push_back(FLASH_LEN_SENTINEL);
  out.push_back(CMD_FLASH);
  out.push_back(static_cast<uint8_t>(len & 0xFF));
  out.push_back(static_cast<uint8_t>(len >> 8));
  out.push_back(flash_cmd_id);
  out.insert(out.end(), params.begin(), params.end());
  return out;
}

std::vector<uint8_t> encode_common_response(uint8_t cmd_id, const std::vector<uint8_t> &payload) {
  std::vector<uint8_t> out;
  out.reserve(COMMON_PAYLOAD_OFFSET + payload.size());
  out.push_back(EVT_TYPE);
  out.push_back(EVT_CODE);
  out.push_back(static_cast<uint8_t>(4 + payload.size()));
  out.push_back(CMD_TYPE);
  out.push_back(OGF_LO);
  out.push_back(OGF_HI);
  out.push_back(cmd_id);
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

std::vector<uint8_t> encode_flash_response(uint8_t flash_cmd_id, uint8_t status, const std::vector<uint8_t> &payload) {
  // The ROM's inner length covers two bytes that the fixed part already counts,
  // so a frame of 11 + n bytes carries n + 3 here.
  const uint16_t len = static_cast<uint16_t>(payload.size() + 3);
  std::vector<uint8_t> out;
  out.reserve(FLASH_PAYLOAD_OFFSET + payload.size());
  out.push_back(EVT_TYPE);
  out.push_back(EVT_CODE);
  out.push_back(FLASH_LEN_SENTINEL);
  out.push_back(CMD_TYPE);
  out.push_back(OGF_LO);
  out.push_back(OGF_HI);
  out.push_back(CMD_FLASH);
  out.push_back(static_cast<uint8_t>(len & 0xFF));
  out.push_back(static_cast<uint8_t>(len >> 8));
  out.push_back(flash_cmd_id);
  out.push_back(status);
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

ResponseKind classify(const Response &rsp) {
  if (rsp.shape != FrameShape::COMMON)
    return ResponseKind::OTHER;
  if (rsp.cmd_id == RSP_LINK_CHECK)
    return ResponseKind::LINK_ACK;
  if (rsp.cmd_id == CMD_STARTUP)
    return ResponseKind::STARTUP;
  return ResponseKind::OTHER;
}

const char *response_kind_to_string(ResponseKind kind) {
  switch (kind) {
    case ResponseKind::LINK_ACK:
      return "LINK_ACK";
    case ResponseKind::STARTUP:
      return "STARTUP";
    case ResponseKind::OTHER:
    default:
      return "OTHER";
  }
}

const char *frame_shape_to_string(FrameShape shape) {
  return shape == FrameShape::FLASH ? "FLASH" : "COMMON";
}

static bool has_echo_(const std::vector<uint8_t> &raw) {
  return raw[3] == CMD_TYPE && raw[4] == OGF_LO && raw[5] == OGF_HI;
}

bool parse_response(const std::vector<uint8_t> &raw, Response &out) {
  if (raw.size() < COMMON_HEADER_SIZE || raw[0] != EVT_TYPE || raw[1] != EVT_CODE)
    return false;

  if (raw[2] == FLASH_LEN_SENTINEL) {
    if (raw.size() < FLASH_FIXED_SIZE || !has_echo_(raw) || raw[6] != CMD_FLASH)
      return false;
    out.shape = FrameShape::FLASH;
    out.inner_len = static_cast<uint16_t>(raw[FLASH_LEN_OFFSET] | (raw[FLASH_LEN_OFFSET + 1] << 8));
    out.cmd_id = raw[FLASH_CMD_OFFSET];
    out.status = raw.size() > FLASH_STATUS_OFFSET ? raw[FLASH_STATUS_OFFSET] : 0xFF;
    if (raw.size() > FLASH_PAYLOAD_OFFSET) {
      out.payload.assign(raw.begin() + FLASH_PAYLOAD_OFFSET, raw.end());
    } else {
      out.payload.clear();
    }
  } else {
    if (raw.size() <= COMMON_CMD_OFFSET || !has_echo_(raw))
      return false;
    out.shape = FrameShape::COMMON;
    out.inner_len = 0;
    out.status = 0xFF;
    out.cmd_id = raw[COMMON_CMD_OFFSET];
    out.payload.assign(raw.begin() + COMMON_PAYLOAD_OFFSET, raw.end());
  }
  out.raw = raw;
  return true;
}

void FrameDecoder::push(uint8_t b) {
  buf_.push_back(b);
  align_();
}

void FrameDecoder::push(const uint8_t *data, size_t len) {
  if (data == nullptr)
    return;
  for (size_t i = 0; i < len; i++)
    push(data[i]);
}

bool FrameDecoder::starts_with_marker_() const {
  return buf_.size() >= 2 && buf_[0] == EVT_TYPE && buf_[1] == EVT_CODE;
}

void FrameDecoder::align_() {
  if (starts_with_marker_())
    return;
  for (size_t i = 1; i + 1 < buf_.size(); i++) {
    if (buf_[i] == EVT_TYPE && buf_[i + 1] == EVT_CODE) {
      buf_.erase(buf_.begin(), buf_.begin() + i);
      return;
    }
  }
  if (buf_.size() > SCAN_LIMIT) {
    // Keep the last byte, it may be the first half of a marker.
    buf_.erase(buf_.begin(), buf_.end() - 1);
  }
}

size_t FrameDecoder::frame_size_() const {
  if (!starts_with_marker_() || buf_.size() < COMMON_HEADER_SIZE)
    return 0;
  uint8_t len = buf_[2];
  if (len != FLASH_LEN_SENTINEL)
    return COMMON_HEADER_SIZE + len;
  if (buf_.size() < FLASH_FIXED_SIZE)
    return 0;
  size_t inner = buf_[FLASH_LEN_OFFSET] | (buf_[FLASH_LEN_OFFSET + 1] << 8);
  if (inner < 2)
    return FLASH_FIXED_SIZE;
  return FLASH_FIXED_SIZE + inner - 2;
}

size_t FrameDecoder::needed() const {
  if (!starts_with_marker_())
    return 1;
  if (buf_.size() < COMMON_HEADER_SIZE)
    return COMMON_HEADER_SIZE - buf_.size();
  if (buf_[2] == FLASH_LEN_SENTINEL && buf_.size() < FLASH_FIXED_SIZE)
    return FLASH_FIXED_SIZE - buf_.size();
  size_t total = frame_size_();
  return total > buf_.size() ? total - buf_.size() : 0;
}

bool FrameDecoder::pop(Response &out) {
  while (true) {
    size_t total = frame_size_();
    if (total == 0 || buf_.size() < total)
      return false;
    std::vector<uint8_t> raw(buf_.begin(), buf_.begin() + total);
    buf_.erase(buf_.begin(), buf_.begin() + total);
    // A frame may be followed by chatter or another frame.
    if (!buf_.empty() && !starts_with_marker_()) {
      std::vector<uint8_t> rest;
      rest.swap(buf_);
      push(rest.data(), rest.size());
    }
    if (parse_response(raw, out))
      return true;
    ESP_LOGD(TAG, "Dropping malformed %u-byte frame", (unsigned) raw.size());
  }
}

}  // namespace hci
}  // namespace bk_flasher
}  // namespace esphome
