// bk_hci.h - BK HCI framing spoken by the Beken boot ROM over UART
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace esphome {
namespace bk_flasher {
namespace hci {

// Command frames start with 01 E0 FC, responses with 04 0E.
constexpr uint8_t CMD_TYPE = 0x01;
constexpr uint8_t OGF_LO = 0xE0;
constexpr uint8_t OGF_HI = 0xFC;
constexpr uint8_t EVT_TYPE = 0x04;
constexpr uint8_t EVT_CODE = 0x0E;

// A length byte of FF marks the flash-subsystem shape nested in outer command F4.
constexpr uint8_t FLASH_LEN_SENTINEL = 0xFF;
constexpr uint8_t CMD_FLASH = 0xF4;

enum : uint8_t {
  CMD_LINK_CHECK = 0x00,
  RSP_LINK_CHECK = 0x01,
  CMD_REG_WRITE = 0x01,
  CMD_REG_READ = 0x03,
  CMD_REBOOT = 0x0E,
  CMD_SET_BAUDRATE = 0x0F,
  CMD_CHECK_CRC32 = 0x10,
  CMD_RAM_WRITE = 0x21,
  CMD_RAM_READ = 0x23,
  CMD_JUMP = 0x25,
  CMD_RESET = 0x70,
  CMD_STAY_ROM = 0xAA,
  CMD_STARTUP = 0xFE,
};

enum : uint8_t {
  FLASH_CMD_WRITE = 0x06,
  FLASH_CMD_SECTOR_WRITE = 0x07,
  FLASH_CMD_READ = 0x08,
  FLASH_CMD_SECTOR_READ = 0x09,
  FLASH_CMD_CHIP_ERASE = 0x0A,
  FLASH_CMD_SECTOR_ERASE = 0x0B,
  FLASH_CMD_REG_READ = 0x0C,
  FLASH_CMD_REG_WRITE = 0x0D,
  FLASH_CMD_SPI_OPERATE = 0x0E,
  FLASH_CMD_SIZE_ERASE = 0x0F,
};

constexpr uint8_t REBOOT_MAGIC = 0xA5;
constexpr uint8_t STAY_ROM_MAGIC = 0x55;
constexpr uint8_t JEDEC_READ_ID = 0x9F;

constexpr uint32_t SECTOR_SIZE = 4096;
constexpr uint8_t ERASED_BYTE = 0xFF;

// Offsets into a reassembled response, counted from the 04 0E marker.
constexpr size_t COMMON_HEADER_SIZE = 3;
constexpr size_t COMMON_CMD_OFFSET = 6;
constexpr size_t COMMON_PAYLOAD_OFFSET = 7;
constexpr size_t FLASH_LEN_OFFSET = 7;
constexpr size_t FLASH_FIXED_SIZE = 10;
constexpr size_t FLASH_CMD_OFFSET = 9;
constexpr size_t FLASH_STATUS_OFFSET = 10;
constexpr size_t FLASH_PAYLOAD_OFFSET = 11;

// Bytes kept while hunting for a marker before the buffer is trimmed.
constexpr size_t SCAN_LIMIT = 256;

inline void put_u32_le(std::vector<uint8_t> &out, uint32_t v) {
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

inline uint32_t get_u32_le(const uint8_t *p) {
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) | (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

inline uint32_t get_u32_be(const uint8_t *p) {
  return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

std::vector<uint8_t> encode_common(uint8_t cmd_id, const std::vector<uint8_t> &params = {});
std::vector<uint8_t> encode_flash(uint8_t flash_cmd_id, const std::vector<uint8_t> &params = {});

// Device side of the wire format. Used by loopback tests and simulators.
std::vector<uint8_t> encode_common_response(uint8_t cmd_id, const std::vector<uint8_t> &payload = {});
std::vector<uint8_t> encode_flash_response(uint8_t flash_cmd_id, uint8_t status,
                                           const std::vector<uint8_t> &payload = {});

enum class FrameShape : uint8_t {
  COMMON = 0,
  FLASH,
};

struct Response {
  FrameShape shape{FrameShape::COMMON};
  uint8_t cmd_id{0};
  uint8_t status{0xFF};    // flash frames only, FF when the frame ends before it
  uint16_t inner_len{0};   // flash frames only
  std::vector<uint8_t> payload;
  std::vector<uint8_t> raw;
};

enum class ResponseKind : uint8_t {
  LINK_ACK = 0,
  STARTUP,
  OTHER,
};

ResponseKind classify(const Response &rsp);
const char *response_kind_to_string(ResponseKind kind);
const char *frame_shape_to_string(FrameShape shape);

// Parses one complete frame. Fails on a bad marker, a missing 01 E0 FC echo or a truncated header.
bool parse_response(const std::vector<uint8_t> &raw, Response &out);

/**
 * Reassembles response frames from an arbitrary byte stream.
 *
 * Bytes ahead of a 04 0E marker are dropped. needed() tells the reader how many
 * more bytes complete the current frame so nothing past it is consumed.
 */
class FrameDecoder {
 public:
  void reset() { buf_.clear(); }
  void push(uint8_t b);
  void push(const uint8_t *data, size_t len);
  size_t needed() const;
  bool pop(Response &out);
  size_t buffered() const { return buf_.size(); }

 private:
  void align_();
  bool starts_with_marker_() const;
  // Total size of the frame at the head of the buffer, 0 while still unknown.
  size_t frame_size_() const;

  std::vector<uint8_t> buf_;
};

}  // namespace hci
}  // namespace bk_flasher
}  // namespace esphome
