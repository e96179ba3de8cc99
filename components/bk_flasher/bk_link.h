// bk_link.h - UART session to a Beken boot ROM: timed reads, baud changes, frame reception
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "esphome/components/uart/uart.h"

#include "bk_hci.h"

namespace esphome {
namespace bk_flasher {

class BkLink {
 public:
  BkLink() = default;
  explicit BkLink(esphome::uart::UARTComponent *u) : uart_(u) {}

  void attach(esphome::uart::UARTComponent *u){ uart_ = u; }
  void set_verbose(bool v){ verbose_ = v; }
  bool is_open() const { return uart_ != nullptr; }
  // Drains TX and detaches the UART. The session stays closed until attach().
  void close();
  esphome::uart::UARTComponent *get_uart() const { return uart_; }

  bool write(const std::vector<uint8_t> &data);
  // Best effort: returns how many bytes arrived before the deadline.
  size_t read(uint8_t *dst, size_t n, uint32_t timeout_ms);
  void flush_input();

  // Retunes the local UART. The caller owns the settling delay.
  bool set_baud(uint32_t baud);
  uint32_t get_baud() const;

  // Waits for one complete response frame, consuming nothing past it.
  bool recv_frame(hci::Response &out, uint32_t timeout_ms);

  void delay_ms(uint32_t ms);
  void log_bytes(const char *prefix, const uint8_t *data, size_t len);

  // Formats one line of raw target output for the serial monitor.
  static std::string render_monitor_line(const uint8_t *data, size_t len);

 private:
  esphome::uart::UARTComponent *uart_{nullptr};
  hci::FrameDecoder decoder_;
  bool verbose_{false};
};

bool is_valid_utf8(const uint8_t *data, size_t len);

}  // namespace bk_flasher
}  // namespace esphome
