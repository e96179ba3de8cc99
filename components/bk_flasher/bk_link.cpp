#include "bk_link.h"

#include <algorithm>
#include <cstdio>

#include "esphome/core/application.h"
#include "esphome/core/hal.h"
#include "esphome/core/log.h"

namespace esphome {
namespace bk_flasher {

static const char *const TAG = "bk_flasher.link";

bool BkLink::write(const std::vector<uint8_t> &data) {
  if (uart_ == nullptr) {
    ESP_LOGE(TAG, "Write with no UART attached");
    return false;
  }
  if (verbose_) {
    // Sector writes are 4 KB; the header is what matters.
    log_bytes("TX", data.data(), std::min<size_t>(data.size(), 16));
  }
  uart_->write_array(data.data(), data.size());
  return true;
}

size_t BkLink::read(uint8_t *dst, size_t n, uint32_t timeout_ms) {
  if (uart_ == nullptr || dst == nullptr)
    return 0;
  size_t got = 0;
  uint32_t start = millis();
  while (got < n && millis() - start < timeout_ms) {
    int avail = uart_->available();
    if (avail <= 0) {
      delay_ms(1);
      continue;
    }
    size_t chunk = std::min<size_t>(static_cast<size_t>(avail), n - got);
    if (uart_->read_array(dst + got, chunk))
      got += chunk;
  }
  return got;
}

void BkLink::close() {
  if (uart_ != nullptr)
    uart_->flush();
  uart_ = nullptr;
  decoder_.reset();
}

void BkLink::flush_input() {
  if (uart_ == nullptr)
    return;
  uint8_t b;
  for (int i = 0; i < 64; i++) {
    bool any = false;
    while (uart_->available()) {
      uart_->read_byte(&b);
      any = true;
      App.feed_wdt();
    }
    if (!any)
      break;
    delay_ms(2);
  }
}

bool BkLink::set_baud(uint32_t baud) {
  if (uart_ == nullptr || baud == 0)
    return false;
  if (uart_->get_baud_rate() == baud) {
    ESP_LOGV(TAG, "UART baud rate already %u", static_cast<unsigned>(baud));
    return true;
  }
  // Outstanding TX must drain before the peripheral is retuned.
  uart_->flush();
  uart_->set_baud_rate(baud);
#if defined(USE_ESP8266) || defined(USE_ESP32)
  uart_->load_settings(false);
#endif
  ESP_LOGD(TAG, "UART baud rate set to %u", static_cast<unsigned>(baud));
  return true;
}

uint32_t BkLink::get_baud() const {
  return uart_ != nullptr ? uart_->get_baud_rate() : 0;
}

bool BkLink::recv_frame(hci::Response &out, uint32_t timeout_ms) {
  if (uart_ == nullptr)
    return false;
  decoder_.reset();
  uint8_t chunk[64];
  uint32_t start = millis();
  while (millis() - start < timeout_ms) {
    int avail = uart_->available();
    if (avail <= 0) {
      delay_ms(1);
      continue;
    }
    size_t want = std::max<size_t>(decoder_.needed(), 1);
    want = std::min<size_t>(want, static_cast<size_t>(avail));
    want = std::min<size_t>(want, sizeof(chunk));
    if (!uart_->read_array(chunk, want))
      continue;
    decoder_.push(chunk, want);
    if (decoder_.pop(out)) {
      if (verbose_)
        log_bytes("RX", out.raw.data(), out.raw.size());
      return true;
    }
  }
  if (verbose_ && decoder_.buffered() > 0)
    ESP_LOGD(TAG, "RX timeout with %u partial bytes buffered", (unsigned) decoder_.buffered());
  return false;
}

void BkLink::delay_ms(uint32_t ms) {
  uint32_t start = millis();
  while (millis() - start < ms) {
    App.feed_wdt();
    esphome::delay(1);
  }
}

void BkLink::log_bytes(const char *prefix, const uint8_t *data, size_t len) {
  if (!data && len)
    return;
  if (len == 0) {
    ESP_LOGD(TAG, "%s <empty>", prefix);
    return;
  }
  char line[140];
  size_t i = 0;
  while (i < len) {
    int pos = snprintf(line, sizeof(line), "%s len=%u: ", prefix, (unsigned) len);
    size_t chunk = std::min<size_t>(16, len - i);
    for (size_t j = 0; j < chunk && pos < (int) sizeof(line) - 4; j++)
      pos += snprintf(line + pos, sizeof(line) - pos, "%02X ", data[i + j]);
    ESP_LOGD(TAG, "%s", line);
    i += chunk;
    App.feed_wdt();
  }
}

bool is_valid_utf8(const uint8_t *data, size_t len) {
  size_t i = 0;
  while (i < len) {
    uint8_t c = data[i];
    size_t extra;
    if (c < 0x80) {
      extra = 0;
    } else if ((c & 0xE0) == 0xC0 && c >= 0xC2) {
      extra = 1;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
    } else if ((c & 0xF8) == 0xF0 && c <= 0xF4) {
      extra = 3;
    } else {
      return false;
    }
    if (len - i <= extra)
      return false;
    for (size_t k = 1; k <= extra; k++) {
      if ((data[i + k] & 0xC0) != 0x80)
        return false;
    }
    i += extra + 1;
  }
  return true;
}

std::string BkLink::render_monitor_line(const uint8_t *data, size_t len) {
  std::string out;
  if (data == nullptr || len == 0)
    return out;
  if (is_valid_utf8(data, len)) {
    out.reserve(len);
    for (size_t i = 0; i < len; i++) {
      char c = static_cast<char>(data[i]);
      if (c == '\r' || c == '\n')
        continue;
      out.push_back(c);
    }
    return out;
  }
  char hex[4];
  out.reserve(len * 3);
  for (size_t i = 0; i < len; i++) {
    snprintf(hex, sizeof(hex), "%02X ", data[i]);
    out.append(hex);
  }
  if (!out.empty())
    out.pop_back();
  return out;
}

}  // namespace bk_flasher
}  // namespace esphome
