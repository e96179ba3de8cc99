// bk_flasher.h - ESPHome external component for Beken BK72xx flashing via the boot ROM HCI protocol
#pragma once

#include <vector>
#include <string>
#include <cstring>
#include <algorithm>

#include "esphome/core/component.h"
#include "esphome/core/automation.h"
#include "esphome/core/log.h"
#include "esphome/core/application.h"
#include "esphome/components/uart/uart.h"
#include "esphome/components/switch/switch.h"
#include "esphome/components/text_sensor/text_sensor.h"
#include "esphome/components/binary_sensor/binary_sensor.h"
#include "esphome/components/md5/md5.h"

#include "bk_link.h"
#include "bk_manifest.h"
#include "bk_programmer.h"
#include "bk_protocol.h"

#ifdef USE_ESP_IDF
  #include "esp_http_client.h"
  #include "esp_crt_bundle.h"
#else
  #error "BK flasher requires ESP-IDF framework."
#endif

namespace esphome {
namespace bk_flasher {

class BkFlasher : public Component {
 public:
  void set_uart(esphome::uart::UARTComponent *u){ uart_ = u; }
  void set_rst_switch(esphome::switch_::Switch *s){ rst_sw_ = s; }
  void set_update_url(const std::string &u){ manifest_url_ = u; }
  void set_start_address(uint32_t a){ start_address_ = a; }
  void set_boot_baud(uint32_t b){ boot_baud_ = b; }
  void set_fast_baud(uint32_t b){ fast_baud_ = b; }
  void set_connect_retries(uint16_t r){ connect_retries_ = r ? r : 20; }
  void set_verbose(bool v){ verbose_ = v; }
  void set_show_progress(bool v){ show_progress_ = v; }
  void set_progress_step(uint8_t s){ progress_step_ = s ? s : 5; }
  void set_monitor(bool m){ monitor_ = m; }
  void set_erase_timeout(uint32_t ms){ timeouts_.erase_ms = ms; }
  void set_write_timeout(uint32_t ms){ timeouts_.write_ms = ms; }
  void set_crc_timeout(uint32_t ms){ timeouts_.crc_ms = ms; }
  void set_flash_id_text_sensor(esphome::text_sensor::TextSensor *t){ flash_id_text_ = t; }
  void set_status_text_sensor(esphome::text_sensor::TextSensor *t){ status_text_ = t; }
  void set_crc_text_sensor(esphome::text_sensor::TextSensor *t){ crc_text_ = t; }
  void set_busy_sensor(esphome::binary_sensor::BinarySensor *b){ busy_sensor_ = b; }

  void start_firmware_update(){ want_update_ = true; }
  void start_link_check(){ want_link_check_ = true; }
  void enable_monitor(bool on){ monitor_ = on; monitor_buf_.clear(); }

  void setup() override;
  void loop() override;
  void dump_config() override;
  float get_setup_priority() const override { return setup_priority::HARDWARE; }

 private:
  // HTTP helpers
  bool http_open_(const std::string &url, esp_http_client_handle_t &client, int timeout_ms=30000);
  bool fetch_manifest_(const std::string &url, FirmwareManifest &manifest);
  void http_close_(esp_http_client_handle_t client);
  bool download_image_(const std::string &url, std::vector<uint8_t> &image);
  bool reserve_image_(std::vector<uint8_t> &image, size_t bytes);

  // Target helpers
  void reset_target_();
  void configure_engine_();
  void restore_baud_();
  void pump_monitor_();
  void publish_status_(const char *s){ if (status_text_) status_text_->publish_state(s); }

  // High level flows
  void run_update_();
  void run_link_check_();
  void finish_run_();
  inline void set_busy_(bool on){ busy_ = on; if (busy_sensor_) busy_sensor_->publish_state(on); }

  // State
  esphome::uart::UARTComponent *uart_{nullptr};
  esphome::switch_::Switch *rst_sw_{nullptr};
  esphome::text_sensor::TextSensor *flash_id_text_{nullptr};
  esphome::text_sensor::TextSensor *status_text_{nullptr};
  esphome::text_sensor::TextSensor *crc_text_{nullptr};
  esphome::binary_sensor::BinarySensor *busy_sensor_{nullptr};

  BkLink link_;
  BkProtocol proto_{link_};
  BkProgrammer programmer_{proto_};
  BkTimeouts timeouts_{};

  std::string manifest_url_;
  uint32_t start_address_{0};
  uint32_t boot_baud_{0};
  uint32_t fast_baud_{921600};
  uint16_t connect_retries_{20};
  bool want_update_{false};
  bool want_link_check_{false};
  bool busy_{false};
  bool verbose_{false};
  bool show_progress_{true};
  uint8_t progress_step_{5};
  bool monitor_{false};
  std::vector<uint8_t> monitor_buf_;
  std::string expected_md5_{};
  uint32_t expected_size_{0};
};

class UpdateFirmwareAction : public esphome::Action<> {
 public:
  void set_parent(BkFlasher *p){ parent_ = p; }
  void play() override { if(parent_) parent_->start_firmware_update(); }
 private:
  BkFlasher *parent_{nullptr};
};

class LinkCheckAction : public esphome::Action<> {
 public:
  void set_parent(BkFlasher *p){ parent_ = p; }
  void play() override { if(parent_) parent_->start_link_check(); }
 private:
  BkFlasher *parent_{nullptr};
};

class MonitorAction : public esphome::Action<> {
 public:
  void set_parent(BkFlasher *p){ parent_ = p; }
  void set_enabled(bool on){ enabled_ = on; }
  void play() override { if(parent_) parent_->enable_monitor(enabled_); }
 private:
  BkFlasher *parent_{nullptr};
  bool enabled_{true};
};

} // namespace bk_flasher
} // namespace esphome
