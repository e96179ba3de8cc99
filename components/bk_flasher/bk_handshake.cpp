#include "bk_handshake.h"

#include "esphome/core/log.h"

namespace esphome {
namespace bk_flasher {

static const char *const TAG = "bk_flasher.handshake";

const char *handshake_state_to_string(HandshakeState state) {
  switch (state) {
    case HandshakeState::IDLE:
      return "IDLE";
    case HandshakeState::PROBING:
      return "PROBING";
    case HandshakeState::STARTUP_SEEN:
      return "STARTUP_SEEN";
    case HandshakeState::CONNECTED:
      return "CONNECTED";
    case HandshakeState::FAILED:
    default:
      return "FAILED";
  }
}

uint16_t extend_retries(uint16_t retries, uint16_t extra) {
  uint32_t total = static_cast<uint32_t>(retries) + extra;
  return total > UINT16_MAX ? UINT16_MAX : static_cast<uint16_t>(total);
}

bool BkHandshake::probe_once_() {
  BkLink &link = proto_.link();
  const BkTimeouts &t = proto_.get_timeouts();

  link.flush_input();
  if (!proto_.send_common(hci::CMD_LINK_CHECK))
    return false;
  link.delay_ms(t.probe_gap_ms);

  hci::Response rsp;
  if (!proto_.recv(rsp, t.probe_ms))
    return false;

  switch (hci::classify(rsp)) {
    case hci::ResponseKind::LINK_ACK:
      return true;
    case hci::ResponseKind::STARTUP:
      // The ROM announced itself while our probe was in flight; ask again.
      state_ = HandshakeState::STARTUP_SEEN;
      ESP_LOGD(TAG, "Startup frame seen, re-sending link check");
      if (!proto_.send_common(hci::CMD_LINK_CHECK))
        return false;
      if (proto_.recv(rsp, t.startup_ack_ms, hci::RSP_LINK_CHECK))
        return true;
      state_ = HandshakeState::PROBING;
      return false;
    case hci::ResponseKind::OTHER:
    default:
      ESP_LOGD(TAG, "Ignoring %s frame cmd=0x%02X while probing", hci::frame_shape_to_string(rsp.shape),
               (unsigned) rsp.cmd_id);
      return false;
  }
}

bool BkHandshake::connect(uint16_t retries) {
  state_ = HandshakeState::PROBING;
  attempts_ = 0;
  ESP_LOGI(TAG, "Waiting for boot ROM (up to %u attempts)...", (unsigned) retries);
  for (uint16_t i = 0; i < retries; i++) {
    attempts_ = i + 1;
    if (probe_once_()) {
      // After a startup race the ROM may still owe us a second ack. Drop it so the
      // next command reads its own reply.
      proto_.link().flush_input();
      state_ = HandshakeState::CONNECTED;
      ESP_LOGI(TAG, "Connected after %u attempt(s)", (unsigned) attempts_);
      return true;
    }
    if (verbose_ || attempts_ % 5 == 0)
      ESP_LOGD(TAG, "Attempt %u/%u: no answer", (unsigned) attempts_, (unsigned) retries);
  }
  state_ = HandshakeState::FAILED;
  ESP_LOGE(TAG, "No response from boot ROM after %u attempts", (unsigned) attempts_);
  return false;
}

}  // namespace bk_flasher
}  // namespace esphome
