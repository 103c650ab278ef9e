/// @file main.cpp
/// @brief GPIO bridge example: I2C slave writes forwarded over SPI
/// @note This is an EXAMPLE, not part of the library

#include <Arduino.h>
#include <cstdlib>
#include "common/Log.h"
#include "common/BoardConfig.h"
#include "common/GpioPins.h"

#include "I2cSpiBridge/I2cSpiBridge.h"

// ============================================================================
// Globals
// ============================================================================

I2cSpiBridge::Bridge bridge;
I2cSpiBridge::Config gConfig;
gpio::BridgePort port;
bool gPortReady = false;
bool verboseMode = false;

// ============================================================================
// Helper Functions
// ============================================================================

const char* errToStr(I2cSpiBridge::Err err) {
  using namespace I2cSpiBridge;
  switch (err) {
    case Err::OK: return "OK";
    case Err::NOT_INITIALIZED: return "NOT_INITIALIZED";
    case Err::INVALID_CONFIG: return "INVALID_CONFIG";
    case Err::BUSY: return "BUSY";
    case Err::IN_PROGRESS: return "IN_PROGRESS";
    case Err::ADDRESS_NACK: return "ADDRESS_NACK";
    case Err::READ_NOT_SUPPORTED: return "READ_NOT_SUPPORTED";
    case Err::PROTOCOL_VIOLATION: return "PROTOCOL_VIOLATION";
    case Err::INCOMPLETE_BYTE: return "INCOMPLETE_BYTE";
    case Err::INCOMPLETE_FRAME: return "INCOMPLETE_FRAME";
    case Err::REPEATED_START: return "REPEATED_START";
    case Err::FRAME_OVERRUN: return "FRAME_OVERRUN";
    case Err::TRANSFER_DROPPED: return "TRANSFER_DROPPED";
    case Err::TRANSFER_ABANDONED: return "TRANSFER_ABANDONED";
    default: return "UNKNOWN";
  }
}

const char* decoderStateToStr(I2cSpiBridge::DecoderState st) {
  using namespace I2cSpiBridge;
  switch (st) {
    case DecoderState::IDLE: return "IDLE";
    case DecoderState::ADDR_BITS: return "ADDR_BITS";
    case DecoderState::ADDR_ACK: return "ADDR_ACK";
    case DecoderState::REG_BITS: return "REG_BITS";
    case DecoderState::REG_ACK: return "REG_ACK";
    case DecoderState::DATA_BITS: return "DATA_BITS";
    case DecoderState::DATA_ACK: return "DATA_ACK";
    case DecoderState::AWAIT_STOP: return "AWAIT_STOP";
    default: return "UNKNOWN";
  }
}

const char* spiStateToStr(I2cSpiBridge::SpiState st) {
  using namespace I2cSpiBridge;
  switch (st) {
    case SpiState::IDLE: return "IDLE";
    case SpiState::CS_ASSERT: return "CS_ASSERT";
    case SpiState::SHIFT: return "SHIFT";
    case SpiState::CS_DEASSERT: return "CS_DEASSERT";
    default: return "UNKNOWN";
  }
}

const char* eventToStr(I2cSpiBridge::EventType type) {
  using namespace I2cSpiBridge;
  switch (type) {
    case EventType::START: return "START";
    case EventType::ADDRESS_MATCH: return "ADDRESS_MATCH";
    case EventType::ADDRESS_NACK: return "ADDRESS_NACK";
    case EventType::BYTE_RECEIVED: return "BYTE_RECEIVED";
    case EventType::FRAME_COMPLETE: return "FRAME_COMPLETE";
    case EventType::FRAME_ABORTED: return "FRAME_ABORTED";
    case EventType::TRANSFER_STARTED: return "TRANSFER_STARTED";
    case EventType::TRANSFER_DROPPED: return "TRANSFER_DROPPED";
    case EventType::TRANSFER_DONE: return "TRANSFER_DONE";
    case EventType::RESET: return "RESET";
    default: return "NONE";
  }
}

void printStatus(const I2cSpiBridge::Status& st) {
  Serial.printf("  Status: %s (code=%u, detail=%ld)\n",
                errToStr(st.code),
                static_cast<unsigned>(st.code),
                static_cast<long>(st.detail));
  if (st.msg && st.msg[0]) {
    Serial.printf("  Message: %s\n", st.msg);
  }
}

/// Event callback: runs inside bridge.tick()
void onBridgeEvent(const I2cSpiBridge::Event& ev, void* user) {
  (void)user;
  using I2cSpiBridge::EventType;

  switch (ev.type) {
    case EventType::TRANSFER_STARTED: {
      I2cSpiBridge::BridgeSnapshot snap;
      if (bridge.getSnapshot(snap).ok()) {
        LOGI("SPI <- reg=0x%02X data=0x%02X", static_cast<unsigned>(snap.lastJob.reg),
             static_cast<unsigned>(snap.lastJob.data));
      }
      break;
    }
    case EventType::TRANSFER_DROPPED:
      LOGW("SPI busy, dropped write to reg 0x%02X", static_cast<unsigned>(ev.value));
      break;
    case EventType::FRAME_ABORTED:
      LOGW("Frame aborted: %s (byte %u, %u bits)", errToStr(ev.error),
           static_cast<unsigned>(ev.byteIndex), static_cast<unsigned>(ev.value));
      break;
    default:
      if (verboseMode) {
        LOGD("t=%lu %s idx=%u val=0x%02X err=%s",
             static_cast<unsigned long>(ev.tick), eventToStr(ev.type),
             static_cast<unsigned>(ev.byteIndex), static_cast<unsigned>(ev.value),
             errToStr(ev.error));
      }
      break;
  }
}

void printCounters() {
  Serial.println("=== Bridge Counters ===");
  Serial.printf("  Ticks: %lu\n", static_cast<unsigned long>(bridge.tickCount()));
  Serial.printf("  Frames completed: %lu\n", static_cast<unsigned long>(bridge.framesCompleted()));
  Serial.printf("  Address NACKs: %lu\n", static_cast<unsigned long>(bridge.addressNacks()));
  Serial.printf("  Frames aborted: %lu\n", static_cast<unsigned long>(bridge.framesAborted()));
  Serial.printf("  Transfers started: %lu\n", static_cast<unsigned long>(bridge.transfersStarted()));
  Serial.printf("  Transfers completed: %lu\n", static_cast<unsigned long>(bridge.transfersCompleted()));
  Serial.printf("  Transfers dropped: %lu\n", static_cast<unsigned long>(bridge.transfersDropped()));
  Serial.printf("  Transfers abandoned: %lu\n", static_cast<unsigned long>(bridge.transfersAbandoned()));
  if (bridge.lastError().code != I2cSpiBridge::Err::OK) {
    Serial.printf("  Last error: %s at tick %lu\n", errToStr(bridge.lastError().code),
                  static_cast<unsigned long>(bridge.lastErrorTick()));
  }
}

void printSnapshot() {
  I2cSpiBridge::BridgeSnapshot snap;
  const I2cSpiBridge::Status st = bridge.getSnapshot(snap);
  if (!st.ok()) {
    printStatus(st);
    return;
  }
  Serial.println("=== Bridge State ===");
  Serial.printf("  Reset held: %s\n", snap.inReset ? "YES" : "NO");
  Serial.printf("  Decoder: %s\n", decoderStateToStr(snap.decoderState));
  Serial.printf("  SPI: %s\n", spiStateToStr(snap.spiState));
  Serial.printf("  uo_out: 0x%02X\n", static_cast<unsigned>(snap.uoOut));
  if (snap.hasLastJob) {
    Serial.printf("  Last job: reg=0x%02X data=0x%02X\n",
                  static_cast<unsigned>(snap.lastJob.reg),
                  static_cast<unsigned>(snap.lastJob.data));
  }
}

void printConfig() {
  const I2cSpiBridge::Config& cfg = bridge.config();
  Serial.println("=== Config ===");
  Serial.printf("  Slave address: 0x%02X\n", static_cast<unsigned>(cfg.slaveAddress));
  Serial.printf("  SPI mode: %u\n", static_cast<unsigned>(cfg.spiMode));
  Serial.printf("  SPI divider: %u\n", static_cast<unsigned>(cfg.spiClockDivider));
  Serial.printf("  CS setup/hold: %u/%u ticks\n", static_cast<unsigned>(cfg.csSetupTicks),
                static_cast<unsigned>(cfg.csHoldTicks));
  Serial.printf("  Transfer: %lu ticks\n", static_cast<unsigned long>(bridge.transferTicks()));
  Serial.printf("  Verbose: %s\n", verboseMode ? "ON" : "OFF");
}

void printHelp() {
  Serial.println("=== Commands ===");
  Serial.println("  help                     - Show this help");
  Serial.println("  status                   - Show decoder/SPI state");
  Serial.println("  stats                    - Show counters");
  Serial.println("  cfg                      - Show current config");
  Serial.println("  mode [0|1|2|3]            - Set SPI mode (re-initializes)");
  Serial.println("  div <n>                  - Set SPI clock divider (re-initializes)");
  Serial.println("  reset                    - Synchronous bridge reset");
  Serial.println("  begin                    - Re-initialize bridge");
  Serial.println("  end                      - End bridge session");
  Serial.println("  verbose [0|1]             - Enable/disable event trace");
}

void applyConfig() {
  const I2cSpiBridge::Status st = bridge.begin(gConfig);
  if (!st.ok()) {
    LOGE("Failed to initialize bridge");
    printStatus(st);
    return;
  }
  LOGI("Bridge ready at 0x%02X", static_cast<unsigned>(gConfig.slaveAddress));
}

// ============================================================================
// Command Processing
// ============================================================================

void processCommand(const String& cmdLine) {
  String cmd = cmdLine;
  cmd.trim();
  if (cmd.length() == 0) {
    return;
  }

  if (cmd == "help" || cmd == "?") {
    printHelp();
    return;
  }

  if (cmd == "status") {
    printSnapshot();
    return;
  }

  if (cmd == "stats") {
    printCounters();
    return;
  }

  if (cmd == "cfg") {
    printConfig();
    return;
  }

  if (cmd.startsWith("mode ")) {
    const int mode = cmd.substring(5).toInt();
    if (mode < 0 || mode > 3) {
      LOGW("Invalid SPI mode: %d", mode);
      return;
    }
    gConfig.spiMode = static_cast<I2cSpiBridge::SpiMode>(mode);
    applyConfig();
    return;
  }

  if (cmd.startsWith("div ")) {
    const int div = cmd.substring(4).toInt();
    if (div < 2 || div > 254) {
      LOGW("Invalid divider: %d", div);
      return;
    }
    gConfig.spiClockDivider = static_cast<uint8_t>(div);
    applyConfig();
    return;
  }

  if (cmd == "reset") {
    bridge.reset();
    LOGI("Bridge reset");
    return;
  }

  if (cmd == "begin") {
    applyConfig();
    return;
  }

  if (cmd == "end") {
    bridge.end();
    port.write(bridge.uoOut());
    LOGI("Bridge ended");
    return;
  }

  if (cmd == "verbose") {
    Serial.printf("  Verbose: %s\n", verboseMode ? "ON" : "OFF");
    return;
  }

  if (cmd.startsWith("verbose ")) {
    verboseMode = cmd.substring(8).toInt() != 0;
    Serial.printf("  Verbose: %s\n", verboseMode ? "ON" : "OFF");
    return;
  }

  LOGW("Unknown command: %s", cmd.c_str());
}

// ============================================================================
// Setup / Loop
// ============================================================================

void setup() {
  log_begin(115200);

  LOGI("=== I2cSpiBridge GPIO Example (v%s) ===", I2cSpiBridge::VERSION);

  gConfig.slaveAddress = I2cSpiBridge::proto::DEFAULT_SLAVE_ADDRESS;
  gConfig.onEvent = onBridgeEvent;
  gConfig.eventUser = nullptr;
  applyConfig();

  // Pins start at the bridge's idle levels (SCLK follows the SPI mode)
  if (!port.begin(board::defaultPins(), bridge.uoOut())) {
    LOGE("Failed to configure bridge pins");
    return;
  }
  gPortReady = true;
  LOGI("Pins: SCL=%d SDA=%d SCLK=%d MOSI=%d CS=%d", board::I2C_SCL, board::I2C_SDA,
       board::SPI_SCLK, board::SPI_MOSI, board::SPI_CS_N);

  printConfig();
  printHelp();
  Serial.print("> ");
}

void loop() {
  if (gPortReady) {
    for (uint32_t i = 0; i < board::TICKS_PER_LOOP; ++i) {
      bridge.tick(port.read(), port.readRstN());
      port.write(bridge.uoOut());
    }
  }

  static String inputBuffer;
  while (Serial.available()) {
    const char c = static_cast<char>(Serial.read());
    if (c == '\n' || c == '\r') {
      if (inputBuffer.length() > 0) {
        processCommand(inputBuffer);
        inputBuffer = "";
        Serial.print("> ");
      }
    } else {
      inputBuffer += c;
    }
  }
}
