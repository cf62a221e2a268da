#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ucibridge/config/bridge_config.hpp"
#include "ucibridge/engine/engine_process.hpp"
#include "ucibridge/engine/line_channel.hpp"
#include "ucibridge/engine/option_registry.hpp"
#include "ucibridge/engine/uci_protocol.hpp"
#include "ucibridge/engine/uci_types.hpp"
#include "ucibridge/log.hpp"

namespace ucibridge::engine
{
  // One engine process, its handshake state and its option cache. Protocol
  // operations are serialized; stop() may be called from any thread and
  // interrupts a read in progress.
  class UciBridge
  {
  public:
    explicit UciBridge(config::BridgeConfig cfg);
    UciBridge(config::BridgeConfig cfg, Logger log);
    ~UciBridge();

    UciBridge(const UciBridge &) = delete;
    UciBridge &operator=(const UciBridge &) = delete;

    // Spawn, handshake, apply configured options, sync with isready.
    // Throws SpawnError or HandshakeError; the process is gone on failure.
    void start();

    // quit, grace period, then SIGKILL. Idempotent, never throws.
    void stop();

    HandshakeState state() const { return m_state.load(); }
    bool isReady() const { return state() == HandshakeState::Ready; }

    // Search for timeMs; returns whatever was reached by timeMs + slack.
    AnalysisResult analyze(const std::string &fen, std::optional<int> timeMs = std::nullopt);

    // No fen -> startpos.
    void setPosition(const std::optional<std::string> &fen,
                     const std::vector<std::string> &moves = {});

    // Searches the current position. "(none)" when the engine has no move.
    std::string getBestMove(std::optional<int> timeMs = std::nullopt);

    void newGame();

    EngineId getEngineId() const;
    std::map<std::string, UciOption> getAvailableOptions() const;
    OptionUpdate setOptions(const OptionList &values);
    OptionValues getCurrentOptionValues() const;

    // Types raw text by the option's advertised metadata.
    UciValue coerceOptionValue(const std::string &name, const std::string &text) const;

    const config::BridgeConfig &config() const { return m_cfg; }

    // True if the last stop() had to SIGKILL the engine.
    bool forcedTermination() const { return m_forcedKill.load(); }

  private:
    using Clock = std::chrono::steady_clock;

    void requireReady(const char *op) const;
    void send(const std::string &line);
    std::string readLineOrThrow(Clock::time_point deadline, const char *phase);
    [[noreturn]] void channelClosed(const char *phase);

    uci::HandshakeAccumulator awaitUciOk(Clock::time_point deadline);
    void syncReady(Clock::time_point deadline);
    void applyConfiguredOptions();
    void settlePendingSearch(Clock::time_point notAfter = Clock::time_point::max());

    void abortStart(std::uint64_t generation, const char *why);
    void teardown();

    config::BridgeConfig m_cfg;
    Logger m_log;

    std::mutex m_lifecycleMtx;  // start/stop
    mutable std::mutex m_opMtx; // one protocol operation in flight

    std::atomic<HandshakeState> m_state{HandshakeState::Uninitialized};
    std::atomic_bool m_forcedKill{false};

    std::unique_ptr<EngineProcess> m_process;
    std::unique_ptr<LineChannel> m_out;
    std::unique_ptr<LineChannel> m_err;

    EngineId m_id;
    OptionRegistry m_options;

    // A timed-out search whose bestmove has not been read yet.
    bool m_searchPending{false};

    // Bumped per spawned process; written under both mutexes.
    std::uint64_t m_generation{0};
  };

} // namespace ucibridge::engine
