/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file agent_link.hpp
 * @brief Discovery, announce and readiness handshake with the host agent.
 *
 * State machine:
 *
 *   none --init--> init --lookup--> unannounced --announce--> announced
 *                   ^                    |                        |
 *                   +------- init -------+-----------init---------+--test--> ready
 *                   (also from ready, on Reset())
 *
 * Entering a state launches its step on the executor's workers:
 * - init:        host lookup (configured/last host, then default gateway)
 * - unannounced: announce this process to the agent
 * - announced:   readiness test against the agent's data endpoint
 *
 * Completions return to the strand. A failed announce or readiness test
 * consumes one unit of the retry budget and is retried after the retry
 * period; an exhausted budget falls back to init. Lookup retries forever
 * without touching the budget.
 *
 * Every accepted transition bumps an epoch. Completions and retry timers
 * carry the epoch they were launched in and are dropped if it moved on.
 */

#ifndef HOSTLINK_AGENT_LINK_HPP_
#define HOSTLINK_AGENT_LINK_HPP_

#include "hostlink/announce.hpp"
#include "hostlink/executor.hpp"
#include "hostlink/fsm.hpp"
#include "hostlink/gateway.hpp"
#include "hostlink/link_config.hpp"
#include "hostlink/log.hpp"
#include "hostlink/process_identity.hpp"
#include "hostlink/transport.hpp"
#include "hostlink/vocabulary.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace hostlink {

// ============================================================================
// States / Events
// ============================================================================

enum class ProtocolState : uint8_t {
  kNone = 0,
  kInit,
  kUnannounced,
  kAnnounced,
  kReady,
};

inline const char* ProtocolStateName(ProtocolState state) noexcept {
  switch (state) {
    case ProtocolState::kNone:        return "none";
    case ProtocolState::kInit:        return "init";
    case ProtocolState::kUnannounced: return "unannounced";
    case ProtocolState::kAnnounced:   return "announced";
    case ProtocolState::kReady:       return "ready";
  }
  return "?";
}

enum LinkEvent : uint32_t {
  kEvtInit = 1,
  kEvtLookup = 2,
  kEvtAnnounce = 3,
  kEvtTest = 4,
};

inline const char* LinkEventName(uint32_t event) noexcept {
  switch (event) {
    case kEvtInit:     return "init";
    case kEvtLookup:   return "lookup";
    case kEvtAnnounce: return "announce";
    case kEvtTest:     return "test";
    default:           return "?";
  }
}

/// Invoked on the strand after every accepted transition.
using StateChangeFn = void (*)(ProtocolState from, ProtocolState to,
                               void* ctx);

/**
 * @brief Non-owning collaborator set. All pointers must outlive the link.
 */
struct LinkCollaborators {
  AgentTransport* transport = nullptr;
  GatewayResolver* gateway = nullptr;
  ProcessMetadataSource* metadata = nullptr;
  Executor* executor = nullptr;
  SettingsApplyFn apply_settings = nullptr;  ///< Optional.
  void* settings_ctx = nullptr;
};

// ============================================================================
// HostAgentLink
// ============================================================================

/**
 * @brief Owns one discovery cycle state machine and its retry policy.
 *
 * Usage:
 * @code
 *   hostlink::SettingsStore settings;
 *   auto link = hostlink::HostAgentLink::Create(
 *       opts, &hostlink::SettingsStore::Apply, &settings);
 *   link->Start();
 *   ...
 *   if (link->IsReady()) { ... }
 *   link->Stop();
 * @endcode
 *
 * Public methods are thread-safe. Stop() must not be called from a
 * callback running on the link's executor.
 */
class HostAgentLink final {
 public:
  HostAgentLink(const LinkOptions& opts, const LinkCollaborators& deps) noexcept
      : opts_(opts), deps_(deps), sm_(*this) {
    HOSTLINK_ASSERT(deps_.transport != nullptr);
    HOSTLINK_ASSERT(deps_.gateway != nullptr);
    HOSTLINK_ASSERT(deps_.metadata != nullptr);
    HOSTLINK_ASSERT(deps_.executor != nullptr);
    if (opts_.max_retries < 1) {
      opts_.max_retries = 1;
    }
    retries_.store(opts_.max_retries, std::memory_order_relaxed);
    candidate_host_ = opts_.host.c_str();
    BuildStateMachine();
  }

  ~HostAgentLink() { Stop(); }

  HostAgentLink(const HostAgentLink&) = delete;
  HostAgentLink& operator=(const HostAgentLink&) = delete;

  /**
   * @brief Link wired to the production collaborators: HTTP transport,
   *        /proc/net/route gateway lookup, procfs metadata and a threaded
   *        executor. The link owns all of them.
   */
  static std::unique_ptr<HostAgentLink> Create(
      const LinkOptions& opts, SettingsApplyFn apply_settings = nullptr,
      void* settings_ctx = nullptr) {
    auto owned = std::make_unique<Owned>(opts);
    LinkCollaborators deps;
    deps.transport = &owned->transport;
    deps.gateway = &owned->gateway;
    deps.metadata = &owned->metadata;
    deps.executor = &owned->executor;
    deps.apply_settings = apply_settings;
    deps.settings_ctx = settings_ctx;
    auto link = std::make_unique<HostAgentLink>(opts, deps);
    link->owned_ = static_cast<std::unique_ptr<Owned>&&>(owned);
    return link;
  }

  /** @brief Call before Start(). */
  void SetStateChangeCallback(StateChangeFn fn, void* ctx) noexcept {
    HOSTLINK_ASSERT(!started_.load(std::memory_order_acquire));
    on_change_ = fn;
    on_change_ctx_ = ctx;
  }

  // ==========================================================================
  // Lifecycle
  // ==========================================================================

  /**
   * @brief Fire the first init event.
   * @return false if already started or the executor is shut down.
   */
  bool Start() noexcept {
    if (started_.exchange(true, std::memory_order_acq_rel)) {
      return false;
    }
    HOSTLINK_LOG_INFO("Link", "starting host agent discovery at %s:%u",
                      opts_.host.c_str(), opts_.port);
    return Post([this] { FireEvent(kEvtInit); });
  }

  /**
   * @brief Restart discovery from init with a full retry budget.
   *
   * In state init only the budget is reset; the running lookup continues,
   * or resumes if it was parked for lack of a retry timer.
   */
  bool Reset() noexcept {
    return Post([this] {
      retries_.store(opts_.max_retries, std::memory_order_relaxed);
      if (lookup_parked_ && State() == ProtocolState::kInit) {
        HOSTLINK_LOG_INFO("Link", "resuming parked host lookup");
        lookup_parked_ = false;
        LookupHost();
        return;
      }
      FireEvent(kEvtInit);
    });
  }

  /** @brief Shut the executor down. Idempotent. */
  void Stop() noexcept {
    if (stopped_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    deps_.executor->Shutdown();
  }

  // ==========================================================================
  // Query
  // ==========================================================================

  ProtocolState State() const noexcept {
    return static_cast<ProtocolState>(state_.load(std::memory_order_acquire));
  }

  const char* StateName() const noexcept { return ProtocolStateName(State()); }

  bool IsReady() const noexcept { return State() == ProtocolState::kReady; }

  int32_t RetriesLeft() const noexcept {
    return retries_.load(std::memory_order_acquire);
  }

  std::string CandidateHost() const {
    std::lock_guard<std::mutex> lock(host_mutex_);
    return candidate_host_;
  }

  /** @brief Transition counter; changes on every accepted event. */
  uint64_t Epoch() const noexcept {
    return epoch_.load(std::memory_order_acquire);
  }

  const LinkOptions& Options() const noexcept { return opts_; }

 private:
  using Machine = StateMachine<HostAgentLink, 5, 4>;
  using Step = void (HostAgentLink::*)();

  /** Production collaborators owned by links built with Create(). */
  struct Owned {
    explicit Owned(const LinkOptions& opts)
        : transport(MakeTransportConfig(opts)),
          metadata(std::string(opts.proc_root.c_str())) {}

    HttpTransport transport;
    RouteTableGatewayResolver gateway;
    ProcfsMetadataSource metadata;
    ThreadedExecutor executor;
  };

  static HttpTransportConfig MakeTransportConfig(const LinkOptions& opts) {
    HttpTransportConfig cfg;
    cfg.timeout_ms = opts.timeout_ms;
    return cfg;
  }

  // --------------------------------------------------------------------------
  // State machine wiring
  // --------------------------------------------------------------------------

  void BuildStateMachine() noexcept {
    const int32_t none = sm_.AddState({"none", nullptr});
    const int32_t init = sm_.AddState({"init", &HostAgentLink::EnterInit});
    const int32_t unannounced =
        sm_.AddState({"unannounced", &HostAgentLink::EnterUnannounced});
    const int32_t announced =
        sm_.AddState({"announced", &HostAgentLink::EnterAnnounced});
    const int32_t ready = sm_.AddState({"ready", nullptr});
    HOSTLINK_ASSERT(ready == static_cast<int32_t>(ProtocolState::kReady));

    (void)sm_.AddTransition(kEvtInit,
                            Machine::StateBit(none) |
                                Machine::StateBit(unannounced) |
                                Machine::StateBit(announced) |
                                Machine::StateBit(ready),
                            init);
    (void)sm_.AddTransition(kEvtLookup, Machine::StateBit(init), unannounced);
    (void)sm_.AddTransition(kEvtAnnounce, Machine::StateBit(unannounced),
                            announced);
    (void)sm_.AddTransition(kEvtTest, Machine::StateBit(announced), ready);

    sm_.SetTransitionHook(&HostAgentLink::OnTransition);
    sm_.SetInitialState(none);
    sm_.Start();
  }

  static void OnTransition(HostAgentLink& self, int32_t from, int32_t to,
                           uint32_t event) {
    self.epoch_.fetch_add(1U, std::memory_order_acq_rel);
    self.state_.store(static_cast<uint8_t>(to), std::memory_order_release);
    const auto old_state = static_cast<ProtocolState>(from);
    const auto new_state = static_cast<ProtocolState>(to);
    HOSTLINK_LOG_DEBUG("Link", "%s --%s--> %s", ProtocolStateName(old_state),
                       LinkEventName(event), ProtocolStateName(new_state));
    if (self.on_change_ != nullptr) {
      self.on_change_(old_state, new_state, self.on_change_ctx_);
    }
  }

  static void EnterInit(HostAgentLink& self) {
    self.retries_.store(self.opts_.max_retries, std::memory_order_release);
    self.lookup_parked_ = false;
    self.LookupHost();
  }

  static void EnterUnannounced(HostAgentLink& self) { self.Announce(); }

  static void EnterAnnounced(HostAgentLink& self) { self.TestReadiness(); }

  /** Strand only. */
  void FireEvent(LinkEvent event) {
    auto r = sm_.Fire(event);
    if (!r.has_value()) {
      HOSTLINK_LOG_DEBUG("Link", "event %s ignored in state %s: %s",
                         LinkEventName(event), sm_.CurrentStateName(),
                         FsmErrorToString(r.get_error()));
    }
  }

  // --------------------------------------------------------------------------
  // Executor helpers
  // --------------------------------------------------------------------------

  bool Post(Task task) noexcept {
    if (!deps_.executor->Dispatch(static_cast<Task&&>(task))) {
      HOSTLINK_LOG_WARN("Link", "executor rejected strand task");
      return false;
    }
    return true;
  }

  void Spawn(Task task) noexcept {
    if (!deps_.executor->Submit(static_cast<Task&&>(task))) {
      HOSTLINK_LOG_WARN("Link", "executor rejected worker task");
    }
  }

  /** Strand only. True (and logged) if @p epoch is no longer current. */
  bool IsStale(uint64_t epoch, const char* what) const noexcept {
    if (epoch == epoch_.load(std::memory_order_acquire)) {
      return false;
    }
    HOSTLINK_LOG_DEBUG("Link", "discarding stale %s (epoch %llu, now %llu)",
                       what, static_cast<unsigned long long>(epoch),
                       static_cast<unsigned long long>(
                           epoch_.load(std::memory_order_acquire)));
    return true;
  }

  /**
   * Strand only. Re-run @p step after the retry period unless the epoch
   * moved on.
   *
   * If the timer cannot be armed while running (all timer slots held by
   * superseded retries), announce and readiness fall back to init. A lookup
   * has nothing to fall back to: it is parked until Reset().
   */
  void ScheduleRetry(uint64_t epoch, Step step) {
    const bool armed = deps_.executor->ScheduleAfter(
        opts_.retry_period_ms, [this, epoch, step] {
          if (!IsStale(epoch, "retry")) {
            (this->*step)();
          }
        });
    if (armed) {
      return;
    }
    if (stopped_.load(std::memory_order_acquire)) {
      HOSTLINK_LOG_DEBUG("Link", "link stopped, retry not armed");
      return;
    }
    if (step == &HostAgentLink::LookupHost) {
      HOSTLINK_LOG_ERROR("Link", "cannot arm lookup retry timer, lookup "
                                 "parked until Reset()");
      lookup_parked_ = true;
      return;
    }
    HOSTLINK_LOG_ERROR("Link", "cannot arm retry timer in %s, restarting "
                               "discovery", sm_.CurrentStateName());
    FireEvent(kEvtInit);
  }

  /**
   * Strand only. Spend one unit of budget for a failed step: retry it, or
   * fall back to init once the budget is gone.
   */
  void ConsumeRetry(uint64_t epoch, Step step) {
    const int32_t left = retries_.load(std::memory_order_acquire) - 1;
    retries_.store(left > 0 ? left : 0, std::memory_order_release);
    if (left <= 0) {
      HOSTLINK_LOG_INFO("Link", "retry budget exhausted in %s, restarting "
                                "discovery", sm_.CurrentStateName());
      FireEvent(kEvtInit);
      return;
    }
    ScheduleRetry(epoch, step);
  }

  std::string Url(const std::string& host, const char* path) const {
    return BuildUrl(host.c_str(), opts_.port, path);
  }

  /** Worker thread. */
  bool ProbeHost(const std::string& host) {
    HOSTLINK_LOG_DEBUG("Lookup", "checking host %s", host.c_str());
    auto header = deps_.transport->HeaderProbe(
        Url(host, "/"), "GET", opts_.identity_header.c_str());
    if (!header.has_value()) {
      HOSTLINK_LOG_DEBUG("Lookup", "probe of %s failed: %s", host.c_str(),
                         TransportErrorToString(header.get_error()));
      return false;
    }
    return opts_.identity_value == header.value().c_str();
  }

  // --------------------------------------------------------------------------
  // Host lookup
  // --------------------------------------------------------------------------

  void LookupHost() {
    const uint64_t epoch = epoch_.load(std::memory_order_acquire);
    std::string host = CandidateHost();
    Spawn([this, epoch, host] {
      if (ProbeHost(host)) {
        FinishLookup(epoch, host);
        return;
      }

      auto gateway = deps_.gateway->DefaultGateway(opts_.route_table.c_str());
      if (!gateway.has_value()) {
        HOSTLINK_LOG_ERROR("Lookup", "failed to fetch the default gateway (%s), "
                                     "scheduling retry",
                           GatewayErrorToString(gateway.get_error()));
        FinishLookup(epoch, std::string());
        return;
      }
      if (gateway.value().empty()) {
        HOSTLINK_LOG_ERROR("Lookup", "default gateway not available, "
                                     "scheduling retry");
        FinishLookup(epoch, std::string());
        return;
      }
      if (ProbeHost(gateway.value())) {
        FinishLookup(epoch, gateway.value());
        return;
      }
      HOSTLINK_LOG_ERROR("Lookup", "cannot reach the agent at %s or gateway %s, "
                                   "scheduling retry",
                         host.c_str(), gateway.value().c_str());
      FinishLookup(epoch, std::string());
    });
  }

  /** Worker thread. Empty @p found_host means the lookup failed. */
  void FinishLookup(uint64_t epoch, std::string found_host) {
    (void)Post([this, epoch, found_host] {
      if (IsStale(epoch, "lookup")) {
        return;
      }
      if (found_host.empty()) {
        ScheduleRetry(epoch, &HostAgentLink::LookupHost);
        return;
      }
      HOSTLINK_LOG_DEBUG("Lookup", "agent lookup success %s",
                         found_host.c_str());
      {
        std::lock_guard<std::mutex> lock(host_mutex_);
        candidate_host_ = found_host;
      }
      retries_.store(opts_.max_retries, std::memory_order_release);
      FireEvent(kEvtLookup);
    });
  }

  // --------------------------------------------------------------------------
  // Announce
  // --------------------------------------------------------------------------

  void Announce() {
    const uint64_t epoch = epoch_.load(std::memory_order_acquire);
    std::string host = CandidateHost();
    HOSTLINK_LOG_DEBUG("Announce", "announcing to the agent at %s",
                       host.c_str());
    Spawn([this, epoch, host] {
      std::unique_ptr<AnnounceResponse> result;
      {
        // The correlation socket stays open until the exchange completes.
        ProcessIdentity identity = BuildProcessIdentity(
            *deps_.metadata, host, opts_.port, opts_.timeout_ms);
        auto reply = deps_.transport->Exchange(
            Url(host, opts_.discovery_path.c_str()), "PUT",
            EncodeIdentity(identity.info));
        if (!reply.has_value()) {
          HOSTLINK_LOG_DEBUG("Announce", "announce request failed: %s",
                             TransportErrorToString(reply.get_error()));
        } else {
          auto decoded = DecodeAnnounceResponse(reply.value().body);
          if (decoded.has_value()) {
            result = std::make_unique<AnnounceResponse>(
                static_cast<AnnounceResponse&&>(decoded.value()));
          } else {
            HOSTLINK_LOG_DEBUG("Announce", "unusable announce response: %s",
                               AnnounceErrorToString(decoded.get_error()));
          }
        }
      }
      (void)Post([this, epoch, resp = static_cast<
                                   std::unique_ptr<AnnounceResponse>&&>(
                                   result)]() mutable {
        FinishAnnounce(epoch, static_cast<std::unique_ptr<AnnounceResponse>&&>(
                                  resp));
      });
    });
  }

  /** Worker thread. Falls back to a pid-only payload if encoding throws. */
  static std::string EncodeIdentity(const DiscoveryInfo& info) {
#if defined(__cpp_exceptions)
    try {
      return EncodeDiscoveryInfo(info);
    } catch (const nlohmann::json::exception& e) {
      HOSTLINK_LOG_ERROR("Announce", "cannot encode process identity (%s), "
                                     "announcing pid only", e.what());
    }
    DiscoveryInfo partial;
    partial.pid = info.pid;
    return EncodeDiscoveryInfo(partial);
#else
    return EncodeDiscoveryInfo(info);
#endif
  }

  /** Strand. nullptr @p resp means the announce failed. */
  void FinishAnnounce(uint64_t epoch, std::unique_ptr<AnnounceResponse> resp) {
    if (IsStale(epoch, "announce")) {
      return;
    }
    if (!resp) {
      HOSTLINK_LOG_ERROR("Announce", "cannot announce sensor, scheduling retry");
      ConsumeRetry(epoch, &HostAgentLink::Announce);
      return;
    }
    HOSTLINK_LOG_INFO("Announce",
                      "Host agent available. We're in business. Announced "
                      "pid: %u",
                      resp->pid);
    if (deps_.apply_settings != nullptr) {
      deps_.apply_settings(*resp, deps_.settings_ctx);
    }
    retries_.store(opts_.max_retries, std::memory_order_release);
    FireEvent(kEvtAnnounce);
  }

  // --------------------------------------------------------------------------
  // Readiness
  // --------------------------------------------------------------------------

  void TestReadiness() {
    const uint64_t epoch = epoch_.load(std::memory_order_acquire);
    std::string host = CandidateHost();
    HOSTLINK_LOG_DEBUG("Ready", "testing communication with the agent");
    Spawn([this, epoch, host] {
      auto probe = deps_.transport->HeadProbe(
          Url(host, opts_.readiness_path.c_str()));
      const bool ok = probe.has_value();
      if (!ok) {
        HOSTLINK_LOG_DEBUG("Ready", "readiness probe failed: %s",
                           TransportErrorToString(probe.get_error()));
      }
      (void)Post([this, epoch, ok] { FinishReadiness(epoch, ok); });
    });
  }

  void FinishReadiness(uint64_t epoch, bool ok) {
    if (IsStale(epoch, "readiness test")) {
      return;
    }
    if (!ok) {
      HOSTLINK_LOG_DEBUG("Ready", "agent is not yet ready, scheduling retry");
      ConsumeRetry(epoch, &HostAgentLink::TestReadiness);
      return;
    }
    retries_.store(opts_.max_retries, std::memory_order_release);
    FireEvent(kEvtTest);
  }

  // --------------------------------------------------------------------------
  // Data members
  // --------------------------------------------------------------------------

  LinkOptions opts_;
  LinkCollaborators deps_;
  std::unique_ptr<Owned> owned_;
  Machine sm_;  ///< Strand only.

  std::atomic<uint8_t> state_{static_cast<uint8_t>(ProtocolState::kNone)};
  std::atomic<int32_t> retries_{0};
  std::atomic<uint64_t> epoch_{0U};
  std::atomic<bool> started_{false};
  std::atomic<bool> stopped_{false};

  bool lookup_parked_ = false;  ///< Strand only.

  mutable std::mutex host_mutex_;
  std::string candidate_host_;

  StateChangeFn on_change_ = nullptr;
  void* on_change_ctx_ = nullptr;
};

}  // namespace hostlink

#endif  // HOSTLINK_AGENT_LINK_HPP_
