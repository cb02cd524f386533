/**
 * @file agent_link_demo.cpp
 * @brief Runs the host agent handshake until the agent is ready or the
 *        process is interrupted.
 *
 * Usage: agent_link_demo [config.ini|config.json]
 *
 * Demonstrates:
 *   - Loading LinkOptions from a config file and the environment
 *   - Creating a HostAgentLink with the production collaborators
 *   - Observing state changes and the settings applied from the agent
 */

#include "hostlink/agent_link.hpp"
#include "hostlink/announce.hpp"
#include "hostlink/link_config.hpp"
#include "hostlink/log.hpp"
#include "hostlink/process_identity.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <thread>

static std::atomic<bool> g_stop{false};

static void OnSignal(int) { g_stop.store(true); }

static void OnStateChange(hostlink::ProtocolState from,
                          hostlink::ProtocolState to, void*) {
  printf("  state: %s -> %s\n", hostlink::ProtocolStateName(from),
         hostlink::ProtocolStateName(to));
}

// -- Options ----------------------------------------------------------------

static bool LoadOptions(int argc, char** argv, hostlink::LinkOptions& opts) {
  if (argc < 2) {
    hostlink::ApplyEnvironment(opts);
    return true;
  }
#if defined(HOSTLINK_CONFIG_INI_ENABLED) || defined(HOSTLINK_CONFIG_JSON_ENABLED)
  auto loaded = hostlink::LoadLinkOptions(argv[1]);
  if (!loaded.has_value()) {
    return false;
  }
  opts = loaded.value();
  return true;
#else
  HOSTLINK_LOG_ERROR("Demo", "built without a config backend, cannot read %s",
                     argv[1]);
  return false;
#endif
}

int main(int argc, char** argv) {
  hostlink::log::Init();
  hostlink::log::SetLevel(hostlink::log::Level::kDebug);
  hostlink::SetProgramArguments(argc, argv);

  hostlink::LinkOptions opts;
  if (!LoadOptions(argc, argv, opts)) {
    hostlink::log::Shutdown();
    return 1;
  }
  printf("=== Host Agent Link Demo ===\n");
  printf("agent %s:%u, retry every %u ms, budget %d\n\n", opts.host.c_str(),
         opts.port, opts.retry_period_ms, opts.max_retries);

  std::signal(SIGINT, OnSignal);
  std::signal(SIGTERM, OnSignal);

  hostlink::SettingsStore settings;
  auto link = hostlink::HostAgentLink::Create(
      opts, &hostlink::SettingsStore::Apply, &settings);
  link->SetStateChangeCallback(&OnStateChange, nullptr);
  if (!link->Start()) {
    HOSTLINK_LOG_ERROR("Demo", "link did not start");
    hostlink::log::Shutdown();
    return 1;
  }

  while (!g_stop.load() && !link->IsReady()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  if (link->IsReady()) {
    const hostlink::AgentSettings s = settings.Snapshot();
    printf("\nready via %s (epoch %llu)\n", link->CandidateHost().c_str(),
           static_cast<unsigned long long>(link->Epoch()));
    printf("  entity id : %s\n", s.entity_id.c_str());
    printf("  host id   : %s\n", s.host_id.c_str());
    printf("  secrets   : %s (%zu patterns)\n", s.secrets_matcher.c_str(),
           s.secrets_list.size());
    printf("  headers   : %zu\n", s.extra_http_headers.size());
  } else {
    printf("\ninterrupted in state %s\n", link->StateName());
  }

  link->Stop();
  hostlink::log::Shutdown();
  return 0;
}
