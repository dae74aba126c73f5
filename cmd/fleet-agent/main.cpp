#include <csignal>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/reactor/event_loop.hpp"
#include "internal/runtime/agent.hpp"
#include "internal/util/errors.hpp"

using fleet::runtime::Agent;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  fleet::config::CommandLineOptions options;
  try {
    options = fleet::config::ParseCommandLine(argc, argv);
  } catch (const fleet::util::ConfigError& e) {
    std::cerr << e.what() << "\n" << fleet::config::Usage();
    return 1;
  }

  if (options.help) {
    std::cout << fleet::config::Usage();
    return 0;
  }

  // ------------------------------------------------------------
  // Load configuration
  // ------------------------------------------------------------
  fleet::runtime::config::RuntimeConfig config;
  try {
    config = fleet::config::ConfigLoader::Load(options);
  } catch (const fleet::util::ConfigError& e) {
    std::cerr << "fleet-agent: " << e.what() << "\n";
    return 1;
  }

  try {
    fleet::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build agent (dependency graph)
    // ------------------------------------------------------------
    fleet::reactor::EventLoop loop;
    Agent                     agent(config, loop);

    // Register signal handlers before starting the loop to avoid a race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    // the loop thread polls the flag; handlers must stay async-signal-safe
    loop.CallEvery(std::chrono::milliseconds(500), [&loop] {
      if (!g_running) loop.Stop();
    });

    agent.Start();

    loop.Run();

    FLEET_LOG_INFO("Shutting down fleet agent");

    agent.Stop();
    fleet::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    FLEET_LOG_ERROR("Fatal error", {fleet::observability::StringField("error", e.what())});
    fleet::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
