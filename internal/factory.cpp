#include "factory.hpp"

#include <filesystem>
#include <system_error>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/exchange/grpc_transport.hpp"
#include "internal/observability/logging.hpp"
#include "internal/plugin/exchange_sink.hpp"
#include "internal/plugin/plugin_factory.hpp"
#include "internal/util/time.hpp"

namespace fleet::factory {

using fleet::observability::StringField;

namespace {

void EnsureParentDirectory(const std::filesystem::path& file) {
  if (!file.has_parent_path()) return;
  std::error_code ec;
  std::filesystem::create_directories(file.parent_path(), ec);
  if (ec) {
    FLEET_LOG_WARN("Cannot create data directory", {StringField("path", file.parent_path().string()), StringField("error", ec.message())});
  }
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const fleet::runtime::config::RuntimeConfig& config) {
  const auto& store = config.message_store();
  if (store.has_sqlite() && !store.sqlite().path().empty()) {
    EnsureParentDirectory(store.sqlite().path());
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(store.sqlite().path());
    db::sqlite::BootstrapSchema(*sqlite_db);
    FLEET_LOG_INFO("Message store opened", {StringField("backend", "sqlite"), StringField("path", store.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  FLEET_LOG_WARN("Message store is in memory; queued messages will not survive a restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full agent dependency graph
*/
Application Build(const fleet::runtime::config::RuntimeConfig& config,
                  reactor::Reactor&                           reactor,
                  std::unique_ptr<exchange::Transport>        transport) {
  Application app;

  // ------------------------------------------------------------------
  // Persisted state
  // ------------------------------------------------------------------
  if (!config.persist().path().empty()) EnsureParentDirectory(config.persist().path());
  app.persist        = std::make_unique<persist::Persist>(config.persist().path());
  app.persist_status = app.persist->Load();

  // ------------------------------------------------------------------
  // Stores
  // ------------------------------------------------------------------
  app.repository    = BuildRepository(config);
  app.message_store = std::make_unique<store::MessageStore>(app.repository, app.persist->RootAt("message-store"));
  app.message_store->Load();

  app.exchange_store = std::make_unique<exchange::ExchangeStore>(app.repository);
  app.identity       = std::make_unique<registration::Identity>(app.persist->RootAt("registration"), config.client());

  // ------------------------------------------------------------------
  // Exchange
  // ------------------------------------------------------------------
  if (!transport) {
    const auto deadline = util::FromProtoOr(config.transport().deadline(), std::chrono::seconds(60));
    transport = std::make_unique<exchange::GrpcTransport>(exchange::GrpcTransport::MakeChannel(config.transport()), deadline);
  }
  app.transport = std::move(transport);

  app.exchange = std::make_unique<exchange::MessageExchange>(reactor,
                                                             *app.message_store,
                                                             *app.exchange_store,
                                                             *app.identity,
                                                             *app.transport,
                                                             exchange::ExchangeSettings::FromConfig(config.exchange()),
                                                             app.persist->RootAt("exchange"));

  const std::filesystem::path root = config.monitor().root_path().empty() ? "/" : config.monitor().root_path();
  app.registration = std::make_unique<registration::RegistrationHandler>(reactor, *app.exchange, *app.identity, root);

  // ------------------------------------------------------------------
  // Monitor plugins
  // ------------------------------------------------------------------
  app.sink    = std::make_unique<plugin::ExchangeSink>(*app.exchange, *app.message_store);
  app.plugins = std::make_unique<plugin::PluginRegistry>(reactor, *app.sink, *app.persist, config);

  std::vector<std::string> names(config.monitor().plugins().begin(), config.monitor().plugins().end());
  if (names.empty()) names.push_back("ALL");
  for (auto& p : plugin::CreatePlugins(names)) app.plugins->Add(std::move(p));

  return app;
}

} // namespace fleet::factory
