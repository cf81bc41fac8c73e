#include "vaulttrade/config/ServerConfig.hpp"
#include "vaulttrade/controller/ContainerAdminController.hpp"
#include "vaulttrade/controller/LedgerAdminController.hpp"
#include "vaulttrade/controller/LedgerRpcController.hpp"
#include "vaulttrade/controller/TradeAdminController.hpp"
#include "vaulttrade/controller/TradeRpcController.hpp"
#include "vaulttrade/inventory/ContainerRegistry.hpp"
#include "vaulttrade/inventory/InventoryMover.hpp"
#include "vaulttrade/repository/AuditLog.hpp"
#include "vaulttrade/repository/MySqlConnectionPool.hpp"
#include "vaulttrade/repository/MySqlSnapshotStore.hpp"
#include "vaulttrade/repository/SnapshotStore.hpp"
#include "vaulttrade/repository/StateRepository.hpp"
#include "vaulttrade/rpc/HttpRpcChannel.hpp"
#include "vaulttrade/rpc/LocalRpcChannel.hpp"
#include "vaulttrade/server/HttpServer.hpp"
#include "vaulttrade/server/Router.hpp"
#include "vaulttrade/service/CatalogService.hpp"
#include "vaulttrade/service/LedgerClient.hpp"
#include "vaulttrade/service/LedgerService.hpp"
#include "vaulttrade/service/ListingService.hpp"
#include "vaulttrade/service/PricingEngine.hpp"
#include "vaulttrade/service/SessionService.hpp"
#include "vaulttrade/service/VaultService.hpp"
#include "vaulttrade/util/HttpClient.hpp"
#include "vaulttrade/util/Logging.hpp"
#include "vaulttrade/workflow/SettlementWorkflow.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <filesystem>
#include <iomanip>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <utility>

namespace {

using namespace vaulttrade;

struct BankNode {
    BankNode(repository::SnapshotStore& store,
             const std::filesystem::path& auditPath,
             const inventory::InventoryMover& mover,
             const config::ServerConfig& config)
        : repo(store)
        , state(repo.load())
        , audit(auditPath)
        , ledger(state, repo, audit)
        , catalog(state, repo, audit)
        , pricing(state.catalog)
        , vault(state, ledger, mover, pricing, audit)
        , rpcController(ledger, vault, config.ledgerChannel, config.peerKey)
        , adminController(ledger, catalog, vault, audit, config.adminToken) {}

    repository::BankRepository repo;
    model::BankState state;
    repository::AuditLog audit;
    service::LedgerService ledger;
    service::CatalogService catalog;
    service::PricingEngine pricing;
    service::VaultService vault;
    controller::LedgerRpcController rpcController;
    controller::LedgerAdminController adminController;
};

struct TradeNode {
    TradeNode(repository::SnapshotStore& store,
              const std::filesystem::path& auditPath,
              const inventory::InventoryMover& mover,
              std::unique_ptr<rpc::RpcChannel> ledgerChannel,
              const service::PricingEngine* pricing,
              const config::ServerConfig& config)
        : repo(store)
        , state(repo.load())
        , audit(auditPath)
        , listings(state, repo, audit, mover)
        , sessions(config.sessionTtl)
        , channel(std::move(ledgerChannel))
        , ledger(*channel, config.peerKey, config.rpcTimeout)
        , settlement(listings, ledger, audit, pricing, config.chargeRetries)
        , rpcController(listings, settlement, sessions, ledger, config.tradeChannel)
        , adminController(listings, audit, config.adminToken) {}

    repository::TradeRepository repo;
    model::TradeState state;
    repository::AuditLog audit;
    service::ListingService listings;
    service::SessionService sessions;
    std::unique_ptr<rpc::RpcChannel> channel;
    service::LedgerClient ledger;
    workflow::SettlementWorkflow settlement;
    controller::TradeRpcController rpcController;
    controller::TradeAdminController adminController;
};

std::unique_ptr<repository::SnapshotStore> makeStore(const config::ServerConfig& config,
                                                     repository::MySqlConnectionPool* pool,
                                                     const std::string& name) {
    if (config.storage == config::StorageBackend::mysql) {
        return std::make_unique<repository::MySqlSnapshotStore>(*pool, name);
    }
    return std::make_unique<repository::JsonFileSnapshotStore>(config.dataDirectory / (name + ".json"));
}

// Trust between the two halves of an `all` node when no peerKey is configured.
std::string generatePeerKey() {
    std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << std::hex;
    for (int i = 0; i < 4; ++i) {
        oss << std::setw(16) << std::setfill('0') << rng();
    }
    return oss.str();
}

int run(config::ServerConfig config) {
    std::filesystem::create_directories(config.dataDirectory);
    if (config.role == config::Role::all && config.peerKey.empty()) {
        config.peerKey = generatePeerKey();
        util::log(util::LogLevel::debug, "Generated in-process peer key for the local ledger channel");
    }

    std::unique_ptr<repository::MySqlConnectionPool> connectionPool;
    if (config.storage == config::StorageBackend::mysql) {
        util::log(util::LogLevel::info, "Connecting to MySQL at " + config.database.host + ":" +
                                            std::to_string(config.database.port) + "/" + config.database.database);
        connectionPool = std::make_unique<repository::MySqlConnectionPool>(config.database);
    }

    inventory::ContainerRegistry registry;
    auto containerStore = makeStore(config, connectionPool.get(), "containers");
    if (auto saved = containerStore->load(); saved && saved->is_array()) {
        registry.restore(saved->as_array());
    } else {
        registry.restore(config.containers);
    }
    inventory::InventoryMover mover{registry};

    auto router = std::make_shared<server::Router>();

    std::unique_ptr<repository::SnapshotStore> bankStore;
    std::unique_ptr<BankNode> bank;
    if (config.servesBank()) {
        bankStore = makeStore(config, connectionPool.get(), "bank");
        bank = std::make_unique<BankNode>(*bankStore, config.dataDirectory / "bank-audit.jsonl", mover, config);
        bank->rpcController.registerRoutes(*router);
        bank->adminController.registerRoutes(*router);
        util::log(util::LogLevel::info, "Ledger loaded from " + bankStore->describe() + " with " +
                                            std::to_string(bank->state.accounts.size()) + " accounts");
    }

    util::HttpClient httpClient;
    std::unique_ptr<repository::SnapshotStore> tradeStore;
    std::unique_ptr<TradeNode> trade;
    if (config.servesTrade()) {
        std::unique_ptr<rpc::RpcChannel> channel;
        const service::PricingEngine* pricing = nullptr;
        if (bank) {
            channel = std::make_unique<rpc::LocalRpcChannel>(config.ledgerChannel, bank->rpcController);
            pricing = &bank->pricing;
        } else {
            channel = std::make_unique<rpc::HttpRpcChannel>(config.ledgerChannel, httpClient,
                                                            config.bankUrl + "/rpc/ledger");
            util::log(util::LogLevel::info, "Ledger reached at " + config.bankUrl);
        }
        tradeStore = makeStore(config, connectionPool.get(), "trade");
        trade = std::make_unique<TradeNode>(*tradeStore, config.dataDirectory / "trade-audit.jsonl", mover,
                                            std::move(channel), pricing, config);
        trade->rpcController.registerRoutes(*router);
        trade->adminController.registerRoutes(*router);
        util::log(util::LogLevel::info, "Listings loaded from " + tradeStore->describe() + " with " +
                                            std::to_string(trade->state.listings.size()) + " listings");
    }

    controller::ContainerAdminController containerAdmin{registry, config.adminToken};
    containerAdmin.registerRoutes(*router);

    if (config.adminToken.empty()) {
        util::log(util::LogLevel::info, "Admin console disabled (no adminToken)");
    }

    boost::asio::io_context io;
    int exitCode = 0;

    server::ServerHooks hooks;
    hooks.afterRequest = [&registry, &containerStore]() { containerStore->save(registry.snapshot()); };
    hooks.onFatal = [&io, &exitCode](const util::StorageError& ex) {
        util::log(util::LogLevel::error, "Stopping: state for " + ex.target() + " could not be persisted");
        exitCode = 1;
        io.stop();
    };

    auto server = std::make_shared<server::HttpServer>(io, router, config.host, config.port, std::move(hooks));
    server->start();

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&io, server](const boost::system::error_code& ec, int signal) {
        if (ec) {
            return;
        }
        util::log(util::LogLevel::info, "Received signal " + std::to_string(signal) + ", shutting down");
        server->stop();
        io.stop();
    });

    util::log(util::LogLevel::info, "vaulttrade " + std::string(config::toString(config.role)) + " node on " +
                                        config.host + ":" + std::to_string(config.port));
    io.run();
    return exitCode;
}

} // namespace

int main(int /*argc*/, char** /*argv*/) {
    util::initLogging(util::LogLevel::info);

    try {
        auto config = config::loadServerConfig();
        util::initLogging(config.logLevel);
        return run(config);
    } catch (const util::StorageError& ex) {
        util::log(util::LogLevel::error, "Storage failure on " + ex.target() + ": " + ex.what());
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string{"Startup failed: "} + ex.what());
    }
    return 1;
}
