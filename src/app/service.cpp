#include <faultline/app/service.h>
#include <faultline/infra/docker_orchestrator.h>

#include <spdlog/spdlog.h>

#include <csignal>
#include <stdexcept>

#include <boost/asio/post.hpp>

namespace faultline::app {

namespace asio = boost::asio;

namespace {

std::array<std::shared_ptr<store::StoreProbe>, 2>
makeProbes(const std::array<std::shared_ptr<store::IAsyncStoreDriver>, 2>& drivers,
           const config::ScenarioConfig& sc) {
    std::array<std::shared_ptr<store::StoreProbe>, 2> probes;
    for (auto id : kAllStores) {
        probes[storeIndex(id)] = std::make_shared<store::StoreProbe>(
            id, drivers[storeIndex(id)], sc.probeTable, sc.probeTimeout);
    }
    return probes;
}

std::array<std::vector<NodeId>, 2> storeNodes(const config::ServiceConfig& cfg) {
    return {cfg.store(StoreId::MongoDB).nodes, cfg.store(StoreId::Cassandra).nodes};
}

std::array<std::string, 2> nodePatterns(const config::ServiceConfig& cfg) {
    return {cfg.store(StoreId::MongoDB).nodeMatch, cfg.store(StoreId::Cassandra).nodeMatch};
}

} // namespace

std::unique_ptr<infra::IOrchestrator>
Service::makeOrchestrator(const config::ServiceConfig& config,
                          std::unique_ptr<infra::IOrchestrator> injected) {
    if (injected)
        return injected;
    if (config.infrastructure.forceSynthetic)
        return nullptr;
    const auto& ic = config.infrastructure;
    return std::make_unique<infra::DockerOrchestrator>(ic.dockerSocket, ic.requestTimeout,
                                                       ic.stopTimeoutSeconds);
}

store::StoreDriverSet Service::makeStores(const config::ServiceConfig& config,
                                         asio::any_io_executor pool) {
    auto stores = store::makeStoreDrivers(config, std::move(pool));
    if (!stores)
        throw std::runtime_error("store drivers: " + stores.error().message);
    return std::move(stores).value();
}

Service::Service(config::ServiceConfig config, std::unique_ptr<infra::IOrchestrator> orchestrator)
    : config_(std::move(config)),
      pool_(config_.server.workerThreads),
      infra_(makeOrchestrator(config_, std::move(orchestrator)), config_.infrastructure),
      stores_(makeStores(config_, pool_.executor())),
      probes_(makeProbes(stores_.drivers, config_.scenario)),
      scenarioRunner_(infra_, locks_, probes_, nodePatterns(config_), config_.scenario,
                      pool_.executor()),
      benchmarkRunner_(stores_.drivers, config_.benchmark.table),
      reports_(config_.reports.directory),
      failureApi_(scenarioRunner_, registry_, infra_, config_.knownNodes(), pool_.executor()),
      performanceApi_(benchmarkRunner_, reports_),
      reportApi_(reports_),
      systemApi_(infra_, registry_, metrics_, pool_.executor()),
      dashboardApi_(infra_, registry_, metrics_, sampler_, stores_.drivers, probes_,
                    storeNodes(config_),
                    api::DashboardController::Options{config_.dashboard.cpuWindow,
                                                      config_.dashboard.partTimeout},
                    pool_.executor()),
      server_(scheduler_, router_, metrics_,
              api::HttpServer::Config{config_.server.bindAddress, config_.server.port}),
      signals_(scheduler_) {
    failureApi_.registerRoutes(router_);
    performanceApi_.registerRoutes(router_);
    reportApi_.registerRoutes(router_);
    systemApi_.registerRoutes(router_);
    dashboardApi_.registerRoutes(router_);
}

Service::~Service() {
    requestStop();
    pool_.stop();
}

Result<void> Service::start() {
    if (auto r = server_.start(); !r)
        return r;

    boost::system::error_code ec;
    signals_.add(SIGINT, ec);
    signals_.add(SIGTERM, ec);
    signals_.async_wait([this](const boost::system::error_code& err, int signo) {
        if (err)
            return;
        spdlog::info("[Service] received signal {}, shutting down", signo);
        requestStop();
    });
    spdlog::info("[Service] started with {} worker threads", pool_.threads());
    return Result<void>();
}

void Service::run() {
    scheduler_.run();
    spdlog::info("[Service] scheduler stopped");
}

void Service::requestStop() {
    asio::post(scheduler_, [this] {
        if (stopped_)
            return;
        stopped_ = true;
        registry_.cancelAll();
        server_.stop();
        boost::system::error_code ec;
        signals_.cancel(ec);
        scheduler_.stop();
    });
}

} // namespace faultline::app
