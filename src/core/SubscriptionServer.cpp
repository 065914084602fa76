#include "core/SubscriptionServer.h"
#include "core/ErrorHandler.h"
#include "core/OPCUALogBridge.h"
#include "core/DataValue.h"
#include "addressspace/ServerAddressSpace.h"
#include "timing/ThreadedScheduler.h"
#include "publish/PublishEngine.h"
#include "subscription/Subscription.h"
#include "http/DiagnosticsHandler.h"
#include <open62541/server_config_default.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <csignal>
#include <cmath>
#include <cstring>
#include <optional>
#include <crow.h>

namespace opcuasub {

// Static instance for signal handling
SubscriptionServer* SubscriptionServer::instance_ = nullptr;

void SubscriptionServer::ServerDeleter::operator()(UA_Server* server) const {
    ErrorHandler::checkStatus(ErrorHandler::ErrorType::UNKNOWN_ERROR, UA_Server_delete(server),
                              "Deleting node store");
}

SubscriptionServer::SubscriptionServer()
    : logger_(OPCUALogBridge::createLogger())
    , running_(false) {
    instance_ = this;
}

SubscriptionServer::~SubscriptionServer() {
    if (running_.load()) {
        stop();
    }

    cleanup();
    instance_ = nullptr;
}

bool SubscriptionServer::initialize() {
    return ErrorHandler::executeWithErrorHandling([this]() {
        spdlog::info("Initializing OPC UA subscription server...");

        if (!initializeConfiguration()) {
            throw std::runtime_error("Failed to initialize configuration");
        }

        spdlog::info("Configuration loaded successfully");
        spdlog::debug("Configuration details: {}", config_->toString());

        setupSignalHandlers();
        spdlog::debug("Signal handlers configured");

        if (!initializeNodeStore()) {
            throw std::runtime_error("Failed to initialize node store");
        }

        if (!initializeComponents()) {
            throw std::runtime_error("Failed to initialize components");
        }

        if (!initializeDemoSubscription()) {
            throw std::runtime_error("Failed to create demonstration subscription");
        }

        if (!setupHTTPServer()) {
            throw std::runtime_error("Failed to setup HTTP server");
        }

        spdlog::info("OPC UA subscription server initialized successfully");

    }, "SubscriptionServer::initialize");
}

void SubscriptionServer::run() {
    ErrorHandler::executeWithErrorHandling([this]() {
        running_.store(true);
        startTime_ = std::chrono::steady_clock::now();

        spdlog::info("Starting OPC UA subscription server...");
        spdlog::info("Configuration:");
        spdlog::info("  OPC UA Port: {}", config_->opcServerPort);
        spdlog::info("  HTTP Port: {}", config_->httpPort);
        spdlog::info("  Publishing Interval: {}ms", config_->publishingIntervalMs);
        spdlog::info("  Sampling Interval: {}ms", config_->samplingIntervalMs);
        spdlog::info("  Publish Request Depth: {}", config_->publishRequestDepth);
        spdlog::info("  Log Level: {}", config_->logLevel);

        UA_StatusCode status = UA_Server_run_startup(server_.get());
        if (!ErrorHandler::checkStatus(ErrorHandler::ErrorType::INITIALIZATION_ERROR, status,
                                       "Node store startup")) {
            throw std::runtime_error("Failed to start node store");
        }
        serverThread_ = std::thread(&SubscriptionServer::serverLoop, this);
        spdlog::info("✓ Node store listening on opc.tcp://localhost:{}", config_->opcServerPort);

        scheduler_->start();
        simulationTimer_ = scheduler_->schedulePeriodic(
            Scheduler::Duration(config_->simulationUpdateMs), TimerPhase::SAMPLING,
            [this]() { updateSimulation(); });
        spdlog::info("✓ Scheduler started, simulation updates every {}ms", config_->simulationUpdateMs);

        for (int i = 0; i < config_->publishRequestDepth; ++i) {
            issuePublishRequest();
        }
        spdlog::info("✓ Loopback publisher keeps {} publish requests queued", config_->publishRequestDepth);

        spdlog::info("✓ HTTP server starting on port {}", config_->httpPort);
        spdlog::info("✓ Health check available at: http://localhost:{}/health", config_->httpPort);
        spdlog::info("✓ Subscriptions available at: http://localhost:{}/subscriptions", config_->httpPort);

        // Start HTTP server (this blocks)
        app_.port(static_cast<uint16_t>(config_->httpPort))
            .multithreaded()
            .run();

    }, "Server runtime", [this]() -> bool {
        // Recovery: attempt graceful shutdown
        spdlog::warn("Attempting graceful shutdown due to server error...");
        stop();
        return false;
    });

    running_.store(false);
    spdlog::info("HTTP server stopped");
}

void SubscriptionServer::stop() {
    // Use atomic flag to prevent multiple stops
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        spdlog::debug("Stop already called or not running");
        return;
    }

    spdlog::info("Stopping OPC UA subscription server...");

    ErrorHandler::executeWithErrorHandling([this]() {
        app_.stop();
        spdlog::debug("HTTP server stop signal sent");

        if (engine_) {
            engine_->shutdown();
        }

        if (scheduler_) {
            scheduler_->stop();
            spdlog::debug("Scheduler stopped");
        }

        if (serverThread_.joinable()) {
            serverThread_.join();
            spdlog::debug("Node store thread joined");
        }

        if (server_) {
            ErrorHandler::checkStatus(ErrorHandler::ErrorType::UNKNOWN_ERROR,
                                      UA_Server_run_shutdown(server_.get()), "Node store shutdown");
        }

    }, "Graceful shutdown");

    spdlog::info("OPC UA subscription server stopped");
}

bool SubscriptionServer::initializeConfiguration() {
    return ErrorHandler::executeWithErrorHandling([this]() {
        config_ = std::make_unique<Configuration>(Configuration::loadFromEnvironment());

        if (!config_->validate()) {
            throw std::runtime_error("Configuration validation failed");
        }

    }, "Configuration initialization");
}

bool SubscriptionServer::initializeNodeStore() {
    return ErrorHandler::executeWithErrorHandling([this]() {
        spdlog::info("Initializing node store...");

        OPCUALogBridge::setLogLevel(OPCUALogBridge::fromSpdlogLevel(spdlog::get_level()));

        UA_ServerConfig serverConfig;
        std::memset(&serverConfig, 0, sizeof(UA_ServerConfig));
        serverConfig.logging = &logger_;
        UA_StatusCode status = UA_ServerConfig_setMinimal(&serverConfig,
                                                          static_cast<UA_UInt16>(config_->opcServerPort),
                                                          nullptr);
        if (!ErrorHandler::checkStatus(ErrorHandler::ErrorType::INITIALIZATION_ERROR, status,
                                       "Node store configuration")) {
            UA_ServerConfig_clear(&serverConfig);
            throw std::runtime_error("Failed to configure node store");
        }

        server_.reset(UA_Server_newWithConfig(&serverConfig));
        if (!server_) {
            throw std::runtime_error("Failed to create node store");
        }

        addressSpace_ = std::make_unique<ServerAddressSpace>(server_.get());
        UA_UInt16 ns = addressSpace_->addNamespace("urn:opcuasub:simulation");
        std::string prefix = "ns=" + std::to_string(ns) + ";s=";

        UA_DateTime now = UA_DateTime_now();
        struct Variable {
            std::string name;
            DataValue initial;
            std::optional<UA_Range> euRange;
        };
        std::vector<Variable> variables = {
            {"Temperature", DataValue::fromDouble(20.0, now), UA_Range{-40.0, 120.0}},
            {"Pressure", DataValue::fromDouble(5.0, now), UA_Range{0.0, 10.0}},
            {"Counter", DataValue::fromInt32(0, now), std::nullopt},
            {"MachineState", DataValue::fromString("Idle", now), std::nullopt}
        };

        for (const auto& variable : variables) {
            std::string nodeId = prefix + variable.name;
            status = addressSpace_->addVariable(nodeId, variable.name, variable.initial, variable.euRange);
            if (status != UA_STATUSCODE_GOOD) {
                throw std::runtime_error("Failed to add variable " + variable.name);
            }
            simulatedNodes_[variable.name] = nodeId;
        }

        spdlog::info("Node store initialized with {} simulated variables in namespace {}",
                     simulatedNodes_.size(), ns);

    }, "Node store initialization");
}

bool SubscriptionServer::initializeComponents() {
    return ErrorHandler::executeWithErrorHandling([this]() {
        spdlog::info("Initializing core components...");

        scheduler_ = std::make_unique<ThreadedScheduler>();
        spdlog::debug("Scheduler initialized");

        engine_ = std::make_unique<PublishEngine>(
            *scheduler_, config_->getServiceLimits(),
            [this](const PublishRequest& request, const PublishResponse& response) {
                onPublishResponse(request, response);
            });
        spdlog::debug("Publish engine initialized with max {} queued requests",
                      config_->maxPublishRequestsInQueue);

        diagnosticsHandler_ = std::make_unique<DiagnosticsHandler>(engine_.get(), *config_);
        spdlog::debug("Diagnostics handler initialized");

        spdlog::info("All core components initialized successfully");

    }, "Components initialization");
}

bool SubscriptionServer::initializeDemoSubscription() {
    return ErrorHandler::executeWithErrorHandling([this]() {
        SubscriptionParameters parameters;
        parameters.publishingInterval = config_->publishingIntervalMs;
        parameters.maxKeepAliveCount = 10;
        parameters.lifetimeCount = 60;

        demoSubscription_ = engine_->createSubscription(parameters);
        if (!demoSubscription_) {
            throw std::runtime_error("Publish engine refused the subscription");
        }

        demoSubscription_->onMonitoredItemCreated(
            [this](UA_UInt32 monitoredItemId, const MonitoredItemCreateRequest& request) {
                spdlog::info("Subscription {}: monitoring {} as item {} ({})",
                             demoSubscription_->getId(), request.nodeId, monitoredItemId,
                             monitoringModeToString(request.monitoringMode));
            });

        auto makeRequest = [this](const std::string& name, UA_UInt32 clientHandle,
                                  UA_MonitoringMode mode, double samplingInterval,
                                  UA_UInt32 queueSize, std::optional<DataChangeFilter> filter) {
            MonitoredItemCreateRequest request;
            request.nodeId = simulatedNodes_.at(name);
            request.monitoringMode = mode;
            request.requestedParameters.clientHandle = clientHandle;
            request.requestedParameters.samplingInterval = samplingInterval;
            request.requestedParameters.queueSize = queueSize;
            request.requestedParameters.filter = filter;
            return request;
        };

        DataChangeFilter temperatureFilter;
        temperatureFilter.deadbandType = UA_DEADBANDTYPE_ABSOLUTE;
        temperatureFilter.deadbandValue = 0.5;

        DataChangeFilter pressureFilter;
        pressureFilter.deadbandType = UA_DEADBANDTYPE_PERCENT;
        pressureFilter.deadbandValue = 2.0;

        double sampling = config_->samplingIntervalMs;
        std::vector<MonitoredItemCreateRequest> requests = {
            makeRequest("Temperature", 1, UA_MONITORINGMODE_REPORTING, sampling, 5, temperatureFilter),
            makeRequest("Counter", 2, UA_MONITORINGMODE_REPORTING, sampling, 1, std::nullopt),
            makeRequest("Pressure", 3, UA_MONITORINGMODE_SAMPLING, sampling, 10, pressureFilter),
            makeRequest("MachineState", 4, UA_MONITORINGMODE_REPORTING, 0.0, 5, std::nullopt)
        };

        std::map<std::string, UA_UInt32> itemIds;
        for (const auto& request : requests) {
            auto result = demoSubscription_->createMonitoredItem(*addressSpace_, UA_TIMESTAMPSTORETURN_BOTH,
                                                                 request);
            if (result.statusCode != UA_STATUSCODE_GOOD) {
                throw std::runtime_error("Failed to monitor " + request.nodeId + ": " +
                                         DataValue::statusCodeToString(result.statusCode));
            }
            itemIds[request.nodeId] = result.monitoredItemId;
        }

        // Pressure is only reported together with a counter change
        auto triggering = demoSubscription_->setTriggering(itemIds.at(simulatedNodes_.at("Counter")),
                                                           {itemIds.at(simulatedNodes_.at("Pressure"))}, {});
        if (triggering.statusCode != UA_STATUSCODE_GOOD) {
            throw std::runtime_error("Failed to link triggering items: " +
                                     DataValue::statusCodeToString(triggering.statusCode));
        }

        spdlog::info("Demonstration subscription {} created with {} monitored items",
                     demoSubscription_->getId(), demoSubscription_->getMonitoredItemCount());

    }, "Demonstration subscription");
}

bool SubscriptionServer::setupHTTPServer() {
    return ErrorHandler::executeWithErrorHandling([this]() {
        spdlog::info("Setting up HTTP server...");

        diagnosticsHandler_->setupRoutes(app_);

        spdlog::info("HTTP server routes configured");

    }, "HTTP server setup");
}

void SubscriptionServer::serverLoop() {
    spdlog::debug("Node store thread started");

    while (running_.load()) {
        UA_UInt16 waitMs = addressSpace_->runIterate();
        auto sleep = std::clamp<int>(waitMs, 1, 50);
        std::this_thread::sleep_for(std::chrono::milliseconds(sleep));
    }

    spdlog::debug("Node store thread stopped");
}

void SubscriptionServer::updateSimulation() {
    uint64_t step = ++simulationStep_;
    UA_DateTime now = UA_DateTime_now();

    auto write = [this](const std::string& name, const DataValue& value) {
        ErrorHandler::checkStatus(ErrorHandler::ErrorType::ADDRESS_SPACE_ERROR,
                                  addressSpace_->writeValue(simulatedNodes_.at(name), value),
                                  "Simulation update of " + name);
    };

    write("Temperature", DataValue::fromDouble(20.0 + 5.0 * std::sin(step / 10.0), now));
    write("Pressure", DataValue::fromDouble(5.0 + 2.0 * std::cos(step / 7.0), now));

    if (step % 5 == 0) {
        write("Counter", DataValue::fromInt32(static_cast<UA_Int32>(step / 5), now));
    }

    if (step % 20 == 0) {
        write("MachineState", DataValue::fromString((step / 20) % 2 ? "Running" : "Idle", now));
    }
}

void SubscriptionServer::issuePublishRequest() {
    PublishRequest request;
    request.requestHandle = nextRequestHandle_++;
    {
        std::lock_guard<std::mutex> lock(acknowledgementsMutex_);
        request.subscriptionAcknowledgements.swap(pendingAcknowledgements_);
    }

    engine_->onPublishRequest(request);
}

void SubscriptionServer::onPublishResponse(const PublishRequest& request, const PublishResponse& response) {
    if (response.serviceResult == UA_STATUSCODE_GOOD) {
        const auto& message = response.notificationMessage;
        if (message.isKeepAlive()) {
            spdlog::debug("Keep-alive from subscription {} (next sequence number {})",
                          response.subscriptionId, message.sequenceNumber);
        } else {
            notificationsReceived_ += message.dataChangeCount();
            spdlog::info("Subscription {} message {}: {} notifications",
                         response.subscriptionId, message.sequenceNumber, message.dataChangeCount());
            spdlog::debug("Publish response: {}", response.toJson().dump());

            std::lock_guard<std::mutex> lock(acknowledgementsMutex_);
            pendingAcknowledgements_.push_back({response.subscriptionId, message.sequenceNumber});
        }
    } else {
        spdlog::warn("Publish request {} answered with {}", request.requestHandle,
                     DataValue::statusCodeToString(response.serviceResult));
    }

    if (!running_.load() ||
        response.serviceResult == UA_STATUSCODE_BADSHUTDOWN ||
        response.serviceResult == UA_STATUSCODE_BADNOSUBSCRIPTION) {
        return;
    }

    // Runs with a subscription locked; re-issue from the scheduler thread
    scheduler_->scheduleOnce(Scheduler::Duration(0), TimerPhase::HOUSEKEEPING,
                             [this]() { issuePublishRequest(); });
}

void SubscriptionServer::signalHandler(int signal) {
    if (instance_) {
        spdlog::info("Received signal {}, shutting down...", signal);
        instance_->stop();
    }
}

void SubscriptionServer::setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

void SubscriptionServer::cleanup() {
    spdlog::info("Cleaning up resources...");

    ErrorHandler::executeWithErrorHandling([this]() {
        if (scheduler_) {
            scheduler_->stop();
        }

        diagnosticsHandler_.reset();
        spdlog::debug("Diagnostics handler cleaned up");

        demoSubscription_.reset();
        engine_.reset();
        spdlog::debug("Publish engine cleaned up");

        scheduler_.reset();
        spdlog::debug("Scheduler cleaned up");

        addressSpace_.reset();
        server_.reset();
        spdlog::debug("Node store cleaned up");

        config_.reset();
        spdlog::debug("Configuration cleaned up");

    }, "Resource cleanup");

    spdlog::info("Resources cleaned up");
}

std::string SubscriptionServer::getStatus() const {
    try {
        auto now = std::chrono::steady_clock::now();
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - startTime_).count();

        nlohmann::json status = {
            {"service", "opcuasub"},
            {"status", running_.load() ? "running" : "stopped"},
            {"uptime_seconds", uptime},
            {"notifications_received", notificationsReceived_.load()},
            {"simulated_nodes", simulatedNodes_}
        };

        if (engine_) {
            status["engine"] = engine_->getStatus();
        }

        if (scheduler_) {
            auto stats = scheduler_->getStats();
            status["scheduler"] = {
                {"executed_callbacks", stats.executedCallbacks},
                {"failed_callbacks", stats.failedCallbacks},
                {"active_timers", stats.activeTimers}
            };
        }

        return status.dump(2);

    } catch (const std::exception& e) {
        return R"({"error": "Failed to get status: )" + std::string(e.what()) + R"("})";
    }
}

} // namespace opcuasub
