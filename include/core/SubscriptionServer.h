#pragma once

#include <map>
#include <mutex>
#include <memory>
#include <atomic>
#include <thread>
#include <chrono>
#include <string>
#include <vector>

#include <open62541/server.h>
#include <open62541/plugin/log.h>
#include "config/Configuration.h"
#include "publish/PublishTypes.h"
#include "timing/Scheduler.h"
#include <crow.h>
#include <crow/middlewares/cors.h>

namespace opcuasub {

// Forward declarations
class ServerAddressSpace;
class ThreadedScheduler;
class PublishEngine;
class Subscription;
class DiagnosticsHandler;

/**
 * @brief Main application class hosting the subscription core
 *
 * Hosts an open62541 node store with simulated process variables, runs one
 * demonstration subscription against it, keeps publish requests outstanding
 * through a loopback publisher and serves the HTTP diagnostics API.
 */
class SubscriptionServer {
public:
    SubscriptionServer();
    ~SubscriptionServer();

    // Non-copyable and non-movable
    SubscriptionServer(const SubscriptionServer&) = delete;
    SubscriptionServer& operator=(const SubscriptionServer&) = delete;
    SubscriptionServer(SubscriptionServer&&) = delete;
    SubscriptionServer& operator=(SubscriptionServer&&) = delete;

    /**
     * @brief Initialize the application and all components
     * @return true if initialization successful, false otherwise
     */
    bool initialize();

    /**
     * @brief Start all services and the HTTP server
     * This method blocks until the server is stopped
     */
    void run();

    /**
     * @brief Stop the server and shutdown all components gracefully
     */
    void stop();

    /**
     * @brief Get runtime statistics for monitoring
     * @return JSON string with current system status
     */
    std::string getStatus() const;

    /**
     * @brief Check if the application is currently running
     */
    bool isRunning() const { return running_.load(); }

    const Configuration& getConfiguration() const { return *config_; }

private:
    struct ServerDeleter {
        void operator()(UA_Server* server) const;
    };

    // Configuration
    std::unique_ptr<Configuration> config_;

    // Hosted node store
    UA_Logger logger_;
    std::unique_ptr<UA_Server, ServerDeleter> server_;
    std::unique_ptr<ServerAddressSpace> addressSpace_;
    std::map<std::string, std::string> simulatedNodes_;   // Browse name -> node id

    // Subscription core
    std::unique_ptr<ThreadedScheduler> scheduler_;
    std::unique_ptr<PublishEngine> engine_;
    std::shared_ptr<Subscription> demoSubscription_;
    std::unique_ptr<DiagnosticsHandler> diagnosticsHandler_;

    // Crow HTTP application with CORS middleware
    crow::App<crow::CORSHandler> app_;

    // Loopback publisher
    std::mutex acknowledgementsMutex_;
    std::vector<SubscriptionAcknowledgement> pendingAcknowledgements_;
    std::atomic<UA_UInt32> nextRequestHandle_{1};
    std::atomic<uint64_t> notificationsReceived_{0};

    // Runtime state
    std::atomic<bool> running_;
    std::thread serverThread_;
    TimerId simulationTimer_{0};
    uint64_t simulationStep_{0};
    std::chrono::steady_clock::time_point startTime_;

    // Initialization methods
    bool initializeConfiguration();
    bool initializeNodeStore();
    bool initializeComponents();
    bool initializeDemoSubscription();
    bool setupHTTPServer();

    // Runtime helpers
    void serverLoop();
    void updateSimulation();
    void issuePublishRequest();
    void onPublishResponse(const PublishRequest& request, const PublishResponse& response);

    // Signal handling
    static void signalHandler(int signal);
    static SubscriptionServer* instance_;
    void setupSignalHandlers();

    // Cleanup
    void cleanup();
};

} // namespace opcuasub
