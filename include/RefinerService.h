#pragma once

#include "ContinualTrainer.h"
#include "RefinerConfig.h"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

struct MonitoringSnapshot {
    uint64_t totalRequests = 0;
    uint64_t searchRequests = 0;
    uint64_t forwardRequests = 0;
    uint64_t feedbackRequests = 0;
    uint64_t trainRequests = 0;
    uint64_t errorRequests = 0;
    double averageLatencyMs = 0.0;
};

class RequestMonitor {
public:
    void recordSuccess(const std::string& endpoint, double latencyMs);
    void recordError(const std::string& endpoint, double latencyMs);
    MonitoringSnapshot snapshot() const;

private:
    void countEndpoint(const std::string& endpoint);

    std::atomic<uint64_t> totalRequests{0};
    std::atomic<uint64_t> searchRequests{0};
    std::atomic<uint64_t> forwardRequests{0};
    std::atomic<uint64_t> feedbackRequests{0};
    std::atomic<uint64_t> trainRequests{0};
    std::atomic<uint64_t> errorRequests{0};
    std::atomic<uint64_t> totalLatencyMicros{0};
};

struct ServiceResponse {
    int status = 200;
    std::string body;
};

/**
 * @brief JSON front-end over one ContinualTrainer.
 *
 * Every trainer call is serialized behind a single mutex. `handle` is the
 * transport-independent entry point; `start` binds it to an HTTP server.
 */
class RefinerService {
public:
    RefinerService(ContinualTrainer& trainer,
                   std::vector<Entity> corpus,
                   std::vector<Entity> validation,
                   RequestMonitor& monitor);

    /// Errors are reported as status 400 with `{error, latency_ms}`.
    ServiceResponse handle(const std::string& method, const std::string& endpoint, const std::string& body);

    int start(const ServiceConfig& config);

private:
    std::string handleSearch(const std::string& body);
    std::string handleForward(const std::string& body);
    std::string handleFeedback(const std::string& body);
    std::string handleTrain(const std::string& body);
    std::string handleHealth();
    std::string handleMetrics();

    ContinualTrainer& trainer;
    std::vector<Entity> corpus;
    std::vector<Entity> validation;
    RequestMonitor& monitor;
    std::mutex trainerMutex;
};
