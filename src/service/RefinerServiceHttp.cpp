#include "RefinerService.h"

#include <algorithm>
#include <iostream>

#include <httplib.h>

int RefinerService::start(const ServiceConfig& config) {
    httplib::Server server;
    server.new_task_queue = [threadCount = std::max<size_t>(1, config.threadCount)] {
        return new httplib::ThreadPool(static_cast<int>(threadCount));
    };

    const auto route = [this](const std::string& method) {
        return [this, method](const httplib::Request& request, httplib::Response& response) {
            const ServiceResponse result = handle(method, request.path, request.body);
            response.status = result.status;
            response.set_content(result.body, "application/json");
        };
    };

    server.Get("/health", route("GET"));
    server.Get("/metrics", route("GET"));
    server.Post("/search", route("POST"));
    server.Post("/forward", route("POST"));
    server.Post("/feedback", route("POST"));
    server.Post("/train", route("POST"));

    std::cout << "[HelixService] corpus_size=" << corpus.size()
              << " validation_size=" << validation.size()
              << " trained=" << (trainer.network().isTrained() ? "true" : "false")
              << " host=" << config.host
              << " port=" << config.port
              << " threads=" << std::max<size_t>(1, config.threadCount)
              << "\n";

    if (!server.listen(config.host.c_str(), config.port)) {
        std::cerr << "[HelixService] failed_to_bind host=" << config.host << " port=" << config.port << "\n";
        return 1;
    }

    return 0;
}
