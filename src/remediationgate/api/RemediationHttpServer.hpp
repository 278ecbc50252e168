#pragma once

#include "api/DecisionEndpoints.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace api {

// Maps method and target onto the endpoints. Unknown targets answer 404, a
// known target with the wrong method 405.
HttpReply RouteRequest(
    DecisionEndpoints& endpoints, const std::string& method, const std::string& target, const std::string& body);

class RemediationHttpServer {
public:
    // bindToIp == false listens on every interface at the given port.
    RemediationHttpServer(std::string address, uint16_t port, bool bindToIp, DecisionEndpoints* endpoints,
        uint32_t workers);

    // Blocks until Stop() is called; a Stop() that comes first makes Run()
    // return right after binding. Each connection carries one request and
    // is served on a worker thread so a slow generation does not hold up the
    // listener.
    void Run();
    void Stop();

    bool IsRunning() const { return running_.load(); }

private:
    std::string address_;
    uint16_t port_;
    bool bindToIp_;
    DecisionEndpoints* endpoints_;
    uint32_t workers_;
    std::atomic<bool> running_{true};
};

} // namespace api
