#pragma once

#include <memory>
#include <string>
#include "config.hpp"
#include "service.hpp"
#include "util.hpp"

namespace httplib {
struct Request;
struct Response;
class Server;
}

class Server {
public:
    Server(std::shared_ptr<const VectorTable> table, size_t skipped_lines, Config config);
    // Blocks until the server stops. Returns false if it could not bind.
    bool run();

    // Route handlers
    void handle_healthz(const httplib::Request& req, httplib::Response& res);
    void handle_stats(const httplib::Request& req, httplib::Response& res);
    void handle_find_common_word(const httplib::Request& req, httplib::Response& res);
    void handle_root(const httplib::Request& req, httplib::Response& res);

private:
    QueryService service_;
    size_t skipped_lines_;
    Config config_;
    LatencyTracker latency_tracker_;
    QPSTracker qps_tracker_;
    UptimeTracker uptime_tracker_;

    void send_json(httplib::Response& res, int status, const nlohmann::json& body) const;
};
