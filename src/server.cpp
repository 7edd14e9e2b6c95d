#include "server.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "util.hpp"

Server::Server(std::shared_ptr<const VectorTable> table, size_t skipped_lines, Config config)
    : service_(std::move(table)), skipped_lines_(skipped_lines), config_(std::move(config)),
      latency_tracker_(), qps_tracker_(), uptime_tracker_() {}

void Server::send_json(httplib::Response& res, int status, const nlohmann::json& body) const {
    res.status = status;
    res.set_content(config_.pretty_json ? body.dump(2) : body.dump(), "application/json");
}

void Server::handle_healthz(const httplib::Request&, httplib::Response& res) {
    res.set_content("ok", "text/plain");
}

void Server::handle_stats(const httplib::Request&, httplib::Response& res) {
    const VectorTable& table = service_.table();

    nlohmann::json response;
    response["status"] = "ready";
    response["count"] = table.count;
    response["dim"] = table.dim;
    response["vectors_path"] = config_.vectors_path;
    response["skipped_lines"] = skipped_lines_;
    response["metric"] = "cosine";
    response["uptime_sec"] = static_cast<int>(uptime_tracker_.get_uptime_sec());
    response["qps_1m"] = qps_tracker_.get_qps();
    response["latency_ms"]["p50"] = latency_tracker_.percentile(50.0);
    response["latency_ms"]["p95"] = latency_tracker_.percentile(95.0);
    response["latency_ms"]["p99"] = latency_tracker_.percentile(99.0);

    send_json(res, 200, response);
}

void Server::handle_find_common_word(const httplib::Request& req, httplib::Response& res) {
    try {
        Timer timer;
        QueryResponse out = service_.find_common_word(req.body);

        latency_tracker_.record(timer.elapsed_ms());
        qps_tracker_.record();

        send_json(res, out.status, out.body);
    } catch (const std::exception& e) {
        LOG_ERROR("find_common_word request failed: " + std::string(e.what()));
        QueryResponse out = make_error(500, "INTERNAL_ERROR", "Internal error: " + std::string(e.what()));
        send_json(res, out.status, out.body);
    }
}

void Server::handle_root(const httplib::Request&, httplib::Response& res) {
    std::string html = "<html><body><h2>wordmean</h2>"
                       "<p>Endpoints: <code>POST /find_common_word</code>, <code>/healthz</code>, <code>/stats</code></p>"
                       "</body></html>";
    res.set_content(html, "text/html");
}

bool Server::run() {
    httplib::Server svr;

    int threads = config_.threads;
    svr.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };

    svr.Get("/healthz", [this](const httplib::Request& req, httplib::Response& res) {
        handle_healthz(req, res);
    });

    svr.Get("/stats", [this](const httplib::Request& req, httplib::Response& res) {
        handle_stats(req, res);
    });

    svr.Post("/find_common_word", [this](const httplib::Request& req, httplib::Response& res) {
        handle_find_common_word(req, res);
    });

    svr.Get("/", [this](const httplib::Request& req, httplib::Response& res) {
        handle_root(req, res);
    });

    LOG_INFO("Starting server on " + config_.host + ":" + std::to_string(config_.port) +
             " (" + config_.environment + ", " + std::to_string(threads) + " threads)");
    if (!svr.listen(config_.host, config_.port)) {
        LOG_ERROR("Failed to listen on " + config_.host + ":" + std::to_string(config_.port));
        return false;
    }
    return true;
}
