#include "config.hpp"
#include "util.hpp"
#include <cstdlib>
#include <stdexcept>

namespace {

struct EnvSetting {
    const char* env_name;
    const char* name;
};

const EnvSetting kEnvSettings[] = {
    {"WORDMEAN_HOST", "host"},
    {"WORDMEAN_PORT", "port"},
    {"WORDMEAN_VECTORS", "vectors_path"},
    {"WORDMEAN_THREADS", "threads"},
    {"WORDMEAN_ENV", "environment"},
};

bool parse_positive_int(const std::string& value, int& out) {
    size_t used = 0;
    int parsed;
    try {
        parsed = std::stoi(value, &used);
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
    if (used != value.size() || parsed <= 0) {
        return false;
    }
    out = parsed;
    return true;
}

void apply_or_warn(Config& config, const std::string& name, const std::string& value) {
    if (!apply_setting(config, name, value)) {
        LOG_WARN("Invalid value for " + name + ": '" + value + "', keeping default");
    }
}

} // namespace

bool apply_setting(Config& config, const std::string& name, const std::string& value) {
    if (name == "host") {
        if (value.empty()) return false;
        config.host = value;
    } else if (name == "port") {
        int port;
        if (!parse_positive_int(value, port) || port > 65535) return false;
        config.port = port;
    } else if (name == "vectors_path") {
        if (value.empty()) return false;
        config.vectors_path = value;
    } else if (name == "threads") {
        int threads;
        if (!parse_positive_int(value, threads)) return false;
        config.threads = threads;
    } else if (name == "environment") {
        if (value != "development" && value != "production") return false;
        config.environment = value;
        config.pretty_json = (value == "development");
    } else {
        return false;
    }
    return true;
}

Config load_config(int argc, char** argv) {
    Config config;

    for (const auto& setting : kEnvSettings) {
        const char* value = std::getenv(setting.env_name);
        if (value != nullptr) {
            apply_or_warn(config, setting.name, value);
        }
    }

    if (argc >= 2) {
        apply_or_warn(config, "port", argv[1]);
    }
    if (argc >= 3) {
        apply_or_warn(config, "vectors_path", argv[2]);
    }

    return config;
}
