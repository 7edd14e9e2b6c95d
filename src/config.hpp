#pragma once

#include <string>

struct Config {
    std::string host = "0.0.0.0";
    int port = 4001;
    std::string vectors_path = "glove/glove.6B.300d.txt";
    int threads = 4;
    std::string environment = "production";
    bool pretty_json = false;  // Indented JSON responses, set in development
};

// Defaults, then WORDMEAN_* environment variables, then positional
// arguments: wordmean [port] [vectors_path]
Config load_config(int argc, char** argv);

// Applies one named setting. Returns false (and leaves config untouched) when
// the value is not valid for that setting.
bool apply_setting(Config& config, const std::string& name, const std::string& value);
