#include "configuration.h"
#include <cstdlib>
#include <stdexcept>
#include <getopt.h>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Teepipe {

namespace {

// std::stoull accepts "-1" and wraps it; sizes must not be negative.
size_t parseSize(const std::string& text) {
    size_t pos = text.find_first_not_of(" \t\n\r\f\v");
    if (pos != std::string::npos && text[pos] == '-') {
        throw std::invalid_argument("negative size: " + text);
    }
    return std::stoull(text);
}

} // namespace

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return parseSize(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["teepipe"]) {
        LOG(WARNING) << "Configuration has no top-level 'teepipe' section; keeping defaults";
        return;
    }
    auto root = yaml["teepipe"];

    // Reader
    if (root["reader"]) {
        auto reader = root["reader"];
        if (reader["lowwater"]) config_.reader.lowwater.set(reader["lowwater"].as<int>());
        if (reader["highwater"]) config_.reader.highwater.set(reader["highwater"].as<int>());
    }

    // Fanout
    if (root["fanout"]) {
        auto fanout = root["fanout"];
        if (fanout["chunk_size"]) config_.fanout.chunk_size.set(fanout["chunk_size"].as<size_t>());
        if (fanout["num_readers"]) config_.fanout.num_readers.set(fanout["num_readers"].as<int>());
        if (fanout["timeout_ms"]) config_.fanout.timeout_ms.set(fanout["timeout_ms"].as<int>());
        if (fanout["output_prefix"]) config_.fanout.output_prefix.set(fanout["output_prefix"].as<std::string>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        applyYAML(YAML::LoadFile(filename));
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        applyYAML(YAML::Load(yaml_content));
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::overrideFromCommandLine(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"lowwater", required_argument, 0, 'l'},
        {"highwater", required_argument, 0, 'H'},
        {"chunk_size", required_argument, 0, 'c'},
        {"num_readers", required_argument, 0, 'n'},
        {"timeout_ms", required_argument, 0, 't'},
        {"config", required_argument, 0, 'f'},
        {0, 0, 0, 0}
    };

    int option_index = 0;
    int c;
    // Tool-specific flags are parsed elsewhere; stay quiet about them
    opterr = 0;
    optind = 1;

    while ((c = getopt_long(argc, argv, "", long_options, &option_index)) != -1) {
        try {
            switch (c) {
                case 'l':
                    config_.reader.lowwater.set(std::stoi(optarg));
                    break;
                case 'H':
                    config_.reader.highwater.set(std::stoi(optarg));
                    break;
                case 'c':
                    config_.fanout.chunk_size.set(parseSize(optarg));
                    break;
                case 'n':
                    config_.fanout.num_readers.set(std::stoi(optarg));
                    break;
                case 't':
                    config_.fanout.timeout_ms.set(std::stoi(optarg));
                    break;
                case 'f':
                    if (!loadFromFile(optarg)) {
                        LOG(ERROR) << "Failed to load configuration from " << optarg;
                    }
                    break;
                default:
                    break;
            }
        } catch (const std::exception& e) {
            LOG(WARNING) << "Ignoring invalid value for --" << long_options[option_index].name
                         << ": " << e.what();
        }
    }
    optind = 1;
}

bool Configuration::validate() const {
    validation_errors_.clear();
    return validateConfig(config_, &validation_errors_);
}

bool Configuration::validateConfig(const TeepipeConfig& config, std::vector<std::string>* errors) {
    const size_t before = errors->size();

    if (config.reader.lowwater.get() < 0) {
        errors->push_back("Reader lowwater must not be negative");
    }

    if (config.reader.highwater.get() < 0) {
        errors->push_back("Reader highwater must not be negative");
    }

    const size_t chunk_size = config.fanout.chunk_size.get();
    if (chunk_size == 0) {
        errors->push_back("Fanout chunk size must be at least 1");
    } else if (chunk_size > kMaxFanoutChunkSize) {
        errors->push_back("Fanout chunk size must be at most " + std::to_string(kMaxFanoutChunkSize) +
                          " (got " + std::to_string(chunk_size) + ")");
    }

    const int num_readers = config.fanout.num_readers.get();
    if (num_readers < 1) {
        errors->push_back("Fanout needs at least 1 reader");
    } else if (num_readers > 1 && config.fanout.output_prefix.get().empty()) {
        errors->push_back("Fanout with more than 1 reader needs an output prefix (readers would interleave on stdout)");
    }

    if (config.fanout.timeout_ms.get() < 0) {
        errors->push_back("Fanout timeout must not be negative");
    }

    return errors->size() == before;
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Teepipe
