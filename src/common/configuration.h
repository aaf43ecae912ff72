#ifndef TEEPIPE_CONFIGURATION_H_
#define TEEPIPE_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace YAML {
class Node;
}

namespace Teepipe {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

/**
 * Main configuration structure
 */
struct TeepipeConfig {
    // Defaults for Broadcaster::NewReader()
    struct Reader {
        ConfigValue<int> lowwater{1, "TEEPIPE_READER_LOWWATER"};
        ConfigValue<int> highwater{64, "TEEPIPE_READER_HIGHWATER"};
    } reader;

    // teepipe_fanout tool
    struct Fanout {
        ConfigValue<size_t> chunk_size{4096, "TEEPIPE_FANOUT_CHUNK_SIZE"};
        ConfigValue<int> num_readers{1, "TEEPIPE_FANOUT_NUM_READERS"};
        // 0 disables the per-reader deadline.
        ConfigValue<int> timeout_ms{0, "TEEPIPE_FANOUT_TIMEOUT_MS"};
        ConfigValue<std::string> output_prefix{"", "TEEPIPE_FANOUT_OUTPUT_PREFIX"};
    } fanout;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Override with command line arguments
    void overrideFromCommandLine(int argc, char* argv[]);

    // Get the configuration
    const TeepipeConfig& config() const { return config_; }
    TeepipeConfig& config() { return config_; }

    int getReaderLowwater() const { return config_.reader.lowwater.get(); }
    int getReaderHighwater() const { return config_.reader.highwater.get(); }
    size_t getFanoutChunkSize() const { return config_.fanout.chunk_size.get(); }

    // Restore compiled-in defaults (tests)
    void reset() { config_ = TeepipeConfig(); validation_errors_.clear(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

    // Check config without touching the singleton; appends one message per problem
    static bool validateConfig(const TeepipeConfig& config, std::vector<std::string>* errors);

    // Upper bound for fanout.chunk_size (one read buffer per tool run)
    static constexpr size_t kMaxFanoutChunkSize = 64 << 20;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    TeepipeConfig config_;
    mutable std::vector<std::string> validation_errors_;

    // Apply the "teepipe:" tree of a parsed document
    void applyYAML(const YAML::Node& root);
};

} // namespace Teepipe

#endif // TEEPIPE_CONFIGURATION_H_
