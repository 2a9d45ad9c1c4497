#ifndef MPATHPR_CONFIGURATION_H_
#define MPATHPR_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace YAML {
class Node;
}

namespace MpathPr {

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

/**
 * Main configuration structure
 */
struct MpathPrConfig {
    // External programs. Bare names are resolved through PATH.
    struct Tools {
        ConfigValue<std::string> mpathpersist{"mpathpersist", "MPATHPR_MPATHPERSIST"};
        ConfigValue<std::string> sg_persist{"sg_persist", "MPATHPR_SG_PERSIST"};
        ConfigValue<std::string> multipathd{"multipathd", "MPATHPR_MULTIPATHD"};
        ConfigValue<std::string> multipath{"multipath", "MPATHPR_MULTIPATH"};
        ConfigValue<std::string> udevadm{"udevadm", "MPATHPR_UDEVADM"};
        ConfigValue<std::string> ssh{"ssh", "MPATHPR_SSH"};
        ConfigValue<std::string> sg_dd{"sg_dd", "MPATHPR_SG_DD"};
        ConfigValue<std::string> probe{"./probe", "MPATHPR_PROBE"};
        ConfigValue<std::string> io_oracle{"mpath_pr_io_oracle", "MPATHPR_IO_ORACLE"};
    } tools;

    // Unit Attention handling
    struct Retry {
        ConfigValue<int> unit_attention_retries{3, "MPATHPR_UA_RETRIES"};
        ConfigValue<int> unit_attention_delay_ms{100, "MPATHPR_UA_DELAY_MS"};
        ConfigValue<int> unit_attention_status{6, "MPATHPR_UA_STATUS"};
    } retry;

    struct Timing {
        // Time the oracle gets to exercise the volume after each operation
        ConfigValue<int> settle_ms{5000, "MPATHPR_SETTLE_MS"};
        ConfigValue<int> iteration_pause_ms{1000, "MPATHPR_ITERATION_PAUSE_MS"};
        ConfigValue<int> start_grace_ms{100, "MPATHPR_START_GRACE_MS"};
        ConfigValue<int> stop_timeout_ms{30000, "MPATHPR_STOP_TIMEOUT_MS"};
    } timing;

    struct Oracle {
        ConfigValue<int> write_interval_ms{100, "MPATHPR_ORACLE_INTERVAL_MS"};
        // sg_dd exit status for a reservation conflict
        ConfigValue<int> conflict_status{24, "MPATHPR_ORACLE_CONFLICT_STATUS"};
        ConfigValue<int> block_size{512, "MPATHPR_ORACLE_BLOCK_SIZE"};
        ConfigValue<int> block_count{8, "MPATHPR_ORACLE_BLOCK_COUNT"};
    } oracle;

    struct Injector {
        ConfigValue<bool> enabled{true, "MPATHPR_INJECTOR_ENABLED"};
        ConfigValue<std::string> command{"./multipath-test.sh", "MPATHPR_INJECTOR"};
    } injector;

    struct Verify {
        ConfigValue<bool> check_multipathd{true, "MPATHPR_VERIFY_MULTIPATHD"};
        ConfigValue<bool> cross_check_peer_path{false, "MPATHPR_VERIFY_PEER_PATH"};
    } verify;

    struct Keys {
        ConfigValue<size_t> peer_key{0x1, "MPATHPR_PEER_KEY"};
        ConfigValue<size_t> first_local_key{0x2, "MPATHPR_FIRST_LOCAL_KEY"};
    } keys;

    struct Run {
        // 0 picks a seed from std::random_device
        ConfigValue<size_t> seed{0, "MPATHPR_SEED"};
        // 0 runs until interrupted
        ConfigValue<size_t> iterations{0, "MPATHPR_ITERATIONS"};
    } run;
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

    // Get the configuration
    const MpathPrConfig& config() const { return config_; }
    MpathPrConfig& config() { return config_; }

    // Restore compiled-in defaults
    void reset() { config_ = MpathPrConfig{}; }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    MpathPrConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void parseYAMLNode(const YAML::Node& root);
};

const Configuration& GetConfig();

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace MpathPr

#endif // MPATHPR_CONFIGURATION_H_
