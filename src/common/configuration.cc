#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>
#include "key.h"

namespace MpathPr {

// Global function to get configuration instance
const Configuration& GetConfig() {
    return Configuration::getInstance();
}

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
            // Base 0 so that keys can be given as 0x1f
            return std::stoull(env_val, nullptr, 0);
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

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

namespace {

// Keys are written in hex in the YAML file, which yaml-cpp does not convert
void SetKey(ConfigValue<size_t>& value, const YAML::Node& node) {
    auto key = ParseKey(node.as<std::string>());
    if (!key.has_value()) {
        throw YAML::Exception(node.Mark(), "invalid key: " + node.as<std::string>());
    }
    value.set(*key);
}

} // namespace

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        if (yaml["mpathpr"]) {
            parseYAMLNode(yaml["mpathpr"]);
        } else {
            LOG(WARNING) << "Configuration file " << filename << " has no 'mpathpr' section";
        }
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file: " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        if (yaml["mpathpr"]) {
            parseYAMLNode(yaml["mpathpr"]);
        }
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::parseYAMLNode(const YAML::Node& root) {
    // Tools
    if (root["tools"]) {
        auto tools = root["tools"];
        if (tools["mpathpersist"]) config_.tools.mpathpersist.set(tools["mpathpersist"].as<std::string>());
        if (tools["sg_persist"]) config_.tools.sg_persist.set(tools["sg_persist"].as<std::string>());
        if (tools["multipathd"]) config_.tools.multipathd.set(tools["multipathd"].as<std::string>());
        if (tools["multipath"]) config_.tools.multipath.set(tools["multipath"].as<std::string>());
        if (tools["udevadm"]) config_.tools.udevadm.set(tools["udevadm"].as<std::string>());
        if (tools["ssh"]) config_.tools.ssh.set(tools["ssh"].as<std::string>());
        if (tools["sg_dd"]) config_.tools.sg_dd.set(tools["sg_dd"].as<std::string>());
        if (tools["probe"]) config_.tools.probe.set(tools["probe"].as<std::string>());
        if (tools["io_oracle"]) config_.tools.io_oracle.set(tools["io_oracle"].as<std::string>());
    }

    // Retry
    if (root["retry"]) {
        auto retry = root["retry"];
        if (retry["unit_attention_retries"]) config_.retry.unit_attention_retries.set(retry["unit_attention_retries"].as<int>());
        if (retry["unit_attention_delay_ms"]) config_.retry.unit_attention_delay_ms.set(retry["unit_attention_delay_ms"].as<int>());
        if (retry["unit_attention_status"]) config_.retry.unit_attention_status.set(retry["unit_attention_status"].as<int>());
    }

    // Timing
    if (root["timing"]) {
        auto timing = root["timing"];
        if (timing["settle_ms"]) config_.timing.settle_ms.set(timing["settle_ms"].as<int>());
        if (timing["iteration_pause_ms"]) config_.timing.iteration_pause_ms.set(timing["iteration_pause_ms"].as<int>());
        if (timing["start_grace_ms"]) config_.timing.start_grace_ms.set(timing["start_grace_ms"].as<int>());
        if (timing["stop_timeout_ms"]) config_.timing.stop_timeout_ms.set(timing["stop_timeout_ms"].as<int>());
    }

    // Oracle
    if (root["oracle"]) {
        auto oracle = root["oracle"];
        if (oracle["write_interval_ms"]) config_.oracle.write_interval_ms.set(oracle["write_interval_ms"].as<int>());
        if (oracle["conflict_status"]) config_.oracle.conflict_status.set(oracle["conflict_status"].as<int>());
        if (oracle["block_size"]) config_.oracle.block_size.set(oracle["block_size"].as<int>());
        if (oracle["block_count"]) config_.oracle.block_count.set(oracle["block_count"].as<int>());
    }

    // Injector
    if (root["injector"]) {
        auto injector = root["injector"];
        if (injector["enabled"]) config_.injector.enabled.set(injector["enabled"].as<bool>());
        if (injector["command"]) config_.injector.command.set(injector["command"].as<std::string>());
    }

    // Verify
    if (root["verify"]) {
        auto verify = root["verify"];
        if (verify["check_multipathd"]) config_.verify.check_multipathd.set(verify["check_multipathd"].as<bool>());
        if (verify["cross_check_peer_path"]) config_.verify.cross_check_peer_path.set(verify["cross_check_peer_path"].as<bool>());
    }

    // Keys
    if (root["keys"]) {
        auto keys = root["keys"];
        if (keys["peer_key"]) SetKey(config_.keys.peer_key, keys["peer_key"]);
        if (keys["first_local_key"]) SetKey(config_.keys.first_local_key, keys["first_local_key"]);
    }

    // Run
    if (root["run"]) {
        auto run = root["run"];
        if (run["seed"]) config_.run.seed.set(run["seed"].as<size_t>());
        if (run["iterations"]) config_.run.iterations.set(run["iterations"].as<size_t>());
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    const auto& tools = config_.tools;
    for (const auto* tool : {&tools.mpathpersist, &tools.sg_persist, &tools.multipathd,
                             &tools.multipath, &tools.udevadm, &tools.ssh, &tools.sg_dd,
                             &tools.probe, &tools.io_oracle}) {
        if (tool->get().empty()) {
            validation_errors_.push_back("Tool name for " + tool->env_var() + " must not be empty");
        }
    }
    if (config_.injector.enabled.get() && config_.injector.command.get().empty()) {
        validation_errors_.push_back("Injector command must not be empty when the injector is enabled");
    }

    // Retry
    if (config_.retry.unit_attention_retries.get() < 1) {
        validation_errors_.push_back("Unit Attention retries must be at least 1");
    }
    if (config_.retry.unit_attention_delay_ms.get() < 0) {
        validation_errors_.push_back("Unit Attention delay must not be negative");
    }

    // Timing
    if (config_.timing.settle_ms.get() < 0 || config_.timing.iteration_pause_ms.get() < 0) {
        validation_errors_.push_back("Settle time and iteration pause must not be negative");
    }
    if (config_.timing.start_grace_ms.get() < 0) {
        validation_errors_.push_back("Start grace must not be negative");
    }
    if (config_.timing.stop_timeout_ms.get() < 1) {
        validation_errors_.push_back("Stop timeout must be positive");
    }

    // Oracle
    if (config_.oracle.write_interval_ms.get() < 1) {
        validation_errors_.push_back("Oracle write interval must be positive");
    }
    if (config_.oracle.block_size.get() < 1 || config_.oracle.block_count.get() < 1) {
        validation_errors_.push_back("Oracle block size and count must be positive");
    }

    // Keys
    const size_t peer_key = config_.keys.peer_key.get();
    const size_t first_key = config_.keys.first_local_key.get();
    if (peer_key == 0) {
        validation_errors_.push_back("Peer key must not be 0x0");
    }
    if (first_key == 0) {
        validation_errors_.push_back("First local key must not be 0x0");
    }
    if (first_key <= peer_key) {
        // Local keys only grow, so this keeps them disjoint from the peer key
        validation_errors_.push_back("First local key must be greater than the peer key");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace MpathPr
