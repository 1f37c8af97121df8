// src/config/codec_config.cpp
#include "config/codec_config.hpp"
#include <yaml-cpp/yaml.h>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace config {

utils::BitOrder parse_bit_order(const std::string& s) {
    std::string lower;
    for (char c : s) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "msb") {
        return utils::BitOrder::Msb;
    }
    if (lower == "lsb") {
        return utils::BitOrder::Lsb;
    }
    throw std::invalid_argument("Unknown bit order: " + s);
}

CodecConfig CodecConfig::load(const std::string& yaml_path) {
    // Check if file exists
    std::ifstream file_check(yaml_path);
    if (!file_check.good()) {
        LOG_WARN("[CodecConfig] File not found: %s", yaml_path.c_str());
        LOG_WARN("[CodecConfig] Using default configuration");
        return get_default();
    }
    file_check.close();

    LOG_INFO("[CodecConfig] Loading codec config from: %s", yaml_path.c_str());

    try {
        YAML::Node root = YAML::LoadFile(yaml_path);

        CodecConfig cfg = get_default();

        if (root["codec"]) {
            auto c = root["codec"];

            // ================================================================
            // Logging
            // ================================================================
            if (c["log_level"]) {
                cfg.log_level = utils::parse_level(c["log_level"].as<std::string>());
            }
            cfg.log_file = c["log_file"].as<std::string>("");

            // ================================================================
            // Codec behaviour
            // ================================================================
            if (c["related_field_policy"]) {
                cfg.related_field_policy =
                    codec::parse_related_field_policy(c["related_field_policy"].as<std::string>());
            }
            if (c["default_bit_order"]) {
                cfg.default_bit_order = parse_bit_order(c["default_bit_order"].as<std::string>());
            }
        } else {
            LOG_WARN("[CodecConfig] No 'codec' section in %s, using defaults", yaml_path.c_str());
        }

        LOG_INFO("[CodecConfig] Loaded: policy=%s, bit order=%s",
                 codec::to_string(cfg.related_field_policy),
                 utils::to_string(cfg.default_bit_order));
        return cfg;

    } catch (const YAML::Exception& e) {
        throw std::runtime_error(
            std::string("[CodecConfig] YAML parse error: ") + e.what()
        );
    } catch (const std::exception& e) {
        throw std::runtime_error(
            std::string("[CodecConfig] Load error: ") + e.what()
        );
    }
}

CodecConfig CodecConfig::get_default() {
    CodecConfig cfg;
    cfg.log_level = utils::LogLevel::Warn;
    cfg.log_file.clear();
    cfg.related_field_policy = codec::RelatedFieldPolicy::Strict;
    cfg.default_bit_order = utils::BitOrder::Msb;
    return cfg;
}

void CodecConfig::validate() const {
    if (log_level < utils::LogLevel::Trace || log_level > utils::LogLevel::Off) {
        throw std::runtime_error("Invalid log_level");
    }
    if (!log_file.empty() && log_file.back() == '/') {
        throw std::runtime_error("Invalid log_file: must name a file, not a directory");
    }

    LOG_DEBUG("[CodecConfig] Validation passed");
}

void CodecConfig::apply() const {
    utils::set_level(log_level);
    if (!log_file.empty() && !utils::open_log_file(log_file)) {
        throw std::runtime_error("[CodecConfig] Cannot open log file: " + log_file);
    }
}

codec::CodecOptions CodecConfig::options() const {
    codec::CodecOptions opts;
    opts.related_field_policy = related_field_policy;
    return opts;
}

void CodecConfig::print_summary() const {
    LOG_INFO("========================================");
    LOG_INFO("Codec Configuration Summary");
    LOG_INFO("========================================");
    LOG_INFO("Log level: %s", utils::to_string(log_level));
    LOG_INFO("Log file: %s", log_file.empty() ? "(stderr only)" : log_file.c_str());
    LOG_INFO("Related field policy: %s", codec::to_string(related_field_policy));
    LOG_INFO("Default bit order: %s", utils::to_string(default_bit_order));
    LOG_INFO("========================================");
}

} // namespace config
