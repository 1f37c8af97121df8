// src/config/codec_config.hpp
#pragma once

#include <string>

#include "codec/codec_engine.hpp"
#include "utils/bitpack.hpp"
#include "utils/logging.hpp"

namespace config {

/**
 * CodecConfig - Loads codec runtime settings from YAML
 *
 * Usage:
 *   auto cfg = CodecConfig::load("config/codec.yaml");
 *   cfg.validate();
 *   cfg.apply();
 *   auto bytes = registry.serialize("Telegram", &msg, cfg.default_bit_order, cfg.options());
 *
 * Falls back to defaults if file not found.
 */
class CodecConfig {
public:
    utils::LogLevel log_level = utils::LogLevel::Warn;
    std::string log_file;              // empty: stderr only

    codec::RelatedFieldPolicy related_field_policy = codec::RelatedFieldPolicy::Strict;
    utils::BitOrder default_bit_order = utils::BitOrder::Msb;

    /**
     * Load codec config from YAML file
     * @param yaml_path Path to YAML file (e.g., "config/codec.yaml")
     * @return CodecConfig with loaded settings
     * @throws std::runtime_error if file exists but is invalid
     *
     * If file doesn't exist, returns default configuration with warning.
     */
    static CodecConfig load(const std::string& yaml_path);

    static CodecConfig get_default();

    /**
     * Validate loaded settings
     * @throws std::runtime_error if any setting is invalid
     */
    void validate() const;

    // Sets the global log level and opens the log file, if any
    void apply() const;

    codec::CodecOptions options() const;

    void print_summary() const;

    CodecConfig() = default;
};

utils::BitOrder parse_bit_order(const std::string& s);

} // namespace config
