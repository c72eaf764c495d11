/**
 * engine_config.hpp - YAML configuration loader for the tritpow engine
 *
 * Parses a subset of YAML (key: value pairs with sections) without external
 * dependencies. Example:
 *
 *   engine:
 *     backend: cuda
 *     grid_rows: 256
 *     start_offset: 0
 *   cuda:
 *     device: 0
 *   paths:
 *     log_dir: ./logs
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

#include "constants.hpp"

namespace tritpow {

/**
 * Engine configuration loaded from tritpow.yml
 */
struct EngineConfig {
    // Engine
    std::string backend = "cpu";
    int grid_rows = 64;
    size_t cpu_threads = 0;          // 0 = hardware concurrency
    int64_t start_offset = 0;
    bool verify_results = true;

    // CUDA
    int cuda_device = 0;

    // Settings
    bool debug = false;

    // Paths
    std::string log_dir;             // empty = ~/.tritpow
    std::string checkpoint_dir = "./checkpoints";

    // Diagnostics from the last load()
    std::vector<std::string> errors;

    /**
     * Get possible config file paths (in order of priority)
     */
    static std::vector<std::string> get_config_paths() {
        std::vector<std::string> paths;

        // 1. Current directory
        paths.push_back("./tritpow.yml");
        paths.push_back("./tritpow.yaml");

        // 2. User home directory
        std::string home;
#ifdef _WIN32
        const char* userprofile = std::getenv("USERPROFILE");
        home = userprofile ? userprofile : "";
#else
        const char* home_env = std::getenv("HOME");
        home = home_env ? home_env : "";
#endif
        if (!home.empty()) {
            paths.push_back(home + "/.tritpow/config.yml");
            paths.push_back(home + "/.tritpow/config.yaml");
        }

        return paths;
    }

    /**
     * Load configuration from a YAML file.
     * Returns true if a config file was found and read.
     */
    bool load(const std::string& explicit_path = "") {
        std::string config_path;

        if (!explicit_path.empty()) {
            if (!std::filesystem::exists(explicit_path)) {
                errors.push_back("Config file not found: " + explicit_path);
                return false;
            }
            config_path = explicit_path;
        } else {
            for (const auto& path : get_config_paths()) {
                if (std::filesystem::exists(path)) {
                    config_path = path;
                    break;
                }
            }
        }

        if (config_path.empty()) {
            return false;  // No config file found (this is OK)
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            errors.push_back("Failed to open config file: " + config_path);
            return false;
        }

        return parse(file);
    }

    /**
     * Parse YAML text from a stream.
     */
    bool parse(std::istream& in) {
        std::string line;
        std::string current_section;
        int line_number = 0;

        while (std::getline(in, line)) {
            line_number++;

            // Trim leading whitespace and count indent
            size_t indent = 0;
            while (indent < line.length() && (line[indent] == ' ' || line[indent] == '\t')) {
                indent++;
            }
            std::string trimmed = line.substr(indent);

            // Skip empty lines, comments and document markers
            if (trimmed.empty() || trimmed[0] == '#' || trimmed.substr(0, 3) == "---") {
                continue;
            }

            // Remove trailing comments
            size_t comment_pos = trimmed.find('#');
            if (comment_pos != std::string::npos) {
                trimmed = trimmed.substr(0, comment_pos);
            }
            while (!trimmed.empty() && (trimmed.back() == ' ' || trimmed.back() == '\t')) {
                trimmed.pop_back();
            }
            if (trimmed.empty()) continue;

            size_t colon_pos = trimmed.find(':');
            if (colon_pos == std::string::npos) {
                errors.push_back("Line " + std::to_string(line_number) + ": expected 'key: value'");
                continue;
            }

            std::string key = trimmed.substr(0, colon_pos);
            std::string value = (colon_pos + 1 < trimmed.length()) ? trimmed.substr(colon_pos + 1) : "";

            while (!key.empty() && (key.back() == ' ' || key.back() == '\t')) key.pop_back();
            while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.erase(0, 1);

            // Section header
            if (value.empty() && indent == 0) {
                current_section = key;
                continue;
            }

            // Remove quotes from string values
            if (value.length() >= 2 &&
                ((value.front() == '"' && value.back() == '"') ||
                 (value.front() == '\'' && value.back() == '\''))) {
                value = value.substr(1, value.length() - 2);
            }

            try {
                parse_value(current_section, key, value);
            } catch (const std::exception& e) {
                errors.push_back("Line " + std::to_string(line_number) + ": " + e.what());
            }
        }

        return true;
    }

    /**
     * Check value ranges. Returns an error message or empty string if valid.
     */
    std::string validate() const {
        if (backend != "cpu" && backend != "cuda") {
            return "Unknown backend: " + backend;
        }
        if (grid_rows < 1 || grid_rows > 65536) {
            return "grid_rows must be in [1, 65536], got " + std::to_string(grid_rows);
        }
        if (start_offset < 0) {
            return "start_offset must not be negative";
        }
        if (!row_offset_fits(start_offset, grid_rows)) {
            return "start_offset + grid_rows - 1 must not exceed " + std::to_string(ROW_COUNTER_MAX);
        }
        if (cuda_device < 0) {
            return "cuda.device must not be negative";
        }
        return "";
    }

private:
    void parse_value(const std::string& section, const std::string& key, const std::string& value) {
        if (section == "engine") {
            if (key == "backend") backend = value;
            else if (key == "grid_rows") grid_rows = std::stoi(value);
            else if (key == "cpu_threads") cpu_threads = std::stoul(value);
            else if (key == "start_offset") start_offset = std::stoll(value);
            else if (key == "verify_results") verify_results = parse_bool(value);
            else throw std::invalid_argument("unknown key engine." + key);
        }
        else if (section == "cuda") {
            if (key == "device") cuda_device = std::stoi(value);
            else throw std::invalid_argument("unknown key cuda." + key);
        }
        else if (section == "settings") {
            if (key == "debug") debug = parse_bool(value);
            else throw std::invalid_argument("unknown key settings." + key);
        }
        else if (section == "paths") {
            if (key == "log_dir") log_dir = value;
            else if (key == "checkpoint_dir") checkpoint_dir = value;
            else throw std::invalid_argument("unknown key paths." + key);
        }
        else {
            throw std::invalid_argument("unknown section '" + section + "'");
        }
    }

    static bool parse_bool(const std::string& value) {
        std::string lower = value;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return (lower == "true" || lower == "yes" || lower == "1" || lower == "on");
    }
};

}  // namespace tritpow
