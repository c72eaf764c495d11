/**
 * Engine Configuration Tests
 */

#include "core/engine_config.hpp"
#include "core/logger.hpp"
#include "core/search_state.hpp"
#include "engine/pow_engine.hpp"
#include "platform/backend.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace tritpow;

void test_defaults() {
    EngineConfig config;
    assert(config.backend == "cpu");
    assert(config.grid_rows == 64);
    assert(config.verify_results);
    assert(config.validate().empty());
    std::cout << "[PASS] Defaults valid\n";
}

void test_parse_sections() {
    std::istringstream yaml(
        "# tritpow settings\n"
        "---\n"
        "engine:\n"
        "  backend: \"cuda\"\n"
        "  grid_rows: 256   # 8192 lanes\n"
        "  cpu_threads: 6\n"
        "  start_offset: 4096\n"
        "  verify_results: no\n"
        "\n"
        "cuda:\n"
        "  device: 1\n"
        "settings:\n"
        "  debug: yes\n"
        "paths:\n"
        "  log_dir: '/var/log/tritpow'\n"
        "  checkpoint_dir: /tmp/ckpt\n");

    EngineConfig config;
    assert(config.parse(yaml));
    assert(config.errors.empty());
    assert(config.backend == "cuda");
    assert(config.grid_rows == 256);
    assert(config.cpu_threads == 6);
    assert(config.start_offset == 4096);
    assert(!config.verify_results);
    assert(config.cuda_device == 1);
    assert(config.debug);
    assert(config.log_dir == "/var/log/tritpow");
    assert(config.checkpoint_dir == "/tmp/ckpt");
    assert(config.validate().empty());

    platform::BackendKind kind;
    assert(platform::parse_backend_kind(config.backend, kind));
    assert(kind == platform::BackendKind::CUDA);
    std::cout << "[PASS] All sections parsed\n";
}

void test_errors_keep_defaults() {
    std::istringstream yaml(
        "engine:\n"
        "  grid_rows: lots\n"
        "  turbo: true\n"
        "  just some text\n"
        "network:\n"
        "  port: 80\n"
        "cuda:\n"
        "  device: 2\n");

    EngineConfig config;
    assert(config.parse(yaml));
    assert(config.errors.size() == 4);
    assert(config.errors[0].find("Line 2") == 0);
    assert(config.grid_rows == 64);
    assert(config.cuda_device == 2);
    std::cout << "[PASS] Bad lines reported per line\n";
}

void test_validate_ranges() {
    EngineConfig config;

    config.backend = "opencl";
    assert(!config.validate().empty());
    config.backend = "cpu";

    config.grid_rows = 0;
    assert(!config.validate().empty());
    config.grid_rows = 64;

    config.start_offset = -1;
    assert(!config.validate().empty());
    config.start_offset = ROW_COUNTER_MAX - 63;     // last of 64 rows at the limit
    assert(config.validate().empty());
    config.start_offset = ROW_COUNTER_MAX - 62;
    assert(!config.validate().empty());
    config.start_offset = 0;

    config.cuda_device = -1;
    assert(!config.validate().empty());
    std::cout << "[PASS] Range validation\n";
}

void test_load_file() {
    auto path = std::filesystem::temp_directory_path() / "tritpow_test_config.yml";
    {
        std::ofstream file(path);
        file << "engine:\n  grid_rows: 16\n";
    }

    EngineConfig config;
    assert(config.load(path.string()));
    assert(config.grid_rows == 16);
    std::filesystem::remove(path);

    EngineConfig missing;
    assert(!missing.load(path.string()));
    assert(missing.errors.size() == 1);
    std::cout << "[PASS] Explicit config path\n";
}

void test_engine_from_config() {
    auto log_dir = std::filesystem::temp_directory_path() / "tritpow_test_config_logs";
    std::filesystem::remove_all(log_dir);

    engine::EventLoop loop;
    std::string error;

    EngineConfig config;
    config.grid_rows = 3;
    config.cpu_threads = 1;
    config.log_dir = log_dir.string();

    auto searcher = engine::create_engine(config, loop, error);
    assert(searcher);
    assert(error.empty());
    assert(searcher->initialize().ok());
    assert(searcher->backend().get_dimensions().y == 3);
    assert(std::filesystem::exists(Logger::instance().get_log_path()));
    assert(searcher->checkpoint_path() == CheckpointStore::path_for(config.checkpoint_dir, "search"));

    config.checkpoint_dir.clear();
    auto no_checkpoints = engine::create_engine(config, loop, error);
    assert(no_checkpoints);
    assert(no_checkpoints->checkpoint_path().empty());

    config.grid_rows = 0;
    assert(!engine::create_engine(config, loop, error));
    assert(!error.empty());

    searcher.reset();
    std::cout << "[PASS] Engine built from config\n";
}

int main() {
    std::cout << "=== Engine Config Tests ===\n\n";

    test_defaults();
    test_parse_sections();
    test_errors_keep_defaults();
    test_validate_ranges();
    test_load_file();
    test_engine_from_config();

    std::cout << "\n=== All config tests passed! ===\n";
    return 0;
}
