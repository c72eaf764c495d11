/**
 * Proof-of-Work Search Engine
 *
 * Turns a stream of search requests into a serialized, interruptible job
 * queue bound to one compute backend.
 *
 * Job lifecycle:
 *   search() -> queue -> start_next() -> [round]* -> callback -> start_next()
 *
 * One round = increment -> twist x81 -> check -> col_check -> flag readback.
 * Each round is posted to the EventLoop as its own task, so interrupt(),
 * resume() and new requests interleave with a running search.
 *
 * Only one job is on the backend at a time. Jobs start in FIFO order; an
 * interrupted job is snapshotted and put back at the head of the queue.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "../core/engine_config.hpp"
#include "../core/search_state.hpp"
#include "../core/types.hpp"
#include "../platform/backend.hpp"
#include "event_loop.hpp"

namespace tritpow {
namespace engine {

enum class EngineState {
    Ready,          // idle, next request starts immediately
    Searching,      // a job is on the backend
    Interrupted,    // parked; requests queue until resume()
    Faulted         // backend failed; engine unusable
};

const char* engine_state_name(EngineState state);

/**
 * Delivered to the job's callback exactly once.
 */
struct SearchOutcome {
    platform::Result status;
    std::string nonce;          // NONCE_TRYTES trytes, empty unless status.ok()
    uint64_t rounds = 0;        // rounds run for this job, across resumes
};

using SearchCallback = std::function<void(const SearchOutcome&)>;

/**
 * Exception carried by search_async() futures.
 */
class SearchError : public std::runtime_error {
public:
    explicit SearchError(const platform::Result& result)
        : std::runtime_error(std::string(platform::error_code_name(result.code)) + ": " + result.message),
          code_(result.code) {}

    platform::ErrorCode code() const { return code_; }

private:
    platform::ErrorCode code_;
};

struct EngineOptions {
    int grid_rows = 64;             // 32 candidates per row per round
    int64_t start_offset = 0;       // row counter offset for new jobs
    bool verify_results = true;     // re-hash found nonces on the host
    std::string checkpoint_path;    // parked job saved here on shutdown, empty = off
};

class PowEngine {
public:
    PowEngine(std::unique_ptr<platform::IComputeBackend> backend, EventLoop& loop,
              EngineOptions options = {});
    ~PowEngine();

    PowEngine(const PowEngine&) = delete;
    PowEngine& operator=(const PowEngine&) = delete;

    /**
     * Allocate the grid and register the kernels.
     */
    platform::Result initialize();

    /**
     * Cancel every pending job and release the backend. A parked job is
     * first written to the checkpoint path, if one is configured.
     */
    void shutdown();

    /**
     * Queue a search over an encoded mid-state (see bitslice::encode).
     * Parameter errors are returned here and the callback is never called.
     */
    platform::Result search(const SearchStates& states, int difficulty, SearchCallback callback);

    /**
     * Queue a search for a full transaction. The sponge is run over all but
     * the last hash block on the host; the callback receives the nonce that
     * replaces the transaction's last NONCE_TRYTES trytes.
     */
    platform::Result search_with_trytes(const std::string& transaction_trytes, int difficulty,
                                        SearchCallback callback);

    /**
     * Future-returning search_with_trytes(). Failures surface as SearchError.
     * The future becomes ready only while the EventLoop is being run.
     */
    std::future<std::string> search_async(const std::string& transaction_trytes, int difficulty);

    /**
     * Park the active job at the end of its current round.
     */
    void interrupt();

    /**
     * Withdraw a pending interrupt, or restart the job at the head.
     */
    void resume();

    /**
     * Row counter offset used by jobs started from now on. Rows offset ..
     * offset + grid_rows - 1 must fit the row field (see ROW_COUNTER_MAX);
     * otherwise InvalidArgument and the offset is unchanged.
     */
    platform::Result set_offset(int64_t offset);

    /**
     * Drop the most recently queued job. Its callback receives Cancelled.
     * Returns false if nothing was queued.
     */
    bool remove();

    /**
     * Snapshot of the parked job at the head of the queue, if any.
     */
    std::optional<SearchCheckpoint> parked_job() const;

    /**
     * Put a saved job back at the head of the queue.
     */
    platform::Result restore(const SearchCheckpoint& checkpoint, SearchCallback callback);

    /**
     * restore() the job saved by an earlier shutdown(). The file is removed
     * once the job is queued.
     */
    platform::Result restore_saved(SearchCallback callback);

    EngineState state() const { return state_; }
    bool active() const { return active_.has_value(); }
    size_t queued() const { return queue_.size(); }
    int64_t offset() const { return options_.start_offset; }
    const std::string& checkpoint_path() const { return options_.checkpoint_path; }
    platform::IComputeBackend& backend() { return *backend_; }

private:
    struct SearchJob {
        uint64_t id = 0;
        SearchStates states;
        int difficulty = 0;
        SearchCallback callback;
        uint64_t rounds = 0;
        bool started = false;
        int64_t offset = 0;
        std::string transaction;    // for host verification, may be empty
        std::chrono::steady_clock::time_point started_at;
    };

    platform::Result validate(const SearchStates& states, int difficulty, const SearchCallback& callback) const;
    platform::Result enqueue(SearchJob job, bool at_head);
    void start_next();
    void post_round(uint64_t job_id);
    void run_round(uint64_t job_id);
    void complete(int32_t row, int32_t mask);
    void park();
    void fault(const platform::Result& result);

    std::unique_ptr<platform::IComputeBackend> backend_;
    EventLoop& loop_;
    EngineOptions options_;

    EngineState state_ = EngineState::Ready;
    bool initialized_ = false;
    uint64_t next_id_ = 1;

    std::optional<SearchJob> active_;
    std::deque<SearchJob> queue_;

    // Tasks posted to the loop hold a weak reference; they do nothing once
    // the engine is gone.
    std::shared_ptr<int> alive_ = std::make_shared<int>(0);
};

/**
 * Engine from a loaded configuration: picks the backend, applies the engine
 * options and starts the logger. Returns nullptr (and sets `error`) if the
 * configuration is invalid or the backend was not compiled in. The engine is
 * not yet initialized.
 */
std::unique_ptr<PowEngine> create_engine(const EngineConfig& config, EventLoop& loop, std::string& error);

}  // namespace engine
}  // namespace tritpow
