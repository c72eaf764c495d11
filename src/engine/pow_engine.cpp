/**
 * Proof-of-Work Search Engine - implementation
 */

#include "pow_engine.hpp"

#include <algorithm>
#include <bit>
#include <exception>
#include <utility>
#include <vector>

#include "../core/bitslice.hpp"
#include "../core/curl.hpp"
#include "../core/logger.hpp"
#include "../core/pow_verifier.hpp"
#include "../core/trytes.hpp"
#include "../gpu/kernels.hpp"

namespace tritpow {
namespace engine {

using platform::ErrorCode;
using platform::Result;

const char* engine_state_name(EngineState state) {
    switch (state) {
        case EngineState::Ready:       return "Ready";
        case EngineState::Searching:   return "Searching";
        case EngineState::Interrupted: return "Interrupted";
        case EngineState::Faulted:     return "Faulted";
        default: return "Unknown";
    }
}

PowEngine::PowEngine(std::unique_ptr<platform::IComputeBackend> backend, EventLoop& loop,
                     EngineOptions options)
    : backend_(std::move(backend)), loop_(loop), options_(options) {}

PowEngine::~PowEngine() {
    shutdown();
}

Result PowEngine::initialize() {
    if (initialized_) {
        return {ErrorCode::Success, "Already initialized"};
    }
    if (!backend_) {
        return {ErrorCode::InvalidDevice, "No compute backend"};
    }
    if (options_.grid_rows < 1) {
        return {ErrorCode::InvalidArgument, "grid_rows must be positive"};
    }
    if (!row_offset_fits(options_.start_offset, options_.grid_rows)) {
        return {ErrorCode::InvalidArgument, "Row offset " + std::to_string(options_.start_offset) +
                                            " overflows the row field"};
    }

    platform::GridSpec spec;
    spec.width = GRID_WIDTH;
    spec.height = options_.grid_rows;

    Result result = backend_->initialize(spec);
    if (!result) {
        Logger::instance().log_backend_error(backend_->get_backend_name(), result.message);
        return result;
    }

    result = gpu::register_kernels(*backend_);
    if (!result) {
        Logger::instance().log_backend_error(backend_->get_backend_name(), result.message);
        backend_->shutdown();
        return result;
    }

    initialized_ = true;
    state_ = EngineState::Ready;
    Logger::instance().log_engine_start(backend_->get_backend_name(), spec.width, spec.height);
    return {ErrorCode::Success, ""};
}

void PowEngine::shutdown() {
    if (!initialized_) return;

    if (!options_.checkpoint_path.empty()) {
        if (std::optional<SearchCheckpoint> parked = parked_job()) {
            if (!CheckpointStore::save(*parked, options_.checkpoint_path)) {
                LOG_WARN("Parked job not saved, it will be cancelled");
            }
        }
    }

    std::vector<SearchJob> cancelled;
    if (active_) {
        cancelled.push_back(std::move(*active_));
        active_.reset();
    }
    for (auto& job : queue_) {
        cancelled.push_back(std::move(job));
    }
    queue_.clear();

    backend_->shutdown();
    initialized_ = false;
    if (state_ != EngineState::Faulted) {
        state_ = EngineState::Ready;
    }

    for (auto& job : cancelled) {
        job.callback({{ErrorCode::Cancelled, "Engine shut down"}, "", job.rounds});
    }
}

Result PowEngine::set_offset(int64_t offset) {
    if (!row_offset_fits(offset, options_.grid_rows)) {
        return {ErrorCode::InvalidArgument,
                "Row offset " + std::to_string(offset) + " with " + std::to_string(options_.grid_rows) +
                " rows overflows the row field (|counter| <= " + std::to_string(ROW_COUNTER_MAX) + ")"};
    }
    options_.start_offset = offset;
    return {ErrorCode::Success, ""};
}

Result PowEngine::validate(const SearchStates& states, int difficulty, const SearchCallback& callback) const {
    if (state_ == EngineState::Faulted) {
        return {ErrorCode::DeviceLost, "Engine faulted after a backend failure"};
    }
    if (!initialized_) {
        return {ErrorCode::NotInitialized, "Engine not initialized"};
    }
    if (difficulty <= 0 || difficulty >= HASH_LENGTH) {
        return {ErrorCode::InvalidArgument,
                "Difficulty must be in (0, " + std::to_string(HASH_LENGTH) + "), got " +
                std::to_string(difficulty)};
    }
    if (states.low.size() != static_cast<size_t>(STATE_LENGTH) ||
        states.high.size() != static_cast<size_t>(STATE_LENGTH)) {
        return {ErrorCode::InvalidArgument, "State must hold " + std::to_string(STATE_LENGTH) + " cells"};
    }
    if (!bitslice::is_well_formed(states)) {
        return {ErrorCode::InvalidArgument, "State holds an invalid (0,0) cell"};
    }
    if (!callback) {
        return {ErrorCode::InvalidArgument, "Missing callback"};
    }
    return {ErrorCode::Success, ""};
}

Result PowEngine::search(const SearchStates& states, int difficulty, SearchCallback callback) {
    Result result = validate(states, difficulty, callback);
    if (!result) return result;

    SearchJob job;
    job.states = states;
    job.difficulty = difficulty;
    job.callback = std::move(callback);
    return enqueue(std::move(job), false);
}

Result PowEngine::search_with_trytes(const std::string& transaction_trytes, int difficulty,
                                     SearchCallback callback) {
    if (transaction_trytes.size() != static_cast<size_t>(TRANSACTION_TRYTES)) {
        return {ErrorCode::InvalidArgument,
                "Transaction must be " + std::to_string(TRANSACTION_TRYTES) + " trytes, got " +
                std::to_string(transaction_trytes.size())};
    }
    if (!is_trytes(transaction_trytes)) {
        return {ErrorCode::InvalidArgument, "Transaction holds a character outside the tryte alphabet"};
    }

    Trits trits = trits_from_trytes(transaction_trytes);

    // Mid-state: sponge over every block but the last, then the last block
    // (which carries the nonce) copied in untransformed.
    cpu::Curl curl;
    curl.absorb(trits, 0, TRANSACTION_LENGTH - HASH_LENGTH);
    Trits mid(curl.state().begin(), curl.state().end());
    std::copy(trits.end() - HASH_LENGTH, trits.end(), mid.begin());

    SearchStates states = bitslice::encode(mid);
    Result result = validate(states, difficulty, callback);
    if (!result) return result;

    SearchJob job;
    job.states = std::move(states);
    job.difficulty = difficulty;
    job.callback = std::move(callback);
    job.transaction = transaction_trytes;
    return enqueue(std::move(job), false);
}

std::future<std::string> PowEngine::search_async(const std::string& transaction_trytes, int difficulty) {
    auto promise = std::make_shared<std::promise<std::string>>();
    std::future<std::string> future = promise->get_future();

    Result result = search_with_trytes(transaction_trytes, difficulty,
        [promise](const SearchOutcome& outcome) {
            if (outcome.status.ok()) {
                promise->set_value(outcome.nonce);
            } else {
                promise->set_exception(std::make_exception_ptr(SearchError(outcome.status)));
            }
        });

    if (!result) {
        promise->set_exception(std::make_exception_ptr(SearchError(result)));
    }
    return future;
}

Result PowEngine::enqueue(SearchJob job, bool at_head) {
    job.id = next_id_++;
    uint64_t id = job.id;
    int difficulty = job.difficulty;

    if (at_head) {
        queue_.push_front(std::move(job));
    } else {
        queue_.push_back(std::move(job));
    }
    Logger::instance().log_job_queued(id, difficulty, queue_.size());

    if (state_ == EngineState::Ready) {
        start_next();
    }
    return {ErrorCode::Success, ""};
}

void PowEngine::start_next() {
    if (active_ || state_ != EngineState::Ready || queue_.empty()) {
        return;
    }

    active_ = std::move(queue_.front());
    queue_.pop_front();
    state_ = EngineState::Searching;

    SearchJob& job = *active_;
    if (!job.started) {
        job.started = true;
        job.offset = options_.start_offset;
    }
    job.started_at = std::chrono::steady_clock::now();
    Logger::instance().log_job_started(job.id, job.offset, job.rounds);

    Result result = backend_->write_data(bitslice::pack_texels(job.states));
    if (result) {
        result = backend_->run_program(gpu::PROGRAM_INIT, 1, {{gpu::UNIFORM_OFFSET, job.offset}});
    }
    if (!result) {
        fault(result);
        return;
    }

    post_round(job.id);
}

void PowEngine::post_round(uint64_t job_id) {
    std::weak_ptr<int> alive = alive_;
    loop_.post([this, alive, job_id] {
        if (alive.expired()) return;
        run_round(job_id);
    });
}

void PowEngine::run_round(uint64_t job_id) {
    if (!active_ || active_->id != job_id) {
        return;
    }

    SearchJob& job = *active_;

    Result result = backend_->run_program(gpu::PROGRAM_INCREMENT, 1);
    if (result) result = backend_->run_program(gpu::PROGRAM_TWIST, NUMBER_OF_ROUNDS);
    if (result) {
        result = backend_->run_program(gpu::PROGRAM_CHECK, 1, {{gpu::UNIFORM_MIN_WEIGHT, job.difficulty}});
    }
    if (result) result = backend_->run_program(gpu::PROGRAM_COL_CHECK, 1);

    std::vector<int32_t> flag;
    if (result) result = backend_->read_data(FLAG_COLUMN, 0, 1, 1, flag);
    if (!result) {
        fault(result);
        return;
    }

    job.rounds++;

    int32_t row = flag[2];
    if (row != SEARCH_PENDING) {
        complete(row, flag[3]);
        return;
    }

    if (state_ == EngineState::Interrupted) {
        park();
        return;
    }

    post_round(job_id);
}

void PowEngine::complete(int32_t row, int32_t mask) {
    std::vector<int32_t> cells;
    Result result = backend_->run_program(gpu::PROGRAM_FINALIZE, 1);
    if (result) result = backend_->read_data(0, 0, HASH_LENGTH, 1, cells);
    if (!result) {
        fault(result);
        return;
    }

    std::vector<int32_t> low(NONCE_LENGTH);
    std::vector<int32_t> high(NONCE_LENGTH);
    for (int i = 0; i < NONCE_LENGTH; i++) {
        size_t cell = static_cast<size_t>(NONCE_START + i) * TEXEL_SIZE;
        low[i] = cells[cell + 2];
        high[i] = cells[cell + 3];
    }

    int lane = std::countr_zero(static_cast<uint32_t>(mask));
    std::string nonce;
    try {
        nonce = trytes_from_trits(bitslice::decode_lane(low.data(), high.data(), NONCE_LENGTH, lane));
    } catch (const std::invalid_argument& e) {
        fault({ErrorCode::KernelFailed, std::string("Corrupt result readback: ") + e.what()});
        return;
    }

    SearchJob job = std::move(*active_);
    active_.reset();

    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - job.started_at).count();
    Logger::instance().log_nonce_found(job.id, job.rounds, nonce, elapsed);
    LOG_DEBUG("Job " + std::to_string(job.id) + " matched on row " + std::to_string(row) +
              ", lane " + std::to_string(lane));

    if (options_.verify_results && !job.transaction.empty() &&
        !verify_nonce(job.transaction, nonce, job.difficulty)) {
        LOG_WARN("VERIFY_FAILED: Job=" + std::to_string(job.id) + ", Nonce=" + nonce +
                 " does not reach MWM=" + std::to_string(job.difficulty));
    }

    // An interrupt that arrived during the final round keeps the engine parked
    if (state_ == EngineState::Searching) {
        state_ = EngineState::Ready;
    }

    std::weak_ptr<int> alive = alive_;
    job.callback({{ErrorCode::Success, ""}, nonce, job.rounds});
    if (alive.expired()) return;

    start_next();
}

void PowEngine::park() {
    std::vector<int32_t> row0;
    Result result = backend_->read_data(0, 0, STATE_LENGTH, 1, row0);
    if (!result) {
        fault(result);
        return;
    }

    SearchJob job = std::move(*active_);
    active_.reset();
    job.states = bitslice::unpack_texels(row0);

    Logger::instance().log_job_parked(job.id, job.rounds);
    queue_.push_front(std::move(job));
}

void PowEngine::interrupt() {
    if (state_ == EngineState::Searching) {
        state_ = EngineState::Interrupted;
        LOG_INFO("ENGINE_INTERRUPT: pending at end of round");
    }
}

void PowEngine::resume() {
    if (state_ != EngineState::Interrupted) {
        return;
    }

    if (active_) {
        // The running job has not reached a round boundary yet
        state_ = EngineState::Searching;
        return;
    }

    state_ = EngineState::Ready;
    start_next();
}

bool PowEngine::remove() {
    if (queue_.empty()) {
        return false;
    }

    SearchJob job = std::move(queue_.back());
    queue_.pop_back();
    LOG_INFO("JOB_REMOVED: Job=" + std::to_string(job.id));

    job.callback({{ErrorCode::Cancelled, "Removed from queue"}, "", job.rounds});
    return true;
}

std::optional<SearchCheckpoint> PowEngine::parked_job() const {
    if (state_ != EngineState::Interrupted || active_ || queue_.empty() || !queue_.front().started) {
        return std::nullopt;
    }

    const SearchJob& job = queue_.front();
    SearchCheckpoint checkpoint;
    checkpoint.difficulty = job.difficulty;
    checkpoint.offset = job.offset;
    checkpoint.rounds = job.rounds;
    checkpoint.states = job.states;
    checkpoint.valid = true;
    return checkpoint;
}

Result PowEngine::restore(const SearchCheckpoint& checkpoint, SearchCallback callback) {
    if (!checkpoint.valid) {
        return {ErrorCode::InvalidArgument, "Invalid checkpoint: " + checkpoint.error};
    }

    Result result = validate(checkpoint.states, checkpoint.difficulty, callback);
    if (!result) return result;
    if (!row_offset_fits(checkpoint.offset, options_.grid_rows)) {
        return {ErrorCode::InvalidArgument,
                "Checkpoint offset " + std::to_string(checkpoint.offset) + " overflows the row field"};
    }

    SearchJob job;
    job.states = checkpoint.states;
    job.difficulty = checkpoint.difficulty;
    job.callback = std::move(callback);
    job.rounds = checkpoint.rounds;
    job.started = true;
    job.offset = checkpoint.offset;

    LOG_INFO("CHECKPOINT_RESTORE: Rounds=" + std::to_string(checkpoint.rounds) +
             ", Offset=" + std::to_string(checkpoint.offset));
    return enqueue(std::move(job), true);
}

Result PowEngine::restore_saved(SearchCallback callback) {
    const std::string& path = options_.checkpoint_path;
    if (path.empty()) {
        return {ErrorCode::NotSupported, "No checkpoint path configured"};
    }
    if (!CheckpointStore::exists(path)) {
        return {ErrorCode::InvalidArgument, "No saved search at " + path};
    }

    Result result = restore(CheckpointStore::load(path), std::move(callback));
    if (result) {
        CheckpointStore::clear(path);
    }
    return result;
}

void PowEngine::fault(const Result& result) {
    Logger::instance().log_backend_error(backend_->get_backend_name(), result.message);
    state_ = EngineState::Faulted;

    std::vector<SearchJob> failed;
    if (active_) {
        failed.push_back(std::move(*active_));
        active_.reset();
    }
    for (auto& job : queue_) {
        failed.push_back(std::move(job));
    }
    queue_.clear();

    for (auto& job : failed) {
        job.callback({result, "", job.rounds});
    }
}

std::unique_ptr<PowEngine> create_engine(const EngineConfig& config, EventLoop& loop, std::string& error) {
    error = config.validate();
    if (!error.empty()) {
        return nullptr;
    }

    platform::BackendKind kind;
    if (!platform::parse_backend_kind(config.backend, kind)) {
        error = "Unknown backend: " + config.backend;
        return nullptr;
    }

    auto backend = platform::create_backend(kind, config.cpu_threads, config.cuda_device);
    if (!backend) {
        error = "Backend '" + config.backend + "' not available in this build";
        return nullptr;
    }

    Logger& logger = Logger::instance();
    if (!logger.init(config.log_dir)) {
        error = "Failed to open log in '" + config.log_dir + "'";
        return nullptr;
    }
    logger.set_min_level(config.debug ? Logger::Level::DEBUG : Logger::Level::INFO);

    EngineOptions options;
    options.grid_rows = config.grid_rows;
    options.start_offset = config.start_offset;
    options.verify_results = config.verify_results;
    if (!config.checkpoint_dir.empty()) {
        options.checkpoint_path = CheckpointStore::path_for(config.checkpoint_dir, "search");
    }
    return std::make_unique<PowEngine>(std::move(backend), loop, options);
}

}  // namespace engine
}  // namespace tritpow
