// NOCKLEDGER - CPU Miner
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License
//
// Proof-of-work nonce search. MineBlock() is a synchronous, cancellable unit
// of work; Miner runs it on worker threads, away from any wallet lock.

#ifndef NOCKLEDGER_MINER_MINER_H
#define NOCKLEDGER_MINER_MINER_H

#include "nockledger/core/block.h"
#include "nockledger/core/status.h"
#include "nockledger/core/types.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace nockledger {
namespace miner {

// ============================================================================
// Mining Options
// ============================================================================

struct MinerOptions {
    /// Number of worker threads for Miner (0 = half the hardware threads)
    int numThreads{1};

    /// First nonce tried
    uint64_t startNonce{0};

    /// Last nonce tried (inclusive)
    uint64_t maxNonce{UINT64_MAX};

    /// Tries between checks of the stop flag
    uint64_t checkInterval{0x1000};

    /// Tries between timestamp refreshes (0 disables)
    uint64_t timestampRefreshInterval{100000};

    /// Tries between progress callbacks
    uint64_t progressInterval{0x100000};
};

/// Snapshot handed to the progress callback
struct MiningProgress {
    /// Hashes computed by this search so far
    uint64_t hashesComputed{0};
    /// Next nonce to be tried
    uint64_t nonce{0};
    BlockHeight height{0};
    /// True on the final report of a search
    bool finished{false};
};

using ProgressCallback = std::function<void(const MiningProgress&)>;

// ============================================================================
// Mining Functions
// ============================================================================

/**
 * Search nonces in [startNonce, maxNonce] until the header meets its target.
 *
 * The stop flag is polled every checkInterval tries and the timestamp is
 * refreshed every timestampRefreshInterval tries.
 *
 * @return The solved header, Consensus("Mining cancelled") if stopped, or
 *         Consensus("Failed to find valid nonce") if the range is exhausted
 */
Result<BlockHeader> MineBlock(BlockHeader header,
                              const MinerOptions& options,
                              const std::atomic<bool>& stop,
                              const ProgressCallback& progress = {});

/// Mine a block's header in place
Result<Block> MineBlock(Block block,
                        const MinerOptions& options,
                        const std::atomic<bool>& stop,
                        const ProgressCallback& progress = {});

// ============================================================================
// Mining Statistics
// ============================================================================

struct MiningStats {
    std::atomic<uint64_t> hashesComputed{0};
    std::atomic<uint32_t> blocksFound{0};
    /// Unix seconds when mining last started
    std::atomic<int64_t> startTime{0};

    /// Hashes per second since startTime
    double GetHashRate() const;

    void Reset();
};

// ============================================================================
// Miner Class
// ============================================================================

/**
 * Threaded CPU miner.
 *
 * Start() splits the nonce range across the worker threads. The first
 * thread to find a solution stops the others; the finished callback runs
 * exactly once per Start(), on a worker thread, with either the solved
 * block or the reason no block was produced.
 *
 * Stop() and Wait() may be called from any thread. From inside the finished
 * callback they only request cancellation; the workers are joined by the
 * next Start(), Stop() or Wait() on another thread, or by the destructor,
 * which must not run on a worker thread.
 */
class Miner {
public:
    using FinishedCallback = std::function<void(const Result<Block>& result)>;

    explicit Miner(const MinerOptions& options = {});

    /// Stops and joins any running search
    ~Miner();

    Miner(const Miner&) = delete;
    Miner& operator=(const Miner&) = delete;

    /**
     * Begin mining `block` in the background.
     * @return false if a search is already running
     */
    bool Start(const Block& block, FinishedCallback onFinished);

    /// Request cancellation and join the workers
    void Stop();

    /// Block until the current search ends
    void Wait();

    bool IsRunning() const { return running_.load(); }

    void SetProgressCallback(ProgressCallback callback);

    const MiningStats& GetStats() const { return stats_; }

    const MinerOptions& GetOptions() const { return options_; }

private:
    void MiningThread(int threadId, Block block, uint64_t first, uint64_t last);

    /// Deliver the outcome; false if one was already delivered
    bool Finish(const Result<Block>& result);

    void JoinThreads();

    MinerOptions options_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shouldStop_{false};
    std::atomic<bool> reported_{false};
    std::atomic<int> activeThreads_{0};
    std::mutex threadsMutex_;
    std::vector<std::thread> threads_;

    mutable std::mutex mutex_;
    FinishedCallback onFinished_;
    ProgressCallback progressCallback_;
    Status lastError_;

    MiningStats stats_;
};

/// Resolve a requested thread count (0 = half the hardware threads, >= 1)
int GetMiningThreadCount(int requestedThreads);

} // namespace miner
} // namespace nockledger

#endif // NOCKLEDGER_MINER_MINER_H
