// NOCKLEDGER - CPU Miner Implementation
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include "nockledger/miner/miner.h"
#include "nockledger/consensus/params.h"
#include "nockledger/util/logging.h"

#include <algorithm>

namespace nockledger {
namespace miner {

namespace {

const char* const MSG_CANCELLED = "Mining cancelled";
const char* const MSG_EXHAUSTED = "Failed to find valid nonce";

// Set on Miner worker threads, where the finished callback runs
thread_local bool inMiningThread = false;

} // namespace

// ============================================================================
// Mining Functions
// ============================================================================

Result<BlockHeader> MineBlock(BlockHeader header,
                              const MinerOptions& options,
                              const std::atomic<bool>& stop,
                              const ProgressCallback& progress) {
    if (options.startNonce > options.maxNonce) {
        return Status::Consensus("Invalid nonce range");
    }

    const Hash256 target = consensus::CompactToTarget(header.bits);
    const uint64_t checkInterval = std::max<uint64_t>(options.checkInterval, 1);
    uint64_t tries = 0;
    uint64_t nonce = options.startNonce;

    auto report = [&](uint64_t next, bool finished) {
        if (progress) {
            progress(MiningProgress{tries, next, header.height, finished});
        }
    };

    while (true) {
        if (tries % checkInterval == 0 && stop.load(std::memory_order_relaxed)) {
            report(nonce, true);
            return Status::Consensus(MSG_CANCELLED);
        }

        header.nonce = nonce;
        ++tries;
        if (consensus::MeetsTarget(header.GetHash(), target)) {
            report(nonce, true);
            return header;
        }

        if (options.timestampRefreshInterval != 0 &&
            tries % options.timestampRefreshInterval == 0) {
            header.timestamp = GetTime();
        }
        if (options.progressInterval != 0 && tries % options.progressInterval == 0) {
            report(nonce + 1, false);
        }

        if (nonce == options.maxNonce) {
            break;
        }
        ++nonce;
    }

    report(nonce, true);
    return Status::Consensus(MSG_EXHAUSTED);
}

Result<Block> MineBlock(Block block,
                        const MinerOptions& options,
                        const std::atomic<bool>& stop,
                        const ProgressCallback& progress) {
    auto header = MineBlock(block.header, options, stop, progress);
    if (!header) {
        return header.status();
    }
    block.header = header.Take();
    return std::move(block);
}

// ============================================================================
// Mining Statistics
// ============================================================================

double MiningStats::GetHashRate() const {
    int64_t start = startTime.load();
    if (start == 0) return 0.0;
    int64_t elapsed = static_cast<int64_t>(GetTime()) - start;
    if (elapsed <= 0) return 0.0;
    return static_cast<double>(hashesComputed.load()) / static_cast<double>(elapsed);
}

void MiningStats::Reset() {
    hashesComputed = 0;
    blocksFound = 0;
    startTime = static_cast<int64_t>(GetTime());
}

// ============================================================================
// Miner Implementation
// ============================================================================

Miner::Miner(const MinerOptions& options) : options_(options) {}

Miner::~Miner() {
    Stop();
}

bool Miner::Start(const Block& block, FinishedCallback onFinished) {
    if (running_.exchange(true)) {
        return false;
    }
    JoinThreads();

    shouldStop_.store(false);
    reported_.store(false);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        onFinished_ = std::move(onFinished);
        lastError_ = Status::Consensus(MSG_EXHAUSTED);
    }
    stats_.Reset();

    uint64_t first = std::min(options_.startNonce, options_.maxNonce);
    uint64_t span = options_.maxNonce - first;
    int numThreads = GetMiningThreadCount(options_.numThreads);
    if (span < static_cast<uint64_t>(numThreads)) {
        numThreads = static_cast<int>(std::max<uint64_t>(span, 1));
    }
    uint64_t chunk = span / static_cast<uint64_t>(numThreads);

    LOG_INFO(util::LogCategory::MINING) << "Starting miner with " << numThreads
        << " thread(s) at height " << block.header.height
        << ", bits 0x" << std::hex << block.header.bits << std::dec;

    activeThreads_.store(numThreads);
    std::lock_guard<std::mutex> lock(threadsMutex_);
    threads_.reserve(numThreads);
    for (int i = 0; i < numThreads; ++i) {
        uint64_t lo = first + static_cast<uint64_t>(i) * chunk;
        uint64_t hi = (i == numThreads - 1) ? options_.maxNonce : lo + chunk - 1;
        threads_.emplace_back(&Miner::MiningThread, this, i, block, lo, hi);
    }
    return true;
}

void Miner::Stop() {
    shouldStop_.store(true);
    if (inMiningThread) {
        // The last worker clears running_ once the others have stopped
        return;
    }
    JoinThreads();
    running_.store(false);
}

void Miner::Wait() {
    JoinThreads();
}

void Miner::SetProgressCallback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    progressCallback_ = std::move(callback);
}

void Miner::JoinThreads() {
    if (inMiningThread) {
        return;
    }
    std::lock_guard<std::mutex> lock(threadsMutex_);
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

bool Miner::Finish(const Result<Block>& result) {
    if (reported_.exchange(true)) {
        return false;
    }
    FinishedCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = onFinished_;
    }
    if (callback) {
        callback(result);
    }
    return true;
}

void Miner::MiningThread(int threadId, Block block, uint64_t first, uint64_t last) {
    inMiningThread = true;
    util::ScopedLogTimer timer(util::LogCategory::MINING,
                               "Mining thread " + std::to_string(threadId));

    MinerOptions opts = options_;
    opts.startNonce = first;
    opts.maxNonce = last;

    ProgressCallback userProgress;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        userProgress = progressCallback_;
    }

    uint64_t counted = 0;
    auto onProgress = [&](const MiningProgress& p) {
        stats_.hashesComputed += p.hashesComputed - counted;
        counted = p.hashesComputed;
        if (userProgress) {
            userProgress(p);
        }
    };

    auto result = MineBlock(std::move(block), opts, shouldStop_, onProgress);
    if (result) {
        shouldStop_.store(true);
        // Threads racing on the same target may both solve it; the first
        // report wins
        if (Finish(result)) {
            stats_.blocksFound++;
            LOG_INFO(util::LogCategory::MINING) << "Thread " << threadId
                << " found block at height " << result->header.height
                << " nonce " << result->header.nonce
                << " hash " << result->GetHash().ToHex().substr(0, 16) << "...";
        }
    } else {
        LogDebugF(util::LogCategory::MINING, "Thread %d stopped after %llu hashes: %s",
                  threadId, static_cast<unsigned long long>(counted),
                  result.status().message().c_str());
        if (result.status().message() == MSG_CANCELLED) {
            std::lock_guard<std::mutex> lock(mutex_);
            lastError_ = result.status();
        }
    }

    if (activeThreads_.fetch_sub(1) == 1) {
        LogInfoF(util::LogCategory::MINING, "Miner finished: %llu hashes, %u block(s), %.1f H/s",
                 static_cast<unsigned long long>(stats_.hashesComputed.load()),
                 stats_.blocksFound.load(), stats_.GetHashRate());
        Status error;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            error = lastError_;
        }
        Finish(error);
        running_.store(false);
    }
}

// ============================================================================
// Utility Functions
// ============================================================================

int GetMiningThreadCount(int requestedThreads) {
    if (requestedThreads > 0) {
        return requestedThreads;
    }
    int hwThreads = static_cast<int>(std::thread::hardware_concurrency());
    return std::max(1, hwThreads / 2);
}

} // namespace miner
} // namespace nockledger
