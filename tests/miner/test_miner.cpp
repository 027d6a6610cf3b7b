// NOCKLEDGER - Miner Tests
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include <gtest/gtest.h>

#include "nockledger/consensus/params.h"
#include "nockledger/core/block.h"
#include "nockledger/miner/miner.h"
#include "nockledger/util/logging.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace nockledger {
namespace miner {
namespace {

constexpr uint32_t EASY_BITS = 0x1fffffff;
constexpr uint32_t IMPOSSIBLE_BITS = 0x03000001;

BlockHeader MakeHeader(uint32_t bits) {
    BlockHeader header;
    header.version = BLOCK_VERSION;
    header.timestamp = GetTime();
    header.bits = bits;
    header.height = 3;
    return header;
}

/// Captures the finished callback of a Miner run
class Outcome {
public:
    void Set(const Result<Block>& result) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_;
        if (result) {
            block_ = *result;
        } else {
            status_ = result.status();
        }
        cv_.notify_all();
    }

    bool WaitFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return calls_ > 0; });
    }

    int Calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }
    std::optional<Block> GetBlock() {
        std::lock_guard<std::mutex> lock(mutex_);
        return block_;
    }
    Status GetStatus() {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    int calls_{0};
    std::optional<Block> block_;
    Status status_;
};

// ============================================================================
// MineBlock
// ============================================================================

TEST(MineBlockTest, FindsNonceForEasyTarget) {
    std::atomic<bool> stop{false};
    auto result = MineBlock(MakeHeader(EASY_BITS), MinerOptions{}, stop);
    ASSERT_TRUE(result.ok()) << result.status().ToString();
    EXPECT_TRUE(result->MeetsDifficulty());
    EXPECT_TRUE(consensus::CheckProofOfWork(result->GetHash(), EASY_BITS));
}

TEST(MineBlockTest, ExhaustedRangeFails) {
    MinerOptions opts;
    opts.maxNonce = 999;
    std::atomic<bool> stop{false};

    std::vector<MiningProgress> reports;
    auto result = MineBlock(MakeHeader(IMPOSSIBLE_BITS), opts, stop,
                            [&](const MiningProgress& p) { reports.push_back(p); });

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), Status::CONSENSUS);
    EXPECT_EQ(result.status().message(), "Failed to find valid nonce");

    ASSERT_FALSE(reports.empty());
    EXPECT_TRUE(reports.back().finished);
    EXPECT_EQ(reports.back().hashesComputed, 1000u);
    EXPECT_EQ(reports.back().height, 3u);
}

TEST(MineBlockTest, PreSetStopCancelsImmediately) {
    std::atomic<bool> stop{true};
    auto result = MineBlock(MakeHeader(IMPOSSIBLE_BITS), MinerOptions{}, stop);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().message(), "Mining cancelled");
}

TEST(MineBlockTest, StopFromAnotherThread) {
    std::atomic<bool> stop{false};
    MinerOptions opts;
    opts.checkInterval = 64;

    std::thread stopper([&stop] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        stop = true;
    });
    auto result = MineBlock(MakeHeader(IMPOSSIBLE_BITS), opts, stop);
    stopper.join();

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().message(), "Mining cancelled");
}

TEST(MineBlockTest, RejectsInvertedRange) {
    MinerOptions opts;
    opts.startNonce = 10;
    opts.maxNonce = 5;
    std::atomic<bool> stop{false};
    auto result = MineBlock(MakeHeader(EASY_BITS), opts, stop);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().message(), "Invalid nonce range");
}

TEST(MineBlockTest, ProgressIsReportedPeriodically) {
    MinerOptions opts;
    opts.maxNonce = 4095;
    opts.progressInterval = 1024;
    std::atomic<bool> stop{false};

    std::vector<MiningProgress> reports;
    auto result = MineBlock(MakeHeader(IMPOSSIBLE_BITS), opts, stop,
                            [&](const MiningProgress& p) { reports.push_back(p); });
    EXPECT_FALSE(result.ok());

    // Four periodic reports plus the final one
    ASSERT_EQ(reports.size(), 5u);
    EXPECT_EQ(reports[0].hashesComputed, 1024u);
    EXPECT_EQ(reports[0].nonce, 1024u);
    EXPECT_FALSE(reports[0].finished);
    EXPECT_TRUE(reports[4].finished);
}

TEST(MineBlockTest, MinedBlockPassesValidation) {
    Block block = Block::Create(Hash256(), {}, EASY_BITS, 1);
    std::atomic<bool> stop{false};
    auto mined = MineBlock(std::move(block), MinerOptions{}, stop);
    ASSERT_TRUE(mined.ok());
    EXPECT_TRUE(mined->Validate(consensus::ChainParams::Regtest()).ok());
}

// ============================================================================
// Miner
// ============================================================================

TEST(MinerTest, ThreadsFindBlock) {
    MinerOptions opts;
    opts.numThreads = 2;
    Miner miner(opts);
    Outcome outcome;

    Block block = Block::Create(Hash256(), {}, EASY_BITS, 7);
    ASSERT_TRUE(miner.Start(block, [&](const Result<Block>& r) { outcome.Set(r); }));
    miner.Wait();

    EXPECT_EQ(outcome.Calls(), 1);
    auto found = outcome.GetBlock();
    ASSERT_TRUE(found.has_value());
    EXPECT_TRUE(found->MeetsDifficulty());
    EXPECT_EQ(found->header.height, 7u);
    EXPECT_EQ(miner.GetStats().blocksFound.load(), 1u);
    EXPECT_FALSE(miner.IsRunning());
}

TEST(MinerTest, StopReportsCancellation) {
    MinerOptions opts;
    opts.numThreads = 2;
    opts.checkInterval = 64;
    Miner miner(opts);
    Outcome outcome;

    Block block = Block::Create(Hash256(), {}, IMPOSSIBLE_BITS, 1);
    ASSERT_TRUE(miner.Start(block, [&](const Result<Block>& r) { outcome.Set(r); }));
    EXPECT_TRUE(miner.IsRunning());
    EXPECT_FALSE(miner.Start(block, [](const Result<Block>&) {}));

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    miner.Stop();

    EXPECT_FALSE(miner.IsRunning());
    EXPECT_EQ(outcome.Calls(), 1);
    EXPECT_FALSE(outcome.GetBlock().has_value());
    EXPECT_EQ(outcome.GetStatus().message(), "Mining cancelled");
}

TEST(MinerTest, ExhaustionReportsFailure) {
    MinerOptions opts;
    opts.numThreads = 2;
    opts.maxNonce = 2000;
    Miner miner(opts);
    Outcome outcome;

    Block block = Block::Create(Hash256(), {}, IMPOSSIBLE_BITS, 1);
    ASSERT_TRUE(miner.Start(block, [&](const Result<Block>& r) { outcome.Set(r); }));
    ASSERT_TRUE(outcome.WaitFor(std::chrono::seconds(30)));
    miner.Wait();

    EXPECT_EQ(outcome.Calls(), 1);
    EXPECT_EQ(outcome.GetStatus().message(), "Failed to find valid nonce");
    EXPECT_EQ(miner.GetStats().hashesComputed.load(), 2001u);
}

TEST(MinerTest, CanRestartAfterFinishing) {
    Miner miner;
    Outcome first;
    Outcome second;

    Block block = Block::Create(Hash256(), {}, EASY_BITS, 1);
    ASSERT_TRUE(miner.Start(block, [&](const Result<Block>& r) { first.Set(r); }));
    miner.Wait();
    ASSERT_TRUE(miner.Start(block, [&](const Result<Block>& r) { second.Set(r); }));
    miner.Wait();

    EXPECT_TRUE(first.GetBlock().has_value());
    EXPECT_TRUE(second.GetBlock().has_value());
}

TEST(MinerTest, StopInsideFinishedCallback) {
    MinerOptions opts;
    opts.numThreads = 2;
    Miner miner(opts);
    Outcome outcome;

    Block block = Block::Create(Hash256(), {}, EASY_BITS, 2);
    ASSERT_TRUE(miner.Start(block, [&](const Result<Block>& r) {
        miner.Stop();
        miner.Wait();
        outcome.Set(r);
    }));
    ASSERT_TRUE(outcome.WaitFor(std::chrono::seconds(30)));
    miner.Wait();

    EXPECT_EQ(outcome.Calls(), 1);
    EXPECT_TRUE(outcome.GetBlock().has_value());
    EXPECT_FALSE(miner.IsRunning());
}

TEST(MinerTest, StopAndWaitFromDifferentThreads) {
    MinerOptions opts;
    opts.numThreads = 2;
    opts.checkInterval = 64;
    Miner miner(opts);
    Outcome outcome;

    Block block = Block::Create(Hash256(), {}, IMPOSSIBLE_BITS, 1);
    ASSERT_TRUE(miner.Start(block, [&](const Result<Block>& r) { outcome.Set(r); }));

    std::thread waiter([&] { miner.Wait(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    miner.Stop();
    waiter.join();

    EXPECT_FALSE(miner.IsRunning());
    EXPECT_EQ(outcome.Calls(), 1);
    EXPECT_EQ(outcome.GetStatus().message(), "Mining cancelled");
}

TEST(MinerTest, LogsRunSummary) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();
    logger.SetLevel(util::LogLevel::Info);
    logger.EnableAllCategories();

    std::mutex logMutex;
    std::vector<std::string> messages;
    logger.AddSink(std::make_shared<util::CallbackSink>([&](const util::LogEntry& entry) {
        std::lock_guard<std::mutex> lock(logMutex);
        if (entry.category == util::LogCategory::MINING) {
            messages.push_back(entry.message);
        }
    }));

    MinerOptions opts;
    opts.numThreads = 1;
    opts.maxNonce = 500;
    Miner miner(opts);
    Outcome outcome;
    Block block = Block::Create(Hash256(), {}, IMPOSSIBLE_BITS, 1);
    ASSERT_TRUE(miner.Start(block, [&](const Result<Block>& r) { outcome.Set(r); }));
    miner.Wait();
    logger.ClearSinks();

    bool found = false;
    for (const auto& message : messages) {
        if (message.find("Miner finished: 501 hashes, 0 block(s), ") == 0) {
            found = true;
        }
    }
    EXPECT_TRUE(found);
}

TEST(MinerTest, ThreadCountResolution) {
    EXPECT_EQ(GetMiningThreadCount(3), 3);
    EXPECT_GE(GetMiningThreadCount(0), 1);
}

} // namespace
} // namespace miner
} // namespace nockledger
