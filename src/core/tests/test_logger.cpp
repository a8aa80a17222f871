/**
 * @file test_logger.cpp
 * @brief Logger facade tests
 */

#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "codec/ScriptCodec.hpp"
#include "logging/Logger.hpp"

using namespace block_script;

TEST(Logger, InitAndGetFromSeveralThreads) {
    std::vector<std::thread> threads;
    std::vector<int> got_logger(8, 0);

    for (size_t i = 0; i < got_logger.size(); ++i) {
        threads.emplace_back([i, &got_logger]() {
            if (i % 2 == 0) {
                Logger::init("test_logger.log", "debug", 1024 * 1024, 1, false, true);
            }
            for (int n = 0; n < 50; ++n) {
                auto logger = Logger::get();
                if (!logger) return;
                LOG_DEBUG("thread {} message {}", i, n);
            }
            got_logger[i] = 1;
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (size_t i = 0; i < got_logger.size(); ++i) {
        EXPECT_EQ(got_logger[i], 1) << "thread " << i;
    }
    EXPECT_NE(Logger::get(), nullptr);
}

TEST(Logger, ConcurrentDecodesLog) {
    Logger::init("test_logger.log", "debug", 1024 * 1024, 1, false, true);
    auto registry = descriptors::DescriptorRegistry::builtin();

    std::vector<std::thread> threads;
    std::vector<size_t> block_counts(4, 0);
    for (size_t i = 0; i < block_counts.size(); ++i) {
        threads.emplace_back([i, &registry, &block_counts]() {
            auto script = codec::decodeScript("BLOCK:RawCode\nint a;\nBLOCK:Parse\nMODE:LR\n=> VAR @x\n", *registry);
            block_counts[i] = script.size();
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (size_t count : block_counts) {
        EXPECT_EQ(count, 2u);
    }
}
