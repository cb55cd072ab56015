#include "UnitTestCommon.h"

#include <engine/Logger.h>

#include <thread>
#include <vector>

using namespace StbGeom::Engine;

class utLogger : public ::testing::Test {};

TEST_F(utLogger, linesBelowTheMinimumLevelAreDropped) {
    StreamLogger logger(LogLevel::Warning);
    ::testing::internal::CaptureStdout();
    ::testing::internal::CaptureStderr();
    logger.info("Orchestrator", "{} solids", 3);
    logger.warn("Orchestrator", "section '{}' not found", "S9");
    const std::string out = ::testing::internal::GetCapturedStdout();
    const std::string err = ::testing::internal::GetCapturedStderr();
    EXPECT_EQ("", out);
    EXPECT_EQ("Orchestrator Warning: section 'S9' not found\n", err);
}

TEST_F(utLogger, levelCanChangeWhileWorkersLog) {
    StreamLogger logger(LogLevel::Error);
    ::testing::internal::CaptureStdout();
    ::testing::internal::CaptureStderr();
    std::vector<std::thread> workers;
    for (int w = 0; w < 4; ++w) {
        workers.emplace_back([&logger, w] {
            for (int i = 0; i < 200; ++i) {
                logger.info("Worker", "{} {}", w, i);
            }
        });
    }
    for (int i = 0; i < 200; ++i) {
        logger.setMinimumLevel(i % 2 ? LogLevel::Info : LogLevel::Error);
    }
    for (auto& worker : workers) worker.join();
    ::testing::internal::GetCapturedStdout();
    ::testing::internal::GetCapturedStderr();

    logger.setMinimumLevel(LogLevel::Warning);
    EXPECT_EQ(LogLevel::Warning, logger.minimumLevel());
}
