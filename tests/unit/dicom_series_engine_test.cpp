// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "core/dicom_series_engine.hpp"
#include "core/tag_reader.hpp"

#include "test_utils/mock_decoding_backend.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <latch>
#include <thread>

namespace dicom_organizer::core::test {

using test_utils::MockBackendState;
using test_utils::makeFile;
using test_utils::makeImage;
using test_utils::makeMockLauncher;

// ============================================================================
// Test fixture
// ============================================================================
class DicomSeriesEngineTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        state_ = std::make_shared<MockBackendState>();
        state_->volumeImage = makeImage(3);
        state_->sliceImage = makeImage(2, 4, PixelType::UInt8);
    }

    std::unique_ptr<DicomSeriesEngine> makeEngine(EngineConfig config = {})
    {
        return std::make_unique<DicomSeriesEngine>(std::move(config), makeMockLauncher(state_));
    }

    /// Three files of one series whose Instance Numbers arrive as 3, 1, 2
    std::vector<DicomFile> shuffledSeries()
    {
        state_->tagsByFile["f1.dcm"] = {{"0020|0013", "3"}};
        state_->tagsByFile["f2.dcm"] = {{"0020|0013", "1"}};
        state_->tagsByFile["f3.dcm"] = {{"0020|0013", "2"}};
        return {makeFile("f1.dcm"), makeFile("f2.dcm"), makeFile("f3.dcm")};
    }

    std::shared_ptr<MockBackendState> state_;
};

// ============================================================================
// End-to-end workflow
// ============================================================================
TEST_F(DicomSeriesEngineTest, CategorizeOrdersEachVolume)
{
    auto engine = makeEngine();
    auto files = shuffledSeries();

    auto volumes = engine->categorize(files);

    ASSERT_TRUE(volumes.has_value()) << volumes.error().message;
    ASSERT_EQ(volumes->size(), 1u);
    const auto& group = volumes->begin()->second;
    ASSERT_EQ(group.size(), 3u);
    EXPECT_TRUE(group[0].sameAs(files[1]));
    EXPECT_TRUE(group[1].sameAs(files[2]));
    EXPECT_TRUE(group[2].sameAs(files[0]));
}

TEST_F(DicomSeriesEngineTest, CategorizedVolumeBuildsInOrder)
{
    auto engine = makeEngine();
    auto volumes = engine->categorize(shuffledSeries());
    ASSERT_TRUE(volumes.has_value());

    auto volume = engine->buildVolume(volumes->begin()->second);

    ASSERT_TRUE(volume.has_value()) << volume.error().message;
    EXPECT_EQ(volume->dimension, 3u);
    EXPECT_TRUE(volume->spatial.isPopulated(3));

    ASSERT_EQ(state_->seriesReads.size(), 1u);
    const std::vector<std::string> expectedPaths = {"f2.dcm", "f3.dcm", "f1.dcm"};
    EXPECT_EQ(state_->seriesReads[0].paths, expectedPaths);
    EXPECT_TRUE(state_->seriesReads[0].singleSortedSeries);
}

TEST_F(DicomSeriesEngineTest, SortingDisabledKeepsBackendOrder)
{
    EngineConfig config;
    config.sortByInstanceNumber = false;
    auto engine = makeEngine(config);
    auto files = shuffledSeries();

    auto volumes = engine->categorize(files);
    ASSERT_TRUE(volumes.has_value());
    const auto& group = volumes->begin()->second;
    ASSERT_EQ(group.size(), 3u);
    EXPECT_TRUE(group[0].sameAs(files[0]));
    EXPECT_TRUE(state_->tagReadPaths.empty());

    ASSERT_TRUE(engine->buildVolume(group).has_value());
    ASSERT_EQ(state_->seriesReads.size(), 1u);
    EXPECT_FALSE(state_->seriesReads[0].singleSortedSeries);
}

TEST_F(DicomSeriesEngineTest, OrderingFailureFailsCategorize)
{
    auto engine = makeEngine();
    auto files = shuffledSeries();
    state_->failTagReads = true;

    auto volumes = engine->categorize(files);

    ASSERT_FALSE(volumes.has_value());
    EXPECT_EQ(volumes.error().code, EngineError::OrderError);
}

TEST_F(DicomSeriesEngineTest, ProgressReportedDuringCategorize)
{
    auto engine = makeEngine();
    std::vector<std::pair<size_t, size_t>> reports;
    engine->setProgressCallback([&reports](size_t current, size_t total, const std::string&) {
        reports.emplace_back(current, total);
    });

    ASSERT_TRUE(engine->categorize(shuffledSeries()).has_value());

    ASSERT_GE(reports.size(), 2u);
    EXPECT_EQ(reports.back().first, reports.back().second);
}

TEST_F(DicomSeriesEngineTest, ReadTagsAndSliceThroughFacade)
{
    auto engine = makeEngine();
    auto files = shuffledSeries();

    auto tags = engine->readTags(files[0], {kInstanceNumberTag});
    ASSERT_TRUE(tags.has_value());
    EXPECT_EQ(tags->at("InstanceNumber"), "3");

    auto slice = engine->getSlice(files[0], true);
    ASSERT_TRUE(slice.has_value()) << slice.error().message;
    EXPECT_EQ(slice->pixelType, PixelType::UInt8);
}

TEST_F(DicomSeriesEngineTest, OrderByInstanceThroughFacade)
{
    auto engine = makeEngine();
    auto files = shuffledSeries();

    auto ordered = engine->orderByInstance(files);

    ASSERT_TRUE(ordered.has_value());
    ASSERT_EQ(ordered->size(), 3u);
    EXPECT_TRUE((*ordered)[0].sameAs(files[1]));
}

// ============================================================================
// Lifecycle
// ============================================================================
TEST_F(DicomSeriesEngineTest, OperationsShareOneBackend)
{
    auto engine = makeEngine();
    auto files = shuffledSeries();

    ASSERT_TRUE(engine->categorize(files).has_value());
    ASSERT_TRUE(engine->getSlice(files[0]).has_value());
    ASSERT_TRUE(engine->buildVolume(files).has_value());

    EXPECT_EQ(state_->launchCount.load(), 1);
    EXPECT_TRUE(engine->isInitialized());
}

TEST_F(DicomSeriesEngineTest, ConcurrentFirstCallsLaunchOnce)
{
    constexpr int kThreadCount = 4;
    state_->launchDelay = std::chrono::milliseconds(30);
    auto engine = makeEngine();

    std::latch startLatch(kThreadCount);
    std::atomic<int> successCount{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreadCount; ++i) {
        threads.emplace_back([&] {
            startLatch.arrive_and_wait();
            if (engine->initialize().has_value()) {
                successCount.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(state_->launchCount.load(), 1);
    EXPECT_EQ(successCount.load(), kThreadCount);
}

TEST_F(DicomSeriesEngineTest, InitFailureSurfacesFromEveryOperation)
{
    state_->failLaunch = true;
    auto engine = makeEngine();
    auto file = makeFile("a.dcm");

    auto volumes = engine->categorize({file});
    ASSERT_FALSE(volumes.has_value());
    EXPECT_EQ(volumes.error().code, EngineError::InitError);

    auto slice = engine->getSlice(file);
    ASSERT_FALSE(slice.has_value());
    EXPECT_EQ(slice.error().code, EngineError::InitError);

    EXPECT_EQ(state_->launchCount.load(), 1);
}

TEST_F(DicomSeriesEngineTest, ShutdownThenReuse)
{
    auto engine = makeEngine();
    ASSERT_TRUE(engine->initialize().has_value());

    engine->shutdown();
    EXPECT_FALSE(engine->isInitialized());

    ASSERT_TRUE(engine->getSlice(makeFile("a.dcm")).has_value());
    EXPECT_EQ(state_->launchCount.load(), 2);
}

TEST_F(DicomSeriesEngineTest, LaterEngineKeepsExistingLoggingSetup)
{
    logging::LoggerFactory::configure(logging::LogConfig{});

    EngineConfig config;
    config.logging.level = logging::LogLevel::Error;
    auto engine = makeEngine(config);

    EXPECT_EQ(logging::LoggerFactory::getGlobalLevel(), logging::LogLevel::Info);
    EXPECT_EQ(engine->config().logging.level, logging::LogLevel::Error);
}

TEST_F(DicomSeriesEngineTest, MovedEngineKeepsWorking)
{
    auto engine = makeEngine();
    DicomSeriesEngine moved(std::move(*engine));

    EXPECT_TRUE(moved.config().sortByInstanceNumber);
    EXPECT_TRUE(moved.getSlice(makeFile("a.dcm")).has_value());
}

} // namespace dicom_organizer::core::test
