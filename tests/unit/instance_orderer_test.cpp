#include "core/instance_orderer.hpp"

#include "test_utils/mock_decoding_backend.hpp"

#include <gtest/gtest.h>

#include <limits>

namespace dicom_organizer::core::test {

using test_utils::MockBackendState;
using test_utils::makeFile;
using test_utils::makeMockLauncher;

// ============================================================================
// Test fixture
// ============================================================================
class InstanceOrdererTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        state_ = std::make_shared<MockBackendState>();
        gateway_ = std::make_unique<BackendGateway>(BackendConfig{}, makeMockLauncher(state_));
        tagReader_ = std::make_unique<TagReader>(*gateway_);
        orderer_ = std::make_unique<InstanceOrderer>(*tagReader_);
    }

    /// File whose Instance Number the mock backend reports as @p value
    DicomFile numberedFile(const std::string& name, const std::string& value)
    {
        state_->tagsByFile[name] = {{kInstanceNumberTag.tag, value}};
        return makeFile(name);
    }

    std::shared_ptr<MockBackendState> state_;
    std::unique_ptr<BackendGateway> gateway_;
    std::unique_ptr<TagReader> tagReader_;
    std::unique_ptr<InstanceOrderer> orderer_;
};

// ============================================================================
// Ordering
// ============================================================================
TEST_F(InstanceOrdererTest, OrdersByInstanceNumber)
{
    auto f3 = numberedFile("f3.dcm", "3");
    auto f1 = numberedFile("f1.dcm", "1");
    auto f2 = numberedFile("f2.dcm", "2");

    auto ordered = orderer_->orderByInstance({f3, f1, f2});

    ASSERT_TRUE(ordered.has_value()) << ordered.error().message;
    ASSERT_EQ(ordered->size(), 3u);
    EXPECT_TRUE((*ordered)[0].sameAs(f1));
    EXPECT_TRUE((*ordered)[1].sameAs(f2));
    EXPECT_TRUE((*ordered)[2].sameAs(f3));
}

TEST_F(InstanceOrdererTest, OrdersNumericallyNotLexically)
{
    auto f10 = numberedFile("f10.dcm", "10");
    auto f9 = numberedFile("f9.dcm", "9");
    auto f100 = numberedFile("f100.dcm", "100");

    auto ordered = orderer_->orderByInstance({f100, f10, f9});

    ASSERT_TRUE(ordered.has_value());
    ASSERT_EQ(ordered->size(), 3u);
    EXPECT_TRUE((*ordered)[0].sameAs(f9));
    EXPECT_TRUE((*ordered)[1].sameAs(f10));
    EXPECT_TRUE((*ordered)[2].sameAs(f100));
}

TEST_F(InstanceOrdererTest, DuplicateNumberKeepsLaterFile)
{
    auto earlier = numberedFile("first.dcm", "5");
    auto later = numberedFile("second.dcm", "5");

    auto ordered = orderer_->orderByInstance({earlier, later});

    ASSERT_TRUE(ordered.has_value());
    ASSERT_EQ(ordered->size(), 1u);
    EXPECT_TRUE((*ordered)[0].sameAs(later));
}

TEST_F(InstanceOrdererTest, MissingInstanceNumberOrdersAsZero)
{
    auto f1 = numberedFile("f1.dcm", "1");
    auto unnumbered = makeFile("unnumbered.dcm");

    auto ordered = orderer_->orderByInstance({f1, unnumbered});

    ASSERT_TRUE(ordered.has_value());
    ASSERT_EQ(ordered->size(), 2u);
    EXPECT_TRUE((*ordered)[0].sameAs(unnumbered));
    EXPECT_TRUE((*ordered)[1].sameAs(f1));
}

TEST_F(InstanceOrdererTest, NonNumericInstanceNumberOrdersAsZero)
{
    auto f2 = numberedFile("f2.dcm", "2");
    auto garbage = numberedFile("garbage.dcm", "abc");

    auto ordered = orderer_->orderByInstance({f2, garbage});

    ASSERT_TRUE(ordered.has_value());
    ASSERT_EQ(ordered->size(), 2u);
    EXPECT_TRUE((*ordered)[0].sameAs(garbage));
}

TEST_F(InstanceOrdererTest, SameNameDifferentContentStaysDistinct)
{
    state_->tagsByFile["slice.dcm"] = {{kInstanceNumberTag.tag, "4"}};
    auto a = DicomFile::fromBytes("slice.dcm", {1});
    auto b = DicomFile::fromBytes("slice.dcm", {2});

    auto ordered = orderer_->orderByInstance({a, b});

    ASSERT_TRUE(ordered.has_value());
    ASSERT_EQ(ordered->size(), 1u);
    EXPECT_TRUE((*ordered)[0].sameAs(b));
    EXPECT_FALSE((*ordered)[0].sameAs(a));
}

TEST_F(InstanceOrdererTest, EmptyVolumeYieldsEmptyOrder)
{
    auto ordered = orderer_->orderByInstance({});
    ASSERT_TRUE(ordered.has_value());
    EXPECT_TRUE(ordered->empty());
}

TEST_F(InstanceOrdererTest, ReadsTagsInScanOrder)
{
    auto f3 = numberedFile("f3.dcm", "3");
    auto f1 = numberedFile("f1.dcm", "1");

    ASSERT_TRUE(orderer_->orderByInstance({f3, f1}).has_value());

    const std::vector<std::string> expected = {"f3.dcm", "f1.dcm"};
    EXPECT_EQ(state_->tagReadPaths, expected);
}

// ============================================================================
// Failure handling
// ============================================================================
TEST_F(InstanceOrdererTest, TagReadFailureIsOrderError)
{
    auto f1 = numberedFile("f1.dcm", "1");
    state_->failTagReads = true;

    auto ordered = orderer_->orderByInstance({f1});

    ASSERT_FALSE(ordered.has_value());
    EXPECT_EQ(ordered.error().code, EngineError::OrderError);
    EXPECT_NE(ordered.error().message.find("f1.dcm"), std::string::npos);
}

TEST_F(InstanceOrdererTest, LaunchFailurePassesThrough)
{
    state_->failLaunch = true;

    auto ordered = orderer_->orderByInstance({makeFile("f1.dcm")});

    ASSERT_FALSE(ordered.has_value());
    EXPECT_EQ(ordered.error().code, EngineError::InitError);
}

// ============================================================================
// Key parsing
// ============================================================================
TEST(InstanceOrderingKeyTest, ParsesPlainIntegers)
{
    EXPECT_EQ(InstanceOrderer::parseOrderingKey("42"), 42);
    EXPECT_EQ(InstanceOrderer::parseOrderingKey("0"), 0);
    EXPECT_EQ(InstanceOrderer::parseOrderingKey("-2"), -2);
}

TEST(InstanceOrderingKeyTest, SkipsLeadingWhitespaceAndPlus)
{
    EXPECT_EQ(InstanceOrderer::parseOrderingKey(" 7 "), 7);
    EXPECT_EQ(InstanceOrderer::parseOrderingKey("+4"), 4);
    EXPECT_EQ(InstanceOrderer::parseOrderingKey("\t12"), 12);
}

TEST(InstanceOrderingKeyTest, IgnoresTrailingText)
{
    EXPECT_EQ(InstanceOrderer::parseOrderingKey("12abc"), 12);
    EXPECT_EQ(InstanceOrderer::parseOrderingKey("3.5"), 3);
}

TEST(InstanceOrderingKeyTest, NonNumericYieldsZero)
{
    EXPECT_EQ(InstanceOrderer::parseOrderingKey(""), 0);
    EXPECT_EQ(InstanceOrderer::parseOrderingKey("abc"), 0);
    EXPECT_EQ(InstanceOrderer::parseOrderingKey("   "), 0);
}

TEST(InstanceOrderingKeyTest, SecondSignYieldsZero)
{
    EXPECT_EQ(InstanceOrderer::parseOrderingKey("+-3"), 0);
    EXPECT_EQ(InstanceOrderer::parseOrderingKey("++3"), 0);
    EXPECT_EQ(InstanceOrderer::parseOrderingKey("-+3"), 0);
}

TEST(InstanceOrderingKeyTest, OutOfRangeClampsToEnds)
{
    EXPECT_EQ(InstanceOrderer::parseOrderingKey("99999999999999999999"),
              std::numeric_limits<int64_t>::max());
    EXPECT_EQ(InstanceOrderer::parseOrderingKey("-99999999999999999999"),
              std::numeric_limits<int64_t>::min());
}

TEST(InstanceOrderingKeyTest, OrderByKeysCollapsesDuplicates)
{
    auto a = makeFile("a");
    auto b = makeFile("b");
    auto c = makeFile("c");

    auto ordered = InstanceOrderer::orderByKeys({{2, a}, {1, b}, {2, c}});

    ASSERT_EQ(ordered.size(), 2u);
    EXPECT_TRUE(ordered[0].sameAs(b));
    EXPECT_TRUE(ordered[1].sameAs(c));
}

} // namespace dicom_organizer::core::test
