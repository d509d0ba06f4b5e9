#include <gtest/gtest.h>
#include <future>
#include <vector>
#include "../src/core/NeuroDecodeExceptions.h"
#include "../src/core/ThreadPool.h"
#include "../src/searchlight/AccuracyAggregator.h"

using namespace neurodecode;
using namespace neurodecode::searchlight;

class AccuracyAggregatorTest : public ::testing::Test {
protected:
    static Vector Values(double a, double b) {
        Vector v(2);
        v[0] = a;
        v[1] = b;
        return v;
    }
};

TEST_F(AccuracyAggregatorTest, ColumnsAreSortedByLocation) {
    AccuracyAggregator aggregator(2);
    aggregator.Add(0, 300, Values(0.3, -0.3));
    aggregator.Add(1, 100, Values(0.1, -0.1));
    aggregator.AddZero(2, 250);
    aggregator.Add(3, 200, Values(0.2, -0.2));

    AccuracyResult result = aggregator.Finalize();
    ASSERT_EQ(result.GetNumberOfSearchlights(), 4u);
    EXPECT_EQ(result.location_ids, (std::vector<int32_t>{100, 200, 250, 300}));
    EXPECT_EQ(result.permutation, (std::vector<size_t>{1, 3, 2, 0}));

    EXPECT_DOUBLE_EQ(result.accuracy(0, 0), 0.1);
    EXPECT_DOUBLE_EQ(result.accuracy(1, 1), -0.2);
    EXPECT_DOUBLE_EQ(result.accuracy(0, 2), 0.0);
    EXPECT_DOUBLE_EQ(result.accuracy(1, 2), 0.0);
    EXPECT_DOUBLE_EQ(result.accuracy(0, 3), 0.3);
}

TEST_F(AccuracyAggregatorTest, EnumerationOrderComesFromSequenceNumbers) {
    // Reports may arrive in any order; ties keep enumeration order
    AccuracyAggregator aggregator(2);
    aggregator.Add(5, 10, Values(5.0, 0.0));
    aggregator.Add(2, 10, Values(2.0, 0.0));
    aggregator.Add(9, 5, Values(9.0, 0.0));

    AccuracyResult result = aggregator.Finalize();
    EXPECT_EQ(result.location_ids, (std::vector<int32_t>{5, 10, 10}));
    EXPECT_EQ(result.permutation, (std::vector<size_t>{2, 0, 1}));
    EXPECT_DOUBLE_EQ(result.accuracy(0, 1), 2.0);
    EXPECT_DOUBLE_EQ(result.accuracy(0, 2), 5.0);
}

TEST_F(AccuracyAggregatorTest, EmptyResult) {
    AccuracyAggregator aggregator(3);
    AccuracyResult result = aggregator.Finalize();
    EXPECT_EQ(result.GetNumberOfSearchlights(), 0u);
    EXPECT_EQ(result.accuracy.rows(), 3u);
    EXPECT_EQ(result.accuracy.cols(), 0u);
}

TEST_F(AccuracyAggregatorTest, InvalidReports) {
    EXPECT_THROW(AccuracyAggregator(0), ConfigurationException);

    AccuracyAggregator aggregator(2);
    EXPECT_THROW(aggregator.Add(0, 1, Vector(3, 0.0)), ShapeMismatchException);

    aggregator.Add(0, 1, Values(1.0, 1.0));
    EXPECT_THROW(aggregator.Add(0, 2, Values(1.0, 1.0)), NeuroDecodeException);
    EXPECT_EQ(aggregator.GetNumberOfEntries(), 1u);
}

TEST_F(AccuracyAggregatorTest, ConcurrentReports) {
    const size_t total = 2000;
    AccuracyAggregator aggregator(2);

    {
        ThreadPool pool(4);
        std::vector<std::future<void>> futures;
        for (size_t begin = 0; begin < total; begin += 100) {
            futures.push_back(pool.Enqueue([&aggregator, begin, total]() {
                for (size_t i = begin; i < begin + 100; ++i) {
                    const int32_t location = static_cast<int32_t>(total - i);
                    aggregator.Add(i, location, Values(static_cast<double>(i), 0.0));
                }
            }));
        }
        for (auto& future : futures) {
            future.get();
        }
    }

    EXPECT_EQ(aggregator.GetNumberOfEntries(), total);
    AccuracyResult result = aggregator.Finalize();
    for (size_t column = 0; column < total; ++column) {
        EXPECT_EQ(result.location_ids[column], static_cast<int32_t>(column + 1));
        EXPECT_EQ(result.permutation[column], total - 1 - column);
        EXPECT_DOUBLE_EQ(result.accuracy(0, static_cast<unsigned>(column)),
                         static_cast<double>(total - 1 - column));
    }
}
