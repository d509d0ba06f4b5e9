/**
 * @file test_error_handling.cpp
 * @brief Exception hierarchy, worker pool failure propagation and stage timing
 */

#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>
#include "../src/core/NeuroDecodeExceptions.h"
#include "../src/core/ProcessingTimer.h"
#include "../src/core/ThreadPool.h"

using namespace neurodecode;
using Category = NeuroDecodeException::Category;
using Severity = NeuroDecodeException::Severity;

TEST(ExceptionHierarchyTest, CategoriesAndSeverities) {
    std::vector<std::unique_ptr<NeuroDecodeException>> exceptions;
    exceptions.push_back(std::make_unique<DataIOException>("regressors.ndm", "read", "truncated"));
    exceptions.push_back(std::make_unique<ShapeMismatchException>("RunLayout", "trial mask size", 450, 449));
    exceptions.push_back(std::make_unique<NumericalException>("FisherZ", "correlation of one", 1.0));
    exceptions.push_back(std::make_unique<ConfigurationException>("run_length", "0", "positive integer"));
    exceptions.push_back(std::make_unique<ResourceException>("ThreadPool", "enqueue on stopped pool"));

    const Category categories[] = {Category::InputOutput, Category::Validation, Category::Numerical,
                                   Category::Configuration, Category::Resource};
    for (size_t i = 0; i < exceptions.size(); ++i) {
        EXPECT_EQ(exceptions[i]->GetCategory(), categories[i]);
        EXPECT_FALSE(exceptions[i]->GetRecoverySuggestions().empty());
        EXPECT_FALSE(std::string(exceptions[i]->what()).empty());
    }

    EXPECT_EQ(exceptions[0]->GetSeverity(), Severity::Fatal);
    EXPECT_EQ(exceptions[4]->GetSeverity(), Severity::Critical);
    EXPECT_EQ(exceptions[3]->GetSeverity(), Severity::Error);
}

TEST(ExceptionHierarchyTest, MessagesNameTheProblem) {
    DataIOException io("folds.txt", "parse", "line 3");
    EXPECT_NE(io.GetMessage().find("folds.txt"), std::string::npos);
    EXPECT_NE(io.GetMessage().find("line 3"), std::string::npos);
    EXPECT_EQ(io.GetFunction(), "parse");

    ShapeMismatchException shape("SearchlightAnalysis", "regressor rows", 450, 449);
    EXPECT_EQ(shape.GetExpected(), 450u);
    EXPECT_EQ(shape.GetActual(), 449u);
    EXPECT_EQ(shape.GetComponent(), "SearchlightAnalysis");
    EXPECT_NE(shape.GetMessage().find("expected 450, got 449"), std::string::npos);

    ConfigurationException config("correlation_policy", "round");
    EXPECT_EQ(config.GetMessage().find("expected"), std::string::npos);

    NumericalException numeric("FisherZ", "correlation of one", 1.0);
    EXPECT_NE(numeric.GetDetailedContext().find("Offending value: 1"), std::string::npos);
}

TEST(ExceptionHierarchyTest, FormattedReport) {
    ConfigurationException e("threads", "-2", "non-negative integer");
    const std::string report = e.GetFormattedReport();

    EXPECT_NE(report.find("=== NeuroDecode Error Report ==="), std::string::npos);
    EXPECT_NE(report.find("Severity: ERROR"), std::string::npos);
    EXPECT_NE(report.find("Category: CONFIGURATION"), std::string::npos);
    EXPECT_NE(report.find("Message: Invalid configuration parameter 'threads'"), std::string::npos);
    EXPECT_NE(report.find("Recovery Suggestions:"), std::string::npos);
    EXPECT_NE(report.find("  1. "), std::string::npos);

    EXPECT_EQ(NeuroDecodeException::CategoryToString(Category::InputOutput), "INPUT_OUTPUT");
    EXPECT_EQ(NeuroDecodeException::SeverityToString(Severity::Warning), "WARNING");
}

TEST(ExceptionHierarchyTest, CatchableAsStdException) {
    try {
        throw ShapeMismatchException("AccuracyAggregator", "reported values", 3, 2);
    } catch (const std::exception& e) {
        EXPECT_NE(std::string(e.what()).find("reported values"), std::string::npos);
        return;
    }
    FAIL() << "exception not caught";
}

TEST(ThreadPoolTest, RunsEveryTask) {
    ThreadPool pool(4);
    EXPECT_EQ(pool.GetNumThreads(), 4u);

    std::atomic<int> sum(0);
    std::vector<std::future<int>> futures;
    for (int i = 1; i <= 100; ++i) {
        futures.push_back(pool.Enqueue([&sum](int value) {
            sum += value;
            return value * 2;
        }, i));
    }

    int doubled = 0;
    for (auto& future : futures) {
        doubled += future.get();
    }
    EXPECT_EQ(sum.load(), 5050);
    EXPECT_EQ(doubled, 10100);
}

TEST(ThreadPoolTest, ExceptionsReachTheCaller) {
    ThreadPool pool(2);

    auto ok = pool.Enqueue([]() { return 7; });
    auto failing = pool.Enqueue([]() -> int {
        throw NumericalException("FisherZ", "correlation of one", 1.0);
    });

    EXPECT_EQ(ok.get(), 7);
    EXPECT_THROW(failing.get(), NumericalException);
}

TEST(ThreadPoolTest, DestructorFinishesQueuedWork) {
    std::atomic<int> completed(0);
    {
        ThreadPool pool(1);
        for (int i = 0; i < 20; ++i) {
            pool.Enqueue([&completed]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                ++completed;
            });
        }
    }
    EXPECT_EQ(completed.load(), 20);
}

TEST(ThreadPoolTest, DefaultThreadCount) {
    EXPECT_GT(ThreadPool::DefaultThreadCount(), 0u);
    ThreadPool pool;
    EXPECT_EQ(pool.GetNumThreads(), ThreadPool::DefaultThreadCount());
}

TEST(ProcessingTimerTest, RecordsStagesInOrder) {
    ProcessingTimer timer;
    timer.BeginStage("conditioning");
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    timer.BeginStage("searchlight sweep");
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    timer.EndStage();
    timer.EndStage();

    const auto& stages = timer.GetStages();
    ASSERT_EQ(stages.size(), 2u);
    EXPECT_EQ(stages[0].first, "conditioning");
    EXPECT_EQ(stages[1].first, "searchlight sweep");
    EXPECT_GE(stages[0].second, 1.0);
    EXPECT_NEAR(timer.TotalMilliseconds(), stages[0].second + stages[1].second, 1e-9);

    std::ostringstream out;
    timer.PrintSummary(out);
    EXPECT_NE(out.str().find("conditioning"), std::string::npos);
    EXPECT_NE(out.str().find("total"), std::string::npos);
}
