#include <gtest/gtest.h>
#include <cmath>
#include <random>
#include "../src/core/NeuroDecodeExceptions.h"
#include "../src/searchlight/RegressorPreparer.h"
#include "../src/searchlight/RunLayout.h"
#include "../src/searchlight/TrialConditioner.h"

using namespace neurodecode;
using namespace neurodecode::searchlight;

class TrialConditioningTest : public ::testing::Test {
protected:
    void SetUp() override {
        rng.seed(1234);
    }

    Matrix RandomMatrix(unsigned rows, unsigned cols, double scale = 1.0, double offset = 0.0) {
        std::normal_distribution<double> normal(0.0, 1.0);
        Matrix m(rows, cols);
        for (unsigned r = 0; r < rows; ++r) {
            for (unsigned c = 0; c < cols; ++c) {
                m(r, c) = offset + scale * normal(rng);
            }
        }
        return m;
    }

    static double ColumnMean(const Matrix& m, unsigned col) {
        return m.get_column(col).mean();
    }

    static double ColumnSampleSd(const Matrix& m, unsigned col) {
        const double mean = ColumnMean(m, col);
        double ss = 0.0;
        for (unsigned r = 0; r < m.rows(); ++r) {
            ss += (m(r, col) - mean) * (m(r, col) - mean);
        }
        return std::sqrt(ss / (m.rows() - 1));
    }

    std::mt19937 rng;
};

TEST_F(TrialConditioningTest, FromTrialCountDerivesRunCount) {
    RunLayout layout = RunLayout::FromTrialCount(150, 50);
    EXPECT_EQ(layout.GetRunCount(), 3u);
    EXPECT_EQ(layout.GetRunLength(), 50u);
    EXPECT_EQ(layout.GetTotalTrials(), 150u);
    EXPECT_EQ(layout.GetRetainedCount(2), 50u);

    EXPECT_THROW(RunLayout::FromTrialCount(149, 50), ConfigurationException);
    EXPECT_THROW(RunLayout::FromTrialCount(0, 50), ConfigurationException);
    EXPECT_THROW(RunLayout::FromTrialCount(100, 0), ConfigurationException);
}

TEST_F(TrialConditioningTest, MaskMatrixIsReadOneColumnPerRun) {
    // 3 trials per run, 2 runs; exclude trial 2 of run 2
    Matrix mask(3, 2, 0.0);
    mask(1, 1) = 1.0;

    std::vector<bool> excluded = RunLayout::ExclusionFromMatrix(mask, 3, 2);
    ASSERT_EQ(excluded.size(), 6u);
    for (size_t i = 0; i < excluded.size(); ++i) {
        EXPECT_EQ(excluded[i], i == 4) << "trial " << i;
    }

    RunLayout layout(3, 2, excluded);
    EXPECT_TRUE(layout.IsExcluded(1, 1));
    EXPECT_EQ(layout.GetRetainedCount(0), 3u);
    EXPECT_EQ(layout.GetRetainedCount(1), 2u);
    EXPECT_EQ(layout.GetExcludedCount(1), 1u);
    EXPECT_EQ(layout.RetainedTrials(1), (std::vector<unsigned>{0, 2}));
}

TEST_F(TrialConditioningTest, MaskVectorIsReadInTrialOrder) {
    Matrix row_mask(1, 6, 0.0);
    row_mask(0, 0) = 1.0;
    Matrix column_mask(6, 1, 0.0);
    column_mask(5, 0) = 2.0;

    std::vector<bool> from_row = RunLayout::ExclusionFromMatrix(row_mask, 3, 2);
    std::vector<bool> from_column = RunLayout::ExclusionFromMatrix(column_mask, 3, 2);

    EXPECT_TRUE(from_row[0]);
    EXPECT_FALSE(from_row[5]);
    EXPECT_TRUE(from_column[5]);
    EXPECT_FALSE(from_column[0]);
}

TEST_F(TrialConditioningTest, MaskWithWrongShapeIsRejected) {
    Matrix mask(2, 3, 0.0);
    EXPECT_THROW(RunLayout::ExclusionFromMatrix(mask, 3, 2), ShapeMismatchException);

    Matrix short_mask(1, 5, 0.0);
    EXPECT_THROW(RunLayout::ExclusionFromMatrix(short_mask, 3, 2), ShapeMismatchException);

    EXPECT_THROW(RunLayout(3, 2, std::vector<bool>(5, false)), ShapeMismatchException);
}

TEST_F(TrialConditioningTest, ConditionedColumnsAreStandardized) {
    RunLayout layout(10, 3);
    Matrix activity = RandomMatrix(30, 5, 4.0, 12.0);

    TrialConditioner conditioner(layout);
    RunBlocks blocks = conditioner.Condition(activity);

    ASSERT_EQ(blocks.size(), 3u);
    for (const auto& block : blocks) {
        ASSERT_EQ(block.rows(), 10u);
        ASSERT_EQ(block.cols(), 5u);
        for (unsigned c = 0; c < block.cols(); ++c) {
            EXPECT_NEAR(ColumnMean(block, c), 0.0, 1e-12);
            EXPECT_NEAR(ColumnSampleSd(block, c), 1.0, 1e-12);
        }
    }
}

TEST_F(TrialConditioningTest, ConstantColumnIsOnlyCentred) {
    RunLayout layout(4, 2);
    Matrix activity = RandomMatrix(8, 2);
    for (unsigned r = 0; r < 8; ++r) {
        activity(r, 1) = 7.25;
    }

    RunBlocks blocks = TrialConditioner(layout).Condition(activity);
    for (const auto& block : blocks) {
        for (unsigned r = 0; r < block.rows(); ++r) {
            EXPECT_NEAR(block(r, 1), 0.0, 1e-12);
            EXPECT_TRUE(std::isfinite(block(r, 0)));
        }
    }
}

TEST_F(TrialConditioningTest, ConditioningLeavesInputUntouched) {
    RunLayout layout(5, 2);
    Matrix activity = RandomMatrix(10, 3, 2.0, 1.0);
    const Matrix original = activity;

    TrialConditioner(layout).Condition(activity);

    EXPECT_EQ(activity, original);
}

TEST_F(TrialConditioningTest, MaskedTrialsNeverReachRunBlocks) {
    std::vector<bool> excluded(8, false);
    excluded[1] = true;
    excluded[6] = true;
    RunLayout layout(4, 2, excluded);

    Matrix activity(8, 1);
    for (unsigned r = 0; r < 8; ++r) {
        activity(r, 0) = (r == 1 || r == 6) ? 1000.0 : static_cast<double>(r);
    }

    RunBlocks raw = layout.SplitRuns(activity, "activity");
    ASSERT_EQ(raw[0].rows(), 3u);
    ASSERT_EQ(raw[1].rows(), 3u);
    for (const auto& block : raw) {
        for (unsigned r = 0; r < block.rows(); ++r) {
            EXPECT_NE(block(r, 0), 1000.0);
        }
    }
    EXPECT_DOUBLE_EQ(raw[0](1, 0), 2.0);
    EXPECT_DOUBLE_EQ(raw[1](2, 0), 7.0);

    // Normalization statistics ignore the excluded outliers
    RunBlocks conditioned = TrialConditioner(layout).Condition(activity);
    EXPECT_NEAR(conditioned[0](0, 0), (-5.0 / 3.0) / std::sqrt(7.0 / 3.0), 1e-12);
}

TEST_F(TrialConditioningTest, RowCountMismatchFailsFast) {
    RunLayout layout(5, 2);
    Matrix activity = RandomMatrix(9, 2);
    EXPECT_THROW(TrialConditioner(layout).Condition(activity), ShapeMismatchException);

    RegressorPreparer preparer(layout);
    EXPECT_THROW(preparer.Split(RandomMatrix(11, 1)), ShapeMismatchException);
}

TEST_F(TrialConditioningTest, RegressorsFollowTheActivityLayout) {
    std::vector<bool> excluded(12, false);
    excluded[0] = true;
    excluded[11] = true;
    RunLayout layout(4, 3, excluded);

    Matrix regressors(12, 2);
    for (unsigned r = 0; r < 12; ++r) {
        regressors(r, 0) = r;
        regressors(r, 1) = -static_cast<double>(r);
    }
    RunBlocks activity = TrialConditioner(layout).Condition(RandomMatrix(12, 3));

    RegressorPreparer preparer(layout);
    EXPECT_FALSE(preparer.HasNuisanceRegressors());
    const RunBlocks untouched = activity;
    RunBlocks blocks = preparer.Prepare(regressors, activity);

    ASSERT_EQ(blocks.size(), 3u);
    for (size_t run = 0; run < 3; ++run) {
        EXPECT_EQ(blocks[run].rows(), activity[run].rows());
        EXPECT_EQ(activity[run], untouched[run]);
    }
    EXPECT_DOUBLE_EQ(blocks[0](0, 0), 1.0);
    EXPECT_DOUBLE_EQ(blocks[2](2, 1), -10.0);
}

TEST_F(TrialConditioningTest, NuisanceRegressionLeavesBlocksOrthogonal) {
    RunLayout layout(12, 3);
    Matrix nuisance = RandomMatrix(36, 2);
    Matrix regressors = RandomMatrix(36, 2, 1.0, 3.0);
    Matrix activity = RandomMatrix(36, 4);

    // Make both inputs partly explained by the nuisance columns
    for (unsigned r = 0; r < 36; ++r) {
        regressors(r, 0) += 2.0 * nuisance(r, 0);
        activity(r, 1) -= 1.5 * nuisance(r, 1);
    }

    RunBlocks blocks = TrialConditioner(layout).Condition(activity);

    RegressorPreparer preparer(layout);
    preparer.SetNuisanceRegressors(nuisance);
    ASSERT_TRUE(preparer.HasNuisanceRegressors());

    RunBlocks targets = preparer.Prepare(regressors, blocks);
    const NuisanceRegression* step = preparer.GetNuisanceRegression();
    ASSERT_NE(step, nullptr);
    ASSERT_EQ(step->GetNumberOfRuns(), 3u);

    for (size_t run = 0; run < 3; ++run) {
        const Matrix nt = step->GetNuisance(run).transpose();
        Matrix target_overlap = nt * targets[run];
        Matrix activity_overlap = nt * blocks[run];
        EXPECT_LT(target_overlap.absolute_value_max(), 1e-9);
        EXPECT_LT(activity_overlap.absolute_value_max(), 1e-9);
    }
}

TEST_F(TrialConditioningTest, NuisanceWithMismatchedRowsIsRejected) {
    RunLayout layout(6, 2);
    RegressorPreparer preparer(layout);
    EXPECT_THROW(preparer.SetNuisanceRegressors(RandomMatrix(10, 1)), ShapeMismatchException);
    EXPECT_THROW(preparer.SetNuisanceRegressors(Matrix(12, 0)), ConfigurationException);
}
