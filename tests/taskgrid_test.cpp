#include <gtest/gtest.h>

#include <cmath>
#include <vector>
#include <string>
#include <stdexcept>
#include "taskgrid.hpp"

namespace {

const std::vector<double> kY = {1, 2, 3, 4, 5, 6};
const std::vector<std::vector<double>> kX = {
    {10, 11, 12, 13, 14, 15},
    {20, 21, 22, 23, 24, 25},
    {30, 31, 32, 33, 34, 35}};

}  // namespace

TEST(TaskGridTest, EnumeratesLagMajorVariableMinor) {
    const std::vector<int> lags = {0, 1};
    const LagAlign::LagBounds b = LagAlign::ComputeLagBounds(lags);
    const TaskGrid::TaskList list =
        TaskGrid::EnumerateTasks(lags, kX, kY, b, 2, {}, 0, {});

    ASSERT_EQ(6u, list.size());
    ASSERT_EQ(6u, list.indices.size());

    const std::vector<TaskGrid::IndexPair> expected = {
        {0, 0}, {0, 1}, {0, 2}, {1, 0}, {1, 1}, {1, 2}};
    EXPECT_EQ(expected, list.indices);

    for (size_t i = 0; i < list.size(); ++i) {
        const TaskGrid::Task& t = list.tasks[i];
        EXPECT_EQ(list.indices[i], t.Index());
        EXPECT_EQ(lags[t.lag_index], t.lag);
        EXPECT_EQ(kX[t.var_index], *t.x);
        EXPECT_EQ(kY, *t.y);
        EXPECT_EQ(2, t.k);
        EXPECT_EQ(0, t.bounds.min_lag);
        EXPECT_EQ(1, t.bounds.max_lag);
        EXPECT_FALSE(t.HasCond());
        EXPECT_FALSE(t.mask);
    }
}

TEST(TaskGridTest, TasksShareImmutableViews) {
    const std::vector<int> lags = {0, 1, 2};
    const std::vector<double> cond = {6, 5, 4, 3, 2, 1};
    const std::vector<uint8_t> mask = {1, 1, 0, 1, 1, 1};
    const LagAlign::LagBounds b = LagAlign::ComputeLagBounds(lags, 1);
    const TaskGrid::TaskList list =
        TaskGrid::EnumerateTasks(lags, kX, kY, b, 1, cond, 1, mask);

    ASSERT_EQ(9u, list.size());
    for (const TaskGrid::Task& t : list.tasks) {
        EXPECT_EQ(list.tasks[0].y.get(), t.y.get());
        EXPECT_EQ(list.tasks[0].cond.get(), t.cond.get());
        EXPECT_EQ(list.tasks[0].mask.get(), t.mask.get());
        EXPECT_EQ(list.tasks[t.var_index].x.get(), t.x.get());
        EXPECT_TRUE(t.HasCond());
        EXPECT_EQ(1, t.cond_lag);
        EXPECT_EQ(mask, *t.mask);
    }
}

TEST(TaskGridTest, TasksOutliveCallerArrays) {
    TaskGrid::Task copy;
    {
        std::vector<double> y = {1, 2, 3};
        std::vector<std::vector<double>> x = {{4, 5, 6}};
        const TaskGrid::TaskList list = TaskGrid::EnumerateTasks(
            {0}, x, y, LagAlign::ComputeLagBounds({0}), 1, {}, 0, {});
        copy = list.tasks.front();
        y[0] = -1;
        x[0][0] = -1;
    }
    EXPECT_EQ(std::vector<double>({1, 2, 3}), *copy.y);
    EXPECT_EQ(std::vector<double>({4, 5, 6}), *copy.x);
}

TEST(TaskGridTest, AssembleScattersByIndexPair) {
    const std::vector<TaskGrid::IndexPair> indices = {{1, 0}, {0, 1}, {0, 0}, {1, 1}};
    const std::vector<double> results = {10, 1, 0, 11};

    const TaskGrid::ResultGrid grid =
        TaskGrid::AssembleGrid(indices, results, {-1, 3}, 2, {"a", "b"});

    ASSERT_EQ(2u, grid.n_lags);
    ASSERT_EQ(2u, grid.n_vars);
    EXPECT_DOUBLE_EQ(0.0, grid.at(0, 0));
    EXPECT_DOUBLE_EQ(1.0, grid.at(0, 1));
    EXPECT_DOUBLE_EQ(10.0, grid.at(1, 0));
    EXPECT_DOUBLE_EQ(11.0, grid.at(1, 1));
    EXPECT_EQ(std::vector<int>({-1, 3}), grid.lags);
    EXPECT_EQ(std::vector<std::string>({"a", "b"}), grid.var_names);
    EXPECT_TRUE(grid.AllFinite());
}

TEST(TaskGridTest, LabelsDoNotChangeValues) {
    const std::vector<TaskGrid::IndexPair> indices = {{0, 0}, {0, 1}};
    const std::vector<double> results = {0.25, 0.5};

    const TaskGrid::ResultGrid plain = TaskGrid::AssembleGrid(indices, results, {2}, 2);
    const TaskGrid::ResultGrid named = TaskGrid::AssembleGrid(indices, results, {2}, 2, {"u", "v"});

    EXPECT_EQ(plain.values, named.values);
    EXPECT_TRUE(plain.var_names.empty());
}

TEST(TaskGridTest, NonFiniteResultsAreKept) {
    const std::vector<TaskGrid::IndexPair> indices = {{0, 0}};
    const std::vector<double> results = {-INFINITY};

    const TaskGrid::ResultGrid grid = TaskGrid::AssembleGrid(indices, results, {0}, 1);

    EXPECT_TRUE(std::isinf(grid.at(0, 0)));
    EXPECT_LT(grid.at(0, 0), 0.0);
    EXPECT_FALSE(grid.AllFinite());
}

TEST(TaskGridTest, AssembleRejectsInconsistentInput) {
    EXPECT_THROW(TaskGrid::AssembleGrid({{0, 0}}, {1.0, 2.0}, {0}, 1), std::invalid_argument);
    EXPECT_THROW(TaskGrid::AssembleGrid({{0, 2}}, {1.0}, {0}, 2), std::out_of_range);
    EXPECT_THROW(TaskGrid::AssembleGrid({{0, 0}}, {1.0}, {0}, 1, {"a", "b"}), std::invalid_argument);

    const TaskGrid::ResultGrid grid = TaskGrid::AssembleGrid({{0, 0}}, {1.0}, {0}, 1);
    EXPECT_THROW(grid.at(1, 0), std::out_of_range);
}
