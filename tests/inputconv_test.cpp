#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>
#include "inputconv.hpp"

TEST(InputConvTest, SplitsColumnMajorMatrixIntoVariables) {
    // 3 observations x 2 variables, stored column by column
    const std::vector<double> data = {1, 2, 3, 10, 20, 30};
    const std::vector<std::vector<double>> vars =
        InputConv::ColumnsFromColMajor(data.data(), 3, 2);

    ASSERT_EQ(2u, vars.size());
    EXPECT_EQ(std::vector<double>({1, 2, 3}), vars[0]);
    EXPECT_EQ(std::vector<double>({10, 20, 30}), vars[1]);
}

TEST(InputConvTest, EmptyMatrixHasNoVariables) {
    const std::vector<double> data;
    EXPECT_TRUE(InputConv::ColumnsFromColMajor(data.data(), 5, 0).empty());
}

TEST(InputConvTest, ConvertsWholeNumberLags) {
    EXPECT_EQ(std::vector<int>({-3, 0, 2}),
              InputConv::LagsFromDoubles({-3.0, 0.0, 2.0}));
    EXPECT_TRUE(InputConv::LagsFromDoubles({}).empty());
}

TEST(InputConvTest, RejectsNonIntegralLags) {
    try {
        InputConv::LagsFromDoubles({0.0, 1.5});
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ("lag must contain only integers (position 2)", e.what());
    }
}

TEST(InputConvTest, RejectsMissingAndOutOfRangeLags) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    EXPECT_THROW(InputConv::LagsFromDoubles({nan}), std::invalid_argument);
    EXPECT_THROW(InputConv::LagsFromDoubles({inf}), std::invalid_argument);
    EXPECT_THROW(InputConv::LagsFromDoubles({-inf}), std::invalid_argument);
    EXPECT_THROW(InputConv::LagsFromDoubles({4294967296.0}), std::invalid_argument);

    const int big = std::numeric_limits<int>::max();
    EXPECT_EQ(std::vector<int>({big}),
              InputConv::LagsFromDoubles({static_cast<double>(big)}));
}

TEST(InputConvTest, ConvertsLogicalMask) {
    EXPECT_EQ(std::vector<uint8_t>({1, 0, 1}),
              InputConv::MaskFromLogical({1, 0, 1}));
}

TEST(InputConvTest, RejectsMissingMaskValues) {
    try {
        InputConv::MaskFromLogical({1, InputConv::kLogicalNA, 0});
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ("mask must contain only booleans", e.what());
    }
}

TEST(InputConvTest, LabelsRowsByLagValue) {
    EXPECT_EQ(std::vector<std::string>({"-2", "0", "5"}),
              InputConv::LagLabels({-2, 0, 5}));
}
