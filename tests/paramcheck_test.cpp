#include <gtest/gtest.h>

#include <vector>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include "paramcheck.hpp"

namespace {

const std::vector<double> kY = {1, 2, 3, 4, 5};
const std::vector<std::vector<double>> kX = {{1, 2, 3, 4, 5}};

void ExpectInvalid(const std::vector<std::vector<double>>& x,
                   const std::vector<double>& y,
                   int k,
                   const std::vector<double>& cond,
                   const std::vector<uint8_t>& mask,
                   const std::string& message) {
    try {
        ParamCheck::CheckParameters(x, y, k, cond, mask);
        FAIL() << "expected std::invalid_argument: " << message;
    } catch (const std::invalid_argument& e) {
        EXPECT_EQ(message, e.what());
    }
}

}  // namespace

TEST(ParamCheckTest, AcceptsConsistentInputs) {
    EXPECT_NO_THROW(ParamCheck::CheckParameters(kX, kY, 3, {}, {}));
    EXPECT_NO_THROW(ParamCheck::CheckParameters(kX, kY, 4, {5, 4, 3, 2, 1}, {1, 0, 1, 1, 0}));
}

TEST(ParamCheckTest, RejectsEmptyVariableSet) {
    ExpectInvalid({}, kY, 1, {}, {}, "x must contain at least one variable");
}

TEST(ParamCheckTest, RejectsXYLengthMismatch) {
    ExpectInvalid({{1, 2, 3, 4}}, kY, 1, {}, {}, "x and y must have same length");
    ExpectInvalid({{1, 2, 3, 4, 5}, {1, 2, 3}}, kY, 1, {}, {}, "x and y must have same length");
}

TEST(ParamCheckTest, RejectsCondLengthMismatch) {
    ExpectInvalid(kX, kY, 1, {1, 2, 3}, {}, "x and cond must have same length");
}

TEST(ParamCheckTest, RejectsKNotSmallerThanObservationCount) {
    ExpectInvalid(kX, kY, 5, {}, {}, "k must be smaller than number of observations");
    ExpectInvalid(kX, kY, 6, {}, {}, "k must be smaller than number of observations");
    ExpectInvalid(kX, kY, 0, {}, {}, "k must be positive");
}

TEST(ParamCheckTest, RejectsMaskLengthMismatch) {
    ExpectInvalid(kX, kY, 1, {}, {1, 1, 1}, "mask length does not match y length");
}

TEST(ParamCheckTest, RejectsNonBooleanMask) {
    ExpectInvalid(kX, kY, 1, {}, {1, 0, 2, 1, 1}, "mask must contain only booleans");
}

TEST(ParamCheckTest, LagBoundsIncludeCondLag) {
    const LagAlign::LagBounds b = ParamCheck::CheckLags({0, 1, 2}, -3, 10);
    EXPECT_EQ(-3, b.min_lag);
    EXPECT_EQ(2, b.max_lag);

    const LagAlign::LagBounds c = ParamCheck::CheckLags({-1, 1}, 4, 10);
    EXPECT_EQ(-1, c.min_lag);
    EXPECT_EQ(5, c.max_lag);
}

TEST(ParamCheckTest, RejectsLagsLeavingNoObservations) {
    EXPECT_THROW(ParamCheck::CheckLags({5}, 0, 5), std::invalid_argument);
    EXPECT_THROW(ParamCheck::CheckLags({-5}, 0, 5), std::invalid_argument);
    EXPECT_THROW(ParamCheck::CheckLags({7}, 0, 5), std::invalid_argument);
    EXPECT_THROW(ParamCheck::CheckLags({-2, 3}, 0, 5), std::invalid_argument);
    EXPECT_THROW(ParamCheck::CheckLags({0}, 5, 5), std::invalid_argument);
    EXPECT_THROW(ParamCheck::CheckLags({}, 0, 5), std::invalid_argument);

    EXPECT_NO_THROW(ParamCheck::CheckLags({4}, 0, 5));
    EXPECT_NO_THROW(ParamCheck::CheckLags({-4}, 0, 5));
    EXPECT_NO_THROW(ParamCheck::CheckLags({-2, 2}, 0, 5));
}

TEST(ParamCheckTest, LagErrorMessageIsDescriptive) {
    try {
        ParamCheck::CheckLags({10}, 0, 10);
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ("lag is too large, no observations left", e.what());
    }
}

TEST(ParamCheckTest, RejectsLagsNearIntegerLimits) {
    const int big = std::numeric_limits<int>::max();
    const int small = std::numeric_limits<int>::min();

    EXPECT_THROW(ParamCheck::CheckLags({big - 1}, 10, 100), std::invalid_argument);
    EXPECT_THROW(ParamCheck::CheckLags({big}, 1, 100), std::invalid_argument);
    EXPECT_THROW(ParamCheck::CheckLags({small + 1}, -10, 100), std::invalid_argument);
    EXPECT_THROW(ParamCheck::CheckLags({0}, big, 100), std::invalid_argument);
    EXPECT_THROW(ParamCheck::CheckLags({small, big}, 0, 100), std::invalid_argument);

    try {
        ParamCheck::CheckLags({big - 1}, 10, 100);
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ("lag is too large, no observations left", e.what());
    }
}
