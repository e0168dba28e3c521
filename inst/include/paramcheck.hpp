/***************************************************************
 *  paramcheck.hpp
 *
 *  Eager validation of the inputs of one lagged mutual
 *  information call. Every check runs before any task is
 *  created, so a violation never leaves partial results.
 *
 *  Checks:
 *      CheckParameters   shapes of x / y / cond / mask, k
 *      CheckLags         lag set against the series length
 *
 *  Errors:
 *      std::invalid_argument with a message naming the
 *      violated precondition.
 *
 *  Note:
 *      k is only checked against the raw observation count.
 *      Windowing and masking can leave fewer observations;
 *      that case is left to the estimator.
 *
 *  License: GPL-3
 ***************************************************************/

#ifndef PARAMCHECK_HPP
#define PARAMCHECK_HPP

#include <vector>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include "lagalign.hpp"

namespace ParamCheck
{
    /***********************************************************
     * Shape and type checks
     *
     *  x     : mat[var][obs], at least one variable
     *  cond  : empty when absent
     *  mask  : empty when absent, elements 0 or 1
     ***********************************************************/
    inline void CheckParameters(
        const std::vector<std::vector<double>>& x,
        const std::vector<double>& y,
        int k,
        const std::vector<double>& cond,
        const std::vector<uint8_t>& mask)
    {
        if (x.empty())
        {
            throw std::invalid_argument("x must contain at least one variable");
        }

        const size_t n_obs = y.size();

        for (const auto& var : x)
        {
            if (var.size() != n_obs)
                throw std::invalid_argument("x and y must have same length");
        }

        if (!cond.empty() && cond.size() != n_obs)
        {
            throw std::invalid_argument("x and cond must have same length");
        }

        if (k < 1)
        {
            throw std::invalid_argument("k must be positive");
        }

        if (n_obs <= static_cast<size_t>(k))
        {
            throw std::invalid_argument("k must be smaller than number of observations");
        }

        if (!mask.empty())
        {
            if (mask.size() != n_obs)
                throw std::invalid_argument("mask length does not match y length");

            for (uint8_t m : mask)
            {
                if (m > 1)
                    throw std::invalid_argument("mask must contain only booleans");
            }
        }
    }

    /***********************************************************
     * Lag range check
     *
     * Rejects lag sets that leave no observations:
     *      max_lag - min_lag >= N
     *      max_lag >= N
     *      min_lag <= -N
     *
     * Returns the call wide lag bounds on success.
     ***********************************************************/
    inline LagAlign::LagBounds CheckLags(
        const std::vector<int>& lags,
        int cond_lag,
        size_t n_obs)
    {
        const LagAlign::LagBounds b = LagAlign::ComputeLagBounds(lags, cond_lag);

        const long long n   = static_cast<long long>(n_obs);
        const long long lo  = b.min_lag;
        const long long hi  = b.max_lag;

        if (hi - lo >= n || hi >= n || lo <= -n)
        {
            throw std::invalid_argument("lag is too large, no observations left");
        }

        return b;
    }

} // namespace ParamCheck

#endif // PARAMCHECK_HPP
