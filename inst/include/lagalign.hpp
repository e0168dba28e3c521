/***************************************************************
 *  lagalign.hpp
 *
 *  Time lag alignment of observation series for lagged
 *  (conditional) mutual information estimation.
 *
 *  Lag convention:
 *      y(t + lag) ~ x(t)
 *
 *      A positive lag means x is observed earlier than y.
 *      The target series y never shifts, only x and cond
 *      are shifted relative to it.
 *
 *  Cropping:
 *      All lags requested in one call share the same crop
 *      so that every task sees windows of the same length.
 *
 *          hi = max(max_lag, 0)
 *          lo = min(min_lag, 0)
 *
 *          y window      : y[hi, N + lo)
 *          lagged window : a[hi - L, N - L + lo)
 *
 *      Window length is N - (hi - lo).
 *
 *  Masking:
 *      The mask is windowed like y and then used to filter
 *      every aligned array. Filtering always happens after
 *      windowing.
 *
 *  Data layout:
 *      Series  = std::vector<double>
 *      Mask    = std::vector<uint8_t>   // 0 = False, 1 = True
 *
 *  Functions:
 *      ComputeLagBounds
 *      LaggedWindow
 *      TargetWindow
 *      MaskWindow
 *      FilterByMask
 *      Align
 *
 *  License: GPL-3
 ***************************************************************/

#ifndef LAGALIGN_HPP
#define LAGALIGN_HPP

#include <vector>
#include <string>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <algorithm>
#include <stdexcept>

namespace LagAlign
{
    using Series = std::vector<double>;
    using Mask   = std::vector<uint8_t>;

    /***********************************************************
     * Call wide lag bounds
     *
     *  min_lag = min(all lags, all lags + cond_lag)
     *  max_lag = max(all lags, all lags + cond_lag)
     ***********************************************************/
    struct LagBounds
    {
        int min_lag = 0;
        int max_lag = 0;

        // First index of the y window
        std::ptrdiff_t Start() const noexcept
        {
            return static_cast<std::ptrdiff_t>(std::max(max_lag, 0));
        }

        // Amount cropped from the end of the y window (<= 0)
        std::ptrdiff_t EndOffset() const noexcept
        {
            return static_cast<std::ptrdiff_t>(std::min(min_lag, 0));
        }

        // Number of observations left in every window
        std::ptrdiff_t WindowLength(size_t n_obs) const noexcept
        {
            return static_cast<std::ptrdiff_t>(n_obs) - (Start() - EndOffset());
        }
    };

    /***********************************************************
     * Aligned windows of one task
     ***********************************************************/
    struct Windows
    {
        Series xs;
        Series ys;
        Series zs;   // empty when no conditioning series is used
    };

    inline LagBounds ComputeLagBounds(
        const std::vector<int>& lags,
        int cond_lag = 0)
    {
        if (lags.empty())
        {
            throw std::invalid_argument("lag must contain at least one value");
        }

        auto mm = std::minmax_element(lags.begin(), lags.end());

        const long long lo_lag = *mm.first;
        const long long hi_lag = *mm.second;
        const long long lo = std::min(lo_lag, lo_lag + cond_lag);
        const long long hi = std::max(hi_lag, hi_lag + cond_lag);

        // Bounds outside int range can never leave any observation
        if (lo < std::numeric_limits<int>::min() || hi > std::numeric_limits<int>::max())
        {
            throw std::invalid_argument("lag is too large, no observations left");
        }

        LagBounds b;
        b.min_lag = static_cast<int>(lo);
        b.max_lag = static_cast<int>(hi);
        return b;
    }

    /***********************************************************
     * Window of an array shifted by its own lag
     *
     *  a[hi - L, len(a) - L + lo)
     ***********************************************************/
    inline Series LaggedWindow(
        const Series& a,
        int lag,
        const LagBounds& bounds)
    {
        const std::ptrdiff_t n     = static_cast<std::ptrdiff_t>(a.size());
        const std::ptrdiff_t start = bounds.Start() - lag;
        const std::ptrdiff_t end   = n - lag + bounds.EndOffset();

        if (start < 0 || end > n || start > end)
        {
            throw std::invalid_argument(
                "lag " + std::to_string(lag) + " lies outside the lag bounds [" +
                std::to_string(bounds.min_lag) + ", " +
                std::to_string(bounds.max_lag) + "]");
        }

        return Series(a.begin() + start, a.begin() + end);
    }

    /***********************************************************
     * Window of the target series, y[hi, N + lo)
     ***********************************************************/
    inline Series TargetWindow(
        const Series& y,
        const LagBounds& bounds)
    {
        return LaggedWindow(y, 0, bounds);
    }

    inline Mask MaskWindow(
        const Mask& mask,
        const LagBounds& bounds)
    {
        const std::ptrdiff_t n     = static_cast<std::ptrdiff_t>(mask.size());
        const std::ptrdiff_t start = bounds.Start();
        const std::ptrdiff_t end   = n + bounds.EndOffset();

        if (start > end)
        {
            throw std::invalid_argument("Mask is shorter than the lag bounds require.");
        }

        return Mask(mask.begin() + start, mask.begin() + end);
    }

    /***********************************************************
     * Keep the positions where mask_subset is True
     ***********************************************************/
    inline Series FilterByMask(
        const Series& slice,
        const Mask& mask_subset)
    {
        if (slice.size() != mask_subset.size())
        {
            throw std::invalid_argument("Slice and mask window must have the same length.");
        }

        Series out;
        out.reserve(slice.size());

        for (size_t i = 0; i < slice.size(); ++i)
        {
            if (mask_subset[i]) out.push_back(slice[i]);
        }
        return out;
    }

    /***********************************************************
     * Align x, y and optionally cond for one lag
     *
     * Parameters:
     *      x         variable series
     *      y         target series
     *      cond      conditioning series, nullptr if absent
     *      mask      observation mask, nullptr if absent
     *      lag       lag of x
     *      cond_lag  additional lag of cond
     *      bounds    call wide lag bounds
     *
     * Returns:
     *      equal length windows; zs is empty without cond
     *
     * The mask window is derived once from the y frame and
     * reused to filter every aligned array.
     ***********************************************************/
    inline Windows Align(
        const Series& x,
        const Series& y,
        const Series* cond,
        const Mask* mask,
        int lag,
        int cond_lag,
        const LagBounds& bounds)
    {
        Windows w;
        w.xs = LaggedWindow(x, lag, bounds);
        w.ys = TargetWindow(y, bounds);
        if (cond != nullptr)
        {
            w.zs = LaggedWindow(*cond, lag + cond_lag, bounds);
        }

        if (mask != nullptr)
        {
            const Mask mask_subset = MaskWindow(*mask, bounds);
            w.xs = FilterByMask(w.xs, mask_subset);
            w.ys = FilterByMask(w.ys, mask_subset);
            if (cond != nullptr)
            {
                w.zs = FilterByMask(w.zs, mask_subset);
            }
        }

        return w;
    }

} // namespace LagAlign

#endif // LAGALIGN_HPP
