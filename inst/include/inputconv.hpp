/***************************************************************
 *  inputconv.hpp
 *
 *  Plain-array conversions behind the R interface.
 *
 *  The R binding unpacks R objects into raw buffers and hands
 *  them to these functions, so that the conversion rules can
 *  be used and checked without an R runtime.
 *
 *  Functions:
 *      ColumnsFromColMajor   column-major matrix -> mat[var][obs]
 *      LagsFromDoubles       numeric lags -> integer lags
 *      MaskFromLogical       R style logical -> 0 / 1 mask
 *      LagLabels             row labels of a result grid
 *
 *  License: GPL-3
 ***************************************************************/

#ifndef INPUTCONV_HPP
#define INPUTCONV_HPP

#include <vector>
#include <cmath>
#include <limits>
#include <string>
#include <cstddef>
#include <cstdint>
#include <stdexcept>

namespace InputConv
{
    // R stores logical NA as the smallest int
    constexpr int kLogicalNA = std::numeric_limits<int>::min();

    /***********************************************************
     * Column-major matrix (rows = observations) to
     * mat[var][obs], one variable per column
     ***********************************************************/
    inline std::vector<std::vector<double>> ColumnsFromColMajor(
        const double* data,
        size_t n_rows,
        size_t n_cols)
    {
        std::vector<std::vector<double>> vars;
        vars.reserve(n_cols);

        for (size_t c = 0; c < n_cols; ++c)
        {
            const double* col = data + c * n_rows;
            vars.emplace_back(col, col + n_rows);
        }
        return vars;
    }

    /*
     * @brief Converts numeric lags to integers.
     *
     * NaN (R's NA), non whole numbers and values outside the int
     * range are rejected with the 1-based position of the offender.
     *
     * @throws std::invalid_argument
     */
    inline std::vector<int> LagsFromDoubles(const std::vector<double>& values)
    {
        std::vector<int> lags;
        lags.reserve(values.size());

        for (size_t i = 0; i < values.size(); ++i)
        {
            const double l = values[i];
            if (std::isnan(l) || std::floor(l) != l ||
                l > static_cast<double>(std::numeric_limits<int>::max()) ||
                l < static_cast<double>(std::numeric_limits<int>::min()))
            {
                throw std::invalid_argument(
                    "lag must contain only integers (position " + std::to_string(i + 1) + ")");
            }
            lags.push_back(static_cast<int>(l));
        }
        return lags;
    }

    inline std::vector<uint8_t> MaskFromLogical(
        const std::vector<int>& values,
        int na_value = kLogicalNA)
    {
        std::vector<uint8_t> mask;
        mask.reserve(values.size());

        for (int v : values)
        {
            if (v == na_value)
            {
                throw std::invalid_argument("mask must contain only booleans");
            }
            mask.push_back(v ? 1 : 0);
        }
        return mask;
    }

    // Lag values as row labels
    inline std::vector<std::string> LagLabels(const std::vector<int>& lags)
    {
        std::vector<std::string> labels;
        labels.reserve(lags.size());
        for (int l : lags) labels.push_back(std::to_string(l));
        return labels;
    }

} // namespace InputConv

#endif // INPUTCONV_HPP
