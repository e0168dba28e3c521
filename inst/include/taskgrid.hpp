/***************************************************************
 *  taskgrid.hpp
 *
 *  Task enumeration and result assembly for lagged mutual
 *  information estimation.
 *
 *  A task is one (lag, variable) pair. Tasks are enumerated
 *  lag-major, variable-minor:
 *
 *      (0,0) (0,1) ... (0,nvar-1) (1,0) ... (nlag-1,nvar-1)
 *
 *  Each Task carries immutable shared views of the arrays
 *  it needs, so it can be copied by value and evaluated in
 *  any process without touching caller owned memory.
 *
 *  Result layout:
 *      ResultGrid.values is row-major [n_lags x n_vars].
 *      Row labels are the lag values, column labels are the
 *      optional variable names.
 *
 *  Functions:
 *      EnumerateTasks
 *      AssembleGrid
 *
 *  License: GPL-3
 ***************************************************************/

#ifndef TASKGRID_HPP
#define TASKGRID_HPP

#include <vector>
#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include "lagalign.hpp"

namespace TaskGrid
{
    using SeriesPtr = std::shared_ptr<const LagAlign::Series>;
    using MaskPtr   = std::shared_ptr<const LagAlign::Mask>;

    // (lag position, variable position)
    using IndexPair = std::pair<size_t, size_t>;

    /***********************************************************
     * Task descriptor
     ***********************************************************/
    struct Task
    {
        size_t lag_index = 0;
        size_t var_index = 0;

        int lag = 0;
        LagAlign::LagBounds bounds;
        int k = 3;
        int cond_lag = 0;

        SeriesPtr x;
        SeriesPtr y;
        SeriesPtr cond;   // null when absent
        MaskPtr   mask;   // null when absent

        bool HasCond() const noexcept { return static_cast<bool>(cond); }

        IndexPair Index() const { return IndexPair(lag_index, var_index); }
    };

    /***********************************************************
     * Enumerated tasks with their index pairs in lockstep
     ***********************************************************/
    struct TaskList
    {
        std::vector<IndexPair> indices;
        std::vector<Task> tasks;

        size_t size() const noexcept { return tasks.size(); }
    };

    /***********************************************************
     * Result grid
     ***********************************************************/
    struct ResultGrid
    {
        size_t n_lags = 0;
        size_t n_vars = 0;
        std::vector<double> values;          // row-major
        std::vector<int> lags;               // row labels
        std::vector<std::string> var_names;  // column labels, may be empty

        double at(size_t row, size_t col) const
        {
            if (row >= n_lags || col >= n_vars)
                throw std::out_of_range("ResultGrid index out of range");
            return values[row * n_vars + col];
        }

        bool AllFinite() const
        {
            for (double v : values)
            {
                if (!std::isfinite(v)) return false;
            }
            return true;
        }
    };

    /***********************************************************
     * EnumerateTasks
     *
     * Each input array is copied once into a shared immutable
     * view; tasks only hold those views. Empty cond / mask
     * mean absent.
     ***********************************************************/
    inline TaskList EnumerateTasks(
        const std::vector<int>& lags,
        const std::vector<std::vector<double>>& x,
        const std::vector<double>& y,
        const LagAlign::LagBounds& bounds,
        int k,
        const std::vector<double>& cond,
        int cond_lag,
        const std::vector<uint8_t>& mask)
    {
        const size_t n_lags = lags.size();
        const size_t n_vars = x.size();

        std::vector<SeriesPtr> columns;
        columns.reserve(n_vars);
        for (const auto& var : x)
        {
            columns.push_back(std::make_shared<const LagAlign::Series>(var));
        }

        SeriesPtr y_ptr = std::make_shared<const LagAlign::Series>(y);
        SeriesPtr cond_ptr;
        if (!cond.empty())
            cond_ptr = std::make_shared<const LagAlign::Series>(cond);
        MaskPtr mask_ptr;
        if (!mask.empty())
            mask_ptr = std::make_shared<const LagAlign::Mask>(mask);

        TaskList list;
        list.indices.reserve(n_lags * n_vars);
        list.tasks.reserve(n_lags * n_vars);

        for (size_t li = 0; li < n_lags; ++li)
        {
            for (size_t vi = 0; vi < n_vars; ++vi)
            {
                Task t;
                t.lag_index = li;
                t.var_index = vi;
                t.lag       = lags[li];
                t.bounds    = bounds;
                t.k         = k;
                t.cond_lag  = cond_lag;
                t.x         = columns[vi];
                t.y         = y_ptr;
                t.cond      = cond_ptr;
                t.mask      = mask_ptr;

                list.indices.push_back(t.Index());
                list.tasks.push_back(std::move(t));
            }
        }

        return list;
    }

    /***********************************************************
     * AssembleGrid
     *
     * Scatters results[i] into the cell of indices[i].
     * Cells without a result stay NaN.
     ***********************************************************/
    inline ResultGrid AssembleGrid(
        const std::vector<IndexPair>& indices,
        const std::vector<double>& results,
        const std::vector<int>& lags,
        size_t n_vars,
        const std::vector<std::string>& var_names = {})
    {
        if (indices.size() != results.size())
        {
            throw std::invalid_argument("Number of results does not match number of tasks.");
        }
        if (!var_names.empty() && var_names.size() != n_vars)
        {
            throw std::invalid_argument("var_names must match the number of variables");
        }

        ResultGrid grid;
        grid.n_lags = lags.size();
        grid.n_vars = n_vars;
        grid.values.assign(grid.n_lags * n_vars, std::numeric_limits<double>::quiet_NaN());
        grid.lags = lags;
        grid.var_names = var_names;

        for (size_t i = 0; i < indices.size(); ++i)
        {
            const size_t row = indices[i].first;
            const size_t col = indices[i].second;
            if (row >= grid.n_lags || col >= n_vars)
                throw std::out_of_range("Task index lies outside the result grid");

            grid.values[row * n_vars + col] = results[i];
        }

        return grid;
    }

} // namespace TaskGrid

#endif // TASKGRID_HPP
