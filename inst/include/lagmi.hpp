/***************************************************************
 *  lagmi.hpp
 *
 *  Lagged (conditional) mutual information between a target
 *  series y and one or more variables x.
 *
 *  Lag convention:
 *      y(t + lag) ~ x(t)
 *
 *      The lags are applied to x and cond so that y stays the
 *      same for every task; y is cropped to
 *      y[max(max_lag, 0) : N + min(min_lag, 0)].
 *
 *  Conditioning:
 *      If cond is given, conditional mutual information is
 *      estimated. cond_lag is added to the lag of cond.
 *
 *  Masking:
 *      Only the y observations whose mask element is True are
 *      used. x and cond are masked with the lags applied.
 *
 *  Estimator:
 *      The point estimators are supplied by the caller through
 *      LagMI::Estimator (typically the k-nearest-neighbor
 *      estimators of Kraskov et al. 2004). Results are in nats.
 *      On discrete data or many identical observations an
 *      estimator may return -inf or other non-finite values;
 *      these are kept as is in the result grid.
 *
 *  Result:
 *      TaskGrid::ResultGrid of shape [n_lags x n_vars].
 *
 *  Functions:
 *      EstimateTask
 *      EstimateMI
 *
 *  License: GPL-3
 ***************************************************************/

#ifndef LAGMI_HPP
#define LAGMI_HPP

#include <vector>
#include <string>
#include <memory>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include "lagalign.hpp"
#include "paramcheck.hpp"
#include "taskgrid.hpp"
#include "dispatch.hpp"

namespace LagMI
{
    /***********************************************************
     * Estimator interface
     *
     * Implementations must be pure functions of their inputs;
     * they may be evaluated in forked worker processes.
     ***********************************************************/
    class Estimator
    {
    public:
        virtual ~Estimator() = default;

        // I(xs ; ys)
        virtual double MI(
            const std::vector<double>& xs,
            const std::vector<double>& ys,
            int k) const = 0;

        // I(xs ; ys | zs)
        virtual double CMI(
            const std::vector<double>& xs,
            const std::vector<double>& ys,
            const std::vector<double>& zs,
            int k) const = 0;
    };

    /***********************************************************
     * Estimate one (lag, variable) task
     ***********************************************************/
    inline double EstimateTask(
        const TaskGrid::Task& task,
        const Estimator& estimator)
    {
        const LagAlign::Windows w = LagAlign::Align(
            *task.x, *task.y, task.cond.get(), task.mask.get(),
            task.lag, task.cond_lag, task.bounds);

        if (!task.HasCond())
            return estimator.MI(w.xs, w.ys, task.k);

        return estimator.CMI(w.xs, w.ys, w.zs, task.k);
    }

    /***********************************************************
     * EstimateMI
     *
     * Parameters:
     *      y          target observations
     *      x          variables, x[var][obs]
     *      lags       lags to apply to x, |lag| < N
     *      estimator  MI / CMI point estimator
     *      k          neighbor count, k < N
     *      cond       conditioning series, empty if absent
     *      cond_lag   additional lag of cond
     *      mask       observation mask over y, empty if absent
     *      parallel   dispatch override
     *      workers    worker processes, 0 = processor count
     *      var_names  column labels, empty or one per variable
     *
     * Returns:
     *      grid[lag index][variable index] in nats
     *
     * Throws:
     *      std::invalid_argument for invalid inputs, before any
     *      task runs; estimator and worker failures propagate.
     ***********************************************************/
    inline TaskGrid::ResultGrid EstimateMI(
        const std::vector<double>& y,
        const std::vector<std::vector<double>>& x,
        const std::vector<int>& lags,
        const Estimator& estimator,
        int k = 3,
        const std::vector<double>& cond = {},
        int cond_lag = 0,
        const std::vector<uint8_t>& mask = {},
        Dispatch::ParallelMode parallel = Dispatch::ParallelMode::Auto,
        size_t workers = 0,
        const std::vector<std::string>& var_names = {})
    {
        ParamCheck::CheckParameters(x, y, k, cond, mask);
        const LagAlign::LagBounds bounds = ParamCheck::CheckLags(lags, cond_lag, y.size());

        if (!var_names.empty() && var_names.size() != x.size())
        {
            throw std::invalid_argument("var_names must match the number of variables");
        }

        const TaskGrid::TaskList list = TaskGrid::EnumerateTasks(
            lags, x, y, bounds, k, cond, cond_lag, mask);

        const bool parallel_run = Dispatch::ShouldBeParallel(parallel, list.size(), y.size());
        const std::unique_ptr<Dispatch::Executor> executor =
            Dispatch::MakeExecutor(parallel_run, workers);

        const std::vector<double> results = Dispatch::Map(
            *executor, list.tasks,
            [&estimator](const TaskGrid::Task& t) { return EstimateTask(t, estimator); });

        return TaskGrid::AssembleGrid(list.indices, results, lags, x.size(), var_names);
    }

    // Single variable overload
    inline TaskGrid::ResultGrid EstimateMI(
        const std::vector<double>& y,
        const std::vector<double>& x,
        const std::vector<int>& lags,
        const Estimator& estimator,
        int k = 3,
        const std::vector<double>& cond = {},
        int cond_lag = 0,
        const std::vector<uint8_t>& mask = {},
        Dispatch::ParallelMode parallel = Dispatch::ParallelMode::Auto,
        size_t workers = 0)
    {
        return EstimateMI(y, std::vector<std::vector<double>>{x}, lags, estimator,
                          k, cond, cond_lag, mask, parallel, workers);
    }

} // namespace LagMI

#endif // LAGMI_HPP
