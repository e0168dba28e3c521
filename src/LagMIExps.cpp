#include <vector>
#include <chrono>
#include <cstdio>
#include <string>
#include <algorithm>
#include "lagalign.hpp"
#include "paramcheck.hpp"
#include "taskgrid.hpp"
#include "dispatch.hpp"
#include "lagmi.hpp"
#include "DataTrans.h"
#include "REstimator.h"

// Format the wall-clock time elapsed since start as "ss.mmm" or "m:ss.mmm"
static std::string elapsed_since(std::chrono::steady_clock::time_point start) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - start).count();

  const long long minutes = ms / 60000;
  const long long seconds = (ms / 1000) % 60;
  const long long millis  = ms % 1000;

  char buf[32];
  if (minutes > 0) {
    std::snprintf(buf, sizeof(buf), "%lld:%02lld.%03lld", minutes, seconds, millis);
  } else {
    std::snprintf(buf, sizeof(buf), "%lld.%03lld", seconds, millis);
  }
  return std::string(buf);
}

// Parse the parallel override, NULL means "use the heuristic"
static Dispatch::ParallelMode parallel_mode(SEXP parallel) {
  if (Rf_isNull(parallel)) return Dispatch::ParallelMode::Auto;
  if (TYPEOF(parallel) != STRSXP || Rf_length(parallel) != 1 ||
      STRING_ELT(parallel, 0) == NA_STRING) {
    Rcpp::stop("unrecognized value for parallel argument");
  }
  return Dispatch::ParseParallelMode(Rcpp::as<std::string>(parallel));
}

// Optional cond argument; a supplied empty vector is a length mismatch, not "absent"
static std::vector<double> cond_series(SEXP cond) {
  if (Rf_isNull(cond)) return std::vector<double>();
  std::vector<double> out = vec2series(cond, "cond");
  if (out.empty()) Rcpp::stop("x and cond must have same length");
  return out;
}

static std::vector<uint8_t> mask_series(SEXP mask) {
  if (Rf_isNull(mask)) return std::vector<uint8_t>();
  std::vector<uint8_t> out = lgl2mask(mask);
  if (out.empty()) Rcpp::stop("mask length does not match y length");
  return out;
}

// Wrapper function to estimate lagged (conditional) mutual information
// [[Rcpp::export(rng = false)]]
Rcpp::NumericMatrix RcppEstimateMI(SEXP y,
                                   SEXP x,
                                   Rcpp::NumericVector lag = Rcpp::NumericVector::create(0),
                                   int k = 3,
                                   SEXP cond = R_NilValue,
                                   int cond_lag = 0,
                                   SEXP mask = R_NilValue,
                                   SEXP parallel = R_NilValue,
                                   SEXP mi = R_NilValue,
                                   SEXP cmi = R_NilValue,
                                   int workers = 0,
                                   bool verbose = false)
{
  std::vector<double> y_std = vec2series(y, "y");
  std::vector<std::vector<double>> x_std = x2vars(x);
  std::vector<std::string> names = x2names(x);
  std::vector<int> lags = lag2std(lag);
  std::vector<double> cond_std = cond_series(cond);
  std::vector<uint8_t> mask_std = mask_series(mask);
  const Dispatch::ParallelMode mode = parallel_mode(parallel);

  if (workers < 0) {
    Rcpp::stop("workers must be zero or positive");
  }

  REstimator estimator(mi, cmi);
  if (cond_std.empty() && !estimator.HasMI()) {
    Rcpp::stop("mi must be an R function (x, y, k)");
  }
  if (!cond_std.empty() && !estimator.HasCMI()) {
    Rcpp::stop("cmi must be an R function (x, y, z, k) when cond is given");
  }

  if (verbose) {
    const size_t n_tasks = lags.size() * x_std.size();
    const bool par = Dispatch::ShouldBeParallel(mode, n_tasks, y_std.size());
    const size_t n_workers = workers > 0 ? static_cast<size_t>(workers)
                                         : Dispatch::DefaultWorkerCount();
    Rcpp::Rcout << "Estimating " << n_tasks << " lag/variable pair(s) with k = " << k;
    if (par) {
      Rcpp::Rcout << " in " << std::min(n_workers, n_tasks) << " worker process(es)\n";
    } else {
      Rcpp::Rcout << " sequentially\n";
    }
  }

  const auto start = std::chrono::steady_clock::now();

  TaskGrid::ResultGrid grid = LagMI::EstimateMI(
    y_std, x_std, lags, estimator, k, cond_std, cond_lag, mask_std,
    mode, static_cast<size_t>(workers), names);

  if (verbose) {
    Rcpp::Rcout << "Estimation completed in " << elapsed_since(start) << "s\n";
  }

  if (!grid.AllFinite()) {
    Rcpp::warning("Some estimates are not finite. The data may be discrete or contain "
                  "many identical observations; add low-amplitude noise and try again.");
  }

  return grid2mat(grid);
}

// Wrapper function to compute the aligned observation windows of every lag/variable task.
// k is only validated here, no estimate is made
// [[Rcpp::export(rng = false)]]
Rcpp::List RcppLaggedWindows(SEXP y,
                             SEXP x,
                             Rcpp::NumericVector lag = Rcpp::NumericVector::create(0),
                             SEXP cond = R_NilValue,
                             int cond_lag = 0,
                             SEXP mask = R_NilValue,
                             int k = 3)
{
  std::vector<double> y_std = vec2series(y, "y");
  std::vector<std::vector<double>> x_std = x2vars(x);
  std::vector<int> lags = lag2std(lag);
  std::vector<double> cond_std = cond_series(cond);
  std::vector<uint8_t> mask_std = mask_series(mask);

  ParamCheck::CheckParameters(x_std, y_std, k, cond_std, mask_std);
  const LagAlign::LagBounds bounds = ParamCheck::CheckLags(lags, cond_lag, y_std.size());

  const TaskGrid::TaskList list = TaskGrid::EnumerateTasks(
    lags, x_std, y_std, bounds, k, cond_std, cond_lag, mask_std);

  Rcpp::List result(list.size());
  for (size_t i = 0; i < list.size(); ++i) {
    const TaskGrid::Task& t = list.tasks[i];
    const LagAlign::Windows w = LagAlign::Align(
      *t.x, *t.y, t.cond.get(), t.mask.get(), t.lag, t.cond_lag, t.bounds);

    if (t.HasCond()) {
      result[i] = Rcpp::List::create(
        Rcpp::Named("lag") = t.lag,
        Rcpp::Named("var") = static_cast<int>(t.var_index + 1),
        Rcpp::Named("x")   = Rcpp::wrap(w.xs),
        Rcpp::Named("y")   = Rcpp::wrap(w.ys),
        Rcpp::Named("z")   = Rcpp::wrap(w.zs));
    } else {
      result[i] = Rcpp::List::create(
        Rcpp::Named("lag") = t.lag,
        Rcpp::Named("var") = static_cast<int>(t.var_index + 1),
        Rcpp::Named("x")   = Rcpp::wrap(w.xs),
        Rcpp::Named("y")   = Rcpp::wrap(w.ys));
    }
  }

  return result;
}

// Wrapper function to expose the sequential / parallel dispatch decision
// [[Rcpp::export(rng = false)]]
bool RcppShouldBeParallel(SEXP parallel, int ntasks, int n)
{
  if (ntasks < 0 || n < 0) {
    Rcpp::stop("ntasks and n must be non-negative");
  }
  return Dispatch::ShouldBeParallel(parallel_mode(parallel),
                                    static_cast<size_t>(ntasks),
                                    static_cast<size_t>(n));
}
