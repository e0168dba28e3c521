#ifndef REstimator_H
#define REstimator_H

#include <vector>
#include <string>
#include "lagmi.hpp"
#include <Rcpp.h>

/********************************************************************
 *
 *  REstimator
 *
 *  LagMI::Estimator backed by R functions:
 *
 *      mi(x, y, k)      -> numeric(1)
 *      cmi(x, y, z, k)  -> numeric(1)
 *
 *  Either function may be NULL when the call never needs it.
 *  R errors raised by the functions surface as C++ exceptions
 *  (Rcpp::eval_error) and abort the whole estimation.
 *
 *  In parallel mode the functions are evaluated in forked
 *  worker processes, so they must not rely on state mutated
 *  by other tasks.
 *
 ********************************************************************/
class REstimator : public LagMI::Estimator
{
public:
    REstimator(SEXP mi, SEXP cmi) : mi_(mi), cmi_(cmi) {}

    bool HasMI() const { return Rf_isFunction(mi_); }
    bool HasCMI() const { return Rf_isFunction(cmi_); }

    double MI(const std::vector<double>& xs,
              const std::vector<double>& ys,
              int k) const override
    {
        if (!HasMI())
            throw std::invalid_argument("mi must be an R function (x, y, k)");

        Rcpp::Function f(static_cast<SEXP>(mi_));
        return Rcpp::as<double>(f(Rcpp::wrap(xs), Rcpp::wrap(ys), k));
    }

    double CMI(const std::vector<double>& xs,
               const std::vector<double>& ys,
               const std::vector<double>& zs,
               int k) const override
    {
        if (!HasCMI())
            throw std::invalid_argument("cmi must be an R function (x, y, z, k)");

        Rcpp::Function f(static_cast<SEXP>(cmi_));
        return Rcpp::as<double>(f(Rcpp::wrap(xs), Rcpp::wrap(ys), Rcpp::wrap(zs), k));
    }

private:
    Rcpp::RObject mi_;
    Rcpp::RObject cmi_;
};

#endif // REstimator_H
