#ifndef DataTrans_H
#define DataTrans_H

#include <vector>
#include <cstdint>
#include <string>
#include "taskgrid.hpp"
#include <Rcpp.h>

/********************************************************************
 *
 *  R <-> C++ Conversion Utilities for Lagged MI Estimation
 *
 *  These functions convert between:
 *
 *      R representation:
 *          numeric vector       one series
 *          numeric matrix       rows = observations, cols = variables
 *          list of vectors      one element per variable
 *          logical vector       observation mask
 *
 *      C++ representation:
 *          std::vector<double>                series
 *          std::vector<std::vector<double>>   mat[var][obs]
 *          std::vector<uint8_t>               mask, 0 / 1
 *          std::vector<int>                   lags
 *
 *  Conversion rules:
 *
 *      R → C++
 *          - Integer vectors are accepted wherever numeric
 *            vectors are expected
 *          - Lags must be whole numbers
 *          - Masks must be logical and free of NA
 *
 *      C++ → R
 *          - TaskGrid::ResultGrid becomes a numeric matrix with
 *            lag values as row names and variable names (when
 *            known) as column names
 *
 ********************************************************************/

/********************************************************************
 *  vec2series
 *
 *  Convert an R numeric (or integer) vector into a series.
 *  `what` names the argument in error messages.
 ********************************************************************/
std::vector<double> vec2series(SEXP v, const char* what);

/********************************************************************
 *  x2vars
 *
 *  Convert the x argument into mat[var][obs].
 *
 *      numeric vector   -> one variable
 *      numeric matrix   -> one variable per column
 *      list             -> one variable per element
 *
 ********************************************************************/
std::vector<std::vector<double>> x2vars(SEXP x);

/********************************************************************
 *  x2names
 *
 *  Variable names of x: colnames of a matrix or names of a
 *  list. Returns an empty vector when x carries no names.
 ********************************************************************/
std::vector<std::string> x2names(SEXP x);

/********************************************************************
 *  lgl2mask
 *
 *  Convert an R logical vector into a 0 / 1 mask.
 *  Non logical input and NA elements are rejected.
 ********************************************************************/
std::vector<uint8_t> lgl2mask(SEXP mask);

/********************************************************************
 *  lag2std
 *
 *  Convert an R numeric / integer vector of lags into
 *  std::vector<int>. Non integral or NA lags are rejected.
 ********************************************************************/
std::vector<int> lag2std(const Rcpp::NumericVector& lag);

/********************************************************************
 *  grid2mat
 *
 *  Convert a result grid into an R matrix [n_lags x n_vars]
 *  with dimnames.
 ********************************************************************/
Rcpp::NumericMatrix grid2mat(const TaskGrid::ResultGrid& grid);

#endif // DataTrans_H
