#include <vector>
#include <cstdint>
#include <string>
#include "taskgrid.hpp"
#include "inputconv.hpp"
#include "DataTrans.h"
#include <Rcpp.h>

// Function to convert an R numeric / integer vector to std::vector<double>
std::vector<double> vec2series(SEXP v, const char* what) {
  if (!Rf_isNumeric(v) || Rf_isFactor(v)) {
    Rcpp::stop("%s must be a numeric vector", what);
  }
  return Rcpp::as<std::vector<double>>(v);
}

// Function to convert the x argument to std::vector<std::vector<double>> (var-major)
std::vector<std::vector<double>> x2vars(SEXP x) {
  std::vector<std::vector<double>> vars;

  if (Rf_isMatrix(x)) {
    if (!Rf_isNumeric(x)) {
      Rcpp::stop("x must be a numeric matrix");
    }
    Rcpp::NumericMatrix mat(x);
    // Each column is one variable, rows are observations
    vars = InputConv::ColumnsFromColMajor(
      REAL(mat), static_cast<size_t>(mat.nrow()), static_cast<size_t>(mat.ncol()));
  } else if (Rf_isNewList(x)) {
    Rcpp::List lst(x);
    vars.reserve(lst.size());
    for (R_xlen_t i = 0; i < lst.size(); ++i) {
      vars.push_back(vec2series(lst[i], "each element of x"));
    }
  } else {
    vars.push_back(vec2series(x, "x"));
  }

  return vars;
}

// Function to collect the variable names of x
std::vector<std::string> x2names(SEXP x) {
  std::vector<std::string> names;

  SEXP nm = R_NilValue;
  if (Rf_isMatrix(x)) {
    SEXP dn = Rf_getAttrib(x, R_DimNamesSymbol);
    if (!Rf_isNull(dn)) {
      nm = VECTOR_ELT(dn, 1);
    }
  } else if (Rf_isNewList(x)) {
    nm = Rf_getAttrib(x, R_NamesSymbol);
  }

  if (Rf_isNull(nm)) return names;

  Rcpp::CharacterVector cv(nm);
  names.reserve(cv.size());
  for (Rcpp::String s : cv) {
    if (s == NA_STRING) {
      names.push_back("NA");
    } else {
      names.push_back(Rcpp::as<std::string>(s));
    }
  }
  return names;
}

// Function to convert an R logical vector to a 0 / 1 mask
std::vector<uint8_t> lgl2mask(SEXP mask) {
  if (TYPEOF(mask) != LGLSXP) {
    Rcpp::stop("mask must contain only booleans");
  }

  Rcpp::LogicalVector lv(mask);
  return InputConv::MaskFromLogical(
    std::vector<int>(lv.begin(), lv.end()), NA_LOGICAL);
}

// Function to convert R lags to std::vector<int>
std::vector<int> lag2std(const Rcpp::NumericVector& lag) {
  return InputConv::LagsFromDoubles(Rcpp::as<std::vector<double>>(lag));
}

// Function to convert TaskGrid::ResultGrid to Rcpp::NumericMatrix
Rcpp::NumericMatrix grid2mat(const TaskGrid::ResultGrid& grid) {
  const int n_rows = static_cast<int>(grid.n_lags);
  const int n_cols = static_cast<int>(grid.n_vars);
  Rcpp::NumericMatrix result(n_rows, n_cols);

  for (int r = 0; r < n_rows; ++r) {
    for (int c = 0; c < n_cols; ++c) {
      result(r, c) = grid.at(r, c);
    }
  }

  Rcpp::CharacterVector row_names(Rcpp::wrap(InputConv::LagLabels(grid.lags)));

  if (grid.var_names.empty()) {
    result.attr("dimnames") = Rcpp::List::create(row_names, R_NilValue);
  } else {
    result.attr("dimnames") = Rcpp::List::create(row_names, Rcpp::wrap(grid.var_names));
  }

  return result;
}
