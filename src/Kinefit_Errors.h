//Kinefit_Errors.h -- Exceptions thrown across the project.
//
// Only failures that are fatal to the caller are thrown. Per-file rejections, non-convergence, and missing confidence
// intervals are reported as values (see Time_Series_Loader.h and Curve_Fitting.h).

#pragma once

#include <string>
#include <stdexcept>

namespace kfit {

// Malformed model catalog document. Fatal at start-up.
struct catalog_parse_error : public std::runtime_error {
    explicit catalog_parse_error(const std::string &what) : std::runtime_error(what) {}
};

// A constant name was specified more than once.
struct duplicate_constant_error : public catalog_parse_error {
    explicit duplicate_constant_error(const std::string &what) : catalog_parse_error(what) {}
};

// A constant value could not be parsed as a number.
struct malformed_constant_error : public catalog_parse_error {
    explicit malformed_constant_error(const std::string &what) : catalog_parse_error(what) {}
};

// A model references a function that is not registered.
struct unknown_function_error : public catalog_parse_error {
    explicit unknown_function_error(const std::string &what) : catalog_parse_error(what) {}
};

// A parameter's default is outside its constraints, or the constraints are inverted.
struct invalid_parameter_range_error : public catalog_parse_error {
    explicit invalid_parameter_range_error(const std::string &what) : catalog_parse_error(what) {}
};

// A mandatory element (inlet type, parameter ranges, ...) is absent.
struct missing_element_error : public catalog_parse_error {
    explicit missing_element_error(const std::string &what) : catalog_parse_error(what) {}
};

// Invalid numeric input to the signal/concentration conversion routines.
struct domain_error : public std::domain_error {
    explicit domain_error(const std::string &what) : std::domain_error(what) {}
};

} // namespace kfit
