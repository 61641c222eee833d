#ifndef GRIDBAYES_ERRORS_HPP_INCLUDED
#define GRIDBAYES_ERRORS_HPP_INCLUDED

/**
 * @file errors.hpp
 * @brief exceptions thrown on invalid input to the grid computations
 */

#include <stdexcept>
#include <string>

namespace gridbayes {

class Invalid_grid_resolution : public std::runtime_error {
public:
   explicit Invalid_grid_resolution(const std::string& msg)
      : std::runtime_error(msg) {}
};

class Invalid_shape_parameters : public std::runtime_error {
public:
   explicit Invalid_shape_parameters(const std::string& msg)
      : std::runtime_error(msg) {}
};

class Invalid_observation_counts : public std::runtime_error {
public:
   explicit Invalid_observation_counts(const std::string& msg)
      : std::runtime_error(msg) {}
};

/// sum of a grid or vector is zero, negative or not finite
class Degenerate_normalization : public std::runtime_error {
public:
   explicit Degenerate_normalization(const std::string& msg)
      : std::runtime_error(msg) {}
};

class Shape_mismatch : public std::runtime_error {
public:
   explicit Shape_mismatch(const std::string& msg)
      : std::runtime_error(msg) {}
};

} // namespace gridbayes

#endif
