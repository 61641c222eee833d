#ifndef GRIDBAYES_NORMALIZATION_HPP_INCLUDED
#define GRIDBAYES_NORMALIZATION_HPP_INCLUDED

/**
 * @file normalization.hpp
 * @brief provides rescaling of grids and vectors to unit sum
 */

#include "errors.hpp"

#include <Eigen/Core>

#include <cmath>
#include <tuple>

namespace gridbayes {

/**
 * @brief rescale matrix or vector so that its elements sum to one
 * @tparam Derived Eigen expression type
 * @param g the matrix or vector to be normalized
 * @return tuple of the normalized copy and the sum of the elements of g
 */
template <class Derived>
std::tuple<typename Derived::PlainObject, double> normalize(
   const Eigen::MatrixBase<Derived>& g)
{
   const double mass = g.sum();

   if (!std::isfinite(mass) || mass <= 0) {
      throw Degenerate_normalization(
         "cannot normalize grid with zero, negative or non-finite sum");
   }

   const typename Derived::PlainObject result = g / mass;

   return std::make_tuple(result, mass);
}

} // namespace gridbayes

#endif
