#include "densities.hpp"
#include "errors.hpp"

#include <cmath>
#include <limits>

namespace gridbayes {

namespace {

// c * log(y), with 0 * log(0) taken to be 0
double xlogy(double c, double y)
{
   if (c == 0) {
      return 0;
   }
   return c * std::log(y);
}

double clamp_log_density(double log_density)
{
   static const double log_max_density = std::log(max_density);

   if (std::isnan(log_density) || log_density > log_max_density) {
      return log_max_density;
   }

   return log_density;
}

} // anonymous namespace

/**
 * @brief log of the beta density with shape parameters a and b
 *
 * Zero shape parameters and evaluation at the end points are allowed;
 * values that would overflow or are undefined are clamped to
 * log(max_density).
 *
 * @param x point at which to evaluate the density
 * @param a first shape parameter
 * @param b second shape parameter
 * @return log density, or -max for x outside of [0, 1] or NaN
 */
double log_beta_density(double x, double a, double b)
{
   if (!std::isfinite(a) || !std::isfinite(b) || a < 0 || b < 0) {
      throw Invalid_shape_parameters(
         "beta shape parameters must be finite and non-negative");
   }

   if (!(x >= 0 && x <= 1)) {
      return -std::numeric_limits<double>::max();
   }

   const double log_normalization =
      std::lgamma(a + b) - std::lgamma(a) - std::lgamma(b);

   return clamp_log_density(
      log_normalization + xlogy(a - 1., x) + xlogy(b - 1., 1. - x));
}

double beta_density(double x, double a, double b)
{
   return std::exp(log_beta_density(x, a, b));
}

/**
 * @brief log of the density (k + 1) x^k on [0, 1]
 * @param x point at which to evaluate the density
 * @param k exponent, must be greater than -1
 * @return log density, or -max for x outside of [0, 1] or NaN
 */
double log_power_law_density(double x, double k)
{
   if (!std::isfinite(k) || k <= -1) {
      throw Invalid_shape_parameters(
         "power law exponent must be finite and greater than -1");
   }

   if (!(x >= 0 && x <= 1)) {
      return -std::numeric_limits<double>::max();
   }

   return clamp_log_density(std::log(k + 1.) + xlogy(k, x));
}

double power_law_density(double x, double k)
{
   return std::exp(log_power_law_density(x, k));
}

} // namespace gridbayes
