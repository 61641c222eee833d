#ifndef GRIDBAYES_DENSITIES_HPP_INCLUDED
#define GRIDBAYES_DENSITIES_HPP_INCLUDED

namespace gridbayes {

/// largest value returned by any density, used in place of overflow
constexpr double max_density = 1.0e100;

double log_beta_density(double, double, double);
double beta_density(double, double, double);

double log_power_law_density(double, double);
double power_law_density(double, double);

} // namespace gridbayes

#endif
