#include "joint_distributions.hpp"
#include "densities.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>

namespace gridbayes {

double Hierarchical_beta_prior::operator()(double theta, double mu) const
{
   const double value = conditional_density(theta, mu)
      * hyperprior_density(mu);
   return std::min(value, max_density);
}

double Hierarchical_beta_prior::conditional_density(
   double theta, double mu) const
{
   return beta_density(theta, confidence * mu, confidence * (1. - mu));
}

double Hierarchical_beta_prior::hyperprior_density(double mu) const
{
   if (hyperprior == Hyperprior_type::Power_law) {
      return power_law_density(mu, power_law_exponent);
   }
   return beta_density(mu, hyperprior_a, hyperprior_b);
}

Binomial_likelihood::Binomial_likelihood(int heads_, int tails_)
   : heads(heads_)
   , tails(tails_)
{
   if (heads_ < 0 || tails_ < 0) {
      throw Invalid_observation_counts(
         "numbers of heads and tails must be non-negative");
   }
}

double Binomial_likelihood::operator()(double theta, double /* mu */) const
{
   return std::pow(theta, heads) * std::pow(1. - theta, tails);
}

} // namespace gridbayes
