#include "hierarchical_beta_binomial.hpp"
#include "errors.hpp"
#include "grid.hpp"
#include "normalization.hpp"
#include "posterior.hpp"

#include <cmath>
#include <iostream>
#include <tuple>

namespace gridbayes {

namespace {

Hierarchical_beta_prior make_prior(
   double confidence, Hyperprior_type hyperprior,
   double hyperprior_a, double hyperprior_b, double power_law_exponent)
{
   if (!std::isfinite(confidence) || confidence <= 0) {
      throw Invalid_shape_parameters(
         "confidence must be finite and positive");
   }

   if (hyperprior == Hyperprior_type::Beta) {
      if (!std::isfinite(hyperprior_a) || !std::isfinite(hyperprior_b)
          || hyperprior_a < 0 || hyperprior_b < 0) {
         throw Invalid_shape_parameters(
            "hyperprior shape parameters must be finite and non-negative");
      }
   } else if (!std::isfinite(power_law_exponent) || power_law_exponent <= -1) {
      throw Invalid_shape_parameters(
         "power law exponent must be finite and greater than -1");
   }

   Hierarchical_beta_prior prior;
   prior.confidence = confidence;
   prior.hyperprior = hyperprior;
   prior.hyperprior_a = hyperprior_a;
   prior.hyperprior_b = hyperprior_b;
   prior.power_law_exponent = power_law_exponent;

   return prior;
}

} // anonymous namespace

HierarchicalBetaBinomial::HierarchicalBetaBinomial(
   int n_grid_points, int heads, int tails, double confidence,
   Hyperprior_type hyperprior, double hyperprior_a, double hyperprior_b,
   double power_law_exponent, int verbosity)
{
   const Hierarchical_beta_prior prior_density = make_prior(
      confidence, hyperprior, hyperprior_a, hyperprior_b,
      power_law_exponent);
   const Binomial_likelihood likelihood_function(heads, tails);

   theta_axis = make_axis(n_grid_points);
   mu_axis = make_axis(n_grid_points);

   if (verbosity > 0) {
      std::cout << "Evaluating prior on " << n_grid_points << " x "
                << n_grid_points << " grid\n";
   }

   std::tie(prior, prior_mass) = normalize(
      outer_evaluate(theta_axis, mu_axis, prior_density));

   likelihood = outer_evaluate(theta_axis, mu_axis, likelihood_function);

   std::tie(posterior, evidence) = combine(prior, likelihood);

   if (verbosity > 0) {
      std::cout << "Prior mass = " << prior_mass << '\n';
      std::cout << "Evidence for " << heads << " heads, " << tails
                << " tails = " << evidence << '\n';
   }

   prior_theta_marginal = marginalize(prior, Marginal_axis::Theta);
   prior_mu_marginal = marginalize(prior, Marginal_axis::Mu);
   posterior_theta_marginal = marginalize(posterior, Marginal_axis::Theta);
   posterior_mu_marginal = marginalize(posterior, Marginal_axis::Mu);

   if (verbosity > 1) {
      std::cout << "Posterior mode theta = "
                << get_posterior_mode(Marginal_axis::Theta) << '\n';
      std::cout << "Posterior mode mu = "
                << get_posterior_mode(Marginal_axis::Mu) << '\n';
   }
}

double HierarchicalBetaBinomial::get_posterior_mean(Marginal_axis axis) const
{
   if (axis == Marginal_axis::Theta) {
      return marginal_mean(theta_axis, posterior_theta_marginal);
   }
   return marginal_mean(mu_axis, posterior_mu_marginal);
}

double HierarchicalBetaBinomial::get_posterior_mode(Marginal_axis axis) const
{
   if (axis == Marginal_axis::Theta) {
      return marginal_mode(theta_axis, posterior_theta_marginal);
   }
   return marginal_mode(mu_axis, posterior_mu_marginal);
}

} // namespace gridbayes
