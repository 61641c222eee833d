#ifndef GRIDBAYES_HIERARCHICAL_BETA_BINOMIAL_HPP_INCLUDED
#define GRIDBAYES_HIERARCHICAL_BETA_BINOMIAL_HPP_INCLUDED

#include "joint_distributions.hpp"
#include "marginals.hpp"

#include <Eigen/Core>

namespace gridbayes {

/**
 * @class HierarchicalBetaBinomial
 * @brief grid approximation to the posterior of a beta-binomial model
 *        with a hyperprior on the mean of the beta distribution
 *
 * All grids and marginals are computed on construction and are not
 * modified afterwards.
 */
class HierarchicalBetaBinomial {
public:
   HierarchicalBetaBinomial(int, int, int, double,
                            Hyperprior_type, double, double, double,
                            int);
   ~HierarchicalBetaBinomial() = default;

   const Eigen::VectorXd& get_theta_axis() const { return theta_axis; }
   const Eigen::VectorXd& get_mu_axis() const { return mu_axis; }

   const Eigen::MatrixXd& get_prior() const { return prior; }
   double get_prior_mass() const { return prior_mass; }
   const Eigen::MatrixXd& get_likelihood() const { return likelihood; }
   const Eigen::MatrixXd& get_posterior() const { return posterior; }
   /// mass of the normalized prior times the likelihood
   double get_evidence() const { return evidence; }

   const Eigen::VectorXd& get_prior_theta_marginal() const {
      return prior_theta_marginal;
   }
   const Eigen::VectorXd& get_prior_mu_marginal() const {
      return prior_mu_marginal;
   }
   const Eigen::VectorXd& get_posterior_theta_marginal() const {
      return posterior_theta_marginal;
   }
   const Eigen::VectorXd& get_posterior_mu_marginal() const {
      return posterior_mu_marginal;
   }

   double get_posterior_mean(Marginal_axis) const;
   double get_posterior_mode(Marginal_axis) const;

private:
   Eigen::VectorXd theta_axis;
   Eigen::VectorXd mu_axis;

   Eigen::MatrixXd prior;
   double prior_mass{0};
   Eigen::MatrixXd likelihood;
   Eigen::MatrixXd posterior;
   double evidence{0};

   Eigen::VectorXd prior_theta_marginal;
   Eigen::VectorXd prior_mu_marginal;
   Eigen::VectorXd posterior_theta_marginal;
   Eigen::VectorXd posterior_mu_marginal;
};

} // namespace gridbayes

#endif
