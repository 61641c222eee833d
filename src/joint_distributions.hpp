#ifndef GRIDBAYES_JOINT_DISTRIBUTIONS_HPP_INCLUDED
#define GRIDBAYES_JOINT_DISTRIBUTIONS_HPP_INCLUDED

/**
 * @file joint_distributions.hpp
 * @brief bivariate prior and likelihood functions and their evaluation
 *        on a grid
 */

#include <Eigen/Core>

namespace gridbayes {

/**
 * @brief evaluates a bivariate function at every pair of axis values
 * @tparam F callable with signature double(double, double)
 * @param x values of the first argument, one per row
 * @param y values of the second argument, one per column
 * @param f the function to evaluate
 * @return matrix with elements f(x(i), y(j))
 */
template <class F>
Eigen::MatrixXd outer_evaluate(const Eigen::VectorXd& x,
                               const Eigen::VectorXd& y, F f)
{
   const int n_rows = x.size();
   const int n_cols = y.size();

   Eigen::MatrixXd result(n_rows, n_cols);
   for (int j = 0; j < n_cols; ++j) {
      for (int i = 0; i < n_rows; ++i) {
         result(i, j) = f(x(i), y(j));
      }
   }

   return result;
}

enum class Hyperprior_type : int { Beta = 0, Power_law };

/**
 * @brief joint density of theta and mu, with theta ~ Beta(c mu, c (1 - mu))
 *        and mu drawn from the hyperprior
 */
struct Hierarchical_beta_prior {
   double confidence{100};
   Hyperprior_type hyperprior{Hyperprior_type::Beta};
   double hyperprior_a{2};
   double hyperprior_b{2};
   double power_law_exponent{1};

   double operator()(double, double) const;
   double conditional_density(double, double) const;
   double hyperprior_density(double) const;
};

/**
 * @brief probability of observing the given numbers of heads and tails,
 *        as a function of theta only
 *
 * Evaluated directly in double precision, so the grid underflows to zero
 * once its largest value drops below about 1e-308, e.g. for 600 heads and
 * 600 tails.  Normalizing a posterior built from such a grid throws
 * Degenerate_normalization.
 */
class Binomial_likelihood {
public:
   Binomial_likelihood(int, int);

   int get_heads() const { return heads; }
   int get_tails() const { return tails; }

   double operator()(double, double) const;

private:
   int heads{0};
   int tails{0};
};

} // namespace gridbayes

#endif
