#ifndef GRIDBAYES_MARGINALS_HPP_INCLUDED
#define GRIDBAYES_MARGINALS_HPP_INCLUDED

/**
 * @file marginals.hpp
 * @brief reduction of joint grids to one-dimensional marginals
 */

#include <Eigen/Core>

namespace gridbayes {

/// parameter whose distribution is retained when marginalizing
enum class Marginal_axis : int { Theta = 0, Mu };

Eigen::VectorXd sum_out(const Eigen::MatrixXd&, Marginal_axis);
Eigen::VectorXd marginalize(const Eigen::MatrixXd&, Marginal_axis);

double marginal_mean(const Eigen::VectorXd&, const Eigen::VectorXd&);
double marginal_mode(const Eigen::VectorXd&, const Eigen::VectorXd&);

} // namespace gridbayes

#endif
