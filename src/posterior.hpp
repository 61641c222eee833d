#ifndef GRIDBAYES_POSTERIOR_HPP_INCLUDED
#define GRIDBAYES_POSTERIOR_HPP_INCLUDED

#include <Eigen/Core>

#include <tuple>

namespace gridbayes {

/**
 * @brief combines prior and likelihood grids into the posterior
 *
 * Neither input is normalized before the elementwise product is taken,
 * so that the returned evidence is the total mass of prior times
 * likelihood.
 *
 * @param prior prior grid
 * @param likelihood likelihood grid of the same shape
 * @return tuple of the normalized posterior grid and the evidence
 */
std::tuple<Eigen::MatrixXd, double> combine(const Eigen::MatrixXd& prior,
                                            const Eigen::MatrixXd& likelihood);

} // namespace gridbayes

#endif
