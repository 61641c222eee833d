#ifndef GRIDBAYES_GRID_HPP_INCLUDED
#define GRIDBAYES_GRID_HPP_INCLUDED

#include <Eigen/Core>

namespace gridbayes {

/**
 * @brief returns the n cell centers of a uniform partition of [0, 1]
 * @param n number of cells
 * @return vector with elements (i + 0.5) / n
 */
Eigen::VectorXd make_axis(int n);

} // namespace gridbayes

#endif
