#include "marginals.hpp"
#include "errors.hpp"
#include "normalization.hpp"

#include <tuple>

namespace gridbayes {

namespace {

void check_marginal_size(const Eigen::VectorXd& axis,
                         const Eigen::VectorXd& marginal)
{
   if (axis.size() != marginal.size()) {
      throw Shape_mismatch(
         "number of axis values does not match length of marginal");
   }

   if (axis.size() == 0) {
      throw Shape_mismatch("marginal must not be empty");
   }
}

} // anonymous namespace

/**
 * @brief sums a joint grid over the parameter not given by axis
 * @param grid joint grid with theta along rows and mu along columns
 * @param axis the parameter to retain
 * @return row sums for Marginal_axis::Theta, column sums for
 *         Marginal_axis::Mu
 */
Eigen::VectorXd sum_out(const Eigen::MatrixXd& grid, Marginal_axis axis)
{
   const int n_rows = grid.rows();
   const int n_cols = grid.cols();

   const bool keep_rows = axis == Marginal_axis::Theta;

   Eigen::VectorXd sums(Eigen::VectorXd::Zero(keep_rows ? n_rows : n_cols));
   for (int j = 0; j < n_cols; ++j) {
      for (int i = 0; i < n_rows; ++i) {
         sums(keep_rows ? i : j) += grid(i, j);
      }
   }

   return sums;
}

Eigen::VectorXd marginalize(const Eigen::MatrixXd& grid, Marginal_axis axis)
{
   return std::get<0>(normalize(sum_out(grid, axis)));
}

double marginal_mean(const Eigen::VectorXd& axis,
                     const Eigen::VectorXd& marginal)
{
   check_marginal_size(axis, marginal);

   return axis.dot(marginal);
}

double marginal_mode(const Eigen::VectorXd& axis,
                     const Eigen::VectorXd& marginal)
{
   check_marginal_size(axis, marginal);

   Eigen::Index mode_index = 0;
   marginal.maxCoeff(&mode_index);

   return axis(mode_index);
}

} // namespace gridbayes
