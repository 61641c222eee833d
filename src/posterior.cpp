#include "posterior.hpp"
#include "errors.hpp"
#include "normalization.hpp"

namespace gridbayes {

std::tuple<Eigen::MatrixXd, double> combine(
   const Eigen::MatrixXd& prior, const Eigen::MatrixXd& likelihood)
{
   if (prior.rows() != likelihood.rows()
       || prior.cols() != likelihood.cols()) {
      throw Shape_mismatch(
         "shape of prior grid does not match shape of likelihood grid");
   }

   const Eigen::MatrixXd unnormalized =
      prior.cwiseProduct(likelihood);

   return normalize(unnormalized);
}

} // namespace gridbayes
