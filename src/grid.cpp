#include "grid.hpp"
#include "errors.hpp"

namespace gridbayes {

Eigen::VectorXd make_axis(int n)
{
   if (n < 1) {
      throw Invalid_grid_resolution(
         "number of grid points must be at least one");
   }

   const double width = 1. / n;

   Eigen::VectorXd axis(n);
   for (int i = 0; i < n; ++i) {
      axis(i) = (i + 0.5) * width;
   }

   return axis;
}

} // namespace gridbayes
