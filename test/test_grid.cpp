#include <catch2/catch.hpp>

#include "densities.hpp"
#include "errors.hpp"
#include "grid.hpp"
#include "joint_distributions.hpp"

#include <Eigen/Core>

#include <cmath>

using namespace gridbayes;

TEST_CASE("Test axis construction", "[grid]")
{
   SECTION("Single cell axis is centered")
   {
      const Eigen::VectorXd axis(make_axis(1));

      REQUIRE(axis.size() == 1);
      CHECK(axis(0) == 0.5);
   }

   SECTION("Returns cell centers")
   {
      const double tolerance = 1e-15;

      const Eigen::VectorXd axis(make_axis(4));

      REQUIRE(axis.size() == 4);
      CHECK(std::abs(axis(0) - 0.125) < tolerance);
      CHECK(std::abs(axis(1) - 0.375) < tolerance);
      CHECK(std::abs(axis(2) - 0.625) < tolerance);
      CHECK(std::abs(axis(3) - 0.875) < tolerance);
   }

   SECTION("Values are increasing and symmetric about one half")
   {
      const double tolerance = 1e-12;

      for (int n : {2, 3, 10, 100, 257}) {
         const Eigen::VectorXd axis(make_axis(n));

         REQUIRE(axis.size() == n);
         CHECK(std::abs(axis(0) - 0.5 / n) < tolerance);
         CHECK(std::abs(axis(n - 1) - (1. - 0.5 / n)) < tolerance);

         for (int i = 0; i < n; ++i) {
            CHECK(axis(i) > 0);
            CHECK(axis(i) < 1);
            CHECK(std::abs(axis(i) + axis(n - 1 - i) - 1.) < tolerance);
            if (i > 0) {
               CHECK(axis(i) > axis(i - 1));
            }
         }
      }
   }

   SECTION("Throws for non-positive number of cells")
   {
      CHECK_THROWS_AS(make_axis(0), Invalid_grid_resolution);
      CHECK_THROWS_AS(make_axis(-3), Invalid_grid_resolution);
   }
}

TEST_CASE("Test outer evaluation", "[grid]")
{
   SECTION("Evaluates non-separable function on rectangular grid")
   {
      const Eigen::VectorXd x(make_axis(3));
      const Eigen::VectorXd y(make_axis(5));

      const auto f = [](double a, double b) { return a + 10. * b * b; };

      const Eigen::MatrixXd grid(outer_evaluate(x, y, f));

      REQUIRE(grid.rows() == 3);
      REQUIRE(grid.cols() == 5);
      for (int j = 0; j < 5; ++j) {
         for (int i = 0; i < 3; ++i) {
            CHECK(grid(i, j) == f(x(i), y(j)));
         }
      }
   }

   SECTION("Prior is product of conditional and hyperprior densities")
   {
      const double tolerance = 1e-12;
      const int n = 20;

      const Eigen::VectorXd axis(make_axis(n));

      Hierarchical_beta_prior prior;
      const Eigen::MatrixXd grid(outer_evaluate(axis, axis, prior));

      for (int j = 0; j < n; ++j) {
         for (int i = 0; i < n; ++i) {
            const double mu = axis(j);
            const double expected = prior.conditional_density(axis(i), mu)
               * 6. * mu * (1. - mu);
            CHECK(std::abs(grid(i, j) - expected) <= tolerance * expected);
         }
      }
   }

   SECTION("Prior is finite on fine grid")
   {
      const Eigen::VectorXd axis(make_axis(1000));

      Hierarchical_beta_prior prior;
      const Eigen::MatrixXd grid(outer_evaluate(axis, axis, prior));

      CHECK(grid.allFinite());
      CHECK(grid.minCoeff() >= 0);
      CHECK(grid.maxCoeff() <= max_density);
   }

   SECTION("Likelihood depends only on theta")
   {
      const double tolerance = 1e-15;
      const int n = 10;

      const Eigen::VectorXd axis(make_axis(n));

      const Binomial_likelihood likelihood(9, 3);
      const Eigen::MatrixXd grid(outer_evaluate(axis, axis, likelihood));

      for (int j = 0; j < n; ++j) {
         for (int i = 0; i < n; ++i) {
            const double theta = axis(i);
            const double expected =
               std::pow(theta, 9) * std::pow(1. - theta, 3);
            CHECK(std::abs(grid(i, j) - expected) < tolerance);
            CHECK(grid(i, j) == grid(i, 0));
         }
      }
   }

   SECTION("Likelihood with no observations is constant")
   {
      const Eigen::VectorXd axis(make_axis(7));

      const Binomial_likelihood likelihood(0, 0);
      const Eigen::MatrixXd grid(outer_evaluate(axis, axis, likelihood));

      REQUIRE(grid.rows() == 7);
      REQUIRE(grid.cols() == 7);
      CHECK((grid.array() == 1.).all());
   }

   SECTION("Throws for negative counts")
   {
      CHECK_THROWS_AS(Binomial_likelihood(-1, 3), Invalid_observation_counts);
      CHECK_THROWS_AS(Binomial_likelihood(2, -5), Invalid_observation_counts);
   }
}
