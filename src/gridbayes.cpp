/**
 * @file gridbayes.cpp
 * @brief provides Python binding definitions
*/

#include "errors.hpp"
#include "grid.hpp"
#include "hierarchical_beta_binomial.hpp"
#include "marginals.hpp"
#include "normalization.hpp"
#include "posterior.hpp"

#include <Eigen/Core>

#include <pybind11/eigen.h>
#include <pybind11/stl.h>
#include <pybind11/pybind11.h>

namespace py = pybind11;

using namespace gridbayes;

PYBIND11_MODULE(gridbayes_ext, m) {
   py::register_exception<Invalid_grid_resolution>(
      m, "InvalidGridResolution", PyExc_ValueError);
   py::register_exception<Invalid_shape_parameters>(
      m, "InvalidShapeParameters", PyExc_ValueError);
   py::register_exception<Invalid_observation_counts>(
      m, "InvalidObservationCounts", PyExc_ValueError);
   py::register_exception<Degenerate_normalization>(
      m, "DegenerateNormalization", PyExc_ArithmeticError);
   py::register_exception<Shape_mismatch>(
      m, "ShapeMismatch", PyExc_ValueError);

   py::enum_<Marginal_axis>(m, "MarginalAxis", py::arithmetic())
      .value("Theta", Marginal_axis::Theta)
      .value("Mu", Marginal_axis::Mu)
      .export_values();

   py::enum_<Hyperprior_type>(m, "HyperpriorType", py::arithmetic())
      .value("Beta", Hyperprior_type::Beta)
      .value("PowerLaw", Hyperprior_type::Power_law)
      .export_values();

   m.def("make_axis", &make_axis, py::arg("n"));
   m.def("normalize",
         [](const Eigen::MatrixXd& grid) { return normalize(grid); },
         py::arg("grid"));
   m.def("combine", &combine, py::arg("prior"), py::arg("likelihood"));
   m.def("marginalize", &marginalize, py::arg("grid"), py::arg("axis"));

   py::class_<HierarchicalBetaBinomial>(m, "HierarchicalBetaBinomial")
      .def(py::init<int, int, int, double,
           Hyperprior_type, double, double, double,
           int>(),
           py::arg("n_grid_points") = 100,
           py::arg("heads") = 0,
           py::arg("tails") = 0,
           py::arg("confidence") = 100.0,
           py::arg("hyperprior") = Hyperprior_type::Beta,
           py::arg("hyperprior_a") = 2.0,
           py::arg("hyperprior_b") = 2.0,
           py::arg("power_law_exponent") = 1.0,
           py::arg("verbosity") = 0)
      .def("get_theta_axis", &HierarchicalBetaBinomial::get_theta_axis,
           py::return_value_policy::copy)
      .def("get_mu_axis", &HierarchicalBetaBinomial::get_mu_axis,
           py::return_value_policy::copy)
      .def("get_prior", &HierarchicalBetaBinomial::get_prior,
           py::return_value_policy::copy)
      .def("get_prior_mass", &HierarchicalBetaBinomial::get_prior_mass)
      .def("get_likelihood", &HierarchicalBetaBinomial::get_likelihood,
           py::return_value_policy::copy)
      .def("get_posterior", &HierarchicalBetaBinomial::get_posterior,
           py::return_value_policy::copy)
      .def("get_evidence", &HierarchicalBetaBinomial::get_evidence)
      .def("get_prior_theta_marginal",
           &HierarchicalBetaBinomial::get_prior_theta_marginal,
           py::return_value_policy::copy)
      .def("get_prior_mu_marginal",
           &HierarchicalBetaBinomial::get_prior_mu_marginal,
           py::return_value_policy::copy)
      .def("get_posterior_theta_marginal",
           &HierarchicalBetaBinomial::get_posterior_theta_marginal,
           py::return_value_policy::copy)
      .def("get_posterior_mu_marginal",
           &HierarchicalBetaBinomial::get_posterior_mu_marginal,
           py::return_value_policy::copy)
      .def("get_posterior_mean", &HierarchicalBetaBinomial::get_posterior_mean)
      .def("get_posterior_mode", &HierarchicalBetaBinomial::get_posterior_mode);
}
