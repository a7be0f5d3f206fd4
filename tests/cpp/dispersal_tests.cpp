/**
 * Tests for the functional connectivity matrix B_ij.
 *
 * Coverage:
 * - Parameter validation per kernel and directionality
 * - Kernel values on a hand-checkable three-reach line
 * - Matrix properties: symmetry, unit diagonal, probability range
 * - Unreachable pairs
 */

#include <gtest/gtest.h>
#include <cmath>
#include "riverconn/core/backend.hpp"
#include "riverconn/core/dispersal.hpp"
#include "riverconn/core/error.hpp"
#include "test_utils.hpp"

using namespace riverconn::core;
using namespace riverconn::core::test;

namespace {

DispersalOptions symmetric(DispersalKernel kernel, double param) {
  DispersalOptions o;
  o.kernel = kernel;
  o.param = param;
  return o;
}

DispersalOptions asymmetric(DispersalKernel kernel, double param_u, double param_d) {
  DispersalOptions o;
  o.kernel = kernel;
  o.directionality = Directionality::Asymmetric;
  o.param_u = param_u;
  o.param_d = param_d;
  return o;
}

DispersalOptions leptokurtic(std::vector<double> param_l) {
  DispersalOptions o;
  o.kernel = DispersalKernel::Leptokurtic;
  o.param_l = std::move(param_l);
  return o;
}

} // namespace

//=============================================================================
// Validation
//=============================================================================

TEST(DispersalValidation, MissingParameterNamesTheField) {
  DispersalOptions o;
  try {
    validate_dispersal(o);
    FAIL() << "expected InvalidParameter";
  } catch (const InvalidParameter& e) {
    EXPECT_NE(std::string(e.what()).find("'param'"), std::string::npos) << e.what();
  }

  auto a = asymmetric(DispersalKernel::Exponential, 0.5, 0.5);
  a.param_d.reset();
  try {
    validate_dispersal(a);
    FAIL() << "expected InvalidParameter";
  } catch (const InvalidParameter& e) {
    EXPECT_NE(std::string(e.what()).find("param_d"), std::string::npos) << e.what();
  }
}

TEST(DispersalValidation, NaNCountsAsMissing) {
  EXPECT_THROW(validate_dispersal(symmetric(DispersalKernel::Exponential, std::nan(""))), InvalidParameter);
}

TEST(DispersalValidation, ExponentialBaseRange) {
  EXPECT_NO_THROW(validate_dispersal(symmetric(DispersalKernel::Exponential, 1.0)));
  EXPECT_NO_THROW(validate_dispersal(symmetric(DispersalKernel::Exponential, 0.01)));
  EXPECT_THROW(validate_dispersal(symmetric(DispersalKernel::Exponential, 0.0)), InvalidParameter);
  EXPECT_THROW(validate_dispersal(symmetric(DispersalKernel::Exponential, 1.5)), InvalidParameter);
  EXPECT_THROW(validate_dispersal(asymmetric(DispersalKernel::Exponential, 0.5, -0.1)), InvalidParameter);
}

TEST(DispersalValidation, ThresholdCutoffRange) {
  EXPECT_NO_THROW(validate_dispersal(symmetric(DispersalKernel::Threshold, 0.0)));
  EXPECT_NO_THROW(validate_dispersal(symmetric(DispersalKernel::Threshold, 250.0)));
  EXPECT_THROW(validate_dispersal(symmetric(DispersalKernel::Threshold, -1.0)), InvalidParameter);
  EXPECT_THROW(validate_dispersal(asymmetric(DispersalKernel::Threshold, -1.0, 5.0)), InvalidParameter);
}

TEST(DispersalValidation, AsymmetricIgnoresSymmetricParam) {
  auto o = asymmetric(DispersalKernel::Exponential, 0.5, 0.9);
  EXPECT_NO_THROW(validate_dispersal(o));
  o.param = 7.0;  // unused in asymmetric mode
  EXPECT_NO_THROW(validate_dispersal(o));
}

TEST(DispersalValidation, LeptokurticParameters) {
  EXPECT_NO_THROW(validate_dispersal(leptokurtic({2.0, 20.0, 0.7})));
  EXPECT_THROW(validate_dispersal(leptokurtic({2.0, 20.0})), InvalidParameter);
  EXPECT_THROW(validate_dispersal(leptokurtic({2.0, 20.0, 0.7, 1.0})), InvalidParameter);
  EXPECT_THROW(validate_dispersal(leptokurtic({0.0, 20.0, 0.7})), InvalidParameter);
  EXPECT_THROW(validate_dispersal(leptokurtic({2.0, -1.0, 0.7})), InvalidParameter);
  EXPECT_THROW(validate_dispersal(leptokurtic({2.0, 20.0, 1.2})), InvalidParameter);
}

TEST(DispersalValidation, LeptokurticForcesSymmetric) {
  auto o = leptokurtic({2.0, 20.0, 0.7});
  o.directionality = Directionality::Asymmetric;  // no param_u / param_d given
  EXPECT_EQ(effective_directionality(o), Directionality::Symmetric);
  EXPECT_NO_THROW(validate_dispersal(o));
}

//=============================================================================
// Kernel values
//=============================================================================

TEST(Dispersal, SymmetricExponential) {
  auto net = make_dammed_line();
  auto be = make_cpu_backend();
  auto b = functional_matrix(net, symmetric(DispersalKernel::Exponential, 0.5), *be);
  ASSERT_EQ(b.rows(), 3);
  EXPECT_NEAR(b(1, 0), 0.25, 1e-12);
  EXPECT_NEAR(b(2, 0), 0.0625, 1e-12);
  EXPECT_NEAR(b(2, 1), 0.25, 1e-12);
  expect_unit_diagonal(b);
  expect_symmetric(b);
}

TEST(Dispersal, ExponentialBaseOneIsFullyConnected) {
  auto net = make_reference_network();
  auto be = make_cpu_backend();
  auto b = functional_matrix(net, symmetric(DispersalKernel::Exponential, 1.0), *be);
  EXPECT_EQ(b.minCoeff(), 1.0);
}

TEST(Dispersal, AsymmetricExponential) {
  auto net = make_dammed_line();
  auto be = make_cpu_backend();
  auto b = functional_matrix(net, asymmetric(DispersalKernel::Exponential, 0.5, 0.9), *be);
  EXPECT_NEAR(b(1, 0), 0.81, 1e-12);    // 0 -> 1 downstream over 2
  EXPECT_NEAR(b(2, 0), 0.6561, 1e-12);  // 0 -> 2 downstream over 4
  EXPECT_NEAR(b(0, 2), 0.0625, 1e-12);  // 2 -> 0 upstream over 4
  expect_unit_diagonal(b);
}

TEST(Dispersal, SymmetricThreshold) {
  auto net = make_dammed_line();
  auto be = make_cpu_backend();
  auto b = functional_matrix(net, symmetric(DispersalKernel::Threshold, 2.0), *be);
  EXPECT_EQ(b(1, 0), 1.0);  // distance equal to the cutoff is inside
  EXPECT_EQ(b(2, 0), 0.0);
  EXPECT_EQ(b(0, 2), 0.0);
  expect_unit_diagonal(b);
}

TEST(Dispersal, AsymmetricThreshold) {
  auto net = make_dammed_line();
  auto be = make_cpu_backend();
  auto b = functional_matrix(net, asymmetric(DispersalKernel::Threshold, 0.0, 5.0), *be);
  EXPECT_EQ(b(2, 0), 1.0);  // downstream only
  EXPECT_EQ(b(0, 2), 0.0);  // needs upstream movement
  expect_unit_diagonal(b);
}

TEST(Dispersal, ThresholdValuesAreBinary) {
  auto net = make_reference_network();
  auto be = make_cpu_backend();
  for (const auto& o : {symmetric(DispersalKernel::Threshold, 10.0),
                        asymmetric(DispersalKernel::Threshold, 5.0, 10.0)}) {
    auto b = functional_matrix(net, o, *be);
    for (Eigen::Index i = 0; i < b.rows(); ++i) {
      for (Eigen::Index j = 0; j < b.cols(); ++j) {
        EXPECT_TRUE(b(i, j) == 0.0 || b(i, j) == 1.0);
      }
    }
  }
}

TEST(Dispersal, Leptokurtic) {
  auto net = make_dammed_line();
  auto be = make_cpu_backend();
  auto b = functional_matrix(net, leptokurtic({1.0, 10.0, 0.5}), *be);
  const double expected = 0.5 * std::erfc(2.0 / std::sqrt(2.0)) + 0.5 * std::erfc(2.0 / (10.0 * std::sqrt(2.0)));
  EXPECT_NEAR(b(1, 0), expected, 1e-12);
  expect_unit_diagonal(b);
  expect_symmetric(b);
}

TEST(Dispersal, ReferenceNetworkProperties) {
  auto net = make_reference_network();
  auto be = make_cpu_backend();

  auto sym = functional_matrix(net, symmetric(DispersalKernel::Exponential, 0.9), *be);
  expect_symmetric(sym);
  expect_probabilities(sym);
  expect_unit_diagonal(sym);

  auto lep = functional_matrix(net, leptokurtic({2.0, 20.0, 0.7}), *be);
  expect_symmetric(lep);
  expect_probabilities(lep);
  expect_unit_diagonal(lep);

  auto asym = functional_matrix(net, asymmetric(DispersalKernel::Exponential, 0.8, 0.95), *be);
  expect_probabilities(asym);
  expect_unit_diagonal(asym);
  // Moving "1" -> "16" is all downstream, the reverse all upstream.
  EXPECT_NEAR(asym(reach_of("16"), reach_of("1")), std::pow(0.95, 24.0), 1e-12);
  EXPECT_NEAR(asym(reach_of("1"), reach_of("16")), std::pow(0.8, 24.0), 1e-12);
}

TEST(Dispersal, DecreasesWithDistance) {
  auto net = make_confluence_line({1.0, 1.0, 1.0, 1.0, 1.0});
  auto be = make_cpu_backend();
  auto b = functional_matrix(net, symmetric(DispersalKernel::Exponential, 0.7), *be);
  for (Eigen::Index i = 1; i < b.rows(); ++i) {
    EXPECT_LT(b(i, 0), b(i - 1, 0));
  }
}

TEST(Dispersal, UnreachablePairsGetZero) {
  std::vector<ReachId> from = {0};
  std::vector<ReachId> to = {1};
  std::vector<LinkType> type = {LinkType::Confluence};
  auto net = RiverNetwork::from_arrays(3, from, to, type);
  net.set_reach_attribute("length", {1.0, 1.0, 1.0});
  auto be = make_cpu_backend();

  auto exp = functional_matrix(net, symmetric(DispersalKernel::Exponential, 1.0), *be);
  EXPECT_EQ(exp(2, 0), 0.0);
  EXPECT_EQ(exp(1, 0), 1.0);
  auto thr = functional_matrix(net, asymmetric(DispersalKernel::Threshold, 100.0, 100.0), *be);
  EXPECT_EQ(thr(0, 2), 0.0);
  auto lep = functional_matrix(net, leptokurtic({2.0, 20.0, 0.7}), *be);
  EXPECT_EQ(lep(2, 1), 0.0);
}

TEST(Dispersal, DistancesFollowDirectionality) {
  auto net = make_dammed_line();
  auto be = make_cpu_backend();
  auto sym = dispersal_distances(net, symmetric(DispersalKernel::Threshold, 1.0), *be);
  EXPECT_EQ(sym.directionality, Directionality::Symmetric);
  EXPECT_DOUBLE_EQ(sym.total(2, 0), 4.0);
  EXPECT_EQ(sym.upstream.size(), 0);

  auto asym = dispersal_distances(net, asymmetric(DispersalKernel::Threshold, 1.0, 1.0), *be);
  EXPECT_EQ(asym.directionality, Directionality::Asymmetric);
  EXPECT_EQ(asym.total.size(), 0);
  EXPECT_DOUBLE_EQ(asym.downstream(2, 0), 4.0);
  EXPECT_DOUBLE_EQ(asym.upstream(2, 0), 0.0);
  EXPECT_DOUBLE_EQ(asym.upstream(0, 2), 4.0);
}

TEST(Dispersal, MissingDistanceField) {
  auto net = make_dammed_line();
  auto be = make_cpu_backend();
  auto o = symmetric(DispersalKernel::Exponential, 0.5);
  o.distance_field = "distance";
  EXPECT_THROW((void)functional_matrix(net, o, *be), InvalidAttribute);
}
