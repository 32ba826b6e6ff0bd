/**
 * @file test_view_blender.cpp
 * @brief Unit tests for Black-Litterman view blending
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "views/view_blender.hpp"
#include <Eigen/Dense>

using namespace allocation;
using namespace allocation::views;
using Catch::Matchers::WithinAbs;

class BlenderTestFixture
{
protected:
    std::vector<std::string> ids_ = {"a", "b", "c"};
    Eigen::VectorXd prior_;
    Eigen::MatrixXd cov_;

    BlenderTestFixture()
    {
        prior_ = Eigen::VectorXd(3);
        prior_ << 0.10, 0.20, 0.30;

        // Independent candidates, equal variance
        cov_ = Eigen::MatrixXd::Identity(3, 3) * 0.04;
    }

    static View absolute_view(const std::string &id, double value, double confidence)
    {
        View v;
        v.targets = {id};
        v.value = value;
        v.confidence = confidence;
        return v;
    }
};

TEST_CASE_METHOD(BlenderTestFixture, "Blending without views returns the prior", "[Views]")
{
    ViewBlender blender;
    auto result = blender.blend(ids_, prior_, cov_, {});

    REQUIRE(result.effective_views == 0);
    REQUIRE(result.posterior_returns.isApprox(prior_));
    REQUIRE(result.posterior_covariance.isApprox(cov_));
    REQUIRE(result.warnings.empty());
}

TEST_CASE_METHOD(BlenderTestFixture, "Zero-confidence views carry no information", "[Views]")
{
    ViewBlender blender;
    auto result = blender.blend(ids_, prior_, cov_, {absolute_view("a", 5.0, 0.0)});

    REQUIRE(result.effective_views == 0);
    REQUIRE(result.posterior_returns.isApprox(prior_));
}

TEST_CASE_METHOD(BlenderTestFixture, "Half-confidence view averages with the prior", "[Views]")
{
    // Omega = tau * sigma^2 when confidence is 0.5, so the posterior of the
    // target is the midpoint of prior and view.
    ViewBlender blender;
    auto result = blender.blend(ids_, prior_, cov_, {absolute_view("a", 0.30, 0.5)});

    REQUIRE(result.effective_views == 1);
    REQUIRE_THAT(result.posterior_returns(0), WithinAbs(0.20, 1e-10));
    // Independent candidates are unaffected
    REQUIRE_THAT(result.posterior_returns(1), WithinAbs(0.20, 1e-10));
    REQUIRE_THAT(result.posterior_returns(2), WithinAbs(0.30, 1e-10));
    // Posterior covariance grows by the posterior uncertainty
    REQUIRE(result.posterior_covariance(0, 0) > cov_(0, 0));
}

TEST_CASE_METHOD(BlenderTestFixture, "Full-confidence view pins the posterior", "[Views]")
{
    BlenderConfig config;
    config.tau = 0.01;
    ViewBlender blender(config);

    auto result = blender.blend(ids_, prior_, cov_, {absolute_view("b", 0.9, 1.0)});

    REQUIRE_THAT(result.posterior_returns(1), WithinAbs(0.9, 1e-6));
    REQUIRE(has_warning(result.warnings, WarningCode::SINGULAR_BLEND));
    REQUIRE(result.posterior_returns.allFinite());
}

TEST_CASE_METHOD(BlenderTestFixture, "Relative view moves the spread toward its value", "[Views]")
{
    View v;
    v.targets = {"a"};
    v.against = {"c"};
    v.type = ViewType::RELATIVE;
    v.value = 0.10;
    v.confidence = 0.9;

    ViewBlender blender;
    auto result = blender.blend(ids_, prior_, cov_, {v});

    const double prior_spread = prior_(0) - prior_(2);
    const double posterior_spread = result.posterior_returns(0) - result.posterior_returns(2);

    REQUIRE(posterior_spread > prior_spread);
    REQUIRE(posterior_spread < 0.10);
    REQUIRE_THAT(result.posterior_returns(1), WithinAbs(0.20, 1e-10));
}

TEST_CASE_METHOD(BlenderTestFixture, "Singular covariance is regularized", "[Views]")
{
    Eigen::MatrixXd singular = Eigen::MatrixXd::Constant(3, 3, 0.04);

    ViewBlender blender;
    auto result = blender.blend(ids_, prior_, singular, {absolute_view("a", 0.5, 0.7)});

    REQUIRE(has_warning(result.warnings, WarningCode::SINGULAR_BLEND));
    REQUIRE(result.posterior_returns.allFinite());
    REQUIRE(result.posterior_returns(0) > prior_(0));
}

TEST_CASE("Zero-risk candidates blend without failing", "[Views]")
{
    Eigen::VectorXd prior(2);
    prior << 0.1, 0.2;
    Eigen::MatrixXd zero = Eigen::MatrixXd::Zero(2, 2);

    View v;
    v.targets = {"a"};
    v.value = 0.5;
    v.confidence = 0.5;

    ViewBlender blender;
    BlendResult result;
    REQUIRE_NOTHROW(result = blender.blend({"a", "b"}, prior, zero, {v}));

    REQUIRE(result.effective_views == 1);
    REQUIRE(has_warning(result.warnings, WarningCode::SINGULAR_BLEND));
    REQUIRE(result.posterior_returns.allFinite());
    REQUIRE(result.posterior_covariance.allFinite());
    REQUIRE(result.posterior_returns(0) >= 0.1);
    REQUIRE(result.posterior_returns(0) <= 0.5);
    REQUIRE_THAT(result.posterior_returns(1), WithinAbs(0.2, 1e-10));
}

TEST_CASE_METHOD(BlenderTestFixture, "Invalid views are rejected", "[Views]")
{
    ViewBlender blender;

    SECTION("Unknown candidate") {
        REQUIRE_THROWS_AS(blender.blend(ids_, prior_, cov_, {absolute_view("zz", 0.1, 0.5)}),
                          std::invalid_argument);
    }

    SECTION("Confidence outside [0, 1]") {
        REQUIRE_THROWS_AS(blender.blend(ids_, prior_, cov_, {absolute_view("a", 0.1, 1.5)}),
                          std::invalid_argument);
    }

    SECTION("Dimension mismatch") {
        REQUIRE_THROWS_AS(blender.blend({"a", "b"}, prior_, cov_, {}), std::invalid_argument);
    }
}

TEST_CASE("Implied prior returns", "[Views]")
{
    Eigen::MatrixXd cov(2, 2);
    cov << 0.04, 0.01,
           0.01, 0.09;
    Eigen::VectorXd w = Eigen::VectorXd::Constant(2, 0.5);

    auto pi = ViewBlender::implied_prior_returns(w, cov, 2.0);

    REQUIRE_THAT(pi(0), WithinAbs(0.05, 1e-12));
    REQUIRE_THAT(pi(1), WithinAbs(0.10, 1e-12));
}
