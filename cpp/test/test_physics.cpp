/**
 * @file test_physics.cpp
 * @brief Unit tests for the reflection model, geometry helpers and validation
 */

#include "mirror_core.hpp"
#include "test_macros.hpp"
#include <iomanip>
#include <stdexcept>

using namespace mirror;

/**
 * @brief Seabed reflection below and above the critical grazing angle
 *
 * Below the critical grazing angle the wave is totally reflected (|R| = 1);
 * steeper arrivals lose energy into the seabed (|R| < 1).
 */
bool test_reflection_critical_angle() {
    std::cout << "Testing reflection coefficient around critical angle... ";

    Real c1 = 1500.0, rho1 = 1.0;
    Real c2 = 1550.0, rho2 = 1.8;
    Real thetaC = critical_angle(c1, c2);

    TEST_ASSERT_NEAR(thetaC, std::acos(c1 / c2), 1e-15, "Critical angle should be acos(c1/c2)");

    for (int i = 0; i <= 20; ++i) {
        Real theta = thetaC * i / 20.0;
        Complex R = reflection_coefficient(theta, c1, rho1, c2, rho2);
        TEST_ASSERT(std::isfinite(R.real()) && std::isfinite(R.imag()), "R should be finite");
        TEST_ASSERT_NEAR(std::abs(R), 1.0, 1e-6, "Total reflection below the critical grazing angle");
    }

    for (int i = 1; i <= 20; ++i) {
        Real theta = thetaC + (PI / 2 - thetaC) * i / 20.0;
        Complex R = reflection_coefficient(theta, c1, rho1, c2, rho2);
        TEST_ASSERT(std::abs(R) < 1.0, "Partial reflection above the critical grazing angle");
    }

    std::cout << "PASSED" << std::endl;
    return true;
}

/**
 * @brief Normal incidence reduces to the impedance contrast
 */
bool test_reflection_normal_incidence() {
    std::cout << "Testing reflection coefficient at normal incidence... ";

    Environment env;
    Real Z1 = env.water_rho * env.water_c;
    Real Z2 = env.seabed_rho * env.seabed_c;

    MatrixXd angle = MatrixXd::Constant(1, 1, PI / 2);
    Complex R = reflection_coefficient_seabed(env, angle)(0, 0);

    TEST_ASSERT_NEAR(R.real(), (Z2 - Z1) / (Z2 + Z1), 1e-12, "R should equal (Z2 - Z1) / (Z2 + Z1)");
    TEST_ASSERT_NEAR(R.imag(), 0.0, 1e-12, "R should be real at normal incidence");

    std::cout << "PASSED" << std::endl;
    std::cout << "  R at 90 deg: " << std::setprecision(6) << R << std::endl;
    return true;
}

/**
 * @brief The water/air interface is a near pressure-release boundary
 */
bool test_reflection_surface() {
    std::cout << "Testing surface reflection coefficient... ";

    Environment env;
    MatrixXd angles(1, 4);
    angles << 0.1, 0.5, 1.0, PI / 2;

    MatrixXcd R = reflection_coefficient_surface(env, angles);
    TEST_ASSERT(R.rows() == 1 && R.cols() == 4, "Output shape should match input angles");

    for (int i = 0; i < 4; ++i) {
        TEST_ASSERT_NEAR(R(0, i).real(), -1.0, 1e-3, "Surface R should be close to -1");
        TEST_ASSERT(std::abs(R(0, i)) <= 1.0, "Surface |R| should not exceed 1");
    }

    // Air is slower than water: no critical angle
    TEST_ASSERT(critical_angle(env.water_c, env.air_c) == 0.0, "No critical angle for a slower medium");

    std::cout << "PASSED" << std::endl;
    return true;
}

/**
 * @brief Mirror, vector, distance and grazing angle helpers
 */
bool test_geometry() {
    std::cout << "Testing geometry helpers... ";

    PointsXYZ pts(2, 3);
    pts << 1.0, 2.0, -3.0,
           -4.0, 5.0, -15.0;

    PointsXYZ img = mirror_points(pts, -12.0);
    TEST_ASSERT_NEAR(img(0, 2), -21.0, 1e-12, "z = -3 mirrored across -12 should be -21");
    TEST_ASSERT_NEAR(img(1, 2), -9.0, 1e-12, "z = -15 mirrored across -12 should be -9");
    TEST_ASSERT(img(0, 0) == 1.0 && img(0, 1) == 2.0, "x and y should be unchanged");
    TEST_ASSERT(img(1, 0) == -4.0 && img(1, 1) == 5.0, "x and y should be unchanged");

    PointsXYZ back = mirror_points(img, -12.0);
    TEST_ASSERT((back - pts).norm() < 1e-12, "Mirroring twice should restore the points");

    PointsXYZ rcv(2, 3);
    rcv << 3.0, 4.0, 0.0,
           0.0, 0.0, 0.0;
    PointsXYZ src(1, 3);
    src << 0.0, 0.0, 0.0;

    ReceiverVectors vec = vector_to_receivers(rcv, src);
    TEST_ASSERT(vec.x.rows() == 2 && vec.x.cols() == 1, "Vectors should be R x P");
    TEST_ASSERT(vec.x(0, 0) == 3.0 && vec.y(0, 0) == 4.0 && vec.z(0, 0) == 0.0,
        "Vector should point from the point to the receiver");

    MatrixXd dist = distance_to_receivers(rcv, src);
    TEST_ASSERT_NEAR(dist(0, 0), 5.0, 1e-12, "3-4-5 distance");
    TEST_ASSERT_NEAR(dist(1, 0), 0.0, 1e-12, "Coincident point distance");

    PointsXYZ above(1, 3);
    above << 3.0, 4.0, 12.0;
    PointsXYZ origin(1, 3);
    origin << 0.0, 0.0, 0.0;
    MatrixXd grz = grazing_angle(vector_to_receivers(origin, above));
    TEST_ASSERT_NEAR(grz(0, 0), std::atan2(12.0, 5.0), 1e-12, "Grazing angle should be positive atan(12/5)");

    std::cout << "PASSED" << std::endl;
    return true;
}

/**
 * @brief Breadcrumb parsing, printing and bounce counting
 */
bool test_breadcrumbs() {
    std::cout << "Testing breadcrumbs... ";

    Breadcrumb crumb = breadcrumb_from_string("bsbsb");
    TEST_ASSERT(crumb.size() == 5, "Length should match the text");
    TEST_ASSERT(crumb[0] == Boundary::Bottom && crumb[1] == Boundary::Surface, "Codes should map to boundaries");
    TEST_ASSERT(bounce_count(crumb, Boundary::Bottom) == 3, "Three bottom bounces");
    TEST_ASSERT(bounce_count(crumb, Boundary::Surface) == 2, "Two surface bounces");
    TEST_ASSERT(to_string(crumb) == "bsbsb", "Text form should match");
    TEST_ASSERT(breadcrumb_from_string("").empty(), "Empty text is the direct path");
    TEST_ASSERT(opposite(Boundary::Surface) == Boundary::Bottom, "Surface flips to bottom");
    TEST_ASSERT(opposite(Boundary::Bottom) == Boundary::Surface, "Bottom flips to surface");

    TEST_ASSERT_THROWS(breadcrumb_from_string("bx"), std::invalid_argument, "Unknown code should be rejected");

    std::cout << "PASSED" << std::endl;
    return true;
}

/**
 * @brief Stopping-condition precondition and environment checks
 */
bool test_validation() {
    std::cout << "Testing configuration validation... ";

    Environment env;
    env.seabed_z = -20.0;

    Geometry geometry;
    geometry.sources.resize(1, 3);
    geometry.sources << 0.0, 0.0, -5.0;
    geometry.receivers.resize(1, 3);
    geometry.receivers << 50.0, 0.0, -10.0;

    StoppingConditions unbounded;
    unbounded.attenuation_thresh_dB = INF;
    auto issues = validate_configuration(env, geometry, unbounded);
    TEST_ASSERT(issues.size() == 1 && issues[0].fatal, "All thresholds unbounded should be fatal");
    TEST_ASSERT_THROWS(generate_images(env, geometry, unbounded), std::invalid_argument,
        "Generation should refuse an unbounded recursion");

    StoppingConditions negative = unbounded;
    negative.bounce_count_thresh = -1.0;
    negative.time_lag_thresh = -0.5;
    TEST_ASSERT_THROWS(throw_if_invalid(env, geometry, negative), std::invalid_argument,
        "Negative thresholds do not bound the recursion");

    StoppingConditions defaults;
    issues = validate_configuration(env, geometry, defaults);
    TEST_ASSERT(issues.size() == 1 && !issues[0].fatal,
        "Attenuation-only bound should be a warning");

    StoppingConditions bounce;
    bounce.bounce_count_thresh = 3;
    TEST_ASSERT(validate_configuration(env, geometry, bounce).empty(), "Bounce bound is clean");

    StoppingConditions lag;
    lag.attenuation_thresh_dB = INF;
    lag.time_lag_thresh = 0.1;
    TEST_ASSERT(validate_configuration(env, geometry, lag).empty(), "Time lag bound is clean");

    Environment noSeabed;
    TEST_ASSERT_THROWS(throw_if_invalid(noSeabed, geometry, bounce), std::invalid_argument,
        "Unset seabed depth should be fatal");

    Geometry noReceivers = geometry;
    noReceivers.receivers.resize(0, 3);
    TEST_ASSERT_THROWS(throw_if_invalid(env, noReceivers, bounce), std::invalid_argument,
        "Missing receivers should be fatal");

    std::cout << "PASSED" << std::endl;
    return true;
}

/**
 * @brief Main test runner
 */
int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "mirror physics and geometry tests" << std::endl;
    std::cout << "========================================" << std::endl;

    TestRunner runner;
    runner.run(test_reflection_critical_angle);
    runner.run(test_reflection_normal_incidence);
    runner.run(test_reflection_surface);
    runner.run(test_geometry);
    runner.run(test_breadcrumbs);
    runner.run(test_validation);
    return runner.report();
}
