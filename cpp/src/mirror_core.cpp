/**
 * @file mirror_core.cpp
 * @brief Reflection model, geometry helpers and configuration validation
 */

#include "mirror_core.hpp"
#include <sstream>
#include <stdexcept>

namespace mirror {

// ============================================================================
// Reflection model
// ============================================================================

Complex reflection_coefficient(Real grazing_angle, Real c1, Real rho1, Real c2, Real rho2) {
    Real k1 = 1.0 / c1;
    Real k2 = 1.0 / c2;
    Real kr1 = std::cos(grazing_angle) * k1;
    Real kz1 = std::sin(grazing_angle) * k1;

    // Horizontal wavenumber is continuous across the interface. The principal
    // root turns kz2 imaginary past the critical angle.
    Real kr2 = kr1;
    Complex kz2 = std::sqrt(Complex(k2 * k2 - kr2 * kr2, 0.0));

    Complex t1(rho2 * kz1, 0.0);
    Complex t2 = rho1 * kz2;
    return (t1 - t2) / (t1 + t2);
}

MatrixXcd reflection_coefficient(const MatrixXd& grazing_angle, Real c1, Real rho1, Real c2, Real rho2) {
    return grazing_angle.unaryExpr([=](Real angle) {
        return reflection_coefficient(angle, c1, rho1, c2, rho2);
    });
}

MatrixXcd reflection_coefficient_surface(const Environment& env, const MatrixXd& grazing_angle) {
    return reflection_coefficient(grazing_angle, env.water_c, env.water_rho, env.air_c, env.air_rho);
}

MatrixXcd reflection_coefficient_seabed(const Environment& env, const MatrixXd& grazing_angle) {
    return reflection_coefficient(grazing_angle, env.water_c, env.water_rho, env.seabed_c, env.seabed_rho);
}

Real critical_angle(Real c1, Real c2) {
    Real ratio = c1 / c2;
    if (ratio >= 1.0) {
        return 0.0;
    }
    return std::acos(ratio);
}

// ============================================================================
// Geometry
// ============================================================================

ReceiverVectors vector_to_receivers(const PointsXYZ& receivers, const PointsXYZ& points) {
    const int R = static_cast<int>(receivers.rows());
    const int P = static_cast<int>(points.rows());

    ReceiverVectors vec;
    vec.x.resize(R, P);
    vec.y.resize(R, P);
    vec.z.resize(R, P);

    for (int p = 0; p < P; ++p) {
        for (int r = 0; r < R; ++r) {
            vec.x(r, p) = receivers(r, 0) - points(p, 0);
            vec.y(r, p) = receivers(r, 1) - points(p, 1);
            vec.z(r, p) = receivers(r, 2) - points(p, 2);
        }
    }
    return vec;
}

MatrixXd vector_norm(const ReceiverVectors& vec) {
    return (vec.x.array().square() + vec.y.array().square() + vec.z.array().square()).sqrt().matrix();
}

MatrixXd distance_to_receivers(const PointsXYZ& receivers, const PointsXYZ& points) {
    return vector_norm(vector_to_receivers(receivers, points));
}

MatrixXd grazing_angle(const ReceiverVectors& vec) {
    MatrixXd ang(vec.z.rows(), vec.z.cols());
    for (Eigen::Index j = 0; j < ang.cols(); ++j) {
        for (Eigen::Index i = 0; i < ang.rows(); ++i) {
            Real horizontal = std::sqrt(vec.x(i, j) * vec.x(i, j) + vec.y(i, j) * vec.y(i, j));
            ang(i, j) = std::abs(std::atan2(vec.z(i, j), horizontal));
        }
    }
    return ang;
}

PointsXYZ mirror_points(const PointsXYZ& points, Real boundary_z) {
    PointsXYZ img = points;
    img.col(2) = (boundary_z - (points.col(2).array() - boundary_z)).matrix();
    return img;
}

Real boundary_depth(const Environment& env, Boundary boundary) {
    return boundary == Boundary::Surface ? env.water_z : env.seabed_z;
}

// ============================================================================
// Breadcrumbs
// ============================================================================

int bounce_count(const Breadcrumb& crumb, Boundary boundary) {
    int n = 0;
    for (Boundary b : crumb) {
        if (b == boundary) ++n;
    }
    return n;
}

std::string to_string(const Breadcrumb& crumb) {
    std::string text;
    text.reserve(crumb.size());
    for (Boundary b : crumb) {
        text.push_back(b == Boundary::Surface ? BREADCRUMB_SURFACE : BREADCRUMB_BOTTOM);
    }
    return text;
}

Breadcrumb breadcrumb_from_string(const std::string& text) {
    Breadcrumb crumb;
    crumb.reserve(text.size());
    for (char ch : text) {
        if (ch == BREADCRUMB_SURFACE) {
            crumb.push_back(Boundary::Surface);
        } else if (ch == BREADCRUMB_BOTTOM) {
            crumb.push_back(Boundary::Bottom);
        } else {
            throw std::invalid_argument("invalid breadcrumb character '" + std::string(1, ch) +
                                        "' in \"" + text + "\"");
        }
    }
    return crumb;
}

// ============================================================================
// Configuration validation
// ============================================================================

namespace {

bool is_nonneg(Real x) {
    return std::isfinite(x) && 0.0 <= x;
}

} // anonymous namespace

std::vector<ValidationIssue> validate_configuration(
    const Environment& env,
    const Geometry& geometry,
    const StoppingConditions& stop
) {
    std::vector<ValidationIssue> issues;

    const bool attenuationBounded = std::isfinite(stop.attenuation_thresh_dB);
    const bool bounceBounded = is_nonneg(stop.bounce_count_thresh);
    const bool lagBounded = is_nonneg(stop.time_lag_thresh);

    if (!attenuationBounded && !bounceBounded && !lagBounded) {
        issues.push_back({"invalid stopping conditions: set a finite attenuation threshold, "
                          "or a finite non-negative bounce count or time lag threshold", true});
    } else if (!bounceBounded && !lagBounded) {
        std::ostringstream msg;
        msg << "recursion is bounded only by attenuation_thresh_dB = " << stop.attenuation_thresh_dB
            << "; image count grows with the 10^(dB/20) distance ratio";
        issues.push_back({msg.str(), false});
    }

    if (!std::isfinite(env.seabed_z)) {
        issues.push_back({"seabed_z must be finite", true});
    }
    if (!(env.water_c > 0.0)) {
        issues.push_back({"water_c must be positive", true});
    }
    if (geometry.nSources() == 0) {
        issues.push_back({"at least one source is required", true});
    }
    if (geometry.nReceivers() == 0) {
        issues.push_back({"at least one receiver is required", true});
    }

    return issues;
}

void throw_if_invalid(
    const Environment& env,
    const Geometry& geometry,
    const StoppingConditions& stop
) {
    const auto issues = validate_configuration(env, geometry, stop);

    bool anyFatal = false;
    std::ostringstream out;
    out << "Invalid mirror configuration:";
    for (const auto& issue : issues) {
        if (issue.fatal) {
            out << "\n - " << issue.message;
            anyFatal = true;
        }
    }
    if (anyFatal) {
        throw std::invalid_argument(out.str());
    }
}

} // namespace mirror
