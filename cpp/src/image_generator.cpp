/**
 * @file image_generator.cpp
 * @brief Recursive image search with attenuation, bounce count and time lag cut-offs
 */

#include "mirror_core.hpp"
#include <iostream>
#include <stdexcept>

namespace mirror {

namespace {

Complex int_pow(Complex z, int n) {
    Complex result(1.0, 0.0);
    for (int i = 0; i < n; ++i) {
        result *= z;
    }
    return result;
}

MatrixXcd cwise_pow(const MatrixXcd& m, int n) {
    return m.unaryExpr([n](const Complex& z) { return int_pow(z, n); });
}

/**
 * @brief Follow one branch of the image tree
 *
 * The boundary flips on every step. Reflection coefficients use the grazing
 * angle of the current image raised to the accumulated bounce counts; for a
 * single-layer isovelocity medium every reflection off the same boundary
 * sees the same angle.
 */
void generate_branch(
    const Environment& env,
    const Geometry& geometry,
    const StoppingConditions& stop,
    const MatrixXd& spreadingLossDirect,
    Boundary boundary,
    ImageCollection& images
) {
    PointsXYZ lastXYZ = geometry.sources;
    Breadcrumb lastCrumb;
    int nSurface = 0;
    int nBottom = 0;

    while (true) {
        if (static_cast<Real>(nSurface + nBottom) >= stop.bounce_count_thresh) {
            break;
        }

        Breadcrumb crumb = lastCrumb;
        crumb.push_back(boundary);

        const Real boundaryZ = boundary_depth(env, boundary);
        if (boundary == Boundary::Surface) {
            ++nSurface;
        } else {
            ++nBottom;
        }
        boundary = opposite(boundary);

        PointsXYZ xyz = mirror_points(lastXYZ, boundaryZ);

        // A receiver sitting on the plane cannot have it as its last
        // reflection; keep recursing through the image without recording it.
        if ((geometry.receivers.col(2).array() == boundaryZ).all()) {
            lastXYZ = xyz;
            lastCrumb = crumb;
            continue;
        }

        ReceiverVectors vec = vector_to_receivers(geometry.receivers, xyz);
        MatrixXd dist = vector_norm(vec);

        if (std::isfinite(stop.time_lag_thresh)) {
            if (((dist.array() / env.water_c) > stop.time_lag_thresh).all()) {
                break;
            }
        }

        MatrixXd grazing = grazing_angle(vec);

        MatrixXcd rcoeff = MatrixXcd::Ones(dist.rows(), dist.cols());
        if (nSurface > 0) {
            rcoeff = rcoeff.cwiseProduct(cwise_pow(reflection_coefficient_surface(env, grazing), nSurface));
        }
        if (nBottom > 0) {
            rcoeff = rcoeff.cwiseProduct(cwise_pow(reflection_coefficient_seabed(env, grazing), nBottom));
        }

        if (std::isfinite(stop.attenuation_thresh_dB)) {
            Eigen::ArrayXXd spreadingLoss = 20.0 * dist.array().log10();
            Eigen::ArrayXXd reflectionLoss = -20.0 * rcoeff.array().abs().log10();
            Eigen::ArrayXXd lossRel = spreadingLoss - spreadingLossDirect.array() + reflectionLoss;
            if ((lossRel > stop.attenuation_thresh_dB).all()) {
                break;
            }
        }

        Image img;
        img.xyz = xyz;
        img.dist = std::move(dist);
        img.vec = std::move(vec);
        img.grazing = std::move(grazing);
        img.rcoeff = std::move(rcoeff);
        img.breadcrumb = crumb;
        images.append(std::move(img));

        lastXYZ = std::move(xyz);
        lastCrumb = std::move(crumb);
    }
}

} // anonymous namespace

ImageCollection generate_images(
    const Environment& env,
    const Geometry& geometry,
    const StoppingConditions& stop
) {
    const auto issues = validate_configuration(env, geometry, stop);
    for (const auto& issue : issues) {
        if (!issue.fatal) {
            std::cerr << "[mirror] warning: " << issue.message << std::endl;
        }
    }
    throw_if_invalid(env, geometry, stop);

    const int R = geometry.nReceivers();
    const int S = geometry.nSources();
    ImageCollection images(R, S);

    // Direct path
    Image direct;
    direct.xyz = geometry.sources;
    direct.vec = vector_to_receivers(geometry.receivers, geometry.sources);
    direct.dist = vector_norm(direct.vec);
    direct.grazing = MatrixXd::Constant(R, S, std::numeric_limits<Real>::quiet_NaN());
    direct.rcoeff = MatrixXcd::Ones(R, S);

    const MatrixXd spreadingLossDirect = (20.0 * direct.dist.array().log10()).matrix();
    images.append(std::move(direct));

    const bool reflectSurface = (geometry.sources.col(2).array() != env.water_z).any();
    if (reflectSurface) {
        generate_branch(env, geometry, stop, spreadingLossDirect, Boundary::Surface, images);
    }

    const bool reflectSeabed = (geometry.sources.col(2).array() != env.seabed_z).any();
    if (reflectSeabed) {
        generate_branch(env, geometry, stop, spreadingLossDirect, Boundary::Bottom, images);
    }

    return images;
}

} // namespace mirror
