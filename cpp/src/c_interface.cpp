/**
 * @file c_interface.cpp
 * @brief Flat-array C interface used by the MEX gateway and other bindings
 */

#include "mirror_core.hpp"
#include <exception>
#include <string>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace mirror {

namespace {

thread_local std::string lastError;

Environment make_environment(const double* depth, const double* sound_speed, const double* density) {
    Environment env;
    env.water_z = depth[0];
    env.seabed_z = depth[1];
    env.air_c = sound_speed[0];
    env.water_c = sound_speed[1];
    env.seabed_c = sound_speed[2];
    env.air_rho = density[0];
    env.water_rho = density[1];
    env.seabed_rho = density[2];
    return env;
}

StoppingConditions make_stopping_conditions(const double* stop) {
    StoppingConditions sc;
    sc.attenuation_thresh_dB = stop[0];
    sc.bounce_count_thresh = stop[1];
    sc.time_lag_thresh = stop[2];
    return sc;
}

// Column-major n x 3 (MATLAB layout)
PointsXYZ make_points(const double* xyz, int n) {
    PointsXYZ pts(n, 3);
    for (int i = 0; i < n; ++i) {
        for (int c = 0; c < 3; ++c) {
            pts(i, c) = xyz[i + c * n];
        }
    }
    return pts;
}

Geometry make_geometry(const double* sources, int nSources, const double* receivers, int nReceivers) {
    Geometry geometry;
    geometry.sources = make_points(sources, nSources);
    geometry.receivers = make_points(receivers, nReceivers);
    return geometry;
}

void retain_breadcrumbs(ImageCollection& images, const char* const* breadcrumbs, int nBreadcrumbs) {
    if (nBreadcrumbs <= 0) {
        return;
    }
    std::vector<Breadcrumb> crumbs;
    crumbs.reserve(nBreadcrumbs);
    for (int i = 0; i < nBreadcrumbs; ++i) {
        crumbs.push_back(breadcrumb_from_string(breadcrumbs[i] ? breadcrumbs[i] : ""));
    }
    images.retain(images.breadcrumbs_to_indices(crumbs));
}

} // anonymous namespace

extern "C" {

int mirror_count_images(
    const double* depth,
    const double* sound_speed,
    const double* density,
    const double* stop,
    const double* sources,
    int nSources,
    const double* receivers,
    int nReceivers
) {
    try {
        lastError.clear();
        Environment env = make_environment(depth, sound_speed, density);
        Geometry geometry = make_geometry(sources, nSources, receivers, nReceivers);
        return generate_images(env, geometry, make_stopping_conditions(stop)).count();
    } catch (const std::exception& e) {
        lastError = e.what();
        return -1;
    }
}

int mirror_transfer_function(
    const double* depth,
    const double* sound_speed,
    const double* density,
    const double* stop,
    const double* sources,
    int nSources,
    const double* receivers,
    int nReceivers,
    const char* const* breadcrumbs,
    int nBreadcrumbs,
    const double* freq,
    int nFreq,
    double* G_real,
    double* G_imag
) {
    try {
        lastError.clear();
        Environment env = make_environment(depth, sound_speed, density);
        Geometry geometry = make_geometry(sources, nSources, receivers, nReceivers);
        ImageCollection images = generate_images(env, geometry, make_stopping_conditions(stop));
        retain_breadcrumbs(images, breadcrumbs, nBreadcrumbs);

        std::vector<Real> freqVec(freq, freq + nFreq);
        TransferFunction T = transfer_function(images, env, freqVec);

        // Column-major [freq][receiver][source]
        for (int s = 0; s < nSources; ++s) {
            for (int r = 0; r < nReceivers; ++r) {
                for (int f = 0; f < nFreq; ++f) {
                    int idx = f + nFreq * (r + nReceivers * s);
                    G_real[idx] = T.G[s](f, r).real();
                    G_imag[idx] = T.G[s](f, r).imag();
                }
            }
        }
        return images.count();
    } catch (const std::exception& e) {
        lastError = e.what();
        return -1;
    }
}

int mirror_clairvoyant_csdm(
    const double* depth,
    const double* sound_speed,
    const double* density,
    const double* stop,
    const double* sources,
    int nSources,
    const double* receivers,
    int nReceivers,
    const char* const* breadcrumbs,
    int nBreadcrumbs,
    const double* freq,
    int nFreq,
    double* K_real,
    double* K_imag
) {
    try {
        lastError.clear();
        Environment env = make_environment(depth, sound_speed, density);
        Geometry geometry = make_geometry(sources, nSources, receivers, nReceivers);
        ImageCollection images = generate_images(env, geometry, make_stopping_conditions(stop));
        retain_breadcrumbs(images, breadcrumbs, nBreadcrumbs);

        std::vector<Real> freqVec(freq, freq + nFreq);
        CrossSpectralDensity K = clairvoyant_csdm(images, env, freqVec);

        // Column-major [receiver][receiver][freq][source]
        const int R = nReceivers;
        for (int s = 0; s < nSources; ++s) {
            for (int f = 0; f < nFreq; ++f) {
                const MatrixXcd& Kfs = K.at(f, s);
                for (int r2 = 0; r2 < R; ++r2) {
                    for (int r1 = 0; r1 < R; ++r1) {
                        int idx = r1 + R * (r2 + R * (f + nFreq * s));
                        K_real[idx] = Kfs(r1, r2).real();
                        K_imag[idx] = Kfs(r1, r2).imag();
                    }
                }
            }
        }
        return images.count();
    } catch (const std::exception& e) {
        lastError = e.what();
        return -1;
    }
}

const char* mirror_last_error() {
    return lastError.c_str();
}

int mirror_get_num_threads() {
#ifdef _OPENMP
    return omp_get_max_threads();
#else
    return 1;
#endif
}

void mirror_set_num_threads(int n) {
#ifdef _OPENMP
    omp_set_num_threads(n);
#endif
}

} // extern "C"

} // namespace mirror
