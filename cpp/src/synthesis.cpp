/**
 * @file synthesis.cpp
 * @brief Transfer function and cross-spectral density matrices from images
 */

#include "mirror_core.hpp"
#include <stdexcept>

namespace mirror {

namespace {

void check_indices(const ImageCollection& images, const std::vector<int>& image_indices) {
    for (int n : image_indices) {
        if (n < 0 || n >= images.count()) {
            throw std::out_of_range("image index " + std::to_string(n) +
                                    " out of range [0, " + std::to_string(images.count()) + ")");
        }
    }
}

/**
 * @brief Weighted superposition of spherical waves from the selected images
 *
 * weights[k] scales the contribution of image_indices[k].
 */
TransferFunction accumulate(
    const ImageCollection& images,
    const Environment& env,
    const std::vector<Real>& freq,
    const std::vector<int>& image_indices,
    const std::vector<Real>& weights
) {
    const int nF = static_cast<int>(freq.size());
    const int R = images.num_receivers();
    const int S = images.num_sources();
    const int nImg = static_cast<int>(image_indices.size());

    TransferFunction T(nF, R, S);

    #pragma omp parallel for schedule(static)
    for (int f = 0; f < nF; ++f) {
        const Complex minus_ik(0.0, -2.0 * PI * freq[f] / env.water_c);

        for (int k = 0; k < nImg; ++k) {
            const Image& img = images[image_indices[k]];
            for (int s = 0; s < S; ++s) {
                for (int r = 0; r < R; ++r) {
                    const Real d = img.dist(r, s);
                    T.G[s](f, r) += weights[k] * (img.rcoeff(r, s) / d) * std::exp(minus_ik * d);
                }
            }
        }
    }

    return T;
}

CrossSpectralDensity outer_products(const TransferFunction& T) {
    CrossSpectralDensity K(T.nFreq, T.nReceivers, T.nSources);

    #pragma omp parallel for schedule(static)
    for (int f = 0; f < T.nFreq; ++f) {
        for (int s = 0; s < T.nSources; ++s) {
            VectorXcd tf = T.G[s].row(f).transpose();
            K.at(f, s) = tf * tf.adjoint();
        }
    }

    return K;
}

} // anonymous namespace

TransferFunction transfer_function(
    const ImageCollection& images,
    const Environment& env,
    const std::vector<Real>& freq
) {
    return transfer_function(images, env, freq, images.all_indices());
}

TransferFunction transfer_function(
    const ImageCollection& images,
    const Environment& env,
    const std::vector<Real>& freq,
    const std::vector<int>& image_indices
) {
    check_indices(images, image_indices);
    return accumulate(images, env, freq, image_indices, std::vector<Real>(image_indices.size(), 1.0));
}

CrossSpectralDensity clairvoyant_csdm(
    const ImageCollection& images,
    const Environment& env,
    const std::vector<Real>& freq
) {
    return clairvoyant_csdm(images, env, freq, images.all_indices());
}

CrossSpectralDensity clairvoyant_csdm(
    const ImageCollection& images,
    const Environment& env,
    const std::vector<Real>& freq,
    const std::vector<int>& image_indices
) {
    return outer_products(transfer_function(images, env, freq, image_indices));
}

CrossSpectralDensity clairvoyant_csdm_with_decoherence(
    const ImageCollection& images,
    const Environment& env,
    const std::vector<Real>& freq,
    Real coh_surface,
    Real coh_seabed
) {
    return clairvoyant_csdm_with_decoherence(images, env, freq, coh_surface, coh_seabed,
                                             images.all_indices());
}

CrossSpectralDensity clairvoyant_csdm_with_decoherence(
    const ImageCollection& images,
    const Environment& env,
    const std::vector<Real>& freq,
    Real coh_surface,
    Real coh_seabed,
    const std::vector<int>& image_indices
) {
    check_indices(images, image_indices);

    // The pair factor coh^(b1 + b2) splits into coh^b1 * coh^b2, so the sum
    // over all image pairs equals the outer product of the weighted sums.
    std::vector<Real> weights(image_indices.size());
    for (size_t k = 0; k < image_indices.size(); ++k) {
        const Breadcrumb& crumb = images[image_indices[k]].breadcrumb;
        weights[k] = std::pow(coh_seabed, bounce_count(crumb, Boundary::Bottom)) *
                     std::pow(coh_surface, bounce_count(crumb, Boundary::Surface));
    }

    return outer_products(accumulate(images, env, freq, image_indices, weights));
}

} // namespace mirror
