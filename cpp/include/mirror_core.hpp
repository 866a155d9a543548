/**
 * @file mirror_core.hpp
 * @brief Image-method acoustic propagation over a single seabed layer
 *
 * This library models underwater sound propagation between sources and an
 * array of receivers in an isovelocity water column bounded by the sea
 * surface and a single fluid seabed half-space. Every boundary reflection is
 * replaced by a mirrored (image) source; the multipath field is the
 * superposition of the direct-path contributions of all retained images.
 *
 * Workflow:
 *   - image finding:   generate_images()
 *   - image filtering: ImageCollection::retain(), breadcrumbs_to_indices()
 *   - rendering:       transfer_function(), clairvoyant_csdm(),
 *                      clairvoyant_csdm_with_decoherence()
 *
 * Reflection coefficients follow Jensen, Kuperman, Porter & Schmidt,
 * Computational Ocean Acoustics (2000), Eq. (2.127).
 */

#ifndef MIRROR_CORE_HPP
#define MIRROR_CORE_HPP

#include <Eigen/Dense>
#include <complex>
#include <limits>
#include <string>
#include <vector>
#include <cmath>

namespace mirror {

// Type aliases for clarity
using Real = double;
using Complex = std::complex<double>;
using MatrixXd = Eigen::MatrixXd;
using MatrixXcd = Eigen::MatrixXcd;
using VectorXd = Eigen::VectorXd;
using VectorXcd = Eigen::VectorXcd;
using PointsXYZ = Eigen::Matrix<Real, Eigen::Dynamic, 3>;  // P x 3 cartesian points

// Constants
constexpr Real PI = 3.14159265358979323846;
constexpr Real INF = std::numeric_limits<Real>::infinity();

constexpr char BREADCRUMB_SURFACE = 's';
constexpr char BREADCRUMB_BOTTOM = 'b';

/**
 * @enum Boundary
 * @brief Reflecting boundary of the water column
 */
enum class Boundary {
    Surface,
    Bottom
};

/// Ordered reflection history of an image; empty for the direct path.
using Breadcrumb = std::vector<Boundary>;

/**
 * @struct Environment
 * @brief Acoustic properties of the air / water / seabed half-spaces
 *
 * Depths are z coordinates (m, positive up, surface at 0). Densities in
 * g/cm^3, sound speeds in m/s. The attenuation fields are carried as
 * metadata and do not enter the propagation model.
 */
struct Environment {
    Real air_z = 0.0;                          // Depth of air (defined as 0)
    Real air_c = 343.21;                       // Sound speed in air
    Real air_rho = 1.2041e-3;                  // Density of air
    Real water_z = 0.0;                        // Depth of water layer
    Real water_c = 1500.0;                     // Sound speed in water
    Real water_rho = 1.0;                      // Density of water
    Real water_alpha = 1.001438340469e-4;      // Attenuation of water (dB/lambda)
    Real seabed_z = std::numeric_limits<Real>::quiet_NaN();  // Depth of seabed layer
    Real seabed_c = 1550.0;                    // Sound speed in seabed
    Real seabed_rho = 1.8;                     // Density of seabed
    Real seabed_alpha = 0.2;                   // Attenuation of seabed (dB/lambda)
};

/**
 * @struct StoppingConditions
 * @brief Limits that terminate a branch of the image recursion
 *
 * A threshold left at infinity does not take part. At least one of them
 * must bound the recursion (see validate_configuration()).
 */
struct StoppingConditions {
    Real attenuation_thresh_dB = 100.0;  // Max loss relative to the direct path
    Real bounce_count_thresh = INF;      // Max number of boundary reflections
    Real time_lag_thresh = INF;          // Max travel time of a multipath ray (s)
};

/**
 * @struct Geometry
 * @brief Source and receiver positions
 */
struct Geometry {
    PointsXYZ sources;    // S x 3
    PointsXYZ receivers;  // R x 3

    int nSources() const { return static_cast<int>(sources.rows()); }
    int nReceivers() const { return static_cast<int>(receivers.rows()); }
};

/**
 * @struct ReceiverVectors
 * @brief Receiver-minus-point vectors, one R x P matrix per component
 */
struct ReceiverVectors {
    MatrixXd x;
    MatrixXd y;
    MatrixXd z;
};

/**
 * @struct Image
 * @brief One image source (direct path or reflected copy of every source)
 */
struct Image {
    PointsXYZ xyz;          // Image coordinates, S x 3
    MatrixXd dist;          // Receiver-to-image distance, R x S
    ReceiverVectors vec;    // Receiver-to-image vectors, R x S per component
    MatrixXd grazing;       // Grazing angle (rad), R x S; NaN for the direct path
    MatrixXcd rcoeff;       // Cumulative reflection coefficient, R x S
    Breadcrumb breadcrumb;  // Reflection history
};

/**
 * @struct ValidationIssue
 * @brief Problem found in a generation configuration
 */
struct ValidationIssue {
    std::string message;
    bool fatal = true;
};

// ============================================================================
// Reflection model
// ============================================================================

/**
 * @brief Plane-wave reflection coefficient of a fluid-fluid interface
 *
 * Medium 1 carries the incident wave. Beyond the critical angle the vertical
 * wavenumber in medium 2 becomes imaginary and |R| = 1.
 *
 * @param grazing_angle Grazing angle in medium 1 (rad, from horizontal)
 * @param c1 Sound speed of incident medium
 * @param rho1 Density of incident medium
 * @param c2 Sound speed of reflecting medium
 * @param rho2 Density of reflecting medium
 * @return Complex reflection coefficient
 */
Complex reflection_coefficient(Real grazing_angle, Real c1, Real rho1, Real c2, Real rho2);

/**
 * @brief Element-wise reflection coefficient for a matrix of grazing angles
 */
MatrixXcd reflection_coefficient(const MatrixXd& grazing_angle, Real c1, Real rho1, Real c2, Real rho2);

/**
 * @brief Reflection coefficient of the water/air interface
 */
MatrixXcd reflection_coefficient_surface(const Environment& env, const MatrixXd& grazing_angle);

/**
 * @brief Reflection coefficient of the water/seabed interface
 */
MatrixXcd reflection_coefficient_seabed(const Environment& env, const MatrixXd& grazing_angle);

/**
 * @brief Critical grazing angle (rad) of a boundary with sound speed c2
 *
 * Zero when c2 <= c1, i.e. no total internal reflection occurs.
 */
Real critical_angle(Real c1, Real c2);

// ============================================================================
// Geometry
// ============================================================================

/**
 * @brief Vectors with head at each receiver and tail at each point
 *
 * @param receivers R x 3 receiver coordinates
 * @param points P x 3 point coordinates
 * @return R x P matrices of the x, y and z components
 */
ReceiverVectors vector_to_receivers(const PointsXYZ& receivers, const PointsXYZ& points);

/**
 * @brief Euclidean distance between each receiver and each point (R x P)
 */
MatrixXd distance_to_receivers(const PointsXYZ& receivers, const PointsXYZ& points);

/**
 * @brief Norm of receiver vectors (R x P)
 */
MatrixXd vector_norm(const ReceiverVectors& vec);

/**
 * @brief Grazing angle |atan2(dz, horizontal range)| of receiver vectors
 */
MatrixXd grazing_angle(const ReceiverVectors& vec);

/**
 * @brief Mirror points across the horizontal plane z = boundary_z
 */
PointsXYZ mirror_points(const PointsXYZ& points, Real boundary_z);

/**
 * @brief z coordinate of a boundary plane in the given environment
 */
Real boundary_depth(const Environment& env, Boundary boundary);

/**
 * @brief The other boundary
 */
inline Boundary opposite(Boundary boundary) {
    return boundary == Boundary::Surface ? Boundary::Bottom : Boundary::Surface;
}

// ============================================================================
// Breadcrumbs
// ============================================================================

int bounce_count(const Breadcrumb& crumb, Boundary boundary);

/**
 * @brief Text form of a breadcrumb ('s' surface, 'b' bottom)
 */
std::string to_string(const Breadcrumb& crumb);

/**
 * @brief Parse the text form of a breadcrumb
 * @throws std::invalid_argument on characters other than 's' and 'b'
 */
Breadcrumb breadcrumb_from_string(const std::string& text);

// ============================================================================
// Configuration validation
// ============================================================================

/**
 * @brief Check a generation configuration
 *
 * The recursion is bounded when the attenuation threshold is finite, or the
 * bounce count threshold is finite and non-negative, or the time lag
 * threshold is finite and non-negative. Failing all three is fatal. Relying
 * on the attenuation threshold alone is reported as a non-fatal warning,
 * since the number of images then grows with the 10^(dB/20) distance ratio.
 */
std::vector<ValidationIssue> validate_configuration(
    const Environment& env,
    const Geometry& geometry,
    const StoppingConditions& stop
);

/**
 * @brief Throw std::invalid_argument listing every fatal issue
 */
void throw_if_invalid(
    const Environment& env,
    const Geometry& geometry,
    const StoppingConditions& stop
);

// ============================================================================
// Image collection
// ============================================================================

/**
 * @class ImageCollection
 * @brief Ordered store of images in discovery order
 *
 * Indices are zero-based. The direct path, when generated, is image 0.
 */
class ImageCollection {
public:
    ImageCollection() : nReceivers_(0), nSources_(0) {}
    ImageCollection(int nReceivers, int nSources) : nReceivers_(nReceivers), nSources_(nSources) {}

    int count() const { return static_cast<int>(images_.size()); }
    int num_receivers() const { return nReceivers_; }
    int num_sources() const { return nSources_; }
    bool empty() const { return images_.empty(); }

    const Image& operator[](int index) const { return images_[index]; }

    /**
     * @throws std::out_of_range for an index outside [0, count())
     */
    const Image& at(int index) const;

    const std::vector<Image>& images() const { return images_; }

    /**
     * @brief Append an image; its fields must be R x S
     * @throws std::invalid_argument on a shape mismatch
     */
    void append(Image image);

    /**
     * @brief Index of the first image with the given breadcrumb, or -1
     */
    int find(const Breadcrumb& crumb) const;

    /**
     * @brief Indices of the given breadcrumbs; absent ones are dropped
     */
    std::vector<int> breadcrumbs_to_indices(const std::vector<Breadcrumb>& crumbs) const;

    /**
     * @brief Keep only the given images, in the given order
     *
     * Indices are validated before anything changes.
     *
     * @throws std::out_of_range if any index is outside [0, count())
     */
    void retain(const std::vector<int>& indices);

    /// Remove every image; receiver and source counts are kept.
    void clear() { images_.clear(); }

    std::vector<int> all_indices() const;

    /// Largest receiver-to-image distance over all images (0 when empty).
    Real max_distance() const;

private:
    int nReceivers_;
    int nSources_;
    std::vector<Image> images_;
};

// ============================================================================
// Image generation
// ============================================================================

/**
 * @brief Find all images for the given environment and geometry
 *
 * The direct path comes first, followed by the branch that starts with a
 * surface reflection and then the branch that starts with a bottom
 * reflection. A branch is skipped when every source lies on its first plane.
 *
 * @throws std::invalid_argument when validate_configuration() reports a
 *         fatal issue; nothing is generated in that case
 */
ImageCollection generate_images(
    const Environment& env,
    const Geometry& geometry,
    const StoppingConditions& stop
);

// ============================================================================
// Transfer function and CSDM
// ============================================================================

/**
 * @struct TransferFunction
 * @brief Complex response per frequency, receiver and source
 */
struct TransferFunction {
    int nFreq;
    int nReceivers;
    int nSources;
    std::vector<MatrixXcd> G;  // One nFreq x nReceivers matrix per source

    TransferFunction() : nFreq(0), nReceivers(0), nSources(0) {}
    TransferFunction(int nf, int nr, int ns)
        : nFreq(nf), nReceivers(nr), nSources(ns), G(ns, MatrixXcd::Zero(nf, nr)) {}

    Complex operator()(int f, int r, int s) const { return G[s](f, r); }
};

/**
 * @struct CrossSpectralDensity
 * @brief Receiver-by-receiver CSDM per frequency and source
 */
struct CrossSpectralDensity {
    int nFreq;
    int nReceivers;
    int nSources;
    std::vector<MatrixXcd> K;  // nReceivers x nReceivers, stored at [s * nFreq + f]

    CrossSpectralDensity() : nFreq(0), nReceivers(0), nSources(0) {}
    CrossSpectralDensity(int nf, int nr, int ns)
        : nFreq(nf), nReceivers(nr), nSources(ns), K(nf * ns, MatrixXcd::Zero(nr, nr)) {}

    const MatrixXcd& at(int f, int s) const { return K[s * nFreq + f]; }
    MatrixXcd& at(int f, int s) { return K[s * nFreq + f]; }
};

/**
 * @brief Transfer function as a superposition of all images
 *
 * G(f, r, s) = sum_n rcoeff_n(r, s) / d_n(r, s) * exp(-i 2 pi f d_n(r, s) / c_w)
 *
 * OpenMP parallelization over frequencies.
 *
 * @param images Generated (and possibly filtered) images
 * @param env Environment; only the water sound speed is used
 * @param freq Frequencies (Hz)
 * @return nFreq x nReceivers x nSources transfer function
 */
TransferFunction transfer_function(
    const ImageCollection& images,
    const Environment& env,
    const std::vector<Real>& freq
);

/**
 * @brief Transfer function over a subset of images
 * @throws std::out_of_range for an invalid image index
 */
TransferFunction transfer_function(
    const ImageCollection& images,
    const Environment& env,
    const std::vector<Real>& freq,
    const std::vector<int>& image_indices
);

/**
 * @brief Clairvoyant CSDM: K(f, s) = T T^H with T the receiver vector of G(f, :, s)
 *
 * No noise and perfect coherence between rays.
 */
CrossSpectralDensity clairvoyant_csdm(
    const ImageCollection& images,
    const Environment& env,
    const std::vector<Real>& freq
);

CrossSpectralDensity clairvoyant_csdm(
    const ImageCollection& images,
    const Environment& env,
    const std::vector<Real>& freq,
    const std::vector<int>& image_indices
);

/**
 * @brief Clairvoyant CSDM with ad hoc decorrelation between eigenrays
 *
 * Every pair of images (n1, n2) contributes
 *   coh_seabed^(b1 + b2) * coh_surface^(s1 + s2) * T1 T2^H
 * where b and s count bottom and surface reflections in each breadcrumb.
 * The factors are expected in [0, 1] but are not checked.
 *
 * @param coh_surface Coherence retained per surface reflection
 * @param coh_seabed Coherence retained per seabed reflection
 */
CrossSpectralDensity clairvoyant_csdm_with_decoherence(
    const ImageCollection& images,
    const Environment& env,
    const std::vector<Real>& freq,
    Real coh_surface,
    Real coh_seabed
);

CrossSpectralDensity clairvoyant_csdm_with_decoherence(
    const ImageCollection& images,
    const Environment& env,
    const std::vector<Real>& freq,
    Real coh_surface,
    Real coh_seabed,
    const std::vector<int>& image_indices
);

// ============================================================================
// C-style interface for MEX and external bindings
// ============================================================================

extern "C" {

/**
 * Common parameters of the C interface:
 *
 * @param depth       {water_z, seabed_z}
 * @param sound_speed {air_c, water_c, seabed_c}
 * @param density     {air_rho, water_rho, seabed_rho}
 * @param stop        {attenuation_thresh_dB, bounce_count_thresh, time_lag_thresh}
 * @param sources     Column-major nSources x 3 coordinates (MATLAB layout)
 * @param receivers   Column-major nReceivers x 3 coordinates
 * @param breadcrumbs Optional eigenrays to retain ("", "bs", ...); all images
 *                    are used when nBreadcrumbs == 0
 *
 * Functions return a negative value on failure; the reason is available
 * from mirror_last_error().
 */

/**
 * @brief Number of images found for the configuration
 */
int mirror_count_images(
    const double* depth,
    const double* sound_speed,
    const double* density,
    const double* stop,
    const double* sources,
    int nSources,
    const double* receivers,
    int nReceivers
);

/**
 * @brief C interface for transfer_function
 *
 * @param G_real Output: real part, column-major nFreq x nReceivers x nSources
 * @param G_imag Output: imaginary part, same layout
 * @return Number of images used, or -1 on failure
 */
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
);

/**
 * @brief C interface for clairvoyant_csdm
 *
 * @param K_real Output: real part, column-major nReceivers x nReceivers x nFreq x nSources
 * @param K_imag Output: imaginary part, same layout
 * @return Number of images used, or -1 on failure
 */
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
);

/**
 * @brief Message of the last failure on this thread ("" if none)
 */
const char* mirror_last_error();

/**
 * @brief Get number of OpenMP threads
 */
int mirror_get_num_threads();

/**
 * @brief Set number of OpenMP threads
 */
void mirror_set_num_threads(int n);

} // extern "C"

} // namespace mirror

#endif // MIRROR_CORE_HPP
