/**
 * @file python_binding.cpp
 * @brief Python bindings for the image-method model using pybind11
 *
 * Exposes image generation, filtering and rendering to Python. Point sets
 * are NumPy arrays of shape (N, 3); transfer functions and CSDMs come back
 * as complex NumPy arrays.
 */

#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <pybind11/complex.h>
#include "mirror_core.hpp"

namespace py = pybind11;
using namespace mirror;

namespace {

PointsXYZ to_points(py::array_t<double, py::array::c_style | py::array::forcecast> xyz, const char* name) {
    auto buf = xyz.request();
    if (buf.ndim != 2 || buf.shape[1] != 3) {
        throw std::runtime_error(std::string(name) + " must be a 2D array with shape (N, 3)");
    }

    int n = static_cast<int>(buf.shape[0]);
    double* ptr = static_cast<double*>(buf.ptr);

    PointsXYZ pts(n, 3);
    for (int i = 0; i < n; i++) {
        for (int c = 0; c < 3; c++) {
            pts(i, c) = ptr[i * 3 + c];
        }
    }
    return pts;
}

std::vector<Real> to_vector(py::array_t<double, py::array::c_style | py::array::forcecast> values) {
    auto buf = values.request();
    if (buf.ndim != 1) {
        throw std::runtime_error("frequencies must be a 1D array");
    }
    double* ptr = static_cast<double*>(buf.ptr);
    return std::vector<Real>(ptr, ptr + buf.shape[0]);
}

py::array_t<double> real_matrix(const MatrixXd& m) {
    py::array_t<double> out({m.rows(), m.cols()});
    auto ptr = out.mutable_unchecked<2>();
    for (Eigen::Index i = 0; i < m.rows(); i++) {
        for (Eigen::Index j = 0; j < m.cols(); j++) {
            ptr(i, j) = m(i, j);
        }
    }
    return out;
}

py::array_t<std::complex<double>> complex_matrix(const MatrixXcd& m) {
    py::array_t<std::complex<double>> out({m.rows(), m.cols()});
    auto ptr = out.mutable_unchecked<2>();
    for (Eigen::Index i = 0; i < m.rows(); i++) {
        for (Eigen::Index j = 0; j < m.cols(); j++) {
            ptr(i, j) = m(i, j);
        }
    }
    return out;
}

/**
 * @brief Transfer function as a complex array with shape (nFreq, nReceivers, nSources)
 */
py::array_t<std::complex<double>> to_array(const TransferFunction& T) {
    py::array_t<std::complex<double>> G({T.nFreq, T.nReceivers, T.nSources});
    auto ptr = G.mutable_unchecked<3>();
    for (int f = 0; f < T.nFreq; f++) {
        for (int r = 0; r < T.nReceivers; r++) {
            for (int s = 0; s < T.nSources; s++) {
                ptr(f, r, s) = T(f, r, s);
            }
        }
    }
    return G;
}

/**
 * @brief CSDM as a complex array with shape (nReceivers, nReceivers, nFreq, nSources)
 */
py::array_t<std::complex<double>> to_array(const CrossSpectralDensity& K) {
    py::array_t<std::complex<double>> out({K.nReceivers, K.nReceivers, K.nFreq, K.nSources});
    auto ptr = out.mutable_unchecked<4>();
    for (int s = 0; s < K.nSources; s++) {
        for (int f = 0; f < K.nFreq; f++) {
            const MatrixXcd& Kfs = K.at(f, s);
            for (int r1 = 0; r1 < K.nReceivers; r1++) {
                for (int r2 = 0; r2 < K.nReceivers; r2++) {
                    ptr(r1, r2, f, s) = Kfs(r1, r2);
                }
            }
        }
    }
    return out;
}

std::vector<int> indices_or_all(const ImageCollection& images, const py::object& indices) {
    if (indices.is_none()) {
        return images.all_indices();
    }
    return indices.cast<std::vector<int>>();
}

} // anonymous namespace

// =============================================================================
// Python module definition
// =============================================================================
PYBIND11_MODULE(mirror, m) {
    m.doc() = R"pbdoc(
        mirror: image-method acoustic propagation over a single seabed layer
        --------------------------------------------------------------------

        Example usage:
            import numpy as np
            import mirror

            env = mirror.Environment()
            env.seabed_z = -12.0

            stop = mirror.StoppingConditions()
            stop.bounce_count_thresh = 10

            sources = np.array([[100.0, 100.0, 0.0], [-30.0, 100.0, 0.0]])
            receivers = np.array([[-5.5, 0.0, -12.0], [5.5, 0.0, -12.0]])

            images = mirror.generate_images(env, sources, receivers, stop)
            images.retain(images.breadcrumbs_to_indices(['', 'bs', 'bsbs']))

            freq = np.linspace(1.0, 3000.0, 512)
            G = mirror.transfer_function(images, env, freq)
            K = mirror.clairvoyant_csdm(images, env, freq)
    )pbdoc";

    py::class_<Environment>(m, "Environment")
        .def(py::init<>())
        .def_readwrite("air_z", &Environment::air_z)
        .def_readwrite("air_c", &Environment::air_c)
        .def_readwrite("air_rho", &Environment::air_rho)
        .def_readwrite("water_z", &Environment::water_z)
        .def_readwrite("water_c", &Environment::water_c)
        .def_readwrite("water_rho", &Environment::water_rho)
        .def_readwrite("water_alpha", &Environment::water_alpha)
        .def_readwrite("seabed_z", &Environment::seabed_z)
        .def_readwrite("seabed_c", &Environment::seabed_c)
        .def_readwrite("seabed_rho", &Environment::seabed_rho)
        .def_readwrite("seabed_alpha", &Environment::seabed_alpha);

    py::class_<StoppingConditions>(m, "StoppingConditions")
        .def(py::init<>())
        .def_readwrite("attenuation_thresh_dB", &StoppingConditions::attenuation_thresh_dB)
        .def_readwrite("bounce_count_thresh", &StoppingConditions::bounce_count_thresh)
        .def_readwrite("time_lag_thresh", &StoppingConditions::time_lag_thresh);

    py::class_<ImageCollection>(m, "ImageCollection")
        .def("count", &ImageCollection::count)
        .def("__len__", &ImageCollection::count)
        .def_property_readonly("num_receivers", &ImageCollection::num_receivers)
        .def_property_readonly("num_sources", &ImageCollection::num_sources)
        .def("breadcrumbs", [](const ImageCollection& images) {
            std::vector<std::string> crumbs;
            for (const auto& img : images.images()) {
                crumbs.push_back(to_string(img.breadcrumb));
            }
            return crumbs;
        })
        .def("find", [](const ImageCollection& images, const std::string& crumb) -> py::object {
            int n = images.find(breadcrumb_from_string(crumb));
            if (n < 0) {
                return py::none();
            }
            return py::int_(n);
        }, py::arg("breadcrumb"))
        .def("breadcrumbs_to_indices", [](const ImageCollection& images, const std::vector<std::string>& crumbs) {
            std::vector<Breadcrumb> parsed;
            for (const auto& text : crumbs) {
                parsed.push_back(breadcrumb_from_string(text));
            }
            return images.breadcrumbs_to_indices(parsed);
        }, py::arg("breadcrumbs"))
        .def("retain", &ImageCollection::retain, py::arg("indices"))
        .def("clear", &ImageCollection::clear)
        .def("max_distance", &ImageCollection::max_distance)
        .def("positions", [](const ImageCollection& images, int n) {
            return real_matrix(images.at(n).xyz);
        }, py::arg("index"))
        .def("distances", [](const ImageCollection& images, int n) {
            return real_matrix(images.at(n).dist);
        }, py::arg("index"))
        .def("grazing_angles", [](const ImageCollection& images, int n) {
            return real_matrix(images.at(n).grazing);
        }, py::arg("index"))
        .def("reflection_coefficients", [](const ImageCollection& images, int n) {
            return complex_matrix(images.at(n).rcoeff);
        }, py::arg("index"));

    m.def("generate_images", [](const Environment& env,
                                py::array_t<double, py::array::c_style | py::array::forcecast> sources,
                                py::array_t<double, py::array::c_style | py::array::forcecast> receivers,
                                const StoppingConditions& stop) {
        Geometry geometry;
        geometry.sources = to_points(sources, "sources");
        geometry.receivers = to_points(receivers, "receivers");
        return generate_images(env, geometry, stop);
    }, R"pbdoc(
        Find all images (eigenrays) for the environment and geometry.

        Parameters
        ----------
        env : Environment
        sources : ndarray
            Source coordinates with shape (S, 3) in meters
        receivers : ndarray
            Receiver coordinates with shape (R, 3) in meters
        stop : StoppingConditions
    )pbdoc",
        py::arg("env"),
        py::arg("sources"),
        py::arg("receivers"),
        py::arg("stop") = StoppingConditions()
    );

    m.def("transfer_function", [](const ImageCollection& images, const Environment& env,
                                  py::array_t<double, py::array::c_style | py::array::forcecast> freq,
                                  py::object indices) {
        return to_array(transfer_function(images, env, to_vector(freq), indices_or_all(images, indices)));
    }, R"pbdoc(
        Transfer function with shape (nFreq, nReceivers, nSources).
    )pbdoc",
        py::arg("images"),
        py::arg("env"),
        py::arg("freq"),
        py::arg("indices") = py::none()
    );

    m.def("clairvoyant_csdm", [](const ImageCollection& images, const Environment& env,
                                 py::array_t<double, py::array::c_style | py::array::forcecast> freq,
                                 py::object indices) {
        return to_array(clairvoyant_csdm(images, env, to_vector(freq), indices_or_all(images, indices)));
    }, R"pbdoc(
        Clairvoyant CSDM with shape (nReceivers, nReceivers, nFreq, nSources).
    )pbdoc",
        py::arg("images"),
        py::arg("env"),
        py::arg("freq"),
        py::arg("indices") = py::none()
    );

    m.def("clairvoyant_csdm_with_decoherence", [](const ImageCollection& images, const Environment& env,
                                                  py::array_t<double, py::array::c_style | py::array::forcecast> freq,
                                                  double coh_surface, double coh_seabed,
                                                  py::object indices) {
        return to_array(clairvoyant_csdm_with_decoherence(images, env, to_vector(freq),
                                                          coh_surface, coh_seabed,
                                                          indices_or_all(images, indices)));
    }, R"pbdoc(
        Clairvoyant CSDM with ad hoc coherence loss per surface and seabed reflection.
    )pbdoc",
        py::arg("images"),
        py::arg("env"),
        py::arg("freq"),
        py::arg("coh_surface"),
        py::arg("coh_seabed"),
        py::arg("indices") = py::none()
    );

    m.def("reflection_coefficient", [](double grazing_angle, double c1, double rho1, double c2, double rho2) {
        return reflection_coefficient(grazing_angle, c1, rho1, c2, rho2);
    }, py::arg("grazing_angle"), py::arg("c1"), py::arg("rho1"), py::arg("c2"), py::arg("rho2"));

    m.def("critical_angle", &critical_angle, py::arg("c1"), py::arg("c2"));

    m.def("get_num_threads", &mirror_get_num_threads, R"pbdoc(
        Get the number of OpenMP threads used for parallel computation.
    )pbdoc");

    m.def("set_num_threads", &mirror_set_num_threads, R"pbdoc(
        Set the number of OpenMP threads for parallel computation.
    )pbdoc",
        py::arg("n")
    );

    // Version info
    m.attr("__version__") = "1.0.0";
}
