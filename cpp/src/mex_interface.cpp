/**
 * @file mex_interface.cpp
 * @brief MATLAB MEX interface for the image-method model (Traditional C API)
 *
 * Usage in MATLAB:
 *   [G, K, nimg] = mirror_mex(sources, receivers, env, freq, [breadcrumbs])
 *
 *   sources     - S-by-3 source coordinates (m)
 *   receivers   - R-by-3 receiver coordinates (m)
 *   env         - struct; any of water_z, seabed_z, air_c, water_c, seabed_c,
 *                 air_rho, water_rho, seabed_rho, attenuation_thresh_dB,
 *                 bounce_count_thresh, time_lag_thresh (missing fields keep
 *                 their defaults; seabed_z is required)
 *   freq        - vector of frequencies (Hz)
 *   breadcrumbs - optional cell array of eigenrays to retain, e.g. {'', 'bs'}
 *
 *   G    - F-by-R-by-S transfer function
 *   K    - R-by-R-by-F-by-S clairvoyant CSDM
 *   nimg - number of images used
 */

#include "mex.h"
#include "matrix.h"
#include "mirror_core.hpp"
#include <string>
#include <vector>

namespace {

double field_or(const mxArray* s, const char* name, double fallback) {
    const mxArray* f = mxGetField(s, 0, name);
    if (f == nullptr) {
        return fallback;
    }
    if (!mxIsDouble(f) || mxIsComplex(f) || mxGetNumberOfElements(f) != 1) {
        mexErrMsgIdAndTxt("MIRROR:invalidInput", "env.%s must be a real double scalar", name);
    }
    return mxGetScalar(f);
}

void check_points(const mxArray* a, const char* name) {
    if (!mxIsDouble(a) || mxIsComplex(a) || mxGetN(a) != 3) {
        mexErrMsgIdAndTxt("MIRROR:invalidInput", "%s must be a real double N-by-3 matrix", name);
    }
}

void copy_complex(mxArray* out, const std::vector<double>& re, const std::vector<double>& im) {
    const size_t n = re.size();
    #if MX_HAS_INTERLEAVED_COMPLEX
    // R2018a+ interleaved complex
    mxComplexDouble* data = mxGetComplexDoubles(out);
    for (size_t i = 0; i < n; ++i) {
        data[i].real = re[i];
        data[i].imag = im[i];
    }
    #else
    // Legacy separate real/imag
    double* outReal = mxGetPr(out);
    double* outImag = mxGetPi(out);
    for (size_t i = 0; i < n; ++i) {
        outReal[i] = re[i];
        outImag[i] = im[i];
    }
    #endif
}

} // anonymous namespace

/**
 * @brief MEX gateway function (Traditional C API)
 */
void mexFunction(int nlhs, mxArray *plhs[], int nrhs, const mxArray *prhs[]) {
    if (nrhs < 4 || nrhs > 5) {
        mexErrMsgIdAndTxt("MIRROR:nrhs",
            "Usage: [G, K, nimg] = mirror_mex(sources, receivers, env, freq, [breadcrumbs])");
    }
    if (nlhs > 3) {
        mexErrMsgIdAndTxt("MIRROR:nlhs", "Too many output arguments");
    }

    check_points(prhs[0], "sources");
    check_points(prhs[1], "receivers");

    if (!mxIsStruct(prhs[2]) || mxGetNumberOfElements(prhs[2]) != 1) {
        mexErrMsgIdAndTxt("MIRROR:invalidInput", "env must be a scalar struct");
    }
    if (!mxIsDouble(prhs[3]) || mxIsComplex(prhs[3])) {
        mexErrMsgIdAndTxt("MIRROR:invalidInput", "freq must be a real double vector");
    }

    // Environment and stopping conditions, defaults from the C++ structs
    const mxArray* envArg = prhs[2];
    mirror::Environment defEnv;
    mirror::StoppingConditions defStop;

    if (mxGetField(envArg, 0, "seabed_z") == nullptr) {
        mexErrMsgIdAndTxt("MIRROR:invalidInput", "env.seabed_z is required");
    }

    double depth[2] = {
        field_or(envArg, "water_z", defEnv.water_z),
        field_or(envArg, "seabed_z", defEnv.seabed_z)
    };
    double soundSpeed[3] = {
        field_or(envArg, "air_c", defEnv.air_c),
        field_or(envArg, "water_c", defEnv.water_c),
        field_or(envArg, "seabed_c", defEnv.seabed_c)
    };
    double density[3] = {
        field_or(envArg, "air_rho", defEnv.air_rho),
        field_or(envArg, "water_rho", defEnv.water_rho),
        field_or(envArg, "seabed_rho", defEnv.seabed_rho)
    };
    double stop[3] = {
        field_or(envArg, "attenuation_thresh_dB", defStop.attenuation_thresh_dB),
        field_or(envArg, "bounce_count_thresh", defStop.bounce_count_thresh),
        field_or(envArg, "time_lag_thresh", defStop.time_lag_thresh)
    };

    // Breadcrumbs (optional cell array of strings)
    std::vector<std::string> crumbText;
    std::vector<const char*> crumbPtr;
    if (nrhs >= 5) {
        if (!mxIsCell(prhs[4])) {
            mexErrMsgIdAndTxt("MIRROR:invalidInput", "breadcrumbs must be a cell array of strings");
        }
        const size_t nCrumbs = mxGetNumberOfElements(prhs[4]);
        crumbText.reserve(nCrumbs);
        for (size_t i = 0; i < nCrumbs; ++i) {
            const mxArray* c = mxGetCell(prhs[4], i);
            if (c == nullptr || mxIsEmpty(c)) {
                crumbText.push_back("");
                continue;
            }
            if (!mxIsChar(c)) {
                mexErrMsgIdAndTxt("MIRROR:invalidInput", "breadcrumbs must be a cell array of strings");
            }
            char* text = mxArrayToString(c);
            crumbText.push_back(text);
            mxFree(text);
        }
        for (const auto& t : crumbText) {
            crumbPtr.push_back(t.c_str());
        }
    }

    const double* sources = mxGetPr(prhs[0]);
    const int nSources = static_cast<int>(mxGetM(prhs[0]));
    const double* receivers = mxGetPr(prhs[1]);
    const int nReceivers = static_cast<int>(mxGetM(prhs[1]));
    const double* freq = mxGetPr(prhs[3]);
    const int nFreq = static_cast<int>(mxGetNumberOfElements(prhs[3]));
    const int nCrumbs = static_cast<int>(crumbPtr.size());
    const char* const* crumbs = crumbPtr.empty() ? nullptr : crumbPtr.data();

    // Transfer function
    std::vector<double> G_real(static_cast<size_t>(nFreq) * nReceivers * nSources);
    std::vector<double> G_imag(G_real.size());

    int nimg = mirror::mirror_transfer_function(
        depth, soundSpeed, density, stop,
        sources, nSources, receivers, nReceivers,
        crumbs, nCrumbs,
        freq, nFreq,
        G_real.data(), G_imag.data()
    );
    if (nimg < 0) {
        mexErrMsgIdAndTxt("MIRROR:failed", "%s", mirror::mirror_last_error());
    }

    mwSize gDims[3] = {
        static_cast<mwSize>(nFreq), static_cast<mwSize>(nReceivers), static_cast<mwSize>(nSources)
    };
    plhs[0] = mxCreateNumericArray(3, gDims, mxDOUBLE_CLASS, mxCOMPLEX);
    copy_complex(plhs[0], G_real, G_imag);

    // CSDM
    if (nlhs >= 2) {
        std::vector<double> K_real(static_cast<size_t>(nReceivers) * nReceivers * nFreq * nSources);
        std::vector<double> K_imag(K_real.size());

        int status = mirror::mirror_clairvoyant_csdm(
            depth, soundSpeed, density, stop,
            sources, nSources, receivers, nReceivers,
            crumbs, nCrumbs,
            freq, nFreq,
            K_real.data(), K_imag.data()
        );
        if (status < 0) {
            mexErrMsgIdAndTxt("MIRROR:failed", "%s", mirror::mirror_last_error());
        }

        mwSize kDims[4] = {
            static_cast<mwSize>(nReceivers), static_cast<mwSize>(nReceivers),
            static_cast<mwSize>(nFreq), static_cast<mwSize>(nSources)
        };
        plhs[1] = mxCreateNumericArray(4, kDims, mxDOUBLE_CLASS, mxCOMPLEX);
        copy_complex(plhs[1], K_real, K_imag);
    }

    if (nlhs >= 3) {
        plhs[2] = mxCreateDoubleScalar(static_cast<double>(nimg));
    }
}
