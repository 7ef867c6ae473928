#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <string>

namespace wfss_contam {

namespace fs = std::filesystem;

// Matrix types (row-major, rows = detector y)
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Di = Eigen::Matrix<int32_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

inline std::string normalize_token(const std::string& s) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(),
               std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(),
               norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return norm;
}

// Fraction of the available cores used for dispersion
enum class MaxCores {
    NONE,
    QUARTER,
    HALF,
    ALL,
    UNKNOWN
};

inline std::string max_cores_to_string(MaxCores mc) {
    switch (mc) {
        case MaxCores::NONE: return "none";
        case MaxCores::QUARTER: return "quarter";
        case MaxCores::HALF: return "half";
        case MaxCores::ALL: return "all";
        default: return "unknown";
    }
}

inline MaxCores string_to_max_cores(const std::string& s) {
    const std::string norm = normalize_token(s);
    if (norm == "none") return MaxCores::NONE;
    if (norm == "quarter") return MaxCores::QUARTER;
    if (norm == "half") return MaxCores::HALF;
    if (norm == "all") return MaxCores::ALL;
    return MaxCores::UNKNOWN;
}

// Where a source template is placed on the detector frame
enum class PlacementMode {
    SEGMENTATION,  // bounding-box origin of the segment
    SLIT,          // xstart/ystart of the source's slit
    UNKNOWN
};

inline std::string placement_mode_to_string(PlacementMode mode) {
    switch (mode) {
        case PlacementMode::SEGMENTATION: return "segmentation";
        case PlacementMode::SLIT: return "slit";
        default: return "unknown";
    }
}

inline PlacementMode string_to_placement_mode(const std::string& s) {
    const std::string norm = normalize_token(s);
    if (norm == "segmentation") return PlacementMode::SEGMENTATION;
    if (norm == "slit") return PlacementMode::SLIT;
    return PlacementMode::UNKNOWN;
}

// Step completion flag propagated to the caller
enum class CalStepStatus {
    COMPLETE,
    SKIPPED
};

inline std::string cal_step_status_to_string(CalStepStatus status) {
    switch (status) {
        case CalStepStatus::COMPLETE: return "COMPLETE";
        case CalStepStatus::SKIPPED: return "SKIPPED";
        default: return "UNKNOWN";
    }
}

// Runner phase enumeration
enum class Phase {
    LOAD_INPUT = 0,
    SETUP_ORDERS = 1,
    CONTAMINATION = 2,
    WRITE_OUTPUT = 3
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::LOAD_INPUT: return "LOAD_INPUT";
        case Phase::SETUP_ORDERS: return "SETUP_ORDERS";
        case Phase::CONTAMINATION: return "CONTAMINATION";
        case Phase::WRITE_OUTPUT: return "WRITE_OUTPUT";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace wfss_contam
