#pragma once

#include "wfss_contam/contam/slit.hpp"
#include "wfss_contam/core/types.hpp"
#include "wfss_contam/dispersion/grism_transform.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace wfss_contam::io {

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;
    std::map<std::string, bool> bool_values;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
    void set(const std::string& key, bool value);
};

// First 2D image HDU of the file (primary or extension)
std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path);
Matrix2Di read_fits_int(const fs::path& path);

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header);

// Multi-slit file: empty primary HDU followed by one IMAGE extension per
// slit. Slit keywords: SLTNAME, SOURCEID, SRCTYPE, SRCXPOS, SRCYPOS,
// SLTSTRT1, SLTSTRT2 (1-based), SPORDER, DISPAXIS. Every slit read gets
// `wcs` as its transform.
std::pair<std::vector<contam::SlitCutout>, FitsHeader>
read_slits(const fs::path& path, std::shared_ptr<const dispersion::GrismTransform> wcs);

void write_slits(const fs::path& path, const std::vector<contam::SlitCutout>& slits,
                 const FitsHeader& primary);

} // namespace wfss_contam::io
