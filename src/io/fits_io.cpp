#include "wfss_contam/io/fits_io.hpp"
#include "wfss_contam/core/errors.hpp"

#include <fitsio.h>
#include <stdexcept>
#include <vector>

namespace wfss_contam::io {

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    auto it = string_values.find(key);
    if (it != string_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> FitsHeader::get_double(const std::string& key) const {
    auto it = numeric_values.find(key);
    if (it != numeric_values.end()) {
        return it->second;
    }
    auto iit = int_values.find(key);
    if (iit != int_values.end()) {
        return static_cast<double>(iit->second);
    }
    return std::nullopt;
}

std::optional<int> FitsHeader::get_int(const std::string& key) const {
    auto it = int_values.find(key);
    if (it != int_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void FitsHeader::set(const std::string& key, const std::string& value) {
    string_values[key] = value;
}

void FitsHeader::set(const std::string& key, double value) {
    numeric_values[key] = value;
}

void FitsHeader::set(const std::string& key, int value) {
    int_values[key] = value;
}

void FitsHeader::set(const std::string& key, bool value) {
    bool_values[key] = value;
}

namespace {

fitsfile* open_readonly(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;
    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }
    return fptr;
}

[[noreturn]] void close_and_throw(fitsfile* fptr, const std::string& message) {
    int status = 0;
    fits_close_file(fptr, &status);
    throw FitsError(message);
}

// Keywords cfitsio maintains itself; never copied between HDUs
bool is_structural_key(const std::string& key) {
    return key == "SIMPLE" || key == "BITPIX" || key.rfind("NAXIS", 0) == 0 ||
           key == "EXTEND" || key == "XTENSION" || key == "PCOUNT" ||
           key == "GCOUNT" || key == "BSCALE" || key == "BZERO" || key == "END";
}

// Header of the current HDU
FitsHeader read_header(fitsfile* fptr) {
    FitsHeader header;
    int status = 0;

    char card[FLEN_CARD];
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);

    for (int i = 1; i <= nkeys; ++i) {
        fits_read_record(fptr, i, card, &status);
        if (status) {
            status = 0;
            continue;
        }

        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        int keylen = 0;

        fits_get_keyname(card, keyname, &keylen, &status);
        if (status) {
            status = 0;
            continue;
        }

        std::string key(keyname);
        if (key.empty() || key == "COMMENT" || key == "HISTORY" || key == "END") {
            continue;
        }

        fits_parse_value(card, value, comment, &status);
        if (status) {
            status = 0;
            continue;
        }

        char dtype;
        fits_get_keytype(value, &dtype, &status);
        if (status) {
            status = 0;
            continue;
        }

        std::string val_str(value);
        val_str.erase(0, val_str.find_first_not_of(" '"));
        val_str.erase(val_str.find_last_not_of(" '") + 1);

        switch (dtype) {
            case 'C':
                header.set(key, val_str);
                break;
            case 'L':
                header.set(key, val_str == "T" || val_str == "1");
                break;
            case 'I':
                try {
                    header.set(key, std::stoi(val_str));
                } catch (const std::logic_error&) {
                    header.set(key, val_str);
                }
                break;
            case 'F':
                try {
                    header.set(key, std::stod(val_str));
                } catch (const std::logic_error&) {
                    header.set(key, val_str);
                }
                break;
            default:
                header.set(key, val_str);
                break;
        }
    }

    return header;
}

void write_header(fitsfile* fptr, const FitsHeader& header, int& status) {
    for (const auto& [key, value] : header.string_values) {
        if (key.size() <= 8 && !is_structural_key(key)) {
            fits_update_key(fptr, TSTRING, key.c_str(),
                           const_cast<char*>(value.c_str()), nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.numeric_values) {
        if (key.size() <= 8 && !is_structural_key(key)) {
            double val = value;
            fits_update_key(fptr, TDOUBLE, key.c_str(), &val, nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.int_values) {
        if (key.size() <= 8 && !is_structural_key(key)) {
            int val = value;
            fits_update_key(fptr, TINT, key.c_str(), &val, nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.bool_values) {
        if (key.size() <= 8 && !is_structural_key(key)) {
            int val = value ? 1 : 0;
            fits_update_key(fptr, TLOGICAL, key.c_str(), &val, nullptr, &status);
        }
    }
}

// Moves to the first HDU holding a 2D image; returns (width, height)
std::pair<long, long> seek_image_hdu(fitsfile* fptr, const fs::path& path) {
    int status = 0;
    int nhdus = 0;
    fits_get_num_hdus(fptr, &nhdus, &status);
    if (status) {
        close_and_throw(fptr, "Cannot count HDUs: " + path.string());
    }

    for (int hdu = 1; hdu <= nhdus; ++hdu) {
        int hdutype = 0;
        fits_movabs_hdu(fptr, hdu, &hdutype, &status);
        if (status) {
            close_and_throw(fptr, "Cannot move to HDU " + std::to_string(hdu) +
                                      ": " + path.string());
        }
        if (hdutype != IMAGE_HDU) continue;

        int naxis = 0;
        long naxes[3] = {0, 0, 0};
        int bitpix = 0;
        fits_get_img_param(fptr, 3, &bitpix, &naxis, naxes, &status);
        if (status) {
            close_and_throw(fptr, "Cannot read FITS image parameters: " + path.string());
        }
        if (naxis >= 2 && naxes[0] > 0 && naxes[1] > 0) {
            return {naxes[0], naxes[1]};
        }
    }

    close_and_throw(fptr, "FITS file has no 2D image: " + path.string());
}

template <typename Matrix, typename Scalar>
Matrix read_pixels(fitsfile* fptr, int datatype, long width, long height,
                   const fs::path& path) {
    int status = 0;
    const long npixels = width * height;
    std::vector<Scalar> buffer(static_cast<size_t>(npixels));
    long fpixel[3] = {1, 1, 1};

    fits_read_pix(fptr, datatype, fpixel, npixels, nullptr, buffer.data(), nullptr, &status);
    if (status) {
        close_and_throw(fptr, "Cannot read FITS pixel data: " + path.string());
    }

    Matrix data(height, width);
    for (long y = 0; y < height; ++y) {
        for (long x = 0; x < width; ++x) {
            data(y, x) = buffer[static_cast<size_t>(y * width + x)];
        }
    }
    return data;
}

void write_pixels(fitsfile* fptr, const Matrix2Df& data, const fs::path& path) {
    int status = 0;
    std::vector<float> buffer(static_cast<size_t>(data.size()));
    for (long y = 0; y < data.rows(); ++y) {
        for (long x = 0; x < data.cols(); ++x) {
            buffer[static_cast<size_t>(y * data.cols() + x)] = data(y, x);
        }
    }

    long fpixel[2] = {1, 1};
    fits_write_pix(fptr, TFLOAT, fpixel, data.size(), buffer.data(), &status);
    if (status) {
        close_and_throw(fptr, "Cannot write FITS pixel data: " + path.string());
    }
}

fitsfile* create_file(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;
    std::string filepath = "!" + path.string();
    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }
    return fptr;
}

} // namespace

std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path) {
    fitsfile* fptr = open_readonly(path);
    const auto [width, height] = seek_image_hdu(fptr, path);

    Matrix2Df data = read_pixels<Matrix2Df, float>(fptr, TFLOAT, width, height, path);
    FitsHeader header = read_header(fptr);

    int status = 0;
    fits_close_file(fptr, &status);
    return {data, header};
}

Matrix2Di read_fits_int(const fs::path& path) {
    fitsfile* fptr = open_readonly(path);
    const auto [width, height] = seek_image_hdu(fptr, path);

    Matrix2Di data = read_pixels<Matrix2Di, int>(fptr, TINT, width, height, path);

    int status = 0;
    fits_close_file(fptr, &status);
    return data;
}

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header) {
    fitsfile* fptr = create_file(path);
    int status = 0;

    long naxes[2] = {static_cast<long>(data.cols()), static_cast<long>(data.rows())};
    fits_create_img(fptr, FLOAT_IMG, 2, naxes, &status);
    if (status) {
        close_and_throw(fptr, "Cannot create FITS image: " + path.string());
    }

    write_header(fptr, header, status);
    if (status) {
        close_and_throw(fptr, "Cannot write FITS header: " + path.string());
    }

    write_pixels(fptr, data, path);
    fits_close_file(fptr, &status);
}

std::pair<std::vector<contam::SlitCutout>, FitsHeader>
read_slits(const fs::path& path, std::shared_ptr<const dispersion::GrismTransform> wcs) {
    fitsfile* fptr = open_readonly(path);
    int status = 0;

    FitsHeader primary = read_header(fptr);

    int nhdus = 0;
    fits_get_num_hdus(fptr, &nhdus, &status);
    if (status) {
        close_and_throw(fptr, "Cannot count HDUs: " + path.string());
    }

    std::vector<contam::SlitCutout> slits;
    for (int hdu = 2; hdu <= nhdus; ++hdu) {
        int hdutype = 0;
        fits_movabs_hdu(fptr, hdu, &hdutype, &status);
        if (status) {
            close_and_throw(fptr, "Cannot move to HDU " + std::to_string(hdu) +
                                      ": " + path.string());
        }
        if (hdutype != IMAGE_HDU) continue;

        int naxis = 0;
        long naxes[2] = {0, 0};
        int bitpix = 0;
        fits_get_img_param(fptr, 2, &bitpix, &naxis, naxes, &status);
        if (status || naxis != 2) {
            close_and_throw(fptr, "Slit HDU " + std::to_string(hdu) +
                                      " is not a 2D image: " + path.string());
        }

        const FitsHeader h = read_header(fptr);
        auto source_id = h.get_int("SOURCEID");
        if (!source_id) {
            close_and_throw(fptr, "Slit HDU " + std::to_string(hdu) +
                                      " has no SOURCEID: " + path.string());
        }

        auto xstart = h.get_int("SLTSTRT1");
        auto ystart = h.get_int("SLTSTRT2");
        if (!xstart || !ystart) {
            close_and_throw(fptr, "Slit HDU " + std::to_string(hdu) +
                                      " has no SLTSTRT1/SLTSTRT2: " + path.string());
        }

        contam::SlitWindow window;
        window.xstart = *xstart - 1;
        window.ystart = *ystart - 1;
        window.xsize = static_cast<int>(naxes[0]);
        window.ysize = static_cast<int>(naxes[1]);

        contam::SlitMeta meta;
        meta.name = h.get_string("SLTNAME").value_or("slit" + std::to_string(hdu - 1));
        meta.source_id = *source_id;
        meta.source_type = h.get_string("SRCTYPE").value_or("UNKNOWN");
        meta.source_xpos = h.get_double("SRCXPOS").value_or(0.0);
        meta.source_ypos = h.get_double("SRCYPOS").value_or(0.0);
        meta.spectral_order = h.get_int("SPORDER").value_or(1);
        meta.dispersion_direction = h.get_int("DISPAXIS").value_or(1);
        meta.wcs = wcs;

        Matrix2Df data = read_pixels<Matrix2Df, float>(fptr, TFLOAT, naxes[0], naxes[1], path);
        try {
            slits.emplace_back(window, std::move(data), std::move(meta));
        } catch (const WfssContamError& e) {
            close_and_throw(fptr, "Slit HDU " + std::to_string(hdu) + " of " +
                                      path.string() + ": " + e.what());
        }
    }

    fits_close_file(fptr, &status);
    return {std::move(slits), primary};
}

void write_slits(const fs::path& path, const std::vector<contam::SlitCutout>& slits,
                 const FitsHeader& primary) {
    fitsfile* fptr = create_file(path);
    int status = 0;

    fits_create_img(fptr, FLOAT_IMG, 0, nullptr, &status);
    write_header(fptr, primary, status);
    if (status) {
        close_and_throw(fptr, "Cannot write primary HDU: " + path.string());
    }

    for (const auto& slit : slits) {
        const contam::SlitWindow& w = slit.window();
        const contam::SlitMeta& m = slit.meta();

        long naxes[2] = {static_cast<long>(w.xsize), static_cast<long>(w.ysize)};
        fits_create_img(fptr, FLOAT_IMG, 2, naxes, &status);
        if (status) {
            close_and_throw(fptr, "Cannot create slit HDU '" + m.name + "': " + path.string());
        }

        FitsHeader h;
        h.set("EXTNAME", std::string("SCI"));
        h.set("SLTNAME", m.name);
        h.set("SOURCEID", m.source_id);
        h.set("SRCTYPE", m.source_type);
        h.set("SRCXPOS", m.source_xpos);
        h.set("SRCYPOS", m.source_ypos);
        h.set("SLTSTRT1", w.xstart + 1);
        h.set("SLTSTRT2", w.ystart + 1);
        h.set("SPORDER", m.spectral_order);
        h.set("DISPAXIS", m.dispersion_direction);
        write_header(fptr, h, status);
        if (status) {
            close_and_throw(fptr, "Cannot write slit header '" + m.name + "': " + path.string());
        }

        write_pixels(fptr, slit.data(), path);
    }

    fits_close_file(fptr, &status);
}

} // namespace wfss_contam::io
