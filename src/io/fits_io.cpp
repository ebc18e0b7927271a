#include "shoreline/io/fits_io.hpp"
#include "shoreline/core/errors.hpp"
#include "shoreline/core/utils.hpp"

#include <fitsio.h>
#include <limits>
#include <vector>

namespace shoreline::io {

namespace {

// Header values read back from cfitsio lose the int/float distinction for
// whole-number doubles, so numeric lookups fall back across both maps.
std::optional<double> numeric_value(const FitsHeader& header, const std::string& key) {
    if (auto v = header.get_double(key)) return v;
    if (auto v = header.get_int(key)) return static_cast<double>(*v);
    return std::nullopt;
}

void write_header_keys(fitsfile* fptr, const FitsHeader& header, int& status) {
    for (const auto& [key, value] : header.string_values) {
        if (key.size() <= 8) {
            fits_update_key(fptr, TSTRING, key.c_str(),
                            const_cast<char*>(value.c_str()), nullptr, &status);
        }
    }
    for (const auto& [key, value] : header.numeric_values) {
        if (key.size() <= 8) {
            double val = value;
            fits_update_key(fptr, TDOUBLE, key.c_str(), &val, nullptr, &status);
        }
    }
    for (const auto& [key, value] : header.int_values) {
        if (key.size() <= 8) {
            int val = value;
            fits_update_key(fptr, TINT, key.c_str(), &val, nullptr, &status);
        }
    }
}

fitsfile* create_image(const fs::path& path, int bitpix, long cols, long rows) {
    fitsfile* fptr = nullptr;
    int status = 0;
    std::string filepath = "!" + path.string();
    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }
    long naxes[2] = {cols, rows};
    fits_create_img(fptr, bitpix, 2, naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot create FITS image: " + path.string());
    }
    return fptr;
}

} // namespace

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

bool is_fits_image_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts";
}

std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;

    fits_get_img_param(fptr, 3, &bitpix, &naxis, naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot read FITS image parameters: " + path.string());
    }

    if (naxis != 2) {
        fits_close_file(fptr, &status);
        throw FitsError("Raster layer must be a single 2-D band: " + path.string());
    }

    long width = naxes[0];
    long height = naxes[1];
    long npixels = width * height;

    // Undefined pixels (BLANK or NaN) come back as NaN
    std::vector<float> buffer(npixels);
    long fpixel[2] = {1, 1};
    float nulval = std::numeric_limits<float>::quiet_NaN();
    int anynul = 0;

    fits_read_pix(fptr, TFLOAT, fpixel, npixels, &nulval, buffer.data(), &anynul, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot read FITS pixel data: " + path.string());
    }

    FitsHeader header;

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
            case 'I':
                try {
                    header.set(key, std::stoi(val_str));
                } catch (const std::exception&) {
                    header.set(key, val_str);
                }
                break;
            case 'F':
                try {
                    header.set(key, std::stod(val_str));
                } catch (const std::exception&) {
                    header.set(key, val_str);
                }
                break;
            default:
                header.set(key, val_str);
                break;
        }
    }

    fits_close_file(fptr, &status);

    Matrix2Df data(height, width);
    for (long y = 0; y < height; ++y) {
        for (long x = 0; x < width; ++x) {
            data(y, x) = buffer[y * width + x];
        }
    }

    return {data, header};
}

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header) {
    int status = 0;
    fitsfile* fptr = create_image(path, FLOAT_IMG, data.cols(), data.rows());

    write_header_keys(fptr, header, status);

    std::vector<float> buffer(data.data(), data.data() + data.size());
    long fpixel[2] = {1, 1};
    float nulval = std::numeric_limits<float>::quiet_NaN();
    fits_write_pixnull(fptr, TFLOAT, fpixel, data.size(), buffer.data(), &nulval, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot write FITS pixel data: " + path.string());
    }

    fits_close_file(fptr, &status);
}

void write_fits_byte(const fs::path& path, const Matrix2Db& data, const FitsHeader& header) {
    int status = 0;
    fitsfile* fptr = create_image(path, BYTE_IMG, data.cols(), data.rows());

    write_header_keys(fptr, header, status);

    std::vector<unsigned char> buffer(data.data(), data.data() + data.size());
    long fpixel[2] = {1, 1};
    fits_write_pix(fptr, TBYTE, fpixel, data.size(), buffer.data(), &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot write FITS pixel data: " + path.string());
    }

    fits_close_file(fptr, &status);
}

std::tuple<int, int, int> get_fits_dimensions(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;

    fits_get_img_param(fptr, 3, &bitpix, &naxis, naxes, &status);
    int close_status = 0;
    fits_close_file(fptr, &close_status);

    if (status) {
        throw FitsError("Cannot read FITS dimensions: " + path.string());
    }

    return {static_cast<int>(naxes[0]), static_cast<int>(naxes[1]), naxis};
}

GeoTransform read_transform(const FitsHeader& header) {
    static const char* keys[6] = {"GT_A", "GT_B", "GT_C", "GT_D", "GT_E", "GT_F"};
    double values[6];
    for (int i = 0; i < 6; ++i) {
        auto v = numeric_value(header, keys[i]);
        if (!v) {
            throw FitsError(std::string("Missing transform key ") + keys[i]);
        }
        values[i] = *v;
    }
    GeoTransform t;
    t.a = values[0];
    t.b = values[1];
    t.c = values[2];
    t.d = values[3];
    t.e = values[4];
    t.f = values[5];
    return t;
}

void write_transform(FitsHeader& header, const GeoTransform& transform) {
    header.set("GT_A", transform.a);
    header.set("GT_B", transform.b);
    header.set("GT_C", transform.c);
    header.set("GT_D", transform.d);
    header.set("GT_E", transform.e);
    header.set("GT_F", transform.f);
}

std::string read_crs(const FitsHeader& header) {
    return header.get_string("CRS").value_or("");
}

} // namespace shoreline::io
