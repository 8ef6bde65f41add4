#include "labelforge/image_io.hpp"

#include <png.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <vector>

namespace lf {

std::string extension_of(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return "";
    std::string e = path.substr(dot);
    std::transform(e.begin(), e.end(), e.begin(), [](unsigned char c){ return char(std::tolower(c)); });
    return e;
}

namespace {

// ---------------------- PNG (libpng) ----------------------
bool load_png_rgb(const std::string& filename, RgbImage& out) {
    FILE* fp = fopen(filename.c_str(), "rb");
    if (!fp) return false;
    png_structp png_ptr = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png_ptr) { fclose(fp); return false; }
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) { png_destroy_read_struct(&png_ptr, nullptr, nullptr); fclose(fp); return false; }

    RgbImage img;
    std::vector<png_bytep> rows;
    if (setjmp(png_jmpbuf(png_ptr))) { png_destroy_read_struct(&png_ptr, &info_ptr, nullptr); fclose(fp); return false; }
    png_init_io(png_ptr, fp);
    png_read_info(png_ptr, info_ptr);
    int width  = int(png_get_image_width(png_ptr, info_ptr));
    int height = int(png_get_image_height(png_ptr, info_ptr));
    png_byte color_type = png_get_color_type(png_ptr, info_ptr);
    png_byte bit_depth  = png_get_bit_depth(png_ptr, info_ptr);
    // conversions to 8-bit RGB
    if (bit_depth == 16) png_set_strip_16(png_ptr);
    if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(png_ptr);
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(png_ptr);
    if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) png_set_gray_to_rgb(png_ptr);
    if (color_type & PNG_COLOR_MASK_ALPHA) png_set_strip_alpha(png_ptr);
    png_read_update_info(png_ptr, info_ptr);
    if (png_get_rowbytes(png_ptr, info_ptr) != size_t(width) * 3) {
        png_destroy_read_struct(&png_ptr, &info_ptr, nullptr); fclose(fp); return false;
    }

    img = RgbImage(width, height);
    rows.resize(size_t(height));
    for (int y=0; y<height; ++y) rows[y] = img.px(0, y);
    png_read_image(png_ptr, rows.data());
    png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
    fclose(fp);
    out = std::move(img);
    return true;
}

bool read_png_size(const std::string& filename, ImageSize& size) {
    FILE* fp = fopen(filename.c_str(), "rb");
    if (!fp) return false;
    png_structp png_ptr = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png_ptr) { fclose(fp); return false; }
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) { png_destroy_read_struct(&png_ptr, nullptr, nullptr); fclose(fp); return false; }

    if (setjmp(png_jmpbuf(png_ptr))) { png_destroy_read_struct(&png_ptr, &info_ptr, nullptr); fclose(fp); return false; }
    png_init_io(png_ptr, fp);
    png_read_info(png_ptr, info_ptr);
    size.width  = int(png_get_image_width(png_ptr, info_ptr));
    size.height = int(png_get_image_height(png_ptr, info_ptr));
    png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
    fclose(fp);
    return size.width > 0 && size.height > 0;
}

bool save_png_rgb(const std::string& filename, const RgbImage& img) {
    FILE* fp = fopen(filename.c_str(), "wb");
    if (!fp) return false;
    png_structp png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png_ptr) { fclose(fp); return false; }
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) { png_destroy_write_struct(&png_ptr, nullptr); fclose(fp); return false; }

    std::vector<png_bytep> rows(size_t(img.height));
    if (setjmp(png_jmpbuf(png_ptr))) { png_destroy_write_struct(&png_ptr, &info_ptr); fclose(fp); return false; }
    png_init_io(png_ptr, fp);
    png_set_IHDR(png_ptr, info_ptr, png_uint_32(img.width), png_uint_32(img.height), 8, PNG_COLOR_TYPE_RGB,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png_ptr, info_ptr);
    for (int y=0; y<img.height; ++y) rows[y] = const_cast<png_bytep>(img.px(0, y));
    png_write_image(png_ptr, rows.data());
    png_write_end(png_ptr, nullptr);
    png_destroy_write_struct(&png_ptr, &info_ptr);
    return fclose(fp) == 0;
}

// ---------------------- PPM ----------------------
bool read_ppm_token(std::istream& f, int& v) {
    f >> std::ws;
    while (f.peek() == '#') { std::string line; std::getline(f, line); f >> std::ws; }
    return bool(f >> v);
}

bool read_ppm_header(std::istream& f, int& w, int& h) {
    std::string magic; f >> magic;
    if (magic != "P6") return false;
    int maxval=0;
    if (!read_ppm_token(f, w) || !read_ppm_token(f, h) || !read_ppm_token(f, maxval)) return false;
    if (w <= 0 || h <= 0 || maxval != 255) return false;
    f.get(); // single whitespace before the raster
    return true;
}

bool load_ppm(const std::string& filename, RgbImage& out) {
    std::ifstream f(filename, std::ios::binary);
    if (!f) return false;
    int w=0, h=0;
    if (!read_ppm_header(f, w, h)) return false;

    RgbImage img(w, h);
    if (!f.read(reinterpret_cast<char*>(img.rgb.data()), std::streamsize(img.rgb.size()))) return false;
    out = std::move(img);
    return true;
}

bool save_ppm(const std::string& filename, const RgbImage& img) {
    std::ofstream file(filename, std::ios::binary);
    if (!file) return false;
    file << "P6\n" << img.width << " " << img.height << "\n255\n";
    file.write(reinterpret_cast<const char*>(img.rgb.data()), std::streamsize(img.rgb.size()));
    return bool(file);
}

} // namespace

bool load_image(const std::string& path, RgbImage& out) {
    const std::string ext = extension_of(path);
    if (ext == ".png") return load_png_rgb(path, out);
    if (ext == ".ppm") return load_ppm(path, out);
    return false;
}

bool read_image_size(const std::string& path, ImageSize& size) {
    const std::string ext = extension_of(path);
    if (ext == ".png") return read_png_size(path, size);
    if (ext == ".ppm") {
        std::ifstream f(path, std::ios::binary);
        if (!f || !read_ppm_header(f, size.width, size.height)) return false;
        return true;
    }
    return false;
}

bool save_image(const std::string& path, const RgbImage& img) {
    if (img.width <= 0 || img.height <= 0 || img.rgb.size() != size_t(img.width)*img.height*3) return false;
    const std::string ext = extension_of(path);
    if (ext == ".png") return save_png_rgb(path, img);
    if (ext == ".ppm") return save_ppm(path, img);
    return false;
}

bool load_label_png(const std::string& path, LabelMap& out) {
    FILE* fp = fopen(path.c_str(), "rb");
    if (!fp) return false;
    png_structp png_ptr = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png_ptr) { fclose(fp); return false; }
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) { png_destroy_read_struct(&png_ptr, nullptr, nullptr); fclose(fp); return false; }

    std::vector<unsigned char> raw;
    std::vector<png_bytep> rows;
    if (setjmp(png_jmpbuf(png_ptr))) { png_destroy_read_struct(&png_ptr, &info_ptr, nullptr); fclose(fp); return false; }
    png_init_io(png_ptr, fp);
    png_read_info(png_ptr, info_ptr);
    int width  = int(png_get_image_width(png_ptr, info_ptr));
    int height = int(png_get_image_height(png_ptr, info_ptr));
    png_byte color_type = png_get_color_type(png_ptr, info_ptr);
    png_byte bit_depth  = png_get_bit_depth(png_ptr, info_ptr);
    if (color_type != PNG_COLOR_TYPE_GRAY && color_type != PNG_COLOR_TYPE_PALETTE) {
        png_destroy_read_struct(&png_ptr, &info_ptr, nullptr); fclose(fp); return false;
    }
    // palette indices stay indices; low bit depths unpack to one byte per pixel
    if (bit_depth < 8) png_set_packing(png_ptr);
    if (bit_depth == 16) png_set_strip_16(png_ptr);
    png_read_update_info(png_ptr, info_ptr);
    if (png_get_rowbytes(png_ptr, info_ptr) != size_t(width)) {
        png_destroy_read_struct(&png_ptr, &info_ptr, nullptr); fclose(fp); return false;
    }

    raw.resize(size_t(width)*height);
    rows.resize(size_t(height));
    for (int y=0; y<height; ++y) rows[y] = raw.data() + size_t(y)*width;
    png_read_image(png_ptr, rows.data());
    png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
    fclose(fp);

    LabelMap m(width, height);
    for (size_t i=0; i<raw.size(); ++i) m.labels[i] = raw[i];
    out = std::move(m);
    return true;
}

bool save_palette_png(const std::string& path, const LabelMap& labels, const std::vector<Rgb>& palette) {
    if (labels.width <= 0 || labels.height <= 0 || labels.labels.size() != size_t(labels.width)*labels.height) return false;
    if (palette.empty() || palette.size() > 256) return false;

    std::vector<png_color> pal(palette.size());
    for (size_t i=0; i<palette.size(); ++i) { pal[i].red = palette[i][0]; pal[i].green = palette[i][1]; pal[i].blue = palette[i][2]; }
    std::vector<unsigned char> idx(labels.labels.size());
    const uint32_t top = uint32_t(palette.size() - 1);
    for (size_t i=0; i<idx.size(); ++i) idx[i] = (unsigned char)(labels.labels[i] > top ? top : labels.labels[i]);

    FILE* fp = fopen(path.c_str(), "wb");
    if (!fp) return false;
    png_structp png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png_ptr) { fclose(fp); return false; }
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) { png_destroy_write_struct(&png_ptr, nullptr); fclose(fp); return false; }

    std::vector<png_bytep> rows(size_t(labels.height));
    if (setjmp(png_jmpbuf(png_ptr))) { png_destroy_write_struct(&png_ptr, &info_ptr); fclose(fp); return false; }
    png_init_io(png_ptr, fp);
    png_set_IHDR(png_ptr, info_ptr, png_uint_32(labels.width), png_uint_32(labels.height), 8, PNG_COLOR_TYPE_PALETTE,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_set_PLTE(png_ptr, info_ptr, pal.data(), int(pal.size()));
    png_write_info(png_ptr, info_ptr);
    for (int y=0; y<labels.height; ++y) rows[y] = idx.data() + size_t(y)*labels.width;
    png_write_image(png_ptr, rows.data());
    png_write_end(png_ptr, nullptr);
    png_destroy_write_struct(&png_ptr, &info_ptr);
    return fclose(fp) == 0;
}

} // namespace lf
