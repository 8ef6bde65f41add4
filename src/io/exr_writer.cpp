// Force TinyEXR to use system zlib (not miniz)
#define TINYEXR_USE_MINIZ 0
#define TINYEXR_USE_ZLIB  1

#define TINYEXR_IMPLEMENTATION
#include <zlib.h>        // ensure zlib types like uLong, Bytef are visible
#include <tinyexr.h>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <vector>
#include "labelforge/exr_writer.hpp"

namespace lf {

bool write_label_exr(const std::string& path, const LabelMap& labels, const char* channel){
    const int w = labels.width, h = labels.height;
    if (w <= 0 || h <= 0 || labels.labels.size() != size_t(w)*h) return false;

    std::vector<float> Y(labels.labels.size());
    for (size_t i=0;i<Y.size();++i) Y[i] = float(labels.labels[i]);

    EXRHeader header; InitEXRHeader(&header);
    EXRImage image;  InitEXRImage(&image);
    image.num_channels = 1;

    float* ptr = Y.data();
    image.images = reinterpret_cast<unsigned char**>(&ptr);
    image.width = w; image.height = h;

    header.num_channels = 1;
    header.channels = (EXRChannelInfo*)malloc(sizeof(EXRChannelInfo));
    std::strncpy(header.channels[0].name, channel, 255); header.channels[0].name[255]='\0';

    header.pixel_types = (int*)malloc(sizeof(int));
    header.requested_pixel_types = (int*)malloc(sizeof(int));
    header.pixel_types[0]=TINYEXR_PIXELTYPE_FLOAT;
    header.requested_pixel_types[0]=TINYEXR_PIXELTYPE_FLOAT;
    header.compression_type = TINYEXR_COMPRESSIONTYPE_ZIP;

    const char* err = nullptr;
    int ret = SaveEXRImageToFile(&image, &header, path.c_str(), &err);
    free(header.channels); free(header.pixel_types); free(header.requested_pixel_types);
    if (ret != TINYEXR_SUCCESS){
        if (err){ std::cerr << "Warning: " << path << ": " << err << "\n"; FreeEXRErrorMessage(err); }
        return false;
    }
    return true;
}

} // namespace lf
