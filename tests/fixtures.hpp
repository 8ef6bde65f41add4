#pragma once
#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <initializer_list>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <labelforge/image.hpp>
#include <labelforge/label_map.hpp>
#include <labelforge/polygon.hpp>
#include <labelforge/segmenter.hpp>

namespace fs = std::filesystem;

// Unique scratch directory, removed on scope exit.
struct TempDir {
    fs::path path;
    TempDir() {
        static std::atomic<int> counter{0};
        path = fs::temp_directory_path() /
               ("labelforge_test_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~TempDir() { std::error_code ec; fs::remove_all(path, ec); }
    std::string str(const std::string& rel = "") const { return (path / rel).string(); }
};

inline lf::LabelMap label_rows(std::initializer_list<std::initializer_list<uint32_t>> rows) {
    const int h = int(rows.size());
    const int w = h ? int(rows.begin()->size()) : 0;
    lf::LabelMap m(w, h);
    int y = 0;
    for (auto& r : rows) {
        if (int(r.size()) != w) throw std::invalid_argument("ragged label rows");
        int x = 0;
        for (auto v : r) m.at(x++, y) = v;
        ++y;
    }
    return m;
}

inline lf::RgbImage solid_image(int w, int h, unsigned char v = 100) {
    lf::RgbImage im(w, h);
    std::fill(im.rgb.begin(), im.rgb.end(), v);
    return im;
}

// Returns a fixed label map per file name (or one for every image).
struct FakeSegmenter : lf::Segmenter {
    std::map<std::string, lf::LabelMap> by_name;
    lf::LabelMap fallback;
    std::vector<std::string> seen;
    std::string fail_on;

    lf::LabelMap infer(const lf::ImageSample& s) override {
        seen.push_back(s.file_name);
        if (s.file_name == fail_on) throw std::runtime_error("model exploded");
        auto it = by_name.find(s.file_name);
        return it != by_name.end() ? it->second : fallback;
    }
};

// polygons_per_hit unit squares for every non-empty mask. The pipeline
// traces categories in id order, so call n of an image is category n % 19.
struct FakeTracer : lf::Tracer {
    int fail_call = -1;
    int polygons_per_hit = 1;
    int calls = 0;

    std::optional<std::vector<lf::Polygon>> trace(const lf::BinaryMask& m, lf::ImageSize) override {
        const int call = calls++;
        if (call == fail_call) throw std::runtime_error("tracer gave up");
        if (m.empty()) return std::nullopt;
        std::vector<lf::Polygon> out;
        for (int k=0; k<polygons_per_hit; ++k)
            out.push_back(lf::Polygon{ lf::NumericArray({4, 2}, std::vector<int32_t>{k,0, k,1, k+1,1, k+1,0}) });
        return out;
    }
};
