// LabelForge: CLI wrapper: segmentation predictions -> COCO polygons
// Outputs: <save_dir>/added_prediction/*, pseudo_color_prediction/*.png, annotations.json
#include <string>
#include <vector>
#include <iostream>
#include <cstdlib>
#include <exception>

#include "labelforge/artifact_writer.hpp"
#include "labelforge/boundary_tracer.hpp"
#include "labelforge/categories.hpp"
#include "labelforge/color_map.hpp"
#include "labelforge/errors.hpp"
#include "labelforge/image_list.hpp"
#include "labelforge/pipeline.hpp"
#include "labelforge/segmenter.hpp"
#include "labelforge/workload.hpp"

// ---------------------------- CLI Options ----------------------------
struct Opts {
    // IO
    std::string image_path;
    std::string save_dir = "./output/result";
    std::string label_dir;

    // Rendering
    std::vector<int> custom_color;
    bool category_colors = false;
    double weight = 0.6;
    bool save_label_map = false;

    // Ranks (-1: take from the environment)
    int rank = -1, nranks = -1;
};

static void print_usage() {
    std::cout <<
R"(LabelForge: export segmentation predictions as COCO polygon annotations

Usage:
  labelforge --image_path PATH --label_dir DIR [--save_dir DIR]
             [--custom_color R G B [R G B ...]] [--category_colors]
             [--weight W] [--save_label_map]
             [--rank K] [--nranks M] [--help]

  --image_path  an image, a list file, or a directory of images
  --label_dir   predicted label maps, <label_dir>/<relative name>.png
  --save_dir    output root (default ./output/result)

Rank and world size default to PADDLE_TRAINER_ID / PADDLE_TRAINERS_NUM.

Examples:
  labelforge --image_path data/leftImg8bit/val --label_dir preds --save_dir out
  labelforge --image_path val_list.txt --label_dir preds --category_colors --rank 1 --nranks 4
)";
}

static int env_int(const char* name, int fallback) {
    const char* v = std::getenv(name);
    if (!v || !*v) return fallback;
    try { return std::stoi(v); }
    catch (const std::exception&) { std::cerr << "Bad " << name << "=" << v << "\n"; std::exit(2); }
}

static Opts parse(int argc, char** argv) {
    Opts o;
    auto need = [&](int &i){ if(i+1>=argc){ print_usage(); std::exit(2);} return ++i; };

    try {
        for (int i=1;i<argc;++i) {
            std::string a(argv[i]);
            if (a=="--image_path")           o.image_path = argv[need(i)];
            else if (a=="--save_dir")        o.save_dir = argv[need(i)];
            else if (a=="--label_dir")       o.label_dir = argv[need(i)];
            else if (a=="--custom_color") {
                while (i+1<argc && std::string(argv[i+1]).rfind("--",0)!=0) o.custom_color.push_back(std::stoi(argv[++i]));
                if (o.custom_color.empty() || o.custom_color.size()%3) { std::cerr<<"Bad --custom_color: need r g b triples\n"; std::exit(2); }
            }
            else if (a=="--category_colors") o.category_colors = true;
            else if (a=="--weight")          o.weight = std::stod(argv[need(i)]);
            else if (a=="--save_label_map")  o.save_label_map = true;
            else if (a=="--rank")            o.rank = std::stoi(argv[need(i)]);
            else if (a=="--nranks")          o.nranks = std::stoi(argv[need(i)]);
            else if (a=="--help" || a=="-h"){ print_usage(); std::exit(0); }
            else { std::cerr << "Unknown flag: " << a << "\n"; print_usage(); std::exit(2); }
        }
    } catch (const std::exception&) {
        std::cerr << "Bad numeric argument\n"; print_usage(); std::exit(2);
    }

    if (o.rank < 0)   o.rank   = env_int("PADDLE_TRAINER_ID", 0);
    if (o.nranks < 0) o.nranks = env_int("PADDLE_TRAINERS_NUM", 1);

    if (o.image_path.empty()) { std::cerr << "--image_path is required\n"; print_usage(); std::exit(2); }
    if (o.label_dir.empty())  { std::cerr << "--label_dir is required\n";  print_usage(); std::exit(2); }
    if (o.nranks < 1 || o.rank < 0 || o.rank >= o.nranks) {
        std::cerr << "Bad rank " << o.rank << " for " << o.nranks << " ranks\n"; std::exit(2);
    }
    if (o.weight < 0.0 || o.weight > 1.0) { std::cerr << "Bad --weight: must be in [0,1]\n"; std::exit(2); }
    return o;
}

// ---------------------------- MAIN ----------------------------
int main(int argc, char** argv) {
    Opts o = parse(argc, argv);

    try {
        lf::ImageList list = lf::get_image_list(o.image_path);
        std::cout << "The number of images: " << list.images.size() << "\n";

        auto shards = lf::partition_list(list.images, o.nranks);
        const auto& shard = shards[size_t(o.rank)];

        lf::RenderOptions render;
        render.palette = lf::color_map_list(256, o.category_colors ? lf::registry_custom_colors() : o.custom_color);
        render.weight = o.weight;
        render.save_label_map = o.save_label_map;

        lf::OutputLayout layout;
        layout.save_dir = o.save_dir;
        layout.rank = o.rank;
        layout.nranks = o.nranks;
        if (o.nranks > 1)
            std::cerr << "Warning: ids restart at 1 on every rank; rank " << o.rank
                      << " writes " << layout.document_path() << "\n";

        lf::ArtifactWriter writer(layout, render);
        lf::PrecomputedSegmenter segmenter(o.label_dir);
        lf::BoundaryTracer tracer;
        lf::ExportPipeline pipeline(segmenter, tracer, writer, list.image_dir);

        lf::ShardResult res = pipeline.run(shard);
        std::cout << "Predicted images are saved in " << o.save_dir << "/added_prediction and "
                  << o.save_dir << "/pseudo_color_prediction .\n";
        return res.skipped.empty() ? 0 : 1;
    } catch (const lf::Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
}
