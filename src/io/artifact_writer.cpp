#include "labelforge/artifact_writer.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include "labelforge/color_map.hpp"
#include "labelforge/errors.hpp"
#include "labelforge/exr_writer.hpp"
#include "labelforge/image_io.hpp"

namespace fs = std::filesystem;

namespace lf {

namespace {

std::string with_extension(const std::string& file_name, const char* ext) {
    fs::path p(file_name);
    p.replace_extension(ext);
    return p.string();
}

void make_parent(const std::string& path) {
    fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) return;
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) throw WriteError("cannot create " + parent.string() + ": " + ec.message());
}

} // namespace

std::string OutputLayout::added_path(const std::string& file_name) const {
    return (fs::path(save_dir) / "added_prediction" / file_name).string();
}
std::string OutputLayout::pseudo_path(const std::string& file_name) const {
    return (fs::path(save_dir) / "pseudo_color_prediction" / with_extension(file_name, ".png")).string();
}
std::string OutputLayout::label_path(const std::string& file_name) const {
    return (fs::path(save_dir) / "label_prediction" / with_extension(file_name, ".exr")).string();
}
std::string OutputLayout::document_path() const {
    if (nranks > 1) return (fs::path(save_dir) / ("annotations_rank" + std::to_string(rank) + ".json")).string();
    return (fs::path(save_dir) / "annotations.json").string();
}

ArtifactWriter::ArtifactWriter(OutputLayout layout, RenderOptions render)
    : layout_(std::move(layout)), render_(std::move(render))
{
    if (render_.palette.empty()) render_.palette = color_map_list(256);
}

void ArtifactWriter::write_image_artifacts(const std::string& file_name, const RgbImage& image, const LabelMap& pred) const {
    const std::string added = layout_.added_path(file_name);
    make_parent(added);
    RgbImage blended;
    try {
        blended = overlay(image, pred, render_.palette, render_.weight);
    } catch (const std::invalid_argument& e) {
        throw WriteError(added + ": " + e.what());
    }
    if (!save_image(added, blended)) throw WriteError("cannot write " + added);

    const std::string pseudo = layout_.pseudo_path(file_name);
    make_parent(pseudo);
    if (!save_palette_png(pseudo, pred, render_.palette)) throw WriteError("cannot write " + pseudo);

    if (render_.save_label_map) {
        const std::string lbl = layout_.label_path(file_name);
        make_parent(lbl);
        if (!write_label_exr(lbl, pred)) throw WriteError("cannot write " + lbl);
    }
}

void ArtifactWriter::write_document(const Document& doc) const {
    const std::string path = layout_.document_path();
    const std::string tmp = path + ".tmp";
    make_parent(path);
    const std::string text = encode_document(doc);
    {
        std::ofstream j(tmp, std::ios::binary | std::ios::trunc);
        if (!j) throw WriteError("cannot open " + tmp);
        j << text;
        j.close();
        if (!j) {
            std::error_code ec;
            fs::remove(tmp, ec);
            throw WriteError("cannot write " + tmp);
        }
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code rm;
        fs::remove(tmp, rm);
        throw WriteError("cannot move " + tmp + " to " + path + ": " + ec.message());
    }
    std::cout << "Wrote " << path << "\n";
}

} // namespace lf
