#include "labelforge/pipeline.hpp"

#include <filesystem>
#include <iostream>
#include <utility>
#include "labelforge/categories.hpp"
#include "labelforge/decompose.hpp"
#include "labelforge/errors.hpp"
#include "labelforge/image_io.hpp"

namespace fs = std::filesystem;

namespace lf {

bool ExportPipeline::process_image(const std::string& path, AnnotationAssembler& assembler, std::string& reason) {
    ImageSample sample;
    sample.path = path;
    sample.file_name = relative_file_name(path, image_dir_);
    if (!load_image(path, sample.image)) throw InputError("cannot decode image " + path);

    LabelMap pred;
    try {
        pred = segmenter_.infer(sample);
    } catch (const Error&) {
        throw;
    } catch (const std::exception& e) {
        throw InferenceError(path + ": " + e.what());
    }
    if (pred.labels.size() != size_t(pred.width)*pred.height || pred.width <= 0 || pred.height <= 0)
        throw InferenceError(path + ": segmenter returned an empty or malformed label map");
    if (pred.size() != sample.image.size())
        throw InferenceError(path + ": label map is " + std::to_string(pred.width) + "x" + std::to_string(pred.height) +
                             ", image is " + std::to_string(sample.image.width) + "x" + std::to_string(sample.image.height));

    // Every category is traced, present or not, in ascending id order.
    std::vector<std::pair<int, std::vector<Polygon>>> per_class;
    per_class.reserve(size_t(kCategoryCount));
    try {
        for (const auto& [id, mask] : decompose(pred))
            per_class.emplace_back(id, extractor_.extract(mask, pred.size(), id));
    } catch (const ExtractionError& e) {
        reason = e.what();
        return false;
    }

    try {
        writer_.write_image_artifacts(sample.file_name, sample.image, pred);
    } catch (const WriteError& e) {
        reason = e.what();
        return false;
    }

    const int64_t image_id = assembler.add_image(sample.file_name, pred.width, pred.height);
    for (const auto& [id, polys] : per_class)
        for (const auto& p : polys) assembler.add_polygon(image_id, id, p);
    return true;
}

ShardResult ExportPipeline::run(const std::vector<std::string>& shard) {
    for (const auto& p : shard) {
        std::error_code ec;
        if (!fs::is_regular_file(p, ec)) throw InputError("image not found: " + p);
        ImageSize size;
        if (!read_image_size(p, size)) throw InputError("cannot decode image " + p);
    }

    ShardResult res;
    AnnotationAssembler assembler;
    std::cout << "Start to predict " << shard.size() << " images...\n";
    for (size_t i=0; i<shard.size(); ++i) {
        std::string reason;
        if (process_image(shard[i], assembler, reason)) {
            ++res.processed;
            std::cout << "Processed " << (i+1) << "/" << shard.size() << " " << shard[i] << "\n";
        } else {
            std::cerr << "Warning: skipping " << shard[i] << ": " << reason << "\n";
            res.skipped.push_back(shard[i] + ": " + reason);
        }
    }

    res.document = aggregate(assembler);
    writer_.write_document(res.document);
    std::cout << "Done. processed=" << res.processed << ", skipped=" << res.skipped.size()
              << ", annotations=" << res.document.annotations.size() << "\n";
    return res;
}

} // namespace lf
