#pragma once
#include <optional>
#include <string>
#include <vector>
#include "labelforge/artifact_writer.hpp"
#include "labelforge/coco.hpp"
#include "labelforge/document.hpp"
#include "labelforge/extractor.hpp"
#include "labelforge/polygon.hpp"
#include "labelforge/segmenter.hpp"

namespace lf {

struct ShardResult {
    Document document;
    size_t processed = 0;
    std::vector<std::string> skipped;   // "<path>: <reason>"
};

// Runs one rank's shard: infer, trace every category, write the per-image
// artifacts, then the document once the whole shard is done.
//
// Error policy: missing images and images whose header does not decode are
// rejected before the first image is processed. Those (InputError) and
// segmenter failures (InferenceError) abort the run before the document is
// written. ExtractionError and per-image WriteError skip that image without
// consuming any id. A failed document write propagates as WriteError.
class ExportPipeline {
public:
    ExportPipeline(Segmenter& segmenter, Tracer& tracer, const ArtifactWriter& writer, std::optional<std::string> image_dir = std::nullopt)
        : segmenter_(segmenter), extractor_(tracer), writer_(writer), image_dir_(std::move(image_dir)) {}

    ShardResult run(const std::vector<std::string>& shard);

    // One image into the assembler; false when it was skipped (reason set).
    bool process_image(const std::string& path, AnnotationAssembler& assembler, std::string& reason);

private:
    Segmenter& segmenter_;
    PolygonExtractor extractor_;
    const ArtifactWriter& writer_;
    std::optional<std::string> image_dir_;
};

} // namespace lf
