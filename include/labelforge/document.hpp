#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "labelforge/coco.hpp"

namespace lf {

// Keys keep the order they are written in.
using Json = nlohmann::ordered_json;

struct Document {
    std::vector<CocoCat>   categories;
    std::vector<CocoImage> images;
    std::vector<CocoAnn>   annotations;
    std::string info;
    std::vector<std::string> licenses;
};

// All registry entries, in id order.
std::vector<CocoCat> registry_categories();

// Checks ids are strictly increasing and every annotation points at a known
// image and category; throws EncodeError otherwise.
Document aggregate(std::vector<CocoCat> categories,
                   std::vector<CocoImage> images,
                   std::vector<CocoAnn> annotations);
Document aggregate(const AnnotationAssembler& assembler);

// Numeric normalization: every width is mapped onto a plain JSON integer or
// double, buffers onto nested arrays following their shape.
Json normalize(const Scalar& v);
Json normalize(const NumericArray& a);

Json document_json(const Document& doc);
Document document_from_json(const Json& j);

// indent < 0 gives the compact single-line form.
std::string encode_document(const Document& doc, int indent = -1);
Document decode_document(const std::string& text);

bool operator==(const CocoImage& a, const CocoImage& b);
bool operator==(const CocoAnn& a, const CocoAnn& b);
bool operator==(const CocoCat& a, const CocoCat& b);
bool operator==(const Document& a, const Document& b);

} // namespace lf
