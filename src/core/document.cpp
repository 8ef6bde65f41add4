#include "labelforge/document.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <type_traits>
#include <unordered_set>
#include <variant>

#include "labelforge/errors.hpp"

namespace lf {

namespace {

Json plain_integer(int64_t v)  { return Json(v); }
Json plain_integer(uint64_t v) {
    if (v <= uint64_t(std::numeric_limits<int64_t>::max())) return Json(int64_t(v));
    return Json(v);
}
Json plain_float(double v) {
    if (!std::isfinite(v)) throw EncodeError("non-finite number cannot be encoded");
    return Json(v);
}

template<typename T>
Json plain(T v) {
    if constexpr (std::is_floating_point_v<T>) return plain_float(double(v));
    else if constexpr (std::is_unsigned_v<T>)  return plain_integer(uint64_t(v));
    else                                       return plain_integer(int64_t(v));
}

template<typename T>
Json nest(const std::vector<T>& v, const std::vector<size_t>& shape, size_t dim, size_t& pos) {
    Json out = Json::array();
    if (dim + 1 == shape.size()) {
        for (size_t i=0; i<shape[dim]; ++i) out.push_back(plain(v[pos++]));
        return out;
    }
    for (size_t i=0; i<shape[dim]; ++i) out.push_back(nest(v, shape, dim + 1, pos));
    return out;
}

double scalar_value(const Scalar& s) { return std::visit([](auto v){ return double(v); }, s); }

// Walks a (possibly nested) JSON array, recording its shape and leaves.
void collect(const Json& j, size_t dim, std::vector<size_t>& shape, std::vector<const Json*>& leaves) {
    if (!j.is_array()) {
        if (dim != shape.size()) throw EncodeError("ragged numeric array");
        if (!j.is_number()) throw EncodeError("numeric array holds a non-number");
        leaves.push_back(&j);
        return;
    }
    if (dim == shape.size()) {
        if (!leaves.empty()) throw EncodeError("ragged numeric array");
        shape.push_back(j.size());
    } else if (shape[dim] != j.size()) {
        throw EncodeError("ragged numeric array");
    }
    for (const auto& e : j) collect(e, dim + 1, shape, leaves);
}

NumericArray array_from_json(const Json& j) {
    if (!j.is_array()) throw EncodeError("expected a numeric array");
    std::vector<size_t> shape;
    std::vector<const Json*> leaves;
    collect(j, 0, shape, leaves);
    bool integral = true, wide = false, negative = false;
    for (auto* l : leaves) {
        if (l->is_number_float()) { integral = false; break; }
        if (l->is_number_unsigned()) wide = wide || l->get<uint64_t>() > uint64_t(std::numeric_limits<int64_t>::max());
        else negative = negative || l->get<int64_t>() < 0;
    }
    if (integral && wide) {
        if (negative) throw EncodeError("integer array mixes negative values with values past the int64 range");
        std::vector<uint64_t> v; v.reserve(leaves.size());
        for (auto* l : leaves) v.push_back(l->get<uint64_t>());
        return NumericArray(shape, std::move(v));
    }
    if (integral) {
        std::vector<int64_t> v; v.reserve(leaves.size());
        for (auto* l : leaves) v.push_back(l->get<int64_t>());
        return NumericArray(shape, std::move(v));
    }
    std::vector<double> v; v.reserve(leaves.size());
    for (auto* l : leaves) v.push_back(l->get<double>());
    return NumericArray(shape, std::move(v));
}

Scalar scalar_from_json(const Json& j) {
    if (j.is_number_float()) return j.get<double>();
    if (j.is_number_unsigned() && j.get<uint64_t>() > uint64_t(std::numeric_limits<int64_t>::max()))
        return j.get<uint64_t>();
    if (j.is_number()) return j.get<int64_t>();
    throw EncodeError("expected a number");
}

} // namespace

std::vector<CocoCat> registry_categories() {
    std::vector<CocoCat> out;
    out.reserve(kCategories.size());
    for (const auto& c : CategoryRegistry::list())
        out.push_back({c.id, c.name, c.color, c.supercategory});
    return out;
}

Document aggregate(std::vector<CocoCat> categories,
                   std::vector<CocoImage> images,
                   std::vector<CocoAnn> annotations)
{
    for (size_t i=1; i<images.size(); ++i)
        if (images[i].id <= images[i-1].id)
            throw EncodeError("image ids are not strictly increasing at id " + std::to_string(images[i].id));
    for (size_t i=1; i<annotations.size(); ++i)
        if (annotations[i].id <= annotations[i-1].id)
            throw EncodeError("annotation ids are not strictly increasing at id " + std::to_string(annotations[i].id));

    // image ids are sorted at this point
    auto has_image = [&](int64_t id){
        auto it = std::lower_bound(images.begin(), images.end(), id,
                                   [](const CocoImage& im, int64_t v){ return im.id < v; });
        return it != images.end() && it->id == id;
    };
    std::unordered_set<int64_t> category_ids;
    for (auto& c : categories) category_ids.insert(c.id);
    auto has_category = [&](int64_t id){ return category_ids.count(id) != 0; };
    for (auto& a : annotations) {
        if (!has_image(a.image_id))
            throw EncodeError("annotation " + std::to_string(a.id) + " refers to missing image " + std::to_string(a.image_id));
        if (!has_category(a.category_id))
            throw EncodeError("annotation " + std::to_string(a.id) + " refers to missing category " + std::to_string(a.category_id));
    }

    Document doc;
    doc.categories  = std::move(categories);
    doc.images      = std::move(images);
    doc.annotations = std::move(annotations);
    return doc;
}

Document aggregate(const AnnotationAssembler& assembler) {
    return aggregate(registry_categories(), assembler.images(), assembler.annotations());
}

Json normalize(const Scalar& v) {
    return std::visit([](auto x){ return plain(x); }, v);
}

Json normalize(const NumericArray& a) {
    if (a.count() != a.size()) throw EncodeError("numeric array shape does not match its element count");
    return std::visit([&](const auto& v) -> Json {
        if (a.shape.empty()) return plain(v.at(0));
        size_t pos = 0;
        return nest(v, a.shape, 0, pos);
    }, a.data);
}

Json document_json(const Document& doc) {
    Json cats = Json::array();
    for (auto& c : doc.categories) {
        Json jc;
        jc["id"] = c.id;
        jc["name"] = c.name;
        jc["color"] = Json::array({c.color[0], c.color[1], c.color[2]});
        jc["supercategory"] = c.supercategory;
        cats.push_back(std::move(jc));
    }
    Json imgs = Json::array();
    for (auto& im : doc.images) {
        Json ji;
        ji["id"] = im.id;
        ji["width"] = im.width;
        ji["height"] = im.height;
        ji["file_name"] = im.file_name;
        ji["license"] = im.license;
        ji["flickr_url"] = im.flickr_url;
        ji["coco_url"] = im.coco_url;
        ji["date_captured"] = im.date_captured;
        imgs.push_back(std::move(ji));
    }
    Json anns = Json::array();
    for (auto& a : doc.annotations) {
        Json ja;
        ja["id"] = a.id;
        ja["iscrowd"] = a.iscrowd;
        ja["image_id"] = a.image_id;
        ja["category_id"] = a.category_id;
        Json seg = Json::array();
        for (auto& s : a.segmentation) seg.push_back(normalize(s));
        ja["segmentation"] = std::move(seg);
        ja["area"] = normalize(a.area);
        ja["bbox"] = normalize(a.bbox);
        anns.push_back(std::move(ja));
    }

    Json j;
    j["categories"] = std::move(cats);
    j["images"] = std::move(imgs);
    j["annotations"] = std::move(anns);
    j["info"] = doc.info;
    j["licenses"] = doc.licenses;
    return j;
}

Document document_from_json(const Json& j) {
    try {
        Document doc;
        for (auto& jc : j.at("categories")) {
            CocoCat c;
            c.id = jc.at("id").get<int64_t>();
            c.name = jc.at("name").get<std::string>();
            const auto& col = jc.at("color");
            if (!col.is_array() || col.size() != 3) throw EncodeError("category color must have 3 components");
            for (size_t k=0; k<3; ++k) {
                int v = col[k].get<int>();
                if (v < 0 || v > 255) throw EncodeError("category color component out of range");
                c.color[k] = uint8_t(v);
            }
            c.supercategory = jc.at("supercategory").get<std::string>();
            doc.categories.push_back(std::move(c));
        }
        for (auto& ji : j.at("images")) {
            CocoImage im;
            im.id = ji.at("id").get<int64_t>();
            im.width = ji.at("width").get<int64_t>();
            im.height = ji.at("height").get<int64_t>();
            im.file_name = ji.at("file_name").get<std::string>();
            im.license = ji.at("license").get<std::string>();
            im.flickr_url = ji.at("flickr_url").get<std::string>();
            im.coco_url = ji.at("coco_url").get<std::string>();
            im.date_captured = ji.at("date_captured").get<std::string>();
            doc.images.push_back(std::move(im));
        }
        for (auto& ja : j.at("annotations")) {
            CocoAnn a;
            a.id = ja.at("id").get<int64_t>();
            a.iscrowd = ja.at("iscrowd").get<int>();
            a.image_id = ja.at("image_id").get<int64_t>();
            a.category_id = ja.at("category_id").get<int64_t>();
            for (auto& s : ja.at("segmentation")) a.segmentation.push_back(array_from_json(s));
            a.area = scalar_from_json(ja.at("area"));
            a.bbox = array_from_json(ja.at("bbox"));
            doc.annotations.push_back(std::move(a));
        }
        doc.info = j.at("info").get<std::string>();
        doc.licenses = j.at("licenses").get<std::vector<std::string>>();
        return doc;
    } catch (const Json::exception& e) {
        throw EncodeError(std::string("malformed annotation document: ") + e.what());
    }
}

std::string encode_document(const Document& doc, int indent) {
    try {
        return document_json(doc).dump(indent);
    } catch (const Json::exception& e) {
        throw EncodeError(std::string("encoding annotation document: ") + e.what());
    }
}

Document decode_document(const std::string& text) {
    Json j;
    try {
        j = Json::parse(text);
    } catch (const Json::exception& e) {
        throw EncodeError(std::string("parsing annotation document: ") + e.what());
    }
    return document_from_json(j);
}

bool operator==(const CocoImage& a, const CocoImage& b) {
    return a.id==b.id && a.width==b.width && a.height==b.height && a.file_name==b.file_name &&
           a.license==b.license && a.flickr_url==b.flickr_url && a.coco_url==b.coco_url &&
           a.date_captured==b.date_captured;
}
bool operator==(const CocoAnn& a, const CocoAnn& b) {
    return a.id==b.id && a.iscrowd==b.iscrowd && a.image_id==b.image_id && a.category_id==b.category_id &&
           a.segmentation==b.segmentation && scalar_value(a.area)==scalar_value(b.area) && a.bbox==b.bbox;
}
bool operator==(const CocoCat& a, const CocoCat& b) {
    return a.id==b.id && a.name==b.name && a.color==b.color && a.supercategory==b.supercategory;
}
bool operator==(const Document& a, const Document& b) {
    return a.categories==b.categories && a.images==b.images && a.annotations==b.annotations &&
           a.info==b.info && a.licenses==b.licenses;
}

} // namespace lf
