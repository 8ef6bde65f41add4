#include <catch2/catch.hpp>

#include <cmath>
#include <limits>
#include <labelforge/document.hpp>
#include <labelforge/errors.hpp>

#define TEST_TAG "[document]"

static lf::Polygon poly_i32(std::vector<int32_t> xy) {
    const size_t n = xy.size()/2;
    return lf::Polygon{ lf::NumericArray({n, 2}, std::move(xy)) };
}

// Image 1: no polygons. Image 2: one polygon. Image 3: several polygons
// across several categories.
static lf::Document sample_document() {
    lf::AnnotationAssembler a;
    a.add_image("empty.png", 4, 4);
    auto i2 = a.add_image("one.png", 4, 4);
    a.add_polygon(i2, 3, poly_i32({0,0, 0,2, 2,2, 2,0}));
    auto i3 = a.add_image("sub/many.png", 16, 8);
    a.add_polygon(i3, 0, poly_i32({0,0, 0,4, 16,4, 16,0}));
    a.add_polygon(i3, 0, poly_i32({1,5, 1,6, 2,6}));
    a.add_polygon(i3, 11, poly_i32({3,3, 3,7, 9,7, 9,3}));
    return lf::aggregate(a);
}

TEST_CASE("Aggregated document carries all categories and the shard records", TEST_TAG) {
    auto doc = sample_document();
    REQUIRE(doc.categories.size() == 19);
    CHECK(doc.categories[0].name == "road");
    CHECK(doc.categories[18].color == lf::Rgb{119, 11, 32});
    CHECK(doc.images.size() == 3);
    CHECK(doc.annotations.size() == 4);
    CHECK(doc.info.empty());
    CHECK(doc.licenses.empty());
}

TEST_CASE("Encoded document has the COCO shape", TEST_TAG) {
    auto j = lf::Json::parse(lf::encode_document(sample_document()));
    std::vector<std::string> keys;
    for (auto it = j.begin(); it != j.end(); ++it) keys.push_back(it.key());
    CHECK(keys == std::vector<std::string>{"categories", "images", "annotations", "info", "licenses"});

    CHECK(j["categories"][0] == lf::Json::parse(R"({"id":0,"name":"road","color":[128,64,128],"supercategory":""})"));
    CHECK(j["images"][2] == lf::Json::parse(R"({"id":3,"width":16,"height":8,"file_name":"sub/many.png",
        "license":"","flickr_url":"","coco_url":"","date_captured":""})"));
    CHECK(j["annotations"][0] == lf::Json::parse(R"({"id":1,"iscrowd":0,"image_id":2,"category_id":3,
        "segmentation":[[0,0,0,2,2,2,2,0]],"area":0,"bbox":[]})"));
    CHECK(j["info"] == "");
    CHECK(j["licenses"] == lf::Json::array());
}

TEST_CASE("Encoding then decoding gives the same document", TEST_TAG) {
    auto doc = sample_document();
    auto back = lf::decode_document(lf::encode_document(doc));
    CHECK(back == doc);
    REQUIRE(back.annotations.size() == 4);
    CHECK(back.annotations[2].segmentation[0].shape == std::vector<size_t>{6});
    CHECK(back.annotations[3].image_id == 3);
    CHECK(back.annotations[3].category_id == 11);

    SECTION("indented output decodes the same") {
        CHECK(lf::decode_document(lf::encode_document(doc, 2)) == doc);
    }
}

TEST_CASE("Empty shard still lists every category", TEST_TAG) {
    lf::AnnotationAssembler a;
    auto doc = lf::aggregate(a);
    auto j = lf::Json::parse(lf::encode_document(doc));
    CHECK(j["categories"].size() == 19);
    CHECK(j["images"].empty());
    CHECK(j["annotations"].empty());
}

TEST_CASE("Numeric normalization yields plain numbers", TEST_TAG) {
    SECTION("scalars of every width") {
        CHECK(lf::normalize(lf::Scalar(int32_t(-7))).dump() == "-7");
        CHECK(lf::normalize(lf::Scalar(int64_t(1) << 40)).dump() == "1099511627776");
        CHECK(lf::normalize(lf::Scalar(uint64_t(42))).is_number_integer());
        CHECK(lf::normalize(lf::Scalar(uint64_t(42))).dump() == "42");
        CHECK(lf::normalize(lf::Scalar(2.5f)).dump() == "2.5");
        CHECK(lf::normalize(lf::Scalar(0.25)).dump() == "0.25");
    }
    SECTION("buffers nest along their shape") {
        lf::NumericArray a({2, 3}, std::vector<uint8_t>{1, 2, 3, 4, 5, 6});
        CHECK(lf::normalize(a).dump() == "[[1,2,3],[4,5,6]]");
        lf::NumericArray b({3, 2}, std::vector<double>{0.5, 1.0, 1.5, 2.0, 2.5, 3.0});
        CHECK(lf::normalize(b).dump() == "[[0.5,1.0],[1.5,2.0],[2.5,3.0]]");
        lf::NumericArray c({2, 1, 2}, std::vector<uint64_t>{1, 2, 3, 4});
        CHECK(lf::normalize(c).dump() == "[[[1,2]],[[3,4]]]");
        lf::NumericArray scalar(std::vector<size_t>{}, std::vector<int64_t>{9});
        CHECK(lf::normalize(scalar).dump() == "9");
        CHECK(lf::normalize(lf::NumericArray()).dump() == "[]");
    }
    SECTION("a document built from wide and float values encodes cleanly") {
        auto doc = sample_document();
        doc.annotations[0].area = uint64_t(16);
        doc.annotations[1].area = 3.75f;
        doc.annotations[1].bbox = lf::NumericArray({4}, std::vector<float>{0.5f, 1.5f, 2.0f, 3.0f});
        doc.annotations[2].segmentation.push_back(lf::NumericArray({2, 2}, std::vector<int64_t>{7, 8, 9, 10}));
        auto text = lf::encode_document(doc);
        auto j = lf::Json::parse(text);
        CHECK(j["annotations"][0]["area"] == 16);
        CHECK(j["annotations"][1]["area"].get<double>() == Approx(3.75));
        CHECK(j["annotations"][1]["bbox"] == lf::Json::parse("[0.5,1.5,2.0,3.0]"));
        CHECK(j["annotations"][2]["segmentation"][1] == lf::Json::parse("[[7,8],[9,10]]"));
        CHECK(lf::decode_document(text) == doc);
    }
    SECTION("non-finite values are refused") {
        CHECK_THROWS_AS(lf::normalize(lf::Scalar(std::numeric_limits<double>::quiet_NaN())), lf::EncodeError);
        lf::NumericArray inf({1}, std::vector<float>{std::numeric_limits<float>::infinity()});
        CHECK_THROWS_AS(lf::normalize(inf), lf::EncodeError);
    }
}

TEST_CASE("Inconsistent records are refused by aggregate", TEST_TAG) {
    lf::CocoImage im; im.id = 1; im.width = 2; im.height = 2; im.file_name = "a.png";
    lf::CocoAnn ann; ann.id = 1; ann.image_id = 1; ann.category_id = 0;

    SECTION("unknown image") {
        ann.image_id = 2;
        CHECK_THROWS_AS(lf::aggregate(lf::registry_categories(), {im}, {ann}), lf::EncodeError);
    }
    SECTION("unknown category") {
        ann.category_id = 42;
        CHECK_THROWS_AS(lf::aggregate(lf::registry_categories(), {im}, {ann}), lf::EncodeError);
    }
    SECTION("repeated annotation id") {
        CHECK_THROWS_AS(lf::aggregate(lf::registry_categories(), {im}, {ann, ann}), lf::EncodeError);
    }
}

TEST_CASE("Annotations resolve against sparse image ids", TEST_TAG) {
    std::vector<lf::CocoImage> images(3);
    images[0].id = 1; images[1].id = 4; images[2].id = 9;
    lf::CocoAnn ann; ann.id = 1; ann.category_id = 18;

    ann.image_id = 9;
    CHECK(lf::aggregate(lf::registry_categories(), images, {ann}).annotations.size() == 1);
    ann.image_id = 5;
    CHECK_THROWS_AS(lf::aggregate(lf::registry_categories(), images, {ann}), lf::EncodeError);
    ann.image_id = 10;
    CHECK_THROWS_AS(lf::aggregate(lf::registry_categories(), images, {ann}), lf::EncodeError);
}

TEST_CASE("Integers past the int64 range decode unchanged", TEST_TAG) {
    const uint64_t big = std::numeric_limits<uint64_t>::max();
    lf::AnnotationAssembler a;
    auto img = a.add_image("a.png", 4, 4);
    a.add_polygon(img, 0, lf::Polygon{ lf::NumericArray({2, 2}, std::vector<uint64_t>{big, 1, 2, 3}) });
    auto doc = lf::aggregate(a);

    auto back = lf::decode_document(lf::encode_document(doc));
    REQUIRE(back.annotations.size() == 1);
    const auto& seg = back.annotations[0].segmentation.at(0);
    REQUIRE(std::holds_alternative<std::vector<uint64_t>>(seg.data));
    CHECK(std::get<std::vector<uint64_t>>(seg.data) == std::vector<uint64_t>{big, 1, 2, 3});

    SECTION("mixed with negatives there is no common integer type") {
        CHECK_THROWS_AS(lf::decode_document(R"({"categories":[],"images":[{"id":1,"width":1,"height":1,
            "file_name":"a.png","license":"","flickr_url":"","coco_url":"","date_captured":""}],
            "annotations":[{"id":1,"iscrowd":0,"image_id":1,"category_id":0,
            "segmentation":[[18446744073709551615,-1]],"area":0,"bbox":[]}],"info":"","licenses":[]})"),
            lf::EncodeError);
    }
}

TEST_CASE("Malformed text is an EncodeError", TEST_TAG) {
    CHECK_THROWS_AS(lf::decode_document("{not json"), lf::EncodeError);
    CHECK_THROWS_AS(lf::decode_document(R"({"categories":[]})"), lf::EncodeError);
    CHECK_THROWS_AS(lf::decode_document(R"({"categories":[],"images":[],"annotations":[
        {"id":1,"iscrowd":0,"image_id":1,"category_id":0,"segmentation":[[1,[2]]],"area":0,"bbox":[]}],
        "info":"","licenses":[]})"), lf::EncodeError);
}
