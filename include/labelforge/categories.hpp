#pragma once
#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include "labelforge/image.hpp"

namespace lf {

struct Category {
    int id;
    const char* name;
    Rgb color;
    const char* supercategory;
};

// Urban-scene taxonomy; ids are the label values the segmenter emits.
inline constexpr std::array<Category, 19> kCategories = {{
    { 0, "road",          {128,  64, 128}, ""},
    { 1, "sidewalk",      {244,  35, 232}, ""},
    { 2, "building",      { 70,  70,  70}, ""},
    { 3, "wall",          {102, 102, 156}, ""},
    { 4, "fence",         {190, 153, 153}, ""},
    { 5, "pole",          {153, 153, 153}, ""},
    { 6, "traffic_light", {250, 170,  30}, ""},
    { 7, "traffic_sign",  {220, 220,   0}, ""},
    { 8, "vegetation",    {107, 142,  35}, ""},
    { 9, "terrain",       {152, 251, 152}, ""},
    {10, "sky",           { 70, 130, 180}, ""},
    {11, "person",        {220,  20,  60}, ""},
    {12, "rider",         {255,   0,   0}, ""},
    {13, "car",           {  0,   0, 142}, ""},
    {14, "truck",         {  0,   0,  70}, ""},
    {15, "bus",           {  0,  60, 100}, ""},
    {16, "train",         {  0,  80, 100}, ""},
    {17, "motorcycle",    {  0,   0, 230}, ""},
    {18, "bicycle",       {119,  11,  32}, ""},
}};

// The decomposer walks [0, kCategoryCount); keep it tied to the table.
inline constexpr int kCategoryCount = int(kCategories.size());

constexpr bool ids_match_positions() {
    for (size_t i=0; i<kCategories.size(); ++i)
        if (kCategories[i].id != int(i)) return false;
    return true;
}
static_assert(ids_match_positions(), "category ids must equal their table position");

class CategoryRegistry {
public:
    static const std::array<Category, 19>& list() { return kCategories; }

    static bool contains(int id) { return id >= 0 && id < kCategoryCount; }

    static const Category& get(int id) {
        if (!contains(id)) throw std::out_of_range("unknown category id " + std::to_string(id));
        return kCategories[size_t(id)];
    }
    static Rgb colorOf(int id) { return get(id).color; }
};

} // namespace lf
