#pragma once
#include <string>
#include "labelforge/label_map.hpp"

namespace lf {
// Raw label ids as one float channel.
bool write_label_exr(const std::string& path, const LabelMap& labels, const char* channel="Y");
}
