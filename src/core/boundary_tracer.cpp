#include "labelforge/boundary_tracer.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace lf {

namespace {

struct Pt { int x, y; };
inline bool operator==(Pt a, Pt b){ return a.x==b.x && a.y==b.y; }
inline bool operator!=(Pt a, Pt b){ return !(a==b); }
inline Pt operator+(Pt a, Pt b){ return {a.x+b.x, a.y+b.y}; }
inline Pt operator-(Pt a){ return {-a.x, -a.y}; }

// Walking direction d keeps the component on side (d.y, -d.x).
inline Pt interior_side(Pt d){ return {d.y, -d.x}; }

struct DisjointSet {
    std::vector<int> parent;
    int add(){ int id = int(parent.size()); parent.push_back(id); return id; }
    int find(int x){ while(parent[x]!=x){ parent[x]=parent[parent[x]]; x=parent[x]; } return x; }
    void unify(int a,int b){ a=find(a); b=find(b); if(a!=b) parent[std::max(a,b)]=std::min(a,b); }
};

// Two-pass 4-connected labelling. Component ids are 1.. in raster order of
// their first pixel; firsts[c-1] is that pixel.
std::vector<int> label_components(const BinaryMask& m, std::vector<Pt>& firsts) {
    const int W = m.width, H = m.height;
    std::vector<int> lab(size_t(W)*H, -1);
    DisjointSet ds;
    for (int y=0; y<H; ++y) for (int x=0; x<W; ++x) {
        if (!m.foreground(x,y)) continue;
        int l = (x>0) ? lab[size_t(y)*W + x-1] : -1;
        int t = (y>0) ? lab[size_t(y-1)*W + x] : -1;
        int cur;
        if (l<0 && t<0) cur = ds.add();
        else if (l<0)   cur = t;
        else if (t<0)   cur = l;
        else { cur = l; ds.unify(l,t); }
        lab[size_t(y)*W + x] = cur;
    }

    std::vector<int> canon(ds.parent.size(), 0);
    std::vector<int> out(size_t(W)*H, 0);
    firsts.clear();
    for (int y=0; y<H; ++y) for (int x=0; x<W; ++x) {
        int l = lab[size_t(y)*W + x];
        if (l<0) continue;
        int r = ds.find(l);
        if (!canon[r]) { firsts.push_back({x,y}); canon[r] = int(firsts.size()); }
        out[size_t(y)*W + x] = canon[r];
    }
    return out;
}

} // namespace

std::optional<std::vector<Polygon>> BoundaryTracer::trace(const BinaryMask& mask, ImageSize size) {
    if (mask.size() != size)
        throw std::invalid_argument("mask is " + std::to_string(mask.width) + "x" + std::to_string(mask.height) +
                                    ", image is " + std::to_string(size.width) + "x" + std::to_string(size.height));
    if (mask.pixels.size() != size_t(mask.width)*mask.height)
        throw std::invalid_argument("mask buffer does not match its dimensions");

    std::vector<Pt> firsts;
    const std::vector<int> comp = label_components(mask, firsts);
    if (firsts.empty()) return std::nullopt;

    const int W = mask.width, H = mask.height;
    std::vector<Polygon> out;
    out.reserve(firsts.size());

    for (size_t ci=0; ci<firsts.size(); ++ci) {
        const int c = int(ci) + 1;
        auto inside = [&](Pt p){
            return p.x>=0 && p.y>=0 && p.x<W && p.y<H && comp[size_t(p.y)*W + p.x]==c;
        };
        // Pixel bordering the unit edge v -> v+d on side s.
        auto pixel_on = [](Pt v, Pt d, Pt s){
            return Pt{ std::min({v.x, v.x+d.x, v.x+s.x, v.x+d.x+s.x}),
                       std::min({v.y, v.y+d.y, v.y+s.y, v.y+d.y+s.y}) };
        };
        auto is_boundary = [&](Pt v, Pt d){
            Pt s = interior_side(d);
            return inside(pixel_on(v,d,s)) && !inside(pixel_on(v,d,-s));
        };

        // The top edge of the first pixel is always on the outer ring.
        const Pt f  = firsts[ci];
        const Pt v0 = {f.x+1, f.y};
        const Pt d0 = {-1, 0};

        std::vector<int32_t> xy;
        Pt cur = v0, dir = d0;
        const size_t max_steps = 4*size_t(W)*H + 4;
        size_t steps = 0;
        do {
            Pt next = cur + dir;
            // Hug the component at pinch corners: inward turn, straight, outward turn.
            const Pt in = interior_side(dir);
            const Pt cand[3] = { in, dir, -in };
            Pt nd = dir;
            bool found = false;
            for (const Pt& d : cand) if (is_boundary(next, d)) { nd = d; found = true; break; }
            if (!found) throw std::runtime_error("boundary walk lost the edge at (" +
                                                 std::to_string(next.x) + "," + std::to_string(next.y) + ")");
            if (keep_every_point_ || nd != dir) { xy.push_back(next.x); xy.push_back(next.y); }
            cur = next; dir = nd;
            if (++steps > max_steps) throw std::runtime_error("boundary walk did not close");
        } while (cur != v0 || dir != d0);

        const size_t n = xy.size()/2;
        out.push_back(Polygon{ NumericArray({n, 2}, std::move(xy)) });
    }
    return out;
}

} // namespace lf
