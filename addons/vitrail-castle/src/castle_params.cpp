#include <vitrail/castle/castle_params.h>
#include <random>

namespace vitrail::castle {

namespace {

// Visit every parameter in panel order
template<typename P, typename Fn>
void forEachParam(P& p, Fn&& fn) {
    fn(p.seed);
    fn(p.towerCount);
    fn(p.towerRadius);
    fn(p.towerHeight);
    fn(p.wallHeight);
    fn(p.wallThickness);
    fn(p.baseRadius);
    fn(p.windowWidth);
    fn(p.windowHeight);
    fn(p.crenelationHeight);
    fn(p.crenelationCount);
    fn(p.windowSlots);
    fn(p.carvedWalls);
}

} // anonymous namespace

void CastleParams::randomizeSeed() {
    static std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(seed.min(), seed.max());
    seed = dist(rng);
}

std::vector<ParamDecl> CastleParams::decls() const {
    std::vector<ParamDecl> out;
    forEachParam(*this, [&out](const auto& p) { out.push_back(p.decl()); });
    return out;
}

json toJson(const CastleParams& params) {
    json obj = json::object();
    forEachParam(params, [&obj](const auto& p) { writeParam(obj, p); });
    return obj;
}

void fromJson(const json& obj, CastleParams& params) {
    if (!obj.is_object()) return;
    forEachParam(params, [&obj](auto& p) { readParam(obj, p); });
}

} // namespace vitrail::castle
