#include <vitrail/castle/castle_generator.h>
#include <vitrail/castle/seeded_random.h>
#include <vitrail/render3d/mesh_builder.h>
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>

namespace vitrail::castle {

using render3d::Group;
using render3d::Material;
using render3d::Mesh;
using render3d::MeshBuilder;
using render3d::MeshNode;
using render3d::Node;

namespace {

// Stone margin on each side of a window opening
constexpr float kWallMargin = 0.06f;
// Overhang of the arch and sill past the opening
constexpr float kFrameOverhang = 0.03f;
constexpr float kArchHeight = 0.04f;
constexpr float kSillHeight = 0.02f;
// Slabs thinner than this are left out
constexpr float kMinSlabHeight = 0.01f;

constexpr float kPillarRadius = 0.08f;
constexpr int kPillarSides = 8;

constexpr float kSkylightSize = 0.6f;
constexpr float kSkylightFrame = 0.02f;

// Multiply every vertex color of a stone piece by a grey tint
Mesh tinted(Mesh mesh, float tint) {
    for (auto& v : mesh.vertices) {
        v.color = glm::vec4(tint, tint, tint, 1.0f);
    }
    return mesh;
}

MeshNode& addStone(Group& parent, MeshBuilder builder, Material* stone, float tint,
                   glm::vec3 position, const char* name) {
    MeshNode& node = parent.add<MeshNode>(tinted(builder.build(), tint), stone, name);
    node.position = position;
    return node;
}

} // anonymous namespace

CastleGenerator::CastleGenerator() {
    m_stone.baseColor(0x5a / 255.0f, 0x5a / 255.0f, 0x5a / 255.0f)
           .roughness(0.85f)
           .metallic(0.05f);
    m_floor.baseColor(0x3a / 255.0f, 0x3a / 255.0f, 0x3a / 255.0f)
           .roughness(0.6f)
           .metallic(0.1f);
    m_frame.baseColor(0x2a / 255.0f, 0x2a / 255.0f, 0x2a / 255.0f)
           .roughness(0.6f)
           .metallic(0.4f);
}

CastleGenerator::~CastleGenerator() {
    clear();
}

// -----------------------------------------------------------------------------
// Generation
// -----------------------------------------------------------------------------

CastleResult CastleGenerator::generate(Node& scene, const std::vector<Material*>& materials) {
    return generate(scene, materials, m_params);
}

CastleResult CastleGenerator::generate(Node& scene, const std::vector<Material*>& materials,
                                       const CastleParams& params) {
    if (&params != &m_params) {
        m_params = params;
    }

    clear();
    m_scene = &scene;

    auto group = std::make_unique<Group>("castle");
    SeededRandom rng(m_params.seed.get());

    const int count = std::max(0, m_params.windowSlots.get());
    std::vector<float> aspects(static_cast<size_t>(count), 1.0f);
    for (int i = 0; i < count && i < static_cast<int>(materials.size()); ++i) {
        if (materials[i] && materials[i]->aspectRatioHint()) {
            aspects[i] = *materials[i]->aspectRatioHint();
        }
    }

    RingDimensions ring = RingDimensions::from(m_params);
    m_windows = layoutWindows(aspects, m_params);

    for (const WindowSpec& spec : m_windows) {
        float tint = static_cast<float>(rng.range(0.85, 1.0));
        m_walls.push_back(&buildWallSegment(*group, spec, ring, tint));

        Material* glass = spec.index < static_cast<int>(materials.size())
                        ? materials[spec.index] : nullptr;
        if (glass) {
            float offset = ring.wallThickness * 0.5f + 0.001f;
            glm::vec3 outward(std::cos(spec.angle), 0.0f, std::sin(spec.angle));

            MeshNode& pane = group->add<MeshNode>(MeshBuilder::rect(spec.width, spec.height).build(),
                                                  glass, "window");
            pane.position = spec.worldPosition + outward * offset;
            pane.position.y = spec.centerHeight;
            pane.rotation.y = spec.worldRotationY;
            pane.castShadow = true;
            pane.receiveShadow = true;
            pane.enableLayer(render3d::LAYER_VOLUMETRIC_LIGHTING);
            m_windowMeshes.push_back(&pane);
        }

        float nextAngle = glm::two_pi<float>() * static_cast<float>(spec.index + 1) / static_cast<float>(count);
        float pillarAngle = (spec.angle + nextAngle) * 0.5f;
        float pillarRadius = ring.radius + ring.wallThickness * 0.5f;

        Group& pillar = buildPillar(*group, ring.wallHeight * 1.1f);
        pillar.position = glm::vec3(std::cos(pillarAngle) * pillarRadius,
                                    0.0f,
                                    std::sin(pillarAngle) * pillarRadius);
        m_pillars.push_back(&pillar);
    }

    // Foundation ring under the walls
    float outer = ring.radius + ring.wallThickness;
    MeshNode& base = group->add<MeshNode>(
        MeshBuilder::cylinder(outer, outer + 0.1f, 0.1f, std::max(3, count * 2)).build(),
        &m_stone, "base");
    base.position.y = -0.05f;
    base.castShadow = false;
    base.receiveShadow = true;

    // Inner floor that catches the projected light
    MeshNode& floor = group->add<MeshNode>(MeshBuilder::circle(ring.radius - 0.1f, 32).build(),
                                           &m_floor, "floor");
    floor.position.y = 0.01f;
    floor.castShadow = false;
    floor.receiveShadow = true;

    if (!materials.empty() && materials[0]) {
        buildSkylight(*group, materials[0], ring.wallHeight);
    }

    m_group = group.get();
    scene.add(std::move(group));

    std::cout << "[castle] Generated " << count << " wall segments, "
              << m_windowMeshes.size() << " glass panes (seed " << m_params.seed.get() << ")"
              << std::endl;

    CastleResult result;
    result.group = m_group;
    result.windowMeshes = m_windowMeshes;
    result.windowCount = count;
    return result;
}

std::optional<CastleResult> CastleGenerator::regenerate(const std::vector<Material*>& materials) {
    if (!m_scene) {
        return std::nullopt;
    }
    return generate(*m_scene, materials, m_params);
}

void CastleGenerator::updateWindowMaterials(const std::vector<Material*>& materials) {
    size_t n = std::min(materials.size(), m_windowMeshes.size());
    for (size_t i = 0; i < n; ++i) {
        if (materials[i]) {
            m_windowMeshes[i]->setMaterial(materials[i]);
        }
    }
}

void CastleGenerator::clear() {
    if (m_group && m_scene) {
        std::unique_ptr<Node> old = m_scene->remove(*m_group);
        if (old) {
            old->disposeGeometry();
        }
    }
    m_group = nullptr;
    m_windowMeshes.clear();
    m_walls.clear();
    m_pillars.clear();
    m_windows.clear();
}

// -----------------------------------------------------------------------------
// Pieces
// -----------------------------------------------------------------------------

Group& CastleGenerator::buildWallSegment(Group& parent, const WindowSpec& spec,
                                         const RingDimensions& ring, float tint) {
    Group& wall = parent.add<Group>("wall");
    wall.position = spec.worldPosition;
    wall.rotation.y = spec.worldRotationY;

    const float w = spec.width;
    const float h = spec.height;
    const float t = ring.wallThickness;
    const float yOff = spec.centerHeight;
    const float totalWidth = w + kWallMargin * 2.0f;

    if (m_params.carvedWalls.get()) {
        // One solid with the opening cut out
        MeshBuilder solid = MeshBuilder::box(totalWidth, ring.wallHeight, t);
        solid.translate(glm::vec3(0.0f, ring.wallHeight * 0.5f, 0.0f));
        MeshBuilder opening = MeshBuilder::box(w, h, t + 0.02f);
        opening.translate(glm::vec3(0.0f, yOff, 0.0f));
        solid.subtract(opening);
        addStone(wall, std::move(solid), &m_stone, tint, glm::vec3(0.0f), "wall.body");
    } else {
        float bottomHeight = yOff - h * 0.5f;
        if (bottomHeight > kMinSlabHeight) {
            addStone(wall, MeshBuilder::box(totalWidth, bottomHeight, t), &m_stone, tint,
                     glm::vec3(0.0f, bottomHeight * 0.5f, 0.0f), "wall.bottom");
        }

        float topStart = yOff + h * 0.5f;
        float topHeight = ring.wallHeight - topStart;
        if (topHeight > kMinSlabHeight) {
            addStone(wall, MeshBuilder::box(totalWidth, topHeight, t), &m_stone, tint,
                     glm::vec3(0.0f, topStart + topHeight * 0.5f, 0.0f), "wall.top");
        }

        float side = w * 0.5f + kWallMargin * 0.5f;
        addStone(wall, MeshBuilder::box(kWallMargin, h, t), &m_stone, tint,
                 glm::vec3(-side, yOff, 0.0f), "wall.left");
        addStone(wall, MeshBuilder::box(kWallMargin, h, t), &m_stone, tint,
                 glm::vec3(side, yOff, 0.0f), "wall.right");
    }

    float trimWidth = w + kFrameOverhang * 2.0f;
    MeshNode& arch = addStone(wall, MeshBuilder::box(trimWidth, kArchHeight, t + 0.01f), &m_stone, tint,
                              glm::vec3(0.0f, yOff + h * 0.5f + kArchHeight * 0.5f, 0.0f), "wall.arch");
    arch.receiveShadow = false;

    MeshNode& sill = addStone(wall, MeshBuilder::box(trimWidth, kSillHeight, t + 0.02f), &m_stone, tint,
                              glm::vec3(0.0f, yOff - h * 0.5f - 0.01f, 0.0f), "wall.sill");
    sill.receiveShadow = false;

    return wall;
}

Group& CastleGenerator::buildPillar(Group& parent, float height) {
    Group& pillar = parent.add<Group>("pillar");

    MeshNode& body = pillar.add<MeshNode>(
        MeshBuilder::cylinder(kPillarRadius, kPillarRadius * 1.1f, height, kPillarSides).build(),
        &m_stone, "pillar.body");
    body.position.y = height * 0.5f;

    MeshNode& cap = pillar.add<MeshNode>(
        MeshBuilder::cone(kPillarRadius * 1.3f, kPillarRadius * 2.0f, kPillarSides).build(),
        &m_stone, "pillar.cap");
    cap.position.y = height + kPillarRadius;
    cap.receiveShadow = false;

    return pillar;
}

void CastleGenerator::buildSkylight(Group& parent, Material* glass, float wallHeight) {
    const float y = wallHeight * 0.8f;

    // Frame bars first so the pane is the last child, matching its place at the
    // end of the window mesh list
    auto barX = std::make_shared<Mesh>(
        MeshBuilder::box(kSkylightSize + kSkylightFrame * 2.0f, kSkylightFrame, kSkylightFrame).build());
    auto barZ = std::make_shared<Mesh>(
        MeshBuilder::box(kSkylightFrame, kSkylightFrame, kSkylightSize + kSkylightFrame * 2.0f).build());
    const float half = kSkylightSize * 0.5f + kSkylightFrame * 0.5f;

    parent.add<MeshNode>(barX, &m_frame, "skylight.frame").position = glm::vec3(0.0f, y, half);
    parent.add<MeshNode>(barX, &m_frame, "skylight.frame").position = glm::vec3(0.0f, y, -half);
    parent.add<MeshNode>(barZ, &m_frame, "skylight.frame").position = glm::vec3(half, y, 0.0f);
    parent.add<MeshNode>(barZ, &m_frame, "skylight.frame").position = glm::vec3(-half, y, 0.0f);

    // Horizontal pane lit from above, shares slot 0's image
    MeshNode& pane = parent.add<MeshNode>(MeshBuilder::plane(kSkylightSize, kSkylightSize).build(),
                                          glass, "skylight");
    pane.position.y = y;
    pane.castShadow = true;
    pane.receiveShadow = false;
    pane.enableLayer(render3d::LAYER_VOLUMETRIC_LIGHTING);
    m_windowMeshes.push_back(&pane);
}

} // namespace vitrail::castle
