#pragma once

/**
 * @file scene.h
 * @brief Hierarchical scene graph handed to the renderer
 *
 * Nodes own their children. Geometry is shared between MeshNodes through
 * shared_ptr, while materials are never owned by the graph: whoever made a
 * Material keeps it alive for as long as meshes reference it.
 *
 * @par Example
 * @code
 * Scene scene;
 * auto& group = scene.add<Group>("castle");
 * auto& wall = group.add<MeshNode>(MeshBuilder::box(1, 1, 0.1f).build(), &stone);
 * wall.position = glm::vec3(0, 0.5f, 0);
 * @endcode
 */

#include <vitrail/render3d/bounds.h>
#include <vitrail/render3d/mesh.h>
#include <glm/glm.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace vitrail::render3d {

class Material;
class Renderable;

/// Render layer that volumetric lighting passes pick up
constexpr int LAYER_VOLUMETRIC_LIGHTING = 10;

/// A node in the scene graph with a local transform and owned children
class Node {
public:
    explicit Node(std::string name = {});
    virtual ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    // -------------------------------------------------------------------------
    /// @name Transform
    /// @{

    glm::vec3 position = glm::vec3(0.0f);
    glm::vec3 rotation = glm::vec3(0.0f);  ///< Euler angles (radians), XYZ order
    glm::vec3 scale = glm::vec3(1.0f);

    /// Local transform from position, rotation and scale
    glm::mat4 localMatrix() const;

    /// Transform to world space through every ancestor
    glm::mat4 worldMatrix() const;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Hierarchy
    /// @{

    /// Take ownership of a child and return it
    Node& add(std::unique_ptr<Node> child);

    /// Construct a child in place
    template<typename T, typename... Args>
    T& add(Args&&... args) {
        auto child = std::make_unique<T>(std::forward<Args>(args)...);
        T& ref = *child;
        add(std::move(child));
        return ref;
    }

    /// Detach a direct child, handing ownership back (nullptr if not a child)
    std::unique_ptr<Node> remove(const Node& child);

    /// Remove every child
    void clear();

    Node* parent() const { return m_parent; }
    const std::vector<std::unique_ptr<Node>>& children() const { return m_children; }

    /// Visit this node and all descendants, depth first
    void traverse(const std::function<void(Node&)>& fn);
    void traverse(const std::function<void(const Node&)>& fn) const;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Layers
    /// @{

    void enableLayer(int layer) { layers |= (1u << layer); }
    void disableLayer(int layer) { layers &= ~(1u << layer); }
    bool hasLayer(int layer) const { return (layers & (1u << layer)) != 0; }

    uint32_t layers = 1u;  ///< Layer 0 is on by default

    /// @}

    /// Capability query: non-null when this node carries drawable geometry
    virtual Renderable* asRenderable() { return nullptr; }
    virtual const Renderable* asRenderable() const { return nullptr; }

    /// Dispose every piece of geometry in this subtree
    void disposeGeometry();

    std::string name;

private:
    Node* m_parent = nullptr;
    std::vector<std::unique_ptr<Node>> m_children;
};

/// Plain composite node
class Group : public Node {
public:
    using Node::Node;
};

/// Root of a scene
class Scene : public Node {
public:
    Scene() : Node("scene") {}
};

/// Something the renderer can draw and the physics can collide against
class Renderable {
public:
    virtual ~Renderable() = default;

    /// Local-space geometry (null if none)
    virtual const Mesh* geometry() const = 0;

    /// Local-to-world transform
    virtual glm::mat4 worldTransform() const = 0;

    /// Whether this object should block movement
    virtual bool isCollidable() const = 0;

    /// World-space bounds of the geometry
    Box3 worldBounds() const;
};

/// A node drawing one mesh with one material
class MeshNode : public Node, public Renderable {
public:
    MeshNode(std::shared_ptr<Mesh> geometry, Material* material, std::string name = {});
    MeshNode(Mesh&& geometry, Material* material, std::string name = {});

    Renderable* asRenderable() override { return this; }
    const Renderable* asRenderable() const override { return this; }

    const Mesh* geometry() const override { return m_geometry.get(); }
    glm::mat4 worldTransform() const override { return worldMatrix(); }

    /// Solid unless the material lets light through (glass stays walkable-through
    /// for caustics) or the geometry has been disposed
    bool isCollidable() const override;

    std::shared_ptr<Mesh> sharedGeometry() const { return m_geometry; }

    /// Swap the appearance without touching geometry
    void setMaterial(Material* material) { m_material = material; }
    Material* material() const { return m_material; }

    bool castShadow = true;
    bool receiveShadow = true;

private:
    std::shared_ptr<Mesh> m_geometry;
    Material* m_material = nullptr;
};

} // namespace vitrail::render3d
