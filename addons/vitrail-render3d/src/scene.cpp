#include <vitrail/render3d/scene.h>
#include <vitrail/render3d/material.h>
#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>

namespace vitrail::render3d {

// -----------------------------------------------------------------------------
// Node
// -----------------------------------------------------------------------------

Node::Node(std::string n)
    : name(std::move(n))
{}

Node::~Node() = default;

glm::mat4 Node::localMatrix() const {
    glm::mat4 m = glm::translate(glm::mat4(1.0f), position);
    m = glm::rotate(m, rotation.x, glm::vec3(1, 0, 0));
    m = glm::rotate(m, rotation.y, glm::vec3(0, 1, 0));
    m = glm::rotate(m, rotation.z, glm::vec3(0, 0, 1));
    return glm::scale(m, scale);
}

glm::mat4 Node::worldMatrix() const {
    if (m_parent) {
        return m_parent->worldMatrix() * localMatrix();
    }
    return localMatrix();
}

Node& Node::add(std::unique_ptr<Node> child) {
    child->m_parent = this;
    m_children.push_back(std::move(child));
    return *m_children.back();
}

std::unique_ptr<Node> Node::remove(const Node& child) {
    auto it = std::find_if(m_children.begin(), m_children.end(),
                           [&child](const std::unique_ptr<Node>& c) { return c.get() == &child; });
    if (it == m_children.end()) {
        return nullptr;
    }

    std::unique_ptr<Node> owned = std::move(*it);
    m_children.erase(it);
    owned->m_parent = nullptr;
    return owned;
}

void Node::clear() {
    for (auto& c : m_children) {
        c->m_parent = nullptr;
    }
    m_children.clear();
}

void Node::traverse(const std::function<void(Node&)>& fn) {
    fn(*this);
    for (auto& c : m_children) {
        c->traverse(fn);
    }
}

void Node::traverse(const std::function<void(const Node&)>& fn) const {
    fn(*this);
    for (const auto& c : m_children) {
        static_cast<const Node&>(*c).traverse(fn);
    }
}

void Node::disposeGeometry() {
    traverse([](Node& n) {
        if (auto* mesh = dynamic_cast<MeshNode*>(&n)) {
            if (auto geo = mesh->sharedGeometry()) {
                geo->dispose();
            }
        }
    });
}

// -----------------------------------------------------------------------------
// Renderable
// -----------------------------------------------------------------------------

Box3 Renderable::worldBounds() const {
    const Mesh* geo = geometry();
    if (!geo) return Box3();
    return geo->bounds().transformed(worldTransform());
}

// -----------------------------------------------------------------------------
// MeshNode
// -----------------------------------------------------------------------------

MeshNode::MeshNode(std::shared_ptr<Mesh> geometry, Material* material, std::string n)
    : Node(std::move(n))
    , m_geometry(std::move(geometry))
    , m_material(material)
{}

MeshNode::MeshNode(Mesh&& geometry, Material* material, std::string n)
    : MeshNode(std::make_shared<Mesh>(std::move(geometry)), material, std::move(n))
{}

bool MeshNode::isCollidable() const {
    if (!m_geometry || m_geometry->disposed()) return false;
    if (m_material && m_material->passesLight()) return false;
    return true;
}

} // namespace vitrail::render3d
