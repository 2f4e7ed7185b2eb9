#include <vitrail/input.h>
#include <algorithm>

namespace vitrail {

namespace {

template<typename Vec>
bool eraseById(Vec& entries, ListenerId id) {
    auto it = std::find_if(entries.begin(), entries.end(),
                           [id](const auto& e) { return e.id == id; });
    if (it == entries.end()) return false;
    entries.erase(it);
    return true;
}

template<typename Vec>
bool containsId(const Vec& entries, ListenerId id) {
    return std::any_of(entries.begin(), entries.end(),
                       [id](const auto& e) { return e.id == id; });
}

// Iterate a snapshot so listeners may subscribe or unsubscribe while we run,
// but skip any entry that was removed after the snapshot was taken
template<typename Vec, typename... Args>
void dispatch(const Vec& live, Args&&... args) {
    Vec snapshot = live;
    for (const auto& entry : snapshot) {
        if (!containsId(live, entry.id)) continue;
        entry.fn(args...);
    }
}

} // anonymous namespace

ListenerId InputTarget::onKeyDown(KeyListener listener) {
    ListenerId id = m_nextId++;
    m_keyDown.push_back({id, std::move(listener)});
    return id;
}

ListenerId InputTarget::onKeyUp(KeyListener listener) {
    ListenerId id = m_nextId++;
    m_keyUp.push_back({id, std::move(listener)});
    return id;
}

ListenerId InputTarget::onPointerMove(PointerMoveListener listener) {
    ListenerId id = m_nextId++;
    m_pointerMove.push_back({id, std::move(listener)});
    return id;
}

ListenerId InputTarget::onPointerLockChange(PointerLockListener listener) {
    ListenerId id = m_nextId++;
    m_lockChange.push_back({id, std::move(listener)});
    return id;
}

bool InputTarget::removeListener(ListenerId id) {
    return eraseById(m_keyDown, id) || eraseById(m_keyUp, id) ||
           eraseById(m_pointerMove, id) || eraseById(m_lockChange, id);
}

size_t InputTarget::listenerCount() const {
    return m_keyDown.size() + m_keyUp.size() + m_pointerMove.size() + m_lockChange.size();
}

void InputTarget::dispatchKey(const KeyEvent& event) {
    dispatch(event.action == KeyAction::Down ? m_keyDown : m_keyUp, event);
}

void InputTarget::dispatchPointerMove(const PointerMoveEvent& event) {
    dispatch(m_pointerMove, event);
}

void InputTarget::setPointerLocked(bool locked) {
    if (locked == m_pointerLocked) return;
    m_pointerLocked = locked;
    dispatch(m_lockChange, locked);
}

} // namespace vitrail
