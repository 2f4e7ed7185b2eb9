#pragma once

/**
 * @file input.h
 * @brief Keyboard, pointer-motion and pointer-lock event source
 *
 * InputTarget stands in for the focusable surface the windowing layer owns
 * (the element that captures keys and holds pointer lock). The window pumps
 * raw events into it with dispatchKey() / setPointerLocked(); consumers such
 * as the walkthrough controller subscribe with listeners and must remove
 * them when they go away.
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace vitrail {

// Key codes for the keys we care about (matches GLFW values)
enum class Key : int {
    Unknown = -1,
    Space = 32,
    A = 65,
    D = 68,
    S = 83,
    W = 87,
    Escape = 256,
    Right = 262,
    Left = 263,
    Down = 264,
    Up = 265,
};

enum class KeyAction { Down, Up };

struct KeyEvent {
    Key key = Key::Unknown;
    KeyAction action = KeyAction::Down;
};

/// Relative pointer motion in pixels, as reported while the pointer is locked
struct PointerMoveEvent {
    float dx = 0.0f;
    float dy = 0.0f;
};

using ListenerId = uint32_t;
using KeyListener = std::function<void(const KeyEvent&)>;
using PointerMoveListener = std::function<void(const PointerMoveEvent&)>;
using PointerLockListener = std::function<void(bool locked)>;

/// Event source for keyboard and pointer-lock state
class InputTarget {
public:
    InputTarget() = default;

    InputTarget(const InputTarget&) = delete;
    InputTarget& operator=(const InputTarget&) = delete;

    // -------------------------------------------------------------------------
    /// @name Listeners
    /// @{

    /// Register a listener for key-down events
    ListenerId onKeyDown(KeyListener listener);

    /// Register a listener for key-up events
    ListenerId onKeyUp(KeyListener listener);

    /// Register a listener for relative pointer motion
    ListenerId onPointerMove(PointerMoveListener listener);

    /// Register a listener for pointer-lock changes
    ListenerId onPointerLockChange(PointerLockListener listener);

    /// Remove a listener by id. Returns false if it was not registered.
    bool removeListener(ListenerId id);

    /// Number of live listeners of all kinds
    size_t listenerCount() const;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Pointer Lock
    /// @{

    /// Ask for pointer lock. Headless targets grant it immediately.
    void requestPointerLock() { setPointerLocked(true); }

    /// Release pointer lock
    void exitPointerLock() { setPointerLocked(false); }

    bool isPointerLocked() const { return m_pointerLocked; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Event Injection
    /// @{

    /// Deliver a key event to the matching listeners
    ///
    /// A listener removed by an earlier listener during the same dispatch is
    /// not called.
    void dispatchKey(const KeyEvent& event);

    /// Deliver pointer motion to the motion listeners
    void dispatchPointerMove(const PointerMoveEvent& event);

    /// Change pointer-lock state; listeners fire only on an actual change
    void setPointerLocked(bool locked);

    /// @}

private:
    template<typename Fn>
    struct Entry {
        ListenerId id;
        Fn fn;
    };

    std::vector<Entry<KeyListener>> m_keyDown;
    std::vector<Entry<KeyListener>> m_keyUp;
    std::vector<Entry<PointerMoveListener>> m_pointerMove;
    std::vector<Entry<PointerLockListener>> m_lockChange;
    ListenerId m_nextId = 1;
    bool m_pointerLocked = false;
};

} // namespace vitrail
