#pragma once

/**
 * @file param.h
 * @brief Parameter wrapper classes for tweakable settings
 *
 * These wrappers combine parameter values with metadata (name, range, default)
 * so a GUI collaborator can enumerate and bind them without knowing the owning
 * struct. Parameters automatically generate ParamDecl for introspection.
 *
 * Parameters support optional bindings for reactive updates:
 * @code
 * // Bind to normalized source (0-1) with output range
 * castle.params().baseRadius.bind([&]() { return hand.pinch(); }, 0.4f, 2.0f);
 *
 * // Bind direct (no range mapping)
 * castle.params().seed.bindDirect([&]() { return presetSeed; });
 * @endcode
 */

#include <algorithm>
#include <functional>
#include <string>

namespace vitrail {

/**
 * @brief Parameter types for UI/serialization
 */
enum class ParamType {
    Float,    ///< Single float value
    Int,      ///< Integer value
    Bool      ///< Boolean toggle
};

/**
 * @brief Parameter declaration for introspection and UI generation
 */
struct ParamDecl {
    std::string name;           ///< Display name
    ParamType type;             ///< Data type
    float minVal = 0.0f;        ///< Minimum value
    float maxVal = 1.0f;        ///< Maximum value
    float defaultVal = 0.0f;    ///< Current value at declaration time
};

/**
 * @brief Type traits mapping C++ types to ParamType enum
 * @tparam T C++ type
 */
template<typename T> struct ParamTypeFor;
template<> struct ParamTypeFor<float> { static constexpr ParamType value = ParamType::Float; };
template<> struct ParamTypeFor<int>   { static constexpr ParamType value = ParamType::Int; };
template<> struct ParamTypeFor<bool>  { static constexpr ParamType value = ParamType::Bool; };

/**
 * @brief Scalar parameter wrapper (float, int, bool)
 * @tparam T Value type (float, int, or bool)
 *
 * Combines a value with metadata. Supports implicit conversion so it can
 * be used like a regular value.
 *
 * @par Example
 * @code
 * struct CastleParams {
 *     Param<float> wallHeight{"wallHeight", 0.6f, 0.2f, 1.5f};
 * };
 *
 * float h = params.wallHeight * 1.5f;
 * @endcode
 */
template<typename T>
class Param {
public:
    /**
     * @brief Construct a parameter
     * @param name Key used for UI labels and config files
     * @param defaultVal Default value
     * @param minVal Minimum allowed value
     * @param maxVal Maximum allowed value
     */
    Param(const char* name, T defaultVal, T minVal = T{}, T maxVal = T{1})
        : m_name(name), m_value(defaultVal), m_min(minVal), m_max(maxVal) {}

    /// @brief Implicit conversion to value type (evaluates binding if set)
    operator T() const { return get(); }

    /// @brief Get value explicitly (evaluates binding if set)
    T get() const {
        if (m_binding) {
            return m_binding();
        }
        return m_value;
    }

    /// @brief Assignment operator (clears any binding)
    ///
    /// The value is stored as given; range enforcement is the job of
    /// setClamped(), used by the config loader and UI.
    Param& operator=(T v) {
        m_value = v;
        m_binding = nullptr;
        return *this;
    }

    /// @brief Store v clamped to [min, max] (clears any binding)
    Param& setClamped(T v) {
        return *this = clamp(v);
    }

    /// @brief Clamp a candidate value to this parameter's range
    T clamp(T v) const {
        return std::min(std::max(v, m_min), m_max);
    }

    // -------------------------------------------------------------------------
    /// @name Binding
    /// @{

    /**
     * @brief Bind to a normalized source (0-1) with output range
     * @param source Function returning 0-1 normalized value
     * @param outMin Output minimum (when source returns 0)
     * @param outMax Output maximum (when source returns 1)
     */
    void bind(std::function<float()> source, T outMin, T outMax) {
        m_binding = [source = std::move(source), outMin, outMax]() {
            float t = source();
            return static_cast<T>(outMin + t * (outMax - outMin));
        };
    }

    /**
     * @brief Bind directly to a source (no range mapping)
     * @param source Function returning the exact value
     */
    void bindDirect(std::function<T()> source) {
        m_binding = std::move(source);
    }

    /// @brief Clear any binding
    void unbind() {
        m_binding = nullptr;
    }

    /// @brief Check if parameter has a binding
    bool isBound() const { return m_binding != nullptr; }

    /// @}
    // -------------------------------------------------------------------------

    /// @brief Get parameter name
    const char* name() const { return m_name; }

    /// @brief Get minimum value
    T min() const { return m_min; }

    /// @brief Get maximum value
    T max() const { return m_max; }

    /**
     * @brief Generate ParamDecl for introspection
     * @return ParamDecl with name, type, range, and current value
     */
    ParamDecl decl() const {
        return {m_name, ParamTypeFor<T>::value,
                static_cast<float>(m_min), static_cast<float>(m_max),
                static_cast<float>(get())};
    }

private:
    const char* m_name;
    T m_value;
    T m_min, m_max;
    std::function<T()> m_binding;
};

} // namespace vitrail
