/**
 * @file variable.hpp
 * @brief Variable declarations, stage groups and related type aliases.
 */
#pragma once
#include "varplan/common/common.hpp"
#include <nlohmann/json.hpp>

namespace varplan
{

// ============================================================================
// Index type aliases
// ============================================================================

/**
 * @brief Type alias for variable indices.
 *
 * @details
 * `VarIdx` identifies a variable by its position in the declaration list.
 * This alias exists for clarity in API signatures and documentation, not for
 * compile-time type safety.
 */
using VarIdx = size_t;

/**
 * @brief Type alias for stage indices. Stage 0 is evaluated first.
 */
using StageIdx = size_t;

/**
 * @brief Plugin payload of a variable, an arbitrary JSON document.
 *
 * @details
 * Object members keep the order in which they were written, so references
 * are reported in the order they appear in the payload.
 */
using SpecJson = nlohmann::ordered_json;

// ============================================================================
// Declarations
// ============================================================================

/**
 * @brief How a variable obtains its value.
 *
 * @details
 * Only `Computed` variables are scanned for references. A `Constant`
 * variable is always a leaf, whatever text its payload contains.
 */
enum class VariableKind
{
    Constant,  ///< Fixed value written in the dashboard.
    Computed   ///< Value produced by a plugin, possibly from a query expression.
};

/**
 * @brief A variable as declared by a dashboard.
 */
struct VariableDeclaration
{
    /// Unique, non-empty name.
    std::string name;

    VariableKind kind{VariableKind::Constant};

    /// Plugin that owns `spec` (e.g. "PrometheusPromQLVariable"). Empty for constants.
    std::string plugin_kind;

    /// Opaque payload. For constants this is the value itself.
    SpecJson spec;
};

/**
 * @brief Create a constant variable declaration.
 */
inline VariableDeclaration make_constant_variable(std::string name, SpecJson value)
{
    return VariableDeclaration{std::move(name), VariableKind::Constant, {}, std::move(value)};
}

/**
 * @brief Create a plugin-computed variable declaration.
 */
inline VariableDeclaration make_computed_variable(std::string name,
                                                  std::string plugin_kind,
                                                  SpecJson spec)
{
    return VariableDeclaration{
        std::move(name), VariableKind::Computed, std::move(plugin_kind), std::move(spec)};
}

// ============================================================================
// Dependency and ordering types
// ============================================================================

/**
 * @brief Referenced names per variable, as `name -> [referenced names]`.
 *
 * @details
 * Variables without references may be absent from the map. Each list holds
 * distinct names in first-seen order.
 */
using DependencyMap = std::unordered_map<std::string, std::vector<std::string>>;

/**
 * @brief A set of variables that may be evaluated concurrently.
 *
 * @details
 * No member depends on another member, and every dependency of a member lies
 * in an earlier group. Members keep their declaration order.
 */
struct VariableGroup
{
    std::vector<std::string> variables;
};

/**
 * @brief Render a build order as `[{a, b}, {c}]`.
 */
inline std::string format_build_order(const std::vector<VariableGroup>& groups)
{
    std::string result = "[";
    for (size_t g = 0; g < groups.size(); ++g)
    {
        if (g > 0)
        {
            result += ", ";
        }
        result += "{";
        const auto& names = groups[g].variables;
        for (size_t i = 0; i < names.size(); ++i)
        {
            if (i > 0)
            {
                result += ", ";
            }
            result += names[i];
        }
        result += "}";
    }
    result += "]";
    return result;
}

} // namespace varplan
