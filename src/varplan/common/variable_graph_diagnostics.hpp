/**
 * @file variable_graph_diagnostics.hpp
 */
#pragma once
#include "varplan/common/common.hpp"
#include "varplan/common/variable.hpp"

namespace varplan
{

// ============================================================================
// Diagnostic item types
// ============================================================================

/**
 * @brief Category of diagnostic issue.
 */
enum class DiagnosticCategory
{
    InvalidName,         ///< A declaration has an empty name.
    DuplicateVariable,   ///< Two declarations share a name.
    UndefinedReference,  ///< A reference names no declared variable.
    CircularDependency   ///< Some variables can never be resolved.
};

/**
 * @brief A single validation error.
 *
 * @details
 * `involved_variables` lists the names the issue is about:
 * - InvalidName: empty.
 * - DuplicateVariable: the duplicated name, once.
 * - UndefinedReference: the referencing variable, then the missing name.
 * - CircularDependency: every variable left unresolved, in declaration
 *   order. This covers the cycle members and anything depending on them.
 */
struct DiagnosticItem
{
    DiagnosticCategory category;
    std::string message;
    std::vector<std::string> involved_variables;
};

// ============================================================================
// VariableGraphDiagnostics
// ============================================================================

/**
 * @brief Validation report for a set of variable declarations.
 *
 * @details
 * Unlike `VariableGraph::build_order()`, which stops at the first problem,
 * diagnostics collect every problem found so that a caller can report all of
 * them at once. Produced by `VariableGraph::get_diagnostics()` and
 * `PlanBuilder::get_diagnostics()`.
 *
 * @par Thread safety
 * - Once constructed, the data is immutable.
 * - Concurrent reads are safe.
 */
class VariableGraphDiagnostics
{
public:
    bool has_errors() const noexcept
    {
        return !m_errors.empty();
    }

    bool is_valid() const noexcept
    {
        return m_errors.empty();
    }

    const std::vector<DiagnosticItem>& errors() const noexcept
    {
        return m_errors;
    }

    /**
     * @brief Check whether any error has the given category.
     */
    bool has_category(DiagnosticCategory category) const noexcept
    {
        for (const auto& item : m_errors)
        {
            if (item.category == category)
            {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief Append an error.
     */
    void add_error(DiagnosticCategory category,
                   std::string message,
                   std::vector<std::string> involved_variables = {})
    {
        m_errors.push_back(
            DiagnosticItem{category, std::move(message), std::move(involved_variables)});
    }

    /**
     * @brief Append all errors of another report.
     */
    void merge(const VariableGraphDiagnostics& other)
    {
        m_errors.insert(m_errors.end(), other.m_errors.begin(), other.m_errors.end());
    }

private:
    std::vector<DiagnosticItem> m_errors;
};

} // namespace varplan
