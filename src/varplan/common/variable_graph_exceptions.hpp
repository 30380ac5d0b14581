/**
 * @file variable_graph_exceptions.hpp
 */
#pragma once
#include "varplan/common/common.hpp"

namespace varplan
{

/**
 * @brief Error codes for variable graph construction and resolution.
 */
enum class VariableGraphErrorCode
{
    InvalidName,
    DuplicateVariable,
    UndefinedReference,
    CircularDependency
};

/**
 * @brief Base exception for variable graph errors.
 *
 * @details
 * Every validation failure raised while deriving dependencies, constructing a
 * `VariableGraph` or resolving its build order is a `VariableGraphError`.
 * The failures are derived from the input alone; retrying the same input
 * yields the same error.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class VariableGraphError : public std::exception
{
public:
    /**
     * @brief Construct a VariableGraphError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    VariableGraphError(VariableGraphErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    VariableGraphErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    VariableGraphErrorCode m_code;
    std::string m_message;
};

/**
 * @brief Thrown when two declarations share a name, or a name is empty.
 */
class DuplicateVariableError : public VariableGraphError
{
public:
    DuplicateVariableError(VariableGraphErrorCode code, std::string name, std::string message)
        : VariableGraphError(code, std::move(message))
        , m_name(std::move(name))
    {
    }

    const std::string& name() const noexcept
    {
        return m_name;
    }

private:
    std::string m_name;
};

/**
 * @brief Thrown when a variable references a name that is not declared.
 */
class UndefinedReferenceError : public VariableGraphError
{
public:
    /**
     * @param missing_name The referenced name with no matching declaration.
     * @param referenced_by The name of the variable holding the reference.
     */
    UndefinedReferenceError(std::string missing_name, std::string referenced_by)
        : VariableGraphError(
              VariableGraphErrorCode::UndefinedReference,
              "variable \"" + missing_name + "\" is used in the variable \"" +
                  referenced_by + "\" but not defined")
        , m_missing_name(std::move(missing_name))
        , m_referenced_by(std::move(referenced_by))
    {
    }

    const std::string& missing_name() const noexcept
    {
        return m_missing_name;
    }

    const std::string& referenced_by() const noexcept
    {
        return m_referenced_by;
    }

private:
    std::string m_missing_name;
    std::string m_referenced_by;
};

/**
 * @brief Thrown when the dependency graph contains a cycle.
 * @note The cycle itself is not reported; see `VariableGraph::get_diagnostics()`.
 */
class CircularDependencyError : public VariableGraphError
{
public:
    CircularDependencyError()
        : VariableGraphError(VariableGraphErrorCode::CircularDependency,
                             "circular dependency detected")
    {
    }
};

} // namespace varplan
