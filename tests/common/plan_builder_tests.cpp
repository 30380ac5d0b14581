#include <gtest/gtest.h>
#include "varplan/common/plan_builder.hpp"

using namespace varplan;

using Names = std::vector<std::string>;

// =============================================================================
// Test Fixture
// =============================================================================

class PlanBuilderTests : public ::testing::Test
{
protected:
    static VariableDeclaration promql(const std::string& name, const std::string& expr)
    {
        return make_computed_variable(name, "PrometheusPromQLVariable",
                                      SpecJson{{"expr", expr}});
    }

    static VariableDeclaration text(const std::string& name, const std::string& value)
    {
        return make_constant_variable(name, value);
    }

    /// myVariable -> {doe, foo, bar}, bar -> {foo}
    static void add_dashboard(PlanBuilder& builder)
    {
        builder.add_variable(promql("myVariable", "sum by($doe) (rate($foo{label='$bar'}))"));
        builder.add_variable(promql("foo", "test"));
        builder.add_variable(promql("bar", "vector($foo)"));
        builder.add_variable(text("doe", "myConstant"));
    }
};

// =============================================================================
// build()
// =============================================================================

TEST_F(PlanBuilderTests, Build_Empty_NoStage)
{
    PlanBuilder builder(true);
    auto plan = builder.build();
    EXPECT_EQ(plan->variable_count(), 0u);
    EXPECT_EQ(plan->stage_count(), 0u);
    EXPECT_TRUE(plan->stage_names().empty());
}

TEST_F(PlanBuilderTests, Build_Dashboard_StagesAndIndices)
{
    PlanBuilder builder(true);
    add_dashboard(builder);
    EXPECT_EQ(builder.variable_count(), 4u);

    auto plan = builder.build();
    ASSERT_EQ(plan->variable_count(), 4u);
    ASSERT_EQ(plan->stage_count(), 3u);

    const VarIdx my_variable = plan->index_of("myVariable");
    const VarIdx foo = plan->index_of("foo");
    const VarIdx bar = plan->index_of("bar");
    const VarIdx doe = plan->index_of("doe");
    EXPECT_EQ(my_variable, 0u);
    EXPECT_EQ(doe, 3u);

    EXPECT_EQ(plan->stages[0], (std::vector<VarIdx>{foo, doe}));
    EXPECT_EQ(plan->stages[1], (std::vector<VarIdx>{bar}));
    EXPECT_EQ(plan->stages[2], (std::vector<VarIdx>{my_variable}));

    EXPECT_EQ(plan->stage_of[foo], 0u);
    EXPECT_EQ(plan->stage_of[bar], 1u);
    EXPECT_EQ(plan->stage_of[my_variable], 2u);

    EXPECT_EQ(plan->dependencies[my_variable], (std::vector<VarIdx>{doe, foo, bar}));
    EXPECT_EQ(plan->dependencies[bar], (std::vector<VarIdx>{foo}));
    EXPECT_TRUE(plan->dependencies[foo].empty());
    EXPECT_EQ(plan->dependents[foo], (std::vector<VarIdx>{my_variable, bar}));
    EXPECT_EQ(plan->dependents[doe], (std::vector<VarIdx>{my_variable}));
    EXPECT_TRUE(plan->dependents[my_variable].empty());

    auto groups = plan->stage_names();
    EXPECT_EQ(format_build_order(groups), "[{foo, doe}, {bar}, {myVariable}]");

    EXPECT_THROW(plan->index_of("nope"), std::out_of_range);
}

TEST_F(PlanBuilderTests, Build_ConstantPayload_NotScanned)
{
    PlanBuilder builder(true);
    builder.add_variable(text("a", "$undeclared"));
    auto plan = builder.build();
    EXPECT_EQ(plan->stage_count(), 1u);
}

TEST_F(PlanBuilderTests, Build_ForwardReference_Allowed)
{
    PlanBuilder builder(true);
    builder.add_variable(promql("a", "up{job=\"$job\"}"));
    builder.add_variable(text("job", "api"));
    auto plan = builder.build();
    EXPECT_EQ(format_build_order(plan->stage_names()), "[{job}, {a}]");
}

TEST_F(PlanBuilderTests, Build_Cycle_ThrowsPlanValidationError)
{
    PlanBuilder builder(true);
    builder.add_variable(promql("a", "$b"));
    builder.add_variable(promql("b", "$a"));
    try
    {
        builder.build();
        FAIL() << "expected PlanValidationError";
    }
    catch (const PlanValidationError& e)
    {
        ASSERT_NE(e.diagnostics(), nullptr);
        EXPECT_TRUE(e.diagnostics()->has_category(DiagnosticCategory::CircularDependency));
        EXPECT_NE(std::string{e.what()}.find("circular dependency detected"), std::string::npos);
    }
}

// =============================================================================
// Eager vs deferred validation
// =============================================================================

TEST_F(PlanBuilderTests, Eager_DuplicateName_ThrowsOnAdd)
{
    PlanBuilder builder(true);
    builder.add_variable(text("a", "1"));
    EXPECT_THROW(builder.add_variable(promql("a", "up")), DuplicateVariableError);
    EXPECT_EQ(builder.variable_count(), 1u);
}

TEST_F(PlanBuilderTests, Eager_EmptyName_ThrowsOnAdd)
{
    PlanBuilder builder(true);
    EXPECT_THROW(builder.add_variable(text("", "1")), DuplicateVariableError);
}

TEST_F(PlanBuilderTests, Deferred_DuplicateName_ReportedAtBuild)
{
    PlanBuilder builder(false);
    builder.add_variable(text("a", "1"));
    builder.add_variable(text("a", "2"));
    EXPECT_EQ(builder.variable_count(), 2u);

    auto diag = builder.get_diagnostics();
    ASSERT_EQ(diag->errors().size(), 1u);
    EXPECT_EQ(diag->errors()[0].category, DiagnosticCategory::DuplicateVariable);
    EXPECT_EQ(diag->errors()[0].involved_variables, (Names{"a"}));

    EXPECT_THROW(builder.build(), PlanValidationError);
}

// =============================================================================
// get_diagnostics()
// =============================================================================

TEST_F(PlanBuilderTests, Diagnostics_Valid)
{
    PlanBuilder builder(true);
    add_dashboard(builder);
    auto diag = builder.get_diagnostics();
    EXPECT_TRUE(diag->is_valid());
}

TEST_F(PlanBuilderTests, Diagnostics_UndefinedReference_NamesBothVariables)
{
    PlanBuilder builder(true);
    builder.add_variable(promql("myVariable", "sum by($doe, $bar) (rate($foo{label='$bar'}))"));
    auto diag = builder.get_diagnostics();

    ASSERT_EQ(diag->errors().size(), 3u);
    EXPECT_EQ(diag->errors()[0].category, DiagnosticCategory::UndefinedReference);
    EXPECT_EQ(diag->errors()[0].involved_variables, (Names{"myVariable", "doe"}));
    EXPECT_EQ(diag->errors()[0].message,
              "variable \"doe\" is used in the variable \"myVariable\" but not defined");
    EXPECT_EQ(diag->errors()[1].involved_variables, (Names{"myVariable", "bar"}));
    EXPECT_EQ(diag->errors()[2].involved_variables, (Names{"myVariable", "foo"}));
}

TEST_F(PlanBuilderTests, Diagnostics_ReportsEveryProblem)
{
    PlanBuilder builder(false);
    builder.add_variable(promql("a", "$missing + $b"));
    builder.add_variable(promql("b", "$a"));
    builder.add_variable(text("c", "1"));
    builder.add_variable(text("c", "2"));
    builder.add_variable(text("", "3"));

    auto diag = builder.get_diagnostics();
    ASSERT_EQ(diag->errors().size(), 4u);
    EXPECT_EQ(diag->errors()[0].category, DiagnosticCategory::DuplicateVariable);
    EXPECT_EQ(diag->errors()[1].category, DiagnosticCategory::InvalidName);
    EXPECT_EQ(diag->errors()[2].category, DiagnosticCategory::UndefinedReference);
    EXPECT_EQ(diag->errors()[2].involved_variables, (Names{"a", "missing"}));
    EXPECT_EQ(diag->errors()[3].category, DiagnosticCategory::CircularDependency);
    EXPECT_EQ(diag->errors()[3].involved_variables, (Names{"a", "b"}));

    try
    {
        builder.build();
        FAIL() << "expected PlanValidationError";
    }
    catch (const PlanValidationError& e)
    {
        EXPECT_EQ(e.diagnostics()->errors().size(), 4u);
        EXPECT_NE(std::string{e.what()}.find("4 error(s)"), std::string::npos);
    }
}
