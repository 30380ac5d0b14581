#include "varplan/common/plan_builder.hpp"
#include "varplan/execution/single_threaded_executor.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace
{

/// Prints each variable as it is evaluated.
class PrintingEvaluator : public varplan::IVariableEvaluator
{
public:
    void evaluate(const varplan::VariableDeclaration& variable) override
    {
        std::cout << "  evaluate " << variable.name;
        if (!variable.plugin_kind.empty())
        {
            std::cout << " (" << variable.plugin_kind << ")";
        }
        std::cout << "\n";
    }
};

} // namespace

int main(int argc, char** argv)
{
    using namespace varplan;

    try
    {
        std::cout << "\n\n====== varplan ======\n" << std::flush;

        PlanBuilder builder(true);
        builder.add_variable(make_computed_variable(
            "myVariable", "PrometheusPromQLVariable",
            SpecJson{{"expr", "sum by($doe) (rate($foo{label='$bar'}))"}}));
        builder.add_variable(make_computed_variable(
            "foo", "PrometheusPromQLVariable", SpecJson{{"expr", "test"}}));
        builder.add_variable(make_computed_variable(
            "bar", "PrometheusPromQLVariable", SpecJson{{"expr", "vector($foo)"}}));
        builder.add_variable(make_constant_variable("doe", "myConstant"));

        auto plan = builder.build();
        std::cout << "build order: " << format_build_order(plan->stage_names()) << "\n";

        PrintingEvaluator evaluator;
        auto executor = make_single_threaded_executor();
        auto result = executor->execute(plan, evaluator);
        std::cout << result.summary() << "\n";

        std::cout << "\n\n====== normal exit ======\n" << std::flush;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
