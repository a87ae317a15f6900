#include "describe.hxx"
#include "options.hxx"
#include "traverse.hxx"

#include <cstdlib>


namespace
{

using namespace treewalk;


void show_example()
{
    //
    //              1
    //          ┌───┴───┐
    //          2       5
    //      ┌───┴───┐
    //      3       4
    //          ┌───┘
    //          6
    //
    auto tree = make_node(1,
        make_node(2,
            make_node(3),
            make_node(4, make_node(6))),
        make_node(5));

    InfoBlock("example {}", describe(tree.get()));

    for (auto n : traverse(tree.get()))
        Info("{}", n->value());
}


} // namespace {}



int main(int argc, char** argv)
{
    VerboseBlock("main()");

    proptest::command_line cl;
    try
    {
        cl = proptest::parse_command_line(argc, argv);
    }
    catch (std::exception& e)
    {
        Error("{}", e.what());
        Info("{}", proptest::usage(argv[0]));
        return 2;
    }

    if (cl.help)
    {
        Info("{}", proptest::usage(argv[0]));
        return EXIT_SUCCESS;
    }

    if (cl.threshold)
        setThreshold(*cl.threshold);

    const auto& config = cl.config;

    try
    {
        show_example();

        auto reports = proptest::run_properties(
            proptest::standard_properties(proptest::stack_traversal(), proptest::recursive_traversal()),
            config
        );

        bool ok = true;
        for (const auto& r : reports)
        {
            if (r.passed())
            {
                Info("{}", proptest::format_report(r));
            }
            else
            {
                Error("{}", proptest::format_report(r));
                ok = false;
            }
        }

        return ok ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (std::exception& e)
    {
        Error("Caught [{}]", e.what());
    }

    return EXIT_FAILURE;
}
