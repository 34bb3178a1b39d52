#include <juce_core/juce_core.h>
#include <iostream>

/**
 * Runs every registered juce::UnitTest, or only one category when named on
 * the command line. Exits non-zero if any expectation failed.
 */
int main (int argc, char* argv[])
{
    juce::UnitTestRunner runner;
    runner.setAssertOnFailure (false);

    if (argc > 1)
        runner.runTestsInCategory (argv[1]);
    else
        runner.runAllTests();

    int failures = 0;
    for (int i = 0; i < runner.getNumResults(); ++i)
        if (auto* result = runner.getResult (i))
            failures += result->failures;

    std::cout << (failures == 0 ? "All tests passed" : juce::String (failures) + " failure(s)") << std::endl;
    return failures == 0 ? 0 : 1;
}
