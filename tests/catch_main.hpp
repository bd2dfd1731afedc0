#ifndef CATCH_MAIN
#define CATCH_MAIN

#define CATCH_CONFIG_EXTERNAL_INTERFACES
#define CATCH_CONFIG_MAIN
#define CATCH_CONFIG_DEFAULT_REPORTER "verboseconsole"
#include <catch2/catch.hpp>

#include <cstdlib>

#include "libprintrelay/Utils.hpp"

namespace Catch {

struct VerboseConsoleReporter : public ConsoleReporter {
    double duration = 0.;
    using ConsoleReporter::ConsoleReporter;

    void testCaseStarting(TestCaseInfo const& _testInfo) override
    {
        Colour::use(Colour::Cyan);
        stream << "Testing ";
        Colour::use(Colour::None);
        stream << _testInfo.name << std::endl;
        ConsoleReporter::testCaseStarting(_testInfo);
    }

    void sectionStarting(const SectionInfo &_sectionInfo) override
    {
        if (_sectionInfo.name != currentTestCaseInfo->name)
            stream << _sectionInfo.name << std::endl;

        ConsoleReporter::sectionStarting(_sectionInfo);
    }

    void sectionEnded(const SectionStats &_sectionStats) override {
        duration += _sectionStats.durationInSeconds;
        ConsoleReporter::sectionEnded(_sectionStats);
    }

    void testCaseEnded(TestCaseStats const& stats) override
    {
        if (stats.totals.assertions.allOk()) {
            Colour::use(Colour::BrightGreen);
            stream << "Passed";
            Colour::use(Colour::None);
            stream << " in " << duration << " [seconds]\n" << std::endl;
        }

        duration = 0.;
        ConsoleReporter::testCaseEnded(stats);
    }
};

// Keeps the library logs quiet unless PRINTRELAY_TEST_LOG_LEVEL asks for more.
struct LogLevelListener : public TestEventListenerBase {
    using TestEventListenerBase::TestEventListenerBase;

    void testRunStarting(TestRunInfo const &info) override
    {
        const char *level = std::getenv("PRINTRELAY_TEST_LOG_LEVEL");
        int parsed = level != nullptr ? PrintRelay::parse_logging_level(level) : -1;
        PrintRelay::set_logging_level(parsed >= 0 ? unsigned(parsed) : 1);
        TestEventListenerBase::testRunStarting(info);
    }
};

CATCH_REGISTER_REPORTER("verboseconsole", VerboseConsoleReporter)
CATCH_REGISTER_LISTENER(LogLevelListener)

} // namespace Catch

#endif // CATCH_MAIN
