#include <scrub/assert_test.h>

#include <scrub/Pl_String.hh>
#include <scrub/ScrubLogger.hh>
#include <iostream>
#include <sstream>
#include <stdexcept>

static void
test_defaults()
{
    auto logger = ScrubLogger::defaultLogger();
    assert(logger == ScrubLogger::defaultLogger());
    logger->info("info to stdout\n");
    logger->warn("warn to stderr\n");
    logger->error("error to stderr\n");
    logger->setWarn(logger->discard());
    logger->warn("warning not seen\n");
    logger->setWarn(nullptr);
    logger->warn("restored warning to stderr\n");
}

static void
test_channels()
{
    auto l = ScrubLogger::create();

    // Warning follows error when error is set explicitly.
    std::string errors;
    auto pl_error = std::make_shared<Pl_String>("errors", nullptr, errors);
    l->setError(pl_error);
    l->warn("warn follows error\n");
    assert(errors == "warn follows error\n");
    l->error("error too\n");
    assert(errors == "warn follows error\nerror too\n");

    // Set warnings -- now they're separate
    std::string warnings;
    auto pl_warn = std::make_shared<Pl_String>("warnings", nullptr, warnings);
    l->setWarn(pl_warn);
    l->warn(std::string("warning now separate\n"));
    l->error(std::string("new error\n"));
    assert(warnings == "warning now separate\n");
    assert(errors == "warn follows error\nerror too\nnew error\n");

    // Restore warnings to default -- follows error again
    l->setWarn(nullptr);
    l->warn("warning 3\n");
    assert(warnings == "warning now separate\n");
    assert(errors == "warn follows error\nerror too\nnew error\nwarning 3\n");

    l->setInfo(nullptr);
    l->setWarn(nullptr);
    l->setError(nullptr);
    l->info("after reset, info to stdout\n");
    l->error("after reset, error to stderr\n");
}

static void
test_debug()
{
    auto l = ScrubLogger::create();
    std::string info;
    l->setInfo(std::make_shared<Pl_String>("info", nullptr, info));
    l->setDebug(false);
    l->debug("not shown");
    assert(info.empty());
    l->setDebug(true);
    assert(l->getDebug());
    l->debug("clean: removed 2 resources");
    assert(info == "scrub: clean: removed 2 resources\n");
}

static void
test_streams()
{
    auto l = ScrubLogger::create();
    std::ostringstream out;
    std::ostringstream err;
    l->setOutputStreams(&out, &err);
    l->info("to out\n");
    l->warn("to err\n");
    l->getInfo()->finish();
    l->getError()->finish();
    assert(out.str() == "to out\n");
    assert(err.str() == "to err\n");
    l->setOutputStreams(nullptr, nullptr);
    assert(l->getInfo() == l->standardOutput());
}

int
main()
{
    test_defaults();
    test_channels();
    test_debug();
    test_streams();
    std::cout << "assertions passed\n";
    return 0;
}
