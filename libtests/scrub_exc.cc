#include <scrub/assert_test.h>

#include <scrub/ScrubExc.hh>
#include <iostream>

static void
throw_structure()
{
    throw ScrubExc(scrub_e_structure, "clean", "7 0 R", "loop detected in page tree");
}

int
main()
{
    try {
        throw_structure();
        assert(false);
    } catch (std::runtime_error& e) {
        assert(std::string(e.what()) == "clean (7 0 R): loop detected in page tree");
    }
    try {
        throw_structure();
        assert(false);
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == scrub_e_structure);
        assert(e.getPhase() == "clean");
        assert(e.getObject() == "7 0 R");
        assert(e.getMessageDetail() == "loop detected in page tree");
    }

    ScrubExc no_object(scrub_e_configuration, "configuration", "", "bad threshold");
    assert(std::string(no_object.what()) == "configuration: bad threshold");
    ScrubExc no_phase(scrub_e_crypto, "", "", "signing failed");
    assert(std::string(no_phase.what()) == "signing failed");

    std::cout << "assertions passed\n";
    return 0;
}
