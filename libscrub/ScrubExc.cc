#include <scrub/ScrubExc.hh>

ScrubExc::ScrubExc(
    scrub_error_code_e error_code,
    std::string const& phase,
    std::string const& object,
    std::string const& message) :
    std::runtime_error(createWhat(phase, object, message)),
    error_code(error_code),
    phase(phase),
    object(object),
    message(message)
{
}

std::string
ScrubExc::createWhat(
    std::string const& phase, std::string const& object, std::string const& message)
{
    std::string result;
    if (!phase.empty()) {
        result += phase;
    }
    if (!object.empty()) {
        if (!phase.empty()) {
            result += " (";
        }
        result += object;
        if (!phase.empty()) {
            result += ")";
        }
    }
    if (!result.empty()) {
        result += ": ";
    }
    result += message;
    return result;
}

scrub_error_code_e
ScrubExc::getErrorCode() const
{
    return error_code;
}

std::string const&
ScrubExc::getPhase() const
{
    return phase;
}

std::string const&
ScrubExc::getObject() const
{
    return object;
}

std::string const&
ScrubExc::getMessageDetail() const
{
    return message;
}
