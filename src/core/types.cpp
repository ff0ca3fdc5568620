#include "core/types.hpp"

namespace ctune {

const char* mode_name(Mode mode) {
    switch (mode) {
        case Mode::Strict: return "strict";
        case Mode::Default: return "default";
        case Mode::Relaxed: return "relaxed";
    }
    return "default";
}

bool parse_mode(const std::string& s, Mode& out) {
    if (s == "strict" || s == "0") {
        out = Mode::Strict;
        return true;
    }
    if (s == "default" || s == "1") {
        out = Mode::Default;
        return true;
    }
    if (s == "relaxed" || s == "2") {
        out = Mode::Relaxed;
        return true;
    }
    return false;
}

const char* level_name(ContrastLevel level) {
    switch (level) {
        case ContrastLevel::Fails: return "FAIL";
        case ContrastLevel::MeetsStandard: return "AA";
        case ContrastLevel::MeetsHigh: return "AAA";
    }
    return "FAIL";
}

const char* readability_name(Readability r) {
    switch (r) {
        case Readability::NotReadable: return "not readable";
        case Readability::Readable: return "readable";
        case Readability::VeryReadable: return "very readable";
    }
    return "not readable";
}

const char* status_name(TuneStatus status) {
    switch (status) {
        case TuneStatus::AlreadyPasses: return "already passes";
        case TuneStatus::PassesStandard: return "passes standard";
        case TuneStatus::PassesHigh: return "passes high standard";
        case TuneStatus::Failed: return "failed";
    }
    return "failed";
}

}
