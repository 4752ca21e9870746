#include "plonk/assignment.hpp"
#include "common/error.hpp"
#include "common/debug_control.hpp"
#include <iostream>

namespace plonkish {

const char* synthesis_phase_name(SynthesisPhase phase) {
    switch (phase) {
        case SynthesisPhase::Configuring: return "Configuring";
        case SynthesisPhase::Synthesizing: return "Synthesizing";
        case SynthesisPhase::Sealed: return "Sealed";
    }
    return "Unknown";
}

void Assignment::begin_synthesis() {
    if (phase_ != SynthesisPhase::Configuring) {
        throw Error::synthesis(std::string("cannot start synthesis from phase ") +
                               synthesis_phase_name(phase_));
    }
    phase_ = SynthesisPhase::Synthesizing;
}

void Assignment::seal() {
    if (phase_ != SynthesisPhase::Synthesizing) {
        throw Error::synthesis(std::string("cannot seal from phase ") +
                               synthesis_phase_name(phase_));
    }
    phase_ = SynthesisPhase::Sealed;
}

void Assignment::ensure_synthesizing(const char* operation) const {
    if (phase_ != SynthesisPhase::Synthesizing) {
        throw Error::synthesis(std::string(operation) + " while " +
                               synthesis_phase_name(phase_));
    }
}

std::vector<std::unique_ptr<Assignment>> Assignment::fork(const std::vector<RowRange>&) {
    throw Error::synthesis("this assignment does not support fork");
}

void Assignment::merge(std::vector<std::unique_ptr<Assignment>>) {
    throw Error::synthesis("this assignment does not support merge");
}

void Assignment::validate_fork_ranges(const std::vector<RowRange>& ranges, const RowRange& rw_rows) {
    size_t range_start = rw_rows.start;
    for (size_t i = 0; i < ranges.size(); ++i) {
        const RowRange& sub_range = ranges[i];
        if (sub_range.start < range_start) {
            std::cerr << "[fork] subCS_" << i << " sub_range.start (" << sub_range.start
                      << ") < range_start (" << range_start << ")" << std::endl;
            throw Error::synthesis("fork range " + sub_range.to_string() +
                                   " overlaps or precedes the previous range");
        }
        if (sub_range.end < sub_range.start) {
            std::cerr << "[fork] subCS_" << i << " inverted range " << sub_range.to_string() << std::endl;
            throw Error::synthesis("fork range " + sub_range.to_string() + " is inverted");
        }
        if (sub_range.end > rw_rows.end) {
            std::cerr << "[fork] subCS_" << i << " sub_range.end (" << sub_range.end
                      << ") > rw_rows.end (" << rw_rows.end << ")" << std::endl;
            throw Error::synthesis("fork range " + sub_range.to_string() +
                                   " exceeds read/write window " + rw_rows.to_string());
        }
        range_start = sub_range.end;
        PLONKISH_DEBUG_COUT("[fork] subCS_" << i << " rw_rows: " << sub_range.to_string() << std::endl);
    }
}

} // namespace plonkish
