#include "srcfmt/types.hpp"

namespace srcfmt {

auto RunStatistics::record(FormatOutcome outcome) -> void {
    switch (outcome) {
    case FormatOutcome::SUCCESS:
        success_count++;
        break;
    case FormatOutcome::FAIL:
        fail_count++;
        break;
    case FormatOutcome::SKIPPED:
        skipped_count++;
        break;
    }
}

auto RunStatistics::total() const -> size_t {
    return success_count + fail_count + skipped_count + read_only_count;
}

auto outcome_name(FormatOutcome outcome) -> std::string {
    switch (outcome) {
    case FormatOutcome::SUCCESS:
        return "SUCCESS";
    case FormatOutcome::FAIL:
        return "FAIL";
    case FormatOutcome::SKIPPED:
        return "SKIPPED";
    }
    return "SKIPPED";
}

} // namespace srcfmt
