#include "common.h"

rxcp::capacity_report rxcp::check_capacity(
    endpoint_session& destination,
    const std::string& directory_path,
    const uint64_t source_length,
    const copy_event_sink& on_event)
{
    capacity_report report;
    report.available = destination.query_free_space(directory_path);
    report.available95 = (uint64_t)((double)report.available * 0.95);
    report.required = (uint64_t)((double)source_length * 1.1);

    raise_event(on_event, copy_event_kind::required_space,
                fmt::format("Required space on {}: {} bytes, available: {} bytes",
                            destination.host().to_string(), report.required, report.available));

    if (source_length >= report.available95) {
        throw copy_error(error_kind::insufficient_space,
                         fmt::format("Insufficient space on {}: required {} bytes, available {} bytes",
                                     destination.host().to_string(), report.required, report.available));
    }

    LOG_DEBUG("Capacity check passed: {} < {} (95% of {})", source_length, report.available95, report.available);
    return report;
}
