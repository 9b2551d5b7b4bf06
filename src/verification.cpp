#include "common.h"

namespace
{
    // Wait for one digest. The first failure is kept in `failure`.
    std::string await_digest(
        std::future<rxcp::work_response>& pending,
        const std::string& path,
        std::optional<rxcp::copy_error>& failure)
    {
        try {
            rxcp::work_response response = pending.get();
            if (response.error_code != 0) {
                if (!failure.has_value()) {
                    failure.emplace(rxcp::error_kind::checksum_computation_error,
                                    "Can't compute digest of " + path + ": " + response.error_message);
                }
                return { };
            }

            const rxcp::digest_result* const digest = std::get_if<rxcp::digest_result>(&response.result);
            if (digest == nullptr) {
                if (!failure.has_value()) {
                    failure.emplace(rxcp::error_kind::channel_failure, "Digest of " + path + " returned an unexpected result");
                }
                return { };
            }
            return digest->hex;
        }
        catch (const rxcp::copy_error& ex) {
            if (!failure.has_value()) {
                failure.emplace(ex.kind, ex.error_message);
            }
            return { };
        }
    }

}  // namespace


rxcp::verification_result rxcp::verify_transfer(
    endpoint_session& source,
    const std::string& source_path,
    endpoint_session& destination,
    const std::string& destination_path,
    const copy_event_sink& on_event)
{
    LOG_DEBUG("Verifying {} against {}", destination_path, source_path);

    std::future<work_response> source_pending = source.digest_async(source_path);
    std::future<work_response> destination_pending = destination.digest_async(destination_path);

    // Wait for both, even if one of them failed
    std::optional<copy_error> failure { };
    verification_result result;
    result.source_digest = await_digest(source_pending, source_path, failure);
    result.destination_digest = await_digest(destination_pending, destination_path, failure);
    if (failure.has_value()) {
        throw failure.value();
    }

    raise_event(on_event, copy_event_kind::digest,
                fmt::format("Source digest ({}): {}", source.host().to_string(), result.source_digest));
    raise_event(on_event, copy_event_kind::digest,
                fmt::format("Destination digest ({}): {}", destination.host().to_string(), result.destination_digest));

    if (!equals_ignore_case(result.source_digest, result.destination_digest)) {
        std::string message = "Checksum mismatch: source " + result.source_digest + ", destination " + result.destination_digest;

        LOG_WARN("Digest mismatch, delete destination {}", destination_path);
        try {
            destination.delete_file(destination_path);
        }
        catch (const copy_error& ex) {
            LOG_ERROR("Delete mismatched destination {} failed: {}", destination_path, ex.error_message);
            message += "; delete destination failed: " + ex.error_message;
        }
        throw copy_error(error_kind::checksum_mismatch, message);
    }

    return result;
}
