#include "common.h"

namespace
{
    class copy_operation
    {
    public:
        RXCP_DISABLE_COPY_CONSTRUCTOR(copy_operation)
        RXCP_DISABLE_MOVE_CONSTRUCTOR(copy_operation)

        copy_operation(rxcp::session_registry& sessions, const rxcp::copy_options& options, const rxcp::copy_event_sink& on_event)
            : _sessions(sessions),
              _options(options),
              _on_event(on_event)
        { }

        ~copy_operation() noexcept
        {
            if (_local_channel) {
                _local_channel->dispose();
            }
        }

        rxcp::copy_result run(const std::string& source, const std::string& destination)
        {
            rxcp::copy_result result;
            try {
                execute(source, destination);
            }
            catch (const rxcp::copy_error& ex) {
                LOG_DEBUG("Copy failed after phase {}: {}: {}", rxcp::to_string(_phase), rxcp::to_string(ex.kind), ex.error_message);
                result.kind = ex.kind;
                result.message = ex.error_message;
            }
            catch (const std::exception& ex) {
                LOG_ERROR("Copy failed after phase {}: {}", rxcp::to_string(_phase), ex.what());
                result.kind = rxcp::error_kind::io_failure;
                result.message = ex.what();
            }
            result.last_phase = _phase;
            return result;
        }

    private:
        void advance(const rxcp::copy_phase phase)
        {
            ASSERT(phase > _phase);
            LOG_DEBUG("Phase: {} -> {}", rxcp::to_string(_phase), rxcp::to_string(phase));
            _phase = phase;
        }

        std::shared_ptr<rxcp::execution_channel> channel_for(const rxcp::host_ref& host)
        {
            if (host.is_local) {
                if (!_local_channel) {
                    _local_channel = std::make_shared<rxcp::local_channel>(_sessions.local_host_id());
                }
                return _local_channel;
            }
            return _sessions.lookup(host);
        }

        void report_host(const rxcp::endpoint_session& endpoint)
        {
            const rxcp::host_ref& host = endpoint.host();
            if (host.is_local) {
                rxcp::raise_event(_on_event, rxcp::copy_event_kind::host_verification,
                                  fmt::format("{} host: {} (local)", endpoint.role(), host.id));
                return;
            }

            const std::string& channel_host = endpoint.channel().host_id();
            if (!rxcp::equals_ignore_case(channel_host, host.id)) {
                LOG_WARN("Session for {} is connected to host {}", host.id, channel_host);
            }
            rxcp::raise_event(_on_event, rxcp::copy_event_kind::host_verification,
                              fmt::format("{} host: {} (session to {})", endpoint.role(), host.id, channel_host));
        }

        void execute(const std::string& source, const std::string& destination)
        {
            const rxcp::path_spec source_spec = rxcp::parse_path_spec(source, _sessions.local_host_id(), false);
            const rxcp::path_spec destination_spec = rxcp::parse_path_spec(destination, _sessions.local_host_id(), true);
            advance(rxcp::copy_phase::parsed);

            const bool both_local = source_spec.host.is_local && destination_spec.host.is_local;

            rxcp::endpoint_session source_endpoint("Source", source_spec.host, channel_for(source_spec.host));
            if (!both_local) {
                report_host(source_endpoint);
            }
            const rxcp::file_metadata metadata = rxcp::probe_source(source_endpoint, source_spec);
            advance(rxcp::copy_phase::source_resolved);

            // The destination session is looked up only once the source is known to be copyable
            rxcp::endpoint_session destination_endpoint("Destination", destination_spec.host, channel_for(destination_spec.host));
            if (!both_local) {
                report_host(destination_endpoint);
            }
            const rxcp::destination_resolution resolution =
                rxcp::resolve_destination(destination_endpoint, destination_spec, metadata, _options.force);
            advance(rxcp::copy_phase::destination_resolved);

            //
            // Both local: one direct copy
            //
            if (both_local) {
                destination_endpoint.copy_local(metadata.full_path, resolution.full_path, _options.force);
                LOG_INFO("Copied {} to {} locally", metadata.full_path, resolution.full_path);
                advance(rxcp::copy_phase::local_short_circuit);
                advance(rxcp::copy_phase::done);
                return;
            }

            //
            // Both on the same remote host: one copy on that host
            //
            if (!source_spec.host.is_local && source_spec.host.same_host(destination_spec.host)) {
                source_endpoint.copy_local(metadata.full_path, resolution.full_path, _options.force);
                LOG_INFO("Copied {} to {} on host {}", metadata.full_path, resolution.full_path, source_spec.host.id);
                advance(rxcp::copy_phase::same_host_short_circuit);
                advance(rxcp::copy_phase::done);
                return;
            }

            (void)rxcp::check_capacity(destination_endpoint, resolution.parent_path, metadata.length, _on_event);
            advance(rxcp::copy_phase::capacity_checked);

            const rxcp::channel_limits limits = destination_spec.host.is_local
                ? source_endpoint.channel().limits()
                : destination_endpoint.channel().limits();
            const rxcp::transfer_plan plan = rxcp::make_transfer_plan(
                metadata, resolution.full_path, limits, _options.check, _options.force, _options.sub_chunk_size);

            rxcp::transfer_engine engine(source_endpoint, destination_endpoint, plan, _on_event);
            (void)engine.run();
            advance(rxcp::copy_phase::transferred);

            if (plan.check) {
                (void)rxcp::verify_transfer(
                    source_endpoint, metadata.full_path, destination_endpoint, plan.destination_path, _on_event);
                advance(rxcp::copy_phase::verified);
            }

            advance(rxcp::copy_phase::done);
        }

    private:
        rxcp::session_registry& _sessions;
        const rxcp::copy_options& _options;
        const rxcp::copy_event_sink& _on_event;

        std::shared_ptr<rxcp::local_channel> _local_channel { nullptr };
        rxcp::copy_phase _phase = rxcp::copy_phase::none;
    };

}  // namespace


rxcp::copy_result rxcp::copy_file(
    session_registry& sessions,
    const std::string& source,
    const std::string& destination,
    const copy_options& options,
    const copy_event_sink& on_event)
{
    LOG_DEBUG("Copy {} -> {} (check={}, force={})", source, destination, options.check, options.force);

    copy_operation operation(sessions, options, on_event);
    copy_result result = operation.run(source, destination);

    if (result.succeeded()) {
        LOG_DEBUG("Copy {} -> {} succeeded", source, destination);
    }
    return result;
}
