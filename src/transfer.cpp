#include "common.h"


uint64_t rxcp::negotiate_chunk_size(const channel_limits& limits) noexcept
{
    uint64_t chunk_size = limits.max_received_data_per_command / 4;
    if (chunk_size == 0) {
        chunk_size = limits.max_received_object_size / 4;
    }
    if (chunk_size == 0) {
        chunk_size = DEFAULT_CHUNK_SIZE;
    }
    return chunk_size;
}

rxcp::transfer_plan rxcp::make_transfer_plan(
    const file_metadata& source,
    std::string destination_path,
    const channel_limits& limits,
    const bool check,
    const bool force,
    const uint64_t sub_chunk_size)
{
    ASSERT(sub_chunk_size > 0);

    transfer_plan plan;
    plan.source = source;
    plan.destination_path = std::move(destination_path);
    plan.total_bytes = source.length;
    plan.chunk_size = negotiate_chunk_size(limits);
    plan.sub_chunk_size = std::min(sub_chunk_size, plan.chunk_size);
    plan.check = check;
    plan.force = force;

    LOG_DEBUG("Transfer plan: {} -> {}, {} bytes, chunk size {}, sub-chunk size {}",
              plan.source.full_path, plan.destination_path, plan.total_bytes, plan.chunk_size, plan.sub_chunk_size);
    return plan;
}



//==============================================================================
// class sub_chunk_sequence
//==============================================================================

rxcp::sub_chunk_sequence::sub_chunk_sequence(
    endpoint_session& source,
    const uint64_t handle,
    const uint64_t send_size,
    const uint64_t sub_chunk_size)
    : _source(source),
      _handle(handle),
      _send_size(send_size),
      _sub_chunk_size(sub_chunk_size),
      _count((send_size + sub_chunk_size - 1) / sub_chunk_size)
{
    ASSERT(sub_chunk_size > 0);
}

bool rxcp::sub_chunk_sequence::next(/*out*/ sub_chunk_result& sub_chunk)
{
    if (_end_of_file || _produced >= _send_size) {
        return false;
    }

    const uint64_t max_bytes = std::min(_sub_chunk_size, _send_size - _produced);
    sub_chunk = _source.read_sub_chunk(_handle, max_bytes);
    if (sub_chunk.raw_length == 0) {
        LOG_TRACE("Source reached end of file after {} of {} bytes in this chunk", _produced, _send_size);
        _end_of_file = true;
        return false;
    }

    ASSERT(sub_chunk.raw_length <= max_bytes);
    _produced += sub_chunk.raw_length;
    return true;
}



//==============================================================================
// class transfer_engine
//==============================================================================

bool rxcp::transfer_engine::should_report_progress(const uint64_t iteration, const uint64_t total_iterations) noexcept
{
    uint64_t step;
    if (total_iterations <= 10) {
        step = 1;
    }
    else if (total_iterations <= 100) {
        step = 5;
    }
    else if (total_iterations <= 1000) {
        step = 25;
    }
    else {
        step = 100;
    }
    return (iteration % step == 0) || (iteration == total_iterations);
}

void rxcp::transfer_engine::close_quietly(endpoint_session& endpoint, std::optional<uint64_t>& handle) noexcept
{
    if (!handle.has_value()) return;

    const uint64_t value = handle.value();
    handle.reset();
    try {
        endpoint.close(value);
    }
    catch (const std::exception& ex) {
        LOG_WARN("Close handle #{} at {} failed: {}", value, endpoint.role(), ex.what());
    }
}

rxcp::transfer_statistics rxcp::transfer_engine::run()
{
    ASSERT(_plan.chunk_size > 0);
    ASSERT(_plan.sub_chunk_size > 0 && _plan.sub_chunk_size <= _plan.chunk_size);

    transfer_statistics stats;
    const uint64_t total_iterations = (_plan.total_bytes + _plan.chunk_size - 1) / _plan.chunk_size;
    const std::chrono::steady_clock::time_point start_time = std::chrono::steady_clock::now();

    std::optional<uint64_t> source_handle { };
    std::optional<uint64_t> destination_handle { };

    infra::sweeper error_cleanup = [&]() {
        close_quietly(_destination, destination_handle);
        close_quietly(_source, source_handle);
    };

    source_handle = _source.open_read(_plan.source.full_path);
    destination_handle = _destination.open_write(_plan.destination_path, false);
    LOG_DEBUG("Transfer {} ({}) -> {} ({}): {} iterations",
              _plan.source.full_path, _source.host().to_string(),
              _plan.destination_path, _destination.host().to_string(), total_iterations);

    // May end negative: decremented by the full chunk size each iteration
    int64_t remaining = (int64_t)_plan.total_bytes;
    uint32_t received = 0;

    while (remaining > 0) {
        const uint64_t send_size = std::min<uint64_t>((uint64_t)remaining, _plan.chunk_size);
        remaining -= (int64_t)_plan.chunk_size;

        sub_chunk_sequence sequence(_source, source_handle.value(), send_size, _plan.sub_chunk_size);
        LOG_TRACE("Iteration {}: {} bytes in {} sub-chunks", stats.iterations + 1, send_size, sequence.count());

        sub_chunk_result sub_chunk;
        while (sequence.next(sub_chunk)) {
            const uint64_t raw_length = sub_chunk.raw_length;
            _destination.append_sub_chunk(destination_handle.value(), std::move(sub_chunk.encoded));
            stats.bytes += raw_length;
            ++stats.sub_chunks;

            ++received;
            if (received == RECYCLE_SUB_CHUNK_COUNT) {
                const uint64_t handle = destination_handle.value();
                destination_handle.reset();
                _destination.close(handle);
                destination_handle = _destination.open_write(_plan.destination_path, true);
                received = 0;
                ++stats.recycles;
                LOG_TRACE("Destination handle recycled after {} bytes", stats.bytes);
            }
        }

        ++stats.iterations;
        if (should_report_progress(stats.iterations, total_iterations)) {
            copy_event event { copy_event_kind::progress, { }, stats.iterations, total_iterations };
            event.message = fmt::format("Iteration {}/{}: {} of {} bytes copied",
                                        stats.iterations, total_iterations, stats.bytes, _plan.total_bytes);
            LOG_DEBUG("Event: {}", event.message);
            if (_on_event) {
                _on_event(event);
            }
        }
    }

    // Close both handles
    {
        const uint64_t handle = destination_handle.value();
        destination_handle.reset();
        _destination.close(handle);
    }
    {
        const uint64_t handle = source_handle.value();
        source_handle.reset();
        _source.close(handle);
    }
    error_cleanup.suppress_sweep();

    stats.elapsed = std::chrono::steady_clock::now() - start_time;
    const double seconds = std::chrono::duration<double>(stats.elapsed).count();
    const double mib_per_second = seconds > 0 ? (double)stats.bytes / (1024.0 * 1024.0) / seconds : 0.0;
    raise_event(_on_event, copy_event_kind::timing_summary,
                fmt::format("Copied {} bytes in {:.3f} seconds ({:.2f} MiB/s, {} iterations)",
                            stats.bytes, seconds, mib_per_second, stats.iterations));

    if (stats.bytes != _plan.total_bytes) {
        LOG_WARN("Copied {} bytes, but the source was {} bytes when probed", stats.bytes, _plan.total_bytes);
    }
    return stats;
}
