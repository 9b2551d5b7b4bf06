#include "test_common.h"

using namespace rxcp;
using rxcp_test::expect_copy_error;
using rxcp_test::recording_channel;
using rxcp_test::scratch_directory;

namespace
{
    struct transfer_fixture
    {
        explicit transfer_fixture(const std::string& name, const channel_limits& limits)
            : scratch(name),
              source_inner(std::make_shared<local_channel>("alpha")),
              destination_inner(std::make_shared<local_channel>("beta")),
              source_channel(std::make_shared<recording_channel>(source_inner, "alpha", limits)),
              destination_channel(std::make_shared<recording_channel>(destination_inner, "beta", limits)),
              source("Source", host_ref { "alpha", false }, source_channel),
              destination("Destination", host_ref { "beta", false }, destination_channel)
        { }

        scratch_directory scratch;
        std::shared_ptr<local_channel> source_inner;
        std::shared_ptr<local_channel> destination_inner;
        std::shared_ptr<recording_channel> source_channel;
        std::shared_ptr<recording_channel> destination_channel;
        endpoint_session source;
        endpoint_session destination;
    };

    channel_limits make_limits(const uint64_t max_received_data_per_command, const uint64_t max_received_object_size)
    {
        return channel_limits { max_received_data_per_command, max_received_object_size };
    }

}  // namespace


static void test_negotiate_chunk_size()
{
    ASSERT(negotiate_chunk_size(make_limits(0, 0)) == DEFAULT_CHUNK_SIZE);
    ASSERT(negotiate_chunk_size(make_limits(2ULL * 1024 * 1024 * 1024, 0)) == 536870912);
    ASSERT(negotiate_chunk_size(make_limits(0, 400)) == 100);
    ASSERT(negotiate_chunk_size(make_limits(4000, 400)) == 1000);

    // A primary limit below 4 bytes counts as unset
    ASSERT(negotiate_chunk_size(make_limits(3, 400)) == 100);
    ASSERT(negotiate_chunk_size(make_limits(3, 3)) == DEFAULT_CHUNK_SIZE);
}

static void test_make_transfer_plan()
{
    file_metadata source;
    source.exists = true;
    source.full_path = "/data/source.bin";
    source.length = 73053601;

    const transfer_plan plan = make_transfer_plan(
        source, "/backup/source.bin", channel_limits { 2ULL * 1024 * 1024 * 1024, 0 }, true, false);
    ASSERT(plan.total_bytes == 73053601);
    ASSERT(plan.chunk_size == 536870912);
    ASSERT(plan.sub_chunk_size == DEFAULT_SUB_CHUNK_SIZE);
    ASSERT(plan.check);
    ASSERT(!plan.force);

    // Sub-chunks never exceed the chunk
    const transfer_plan small = make_transfer_plan(source, "/backup/source.bin", channel_limits { 4000, 0 }, false, false, 4096);
    ASSERT(small.chunk_size == 1000);
    ASSERT(small.sub_chunk_size == 1000);
}

static void test_progress_cadence()
{
    ASSERT(transfer_engine::should_report_progress(1, 1));
    ASSERT(transfer_engine::should_report_progress(3, 10));
    ASSERT(!transfer_engine::should_report_progress(3, 50));
    ASSERT(transfer_engine::should_report_progress(5, 50));
    ASSERT(transfer_engine::should_report_progress(50, 50));
    ASSERT(!transfer_engine::should_report_progress(7, 11));
    ASSERT(transfer_engine::should_report_progress(11, 11));
    ASSERT(transfer_engine::should_report_progress(25, 500));
    ASSERT(!transfer_engine::should_report_progress(26, 500));
    ASSERT(!transfer_engine::should_report_progress(150, 5000));
    ASSERT(transfer_engine::should_report_progress(200, 5000));
    ASSERT(transfer_engine::should_report_progress(4999 + 1, 5000));

    // Early iterations of a long transfer use the long transfer's step
    ASSERT(!transfer_engine::should_report_progress(3, 5000));
    ASSERT(!transfer_engine::should_report_progress(9, 200));
    ASSERT(transfer_engine::should_report_progress(100, 5000));
}

static void test_sub_chunk_sequence()
{
    transfer_fixture fixture("transfer-sequence", channel_limits { });
    const std::string path = fixture.scratch.path("source.bin");
    const std::string content = rxcp_test::make_content(2500, 4);
    rxcp_test::write_file(path, content);

    const uint64_t handle = fixture.source.open_read(path);

    // A full chunk: 1000 bytes as 300 + 300 + 300 + 100
    {
        sub_chunk_sequence sequence(fixture.source, handle, 1000, 300);
        ASSERT(sequence.count() == 4);

        std::vector<uint64_t> lengths;
        std::string raw;
        sub_chunk_result sub_chunk;
        while (sequence.next(sub_chunk)) {
            lengths.emplace_back(sub_chunk.raw_length);
            raw += base64_decode(sub_chunk.encoded);
        }
        const std::vector<uint64_t> expected_lengths { 300, 300, 300, 100 };
        ASSERT(lengths == expected_lengths);
        ASSERT(sequence.produced_bytes() == 1000);
        ASSERT(raw == content.substr(0, 1000));
    }

    // Asking for more than what is left ends at end of file
    {
        sub_chunk_sequence sequence(fixture.source, handle, 2000, 700);
        ASSERT(sequence.count() == 3);

        uint64_t produced = 0;
        size_t count = 0;
        sub_chunk_result sub_chunk;
        while (sequence.next(sub_chunk)) {
            produced += sub_chunk.raw_length;
            ++count;
        }
        ASSERT(produced == 1500);
        ASSERT(count == 3);
        ASSERT(sequence.produced_bytes() == 1500);
    }

    fixture.source.close(handle);
}

static void test_sizes_around_chunk_boundaries()
{
    // chunk size 1000, sub-chunk size 300
    const channel_limits limits { 4000, 0 };
    const std::vector<size_t> sizes { 0, 1, 299, 300, 999, 1000, 1001, 2100, 2500, 6300, 12345 };

    for (const size_t size : sizes) {
        transfer_fixture fixture("transfer-sizes", limits);
        const std::string source_path = fixture.scratch.path("source.bin");
        const std::string destination_path = fixture.scratch.path("destination.bin");
        const std::string content = rxcp_test::make_content(size, (uint32_t)size);
        rxcp_test::write_file(source_path, content);

        const file_metadata metadata = probe_source(fixture.source, parse_path_spec("\\\\alpha\\" + source_path, "workstation", false));
        const transfer_plan plan = make_transfer_plan(metadata, destination_path, limits, false, false, 300);
        ASSERT(plan.chunk_size == 1000);

        std::vector<copy_event> progress;
        size_t summaries = 0;
        transfer_engine engine(fixture.source, fixture.destination, plan, [&](const copy_event& event) {
            if (event.kind == copy_event_kind::progress) progress.emplace_back(event);
            if (event.kind == copy_event_kind::timing_summary) ++summaries;
        });
        const transfer_statistics stats = engine.run();

        const uint64_t iterations = (size + 999) / 1000;
        ASSERT(stats.iterations == iterations, "size {}: {} iterations", size, stats.iterations);
        ASSERT(stats.bytes == size);
        ASSERT(rxcp_test::read_file(destination_path) == content, "size {}: content differs", size);

        uint64_t sub_chunks = 0;
        for (uint64_t remaining = size; remaining > 0; remaining -= std::min<uint64_t>(remaining, 1000)) {
            sub_chunks += (std::min<uint64_t>(remaining, 1000) + 299) / 300;
        }
        ASSERT(stats.sub_chunks == sub_chunks, "size {}: {} sub-chunks", size, stats.sub_chunks);
        ASSERT(stats.recycles == sub_chunks / RECYCLE_SUB_CHUNK_COUNT);

        // One open and one close per recycle, plus the first open and the final close
        ASSERT(fixture.destination_channel->count("open_write") == stats.recycles + 1);
        ASSERT(fixture.destination_channel->count("close") == stats.recycles + 1);
        ASSERT(fixture.destination_channel->count("append_sub_chunk") == sub_chunks);
        ASSERT(fixture.source_channel->count("open_read") == 1);
        ASSERT(fixture.source_channel->count("close") == 1);
        ASSERT(fixture.source_inner->open_handle_count() == 0);
        ASSERT(fixture.destination_inner->open_handle_count() == 0);

        ASSERT(progress.size() == iterations);
        for (size_t i = 0; i < progress.size(); ++i) {
            ASSERT(progress[i].iteration == i + 1);
            ASSERT(progress[i].total_iterations == iterations);
        }
        ASSERT(summaries == 1);
    }
}

static void test_recycle_after_seven_sub_chunks()
{
    transfer_fixture fixture("transfer-recycle", channel_limits { });
    const std::string source_path = fixture.scratch.path("source.bin");
    const std::string destination_path = fixture.scratch.path("destination.bin");
    const std::string content = rxcp_test::make_content(100 * 15, 5);
    rxcp_test::write_file(source_path, content);

    file_metadata metadata = fixture.source.stat(source_path);
    const transfer_plan plan = make_transfer_plan(metadata, destination_path, channel_limits { }, false, false, 100);
    ASSERT(plan.chunk_size == DEFAULT_CHUNK_SIZE);

    transfer_engine engine(fixture.source, fixture.destination, plan, nullptr);
    const transfer_statistics stats = engine.run();

    // 15 sub-chunks in one chunk: recycled after the 7th and the 14th
    ASSERT(stats.iterations == 1);
    ASSERT(stats.sub_chunks == 15);
    ASSERT(stats.recycles == 2);
    ASSERT(fixture.destination_channel->count("open_write") == 3);
    ASSERT(rxcp_test::read_file(destination_path) == content);
}

static void test_progress_every_fifth_iteration()
{
    // chunk size 10, 12 iterations
    const channel_limits limits { 40, 0 };
    transfer_fixture fixture("transfer-progress", limits);
    const std::string source_path = fixture.scratch.path("source.bin");
    rxcp_test::write_file(source_path, rxcp_test::make_content(115, 6));

    const file_metadata metadata = fixture.source.stat(source_path);
    const transfer_plan plan = make_transfer_plan(metadata, fixture.scratch.path("destination.bin"), limits, false, false);
    ASSERT(plan.chunk_size == 10);
    ASSERT(plan.sub_chunk_size == 10);

    std::vector<uint64_t> reported;
    transfer_engine engine(fixture.source, fixture.destination, plan, [&](const copy_event& event) {
        if (event.kind == copy_event_kind::progress) reported.emplace_back(event.iteration);
    });
    const transfer_statistics stats = engine.run();
    ASSERT(stats.iterations == 12);
    const std::vector<uint64_t> expected_reported { 5, 10, 12 };
    ASSERT(reported == expected_reported);
}

static void test_failure_closes_handles()
{
    transfer_fixture fixture("transfer-failure", channel_limits { 4000, 0 });
    const std::string source_path = fixture.scratch.path("source.bin");
    rxcp_test::write_file(source_path, rxcp_test::make_content(3000, 7));

    // The third append fails
    std::atomic_int appends { 0 };
    fixture.destination_channel->set_override([&](const work_request& request) -> std::optional<work_response> {
        if (std::holds_alternative<work_append_sub_chunk>(request) && ++appends == 3) {
            work_response response;
            response.error_code = ENOSPC;
            response.error_message = "No space left on device";
            return response;
        }
        return std::nullopt;
    });

    const file_metadata metadata = fixture.source.stat(source_path);
    const transfer_plan plan = make_transfer_plan(metadata, fixture.scratch.path("destination.bin"), channel_limits { 4000, 0 }, false, false, 300);

    transfer_engine engine(fixture.source, fixture.destination, plan, nullptr);
    expect_copy_error(error_kind::io_failure, [&]() {
        (void)engine.run();
    });

    ASSERT(fixture.source_inner->open_handle_count() == 0);
    ASSERT(fixture.destination_inner->open_handle_count() == 0);
}

int main()
{
    [[maybe_unused]]
    const infra::global_initialize_finalize_t __init_fin;

    test_negotiate_chunk_size();
    test_make_transfer_plan();
    test_progress_cadence();
    test_sub_chunk_sequence();
    test_sizes_around_chunk_boundaries();
    test_recycle_after_seven_sub_chunks();
    test_progress_every_fifth_iteration();
    test_failure_closes_handles();

    LOG_INFO("test_transfer passed");
    return 0;
}
