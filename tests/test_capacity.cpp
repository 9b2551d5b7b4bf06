#include "test_common.h"

using namespace rxcp;
using rxcp_test::expect_copy_error;
using rxcp_test::recording_channel;
using rxcp_test::scratch_directory;

namespace
{
    // Report a fixed number of free bytes, everything else goes through
    void fake_free_space(recording_channel& channel, const uint64_t available)
    {
        channel.set_override([available](const work_request& request) -> std::optional<work_response> {
            if (!std::holds_alternative<work_query_free_space>(request)) {
                return std::nullopt;
            }
            work_response response;
            response.result = free_space_result { available };
            return response;
        });
    }

}  // namespace


static void test_threshold()
{
    std::shared_ptr<recording_channel> channel = rxcp_test::make_host("beta");
    fake_free_space(*channel, 1000);
    endpoint_session destination("Destination", host_ref { "beta", false }, channel);

    std::vector<copy_event> events;
    const copy_event_sink sink = [&](const copy_event& event) { events.emplace_back(event); };

    // 949 < 950 (95% of 1000)
    const capacity_report report = check_capacity(destination, "/data", 949, sink);
    ASSERT(report.available == 1000);
    ASSERT(report.available95 == 950);
    ASSERT(report.required == 1043, "got {}", report.required);
    ASSERT(events.size() == 1);
    ASSERT(events[0].kind == copy_event_kind::required_space);

    // At the threshold it fails, after reporting the requirement
    events.clear();
    expect_copy_error(error_kind::insufficient_space, [&]() {
        (void)check_capacity(destination, "/data", 950, sink);
    });
    ASSERT(events.size() == 1);
    ASSERT(events[0].kind == copy_event_kind::required_space);

    ASSERT(channel->count("query_free_space") == 2);
    ASSERT(channel->total() == 2);
}

static void test_empty_source_needs_free_bytes()
{
    std::shared_ptr<recording_channel> channel = rxcp_test::make_host("beta");
    fake_free_space(*channel, 0);
    endpoint_session destination("Destination", host_ref { "beta", false }, channel);

    expect_copy_error(error_kind::insufficient_space, [&]() {
        (void)check_capacity(destination, "/data", 0, nullptr);
    });
}

static void test_query_failure()
{
    scratch_directory scratch("capacity-failure");
    std::shared_ptr<recording_channel> channel = rxcp_test::make_host("beta");
    endpoint_session destination("Destination", host_ref { "beta", false }, channel);

    expect_copy_error(error_kind::io_failure, [&]() {
        (void)check_capacity(destination, scratch.path("missing/dir"), 1, nullptr);
    });

    // The real volume has room for one byte
    const capacity_report report = check_capacity(destination, scratch.root(), 1, nullptr);
    ASSERT(report.available > 1);
}

static void test_copy_opens_nothing_when_short_of_space()
{
    scratch_directory scratch("capacity-copy");
    const std::string source = scratch.path("source.bin");
    rxcp_test::write_file(source, rxcp_test::make_content(4096, 3));

    std::shared_ptr<recording_channel> alpha = rxcp_test::make_host("alpha");
    std::shared_ptr<recording_channel> beta = rxcp_test::make_host("beta");
    fake_free_space(*beta, 4096);

    session_registry sessions("workstation");
    sessions.add("alpha", alpha);
    sessions.add("beta", beta);

    const copy_result result = copy_file(
        sessions, "\\\\alpha\\" + source, "\\\\beta\\" + scratch.path("dest.bin"), copy_options { });
    ASSERT(result.kind == error_kind::insufficient_space, "got {}: {}", to_string(result.kind), result.message);
    ASSERT(result.last_phase == copy_phase::destination_resolved);

    ASSERT(alpha->count("open_read") == 0);
    ASSERT(alpha->count("open_write") == 0);
    ASSERT(beta->count("open_read") == 0);
    ASSERT(beta->count("open_write") == 0);
    ASSERT(!rxcp_test::file_exists(scratch.path("dest.bin")));
}

int main()
{
    [[maybe_unused]]
    const infra::global_initialize_finalize_t __init_fin;

    test_threshold();
    test_empty_source_needs_free_bytes();
    test_query_failure();
    test_copy_opens_nothing_when_short_of_space();

    LOG_INFO("test_capacity passed");
    return 0;
}
