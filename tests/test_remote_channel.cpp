#include "test_common.h"

using namespace rxcp;
using rxcp_test::scratch_directory;

namespace
{
    std::shared_ptr<agent_state> start_agent(const std::string& host_id)
    {
        std::shared_ptr<rxcpd_program_options> options = std::make_shared<rxcpd_program_options>();
        options->arg_portal = infra::tcp_endpoint();
        ASSERT(options->arg_portal->parse("127.0.0.1:0"));
        options->arg_host_id = host_id;
        options->arg_max_data_per_command = 40000;
        options->arg_max_object_size = 1024 * 1024;
        ASSERT(options->post_process());
        ASSERT(options->host_id == host_id);

        std::shared_ptr<agent_state> agent = std::make_shared<agent_state>(options);
        ASSERT(agent->init());
        ASSERT(agent->bound_local_endpoint.port() != 0);
        return agent;
    }

    std::shared_ptr<remote_channel> connect_agent(const agent_state& agent)
    {
        infra::tcp_endpoint endpoint;
        const std::string value = "127.0.0.1:" + std::to_string(agent.bound_local_endpoint.port());
        ASSERT(endpoint.parse(value), "parse {} failed", value);

        std::shared_ptr<remote_channel> channel = std::make_shared<remote_channel>(std::move(endpoint));
        channel->connect();
        return channel;
    }

}  // namespace


static void test_handshake_reports_agent()
{
    std::shared_ptr<agent_state> agent = start_agent("far-host");
    const infra::sweeper dispose_agent = [&]() { agent->dispose(); };

    std::shared_ptr<remote_channel> channel = connect_agent(*agent);
    ASSERT(channel->host_id() == "far-host");
    ASSERT(channel->limits().max_received_data_per_command == 40000);
    ASSERT(channel->limits().max_received_object_size == 1024 * 1024);

    // Failures of a unit of work come back in the response
    const work_response response = channel->invoke(work_close { 12345 });
    ASSERT(response.error_code == EBADF, "got errno {}", response.error_code);
    ASSERT(!response.error_message.empty());

    // The channel keeps working after a failed unit of work
    scratch_directory scratch("remote-handshake");
    const work_response stat_response = channel->invoke(work_stat { scratch.root() });
    ASSERT(stat_response.error_code == 0);
    const file_metadata* const metadata = std::get_if<file_metadata>(&stat_response.result);
    ASSERT(metadata != nullptr);
    ASSERT(metadata->exists && metadata->is_directory);

    channel->dispose();
    rxcp_test::expect_copy_error(error_kind::channel_failure, [&]() {
        (void)channel->invoke(work_stat { scratch.root() });
    });
}

static void test_connect_failure()
{
    // Nothing listens on a port that was just released
    uint16_t port;
    {
        std::shared_ptr<agent_state> agent = start_agent("gone");
        port = agent->bound_local_endpoint.port();
        agent->dispose();
    }

    infra::tcp_endpoint endpoint;
    ASSERT(endpoint.parse("127.0.0.1:" + std::to_string(port)));
    std::shared_ptr<remote_channel> channel = std::make_shared<remote_channel>(std::move(endpoint));
    rxcp_test::expect_copy_error(error_kind::channel_failure, [&]() {
        channel->connect();
    });
    channel->dispose();
}

static void test_copy_through_agents()
{
    std::shared_ptr<agent_state> agent = start_agent("far-host");
    const infra::sweeper dispose_agent = [&]() { agent->dispose(); };

    scratch_directory scratch("remote-copy");
    const std::string content = rxcp_test::make_content(123457, 31);
    rxcp_test::write_file(scratch.path("source.bin"), content);

    // Two sessions to the same agent under different names: copied chunk by chunk
    std::shared_ptr<remote_channel> first = connect_agent(*agent);
    std::shared_ptr<remote_channel> second = connect_agent(*agent);
    const infra::sweeper dispose_channels = [&]() {
        first->dispose();
        second->dispose();
    };

    session_registry sessions("workstation");
    sessions.add("north", first);
    sessions.add("south", second);

    copy_options options;
    options.check = true;
    options.sub_chunk_size = 3000;

    std::vector<copy_event> progress;
    const copy_result pushed = copy_file(
        sessions, scratch.path("source.bin"), "\\\\north\\" + scratch.path("pushed.bin"), options,
        [&](const copy_event& event) { if (event.kind == copy_event_kind::progress) progress.emplace_back(event); });
    ASSERT(pushed.succeeded(), "{}: {}", to_string(pushed.kind), pushed.message);
    ASSERT(rxcp_test::read_file(scratch.path("pushed.bin")) == content);

    // chunk size 10000 from the agent's limits
    ASSERT(!progress.empty());
    ASSERT(progress.back().total_iterations == 13);

    const copy_result relayed = copy_file(
        sessions, "\\\\north\\" + scratch.path("pushed.bin"), "\\\\south\\" + scratch.path("relayed.bin"), options);
    ASSERT(relayed.succeeded(), "{}: {}", to_string(relayed.kind), relayed.message);
    ASSERT(relayed.last_phase == copy_phase::done);
    ASSERT(rxcp_test::read_file(scratch.path("relayed.bin")) == content);

    const copy_result same_host = copy_file(
        sessions, "\\\\south\\" + scratch.path("relayed.bin"), "\\\\SOUTH\\" + scratch.path("same.bin"), options);
    ASSERT(same_host.succeeded(), "{}: {}", to_string(same_host.kind), same_host.message);
    ASSERT(rxcp_test::read_file(scratch.path("same.bin")) == content);

    const copy_result exists = copy_file(
        sessions, scratch.path("source.bin"), "\\\\south\\" + scratch.path("same.bin"), options);
    ASSERT(exists.kind == error_kind::file_already_exists);
    ASSERT(agent->connection_count() == 2);
}

static void test_handles_are_per_connection()
{
    std::shared_ptr<agent_state> agent = start_agent("far-host");
    const infra::sweeper dispose_agent = [&]() { agent->dispose(); };

    scratch_directory scratch("remote-handles");
    rxcp_test::write_file(scratch.path("source.bin"), "left open");

    std::shared_ptr<remote_channel> channel = connect_agent(*agent);
    const work_response opened = channel->invoke(work_open_read { scratch.path("source.bin") });
    ASSERT(opened.error_code == 0);
    ASSERT(std::get<handle_result>(opened.result).handle == 1);

    // Handles belong to the connection: a new connection starts its own table
    std::shared_ptr<remote_channel> other = connect_agent(*agent);
    const work_response other_opened = other->invoke(work_open_read { scratch.path("source.bin") });
    ASSERT(other_opened.error_code == 0);
    ASSERT(std::get<handle_result>(other_opened.result).handle == 1);

    const work_response foreign = other->invoke(work_read_sub_chunk { 2, 16 });
    ASSERT(foreign.error_code == EBADF);

    channel->dispose();
    other->dispose();
}

int main()
{
    [[maybe_unused]]
    const infra::global_initialize_finalize_t __init_fin;

    test_handshake_reports_agent();
    test_connect_failure();
    test_copy_through_agents();
    test_handles_are_per_connection();

    LOG_INFO("test_remote_channel passed");
    return 0;
}
