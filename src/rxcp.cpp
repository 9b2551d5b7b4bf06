#include "common.h"


int main(int argc, char* argv[])
{
    //
    // Global initializer and finalizer
    //
    [[maybe_unused]]
    const infra::global_initialize_finalize_t __init_fin;

    //
    // Parse command line arguments
    //
    std::shared_ptr<rxcp::rxcp_program_options> options = std::make_shared<rxcp::rxcp_program_options>();
    CLI::App app("rxcp client", "rxcp");
    options->add_options(app);
    try {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    if (!options->post_process()) {
        LOG_ERROR("rxcp_program_options post_process() failed");
        return 1;
    }

    const std::string local_host_id = infra::get_local_host_name();
    if (local_host_id.empty()) {
        LOG_ERROR("Can't get local host name");
        return 1;
    }

    rxcp::session_registry sessions(local_host_id);
    std::vector<std::shared_ptr<rxcp::remote_channel>> channels;

    //
    // On-exit sweeper
    //
    const infra::sweeper exit_sweep = [&]() {
        for (std::shared_ptr<rxcp::remote_channel>& channel : channels) {
            channel->dispose();
        }
        channels.clear();
    };

    //
    // Connect sessions
    //
    for (const rxcp::session_option& session : options->arg_sessions) {
        std::shared_ptr<rxcp::remote_channel> channel = std::make_shared<rxcp::remote_channel>(session.endpoint);
        try {
            channel->connect();
        }
        catch (const rxcp::copy_error& ex) {
            LOG_ERROR("Can't open session for host {}: {}", session.host_id, ex.error_message);
            channel->dispose();
            return 1;
        }

        channels.emplace_back(channel);
        sessions.add(session.host_id, channel);
        LOG_DEBUG("Session for host {} opened (agent host id {})", session.host_id, channel->host_id());
    }

    //
    // Copy
    //
    rxcp::copy_options copy_options;
    copy_options.check = options->arg_check;
    copy_options.force = options->arg_force;

    const rxcp::copy_result result = rxcp::copy_file(
        sessions,
        options->arg_from_path,
        options->arg_to_path,
        copy_options,
        [](const rxcp::copy_event& event) {
            LOG_INFO("{}", event.message);
        });

    if (!result.succeeded()) {
        LOG_ERROR("Copy failed after {}: {}: {}",
                  rxcp::to_string(result.last_phase), rxcp::to_string(result.kind), result.message);
        return 1;
    }

    LOG_INFO("Copy done");
    return 0;
}
