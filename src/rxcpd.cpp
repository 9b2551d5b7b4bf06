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
    std::shared_ptr<rxcp::rxcpd_program_options> options = std::make_shared<rxcp::rxcpd_program_options>();
    CLI::App app("rxcp agent", "rxcpd");
    options->add_options(app);
    try {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    if (!options->post_process()) {
        LOG_ERROR("rxcpd_program_options post_process() failed");
        return 1;
    }

    // Initialize signal handler
    infra::sighandle::setup_signal_handler();

    {
        std::shared_ptr<rxcp::agent_state> agent = std::make_shared<rxcp::agent_state>(options);

        //
        // On-exit sweeper
        //
        infra::sweeper exit_sweep = [&]() {
            // Set exit required flag first!
            if (!infra::sighandle::is_exit_required()) {
                infra::sighandle::require_exit();
            }

            // Close agent
            agent->dispose();
            agent.reset();

            LOG_INFO("Bye!");
        };

        if (!agent->init()) {
            LOG_ERROR("agent init() failed");
            return 1;
        }


        // Wait for exit...
        LOG_TRACE("Waiting for exit on main thread...");
        infra::sighandle::wait_for_exit_required();
    }

    return 0;
}
