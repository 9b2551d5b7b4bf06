#if !defined(_RXCP_PROGRAM_OPTIONS_H_INCLUDED_)
#define _RXCP_PROGRAM_OPTIONS_H_INCLUDED_

#if !defined(_RXCP_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_RXCP_COMMON_H_INCLUDED_)


//
// For CLI11
//
namespace infra
{
    inline std::istream& operator >>(std::istream& iss, infra::tcp_endpoint& ep)
    {
        std::string value;
        iss >> value;
        ep = infra::tcp_endpoint();
        if (!ep.parse(value)) {
            throw CLI::ConversionError(value, "tcp_endpoint");
        }
        return iss;
    }
}  // namespace infra


namespace rxcp
{
    //
    // -s HOST=ENDPOINT: the agent serving HOST
    //
    struct session_option
    {
    public:
        bool parse(const std::string& value);

        friend std::istream& operator >>(std::istream& iss, session_option& so)
        {
            std::string value;
            iss >> value;
            so = session_option();
            if (!so.parse(value)) {
                throw CLI::ConversionError(value, "session");
            }
            return iss;
        }

    public:
        std::string host_id { };
        infra::tcp_endpoint endpoint { };
    };

    struct program_options_defaults
    {
        static constexpr const char AGENT_PORTAL_HOST[] = "[::]";
        static constexpr const uint16_t AGENT_PORTAL_PORT = 62591;

        static constexpr const uint64_t MAX_RECEIVED_DATA_PER_COMMAND = 2ULL * 1024 * 1024 * 1024;  // 2 GiB
        static constexpr const uint64_t MAX_RECEIVED_OBJECT_SIZE = 0;  // unset
    };

    struct base_program_options
    {
    public:
        int arg_verbosity = 0;

    public:
        virtual ~base_program_options() = default;
        virtual void add_options(CLI::App& app);
        virtual bool post_process();
    };


    struct rxcp_program_options : base_program_options
    {
    public:
        std::vector<session_option> arg_sessions { };
        bool arg_check = false;
        bool arg_force = false;
        std::string arg_from_path { };
        std::string arg_to_path { };  // empty: same path as the source

    public:
        void add_options(CLI::App& app) override;
        bool post_process() override;
    };


    struct rxcpd_program_options : base_program_options
    {
    public:
        std::optional<infra::tcp_endpoint> arg_portal { };
        std::optional<std::string> arg_host_id { };
        std::optional<uint64_t> arg_max_data_per_command { };
        std::optional<uint64_t> arg_max_object_size { };

        std::string host_id { };
        channel_limits limits { };

    public:
        void add_options(CLI::App& app) override;
        bool post_process() override;
    };

}  // namespace rxcp


#endif  // !defined(_RXCP_PROGRAM_OPTIONS_H_INCLUDED_)
