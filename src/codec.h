#if !defined(_RXCP_CODEC_H_INCLUDED_)
#define _RXCP_CODEC_H_INCLUDED_

#if !defined(_RXCP_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_RXCP_COMMON_H_INCLUDED_)


namespace rxcp
{
    // Text-safe encoding of sub-chunks
    [[nodiscard]]
    std::string base64_encode(const void* data, size_t size);

    // Throws std::invalid_argument if text is not well-formed base64
    [[nodiscard]]
    std::string base64_decode(const std::string& text);


    //
    // Streaming SHA-256, finished as lowercase hex
    //
    class sha256_accumulator
    {
    public:
        RXCP_DISABLE_COPY_CONSTRUCTOR(sha256_accumulator)
        RXCP_DISABLE_MOVE_CONSTRUCTOR(sha256_accumulator)

        sha256_accumulator();  // throws std::runtime_error
        ~sha256_accumulator() noexcept;

        void update(const void* data, size_t size);
        [[nodiscard]]
        std::string finish_hex();

    private:
        EVP_MD_CTX* _ctx { nullptr };
        bool _finished { false };
    };

    [[nodiscard]]
    bool equals_ignore_case(const std::string& a, const std::string& b) noexcept;

    [[nodiscard]]
    std::string to_lower(std::string value);

}  // namespace rxcp


#endif  // !defined(_RXCP_CODEC_H_INCLUDED_)
