#if !defined(_RXCP_INFRA_MACRO_H_INCLUDED_)
#define _RXCP_INFRA_MACRO_H_INCLUDED_

#if !defined(_RXCP_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_RXCP_INFRA_INFRA_H_INCLUDED_)


//
// Macros for defaulted/disabled copy/move constructor
//
#define RXCP_DISABLE_COPY_CONSTRUCTOR(_Class_) \
    _Class_(const _Class_&) = delete; \
    _Class_& operator =(const _Class_&) = delete;

#define RXCP_DISABLE_MOVE_CONSTRUCTOR(_Class_) \
    _Class_(_Class_&&) = delete; \
    _Class_& operator =(_Class_&&) = delete;

#define RXCP_DEFAULT_COPY_CONSTRUCTOR(_Class_) \
    _Class_(const _Class_&) = default; \
    _Class_& operator =(const _Class_&) = default;

#define RXCP_DEFAULT_MOVE_CONSTRUCTOR(_Class_) \
    _Class_(_Class_&&) noexcept = default; \
    _Class_& operator =(_Class_&&) noexcept = default;


//
// Serialization
//
#define RXCP_DEFAULT_SERIALIZATION(...) \
    friend class cereal::access; \
    \
    template<typename Archive> \
    void serialize(Archive& ar) \
    { \
        ar(__VA_ARGS__); \
    }

// For units of work and results without any field
#define RXCP_EMPTY_SERIALIZATION() \
    friend class cereal::access; \
    \
    template<typename Archive> \
    void serialize(Archive& /*ar*/) \
    { }


//
// System errors
//
#define THROW_SYSTEM_ERROR(_Errno_, _Function_) \
    throw std::system_error(std::error_code((_Errno_), std::system_category()), #_Function_ "() failed")


//
// Helper macros
//
#define JUST(...)       __VA_ARGS__


#endif  // !defined(_RXCP_INFRA_MACRO_H_INCLUDED_)
