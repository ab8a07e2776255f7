#ifndef MCPBRIDGE_RESULT_HPP
#define MCPBRIDGE_RESULT_HPP

#include <mcpbridge/errors.hpp>
#include <mcpbridge/types.hpp>
#include <string>
#include <utility>
#include <variant>

namespace mcpbridge
{

/// Plain-data copy of a BridgeError
struct ErrorInfo
{
    ErrorKind kind = ErrorKind::Protocol;
    std::string message;
    ErrorContext context;
    json payload; // Server-supplied error for ToolInvocation / Handshake, null otherwise

    static ErrorInfo from_exception(const BridgeError& e);
};

/// Value-or-error return used by the non-throwing bridge entry points
template <typename T>
class Result
{
  public:
    static Result ok(T value)
    {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result fail(ErrorInfo error)
    {
        return Result(std::in_place_index<1>, std::move(error));
    }

    bool has_value() const
    {
        return data_.index() == 0;
    }

    explicit operator bool() const
    {
        return has_value();
    }

    // Throws BridgeError when holding an error
    const T& value() const
    {
        if (!has_value())
        {
            const auto& err = std::get<1>(data_);
            throw BridgeError(err.kind, err.message, err.context);
        }
        return std::get<0>(data_);
    }

    T&& take()
    {
        value();
        return std::move(std::get<0>(data_));
    }

    const ErrorInfo& error() const
    {
        if (has_value())
            throw std::logic_error("Result holds a value, not an error");
        return std::get<1>(data_);
    }

  private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& v) : data_(tag, std::forward<U>(v))
    {
    }

    std::variant<T, ErrorInfo> data_;
};

} // namespace mcpbridge

#endif // MCPBRIDGE_RESULT_HPP
