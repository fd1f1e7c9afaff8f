/**
 * @file error.cpp
 * @brief Error construction, aggregation and wrapping.
 */
#include "lft_base.hpp"
#include "utils/error.hpp"

#include <stdexcept>

namespace liftoff
{

struct Error::Rep
{
    ErrorKind kind{ErrorKind::Failure};
    std::string message;
    int code{0};
    std::vector<Error> causes;
    std::string graph;
};

const char *to_string(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::Failure:
        return "Failure";
    case ErrorKind::InvalidOption:
        return "InvalidOption";
    case ErrorKind::InvalidProvider:
        return "InvalidProvider";
    case ErrorKind::MissingDependency:
        return "MissingDependency";
    case ErrorKind::DependencyCycle:
        return "DependencyCycle";
    case ErrorKind::ConstructorFailed:
        return "ConstructorFailed";
    case ErrorKind::DeadlineExceeded:
        return "DeadlineExceeded";
    case ErrorKind::Canceled:
        return "Canceled";
    case ErrorKind::BroadcastPartialFailure:
        return "BroadcastPartialFailure";
    case ErrorKind::SignalRelay:
        return "SignalRelay";
    case ErrorKind::Multiple:
        return "Multiple";
    }
    return "Unknown";
}

Error::Error(std::shared_ptr<const Rep> rep) noexcept : m_rep(std::move(rep)) {}

Error Error::make(ErrorKind kind, std::string message, int code)
{
    auto rep = std::make_shared<Rep>();
    rep->kind = kind;
    rep->message = std::move(message);
    rep->code = code;
    return Error(std::move(rep));
}

Error Error::failure(std::string message)
{
    return make(ErrorKind::Failure, std::move(message));
}

Error Error::wrap(ErrorKind kind, std::string message, Error cause)
{
    if (cause.is_ok())
    {
        return make(kind, std::move(message));
    }
    auto rep = std::make_shared<Rep>();
    rep->kind = kind;
    rep->message = fmt::format("{}: {}", message, cause.message());
    rep->code = cause.code();
    rep->causes.push_back(std::move(cause));
    return Error(std::move(rep));
}

Error Error::combine(const std::vector<Error> &errors)
{
    std::vector<Error> flat;
    for (const auto &err : errors)
    {
        if (err.is_ok())
        {
            continue;
        }
        if (err.m_rep->kind == ErrorKind::Multiple)
        {
            flat.insert(flat.end(), err.m_rep->causes.begin(), err.m_rep->causes.end());
        }
        else
        {
            flat.push_back(err);
        }
    }

    if (flat.empty())
    {
        return {};
    }
    if (flat.size() == 1)
    {
        return flat.front();
    }

    auto rep = std::make_shared<Rep>();
    rep->kind = ErrorKind::Multiple;
    fmt::memory_buffer buf;
    for (size_t i = 0; i < flat.size(); ++i)
    {
        fmt::format_to(std::back_inserter(buf), "{}{}", i == 0 ? "" : "; ", flat[i].message());
    }
    rep->message = fmt::to_string(buf);
    rep->code = static_cast<int>(flat.size());
    rep->causes = std::move(flat);
    return Error(std::move(rep));
}

Error Error::append(const Error &first, const Error &second)
{
    return combine({first, second});
}

ErrorKind Error::kind() const
{
    if (is_ok())
    {
        throw std::logic_error("Error::kind() called on success");
    }
    return m_rep->kind;
}

const std::string &Error::message() const noexcept
{
    static const std::string kEmpty;
    return m_rep ? m_rep->message : kEmpty;
}

int Error::code() const noexcept
{
    return m_rep ? m_rep->code : 0;
}

const std::vector<Error> &Error::causes() const noexcept
{
    static const std::vector<Error> kNone;
    return m_rep ? m_rep->causes : kNone;
}

std::vector<Error> Error::errors() const
{
    if (is_ok())
    {
        return {};
    }
    if (m_rep->kind == ErrorKind::Multiple)
    {
        return m_rep->causes;
    }
    return {*this};
}

bool Error::contains(ErrorKind kind) const noexcept
{
    if (is_ok())
    {
        return false;
    }
    if (m_rep->kind == kind)
    {
        return true;
    }
    for (const auto &cause : m_rep->causes)
    {
        if (cause.contains(kind))
        {
            return true;
        }
    }
    return false;
}

Error Error::with_graph(std::string dot_graph) const
{
    if (is_ok())
    {
        throw std::logic_error("Error::with_graph() called on success");
    }
    auto rep = std::make_shared<Rep>(*m_rep);
    rep->graph = std::move(dot_graph);
    return Error(std::move(rep));
}

bool Error::has_graph() const noexcept
{
    return m_rep && !m_rep->graph.empty();
}

std::string Error::to_string() const
{
    if (is_ok())
    {
        return "ok";
    }
    return fmt::format("{}: {}", liftoff::to_string(m_rep->kind), m_rep->message);
}

Result<std::string, Error> visualize_error(const Error &err)
{
    if (!err.has_graph())
    {
        return Result<std::string, Error>::error(Error::failure("unable to visualize error"));
    }
    return Result<std::string, Error>::ok(err.m_rep->graph);
}

} // namespace liftoff
