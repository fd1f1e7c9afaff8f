#include "lft_base.hpp"
#include "utils/logger_sinks/file_sink.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>

#if defined(LIFTOFF_IS_POSIX)
#include <fcntl.h>
#include <unistd.h>
#else
#include <fcntl.h>
#include <io.h>
#include <sys/stat.h>
#endif

namespace liftoff::utils
{

namespace
{
#if defined(LIFTOFF_IS_POSIX)
int open_append(const std::filesystem::path &path)
{
    return ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
}
bool write_all(int fd, const std::string &content)
{
    const char *data = content.data();
    std::size_t left = content.size();
    while (left > 0)
    {
        const ssize_t n = ::write(fd, data, left);
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false;
        }
        data += n;
        left -= static_cast<std::size_t>(n);
    }
    return true;
}
#else
int open_append(const std::filesystem::path &path)
{
    return ::_wopen(path.c_str(), _O_WRONLY | _O_CREAT | _O_APPEND | _O_BINARY, _S_IREAD | _S_IWRITE);
}
bool write_all(int fd, const std::string &content)
{
    return ::_write(fd, content.data(), static_cast<unsigned int>(content.size())) ==
           static_cast<int>(content.size());
}
#endif
} // namespace

FileSink::FileSink(const std::filesystem::path &path) : m_path(path)
{
    std::error_code ec;
    const auto parent = m_path.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent, ec))
    {
        std::filesystem::create_directories(parent, ec);
    }
    m_fd = open_append(m_path);
    if (m_fd < 0)
    {
        throw std::runtime_error(fmt::format("Failed to open log file '{}': {}", m_path.string(), std::strerror(errno)));
    }
}

FileSink::~FileSink()
{
    if (m_fd >= 0)
    {
#if defined(LIFTOFF_IS_POSIX)
        ::close(m_fd);
#else
        ::_close(m_fd);
#endif
    }
}

void FileSink::write(const LogMessage &msg, Sink::WRITE_MODE mode)
{
    if (!write_all(m_fd, format_logmsg(msg, mode)))
    {
        throw std::system_error(errno, std::generic_category(), "FileSink write to " + m_path.string());
    }
}

void FileSink::flush()
{
#if defined(LIFTOFF_IS_POSIX)
    ::fsync(m_fd);
#else
    ::_commit(m_fd);
#endif
}

std::string FileSink::description() const
{
    return "File: " + m_path.string();
}

} // namespace liftoff::utils
