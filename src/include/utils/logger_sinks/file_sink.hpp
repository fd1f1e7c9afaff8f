#pragma once

#include <filesystem>
#include <string>

#include "utils/logger_sinks/sink.hpp"

namespace liftoff::utils
{

/**
 * @class FileSink
 * @brief Appends formatted log lines to a single file.
 *
 * The file is opened (and created if needed) in the constructor; failure
 * throws `std::runtime_error` naming the path.
 */
class LIFTOFF_UTILS_EXPORT FileSink : public Sink
{
  public:
    explicit FileSink(const std::filesystem::path &path);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg, Sink::WRITE_MODE mode) override;
    void flush() override;
    std::string description() const override;

  private:
    std::filesystem::path m_path;
    int m_fd = -1;
};

} // namespace liftoff::utils
