#pragma once

#include <chrono>
#include <iosfwd>
#include <optional>
#include <string>

namespace rustman {

class cancellation_flag;

/**
 * @brief A source of lines of user input for the project menu.
 */
class line_reader {
public:
    virtual ~line_reader() = default;

    /**
     * @brief Read the next line, without its line ending.
     *
     * Returns nullopt once the input is exhausted. Implementations that observe a
     * cancellation_flag also return nullopt once the flag is set.
     */
    virtual std::optional<std::string> read_line() = 0;
};

/// Read lines from a std::istream
class stream_line_reader : public line_reader {
    std::istream& _in;

public:
    explicit stream_line_reader(std::istream& in)
        : _in(in) {}

    std::optional<std::string> read_line() override;
};

/**
 * @brief Read lines from a file descriptor, waking periodically to check for cancellation.
 *
 * The descriptor is not owned, and is never closed by this object.
 */
class fd_line_reader : public line_reader {
    int                       _fd;
    const cancellation_flag&  _cancel;
    std::chrono::milliseconds _poll_interval;
    std::string               _pending;
    bool                      _eof = false;

    bool _fill();

public:
    fd_line_reader(int                       fd,
                   const cancellation_flag&  cancel,
                   std::chrono::milliseconds poll_interval = std::chrono::milliseconds{100})
        : _fd(fd)
        , _cancel(cancel)
        , _poll_interval(poll_interval) {}

    std::optional<std::string> read_line() override;
};

}  // namespace rustman
