#ifndef SYSGPIO_ERROR_EXCEPTION_HPP
#define SYSGPIO_ERROR_EXCEPTION_HPP

#include <exception>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#define SYSGPIO_FILE_NAME __FILE__
#define SYSGPIO_FILE_LINE __LINE__
#define SYSGPIO_FUNC_NAME __func__

namespace sysgpio::error {

/**
 * @brief Base exception recording where it was thrown.
 *
 * The message is built by streaming every trailing constructor argument,
 * so callers can pass mixed strings and numbers.
 */
class Exception : public std::exception {
public:
    template <typename... Args>
    Exception(const char* file, int line, const char* func, Args&&... args)
        : file_(file),
          line_(line),
          func_(func),
          thread_id_(std::this_thread::get_id()) {
        std::ostringstream oss;
        ((oss << std::forward<Args>(args)), ...);
        message_ = oss.str();
    }

    auto what() const noexcept -> const char* override;

    auto getFile() const -> std::string;
    auto getLine() const -> int;
    auto getFunction() const -> std::string;
    auto getMessage() const -> std::string;
    auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    mutable std::string full_message_;
    std::thread::id thread_id_;
};

class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

}  // namespace sysgpio::error

#define THROW_INVALID_ARGUMENT(...)                                      \
    throw sysgpio::error::InvalidArgument(SYSGPIO_FILE_NAME,             \
                                          SYSGPIO_FILE_LINE,             \
                                          SYSGPIO_FUNC_NAME, __VA_ARGS__)

#endif  // SYSGPIO_ERROR_EXCEPTION_HPP
