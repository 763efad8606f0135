#include "dbal/lib.hpp"
#include "dbal/log.hpp"

namespace dbal {

std::atomic<log_level> g_log_level{log_level::warn};

namespace {

    std::string vformat(const char* fmt, va_list args) {
        // Two passes: the first call with a null buffer returns the number of
        // characters that would have been written.
        va_list args_copy;
        va_copy(args_copy, args);
        int required_size = std::vsnprintf(nullptr, 0, fmt, args_copy);
        va_end(args_copy);

        if (required_size < 0) {
            throw std::runtime_error("Error: Failed to determine required buffer size.");
        }

        std::vector<char> buffer(required_size + 1);
        std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
        return std::string(buffer.data(), required_size);
    }

}

std::string format(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    std::string out = vformat(fmt, args);
    va_end(args);
    return out;
}

void raise(ErrorKind kind, const char* file, int line, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    std::string msg = vformat(fmt, args);
    va_end(args);

    std::stringstream ss;
    ss << file << ":" << line << ": " << msg;

    switch (kind) {
        case ErrorKind::Invariant:       throw InvariantError(ss.str());
        case ErrorKind::NotFound:        throw NotFoundError(ss.str());
        case ErrorKind::InvalidOperator: throw InvalidOperator(ss.str());
        case ErrorKind::Unsupported:     throw UnsupportedError(ss.str());
        case ErrorKind::Backend:         throw BackendError(ss.str());
        case ErrorKind::Generic:         break;
    }
    throw Error(ss.str());
}

} // namespace dbal
