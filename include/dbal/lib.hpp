#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdarg>
#include <cstdio>
#include <sstream> // To build the final string

namespace dbal {

using str = std::string;

// Base of every error the library raises. Callers that do not care about the
// category catch this one (or std::runtime_error).
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Migration authoring mistakes: duplicate primary key, enum option with a comma,
// foreign key to a layout without primary key.
class InvariantError : public Error {
public:
    using Error::Error;
};

// Referencing a field / index / layout / output that does not exist.
class NotFoundError : public Error {
public:
    using Error::Error;
};

// Negating an operator that has no complement.
class InvalidOperator : public Error {
public:
    using Error::Error;
};

// The dialect has no way to express the requested change.
class UnsupportedError : public Error {
public:
    using Error::Error;
};

// Anything the driver / database reports back.
class BackendError : public Error {
public:
    using Error::Error;
};

enum class ErrorKind { Generic, Invariant, NotFound, InvalidOperator, Unsupported, Backend };

// printf style formatter, prefixes the message with file:line: and throws the
// exception matching @p kind. Pass std::string arguments through c_str().
[[noreturn]] void raise(ErrorKind kind, const char* file, int line, const char* fmt, ...);

// printf style formatting without the throw.
std::string format(const char* fmt, ...);

} // namespace dbal

// Helper macros to automatically pass __FILE__ and __LINE__
#define DBAL_THROW(msg, ...)            ::dbal::raise(::dbal::ErrorKind::Generic,         __FILE__, __LINE__, msg, ##__VA_ARGS__)
#define DBAL_INVARIANT(msg, ...)        ::dbal::raise(::dbal::ErrorKind::Invariant,       __FILE__, __LINE__, msg, ##__VA_ARGS__)
#define DBAL_NOT_FOUND(msg, ...)        ::dbal::raise(::dbal::ErrorKind::NotFound,        __FILE__, __LINE__, msg, ##__VA_ARGS__)
#define DBAL_INVALID_OPERATOR(msg, ...) ::dbal::raise(::dbal::ErrorKind::InvalidOperator, __FILE__, __LINE__, msg, ##__VA_ARGS__)
#define DBAL_UNSUPPORTED(msg, ...)      ::dbal::raise(::dbal::ErrorKind::Unsupported,     __FILE__, __LINE__, msg, ##__VA_ARGS__)
#define DBAL_BACKEND(msg, ...)          ::dbal::raise(::dbal::ErrorKind::Backend,         __FILE__, __LINE__, msg, ##__VA_ARGS__)
