#ifndef RESULT_HPP
#define RESULT_HPP

#include <cassert>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>

enum class ErrorKind : std::uint8_t {
    Configuration,
    Parse,
    Overflow,
    TypeMismatch,
    AmbiguousUnit,
    DivisionByZero
};

struct Error {
    ErrorKind kind;
    std::string message;
};

std::string getErrorKindName(ErrorKind kind);

template <typename T>
class Result {
public:
    Result(const T& value) : m_data{ value } {}
    Result(T&& value) : m_data{ std::move(value) } {}
    Result(const Error& error) : m_data{ error } {}
    Result(Error&& error) : m_data{ std::move(error) } {}

    bool isValue() const {
        return std::holds_alternative<T>(m_data);
    }

    bool isError() const {
        return std::holds_alternative<Error>(m_data);
    }

    const T& getValue() const {
        assert(isValue());
        return std::get<T>(m_data);
    }

    T& getValue() {
        assert(isValue());
        return std::get<T>(m_data);
    }

    const Error& getError() const {
        assert(isError());
        return std::get<Error>(m_data);
    }

    ErrorKind getErrorKind() const {
        return getError().kind;
    }

private:
    std::variant<T, Error> m_data;
};

#endif // RESULT_HPP
