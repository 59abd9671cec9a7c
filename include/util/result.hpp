#ifndef RESULT_HPP
#define RESULT_HPP

#include <cassert>
#include <string>
#include <utility>
#include <variant>

// Holds either a value or a human readable error message
template <typename T>
class Result {
public:
    Result(const T& value) : m_data{ std::in_place_index<0>, value } {}
    Result(T&& value) : m_data{ std::in_place_index<0>, std::move(value) } {}
    Result(const std::string& error) : m_data{ std::in_place_index<1>, error } {}
    Result(std::string&& error) : m_data{ std::in_place_index<1>, std::move(error) } {}
    Result(const char* error) : m_data{ std::in_place_index<1>, std::string{ error } } {}

    bool isValue() const {
        return m_data.index() == 0;
    }

    bool isError() const {
        return m_data.index() == 1;
    }

    const T& getValue() const {
        assert(isValue());
        return std::get<0>(m_data);
    }

    T& getValue() {
        assert(isValue());
        return std::get<0>(m_data);
    }

    const std::string& getError() const {
        assert(isError());
        return std::get<1>(m_data);
    }

    // Prefixes the error message with context, leaving values untouched
    Result withErrorContext(const std::string& context) const {
        if (isValue()) {
            return *this;
        }
        return context + getError();
    }

private:
    std::variant<T, std::string> m_data;
};

#endif // RESULT_HPP
