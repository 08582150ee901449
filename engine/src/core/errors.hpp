#pragma once

#include <optional>
#include <string>
#include <utility>

enum class error_kind {
    none,
    validation,
    not_found,
    transport,
    integrity,
    persistence,
};

inline const char* to_string(error_kind kind) {
    switch (kind) {
    case error_kind::none:
        return "";
    case error_kind::validation:
        return "ValidationError";
    case error_kind::not_found:
        return "NotFound";
    case error_kind::transport:
        return "TransportError";
    case error_kind::integrity:
        return "IntegrityError";
    case error_kind::persistence:
        return "PersistenceError";
    }
    return "";
}

inline error_kind error_kind_from_string(const std::string& name) {
    if (name == "ValidationError")
        return error_kind::validation;
    if (name == "NotFound")
        return error_kind::not_found;
    if (name == "TransportError")
        return error_kind::transport;
    if (name == "IntegrityError")
        return error_kind::integrity;
    if (name == "PersistenceError")
        return error_kind::persistence;
    return error_kind::none;
}

// Classified failure returned by every download_manager operation.
struct engine_error {
    error_kind kind = error_kind::none;
    std::string message;

    engine_error() = default;
    engine_error(error_kind k, std::string msg) : kind(k), message(std::move(msg)) {}

    bool ok() const {
        return kind == error_kind::none;
    }

    static engine_error validation(std::string msg) {
        return {error_kind::validation, std::move(msg)};
    }
    static engine_error not_found(std::string msg) {
        return {error_kind::not_found, std::move(msg)};
    }
    static engine_error transport(std::string msg) {
        return {error_kind::transport, std::move(msg)};
    }
    static engine_error integrity(std::string msg) {
        return {error_kind::integrity, std::move(msg)};
    }
    static engine_error persistence(std::string msg) {
        return {error_kind::persistence, std::move(msg)};
    }
};

template <typename T>
class result {
public:
    result(T value) : m_value(std::move(value)) {}
    result(engine_error error) : m_error(std::move(error)) {}

    bool ok() const {
        return m_error.ok();
    }

    const T& value() const {
        return *m_value;
    }
    T& value() {
        return *m_value;
    }

    const engine_error& error() const {
        return m_error;
    }

private:
    std::optional<T> m_value;
    engine_error m_error;
};
