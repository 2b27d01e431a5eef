#pragma once

#include <QString>

#include <utility>
#include <variant>

namespace salon {
namespace core {

enum class BookingError
{
    UnknownClient,
    UnknownService,
    InvalidSlot,
    SlotConflict,
    NotFound,
    AlreadyCancelled,
    InvalidTransition,
    StorageTimeout,
    StorageUnavailable,
};

QString errorName(BookingError error);

// True for errors a caller may retry after a fresh availability lookup or a backoff.
bool isRetryable(BookingError error);

template <typename T>
class Result
{
public:
    Result(T value)
        : m_state(std::move(value))
    {
    }

    Result(BookingError error)
        : m_state(error)
    {
    }

    bool ok() const { return std::holds_alternative<T>(m_state); }
    explicit operator bool() const { return ok(); }

    const T &value() const & { return std::get<T>(m_state); }
    T &value() & { return std::get<T>(m_state); }
    T &&value() && { return std::get<T>(std::move(m_state)); }

    const T *operator->() const { return &std::get<T>(m_state); }
    const T &operator*() const { return std::get<T>(m_state); }

    BookingError error() const { return std::get<BookingError>(m_state); }

private:
    std::variant<T, BookingError> m_state;
};

} // namespace core
} // namespace salon
