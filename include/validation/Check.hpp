#pragma once

#include <optional>
#include <utility>

namespace tr::validation {

// Outcome of a pure validator: empty on success, otherwise the first violation found.
template <typename E> struct Check {
    std::optional<E> error;

    [[nodiscard]] bool ok() const { return !error.has_value(); }
    explicit operator bool() const { return ok(); }

    static Check pass() { return {}; }
    static Check fail(E e) { return {std::make_optional<E>(std::move(e))}; }
};

}
