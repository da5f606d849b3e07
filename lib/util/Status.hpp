#pragma once

#include <array>
#include <utility>

namespace lexpath::util {

/**
 * @brief Operation status indication
 */
class Status final {
    enum class Code: unsigned {
        Ok,
        NotAbsolute,
        DriveMismatch,
        Undefined
    };

    static constexpr std::size_t MAX_MESSAGE_LEN = 36;

public:
    [[nodiscard]] static Status Ok();

    /**
     * @brief Path had to be absolute but is relative or only rooted
     */
    template<typename T>
    [[nodiscard]] static constexpr Status NotAbsolute(T&& m) {
        return create(Code::NotAbsolute, std::forward<T>(m));
    }

    /**
     * @brief Drive-relative path names a drive other than the one it is resolved against
     */
    template<typename T>
    [[nodiscard]] static constexpr Status DriveMismatch(T&& m) {
        return create(Code::DriveMismatch, std::forward<T>(m));
    }

    constexpr Status() = default;
    ~Status() = default;

    Status(const Status&) = default;
    Status& operator=(const Status&) = default;

    Status(Status&&) noexcept = default;
    Status& operator=(Status&&) noexcept = default;

    [[nodiscard]] const char* message() const noexcept;

    [[nodiscard]] bool isOk() const noexcept;
    [[nodiscard]] bool isNotAbsolute() const noexcept;
    [[nodiscard]] bool isDriveMismatch() const noexcept;

private:
    template<std::size_t N>
    [[nodiscard]] static inline constexpr Status create(Code code, const char (&m)[N]) {
        static_assert(N < MAX_MESSAGE_LEN, "Message too long. Max length is 36 chars");

        return Status{code, m, std::make_index_sequence<N>{}};
    }

    template<std::size_t N, std::size_t... I>
    constexpr Status(Code code, const char (&m)[N], std::index_sequence<I...>) noexcept:
        code_{code},
        message_{m[I]...}
    {
    }

    Code code_{Code::Undefined};
    std::array<char, MAX_MESSAGE_LEN> message_{0};
};

}
