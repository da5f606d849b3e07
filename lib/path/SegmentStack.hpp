#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace lexpath::path {

/**
 * @brief Retained segments of a path being cleaned
 *
 * ".." pops the previous name. With nothing to pop it is dropped for a
 * rooted path and kept as a Parent marker otherwise, so later ".." never
 * consume it. Segments are views into the caller's string.
 */
class SegmentStack final {
public:
    static constexpr std::string_view CurrentDir = ".";
    static constexpr std::string_view ParentDir  = "..";

    enum class Tag: unsigned {
        Name,
        Parent
    };

    struct Segment {
        Tag tag;
        std::string_view text;
    };

    explicit SegmentStack(bool rooted) noexcept;

    void push(std::string_view segment);

    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] const std::vector<Segment>& segments() const noexcept;

    /**
     * @brief Join retained segments
     * @param separator - character placed between segments
     * @return empty string when nothing is retained
     */
    [[nodiscard]] std::string join(char separator) const;

private:
    bool rooted_;
    std::vector<Segment> segments_;
};

}
