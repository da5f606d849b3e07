#include "SegmentStack.hpp"

namespace lexpath::path {

SegmentStack::SegmentStack(bool rooted) noexcept:
    rooted_{rooted}
{
}

void SegmentStack::push(std::string_view segment) {
    if (segment.empty() || segment == CurrentDir)
        return;

    if (segment != ParentDir) {
        segments_.push_back({Tag::Name, segment});
        return;
    }

    if (!segments_.empty() && segments_.back().tag == Tag::Name) {
        segments_.pop_back();
        return;
    }

    if (rooted_)
        return;  // cannot go above root

    segments_.push_back({Tag::Parent, segment});
}

bool SegmentStack::empty() const noexcept {
    return segments_.empty();
}

std::size_t SegmentStack::size() const noexcept {
    return segments_.size();
}

const std::vector<SegmentStack::Segment>& SegmentStack::segments() const noexcept {
    return segments_;
}

std::string SegmentStack::join(char separator) const {
    std::string ret;

    for (auto&& s : segments_) {
        if (!ret.empty())
            ret.push_back(separator);

        ret.append(s.text);
    }

    return ret;
}

}
