#include "Status.hpp"

namespace lexpath::util {

const char* Status::message() const noexcept {
    return message_.data();
}

Status Status::Ok() {
    return Status{Code::Ok, "", std::make_index_sequence<1>{}};
}

bool Status::isOk() const noexcept {
    return code_ == Code::Ok;
}

bool Status::isNotAbsolute() const noexcept {
    return code_ == Code::NotAbsolute;
}

bool Status::isDriveMismatch() const noexcept {
    return code_ == Code::DriveMismatch;
}

}
