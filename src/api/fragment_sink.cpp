#include "api/fragment_sink.hpp"

#include "util/log.hpp"

namespace api {

const char* publication_failure_name(PublicationFailure failure) noexcept {
    switch (failure) {
    case PublicationFailure::None: return "none";
    case PublicationFailure::NotConnected: return "not-connected";
    case PublicationFailure::Closed: return "closed";
    case PublicationFailure::MaxPositionExceeded: return "max-position-exceeded";
    case PublicationFailure::Unknown: return "unknown";
    }
    return "unknown";
}

bool PublicationSink::on_fragment(const archive::AtomicBuffer& buffer,
                                  archive::index_t offset,
                                  archive::index_t length) {
    if (failed()) {
        return false;
    }

    const std::int64_t result = publication_->offer(buffer, offset, length);
    if (result > 0) {
        ++stats_.offered;
        return true;
    }

    if (result == aeron::BACK_PRESSURED) {
        ++stats_.back_pressured;
        return false;
    }
    if (result == aeron::ADMIN_ACTION) {
        ++stats_.admin_actions;
        return false;
    }

    if (result == aeron::NOT_CONNECTED) {
        ++stats_.not_connected;
        failure_ = PublicationFailure::NotConnected;
    } else if (result == aeron::PUBLICATION_CLOSED) {
        failure_ = PublicationFailure::Closed;
    } else if (result == aeron::MAX_POSITION_EXCEEDED) {
        failure_ = PublicationFailure::MaxPositionExceeded;
    } else {
        failure_ = PublicationFailure::Unknown;
    }
    util::log(util::LogLevel::Error, "PublicationSink: offer failed result=%lld (%s)",
              static_cast<long long>(result), publication_failure_name(failure_));
    return false;
}

} // namespace api
