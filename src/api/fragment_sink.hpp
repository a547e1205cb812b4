#pragma once

#include <cstdint>
#include <memory>

#include "api/publication_view.hpp"
#include "archive/frame_format.hpp"
#include "util/crc32c.hpp"

namespace api {

// Destination for replayed fragments. Returning false rejects the fragment
// and asks the reader to offer it again on the next poll.
class FragmentSink {
public:
    virtual ~FragmentSink() = default;
    virtual bool on_fragment(const archive::AtomicBuffer& buffer, archive::index_t offset, archive::index_t length) = 0;
    // A failed sink will never accept again.
    virtual bool failed() const noexcept { return false; }
};

// Accepts everything; keeps a running CRC32C over delivered payloads so two
// archive copies can be compared by digest.
class DigestSink final : public FragmentSink {
public:
    bool on_fragment(const archive::AtomicBuffer& buffer, archive::index_t offset, archive::index_t length) override {
        digest_.update(buffer.buffer() + offset, static_cast<std::size_t>(length));
        ++fragments_;
        bytes_ += static_cast<std::uint64_t>(length);
        return true;
    }

    std::uint32_t digest() const noexcept { return digest_.value(); }
    std::uint64_t fragments() const noexcept { return fragments_; }
    std::uint64_t bytes() const noexcept { return bytes_; }

private:
    util::Crc32cDigest digest_{};
    std::uint64_t fragments_{0};
    std::uint64_t bytes_{0};
};

struct PublicationSinkStats {
    std::uint64_t offered{0};
    std::uint64_t back_pressured{0};
    std::uint64_t admin_actions{0};
    std::uint64_t not_connected{0};
};

enum class PublicationFailure {
    None = 0,
    NotConnected,
    Closed,
    MaxPositionExceeded,
    Unknown,
};

const char* publication_failure_name(PublicationFailure failure) noexcept;

// Ships fragments to an Aeron publication. Back pressure and admin actions
// reject the fragment for redelivery; a closed or saturated publication
// fails the sink.
class PublicationSink final : public FragmentSink {
public:
    explicit PublicationSink(std::shared_ptr<PublicationView> publication) noexcept
        : publication_(std::move(publication)) {}

    bool on_fragment(const archive::AtomicBuffer& buffer, archive::index_t offset, archive::index_t length) override;

    bool failed() const noexcept override { return failure_ != PublicationFailure::None; }
    PublicationFailure failure() const noexcept { return failure_; }
    const PublicationSinkStats& stats() const noexcept { return stats_; }

private:
    std::shared_ptr<PublicationView> publication_;
    PublicationFailure failure_{PublicationFailure::None};
    PublicationSinkStats stats_{};
};

} // namespace api
