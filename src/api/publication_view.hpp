#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <aeron/Aeron.h>
#include <aeron/Publication.h>
#include <aeron/concurrent/AtomicBuffer.h>

namespace api {

// Narrow seam over aeron::Publication so sinks can be tested without a
// media driver.
class PublicationView {
public:
    virtual ~PublicationView() = default;
    // Aeron offer semantics: new stream position on success, otherwise one of
    // aeron::NOT_CONNECTED, BACK_PRESSURED, ADMIN_ACTION, PUBLICATION_CLOSED,
    // MAX_POSITION_EXCEEDED.
    virtual std::int64_t offer(const aeron::concurrent::AtomicBuffer& buffer,
                               aeron::util::index_t offset,
                               aeron::util::index_t length) = 0;
    virtual bool is_connected() const = 0;
};

class AeronClientView {
public:
    virtual ~AeronClientView() = default;
    virtual std::int64_t add_publication(const std::string& channel, std::int32_t stream_id) = 0;
    virtual std::shared_ptr<PublicationView> find_publication(std::int64_t registration_id) = 0;
};

class RealPublicationView final : public PublicationView {
public:
    explicit RealPublicationView(std::shared_ptr<aeron::Publication> pub) : pub_(std::move(pub)) {}

    std::int64_t offer(const aeron::concurrent::AtomicBuffer& buffer,
                       aeron::util::index_t offset,
                       aeron::util::index_t length) override {
        return pub_->offer(buffer, offset, length);
    }

    bool is_connected() const override { return pub_->isConnected(); }

private:
    std::shared_ptr<aeron::Publication> pub_;
};

class RealAeronClientView final : public AeronClientView {
public:
    explicit RealAeronClientView(std::shared_ptr<aeron::Aeron> client) : client_(std::move(client)) {}

    std::int64_t add_publication(const std::string& channel, std::int32_t stream_id) override {
        return client_->addPublication(channel, stream_id);
    }

    std::shared_ptr<PublicationView> find_publication(std::int64_t registration_id) override {
        auto publication = client_->findPublication(registration_id);
        if (!publication) {
            return nullptr;
        }
        return std::make_shared<RealPublicationView>(std::move(publication));
    }

private:
    std::shared_ptr<aeron::Aeron> client_;
};

inline std::shared_ptr<AeronClientView> make_aeron_client_view(std::shared_ptr<aeron::Aeron> client) {
    return std::make_shared<RealAeronClientView>(std::move(client));
}

} // namespace api
