// =============================================================================
// Mirador - Decoder Binding
// =============================================================================
// DecoderSlot:    which decoder kind the render surface was built for.
// DecoderBinding: one live decoder bound to a surface for one session.
//
// configure/decode are serialized per binding, so a decode issued after a
// reconfigure always runs against the new geometry.
// =============================================================================
#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "decoder.hpp"

namespace mirador::video {

class DecoderSlot {
public:
    DecoderSlot() = default;

    // Non-copyable
    DecoderSlot(const DecoderSlot&) = delete;
    DecoderSlot& operator=(const DecoderSlot&) = delete;

    // Surface for `descriptor`. A new surface (new identity) is created when
    // the kind differs from the one the current surface was built for.
    std::shared_ptr<RenderSurface> ensure(const DecoderDescriptor& descriptor);

    std::shared_ptr<RenderSurface> surface() const { return surface_; }
    const std::string& decoderKind() const { return kind_; }

private:
    std::string kind_;
    std::shared_ptr<RenderSurface> surface_;
};

class DecoderBinding {
public:
    static Result<std::unique_ptr<DecoderBinding>, SessionError> bind(
        const DecoderDescriptor& descriptor,
        std::shared_ptr<RenderSurface> surface);

    ~DecoderBinding();

    // Non-copyable
    DecoderBinding(const DecoderBinding&) = delete;
    DecoderBinding& operator=(const DecoderBinding&) = delete;

    // Resizes the surface to the cropped size, then reconfigures the decoder.
    // Until this succeeds no frame is decoded.
    Result<void, Error> reconfigure(const scrcpy::VideoGeometry& geometry);

    Result<void, Error> decode(const std::vector<uint8_t>& data);

    // Idempotent; safe when nothing was ever decoded
    void dispose();

    bool configured() const;
    bool disposed() const;

    const std::string& decoderKind() const { return kind_; }
    uint64_t surfaceId() const { return surface_ ? surface_->id() : 0; }

    uint64_t framesDecoded() const { return frames_decoded_.load(); }
    uint64_t errorsCount() const { return errors_count_.load(); }

private:
    DecoderBinding(std::string kind, std::unique_ptr<Decoder> decoder,
                   std::shared_ptr<RenderSurface> surface);

    const std::string kind_;
    std::unique_ptr<Decoder> decoder_;
    std::shared_ptr<RenderSurface> surface_;

    mutable std::mutex decode_mutex_;
    bool configured_ = false;
    bool disposed_ = false;

    std::atomic<uint64_t> frames_decoded_{0};
    std::atomic<uint64_t> errors_count_{0};
};

} // namespace mirador::video
