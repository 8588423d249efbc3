#include "decoder_binding.hpp"
#include "../mirador_log.hpp"

namespace mirador::video {

namespace {
// Surface identities are process-wide so a new slot never reuses an old id
std::atomic<uint64_t> g_next_surface_id{1};
}

// =============================================================================
// DecoderSlot
// =============================================================================

std::shared_ptr<RenderSurface> DecoderSlot::ensure(const DecoderDescriptor& descriptor) {
    if (surface_ && kind_ == descriptor.name) {
        return surface_;
    }

    auto id = g_next_surface_id.fetch_add(1);
    surface_ = std::make_shared<RenderSurface>(id, descriptor.context_type);
    kind_ = descriptor.name;
    MLOG_INFO("decoder", "New render surface #%llu for '%s' (context=%s)",
              (unsigned long long)id, kind_.c_str(), descriptor.context_type.c_str());
    return surface_;
}

// =============================================================================
// DecoderBinding
// =============================================================================

Result<std::unique_ptr<DecoderBinding>, SessionError> DecoderBinding::bind(
        const DecoderDescriptor& descriptor,
        std::shared_ptr<RenderSurface> surface) {
    if (!surface) {
        return SessionError::decoderUnavailable("No render surface for decoder '" + descriptor.name + "'");
    }
    if (surface->contextType() != descriptor.context_type) {
        return SessionError::decoderUnavailable(
            "Surface #" + std::to_string(surface->id()) + " provides '" + surface->contextType() +
            "' but decoder '" + descriptor.name + "' needs '" + descriptor.context_type + "'");
    }
    if (!descriptor.factory) {
        return SessionError::decoderUnavailable("Decoder '" + descriptor.name + "' has no factory");
    }

    auto decoder = descriptor.factory(*surface);
    if (!decoder) {
        return SessionError::decoderUnavailable("Failed to create decoder '" + descriptor.name + "'");
    }

    MLOG_INFO("decoder", "Bound '%s' to surface #%llu",
              descriptor.name.c_str(), (unsigned long long)surface->id());
    return std::unique_ptr<DecoderBinding>(
        new DecoderBinding(descriptor.name, std::move(decoder), std::move(surface)));
}

DecoderBinding::DecoderBinding(std::string kind, std::unique_ptr<Decoder> decoder,
                               std::shared_ptr<RenderSurface> surface)
    : kind_(std::move(kind)), decoder_(std::move(decoder)), surface_(std::move(surface)) {}

DecoderBinding::~DecoderBinding() {
    dispose();
}

Result<void, Error> DecoderBinding::reconfigure(const scrcpy::VideoGeometry& geometry) {
    std::lock_guard<std::mutex> lock(decode_mutex_);
    if (disposed_) {
        return Error("Decoder already disposed");
    }

    configured_ = false;
    surface_->resize(geometry.cropped_width, geometry.cropped_height);

    auto result = decoder_->configure(geometry);
    if (result.is_err()) {
        errors_count_++;
        MLOG_ERROR("decoder", "'%s' configure %dx%d failed: %s", kind_.c_str(),
                   geometry.cropped_width, geometry.cropped_height,
                   result.error().message.c_str());
        return result;
    }

    configured_ = true;
    MLOG_INFO("decoder", "'%s' configured for %dx%d", kind_.c_str(),
              geometry.cropped_width, geometry.cropped_height);
    return result;
}

Result<void, Error> DecoderBinding::decode(const std::vector<uint8_t>& data) {
    std::lock_guard<std::mutex> lock(decode_mutex_);
    if (disposed_) {
        return Error("Decoder already disposed");
    }
    if (!configured_) {
        return Error("Decoder not configured for current geometry");
    }

    auto result = decoder_->decode(data);
    if (result.is_err()) {
        errors_count_++;
        return result;
    }
    frames_decoded_++;
    return result;
}

void DecoderBinding::dispose() {
    std::lock_guard<std::mutex> lock(decode_mutex_);
    if (disposed_) return;
    disposed_ = true;
    configured_ = false;
    if (decoder_) {
        decoder_->dispose();
    }
    MLOG_INFO("decoder", "'%s' disposed (frames=%llu errors=%llu)", kind_.c_str(),
              (unsigned long long)frames_decoded_.load(),
              (unsigned long long)errors_count_.load());
}

bool DecoderBinding::configured() const {
    std::lock_guard<std::mutex> lock(decode_mutex_);
    return configured_;
}

bool DecoderBinding::disposed() const {
    std::lock_guard<std::mutex> lock(decode_mutex_);
    return disposed_;
}

} // namespace mirador::video
