// =============================================================================
// Mirador - Decoder Contract
// =============================================================================
// Decoders are constructed against a RenderSurface and draw into it. A surface
// keeps the rendering-context type it was created with for its whole lifetime,
// so a decoder needing another context type needs another surface.
// =============================================================================
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../result.hpp"
#include "../scrcpy_protocol.hpp"

namespace mirador::video {

// =============================================================================
// RenderSurface
// =============================================================================
class RenderSurface {
public:
    RenderSurface(uint64_t id, std::string context_type)
        : id_(id), context_type_(std::move(context_type)) {}

    // Non-copyable: identity matters
    RenderSurface(const RenderSurface&) = delete;
    RenderSurface& operator=(const RenderSurface&) = delete;

    uint64_t id() const { return id_; }
    const std::string& contextType() const { return context_type_; }

    void resize(int width, int height) {
        std::lock_guard<std::mutex> lock(mutex_);
        width_ = width;
        height_ = height;
    }

    int width() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return width_;
    }

    int height() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return height_;
    }

private:
    const uint64_t id_;
    const std::string context_type_;
    mutable std::mutex mutex_;
    int width_ = 0;
    int height_ = 0;
};

// =============================================================================
// Decoder
// =============================================================================
class Decoder {
public:
    virtual ~Decoder() = default;

    // (Re)initialize for a new stream geometry
    virtual Result<void, Error> configure(const scrcpy::VideoGeometry& geometry) = 0;

    // One encoded access unit
    virtual Result<void, Error> decode(const std::vector<uint8_t>& data) = 0;

    virtual void dispose() = 0;
};

using DecoderFactory = std::function<std::unique_ptr<Decoder>(RenderSurface& surface)>;

struct DecoderDescriptor {
    std::string name;           // also the decoder kind
    std::string context_type;   // rendering context the surface must provide
    DecoderFactory factory;
};

// =============================================================================
// DecoderRegistry - ordered list of usable decoders, first is the default
// =============================================================================
class DecoderRegistry {
public:
    // Replaces an entry with the same name, keeping its position
    void add(DecoderDescriptor descriptor);

    std::optional<DecoderDescriptor> find(const std::string& name) const;
    std::optional<DecoderDescriptor> defaultDecoder() const;
    std::vector<std::string> names() const;

    size_t size() const { return decoders_.size(); }
    bool empty() const { return decoders_.empty(); }

private:
    std::vector<DecoderDescriptor> decoders_;
};

} // namespace mirador::video
