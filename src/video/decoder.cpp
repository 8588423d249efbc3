#include "decoder.hpp"
#include "../mirador_log.hpp"

namespace mirador::video {

void DecoderRegistry::add(DecoderDescriptor descriptor) {
    for (auto& existing : decoders_) {
        if (existing.name == descriptor.name) {
            existing = std::move(descriptor);
            return;
        }
    }
    MLOG_DEBUG("decoder", "Registered decoder '%s' (context=%s)",
               descriptor.name.c_str(), descriptor.context_type.c_str());
    decoders_.push_back(std::move(descriptor));
}

std::optional<DecoderDescriptor> DecoderRegistry::find(const std::string& name) const {
    for (const auto& d : decoders_) {
        if (d.name == name) return d;
    }
    return std::nullopt;
}

std::optional<DecoderDescriptor> DecoderRegistry::defaultDecoder() const {
    if (decoders_.empty()) return std::nullopt;
    return decoders_.front();
}

std::vector<std::string> DecoderRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(decoders_.size());
    for (const auto& d : decoders_) result.push_back(d.name);
    return result;
}

} // namespace mirador::video
