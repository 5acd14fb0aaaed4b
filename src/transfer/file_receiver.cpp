#include "peerdrop/transfer/file_receiver.hpp"
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/utils.hpp"
#include <algorithm>

namespace peerdrop::transfer {

namespace {
    constexpr std::size_t MAX_PREALLOCATION = 64 * 1024 * 1024;
}

FileReceiver::FileReceiver(TransferOptions options)
    : options_(std::move(options))
    , violations_(0) {
}

core::Result FileReceiver::handle_message(network::ChannelMessage message) {
    TransferFrame frame;
    auto result = decode_frame(std::move(message), frame);
    if (!result) {
        LOG_WARN("Ignoring channel message: {}", result.message);
        return result;
    }
    return handle_frame(std::move(frame));
}

core::Result FileReceiver::handle_frame(TransferFrame frame) {
    return std::visit(core::utils::overloaded{
        [this](MetadataFrame& f) { return on_metadata(std::move(f)); },
        [this](ChunkFrame& f) { return on_chunk(std::move(f)); },
        [this](EndOfFileFrame& f) { return on_end_of_file(f); },
        [this](CancelFrame& f) { return on_cancel(f); }
    }, frame);
}

void FileReceiver::abort_current() {
    if (active_) {
        LOG_DEBUG("Discarding partial file {}", active_->metadata.name);
    }
    active_.reset();
}

std::optional<TransferProgress> FileReceiver::progress() const {
    if (!active_) {
        return std::nullopt;
    }

    TransferProgress progress;
    progress.file_name = active_->metadata.name;
    progress.total_size = active_->metadata.size;
    progress.transferred_size = active_->data.size();
    progress.progress = TransferProgress::percent(active_->data.size(), active_->metadata.size);
    progress.direction = TransferDirection::RECEIVING;
    return progress;
}

core::Result FileReceiver::on_metadata(MetadataFrame frame) {
    core::Result result;
    if (active_) {
        result = violation("Metadata for " + frame.metadata.name + " arrived while " +
                           active_->metadata.name + " was incomplete; partial file discarded");
        active_.reset();
    }

    LOG_INFO("Receiving {} ({}, {})", frame.metadata.name,
             core::utils::StringUtils::format_bytes(frame.metadata.size), frame.metadata.mime_type);

    InProgress incoming;
    incoming.metadata = std::move(frame.metadata);
    incoming.data.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(incoming.metadata.size, MAX_PREALLOCATION)));
    active_ = std::move(incoming);

    report_progress();

    if (active_ && !options_.require_end_marker && active_->metadata.size == 0) {
        complete();
    }
    return result;
}

core::Result FileReceiver::on_chunk(ChunkFrame frame) {
    if (!active_) {
        return violation("Chunk of " + std::to_string(frame.data.size()) + " bytes without metadata dropped");
    }

    auto& file = *active_;
    if (file.data.size() + frame.data.size() > file.metadata.size) {
        auto name = file.metadata.name;
        active_.reset();
        return violation("More bytes than declared for " + name + "; partial file discarded");
    }

    file.data.insert(file.data.end(), frame.data.begin(), frame.data.end());
    file.digest.update(frame.data);
    LOG_TRACE("Received {} bytes of {} ({}/{})", frame.data.size(), file.metadata.name,
              file.data.size(), file.metadata.size);

    report_progress();

    if (active_ && !options_.require_end_marker && active_->data.size() >= active_->metadata.size) {
        complete();
    }
    return core::Result();
}

core::Result FileReceiver::on_end_of_file(const EndOfFileFrame& frame) {
    if (!options_.require_end_marker) {
        // Completion already happened on the byte count
        LOG_DEBUG("End of {} acknowledged", frame.name);
        return core::Result();
    }

    if (!active_) {
        return violation("End of " + frame.name + " without an active file");
    }

    auto& file = *active_;
    if (file.data.size() != file.metadata.size || frame.size != file.metadata.size) {
        auto message = "End of " + file.metadata.name + " after " + std::to_string(file.data.size()) +
                       " of " + std::to_string(file.metadata.size) + " bytes; partial file discarded";
        active_.reset();
        return violation(message);
    }

    if (frame.digest.empty()) {
        LOG_DEBUG("No digest for {}, trusting the byte count", file.metadata.name);
    } else if (!crypto::FileDigest::matches(frame.digest, file.digest.hex())) {
        auto message = "Digest mismatch for " + file.metadata.name + "; file discarded";
        active_.reset();
        return violation(message);
    }

    complete();
    return core::Result();
}

core::Result FileReceiver::on_cancel(const CancelFrame& frame) {
    if (!active_) {
        LOG_DEBUG("Cancel for {} with nothing in progress", frame.name);
        return core::Result();
    }

    LOG_INFO("Sender cancelled {}", active_->metadata.name);
    active_.reset();
    return core::Result();
}

void FileReceiver::complete() {
    auto file = std::move(*active_);
    active_.reset();

    ReceivedFile received;
    received.name = std::move(file.metadata.name);
    received.size = file.metadata.size;
    received.mime_type = std::move(file.metadata.mime_type);
    received.data = std::move(file.data);

    LOG_INFO("Received {} ({} bytes)", received.name, received.size);
    received_.push_back(std::move(received));

    if (file_callback_) {
        file_callback_(received_.back());
    }
}

core::Result FileReceiver::violation(const std::string& message) {
    ++violations_;
    LOG_WARN("Protocol violation: {}", message);
    return core::Result(core::ErrorCode::PROTOCOL_VIOLATION, message);
}

void FileReceiver::report_progress() {
    if (!progress_callback_) {
        return;
    }
    if (auto current = progress()) {
        progress_callback_(*current);
    }
}

}
