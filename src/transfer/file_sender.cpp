#include "peerdrop/transfer/file_sender.hpp"
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/utils.hpp"

namespace peerdrop::transfer {

FileSender::FileSender(boost::asio::io_context& io_context, TransferOptions options)
    : io_context_(io_context)
    , options_(std::move(options))
    , backpressure_timer_(io_context)
    , generation_(0) {

    if (options_.chunk_size == 0) {
        options_.chunk_size = DEFAULT_CHUNK_SIZE;
    }
}

FileSender::~FileSender() {
    backpressure_timer_.cancel();
}

core::Result FileSender::send(std::unique_ptr<ChunkSource> source, CompletionCallback on_complete) {
    if (!channel_ || !channel_->is_open()) {
        return core::Result(core::ErrorCode::CHANNEL_NOT_READY, "Data channel is not open");
    }
    if (!source) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Nothing to send");
    }

    const auto& metadata = source->metadata();
    LOG_INFO("Queued {} ({}) for sending", metadata.name, core::utils::StringUtils::format_bytes(metadata.size));

    Job job;
    job.source = std::move(source);
    job.on_complete = std::move(on_complete);
    queue_.push_back(std::move(job));

    if (!active_) {
        boost::asio::post(io_context_, [weak = weak_from_this(), generation = generation_]() {
            auto self = weak.lock();
            if (self && self->generation_ == generation) {
                self->start_next();
            }
        });
    }
    return core::Result();
}

void FileSender::cancel_current() {
    if (active_) {
        LOG_INFO("Cancelling transfer of {}", active_->source->metadata().name);
        active_->token.cancel();
    }
}

void FileSender::stop() {
    ++generation_;
    backpressure_timer_.cancel();
    if (active_) {
        LOG_DEBUG("Dropping in-flight transfer of {}", active_->source->metadata().name);
    }
    active_.reset();
    queue_.clear();
}

std::optional<TransferProgress> FileSender::progress() const {
    if (!active_) {
        return std::nullopt;
    }

    const auto& metadata = active_->source->metadata();
    TransferProgress progress;
    progress.file_name = metadata.name;
    progress.total_size = metadata.size;
    progress.transferred_size = active_->sent;
    progress.progress = TransferProgress::percent(active_->sent, metadata.size);
    progress.direction = TransferDirection::SENDING;
    return progress;
}

void FileSender::start_next() {
    if (active_ || queue_.empty()) {
        return;
    }

    active_ = std::move(queue_.front());
    queue_.pop_front();

    if (!channel_ || !channel_->is_open()) {
        finish(core::Result(core::ErrorCode::CHANNEL_NOT_READY, "Data channel is not open"));
        return;
    }

    const auto& metadata = active_->source->metadata();
    LOG_INFO("Sending {} ({} bytes, {})", metadata.name, metadata.size, metadata.mime_type);

    if (!send_frame(MetadataFrame{metadata})) {
        finish(core::Result(core::ErrorCode::TRANSPORT_ERROR, "Failed to send metadata"));
        return;
    }

    report_progress();
    schedule_chunk();
}

void FileSender::schedule_chunk() {
    boost::asio::post(io_context_, [weak = weak_from_this(), generation = generation_]() {
        auto self = weak.lock();
        if (self && self->generation_ == generation) {
            self->send_chunk();
        }
    });
}

void FileSender::send_chunk() {
    if (!active_) {
        return;
    }

    auto& job = *active_;
    const auto& metadata = job.source->metadata();

    if (job.token.is_cancelled()) {
        send_frame(CancelFrame{metadata.name});
        finish(core::Result(core::ErrorCode::CANCELLED, "Transfer of " + metadata.name + " cancelled"));
        return;
    }

    if (!channel_ || !channel_->is_open()) {
        finish(core::Result(core::ErrorCode::CHANNEL_NOT_READY, "Data channel closed during transfer"));
        return;
    }

    if (channel_->buffered_amount() > options_.max_buffered_bytes) {
        backpressure_timer_.expires_after(options_.backpressure_delay);
        backpressure_timer_.async_wait(
            [weak = weak_from_this(), generation = generation_](const boost::system::error_code& ec) {
                auto self = weak.lock();
                if (!ec && self && self->generation_ == generation) {
                    self->send_chunk();
                }
            });
        return;
    }

    if (job.sent >= metadata.size) {
        if (!send_frame(EndOfFileFrame{metadata.name, metadata.size, job.digest.hex()})) {
            finish(core::Result(core::ErrorCode::TRANSPORT_ERROR, "Failed to send end of file"));
            return;
        }
        finish(core::Result());
        return;
    }

    std::vector<std::uint8_t> chunk;
    auto result = job.source->read(options_.chunk_size, chunk);
    if (result && chunk.empty()) {
        result = core::Result(core::ErrorCode::IO_ERROR, "Unexpected end of " + metadata.name);
    }
    if (!result) {
        send_frame(CancelFrame{metadata.name});
        finish(result);
        return;
    }

    if (!channel_->send_binary(chunk)) {
        finish(core::Result(core::ErrorCode::TRANSPORT_ERROR, "Failed to send chunk"));
        return;
    }

    job.digest.update(chunk);
    job.sent += chunk.size();
    LOG_TRACE("Sent {} bytes of {} ({}/{})", chunk.size(), metadata.name, job.sent, metadata.size);

    report_progress();
    schedule_chunk();
}

void FileSender::finish(core::Result result) {
    auto job = std::move(*active_);
    active_.reset();

    const auto& metadata = job.source->metadata();
    if (result) {
        LOG_INFO("Finished sending {} ({} bytes)", metadata.name, job.sent);
    } else {
        LOG_WARN("Sending {} stopped: {}", metadata.name, result.describe());
    }

    auto generation = generation_;
    if (job.on_complete) {
        job.on_complete(metadata, result);
    }

    if (generation == generation_ && !queue_.empty()) {
        boost::asio::post(io_context_, [weak = weak_from_this(), generation]() {
            auto self = weak.lock();
            if (self && self->generation_ == generation) {
                self->start_next();
            }
        });
    }
}

bool FileSender::send_frame(const TransferFrame& frame) {
    if (!channel_) {
        return false;
    }
    auto message = encode_frame(frame);
    if (auto* text = std::get_if<std::string>(&message)) {
        return channel_->send_text(*text);
    }
    return channel_->send_binary(std::get<std::vector<std::uint8_t>>(message));
}

void FileSender::report_progress() {
    if (!progress_callback_) {
        return;
    }
    if (auto current = progress()) {
        progress_callback_(*current);
    }
}

}
