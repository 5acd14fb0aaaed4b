#include "peerdrop/transfer/transfer_frame.hpp"
#include "peerdrop/core/utils.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace peerdrop::transfer {

namespace {
    std::uint64_t read_size(const nlohmann::json& j) {
        const auto& size = j.at("size");
        if (!size.is_number_unsigned()) {
            throw std::invalid_argument("size must be a non-negative integer");
        }
        return size.get<std::uint64_t>();
    }

    core::Result decode_text(const std::string& text, TransferFrame& out_frame) {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(text);
        } catch (const nlohmann::json::exception& e) {
            return core::Result(core::ErrorCode::MALFORMED_PAYLOAD, std::string("Invalid control message: ") + e.what());
        }

        try {
            auto type = j.at("type").get<std::string>();
            if (type == "metadata") {
                MetadataFrame frame;
                frame.metadata.name = j.at("name").get<std::string>();
                frame.metadata.size = read_size(j);
                frame.metadata.mime_type = j.value("mimeType", std::string("application/octet-stream"));
                out_frame = std::move(frame);
            } else if (type == "eof") {
                EndOfFileFrame frame;
                frame.name = j.value("name", std::string());
                frame.size = read_size(j);
                frame.digest = j.value("digest", std::string());
                out_frame = std::move(frame);
            } else if (type == "cancel") {
                out_frame = CancelFrame{j.value("name", std::string())};
            } else {
                return core::Result(core::ErrorCode::MALFORMED_PAYLOAD, "Unknown control message type '" + type + "'");
            }
        } catch (const nlohmann::json::exception& e) {
            return core::Result(core::ErrorCode::MALFORMED_PAYLOAD, std::string("Invalid control message: ") + e.what());
        } catch (const std::invalid_argument& e) {
            return core::Result(core::ErrorCode::MALFORMED_PAYLOAD, std::string("Invalid control message: ") + e.what());
        }
        return core::Result();
    }
}

network::ChannelMessage encode_frame(const TransferFrame& frame) {
    return std::visit(core::utils::overloaded{
        [](const MetadataFrame& f) -> network::ChannelMessage {
            nlohmann::json j = {
                {"type", "metadata"},
                {"name", f.metadata.name},
                {"size", f.metadata.size},
                {"mimeType", f.metadata.mime_type}
            };
            return j.dump();
        },
        [](const ChunkFrame& f) -> network::ChannelMessage {
            return f.data;
        },
        [](const EndOfFileFrame& f) -> network::ChannelMessage {
            nlohmann::json j = {{"type", "eof"}, {"name", f.name}, {"size", f.size}};
            if (!f.digest.empty()) {
                j["digest"] = f.digest;
            }
            return j.dump();
        },
        [](const CancelFrame& f) -> network::ChannelMessage {
            nlohmann::json j = {{"type", "cancel"}, {"name", f.name}};
            return j.dump();
        }
    }, frame);
}

core::Result decode_frame(network::ChannelMessage message, TransferFrame& out_frame) {
    if (auto* binary = std::get_if<std::vector<std::uint8_t>>(&message)) {
        out_frame = ChunkFrame{std::move(*binary)};
        return core::Result();
    }
    return decode_text(std::get<std::string>(message), out_frame);
}

}
