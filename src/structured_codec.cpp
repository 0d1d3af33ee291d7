/**
 * @file structured_codec.cpp
 * @brief Length-prefixed JSON wire codec implementation
 * @version 1.0
 * @date 2026-10-19
 */

#include <limits>

#include "../include/codec/structured_codec.hpp"

using json = nlohmann::json;

namespace canlink {

    namespace {

        // Reads an unsigned integer no larger than max_value
        bool read_unsigned(const json& value, std::uint64_t max_value, std::uint64_t& out) {
            if (value.is_number_unsigned()) {
                out = value.get<std::uint64_t>();
                return out <= max_value;
            }
            if (value.is_number_integer()) {
                std::int64_t v = value.get<std::int64_t>();
                if (v < 0) return false;
                out = static_cast<std::uint64_t>(v);
                return out <= max_value;
            }
            return false;
        }

    } // namespace

    Result<DecodeOutcome> StructuredCodec::try_decode(span<const std::uint8_t> buffer) const {
        if (buffer.size() < StructuredLayout::PREFIX_SIZE) {
            return Result<DecodeOutcome>::error(Status::WINCOMPLETE, "structured prefix");
        }

        std::uint32_t n = bytes_to_int_be<std::uint32_t>(
            buffer.subspan(StructuredLayout::LENGTH, StructuredLayout::PREFIX_SIZE));
        if (n > max_message_bytes_) {
            return Result<DecodeOutcome>::error(Status::WBAD_LENGTH,
                "structured length " + std::to_string(n));
        }

        std::size_t total = StructuredLayout::PREFIX_SIZE + n;
        if (buffer.size() < total) {
            return Result<DecodeOutcome>::error(Status::WINCOMPLETE, "structured record");
        }

        auto record_bytes = buffer.subspan(StructuredLayout::PAYLOAD, n);
        json record;
        try {
            record = json::parse(record_bytes.begin(), record_bytes.end());
        } catch (const json::parse_error& e) {
            return Result<DecodeOutcome>::error(Status::WBAD_FORMAT,
                std::string("structured parse: ") + e.what());
        }

        DecodeOutcome outcome;
        Status status = record_to_frame(record, outcome);
        if (status != Status::SUCCESS) {
            return Result<DecodeOutcome>::error(status, "structured record");
        }
        outcome.consumed = total;
        return Result<DecodeOutcome>::success(std::move(outcome));
    }

    Status StructuredCodec::record_to_frame(const json& record, DecodeOutcome& outcome) {
        if (!record.is_object()) {
            return Status::WBAD_FORMAT;
        }

        auto type_it = record.find(StructuredLayout::KEY_TYPE);
        if (type_it == record.end() || !type_it->is_string()) {
            return Status::WBAD_FORMAT;
        }
        if (type_it->get<std::string>() != StructuredLayout::FRAME_TYPE) {
            // Not a frame record: consumed and ignored
            return Status::SUCCESS;
        }

        auto id_it = record.find(StructuredLayout::KEY_ID);
        std::uint64_t id = 0;
        if (id_it == record.end() ||
            !read_unsigned(*id_it, std::numeric_limits<std::uint32_t>::max(), id)) {
            return Status::WBAD_ID;
        }

        std::uint64_t flags = 0;
        auto flags_it = record.find(StructuredLayout::KEY_FLAGS);
        if (flags_it != record.end() &&
            !read_unsigned(*flags_it, std::numeric_limits<std::uint32_t>::max(), flags)) {
            return Status::WBAD_FORMAT;
        }

        std::vector<std::uint8_t> data;
        auto data_it = record.find(StructuredLayout::KEY_DATA);
        if (data_it != record.end()) {
            if (!data_it->is_array()) {
                return Status::WBAD_DATA;
            }
            data.reserve(data_it->size());
            for (const auto& element : *data_it) {
                std::uint64_t byte = 0;
                if (!read_unsigned(element, 0xFF, byte)) {
                    return Status::WBAD_DATA;
                }
                data.push_back(static_cast<std::uint8_t>(byte));
            }
        }

        Frame frame;
        frame.id = static_cast<std::uint32_t>(id);
        frame.flags = static_cast<std::uint32_t>(flags);
        outcome.truncated_bytes = assign_payload(frame, span<const std::uint8_t>(data));
        outcome.frame = std::move(frame);
        return Status::SUCCESS;
    }

    json StructuredCodec::frame_to_record(const Frame& frame) {
        json record;
        record[StructuredLayout::KEY_TYPE] = StructuredLayout::FRAME_TYPE;
        record[StructuredLayout::KEY_ID] = frame.id;
        record[StructuredLayout::KEY_DATA] = frame.payload;
        if (frame.flags != 0) {
            record[StructuredLayout::KEY_FLAGS] = frame.flags;
        }
        return record;
    }

    std::vector<std::uint8_t> StructuredCodec::encode(const Frame& frame) const {
        std::string text = frame_to_record(frame).dump();

        std::vector<std::uint8_t> out;
        out.reserve(StructuredLayout::PREFIX_SIZE + text.size());
        auto prefix = int_to_bytes_be<std::uint32_t>(static_cast<std::uint32_t>(text.size()));
        out.insert(out.end(), prefix.begin(), prefix.end());
        out.insert(out.end(), text.begin(), text.end());
        return out;
    }

} // namespace canlink
