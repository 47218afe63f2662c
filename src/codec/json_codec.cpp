#include "coinjecture/codec.hpp"
#include "coinjecture/log.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <limits>

namespace coinjecture::codec {

using crypto::utils::to_hex;

namespace {
    constexpr std::array<const char*, 10> HEADER_FIELDS = {
        "codec_version", "block_index", "timestamp", "parent_hash", "merkle_root",
        "miner_address", "commitment", "difficulty_target", "nonce", "extra_data",
    };

    std::nullopt_t reject(CodecError* error, CodecError reason, const char* field) {
        if (error) {
            *error = reason;
        }
        COINJ_LOG_DEBUG(std::string("codec: json rejected at '") + field + "': " +
                        to_string(reason));
        return std::nullopt;
    }

    bool read_unsigned(const nlohmann::json& object, const char* field, uint64_t& out) {
        const auto& value = object.at(field);
        if (!value.is_number_unsigned()) {
            return false;
        }
        out = value.get<uint64_t>();
        return true;
    }

    bool read_signed(const nlohmann::json& object, const char* field, int64_t& out) {
        const auto& value = object.at(field);
        if (value.is_number_unsigned()) {
            uint64_t raw = value.get<uint64_t>();
            if (raw > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return false;
            }
            out = static_cast<int64_t>(raw);
            return true;
        }
        if (!value.is_number_integer()) {
            return false;
        }
        out = value.get<int64_t>();
        return true;
    }

    bool read_hash(const nlohmann::json& object, const char* field, Hash256& out) {
        const auto& value = object.at(field);
        if (!value.is_string()) {
            return false;
        }
        auto hash = crypto::utils::hash256_from_hex(value.get<std::string>());
        if (!hash) {
            return false;
        }
        out = *hash;
        return true;
    }
}

std::string header_to_json(const BlockHeader& header, int indent) {
    nlohmann::ordered_json object;
    object["codec_version"] = header.codec_version;
    object["block_index"] = header.block_index;
    object["timestamp"] = header.timestamp;
    object["parent_hash"] = to_hex(header.parent_hash);
    object["merkle_root"] = to_hex(header.merkle_root);
    object["miner_address"] = to_hex(header.miner_address);
    object["commitment"] = to_hex(header.commitment);
    object["difficulty_target"] = header.difficulty_target;
    object["nonce"] = header.nonce;
    object["extra_data"] = to_hex(header.extra_data);
    return object.dump(indent);
}

std::optional<BlockHeader> header_from_json(const std::string& text, CodecError* error) {
    auto object = nlohmann::json::parse(text, nullptr, false);
    if (object.is_discarded() || !object.is_object()) {
        return reject(error, CodecError::MalformedJson, "<root>");
    }

    // Exactly the header fields, nothing more
    for (const char* field : HEADER_FIELDS) {
        if (!object.contains(field)) {
            return reject(error, CodecError::InvalidField, field);
        }
    }
    if (object.size() != HEADER_FIELDS.size()) {
        return reject(error, CodecError::InvalidField, "<unknown>");
    }

    BlockHeader header;

    uint64_t version = 0;
    if (!read_unsigned(object, "codec_version", version) ||
        version > std::numeric_limits<uint8_t>::max()) {
        return reject(error, CodecError::InvalidField, "codec_version");
    }
    if (version != params::CODEC_VERSION) {
        return reject(error, CodecError::UnsupportedVersion, "codec_version");
    }
    header.codec_version = static_cast<uint8_t>(version);

    if (!read_unsigned(object, "block_index", header.block_index)) {
        return reject(error, CodecError::InvalidField, "block_index");
    }
    if (!read_signed(object, "timestamp", header.timestamp)) {
        return reject(error, CodecError::InvalidField, "timestamp");
    }
    if (!read_hash(object, "parent_hash", header.parent_hash)) {
        return reject(error, CodecError::InvalidField, "parent_hash");
    }
    if (!read_hash(object, "merkle_root", header.merkle_root)) {
        return reject(error, CodecError::InvalidField, "merkle_root");
    }
    if (!read_hash(object, "miner_address", header.miner_address)) {
        return reject(error, CodecError::InvalidField, "miner_address");
    }
    if (!read_hash(object, "commitment", header.commitment)) {
        return reject(error, CodecError::InvalidField, "commitment");
    }
    if (!read_unsigned(object, "difficulty_target", header.difficulty_target)) {
        return reject(error, CodecError::InvalidField, "difficulty_target");
    }
    if (!read_unsigned(object, "nonce", header.nonce)) {
        return reject(error, CodecError::InvalidField, "nonce");
    }

    const auto& extra = object.at("extra_data");
    if (!extra.is_string()) {
        return reject(error, CodecError::InvalidField, "extra_data");
    }
    auto extra_bytes = crypto::utils::from_hex(extra.get<std::string>());
    if (!extra_bytes) {
        return reject(error, CodecError::InvalidField, "extra_data");
    }
    if (extra_bytes->size() > params::MAX_EXTRA_DATA_SIZE) {
        return reject(error, CodecError::ExtraDataTooLarge, "extra_data");
    }
    header.extra_data = std::move(*extra_bytes);

    return header;
}

} // namespace coinjecture::codec
