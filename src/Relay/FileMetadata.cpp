//
// File metadata parsing and validation
//

#include "FileMetadata.h"
#include "../Lib/GeneralUtils.h"
#include "../Lib/RelayErrors.h"
#include "../Settings.h"
#include <algorithm>
#include <boost/algorithm/string/trim.hpp>

auto sFileMetadata::create(const std::string& name, uint64_t size, const std::string& mimeType) -> sFileMetadata {
    auto safeName = escapeFileName(name);

    if (safeName.empty()) {
        throw eValidationError("Invalid file metadata: the file name is empty.");
    }

    if (safeName.length() > MAX_FILE_NAME_LENGTH) {
        throw eValidationError(
                "Invalid file metadata: the file name is longer than " + std::to_string(MAX_FILE_NAME_LENGTH) +
                " characters."
        );
    }

    if (size == 0) {
        throw eValidationError("Invalid file metadata: the file size must be greater than zero.");
    }

    auto type = boost::algorithm::trim_copy(mimeType);

    return {
            .name = safeName,
            .size = size,
            .mimeType = type.empty() ? std::string(DEFAULT_MIME_TYPE) : type
    };
}

auto sFileMetadata::fromJson(const nlohmann::json& json) -> sFileMetadata {
    if (!json.is_object()) {
        throw eValidationError("Invalid file metadata: expected a json object.");
    }

    // Find the first of several accepted aliases for a field
    auto field = [&json](std::initializer_list<const char*> names) -> const nlohmann::json* {
        for (const auto* name : names) {
            if (json.contains(name)) {
                return &json.at(name);
            }
        }
        return nullptr;
    };

    const auto* name = field({"file_name", "name"});
    if (name == nullptr || !name->is_string()) {
        throw eValidationError("Invalid file metadata: 'file_name' must be a string.");
    }

    const auto* size = field({"file_size", "size"});
    uint64_t fileSize = 0;
    if (size != nullptr && size->is_number_unsigned()) {
        fileSize = size->get<uint64_t>();
    } else if (size != nullptr && size->is_string()) {
        fileSize = parseLength(size->get<std::string>());
    } else {
        throw eValidationError("Invalid file metadata: 'file_size' must be a positive integer.");
    }

    std::string mimeType;
    const auto* type = field({"file_type", "type", "content_type"});
    if (type != nullptr && type->is_string()) {
        mimeType = type->get<std::string>();
    } else if (type != nullptr && !type->is_null()) {
        throw eValidationError("Invalid file metadata: 'file_type' must be a string.");
    }

    return create(name->get<std::string>(), fileSize, mimeType);
}

auto sFileMetadata::fromJsonString(const std::string& json) -> sFileMetadata {
    try {
        return fromJson(nlohmann::json::parse(json));
    } catch (nlohmann::json::exception& exception) {
        throw eValidationError(std::string("Invalid file metadata: ") + exception.what());
    }
}

auto sFileMetadata::toJson() const -> nlohmann::json {
    return {
            {"file_name", name},
            {"file_size", size},
            {"file_type", mimeType}
    };
}

auto sFileMetadata::toString() const -> std::string {
    return name + " (" + formatSize(size) + " - " + mimeType + ")";
}

auto sFileMetadata::escapeFileName(const std::string& name) -> std::string {
    // Strip anything that could be used to traverse a path, or break out of a quoted header value
    const std::string unsafeChars = ":;|*@/\\\"";

    std::string result;
    result.reserve(name.size());
    std::copy_if(name.begin(), name.end(), std::back_inserter(result), [&unsafeChars](char character) {
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
        return unsafeChars.find(character) == std::string::npos && static_cast<unsigned char>(character) >= 0x20;
    });

    return boost::algorithm::trim_copy(result);
}

auto sFileMetadata::parseLength(const std::string& length) -> uint64_t {
    auto value = boost::algorithm::trim_copy(length);

    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw eValidationError("Invalid file metadata: '" + length + "' is not a valid length.");
    }

    uint64_t result = 0;
    try {
        result = std::stoull(value);
    } catch (std::out_of_range&) {
        throw eValidationError("Invalid file metadata: '" + length + "' is too large.");
    }

    if (result == 0) {
        throw eValidationError("Invalid file metadata: the file size must be greater than zero.");
    }

    return result;
}
