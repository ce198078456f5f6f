/// @file marshal_options.cpp
/// @brief MarshalOptions from configuration.

#include "gm/marshal/marshal_options.hpp"

#include <string>

#include "gm/foundation/marshal_logger.hpp"

namespace gm::marshal {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::MarshalError;
using foundation::MarshalResult;

std::optional<EncodingPolicy> parseEncodingPolicy(std::string_view name) {
    if (name == "annotate") {
        return EncodingPolicy::Annotate;
    }
    if (name == "omit") {
        return EncodingPolicy::Omit;
    }
    return std::nullopt;
}

MarshalResult<MarshalOptions> marshalOptionsFromConfig(
    const foundation::ConfigManager& config) {
    MarshalOptions options;

    auto policyName = config.getOr<std::string>(
        "marshal.encoding_policy", std::string(encodingPolicyName(options.encodingPolicy)));
    GM_TRY(policyName);
    auto policy = parseEncodingPolicy(policyName.value());
    if (!policy) {
        return MarshalResult<MarshalOptions>::err(MarshalError(
            ErrorCode::ConfigTypeMismatch,
            "unknown marshal.encoding_policy '" + policyName.value() +
                "' (expected 'annotate' or 'omit')"));
    }
    options.encodingPolicy = *policy;

    auto header = config.getOr<bool>("marshal.version_header", options.writeVersionHeader);
    GM_TRY(header);
    options.writeVersionHeader = header.value();

    GM_LOG_DEBUG(LogCategory::Core,
                 "marshal options: encoding_policy=" +
                     std::string(encodingPolicyName(options.encodingPolicy)) +
                     ", version_header=" + (options.writeVersionHeader ? "true" : "false"));

    return MarshalResult<MarshalOptions>::ok(options);
}

} // namespace gm::marshal
