#pragma once

/// @file marshal_options.hpp
/// @brief Writer options and their mapping from configuration.

#include <cstdint>
#include <optional>
#include <string_view>

#include "gm/foundation/config_manager.hpp"
#include "gm/foundation/marshal_result.hpp"

namespace gm::marshal {

/// Whether string encodings are recorded in the stream.
enum class EncodingPolicy : uint8_t {
    Annotate, ///< Record the encoding of every non-binary string.
    Omit      ///< Never record encodings; strings travel as raw bytes.
};

constexpr std::string_view encodingPolicyName(EncodingPolicy policy) {
    switch (policy) {
        case EncodingPolicy::Annotate: return "annotate";
        case EncodingPolicy::Omit:     return "omit";
    }
    return "unknown";
}

[[nodiscard]] std::optional<EncodingPolicy> parseEncodingPolicy(std::string_view name);

struct MarshalOptions {
    EncodingPolicy encodingPolicy = EncodingPolicy::Annotate;

    /// Prefix every top-level dump with the format version bytes (04 08).
    /// MRI numbers floats, big integers and charset names in its object
    /// table, so with any of those ahead of a link the stream does not load
    /// through Marshal.load.
    bool writeVersionHeader = false;
};

/// Build options from the `marshal.*` keys of @p config.
///
/// | Key                        | Type   | Default    |
/// |----------------------------|--------|------------|
/// | marshal.encoding_policy    | string | "annotate" |
/// | marshal.version_header     | bool   | false      |
///
/// @return ConfigTypeMismatch for an unknown policy name or a mistyped key.
[[nodiscard]] foundation::MarshalResult<MarshalOptions> marshalOptionsFromConfig(
    const foundation::ConfigManager& config);

} // namespace gm::marshal
