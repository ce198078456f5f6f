#pragma once

/// @file metadata_emitter.hpp
/// @brief Records interleaved with value data: instance-variable tables,
///        user subclass markers, module extension chains and encodings.

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gm/foundation/marshal_result.hpp"
#include "gm/marshal/marshal_options.hpp"
#include "gm/marshal/value.hpp"

namespace gm::marshal {

class MarshalWriter;

/// Ordered instance variables to emit after a value's data.
using VariableList = std::vector<Variable>;

/// Result of unwrapping a value's current type.
struct ExtendedChain {
    /// The concrete class behind singleton and module wrappers.
    const TypeRef* concrete = nullptr;

    /// Paths of the modules mixed in above it, innermost first.
    std::vector<std::string> modulePaths;
};

/// Emits the metadata records surrounding a value.
///
/// Owned by a MarshalWriter and writes through it, so symbols and nested
/// values share the writer's identity cache.
///
/// For a value `v` the records appear as:
/// @code
///   [I] [e Mod]... [C Subclass] <shape data> [count (encoding) (name value)...]
/// @endcode
/// where `I` announces the trailing variable table. Every type path is
/// validated before the first record is written, so an AnonymousType,
/// UnresolvableTypeReference or StatefulSingleton rejection leaves no bytes
/// of its own in the stream. Shape failures found later (an unsupported
/// shape after `I`) do leave the prefix behind.
class MetadataEmitter {
public:
    MetadataEmitter(MarshalWriter& writer, const MarshalOptions& options,
                    const TypeRegistry* registry);

    /// Write the records that precede the shape data of @p value.
    ///
    /// @return The variables to emit after the shape data, or std::nullopt
    ///         when no `I` record was written.
    foundation::MarshalResult<std::optional<VariableList>> writePrefix(const Value& value);

    /// Write the variable table announced by writePrefix().
    foundation::MarshalResult<void> writeVariableTable(const Value& value,
                                                       const VariableList& vars);

    /// Unwrap a stateless singleton class and collect the modules mixed
    /// into it. Nothing is written; the caller emits one `e` record per
    /// module path.
    ///
    /// @return StatefulSingleton when the singleton has methods or
    ///         variables of its own, or a typePath() error for a module.
    [[nodiscard]] foundation::MarshalResult<ExtendedChain> resolveExtendedChain(
        const TypeRef& type) const;

    /// Path under which @p type is written.
    ///
    /// @return AnonymousType for unnamed types, UnresolvableTypeReference
    ///         when the registry maps the path to a different type.
    [[nodiscard]] foundation::MarshalResult<std::string> typePath(const TypeRef& type) const;

    /// True when the value's encoding must be recorded under the options.
    [[nodiscard]] bool shouldAnnotateEncoding(const Value& value) const;

private:
    foundation::MarshalResult<void> writeEncoding(const TextEncoding& encoding);

    MarshalWriter& writer_;
    const MarshalOptions& options_;
    const TypeRegistry* registry_;
};

} // namespace gm::marshal
