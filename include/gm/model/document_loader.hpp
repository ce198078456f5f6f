#pragma once

/// @file document_loader.hpp
/// @brief Builds heap values from a YAML document.

#include <filesystem>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "gm/foundation/marshal_result.hpp"
#include "gm/model/heap.hpp"

namespace gm::model {

/// Converts YAML into a value graph on a Heap.
///
/// | YAML                           | Value                               |
/// |--------------------------------|-------------------------------------|
/// | mapping                        | hash (document order)               |
/// | sequence                       | array                               |
/// | `~`, `null`, empty             | nil                                 |
/// | `true` / `false`               | boolean                             |
/// | plain integer                  | integer, big integer beyond 64 bits |
/// | plain float, `.inf`, `.nan`    | float                               |
/// | other scalars                  | UTF-8 string                        |
/// | `!str` / `!!str`               | UTF-8 string, never inferred        |
/// | `!!bool` / `!!int` / `!!float` | that type; other text is an error   |
/// | `!binary` / `!!binary`         | binary string from base64           |
/// | `!sym`                         | symbol                              |
/// | `!bigint`                      | big integer from a decimal literal  |
///
/// A node reached again through an alias yields the same value, so
/// anchors express shared and cyclic structure.
class DocumentLoader {
public:
    explicit DocumentLoader(Heap& heap) : heap_(heap) {}

    /// Parse YAML text.
    /// @return The root value, or DocumentParseFailed.
    foundation::MarshalResult<Object*> loadString(std::string_view yaml);

    /// Parse a YAML file.
    /// @return The root value, or DocumentParseFailed.
    foundation::MarshalResult<Object*> loadFile(const std::filesystem::path& path);

private:
    foundation::MarshalResult<Object*> loadRoot(const YAML::Node& root);
    foundation::MarshalResult<Object*> convert(const YAML::Node& node);
    foundation::MarshalResult<Object*> convertScalar(const YAML::Node& node);
    Object& inferPlainScalar(const std::string& text);

    [[nodiscard]] Object* findConverted(const YAML::Node& node) const;
    void remember(const YAML::Node& node, Object* object);

    Heap& heap_;
    // Keyed by source position; an alias shares its anchor's mark.
    std::unordered_map<int, std::vector<std::pair<YAML::Node, Object*>>> converted_;
};

} // namespace gm::model
