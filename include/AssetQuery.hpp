#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Which asset to show, chosen the way a page query string would:
//   embedviewer "?model=Chair.glb&texture=wood.png"
//   embedviewer model=Chair.glb texture=wood.png
struct AssetQuery {
    std::string model;                  // file name under cfg::MODELS_DIR
    std::optional<std::string> texture; // file name under cfg::TEXTURES_DIR

    static AssetQuery fromArgs(const std::vector<std::string>& args);
    static AssetQuery fromQueryString(std::string_view query);

    std::string modelPath() const;
    std::optional<std::string> texturePath() const;
};

namespace query {

// %XX escapes and '+' as space.
std::string decodeComponent(std::string_view s);

} // namespace query
