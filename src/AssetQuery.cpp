#include "AssetQuery.hpp"

#include "Config.hpp"
#include "Util.hpp"

namespace query {

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string decodeComponent(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < s.size()) {
            int hi = hexValue(s[i + 1]);
            int lo = hexValue(s[i + 2]);
            if (hi < 0 || lo < 0) {
                out.push_back(c);
                continue;
            }
            out.push_back(static_cast<char>(hi * 16 + lo));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace query

// Applies one "key=value" pair. Unknown keys are ignored.
static void applyPair(AssetQuery& q, std::string_view pair) {
    auto eq = pair.find('=');
    if (eq == std::string_view::npos) return;

    std::string key = query::decodeComponent(pair.substr(0, eq));
    std::string value = query::decodeComponent(pair.substr(eq + 1));
    if (value.empty()) return;

    if (key == "model") {
        q.model = value;
    } else if (key == "texture") {
        q.texture = value;
    }
}

static void applyQuery(AssetQuery& q, std::string_view query) {
    if (!query.empty() && query.front() == '?') query.remove_prefix(1);

    while (!query.empty()) {
        auto amp = query.find('&');
        applyPair(q, query.substr(0, amp));
        if (amp == std::string_view::npos) break;
        query.remove_prefix(amp + 1);
    }
}

AssetQuery AssetQuery::fromQueryString(std::string_view query) {
    AssetQuery q;
    q.model = cfg::DEFAULT_MODEL;
    applyQuery(q, query);
    return q;
}

AssetQuery AssetQuery::fromArgs(const std::vector<std::string>& args) {
    AssetQuery q;
    q.model = cfg::DEFAULT_MODEL;

    for (const auto& a : args) {
        if (!a.empty() && a.front() == '?') {
            applyQuery(q, a);
            continue;
        }
        if (a.find('=') == std::string::npos) {
            util::logWarn("Ignoring argument (expected key=value): " + a);
            continue;
        }
        applyPair(q, a);
    }
    return q;
}

std::string AssetQuery::modelPath() const {
    return util::joinPath(cfg::MODELS_DIR, model);
}

std::optional<std::string> AssetQuery::texturePath() const {
    if (!texture) return std::nullopt;
    return util::joinPath(cfg::TEXTURES_DIR, *texture);
}
