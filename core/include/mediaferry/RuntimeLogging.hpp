// Session tokens never reach the log in clear text. A developer can opt in
// to full tokens with MEDIAFERRY_ENV=dev and MEDIAFERRY_LOG_SENSITIVE=1.
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace mediaferry {

// Lower-cased, whitespace-trimmed value of an environment variable.
inline std::string envSetting(const char *name) {
    const char *raw = name ? std::getenv(name) : nullptr;
    if (!raw)
        return {};
    auto blank = [](unsigned char c) { return std::isspace(c) != 0; };
    std::string v(raw);
    v.erase(v.begin(), std::find_if_not(v.begin(), v.end(), blank));
    v.erase(std::find_if_not(v.rbegin(), v.rend(), blank).base(), v.end());
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v;
}

inline bool tokensLoggable() {
    const std::string env = envSetting("MEDIAFERRY_ENV");
    if (env != "dev" && env != "development" && env != "local")
        return false;
    const std::string flag = envSetting("MEDIAFERRY_LOG_SENSITIVE");
    return flag == "1" || flag == "true" || flag == "yes" || flag == "on";
}

// "abcd…(48 chars)"; short tokens keep no prefix at all.
inline std::string redactToken(const std::string &token) {
    if (tokensLoggable())
        return token;
    if (token.empty())
        return "<empty>";
    const std::size_t keep = token.size() > 8 ? 4 : 0;
    return token.substr(0, keep) + "\xE2\x80\xA6(" + std::to_string(token.size()) +
           " chars)";
}

} // namespace mediaferry
