#include "mediaferry/MessageLink.hpp"
#include <cctype>
#include <cstdlib>
#include <vector>

namespace mediaferry {

static std::string trimmed(const std::string& s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
        ++start;
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;
    return s.substr(start, end - start);
}

static std::vector<std::string> splitSlash(const std::string& s) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    for (;;) {
        const std::size_t pos = s.find('/', start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

// Strict decimal parse; rejects empty strings, signs and trailing garbage.
static bool parsePositive(const std::string& s, std::int64_t& out) {
    if (s.empty() || s.size() > 18)
        return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
    }
    out = std::strtoll(s.c_str(), nullptr, 10);
    return out > 0;
}

bool parseMessageLink(const std::string& link, FileReference& out, std::string& err) {
    std::string l = trimmed(link);
    const std::size_t q = l.find('?');
    if (q != std::string::npos)
        l = l.substr(0, q);
    while (!l.empty() && l.back() == '/')
        l.pop_back();
    if (l.empty()) {
        err = "empty message link";
        return false;
    }

    const std::vector<std::string> parts = splitSlash(l);
    const std::size_t n = parts.size();
    FileReference ref;

    if (l.find("/c/") != std::string::npos) {
        std::int64_t channel = 0;
        std::int64_t thread = 0;
        std::int64_t message = 0;
        if (n >= 7 && parsePositive(parts[n - 3], channel) &&
            parsePositive(parts[n - 2], thread) &&
            parsePositive(parts[n - 1], message)) {
            ref.chat = "-100" + std::to_string(channel);
            ref.thread_id = thread;
            ref.message_id = message;
        } else if (n >= 6 && parsePositive(parts[n - 2], channel) &&
                   parsePositive(parts[n - 1], message)) {
            ref.chat = "-100" + std::to_string(channel);
            ref.message_id = message;
        } else {
            err = "malformed private message link: " + link;
            return false;
        }
    } else {
        std::int64_t thread = 0;
        std::int64_t message = 0;
        if (n >= 6 && !parts[n - 3].empty() &&
            parsePositive(parts[n - 2], thread) &&
            parsePositive(parts[n - 1], message)) {
            ref.chat = parts[n - 3];
            ref.thread_id = thread;
            ref.message_id = message;
        } else if (n >= 4 && !parts[n - 2].empty() &&
                   parsePositive(parts[n - 1], message)) {
            ref.chat = parts[n - 2];
            ref.message_id = message;
        } else {
            err = "malformed message link: " + link;
            return false;
        }
    }
    out = ref;
    return true;
}

std::string messageLink(const std::string& chat, std::int64_t message_id,
                        const std::string& username) {
    if (!username.empty())
        return "https://t.me/" + username + "/" + std::to_string(message_id);
    std::string id = chat;
    if (id.rfind("-100", 0) == 0)
        id = id.substr(4);
    return "https://t.me/c/" + id + "/" + std::to_string(message_id);
}

bool parseFileReference(const std::string& text, FileReference& out, std::string& err) {
    const std::string t = trimmed(text);
    if (t.find("://") != std::string::npos || t.rfind("t.me/", 0) == 0)
        return parseMessageLink(t.find("://") != std::string::npos ? t : "https://" + t,
                                out, err);
    const std::size_t slash = t.rfind('/');
    std::int64_t message = 0;
    if (slash == std::string::npos || slash == 0 ||
        !parsePositive(t.substr(slash + 1), message)) {
        err = "expected a message link or <chat>/<message_id>: " + text;
        return false;
    }
    FileReference ref;
    ref.chat = t.substr(0, slash);
    ref.message_id = message;
    out = ref;
    return true;
}

} // namespace mediaferry
