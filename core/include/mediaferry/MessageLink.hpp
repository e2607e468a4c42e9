// Message links (https://t.me/...) <-> FileReference.
#pragma once
#include "TransferTypes.hpp"
#include <string>

namespace mediaferry {

// Accepted shapes (query string and trailing '/' are ignored):
//   https://t.me/<username>/<message>
//   https://t.me/<username>/<thread>/<message>
//   https://t.me/c/<channel>/<message>           -> chat "-100<channel>"
//   https://t.me/c/<channel>/<thread>/<message>
bool parseMessageLink(const std::string& link, FileReference& out, std::string& err);

// Public chats use the username; others the numeric id without its -100
// prefix under /c/.
std::string messageLink(const std::string& chat, std::int64_t message_id,
                        const std::string& username = {});

// Either a message link or the canonical "chat/message_id" key.
bool parseFileReference(const std::string& text, FileReference& out, std::string& err);

} // namespace mediaferry
