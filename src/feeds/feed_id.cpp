// FEEDROUTE - Feed Identifiers Implementation
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License

#include <feedroute/feeds/feed_id.h>
#include <feedroute/feeds/errors.h>

#include <cctype>

namespace feedroute {
namespace feeds {

FeedId EncodeFeedId(Byte category, const std::string& name) {
    if (name.size() > FEED_NAME_MAX_LENGTH) {
        throw RegistryError(RegistryErrorCode::InvalidFeedName,
                            "name '" + name + "' exceeds " +
                            std::to_string(FEED_NAME_MAX_LENGTH) + " bytes");
    }

    FeedId id;
    id[0] = category;
    for (size_t i = 0; i < name.size(); ++i) {
        id[i + 1] = static_cast<Byte>(name[i]);
    }
    return id;
}

std::pair<Byte, std::string> DecodeFeedId(const FeedId& id) {
    size_t end = FeedId::SIZE;
    while (end > 1 && id[end - 1] == 0) {
        --end;
    }
    std::string name(reinterpret_cast<const char*>(id.data() + 1), end - 1);
    return {id.Category(), name};
}

std::string FeedIdToString(const FeedId& id) {
    auto decoded = DecodeFeedId(id);
    for (char c : decoded.second) {
        if (!std::isprint(static_cast<unsigned char>(c))) {
            return "0x" + id.ToHex();
        }
    }
    return std::to_string(decoded.first) + ":" + decoded.second;
}

} // namespace feeds
} // namespace feedroute
