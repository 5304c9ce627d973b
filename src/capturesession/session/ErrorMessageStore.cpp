#include "session/ErrorMessageStore.hpp"

namespace CS::Detail {

auto ErrorMessageStore::put(Uri const& uri, std::string reason) -> void {
    messages.insert_or_assign(uri, std::move(reason));
}

auto ErrorMessageStore::has(Uri const& uri) const -> bool {
    return messages.contains(uri);
}

auto ErrorMessageStore::get(Uri const& uri) const -> std::optional<std::string> {
    std::optional<std::string> result;
    messages.if_contains(uri, [&](auto const& entry) { result = entry.second; });
    return result;
}

auto ErrorMessageStore::clear(Uri const& uri) -> bool {
    return messages.erase(uri) > 0;
}

auto ErrorMessageStore::size() const -> std::size_t {
    return messages.size();
}

auto ErrorMessageStore::entries() const -> std::vector<std::pair<Uri, std::string>> {
    std::vector<std::pair<Uri, std::string>> result;
    messages.for_each([&](auto const& entry) { result.emplace_back(entry.first, entry.second); });
    return result;
}

} // namespace CS::Detail
