#include "session/SessionRegistry.hpp"

namespace CS::Detail {

auto SessionRegistry::insert(Uri const& uri, SessionPtr session) -> bool {
    return entries.try_emplace(uri, std::move(session)).second;
}

auto SessionRegistry::remove(Uri const& uri, CaptureSessionImpl const* owner) -> bool {
    return entries.erase_if(uri, [owner](auto const& entry) { return entry.second.get() == owner; });
}

auto SessionRegistry::find(Uri const& uri) const -> SessionPtr {
    SessionPtr found;
    entries.if_contains(uri, [&](auto const& entry) { found = entry.second; });
    return found;
}

auto SessionRegistry::contains(Uri const& uri) const -> bool {
    return entries.contains(uri);
}

auto SessionRegistry::size() const -> std::size_t {
    return entries.size();
}

auto SessionRegistry::sessions() const -> std::vector<SessionPtr> {
    std::vector<SessionPtr> result;
    result.reserve(entries.size());
    entries.for_each([&](auto const& entry) { result.push_back(entry.second); });
    return result;
}

} // namespace CS::Detail
