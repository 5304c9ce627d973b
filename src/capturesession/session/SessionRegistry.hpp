#pragma once

#include <capturesession/core/Types.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace CS::Detail {

class CaptureSessionImpl;

/**
 * Identifier -> started session.
 *
 * The map is sharded with one std::mutex per shard and is independent of any
 * session's own lock. Callers may hold a session lock while calling into the
 * registry; the registry never calls into a session while holding a shard
 * lock, so the only lock order is session -> shard.
 */
class SessionRegistry {
public:
    using SessionPtr = std::shared_ptr<CaptureSessionImpl>;

    // False if uri is already registered; the existing entry is kept.
    auto insert(Uri const& uri, SessionPtr session) -> bool;

    // Removes uri only while it still maps to owner. Returns true if removed.
    auto remove(Uri const& uri, CaptureSessionImpl const* owner) -> bool;

    auto find(Uri const& uri) const -> SessionPtr;
    auto contains(Uri const& uri) const -> bool;
    auto size() const -> std::size_t;
    auto sessions() const -> std::vector<SessionPtr>;

private:
    static constexpr int Submaps = 4;

    using Map = phmap::parallel_flat_hash_map<Uri,
                                              SessionPtr,
                                              std::hash<Uri>,
                                              std::equal_to<Uri>,
                                              std::allocator<std::pair<const Uri, SessionPtr>>,
                                              Submaps,
                                              std::mutex>;
    Map entries;
};

} // namespace CS::Detail
