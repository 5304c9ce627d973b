#pragma once

#include <capturesession/core/Types.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace CS::Detail {

/**
 * Failure reasons keyed by session URI.
 *
 * Entries outlive the sessions that wrote them and stay until a caller clears
 * them (typically a UI dismissing an error banner).
 */
class ErrorMessageStore {
public:
    auto put(Uri const& uri, std::string reason) -> void;
    auto has(Uri const& uri) const -> bool;
    auto get(Uri const& uri) const -> std::optional<std::string>;
    // Returns true if an entry was removed.
    auto clear(Uri const& uri) -> bool;
    auto size() const -> std::size_t;
    auto entries() const -> std::vector<std::pair<Uri, std::string>>;

private:
    static constexpr int Submaps = 4;

    using Map = phmap::parallel_flat_hash_map<Uri,
                                              std::string,
                                              std::hash<Uri>,
                                              std::equal_to<Uri>,
                                              std::allocator<std::pair<const Uri, std::string>>,
                                              Submaps,
                                              std::mutex>;
    Map messages;
};

} // namespace CS::Detail
