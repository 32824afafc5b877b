#pragma once

namespace shardrt::support {

// For objects whose address is handed to other threads (shards, runtimes):
// they must stay put for their whole lifetime.
struct nonmovable {
    nonmovable() = default;
    nonmovable(const nonmovable&) = delete;
    nonmovable& operator=(const nonmovable&) = delete;
    nonmovable(nonmovable&&) = delete;
    nonmovable& operator=(nonmovable&&) = delete;
};

} // namespace shardrt::support
