#pragma once

#include "storage/backend.hpp"

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace notes {

// Volatile, process-local note storage backed by std::unordered_map.
//
// Concurrency model:
//   - get() / keys() / size() acquire a shared (read) lock.
//   - set() acquires an exclusive (write) lock.
//   Multiple concurrent readers are allowed; writers are exclusive.
//
// Nothing survives a process restart.
class MemoryBackend final : public Backend {
public:
    MemoryBackend() = default;

    // Not copyable – copies of a live store would silently race.
    MemoryBackend(const MemoryBackend&)            = delete;
    MemoryBackend& operator=(const MemoryBackend&) = delete;

    [[nodiscard]] boost::asio::awaitable<Note> get(std::string id) override;
    boost::asio::awaitable<void> set(std::string id, CreateNoteRequest request) override;
    [[nodiscard]] boost::asio::awaitable<std::vector<std::string>> keys() override;

    [[nodiscard]] std::string_view name() const noexcept override { return "memory"; }

    // Returns the number of stored notes.
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, CreateNoteRequest> map_;
};

} // namespace notes
