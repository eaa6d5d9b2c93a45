#include "storage/memory_backend.hpp"
#include "storage/errors.hpp"

#include <mutex>
#include <shared_mutex>
#include <utility>

namespace notes {

// The locks below are never held across a co_await: each body runs to
// completion on one thread before the coroutine returns.

boost::asio::awaitable<Note> MemoryBackend::get(std::string id) {
    CreateNoteRequest stored;
    {
        std::shared_lock lock(mutex_);
        auto it = map_.find(id);
        if (it == map_.end()) {
            throw NotFoundError(id);
        }
        stored = it->second;
    }
    co_return make_note(std::move(id), std::move(stored));
}

boost::asio::awaitable<void> MemoryBackend::set(std::string id, CreateNoteRequest request) {
    {
        std::unique_lock lock(mutex_);
        map_.insert_or_assign(std::move(id), std::move(request));
    }
    co_return;
}

boost::asio::awaitable<std::vector<std::string>> MemoryBackend::keys() {
    std::vector<std::string> result;
    {
        std::shared_lock lock(mutex_);
        result.reserve(map_.size());
        for (const auto& [k, _] : map_) {
            result.push_back(k);
        }
    }
    co_return result;
}

std::size_t MemoryBackend::size() const {
    std::shared_lock lock(mutex_);
    return map_.size();
}

} // namespace notes
