#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace courier {

/**
 * ResourceCache maps a resource name to a lazily created, shared handle.
 *
 * - The first caller for a name runs the factory outside the lock; concurrent
 *   callers for the same name wait on its result, so exactly one handle is
 *   constructed per name.
 * - A factory failure is rethrown to the creator and every waiter and the entry
 *   is dropped, so the next call retries construction.
 * - invalidate() only forgets the entry. Callers already holding the handle
 *   keep it alive; it is destroyed when the last of them releases it.
 */
template <typename Handle>
class ResourceCache {
public:
    using HandlePtr = std::shared_ptr<Handle>;
    using Factory = std::function<HandlePtr(const std::string&)>;

    explicit ResourceCache(Factory factory) : factory_(std::move(factory)) {}

    ResourceCache(const ResourceCache&) = delete;
    ResourceCache& operator=(const ResourceCache&) = delete;

    HandlePtr get_or_create(const std::string& name) {
        std::promise<HandlePtr> promise;
        std::shared_future<HandlePtr> result;
        std::uint64_t generation = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(name);
            if (it != entries_.end()) {
                result = it->second.handle;
            } else {
                generation = ++generation_;
                result = promise.get_future().share();
                entries_.emplace(name, Entry{generation, result});
            }
        }

        if (generation == 0) {
            return result.get();
        }

        try {
            HandlePtr handle = factory_(name);
            promise.set_value(handle);
            return handle;
        } catch (...) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = entries_.find(name);
                if (it != entries_.end() && it->second.generation == generation) {
                    entries_.erase(it);
                }
            }
            promise.set_exception(std::current_exception());
            throw;
        }
    }

    // Returns the cached handle without creating one, or nullptr.
    HandlePtr find(const std::string& name) const {
        std::shared_future<HandlePtr> result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(name);
            if (it == entries_.end()) {
                return nullptr;
            }
            result = it->second.handle;
        }
        try {
            return result.get();
        } catch (const std::exception&) {
            return nullptr;
        }
    }

    bool invalidate(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.erase(name) > 0;
    }

    // Forgets every entry and hands back the handles that were constructed.
    std::vector<HandlePtr> clear() {
        std::map<std::string, Entry> entries;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            entries.swap(entries_);
        }

        std::vector<HandlePtr> handles;
        for (auto& entry : entries) {
            try {
                handles.push_back(entry.second.handle.get());
            } catch (const std::exception&) {
                // its creator already reported the failure
            }
        }
        return handles;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    struct Entry {
        std::uint64_t generation;
        std::shared_future<HandlePtr> handle;
    };

    Factory factory_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    std::uint64_t generation_ = 0;
};

} // namespace courier
