#pragma once

#include <boost/bimap.hpp>
#include <boost/bimap/list_of.hpp>
#include <boost/bimap/unordered_set_of.hpp>

#include <cstddef>
#include <string>

namespace xmv::bridge {

/**
 * \brief Bounded memo table keyed by raw engine text.
 *
 * The left view indexes entries by text, the right view keeps them in use
 * order: least recently used at the front, evicted first once \a capacity is
 * reached. Values are returned by copy so that later evictions cannot dangle.
 */
template <typename Value>
class TextCache {
    using cache_type = boost::bimaps::bimap<boost::bimaps::unordered_set_of<std::string>,
                                            boost::bimaps::list_of<Value>>;
    using value_type = typename cache_type::left_value_type;

public:
    explicit TextCache(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    template <typename Compute>
    Value get_or_compute(const std::string& key, Compute&& compute) {
        if (auto it = cache_.left.find(key); it != cache_.left.end()) {
            cache_.right.relocate(cache_.right.end(), cache_.project_right(it));
            return it->second;
        }
        Value value = compute(key);
        if (cache_.size() == capacity_) {
            cache_.right.erase(cache_.right.begin());
        }
        cache_.left.insert(value_type(key, value));
        return value;
    }

    [[nodiscard]] bool contains(const std::string& key) const { return cache_.left.find(key) != cache_.left.end(); }
    [[nodiscard]] std::size_t size() const noexcept { return cache_.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    cache_type cache_;
    std::size_t capacity_;
};

}  // namespace xmv::bridge
