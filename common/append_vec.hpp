#ifndef CORVID_COMMON_APPEND_VEC_HPP
#define CORVID_COMMON_APPEND_VEC_HPP

#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <utility>
#include <vector>

namespace corvid {

// Growable append-only sequence.
//
// Elements live in fixed-size chunks that are reserved up front and never
// reallocated, so references to earlier elements stay valid across
// push_back (and across moves of the container itself). Elements are never
// removed or reordered.
template <typename T>
class AppendVec {
public:
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        const_iterator() = default;
        const_iterator(const AppendVec* owner, size_t index) : owner_(owner), index_(index) {}

        reference operator*() const { return (*owner_)[index_]; }
        pointer operator->() const { return &(*owner_)[index_]; }

        const_iterator& operator++() {
            ++index_;
            return *this;
        }

        const_iterator operator++(int) {
            const_iterator tmp = *this;
            ++index_;
            return tmp;
        }

        bool operator==(const const_iterator& other) const {
            return owner_ == other.owner_ && index_ == other.index_;
        }
        bool operator!=(const const_iterator& other) const { return !(*this == other); }

    private:
        const AppendVec* owner_ = nullptr;
        size_t index_ = 0;
    };

    // capacity_hint is the number of elements per chunk.
    explicit AppendVec(size_t capacity_hint = 1024)
        : chunk_size_(capacity_hint == 0 ? 1 : capacity_hint) {}

    AppendVec(AppendVec&&) noexcept = default;
    AppendVec& operator=(AppendVec&&) noexcept = default;
    AppendVec(const AppendVec&) = delete;
    AppendVec& operator=(const AppendVec&) = delete;

    T& push_back(T value) {
        if (chunks_.empty() || chunks_.back().size() == chunk_size_) {
            chunks_.emplace_back();
            chunks_.back().reserve(chunk_size_);
        }
        chunks_.back().push_back(std::move(value));
        ++size_;
        return chunks_.back().back();
    }

    const T& operator[](size_t index) const {
        return chunks_[index / chunk_size_][index % chunk_size_];
    }

    const T& at(size_t index) const {
        if (index >= size_) {
            throw std::out_of_range("AppendVec index out of range");
        }
        return (*this)[index];
    }

    const T& back() const { return chunks_.back().back(); }

    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    size_t chunk_size() const { return chunk_size_; }

    const_iterator begin() const { return const_iterator(this, 0); }
    const_iterator end() const { return const_iterator(this, size_); }

    std::vector<T> to_vector() const {
        std::vector<T> out;
        out.reserve(size_);
        for (const auto& chunk : chunks_) {
            out.insert(out.end(), chunk.begin(), chunk.end());
        }
        return out;
    }

private:
    size_t chunk_size_;
    size_t size_ = 0;
    std::vector<std::vector<T>> chunks_;
};

}  // namespace corvid

#endif // CORVID_COMMON_APPEND_VEC_HPP
