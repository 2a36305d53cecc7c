#pragma once

#include "progress_bar.hpp"
#include <iterator>
#include <memory>
#include <type_traits>
#include <utility>
#include <cstdint>

namespace rateline {
namespace progress {

namespace detail {

template<typename Range, typename = void>
struct has_size : std::false_type {};

template<typename Range>
struct has_size<Range, std::void_t<decltype(std::size(std::declval<Range&>()))>> : std::true_type {};

template<typename Range>
int64_t sizeOrUnknown(Range& range, int64_t fallback) {
    if constexpr (has_size<Range>::value) {
        return static_cast<int64_t>(std::size(range));
    } else {
        return fallback;
    }
}

}

// Range adapter that reports progress while iterating.
//
// The bar is told about element i (i elements already yielded) just before
// element i is handed out, and finish() runs once the underlying iterator
// reaches the end. Nothing is read ahead of the element being yielded. When
// the length was unknown the number of yielded elements becomes the total.
// Lvalue ranges are referenced, rvalue ranges are moved in.
template<typename Range>
class Wrapped {
public:
    using UnderlyingIterator = decltype(std::begin(std::declval<Range&>()));

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = typename std::iterator_traits<UnderlyingIterator>::value_type;
        using difference_type = typename std::iterator_traits<UnderlyingIterator>::difference_type;
        using pointer = typename std::iterator_traits<UnderlyingIterator>::pointer;
        using reference = typename std::iterator_traits<UnderlyingIterator>::reference;

        iterator(Wrapped* parent, UnderlyingIterator it) : parent_(parent), it_(it) {}

        reference operator*() const { return *it_; }

        iterator& operator++() {
            ++it_;
            ++index_;
            parent_->announce(it_, index_);
            return *this;
        }

        bool operator==(const iterator& other) const { return it_ == other.it_; }
        bool operator!=(const iterator& other) const { return it_ != other.it_; }

    private:
        Wrapped* parent_;
        UnderlyingIterator it_;
        int64_t index_ = 0;
    };

    Wrapped(Range&& range, ProgressBar& bar, int64_t total)
        : range_(std::forward<Range>(range)),
          bar_(&bar),
          total_(total) {}

    Wrapped(Range&& range, std::unique_ptr<ProgressBar> owned, int64_t total)
        : range_(std::forward<Range>(range)),
          owned_(std::move(owned)),
          bar_(owned_.get()),
          total_(total) {}

    iterator begin() {
        auto it = std::begin(range_);
        announce(it, 0);
        return iterator(this, it);
    }

    iterator end() {
        return iterator(this, std::end(range_));
    }

    ProgressBar& bar() { return *bar_; }
    int64_t total() const { return total_; }

private:
    Range range_;
    std::unique_ptr<ProgressBar> owned_;
    ProgressBar* bar_;
    int64_t total_;

    void announce(const UnderlyingIterator& it, int64_t index) {
        if (it == std::end(range_)) {
            if (total_ <= 0) {
                bar_->engine().setTotal(index);
            }
            bar_->finish();
        } else {
            bar_->progress(index, total_);
        }
    }
};

template<typename Range>
Wrapped<Range> wrap(Range&& range, ProgressBar& bar, int64_t total) {
    return Wrapped<Range>(std::forward<Range>(range), bar, total);
}

// Total taken from std::size when the range has one, otherwise whatever the
// bar already knows.
template<typename Range>
Wrapped<Range> wrap(Range&& range, ProgressBar& bar) {
    int64_t total = detail::sizeOrUnknown(range, bar.engine().total());
    return Wrapped<Range>(std::forward<Range>(range), bar, total);
}

template<typename Range>
Wrapped<Range> wrap(Range&& range,
                    const ProgressBarOptions& options = ProgressBarOptions{},
                    std::ostream& out = std::cerr) {
    int64_t total = detail::sizeOrUnknown(range, options.engine.total);
    auto bar = std::make_unique<ProgressBar>(options, out);
    return Wrapped<Range>(std::forward<Range>(range), std::move(bar), total);
}

}}
