#pragma once

#include "progress_bar.hpp"
#include <cstddef>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

namespace progressbar {
namespace core {

// Pull-based cursor over a sequence; every item handed out advances the bar
// by one. The cursor never rewinds.
template<typename T>
class IterationAdapter {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        Iterator() = default;

        explicit Iterator(IterationAdapter* owner) : owner_(owner) { pull(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        Iterator& operator++() {
            pull();
            return *this;
        }

        bool operator==(const Iterator& other) const { return owner_ == other.owner_; }
        bool operator!=(const Iterator& other) const { return owner_ != other.owner_; }

    private:
        IterationAdapter* owner_ = nullptr;
        std::optional<T> current_;

        void pull() {
            current_ = owner_->next();
            if (!current_) {
                owner_ = nullptr;
            }
        }
    };

    IterationAdapter(const std::vector<T>& items, ProgressBar& bar)
        : items_(items), bar_(bar), cursor_(0) {}

    bool hasNext() const { return cursor_ < items_.size(); }

    std::optional<T> next() {
        if (!hasNext()) {
            return std::nullopt;
        }
        const T& item = items_[cursor_++];
        bar_.increment(1);
        return item;
    }

    size_t position() const { return cursor_; }
    size_t size() const { return items_.size(); }

    Iterator begin() { return hasNext() ? Iterator(this) : Iterator(); }
    Iterator end() { return Iterator(); }

private:
    const std::vector<T>& items_;
    ProgressBar& bar_;
    size_t cursor_;
};

// A bar whose total is the length of the sequence it retains.
template<typename T>
class SequenceProgress {
public:
    explicit SequenceProgress(std::vector<T> items,
                              BarOptions options = {},
                              std::ostream& out = std::cout,
                              TimeSource time_source = systemTimeSource())
        : items_(std::move(items)),
          bar_(static_cast<int64_t>(items_.size()), std::move(options), out, std::move(time_source)) {}

    SequenceProgress(const SequenceProgress&) = delete;
    SequenceProgress& operator=(const SequenceProgress&) = delete;

    IterationAdapter<T> iterate() { return IterationAdapter<T>(items_, bar_); }

    const std::vector<T>& items() const { return items_; }
    ProgressBar& bar() { return bar_; }
    const ProgressBar& bar() const { return bar_; }

private:
    std::vector<T> items_;
    ProgressBar bar_;
};

}}
