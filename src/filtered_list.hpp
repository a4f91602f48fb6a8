#pragma once
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace karltui {

// Ordered items with a predicate-filtered visible subset and one selection.
// The selection is a position within the visible subset, not an item
// identity: filtering keeps the position when it is still in range and
// falls back to the first visible item otherwise.
template<typename T>
class FilteredList {
public:
    FilteredList() = default;
    explicit FilteredList(std::vector<T> items) { replace_all(std::move(items)); }

    // Drops any filter; callers re-apply it after a refresh.
    void replace_all(std::vector<T> items) {
        items_ = std::move(items);
        reset_visible();
        selection_ = visible_.empty() ? std::nullopt : std::optional<size_t>(0);
    }

    template<typename Pred>
    void apply_filter(Pred pred) {
        visible_.clear();
        for (size_t i = 0; i < items_.size(); ++i) {
            if (pred(items_[i])) visible_.push_back(i);
        }
        if (selection_) {
            if (*selection_ >= visible_.size()) {
                selection_ = visible_.empty() ? std::nullopt : std::optional<size_t>(0);
            }
        } else if (!visible_.empty()) {
            selection_ = 0;
        }
    }

    void clear_filter() {
        reset_visible();
        if (!visible_.empty() && !selection_) selection_ = 0;
    }

    void next() {
        if (visible_.empty()) return;
        if (!selection_ || *selection_ + 1 >= visible_.size()) {
            selection_ = 0;
        } else {
            selection_ = *selection_ + 1;
        }
    }

    void previous() {
        if (visible_.empty()) return;
        if (!selection_) {
            selection_ = 0;
        } else if (*selection_ == 0) {
            selection_ = visible_.size() - 1;
        } else {
            selection_ = *selection_ - 1;
        }
    }

    const T* selected() const {
        auto idx = selected_index();
        return idx ? &items_[*idx] : nullptr;
    }

    // Index into the unfiltered items, for mutation by identity.
    std::optional<size_t> selected_index() const {
        if (!selection_ || *selection_ >= visible_.size()) return std::nullopt;
        return visible_[*selection_];
    }

    // Position within the visible subset.
    std::optional<size_t> selected_position() const {
        if (!selection_ || *selection_ >= visible_.size()) return std::nullopt;
        return selection_;
    }

    size_t visible_count() const { return visible_.size(); }
    size_t total_count() const { return items_.size(); }
    bool empty() const { return visible_.empty(); }

    const std::vector<size_t>& visible_indices() const { return visible_; }
    const std::vector<T>& items() const { return items_; }
    T* item_at(size_t index) { return index < items_.size() ? &items_[index] : nullptr; }

    // Restartable view over the visible items, in order.
    class VisibleRange {
    public:
        class iterator {
        public:
            iterator(const FilteredList* list, size_t pos) : list_(list), pos_(pos) {}
            const T& operator*() const { return list_->items_[list_->visible_[pos_]]; }
            const T* operator->() const { return &**this; }
            iterator& operator++() { ++pos_; return *this; }
            bool operator==(const iterator& o) const { return pos_ == o.pos_; }
            bool operator!=(const iterator& o) const { return pos_ != o.pos_; }
        private:
            const FilteredList* list_;
            size_t pos_;
        };

        explicit VisibleRange(const FilteredList* list) : list_(list) {}
        iterator begin() const { return iterator(list_, 0); }
        iterator end() const { return iterator(list_, list_->visible_.size()); }

    private:
        const FilteredList* list_;
    };

    VisibleRange visible_items() const { return VisibleRange(this); }

private:
    void reset_visible() {
        visible_.resize(items_.size());
        for (size_t i = 0; i < items_.size(); ++i) visible_[i] = i;
    }

    std::vector<T> items_;
    std::vector<size_t> visible_;
    std::optional<size_t> selection_;
};

} // namespace karltui
