#pragma once

#include <ring-core/assertf.hh>
#include <ring-core/fwd.hh>
#include <ring-core/ring_deque.hh>

#include <concepts>

namespace rc
{
/// Anything an index-based external sort can work on:
///   s.size()       number of elements
///   s.less(i, j)   element i orders before element j
///   s.swap(i, j)   exchange elements i and j
template <class S>
concept index_sortable = requires(S& s, isize i, isize j) {
    { s.size() } -> std::convertible_to<isize>;
    { s.less(i, j) } -> std::convertible_to<bool>;
    s.swap(i, j);
};
} // namespace rc

/// Non-owning compare/swap view over a ring_deque, for sorting it in place.
///
/// Index-based sorts use size() / less(i, j) / swap(i, j);
/// iterator-based sorts use begin() / end():
///
///   auto view = rc::make_sortable(deque);
///   std::sort(view.begin(), view.end());
///
/// Sorting permutes the logical order only, capacity and size stay the same.
/// The view must not outlive the deque.
template <class T>
struct rc::sortable
{
    static_assert(std::totally_ordered<T>, "sortable requires elements with a total order");

    explicit sortable(ring_deque<T>& deque) : _deque(&deque) {}

    [[nodiscard]] isize size() const { return _deque->size(); }

    /// Both indices must be in [0, size()) (always-on assertion).
    [[nodiscard]] bool less(isize i, isize j) const
    {
        auto const size = _deque->size();
        RC_ASSERTF_ALWAYS(0 <= i && i < size, "less: index i = {} out of range [0, {})", i, size);
        RC_ASSERTF_ALWAYS(0 <= j && j < size, "less: index j = {} out of range [0, {})", j, size);
        return (*_deque)[i] < (*_deque)[j];
    }

    /// See ring_deque::swap_elements.
    void swap(isize i, isize j) { _deque->swap_elements(i, j); }

    [[nodiscard]] auto begin() const { return _deque->begin(); }
    [[nodiscard]] auto end() const { return _deque->end(); }

private:
    ring_deque<T>* _deque;
};

namespace rc
{
template <class T>
sortable(ring_deque<T>&) -> sortable<T>;

template <class T>
[[nodiscard]] sortable<T> make_sortable(ring_deque<T>& deque)
{
    return sortable<T>(deque);
}
} // namespace rc
