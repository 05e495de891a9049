#pragma once

#include <ring-core/assertf.hh>
#include <ring-core/fwd.hh>
#include <ring-core/impl/object_lifetime_util.hh>
#include <ring-core/memory.hh>
#include <ring-core/new.hh>
#include <ring-core/optional.hh>
#include <ring-core/span.hh>
#include <ring-core/to_debug_string.hh>
#include <ring-core/utility.hh>

#include <compare>
#include <format>
#include <iterator>
#include <limits>
#include <string>
#include <type_traits>
#include <vector>

/// The live elements of a ring_deque as (at most) two contiguous runs of the backing block.
///
///   front: [head, min(head + size, capacity))
///   back:  [0, size - front.size())
///
/// Logical order is front followed by back; back is empty unless the ring wraps.
template <class T>
struct rc::ring_runs
{
    rc::span<T> front;
    rc::span<T> back;

    [[nodiscard]] isize size() const { return front.size() + back.size(); }
};

/// Double-ended queue of T stored in one contiguous circular block.
///
/// State is three numbers over an owned block of `capacity` slots:
///   - head: slot of the logical first element
///   - size: number of live elements
///   - the logical element i lives in slot (head + i) % capacity
///
/// Pushing and popping at either end only moves head / size (O(1), amortized for growth).
/// Nothing is ever shifted; the live window simply wraps past the end of the block.
/// Growth and clip allocate a new block and relocate the front run, then the back run, to slot 0,
/// so afterwards head == 0 and physical order equals logical order.
///
/// Slots outside the live window hold no objects: elements are constructed on push and
/// destroyed on pop, so T does not need to be default constructible.
///
/// Expected results ("is there a front?") come back as rc::optional<T>;
/// misuse (negative growth, swapping out-of-range indices) is an always-on assertion.
///
/// Not thread-safe. One owner at a time.
///
/// Usage:
///   auto d = rc::ring_deque<int>::create_of(9, 8, 7, 6);
///   d.push_front(10);
///   d.push_back(5);
///   while (d.pop_back().has_value()) {}
template <class T>
struct rc::ring_deque
{
    static_assert(!std::is_reference_v<T>, "ring_deque elements cannot be references");
    static_assert(!std::is_const_v<T>, "ring_deque elements cannot be const");

    // iteration types
public:
    template <bool IsConst>
    struct basic_iterator;

    using iterator = basic_iterator<false>;
    using const_iterator = basic_iterator<true>;

    /// (index, element) pair produced by enumerate() / enumerate_reversed()
    /// Usage: for (auto [i, v] : d.enumerate()) { ... }
    template <class ElemT>
    struct entry
    {
        isize index;
        ElemT& value;
    };

    template <class DequeT, bool Reverse>
    struct enumerate_range;

    // factories
public:
    /// Empty deque with room for at least `capacity` elements.
    /// Negative capacity is an invalid argument (always-on assertion).
    [[nodiscard]] static ring_deque create_with_capacity(isize capacity)
    {
        RC_ASSERTF_ALWAYS(capacity >= 0, "create_with_capacity: capacity must be non-negative, got {}", capacity);
        ring_deque result;
        result.grow(capacity);
        return result;
    }

    /// Deque holding the given items in order, as if each was pushed to the back.
    /// Allocates exactly once.
    /// Usage: auto d = rc::ring_deque<int>::create_of(9, 8, 7, 6);
    template <class... Args>
    [[nodiscard]] static ring_deque create_of(Args&&... items)
    {
        ring_deque result;
        result.grow(isize(sizeof...(Args)));
        (result.emplace_back(rc::forward<Args>(items)), ...);
        return result;
    }

    /// Deque holding copies of the given items in order.
    [[nodiscard]] static ring_deque create_copy_of(span<T const> items)
    {
        ring_deque result;
        result.push_back_all(items);
        return result;
    }

    // queries
public:
    [[nodiscard]] isize size() const { return _size; }
    [[nodiscard]] bool empty() const { return _size == 0; }

    /// Total number of slots in the backing block.
    [[nodiscard]] isize capacity() const { return _capacity; }

    /// Number of pushes possible without reallocation.
    [[nodiscard]] isize capacity_free() const { return _capacity - _size; }

    // element access
public:
    /// Copy of the first element, or empty if the deque is empty.
    [[nodiscard]] rc::optional<T> front() const
    {
        if (_size == 0)
            return rc::nullopt;
        return rc::optional<T>(_slots[_head]);
    }

    /// Copy of the last element, or empty if the deque is empty.
    [[nodiscard]] rc::optional<T> back() const
    {
        if (_size == 0)
            return rc::nullopt;
        return rc::optional<T>(_slots[physical_index(_size - 1)]);
    }

    /// Copy of the element at logical index n, or empty if n is not in [0, size()).
    /// Out-of-range is an expected result here, not an error.
    [[nodiscard]] rc::optional<T> at(isize n) const
    {
        if (n < 0 || n >= _size)
            return rc::nullopt;
        return rc::optional<T>(_slots[physical_index(n)]);
    }

    /// Reference to the element at logical index i.
    /// Precondition: 0 <= i < size()
    [[nodiscard]] T& operator[](isize i)
    {
        RC_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _slots[physical_index(i)];
    }
    [[nodiscard]] T const& operator[](isize i) const
    {
        RC_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _slots[physical_index(i)];
    }

    /// The live elements as front run + back run (see ring_runs).
    /// This split is the single place that knows how the live window wraps;
    /// relocation, copying, rendering and destruction all walk these two spans.
    [[nodiscard]] ring_runs<T> front_back_runs()
    {
        auto const end = rc::min(_head + _size, _capacity);
        auto const rest = _size - (end - _head);
        return {span<T>(_slots + _head, _slots + end), span<T>(_slots, rest)};
    }
    [[nodiscard]] ring_runs<T const> front_back_runs() const
    {
        auto const end = rc::min(_head + _size, _capacity);
        auto const rest = _size - (end - _head);
        return {span<T const>(_slots + _head, _slots + end), span<T const>(_slots, rest)};
    }

    // iterators
public:
    [[nodiscard]] iterator begin() { return iterator(this, 0); }
    [[nodiscard]] iterator end() { return iterator(this, _size); }
    [[nodiscard]] const_iterator begin() const { return const_iterator(this, 0); }
    [[nodiscard]] const_iterator end() const { return const_iterator(this, _size); }

    /// Lazy (index, element) range from the front to the back.
    /// Restartable: every begin() starts over at index 0.
    [[nodiscard]] enumerate_range<ring_deque, false> enumerate() { return {this}; }
    [[nodiscard]] enumerate_range<ring_deque const, false> enumerate() const { return {this}; }

    /// Lazy (index, element) range from the back to the front (index size()-1 down to 0).
    [[nodiscard]] enumerate_range<ring_deque, true> enumerate_reversed() { return {this}; }
    [[nodiscard]] enumerate_range<ring_deque const, true> enumerate_reversed() const { return {this}; }

    // capacity management
public:
    /// Guarantees that at least n more elements can be pushed without reallocation.
    /// Reallocates to max(size + n, 2 * capacity) slots if the free capacity is too small.
    /// Negative n is an invalid argument (always-on assertion).
    void grow(isize n)
    {
        RC_ASSERTF_ALWAYS(n >= 0, "grow: n must be non-negative, got {}", n);
        RC_ASSERTF_ALWAYS(n <= std::numeric_limits<isize>::max() - _size, "grow: size {} + n {} overflows", _size, n);

        if (capacity_free() >= n)
            return;

        relocate_into(grown_capacity(n));
    }

    /// Releases all unused capacity: afterwards capacity() == size().
    /// An empty deque releases its block entirely.
    void clip()
    {
        if (_capacity == _size)
            return;

        relocate_into(_size);
    }

    // modifiers
public:
    /// Constructs a new first element in place and returns it.
    /// The reference is invalidated by any later growth or clip (including a push onto a full deque).
    template <class... Args>
    T& emplace_front(Args&&... args)
    {
        if (_size == _capacity) [[unlikely]]
            return emplace_front_grow(rc::forward<Args>(args)...);

        auto const new_head = rc::wrapped_decrement(_head, _capacity);
        T* const slot = new (rc::placement_new, _slots + new_head) T(rc::forward<Args>(args)...);
        _head = new_head;
        ++_size;
        return *slot;
    }

    /// Constructs a new last element in place and returns it.
    /// The reference is invalidated by any later growth or clip (including a push onto a full deque).
    template <class... Args>
    T& emplace_back(Args&&... args)
    {
        if (_size == _capacity) [[unlikely]]
            return emplace_back_grow(rc::forward<Args>(args)...);

        T* const slot = new (rc::placement_new, _slots + physical_index(_size)) T(rc::forward<Args>(args)...);
        ++_size;
        return *slot;
    }

    void push_front(T const& value) { this->emplace_front(value); }
    void push_front(T&& value) { this->emplace_front(rc::move(value)); }

    void push_back(T const& value) { this->emplace_back(value); }
    void push_back(T&& value) { this->emplace_back(rc::move(value)); }

    /// Appends copies of all items in order, growing at most once.
    /// items must not view this deque's own elements.
    void push_back_all(span<T const> items)
    {
        grow(items.size());

        if (items.empty())
            return;

        auto tail = physical_index(_size);
        for (auto const& item : items)
        {
            new (rc::placement_new, _slots + tail) T(item);
            ++_size;
            tail = rc::wrapped_increment(tail, _capacity);
        }
    }

    /// Removes the first element and returns it, or returns empty if the deque is empty.
    [[nodiscard]] rc::optional<T> pop_front()
    {
        if (_size == 0)
            return rc::nullopt;

        T& slot = _slots[_head];
        rc::optional<T> result(rc::move(slot));
        slot.~T();
        _head = rc::wrapped_increment(_head, _capacity);
        --_size;
        return result;
    }

    /// Removes the last element and returns it, or returns empty if the deque is empty.
    [[nodiscard]] rc::optional<T> pop_back()
    {
        if (_size == 0)
            return rc::nullopt;

        T& slot = _slots[physical_index(_size - 1)];
        rc::optional<T> result(rc::move(slot));
        slot.~T();
        --_size;
        return result;
    }

    /// Removes the first element without returning it.
    /// Returns false if the deque was empty.
    bool remove_front()
    {
        if (_size == 0)
            return false;

        _slots[_head].~T();
        _head = rc::wrapped_increment(_head, _capacity);
        --_size;
        return true;
    }

    /// Removes the last element without returning it.
    /// Returns false if the deque was empty.
    bool remove_back()
    {
        if (_size == 0)
            return false;

        _slots[physical_index(_size - 1)].~T();
        --_size;
        return true;
    }

    /// Exchanges the elements at logical indices i and j.
    /// Both indices must be in [0, size()) (always-on assertion).
    void swap_elements(isize i, isize j)
    {
        RC_ASSERTF_ALWAYS(0 <= i && i < _size, "swap_elements: index i = {} out of range [0, {})", i, _size);
        RC_ASSERTF_ALWAYS(0 <= j && j < _size, "swap_elements: index j = {} out of range [0, {})", j, _size);

        if (i == j)
            return;

        rc::swap(_slots[physical_index(i)], _slots[physical_index(j)]);
    }

    /// Destroys all elements. Capacity is kept.
    void clear()
    {
        destroy_live_objects();
        _size = 0;
        _head = 0;
    }

    // materialization
public:
    /// Fresh front-to-back copy of the elements; never aliases the backing block.
    [[nodiscard]] std::vector<T> to_vector() const
    {
        std::vector<T> result;
        result.reserve(_size);
        auto const runs = front_back_runs();
        result.insert(result.end(), runs.front.begin(), runs.front.end());
        result.insert(result.end(), runs.back.begin(), runs.back.end());
        return result;
    }

    /// Front-to-back copy into any container with push_back.
    template <class ContainerT>
    [[nodiscard]] ContainerT to_container() const
    {
        static_assert(sizeof(ContainerT) > 0, "ContainerT must be complete (did you forget to include its header?)");

        ContainerT container;
        auto const runs = front_back_runs();
        for (auto const& e : runs.front)
            container.push_back(e);
        for (auto const& e : runs.back)
            container.push_back(e);
        return container;
    }

    /// Debug rendering: ring_deque{ size: 3, capacity: 4, items: [1, 2, 3]}
    /// Elements are rendered with rc::to_debug_string. Not meant to be parsed.
    [[nodiscard]] std::string to_string() const
    {
        auto s = std::format("ring_deque{{ size: {}, capacity: {}, items: [", _size, _capacity);
        auto const runs = front_back_runs();
        isize i = 0;
        for (auto const run : {runs.front, runs.back})
            for (auto const& e : run)
            {
                if (i++ > 0)
                    s += ", ";
                s += rc::to_debug_string(e);
            }
        s += "]}";
        return s;
    }

    // comparison
public:
    /// Same size and equal elements in logical order. Capacity and head do not matter.
    [[nodiscard]] friend bool operator==(ring_deque const& lhs, ring_deque const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs._size != rhs._size)
            return false;

        for (isize i = 0; i < lhs._size; ++i)
            if (!(lhs[i] == rhs[i]))
                return false;

        return true;
    }

    // lifecycle
public:
    ring_deque() = default;

    /// Deep copy into a tight, linearized block (capacity == size, head == 0).
    /// Delegates to the default ctor first so a throwing element copy still runs the destructor.
    ring_deque(ring_deque const& rhs) : ring_deque()
    {
        if (rhs._size == 0)
            return;

        _slots = impl::allocate_slots<T>(rhs._size);
        _capacity = rhs._size;

        auto const runs = rhs.front_back_runs();
        T* dest_end = _slots;
        try
        {
            impl::copy_create_objects_to(dest_end, runs.front.begin(), runs.front.end());
            impl::copy_create_objects_to(dest_end, runs.back.begin(), runs.back.end());
        }
        catch (...)
        {
            // exactly [_slots, dest_end) is alive, the destructor takes it from here
            _size = dest_end - _slots;
            throw;
        }
        _size = _capacity;
    }

    ring_deque(ring_deque&& rhs) noexcept
      : _slots(rc::exchange(rhs._slots, nullptr)),
        _capacity(rc::exchange(rhs._capacity, 0)),
        _head(rc::exchange(rhs._head, 0)),
        _size(rc::exchange(rhs._size, 0))
    {
    }

    ring_deque& operator=(ring_deque const& rhs)
    {
        if (this != &rhs)
            *this = ring_deque(rhs);
        return *this;
    }

    /// Safe even if rhs lives inside one of our own elements:
    /// rhs is emptied into a temporary before anything of ours is destroyed.
    ring_deque& operator=(ring_deque&& rhs) noexcept
    {
        if (this != &rhs)
        {
            auto rhs_tmp = rc::move(rhs);

            destroy_live_objects();
            impl::deallocate_slots(_slots, _capacity);

            _slots = rc::exchange(rhs_tmp._slots, nullptr);
            _capacity = rc::exchange(rhs_tmp._capacity, 0);
            _head = rc::exchange(rhs_tmp._head, 0);
            _size = rc::exchange(rhs_tmp._size, 0);
        }
        return *this;
    }

    ~ring_deque()
    {
        destroy_live_objects();
        impl::deallocate_slots(_slots, _capacity);
    }

    // helper
private:
    /// Slot of logical index i, for 0 <= i <= size() < capacity or 0 <= i < size().
    [[nodiscard]] isize physical_index(isize i) const { return rc::wrapped_add(_head, i, _capacity); }

    /// Amortized growth: at least n more slots, at least double the old capacity.
    /// Precondition: _size + n does not overflow (checked in grow)
    [[nodiscard]] isize grown_capacity(isize n) const
    {
        constexpr auto max_size = std::numeric_limits<isize>::max();
        auto const doubled = _capacity > max_size / 2 ? max_size : 2 * _capacity;
        return rc::max(_size + n, doubled);
    }

    /// Destroys the live elements in reverse logical order (back run first).
    void destroy_live_objects()
    {
        auto const runs = front_back_runs();
        impl::destroy_objects_in_reverse(runs.back.begin(), runs.back.end());
        impl::destroy_objects_in_reverse(runs.front.begin(), runs.front.end());
    }

    /// Moves the live elements into slots [0, size) of `new_slots`, releases the old block
    /// and adopts the new one with head == 0.
    void adopt_block(T* new_slots, isize new_capacity)
    {
        RC_ASSERT(new_capacity >= _size, "new block must hold all live elements");

        auto const runs = front_back_runs();
        T* dest_end = new_slots;
        impl::move_create_objects_to(dest_end, runs.front.begin(), runs.front.end());
        impl::move_create_objects_to(dest_end, runs.back.begin(), runs.back.end());

        destroy_live_objects();
        impl::deallocate_slots(_slots, _capacity);

        _slots = new_slots;
        _capacity = new_capacity;
        _head = 0;
    }

    void relocate_into(isize new_capacity) { adopt_block(impl::allocate_slots<T>(new_capacity), new_capacity); }

    // slow paths of emplace_front / emplace_back
    // The new element is constructed in the new block before the old elements are moved,
    // so args may refer to elements of this deque (d.push_back(d[0]) is fine).

    template <class... Args>
    T& emplace_front_grow(Args&&... args)
    {
        auto const new_capacity = grown_capacity(1);
        T* const new_slots = impl::allocate_slots<T>(new_capacity);

        T* slot = nullptr;
        try
        {
            // last slot, right before slot 0 where the old front will land
            slot = new (rc::placement_new, new_slots + new_capacity - 1) T(rc::forward<Args>(args)...);
        }
        catch (...)
        {
            impl::deallocate_slots(new_slots, new_capacity);
            throw;
        }

        adopt_block(new_slots, new_capacity);
        _head = new_capacity - 1;
        ++_size;
        return *slot;
    }

    template <class... Args>
    T& emplace_back_grow(Args&&... args)
    {
        auto const new_capacity = grown_capacity(1);
        T* const new_slots = impl::allocate_slots<T>(new_capacity);

        T* slot = nullptr;
        try
        {
            slot = new (rc::placement_new, new_slots + _size) T(rc::forward<Args>(args)...);
        }
        catch (...)
        {
            impl::deallocate_slots(new_slots, new_capacity);
            throw;
        }

        adopt_block(new_slots, new_capacity);
        ++_size;
        return *slot;
    }

    // members
private:
    /// Block of _capacity slots; only the ring window [head, head + size) holds live objects.
    T* _slots = nullptr;
    isize _capacity = 0;
    /// 0 <= _head < _capacity, or 0 if _capacity == 0
    isize _head = 0;
    /// 0 <= _size <= _capacity
    isize _size = 0;
};

/// Random-access iterator over the logical order.
/// Stores the deque and a logical index, so it stays meaningful across the wrap point.
/// Invalidated by anything that changes the size or reallocates.
template <class T>
template <bool IsConst>
struct rc::ring_deque<T>::basic_iterator
{
    using deque_t = std::conditional_t<IsConst, ring_deque const, ring_deque>;

    using iterator_concept = std::random_access_iterator_tag;
    using iterator_category = std::random_access_iterator_tag;
    using value_type = T;
    using difference_type = isize;
    using pointer = std::conditional_t<IsConst, T const*, T*>;
    using reference = std::conditional_t<IsConst, T const&, T&>;

    basic_iterator() = default;
    basic_iterator(deque_t* deque, isize idx) : _deque(deque), _idx(idx) {}

    /// iterator -> const_iterator
    template <bool OtherConst>
        requires(IsConst && !OtherConst)
    basic_iterator(basic_iterator<OtherConst> const& rhs) : _deque(rhs._deque), _idx(rhs._idx)
    {
    }

    [[nodiscard]] reference operator*() const { return (*_deque)[_idx]; }
    [[nodiscard]] pointer operator->() const { return &(*_deque)[_idx]; }
    [[nodiscard]] reference operator[](difference_type n) const { return (*_deque)[_idx + n]; }

    basic_iterator& operator++()
    {
        ++_idx;
        return *this;
    }
    basic_iterator operator++(int)
    {
        auto r = *this;
        ++_idx;
        return r;
    }
    basic_iterator& operator--()
    {
        --_idx;
        return *this;
    }
    basic_iterator operator--(int)
    {
        auto r = *this;
        --_idx;
        return r;
    }

    basic_iterator& operator+=(difference_type n)
    {
        _idx += n;
        return *this;
    }
    basic_iterator& operator-=(difference_type n)
    {
        _idx -= n;
        return *this;
    }

    [[nodiscard]] friend basic_iterator operator+(basic_iterator it, difference_type n) { return it += n; }
    [[nodiscard]] friend basic_iterator operator+(difference_type n, basic_iterator it) { return it += n; }
    [[nodiscard]] friend basic_iterator operator-(basic_iterator it, difference_type n) { return it -= n; }
    [[nodiscard]] friend difference_type operator-(basic_iterator const& a, basic_iterator const& b)
    {
        return a._idx - b._idx;
    }

    [[nodiscard]] friend bool operator==(basic_iterator const& a, basic_iterator const& b) { return a._idx == b._idx; }
    [[nodiscard]] friend std::strong_ordering operator<=>(basic_iterator const& a, basic_iterator const& b)
    {
        return a._idx <=> b._idx;
    }

private:
    deque_t* _deque = nullptr;
    isize _idx = 0;

    friend struct basic_iterator<!IsConst>;
};

/// Restartable, lazy (index, element) range; see enumerate() and enumerate_reversed().
/// Elements are read on demand through operator[], nothing is materialized.
/// The cursor stops as soon as its index leaves [0, size()), so breaking out early does no extra work.
template <class T>
template <class DequeT, bool Reverse>
struct rc::ring_deque<T>::enumerate_range
{
    using elem_t = std::conditional_t<std::is_const_v<DequeT>, T const, T>;

    struct cursor
    {
        DequeT* deque = nullptr;
        isize idx = 0;

        [[nodiscard]] entry<elem_t> operator*() const { return {idx, (*deque)[idx]}; }

        cursor& operator++()
        {
            if constexpr (Reverse)
                --idx;
            else
                ++idx;
            return *this;
        }

        [[nodiscard]] bool operator==(rc::sentinel) const { return idx < 0 || idx >= deque->size(); }
    };

    [[nodiscard]] cursor begin() const { return {_deque, Reverse ? _deque->size() - 1 : 0}; }
    [[nodiscard]] rc::sentinel end() const { return {}; }

    DequeT* _deque = nullptr;
};
