// intrusive_rb_node.hpp
// Per-element linkage for the intrusive left-leaning red-black tree, plus the two
// capabilities the tree needs from the element type (ordering and linkage access).
//
// - C++17 header-only.
// - RBNode<T> is two pointer-widths: a left child pointer and a right child pointer
//   whose least significant bit carries the color. T must therefore be aligned to at
//   least 2 bytes.
// - RBOrdering is the four-way comparison result. The tree treats Incomparable the
//   same as Less everywhere it picks a direction.
// - RBDefaultCompare builds an RBOrdering out of operator< and operator==.
// - RBMemberNode<T, &T::member> is the linkage accessor for a data member.
//
// Usage:
//   struct Extent {
//       std::size_t addr = 0;
//       RBNode<Extent> link;
//   };
//   using ExtentTree = IntrusiveRBTree<Extent, RBMemberNode<Extent, &Extent::link>, ByAddr>;
//
// Config macros (define before the first include):
//   INTRUSIVE_RB_ASSERT(x)   fatal check for misuse and broken invariants, default assert(x)
//   INTRUSIVE_RB_MAX_DEPTH   capacity of the insert/remove path and traversal stacks

#ifndef INTRUSIVE_RB_NODE_HPP
#define INTRUSIVE_RB_NODE_HPP

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <ostream>
#include <type_traits>
#include <utility>

#ifndef INTRUSIVE_RB_ASSERT
#define INTRUSIVE_RB_ASSERT(x) assert(x)
#endif

// An LLRB tree of n elements is at most 2*log2(n+1) high; n fits in std::size_t.
// Two extra slots hold the element being inserted and the sentinel below a leaf.
#ifndef INTRUSIVE_RB_MAX_DEPTH
#define INTRUSIVE_RB_MAX_DEPTH (2u * std::numeric_limits<std::size_t>::digits + 2u)
#endif

enum class RBOrdering { Less, Equal, Greater, Incomparable };

// Direction rule shared by every operation: Incomparable descends left, like Less.
constexpr bool rb_goes_left(RBOrdering o) noexcept {
    return o == RBOrdering::Less || o == RBOrdering::Incomparable;
}

inline std::ostream& operator<<(std::ostream& os, RBOrdering o) {
    switch (o) {
        case RBOrdering::Less: return os << "Less";
        case RBOrdering::Equal: return os << "Equal";
        case RBOrdering::Greater: return os << "Greater";
        case RBOrdering::Incomparable: return os << "Incomparable";
    }
    return os;
}

// The fields required in an element to store it in an IntrusiveRBTree.
// A default-constructed linkage holds null children and is black; it is only
// meaningful once insert() has initialized it.
template <typename T>
class RBNode {
public:
    enum Color : std::uintptr_t { BLACK = 0, RED = 1 };

    RBNode() noexcept : left_(nullptr), right_red_(0) {}

    T* left() const noexcept { return left_; }
    void set_left(T* n) noexcept { left_ = n; }

    T* right() const noexcept { return reinterpret_cast<T*>(right_red_ & kPtrMask); }
    void set_right(T* n) noexcept {
        static_assert(alignof(T) >= 2, "RBNode<T> keeps the color in bit 0 of a T*");
        right_red_ = reinterpret_cast<std::uintptr_t>(n) | (right_red_ & kColorMask);
    }

    Color color() const noexcept { return static_cast<Color>(right_red_ & kColorMask); }
    void set_color(Color c) noexcept { right_red_ = (right_red_ & kPtrMask) | c; }
    bool is_red() const noexcept { return color() == RED; }

    // Both children at `nil`, with color `c`.
    void reset(T* nil, Color c) noexcept {
        left_ = nil;
        right_red_ = reinterpret_cast<std::uintptr_t>(nil) | c;
    }

    // Equality of elements in an intrusive container never depends on their
    // position in it, so linkages always compare equal.
    friend bool operator==(const RBNode&, const RBNode&) noexcept { return true; }
    friend bool operator!=(const RBNode&, const RBNode&) noexcept { return false; }
    friend bool operator<(const RBNode&, const RBNode&) noexcept { return false; }
    friend bool operator>(const RBNode&, const RBNode&) noexcept { return false; }
    friend bool operator<=(const RBNode&, const RBNode&) noexcept { return true; }
    friend bool operator>=(const RBNode&, const RBNode&) noexcept { return true; }

private:
    static constexpr std::uintptr_t kColorMask = 1;
    static constexpr std::uintptr_t kPtrMask = ~kColorMask;

    T* left_;
    std::uintptr_t right_red_;
};

// Linkage accessor for an RBNode<T> data member of T.
template <typename T, RBNode<T> T::*Member>
struct RBMemberNode {
    static RBNode<T>& node(T& e) noexcept { return e.*Member; }
    static const RBNode<T>& node(const T& e) noexcept { return e.*Member; }
};

// Four-way comparison from operator< and operator==. Values that are neither
// less, greater nor equal (NaN, for instance) are Incomparable.
struct RBDefaultCompare {
    template <typename A, typename B>
    RBOrdering operator()(const A& a, const B& b) const {
        if (a < b) return RBOrdering::Less;
        if (b < a) return RBOrdering::Greater;
        if (a == b) return RBOrdering::Equal;
        return RBOrdering::Incomparable;
    }
};

// true when `os << const U&` is well-formed; diagnostics fall back to addresses otherwise
template <typename U, typename = void>
struct rb_is_streamable : std::false_type {};

template <typename U>
struct rb_is_streamable<U, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const U&>())>>
    : std::true_type {};

#endif // INTRUSIVE_RB_NODE_HPP
