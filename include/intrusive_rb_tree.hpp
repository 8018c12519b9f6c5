// intrusive_rb_tree.hpp
// Intrusive left-leaning 2-3 red-black tree. Elements carry their own RBNode<T> linkage, so
// the tree never allocates; it only rewires linkage and orders elements with the caller's
// comparator. Parent pointers are not kept: insert and remove record the root-to-leaf path
// on a bounded stack and rebalance while unwinding it.
//
// - C++17 header-only.
// - Operations:
//     * first() / last() / search(k) / nsearch(k) (ceiling) / psearch(k) (floor)
//     * next(e) / prev(e)        - O(log n), walk down from the root when needed
//     * insert(e) / remove(e)    - O(log n)
//     * iter([start,] visitor) / reverse_iter([start,] visitor)
//         - the visitor gets T& and returns std::optional<R>; the first engaged result
//           stops the walk and is returned.
//     * begin() / end()          - bidirectional iterator built on next()/prev()
// - "No element" is nullptr. Misuse (duplicate insert, removing a non-member) trips
//   INTRUSIVE_RB_ASSERT.
// - Diagnostics:
//     * validate_invariants_json(std::string& out_json) const
//         - Validates the sentinel, BST order, red-red, left-leaning shape and black-height.
//         - Produces a JSON object with validity, issues, node count, black-height and a
//           BFS node list (key, color, left, right, addr).
//     * validate_invariants(std::string* out) const
//     * tree_dump(std::ostream& os, bool show_addresses = false) const
//   Elements are printed with operator<< when T has one, by address otherwise.
//
// Requirements on T: default-constructible (the tree embeds one T as its sentinel) and
// aligned to at least 2 bytes. The tree is neither copyable nor movable because member
// linkages point at its sentinel.
//
// Usage in tests:
//   Tree t;
//   ... operations ...
//   std::string diag;
//   ASSERT_TRUE(t.validate_invariants(&diag)) << diag;

#ifndef INTRUSIVE_RB_TREE_HPP
#define INTRUSIVE_RB_TREE_HPP

#include "intrusive_rb_node.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <iterator>
#include <queue>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

template <typename T, typename NodeOf, typename Compare = RBDefaultCompare>
class IntrusiveRBTree {
public:
    using value_type    = T;
    using node_type     = RBNode<T>;
    using accessor_type = NodeOf;
    using key_compare   = Compare;
    using size_type     = std::size_t;

    static constexpr size_type max_depth = INTRUSIVE_RB_MAX_DEPTH;

    class iterator {
        friend class IntrusiveRBTree;
    public:
        using iterator_category = std::bidirectional_iterator_tag;
        using value_type        = T;
        using reference         = T&;
        using pointer           = T*;
        using difference_type   = std::ptrdiff_t;

        iterator() noexcept : node_(nullptr), tree_(nullptr) {}
        reference operator*() const { return *node_; }
        pointer operator->() const { return node_; }

        iterator& operator++() { node_ = tree_->next(node_); return *this; }
        iterator operator++(int) { iterator tmp = *this; ++(*this); return tmp; }

        iterator& operator--() {
            if (node_ == nullptr) node_ = tree_->last();
            else node_ = tree_->prev(node_);
            return *this;
        }
        iterator operator--(int) { iterator tmp = *this; --(*this); return tmp; }

        bool operator==(const iterator& o) const { return node_ == o.node_; }
        bool operator!=(const iterator& o) const { return node_ != o.node_; }

    private:
        T* node_;
        const IntrusiveRBTree* tree_;
        iterator(T* n, const IntrusiveRBTree* t) noexcept : node_(n), tree_(t) {}
    };

    explicit IntrusiveRBTree(const key_compare& comp = key_compare())
        : comp_(comp), nil_(), root_(nullptr), rotation_count_(0)
    {
        static_assert(std::is_default_constructible<T>::value,
                      "IntrusiveRBTree embeds a default-constructed T as its sentinel");
        NodeOf::node(nil_).reset(&nil_, node_type::BLACK);
        root_ = &nil_;
    }

    IntrusiveRBTree(const IntrusiveRBTree&) = delete;
    IntrusiveRBTree& operator=(const IntrusiveRBTree&) = delete;
    IntrusiveRBTree(IntrusiveRBTree&&) = delete;
    IntrusiveRBTree& operator=(IntrusiveRBTree&&) = delete;

    // Forget every member. Their linkages are left as they are.
    void clear() noexcept { root_ = &nil_; }

    bool empty() const noexcept { return root_ == nil(); }

    iterator begin() noexcept { return iterator(first(), this); }
    iterator end() noexcept { return iterator(nullptr, this); }

    // queries

    T* first() const noexcept { return first_in(root_); }
    T* last() const noexcept { return last_in(root_); }

    // Successor of a member, nullptr after the last one.
    T* next(const T* e) const {
        INTRUSIVE_RB_ASSERT(e != nullptr);
        T* r = right_of(e);
        if (r != nil()) return first_in(r);

        T* ret = nullptr;
        T* t = root_;
        INTRUSIVE_RB_ASSERT(t != nil());
        while (t != nil()) {
            const RBOrdering o = comp_(*e, *t);
            if (rb_goes_left(o)) {
                ret = t;
                t = left_of(t);
            } else if (o == RBOrdering::Greater) {
                t = right_of(t);
            } else {
                return ret;
            }
        }
        INTRUSIVE_RB_ASSERT(false && "next() on an element that is not in the tree");
        return nullptr;
    }

    // Predecessor of a member, nullptr before the first one.
    T* prev(const T* e) const {
        INTRUSIVE_RB_ASSERT(e != nullptr);
        T* l = left_of(e);
        if (l != nil()) return last_in(l);

        T* ret = nullptr;
        T* t = root_;
        INTRUSIVE_RB_ASSERT(t != nil());
        while (t != nil()) {
            const RBOrdering o = comp_(*e, *t);
            if (rb_goes_left(o)) {
                t = left_of(t);
            } else if (o == RBOrdering::Greater) {
                ret = t;
                t = right_of(t);
            } else {
                return ret;
            }
        }
        INTRUSIVE_RB_ASSERT(false && "prev() on an element that is not in the tree");
        return nullptr;
    }

    template <typename K>
    T* search(const K& key) const {
        T* t = root_;
        while (t != nil()) {
            const RBOrdering o = comp_(key, *t);
            if (rb_goes_left(o)) t = left_of(t);
            else if (o == RBOrdering::Greater) t = right_of(t);
            else return t;
        }
        return nullptr;
    }

    // Smallest element not less than key.
    template <typename K>
    T* nsearch(const K& key) const {
        T* ret = nullptr;
        T* t = root_;
        while (t != nil()) {
            const RBOrdering o = comp_(key, *t);
            if (rb_goes_left(o)) {
                ret = t;
                t = left_of(t);
            } else if (o == RBOrdering::Greater) {
                t = right_of(t);
            } else {
                return t;
            }
        }
        return ret;
    }

    // Largest element not greater than key.
    template <typename K>
    T* psearch(const K& key) const {
        T* ret = nullptr;
        T* t = root_;
        while (t != nil()) {
            const RBOrdering o = comp_(key, *t);
            if (rb_goes_left(o)) {
                t = left_of(t);
            } else if (o == RBOrdering::Greater) {
                ret = t;
                t = right_of(t);
            } else {
                return t;
            }
        }
        return ret;
    }

    // modifiers

    // e must not be a member, and no member may compare Equal to it.
    void insert(T* e) {
        INTRUSIVE_RB_ASSERT(e != nullptr && e != nil());
        std::array<PathEntry, max_depth> path;
        NodeOf::node(*e).reset(nil(), node_type::RED);

        // Wind
        size_type p = 0;
        path[0].node = root_;
        while (path[p].node != nil()) {
            INTRUSIVE_RB_ASSERT(p + 2 < max_depth);
            T* cur = path[p].node;
            const RBOrdering o = comp_(*e, *cur);
            INTRUSIVE_RB_ASSERT(o != RBOrdering::Equal && "insert() of a duplicate key");
            path[p].cmp = o;
            path[p + 1].node = rb_goes_left(o) ? left_of(cur) : right_of(cur);
            ++p;
        }
        path[p].node = e;

        // Unwind
        while (p-- > 0) {
            T* cnode = path[p].node;
            if (rb_goes_left(path[p].cmp)) {
                T* left = path[p + 1].node;
                set_left(cnode, left);
                if (!is_red(left)) return;
                T* left_left = left_of(left);
                if (is_red(left_left)) {
                    // Fix up 4-node.
                    set_black(left_left);
                    cnode = rotate_right(cnode);
                }
            } else {
                T* right = path[p + 1].node;
                set_right(cnode, right);
                if (!is_red(right)) return;
                T* left = left_of(cnode);
                if (is_red(left)) {
                    // Split 4-node.
                    set_black(left);
                    set_black(right);
                    set_red(cnode);
                } else {
                    // Lean left.
                    const typename node_type::Color color = NodeOf::node(*cnode).color();
                    T* t = rotate_left(cnode);
                    NodeOf::node(*t).set_color(color);
                    set_red(cnode);
                    cnode = t;
                }
            }
            path[p].node = cnode;
        }

        root_ = path[0].node;
        set_black(root_);
    }

    // e must be a member. Its linkage is unspecified afterwards.
    void remove(T* e) {
        INTRUSIVE_RB_ASSERT(e != nullptr && e != nil());
        std::array<PathEntry, max_depth> path;

        // Wind down to e, then to its successor.
        size_type nodep = max_depth;
        size_type p = 0;
        path[0].node = root_;
        while (path[p].node != nil()) {
            INTRUSIVE_RB_ASSERT(p + 2 < max_depth);
            T* cur = path[p].node;
            const RBOrdering o = path[p].cmp = comp_(*e, *cur);
            if (rb_goes_left(o)) {
                path[p + 1].node = left_of(cur);
            } else {
                path[p + 1].node = right_of(cur);
                if (o == RBOrdering::Equal) {
                    path[p].cmp = RBOrdering::Greater;
                    nodep = p;
                    for (++p; path[p].node != nil(); ++p) {
                        INTRUSIVE_RB_ASSERT(p + 2 < max_depth);
                        path[p].cmp = RBOrdering::Less;
                        path[p + 1].node = left_of(path[p].node);
                    }
                    break;
                }
            }
            ++p;
        }
        if (nodep == max_depth || path[nodep].node != e) {
            INTRUSIVE_RB_ASSERT(false && "remove() of an element that is not in the tree");
            return;
        }

        --p;
        if (path[p].node != e) {
            // Swap e with its successor. When the successor is e's right child the right
            // pointer copied here is wrong, but it is rewritten when the successor's old
            // position is pruned below.
            T* succ = path[p].node;
            const typename node_type::Color succ_color = NodeOf::node(*succ).color();
            NodeOf::node(*succ).set_color(NodeOf::node(*e).color());
            set_left(succ, left_of(e));
            set_right(succ, right_of(e));
            NodeOf::node(*e).set_color(succ_color);
            path[nodep].node = succ;
            path[p].node = e;
            if (nodep == 0) root_ = succ;
            else replace_child(path[nodep - 1], succ);
        } else {
            T* left = left_of(e);
            if (left != nil()) {
                // e has no successor but has a left child: splice e out, keeping the child.
                INTRUSIVE_RB_ASSERT(!is_red(e));
                INTRUSIVE_RB_ASSERT(is_red(left));
                set_black(left);
                if (p == 0) root_ = left;
                else replace_child(path[p - 1], left);
                return;
            } else if (p == 0) {
                // e was the only element.
                root_ = nil();
                return;
            }
        }

        if (is_red(path[p].node)) {
            // Prune a red leaf, no fixup needed.
            INTRUSIVE_RB_ASSERT(rb_goes_left(path[p - 1].cmp));
            set_left(path[p - 1].node, nil());
            return;
        }

        // The pruned leaf is black; unwind until balance is restored.
        // In the diagrams below ||, // and \\ mark the path to the removed element.
        path[p].node = nil();
        while (p-- > 0) {
            INTRUSIVE_RB_ASSERT(path[p].cmp != RBOrdering::Equal);
            T* cnode = path[p].node;
            if (rb_goes_left(path[p].cmp)) {
                set_left(cnode, path[p + 1].node);
                INTRUSIVE_RB_ASSERT(!is_red(path[p + 1].node));
                T* right = right_of(cnode);
                T* right_left = left_of(right);
                if (is_red(cnode)) {
                    T* t;
                    if (is_red(right_left)) {
                        /*
                               ||
                             cnode(r)
                           //        \
                          (b)        (b)
                                    /
                                   (r)
                        */
                        set_black(cnode);
                        set_right(cnode, rotate_right(right));
                        t = rotate_left(cnode);
                    } else {
                        /*
                               ||
                             cnode(r)
                           //        \
                          (b)        (b)
                                    /
                                   (b)
                        */
                        t = rotate_left(cnode);
                    }
                    // A red element is never the root.
                    INTRUSIVE_RB_ASSERT(p > 0);
                    replace_child(path[p - 1], t);
                    return;
                }
                if (is_red(right_left)) {
                    /*
                           ||
                         cnode(b)
                       //        \
                      (b)        (b)
                                /
                               (r)
                    */
                    set_black(right_left);
                    set_right(cnode, rotate_right(right));
                    replace_subtree(path, p, rotate_left(cnode));
                    return;
                }
                /*
                       ||
                     cnode(b)
                   //        \
                  (b)        (b)
                            /
                           (b)
                */
                set_red(cnode);
                path[p].node = rotate_left(cnode);
            } else {
                set_right(cnode, path[p + 1].node);
                T* left = left_of(cnode);
                if (is_red(left)) {
                    T* t;
                    T* left_right = right_of(left);
                    T* left_right_left = left_of(left_right);
                    if (is_red(left_right_left)) {
                        /*
                               ||
                             cnode(b)
                            /        \\
                          (r)        (b)
                            \
                            (b)
                            /
                          (r)
                        */
                        set_black(left_right_left);
                        T* u = rotate_right(cnode);
                        t = rotate_right(cnode);
                        set_right(u, t);
                        t = rotate_left(u);
                    } else {
                        /*
                               ||
                             cnode(b)
                            /        \\
                          (r)        (b)
                            \
                            (b)
                            /
                          (b)
                        */
                        INTRUSIVE_RB_ASSERT(left_right != nil());
                        set_red(left_right);
                        t = rotate_right(cnode);
                        set_black(t);
                    }
                    replace_subtree(path, p, t);
                    return;
                }
                T* left_left = left_of(left);
                if (is_red(cnode)) {
                    if (is_red(left_left)) {
                        /*
                                 ||
                               cnode(r)
                              /        \\
                            (b)        (b)
                            /
                          (r)
                        */
                        set_black(cnode);
                        set_red(left);
                        set_black(left_left);
                        T* t = rotate_right(cnode);
                        INTRUSIVE_RB_ASSERT(p > 0);
                        replace_child(path[p - 1], t);
                        return;
                    }
                    /*
                             ||
                           cnode(r)
                          /        \\
                        (b)        (b)
                        /
                      (b)
                    */
                    set_red(left);
                    set_black(cnode);
                    return;
                }
                if (is_red(left_left)) {
                    /*
                                    ||
                                  cnode(b)
                                 /        \\
                               (b)        (b)
                               /
                             (r)
                    */
                    set_black(left_left);
                    replace_subtree(path, p, rotate_right(cnode));
                    return;
                }
                /*
                                ||
                              cnode(b)
                             /        \\
                           (b)        (b)
                           /
                         (b)
                */
                set_red(left);
            }
        }

        root_ = path[0].node;
        INTRUSIVE_RB_ASSERT(!is_red(root_));
    }

    // traversal

    // Ascending walk over every element.
    template <typename F>
    auto iter(F&& visit) -> std::invoke_result_t<F&, T&> {
        Stack stack;
        size_type depth = 0;
        for (T* n = root_; n != nil(); n = left_of(n)) push(stack, depth, n);
        return walk(stack, depth, false, visit);
    }

    // Ascending walk from the first element not less than start.
    template <typename K, typename F>
    auto iter(const K& start, F&& visit) -> std::invoke_result_t<F&, T&> {
        Stack stack;
        size_type depth = 0;
        T* n = root_;
        while (n != nil()) {
            const RBOrdering o = comp_(start, *n);
            if (rb_goes_left(o)) {
                push(stack, depth, n);
                n = left_of(n);
            } else if (o == RBOrdering::Greater) {
                n = right_of(n);
            } else {
                push(stack, depth, n);
                break;
            }
        }
        return walk(stack, depth, false, visit);
    }

    // Descending walk over every element.
    template <typename F>
    auto reverse_iter(F&& visit) -> std::invoke_result_t<F&, T&> {
        Stack stack;
        size_type depth = 0;
        for (T* n = root_; n != nil(); n = right_of(n)) push(stack, depth, n);
        return walk(stack, depth, true, visit);
    }

    // Descending walk from the first element not greater than start.
    template <typename K, typename F>
    auto reverse_iter(const K& start, F&& visit) -> std::invoke_result_t<F&, T&> {
        Stack stack;
        size_type depth = 0;
        T* n = root_;
        while (n != nil()) {
            const RBOrdering o = comp_(start, *n);
            if (rb_goes_left(o)) {
                n = left_of(n);
            } else if (o == RBOrdering::Greater) {
                push(stack, depth, n);
                n = right_of(n);
            } else {
                push(stack, depth, n);
                break;
            }
        }
        return walk(stack, depth, true, visit);
    }

    // Instrumentation accessors
    size_t rotation_count() const noexcept { return rotation_count_; }
    void reset_rotation_count() noexcept { rotation_count_ = 0; }

    // validate_invariants_json:
    // Produces structured JSON diagnostics in out_json.
    // Returns true if invariants hold, false otherwise.
    //
    // JSON structure:
    // {
    //   "valid": true|false,
    //   "node_count": n,
    //   "black_height": bh,
    //   "rotation_count": r,
    //   "issues": [ "..." , ... ],
    //   "nodes": [
    //       { "key": "...", "color":"RED"|"BLACK", "left": "..."|null, "right":"..."|null, "addr": "0x..." },
    //       ...
    //   ]
    // }
    bool validate_invariants_json(std::string& out_json) const {
        std::vector<std::string> issues;
        bool valid = true;
        int black_height = -1;

        const node_type& sentinel = NodeOf::node(nil_);
        if (sentinel.is_red()) {
            issues.push_back("sentinel is not black");
            valid = false;
        }
        if (sentinel.left() != nil() || sentinel.right() != nil()) {
            issues.push_back("sentinel is not its own child");
            valid = false;
        }
        if (!root_) {
            issues.push_back("root_ is null");
            valid = false;
        } else if (root_ != nil() && is_red(root_)) {
            issues.push_back("root is not black");
            valid = false;
        }

        size_t counted = 0;

        // Returns (ok, black-height of the subtree). lo/hi are the exclusive bounds
        // inherited from ancestors.
        std::function<std::pair<bool,int>(const T*, const T*, const T*, size_type)> validate_node;
        validate_node = [&](const T* node, const T* lo, const T* hi, size_type depth) -> std::pair<bool,int> {
            if (node == nil()) return { true, 0 };
            if (node == nullptr) {
                issues.push_back("null child link");
                return { false, 0 };
            }
            if (depth >= max_depth) {
                std::ostringstream oss;
                oss << "Depth exceeds " << max_depth << " at " << key_to_string(*node);
                issues.push_back(oss.str());
                return { false, 0 };
            }
            ++counted;

            if (lo && comp_(*node, *lo) != RBOrdering::Greater) {
                std::ostringstream oss;
                oss << "BST violation: node " << key_to_string(*node) << " not above lower bound " << key_to_string(*lo);
                issues.push_back(oss.str());
                return { false, 0 };
            }
            if (hi && !rb_goes_left(comp_(*node, *hi))) {
                std::ostringstream oss;
                oss << "BST violation: node " << key_to_string(*node) << " not below upper bound " << key_to_string(*hi);
                issues.push_back(oss.str());
                return { false, 0 };
            }

            const T* l = left_of(node);
            const T* r = right_of(node);
            if (!l || !r) {
                std::ostringstream oss;
                oss << "Null child link under " << key_to_string(*node);
                issues.push_back(oss.str());
                return { false, 0 };
            }

            if (is_red(node) && (is_red(l) || is_red(r))) {
                std::ostringstream oss;
                oss << "Red violation: node " << key_to_string(*node) << " and a child both red";
                issues.push_back(oss.str());
                return { false, 0 };
            }
            if (is_red(r)) {
                std::ostringstream oss;
                oss << "Lean violation: right child of " << key_to_string(*node) << " is red";
                issues.push_back(oss.str());
                return { false, 0 };
            }

            auto left = validate_node(l, lo, node, depth + 1);
            if (!left.first) return { false, 0 };
            auto right = validate_node(r, node, hi, depth + 1);
            if (!right.first) return { false, 0 };

            if (left.second != right.second) {
                std::ostringstream oss;
                oss << "Black-height mismatch at " << key_to_string(*node)
                    << " left_bh=" << left.second << " right_bh=" << right.second;
                issues.push_back(oss.str());
                return { false, 0 };
            }

            return { true, left.second + (is_red(node) ? 0 : 1) };
        };

        if (root_ && root_ != nil()) {
            auto p = validate_node(root_, nullptr, nullptr, 0);
            if (!p.first) valid = false;
            black_height = p.second;
        } else if (root_) {
            black_height = 0;
        }

        // BFS node list; skipped when the shape is broken since links may cycle.
        std::vector<std::string> node_jsons;
        if (valid && root_ != nil()) {
            std::queue<const T*> q;
            q.push(root_);
            while (!q.empty()) {
                const T* n = q.front(); q.pop();
                const T* l = left_of(n);
                const T* r = right_of(n);
                std::ostringstream nj;
                nj << "{";
                nj << "\"key\":" << json_escape_and_quote(key_to_string(*n)) << ",";
                nj << "\"color\":\"" << (is_red(n) ? "RED" : "BLACK") << "\",";
                if (l != nil()) nj << "\"left\":" << json_escape_and_quote(key_to_string(*l)) << ",";
                else nj << "\"left\":null,";
                if (r != nil()) nj << "\"right\":" << json_escape_and_quote(key_to_string(*r)) << ",";
                else nj << "\"right\":null,";
                nj << "\"addr\":\"" << pointer_to_hex(n) << "\"";
                nj << "}";
                node_jsons.push_back(nj.str());
                if (l != nil()) q.push(l);
                if (r != nil()) q.push(r);
            }
        }

        std::ostringstream out;
        out << "{";
        out << "\"valid\":" << (valid ? "true" : "false") << ",";
        out << "\"node_count\":" << counted << ",";
        out << "\"black_height\":" << black_height << ",";
        out << "\"rotation_count\":" << rotation_count_ << ",";
        out << "\"issues\":[";
        for (size_t i = 0; i < issues.size(); ++i) {
            out << json_escape_and_quote(issues[i]);
            if (i + 1 < issues.size()) out << ",";
        }
        out << "],";
        out << "\"nodes\":[";
        for (size_t i = 0; i < node_jsons.size(); ++i) {
            out << node_jsons[i];
            if (i + 1 < node_jsons.size()) out << ",";
        }
        out << "]";
        out << "}";
        out_json = out.str();
        return valid && issues.empty();
    }

    // If out is non-null it receives the JSON diagnostics followed by a tree dump.
    bool validate_invariants(std::string* out = nullptr) const {
        std::string json;
        bool ok = validate_invariants_json(json);
        if (!out) return ok;
        std::ostringstream oss;
        oss << "validate_invariants: valid=" << (ok ? "true" : "false") << "\n";
        oss << "JSON diagnostics:\n" << json << "\n";
        if (ok) oss << "Tree dump:\n" << tree_dump_to_string(false) << "\n";
        *out = oss.str();
        return ok;
    }

    void tree_dump(std::ostream& os, bool show_addresses = false) const {
        os << tree_dump_to_string(show_addresses);
    }

    std::string tree_dump_to_string(bool show_addresses = false) const {
        std::ostringstream oss;
        if (!root_ || root_ == nil()) {
            oss << "<empty tree>\n";
            return oss.str();
        }
        std::function<void(const T*, std::string)> print_node = [&](const T* n, std::string indent) {
            if (n == nil()) {
                oss << indent << "(NIL)\n";
                return;
            }
            oss << indent << (is_red(n) ? "R " : "B ") << key_to_string(*n);
            if (show_addresses) oss << " @" << pointer_to_hex(n);
            oss << "\n";
            print_node(left_of(n), indent + "  L-");
            print_node(right_of(n), indent + "  R-");
        };
        print_node(root_, "");
        return oss.str();
    }

private:
    struct PathEntry {
        T* node;
        RBOrdering cmp;
    };

    using Stack = std::array<T*, max_depth>;

    key_compare comp_;
    T nil_;
    T* root_;
    size_t rotation_count_;

    T* nil() noexcept { return &nil_; }
    const T* nil() const noexcept { return &nil_; }

    static T* left_of(const T* e) noexcept { return NodeOf::node(*e).left(); }
    static T* right_of(const T* e) noexcept { return NodeOf::node(*e).right(); }
    static bool is_red(const T* e) noexcept { return NodeOf::node(*e).is_red(); }

    static void set_left(T* e, T* child) noexcept { NodeOf::node(*e).set_left(child); }
    static void set_right(T* e, T* child) noexcept { NodeOf::node(*e).set_right(child); }
    static void set_red(T* e) noexcept { NodeOf::node(*e).set_color(node_type::RED); }
    static void set_black(T* e) noexcept { NodeOf::node(*e).set_color(node_type::BLACK); }

    T* first_in(T* subtree) const noexcept {
        if (subtree == nil()) return nullptr;
        while (left_of(subtree) != nil()) subtree = left_of(subtree);
        return subtree;
    }

    T* last_in(T* subtree) const noexcept {
        if (subtree == nil()) return nullptr;
        while (right_of(subtree) != nil()) subtree = right_of(subtree);
        return subtree;
    }

    // rotation helpers (these increment rotation_count_); both return the new subtree root
    T* rotate_left(T* n) noexcept {
        T* r = right_of(n);
        set_right(n, left_of(r));
        set_left(r, n);
        ++rotation_count_;
        return r;
    }

    T* rotate_right(T* n) noexcept {
        T* l = left_of(n);
        set_left(n, right_of(l));
        set_right(l, n);
        ++rotation_count_;
        return l;
    }

    static void replace_child(const PathEntry& parent, T* child) noexcept {
        if (rb_goes_left(parent.cmp)) set_left(parent.node, child);
        else set_right(parent.node, child);
    }

    // Hooks a rebalanced subtree in at path position p, which may be the root.
    void replace_subtree(const std::array<PathEntry, max_depth>& path, size_type p, T* subtree) noexcept {
        if (p == 0) root_ = subtree;
        else replace_child(path[p - 1], subtree);
    }

    static void push(Stack& stack, size_type& depth, T* n) {
        INTRUSIVE_RB_ASSERT(depth < max_depth);
        stack[depth++] = n;
    }

    // Pops the next element, visits it, then stacks the near spine of its far subtree.
    template <typename F>
    auto walk(Stack& stack, size_type depth, bool reverse, F& visit) -> std::invoke_result_t<F&, T&> {
        while (depth > 0) {
            T* n = stack[--depth];
            auto result = visit(*n);
            if (result) return result;
            for (T* c = reverse ? left_of(n) : right_of(n); c != nil(); c = reverse ? right_of(c) : left_of(c)) {
                push(stack, depth, c);
            }
        }
        return {};
    }

    // utility: convert pointer to hex string
    static std::string pointer_to_hex(const void* p) {
        std::ostringstream oss;
        oss << "0x" << std::hex << reinterpret_cast<uintptr_t>(p) << std::dec;
        return oss.str();
    }

    // utility: escape string for JSON and wrap in quotes
    static std::string json_escape_and_quote(const std::string& s) {
        std::ostringstream o;
        o << "\"";
        for (char c : s) {
            switch (c) {
                case '\"': o << "\\\""; break;
                case '\\': o << "\\\\"; break;
                case '\b': o << "\\b"; break;
                case '\f': o << "\\f"; break;
                case '\n': o << "\\n"; break;
                case '\r': o << "\\r"; break;
                case '\t': o << "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        o << "\\u00" << std::hex << (static_cast<int>(c) >> 4) << (static_cast<int>(c) & 0xf) << std::dec;
                    } else {
                        o << c;
                    }
            }
        }
        o << "\"";
        return o.str();
    }

    static std::string key_to_string(const T& e) {
        std::ostringstream oss;
        if constexpr (rb_is_streamable<T>::value) oss << e;
        else oss << pointer_to_hex(&e);
        return oss.str();
    }
};

#endif // INTRUSIVE_RB_TREE_HPP
