// main.cpp
// Extent allocator demo for IntrusiveRBTree.
//
// Every free extent is linked into two trees at once: one ordered by address, used to find
// neighbours to coalesce with, and one ordered by (size, address), used for best-fit
// allocation. Extent records live in a fixed pool; the trees never allocate.
//
// Exits with a nonzero status if either tree fails validation or the heap does not coalesce
// back into a single extent once everything has been freed.

#include <array>
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "intrusive_rb_tree.hpp"

struct Extent {
    std::size_t addr = 0;
    std::size_t size = 0;
    RBNode<Extent> by_addr;
    RBNode<Extent> by_size;
};

std::ostream& operator<<(std::ostream& os, const Extent& e) {
    return os << "[" << e.addr << ", " << e.addr + e.size << ")";
}

struct AddrCompare {
    RBOrdering operator()(std::size_t addr, const Extent& e) const { return RBDefaultCompare()(addr, e.addr); }
    RBOrdering operator()(const Extent& a, const Extent& b) const { return RBDefaultCompare()(a.addr, b.addr); }
};

// Probe for the size tree: the smallest extent of at least `size` bytes, lowest address first.
struct SizeKey {
    std::size_t size;
    std::size_t addr;
};

struct SizeCompare {
    RBOrdering operator()(const SizeKey& k, const Extent& e) const {
        return RBDefaultCompare()(std::make_pair(k.size, k.addr), std::make_pair(e.size, e.addr));
    }
    RBOrdering operator()(const Extent& a, const Extent& b) const {
        return RBDefaultCompare()(std::make_pair(a.size, a.addr), std::make_pair(b.size, b.addr));
    }
};

using AddrTree = IntrusiveRBTree<Extent, RBMemberNode<Extent, &Extent::by_addr>, AddrCompare>;
using SizeTree = IntrusiveRBTree<Extent, RBMemberNode<Extent, &Extent::by_size>, SizeCompare>;

class ExtentHeap {
public:
    static constexpr std::size_t kMaxExtents = 64;

    ExtentHeap() {
        for (std::size_t i = kMaxExtents; i > 0; --i) spare_.push_back(&records_[i - 1]);
    }

    // Returns [addr, addr + size) to the heap, merging it with adjacent free extents.
    bool add_free(std::size_t addr, std::size_t size) {
        if (size == 0) return true;

        Extent* below = by_addr_.psearch(addr);
        if (below && below->addr + below->size > addr) {
            std::cerr << "add_free: [" << addr << ", " << addr + size << ") overlaps " << *below << "\n";
            return false;
        }
        Extent* above = by_addr_.nsearch(addr);
        if (above && addr + size > above->addr) {
            std::cerr << "add_free: [" << addr << ", " << addr + size << ") overlaps " << *above << "\n";
            return false;
        }

        if (below && below->addr + below->size == addr) {
            unlink(below);
            addr = below->addr;
            size += below->size;
            release(below);
        }
        if (above && addr + size == above->addr) {
            unlink(above);
            size += above->size;
            release(above);
        }

        if (spare_.empty()) {
            std::cerr << "add_free: out of extent records\n";
            return false;
        }
        Extent* e = spare_.back();
        spare_.pop_back();
        e->addr = addr;
        e->size = size;
        link(e);
        return true;
    }

    // Best fit: the smallest free extent that can hold `size`, split if it is larger.
    std::optional<std::size_t> allocate(std::size_t size) {
        if (size == 0) return std::nullopt;
        Extent* e = by_size_.nsearch(SizeKey{size, 0});
        if (!e) return std::nullopt;

        unlink(e);
        const std::size_t addr = e->addr;
        if (e->size > size) {
            e->addr += size;
            e->size -= size;
            link(e);
        } else {
            release(e);
        }
        return addr;
    }

    std::size_t extent_count() const {
        return kMaxExtents - spare_.size();
    }

    bool validate(std::string* diag) const {
        std::string a, s;
        bool ok = true;
        if (!by_addr_.validate_invariants(&a)) {
            ok = false;
            if (diag) *diag += "address tree:\n" + a;
        }
        if (!by_size_.validate_invariants(&s)) {
            ok = false;
            if (diag) *diag += "size tree:\n" + s;
        }
        return ok;
    }

    void print(std::ostream& os) {
        os << "  by address:";
        by_addr_.iter([&](Extent& e) -> std::optional<bool> {
            os << " " << e;
            return std::nullopt;
        });
        os << "\n  by size:   ";
        by_size_.iter([&](Extent& e) -> std::optional<bool> {
            os << " " << e.size << "@" << e.addr;
            return std::nullopt;
        });
        os << "\n";
    }

private:
    std::array<Extent, kMaxExtents> records_;
    std::vector<Extent*> spare_;
    AddrTree by_addr_;
    SizeTree by_size_;

    void link(Extent* e) {
        by_addr_.insert(e);
        by_size_.insert(e);
    }

    void unlink(Extent* e) {
        by_addr_.remove(e);
        by_size_.remove(e);
    }

    void release(Extent* e) {
        e->addr = 0;
        e->size = 0;
        spare_.push_back(e);
    }
};

int main() {
    constexpr std::size_t kArena = 4096;
    ExtentHeap heap;
    std::string diag;

    if (!heap.add_free(0, kArena)) return 1;
    std::cout << "initial heap\n";
    heap.print(std::cout);

    const std::size_t requests[] = { 512, 128, 1024, 64, 256, 512, 128 };
    std::vector<std::pair<std::size_t, std::size_t>> live;
    for (std::size_t req : requests) {
        std::optional<std::size_t> addr = heap.allocate(req);
        if (!addr) {
            std::cout << "allocate(" << req << ") failed\n";
            continue;
        }
        std::cout << "allocate(" << req << ") -> " << *addr << "\n";
        live.emplace_back(*addr, req);
    }
    heap.print(std::cout);

    // Free every other block first so the heap fragments, then the rest.
    for (std::size_t pass = 0; pass < 2; ++pass) {
        for (std::size_t i = pass; i < live.size(); i += 2) {
            if (!heap.add_free(live[i].first, live[i].second)) {
                std::cerr << "add_free(" << live[i].first << ", " << live[i].second << ") rejected\n";
                return 1;
            }
            std::cout << "free " << live[i].first << " (" << live[i].second << " bytes), "
                      << heap.extent_count() << " free extents\n";
            if (!heap.validate(&diag)) {
                std::cerr << diag;
                return 1;
            }
        }
        heap.print(std::cout);
    }

    // Best fit prefers the exact-size hole over carving up the large extent.
    ExtentHeap fit;
    if (!fit.add_free(0, 100) || !fit.add_free(200, 40) || !fit.add_free(300, 64)) return 1;
    std::optional<std::size_t> best = fit.allocate(40);
    std::cout << "best fit for 40 bytes -> " << (best ? std::to_string(*best) : std::string("none")) << "\n";
    if (!best || *best != 200) return 1;

    if (heap.extent_count() != 1) {
        std::cerr << "expected a single coalesced extent, found " << heap.extent_count() << "\n";
        return 1;
    }
    std::cout << "heap coalesced back into one extent\n";
    return 0;
}
