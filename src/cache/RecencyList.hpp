#ifndef RECENCYLIST_HPP
#define RECENCYLIST_HPP

#include <cstddef>
#include <utility>
#include <vector>

#include "CacheNode.hpp"

// Doubly linked recency ordering over an arena of nodes.
// Front is the most recently touched entry, back the least recently touched.
// Links are slot indices into nodes_; erased slots are recycled through free_.
// Not synchronised: the owning cache serialises every call.
template <typename K, typename V>
class RecencyList {
public:
    using Entry = CacheEntry<K, V>;

    Slot pushFront(Entry entry) {
        Slot slot;
        if (!free_.empty()) {
            slot = free_.back();
            free_.pop_back();
        } else {
            slot = nodes_.size();
            nodes_.emplace_back();
        }
        nodes_[slot].entry.emplace(std::move(entry));
        linkFront(slot);
        ++size_;
        return slot;
    }

    void moveToFront(Slot slot) {
        if (slot == head_) {
            return;
        }
        unlink(slot);
        linkFront(slot);
    }

    // Unlinks the slot, destroys its entry and recycles it.
    void erase(Slot slot) {
        unlink(slot);
        nodes_[slot].entry.reset();
        free_.push_back(slot);
        --size_;
    }

    void clear() {
        // Swap with empties so the arena memory is released too
        std::vector<CacheNode<K, V>>().swap(nodes_);
        std::vector<Slot>().swap(free_);
        head_ = kNoSlot;
        tail_ = kNoSlot;
        size_ = 0;
    }

    Slot front() const { return head_; }
    Slot back() const { return tail_; }
    std::size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    // Number of arena slots, live or free. Sweeps walk [0, slotCount()).
    std::size_t slotCount() const { return nodes_.size(); }
    bool occupied(Slot slot) const { return slot < nodes_.size() && nodes_[slot].entry.has_value(); }

    Entry& entry(Slot slot) { return *nodes_[slot].entry; }
    const Entry& entry(Slot slot) const { return *nodes_[slot].entry; }

    // Visits live entries front to back.
    template <typename Fn>
    void forEach(Fn&& fn) const {
        for (Slot slot = head_; slot != kNoSlot; slot = nodes_[slot].next) {
            fn(*nodes_[slot].entry);
        }
    }

private:
    void linkFront(Slot slot) {
        CacheNode<K, V>& node = nodes_[slot];
        node.prev = kNoSlot;
        node.next = head_;
        if (head_ != kNoSlot) {
            nodes_[head_].prev = slot;
        }
        head_ = slot;
        if (tail_ == kNoSlot) {
            tail_ = slot;
        }
    }

    void unlink(Slot slot) {
        CacheNode<K, V>& node = nodes_[slot];
        if (node.prev != kNoSlot) {
            nodes_[node.prev].next = node.next;
        } else {
            head_ = node.next;
        }
        if (node.next != kNoSlot) {
            nodes_[node.next].prev = node.prev;
        } else {
            tail_ = node.prev;
        }
        node.prev = kNoSlot;
        node.next = kNoSlot;
    }

    std::vector<CacheNode<K, V>> nodes_;
    std::vector<Slot> free_;
    Slot head_ = kNoSlot;
    Slot tail_ = kNoSlot;
    std::size_t size_ = 0;
};

#endif // RECENCYLIST_HPP
