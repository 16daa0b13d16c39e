/**
 * @file lru_arena.hpp
 * @brief Fixed-capacity keyed arena with least-recently-used eviction.
 *
 * @details
 * PURPOSE
 * -------
 * The route table, the identity cache and the inbound transfer registry all
 * need the same thing: a bounded map that never allocates after construction
 * and that, when full, makes room by dropping the entry that was refreshed
 * longest ago. LruArena is that structure, shared so the three tables cannot
 * drift apart in eviction behaviour.
 *
 * LAYOUT
 * ------
 * ```
 *   slots_[N]     Key + Value + prev/next links (intrusive list)
 *   index_        etl::map<Key, slot index, N>      (lookup)
 *   head_ ... tail_   LRU order: head is oldest, tail is freshest
 *   free_         singly linked free list through Slot::next
 * ```
 * - find() does not change recency; touch() moves an entry to the fresh end.
 *   Callers touch on "seen again", not on "looked up", so the LRU order is
 *   also the last-seen order.
 * - capacity() is a runtime limit not above N. Lowering it evicts at once.
 *
 * All operations are bounded: O(log N) map work plus O(1) list surgery,
 * except for_each()/erase_if() which walk the live entries.
 */
#ifndef MYCORRHIZA_LRU_ARENA_HPP
#define MYCORRHIZA_LRU_ARENA_HPP

#include <stddef.h>
#include <stdint.h>
#include "etl/map.h"

namespace mycorrhiza {

template <typename Key, typename Value, size_t N>
class LruArena {
public:
  using Index = uint16_t;
  static constexpr Index NIL = 0xFFFF;
  static_assert(N > 0 && N < NIL, "arena size must fit a 16-bit index");

  LruArena() { clear(); }

  /// Drop every entry and rebuild the free list.
  void clear() {
    index_.clear();
    for (size_t i = 0; i < N; ++i) {
      slots_[i].prev = NIL;
      slots_[i].next = (i + 1 < N) ? static_cast<Index>(i + 1) : NIL;
    }
    free_ = 0;
    head_ = tail_ = NIL;
  }

  size_t size() const     { return index_.size(); }
  size_t capacity() const { return limit_; }
  bool   empty() const    { return index_.empty(); }
  static constexpr size_t max_capacity() { return N; }

  /**
   * @brief Change the runtime limit, clamped to [1, N].
   * @return number of entries evicted to honour the new limit
   */
  size_t set_capacity(size_t limit) {
    if (limit == 0) limit = 1;
    if (limit > N)  limit = N;
    limit_ = limit;
    size_t evicted = 0;
    while (size() > limit_) { evict_oldest(); ++evicted; }
    return evicted;
  }

  Value* find(const Key& key) {
    auto it = index_.find(key);
    return it == index_.end() ? nullptr : &slots_[it->second].value;
  }

  const Value* find(const Key& key) const {
    auto it = index_.find(key);
    return it == index_.end() ? nullptr : &slots_[it->second].value;
  }

  /// find() and mark the entry freshest.
  Value* touch(const Key& key) {
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    unlink(it->second);
    link_tail(it->second);
    return &slots_[it->second].value;
  }

  /**
   * @brief Insert a new entry (or overwrite an existing one) as freshest.
   *
   * @param evicted  set true when the oldest entry had to go to make room
   * @param evicted_key  receives that entry's key when non-null
   * @return pointer to the stored value (never null)
   */
  Value* insert(const Key& key, const Value& value, bool* evicted = nullptr,
                Key* evicted_key = nullptr) {
    if (evicted) *evicted = false;
    if (Value* v = touch(key)) { *v = value; return v; }

    if (size() >= limit_ || free_ == NIL) {
      if (evicted_key && head_ != NIL) *evicted_key = slots_[head_].key;
      evict_oldest();
      if (evicted) *evicted = true;
    }

    const Index i = free_;
    free_ = slots_[i].next;
    slots_[i].key = key;
    slots_[i].value = value;
    link_tail(i);
    index_.insert(typename IndexMap::value_type(key, i));
    return &slots_[i].value;
  }

  bool erase(const Key& key) {
    auto it = index_.find(key);
    if (it == index_.end()) return false;
    release(it->second);
    return true;
  }

  /// Key of the least recently refreshed entry, or null when empty.
  const Key* oldest_key() const { return head_ == NIL ? nullptr : &slots_[head_].key; }

  /// Visit entries oldest first: f(const Key&, const Value&).
  template <typename F>
  void for_each(F f) const {
    for (Index i = head_; i != NIL; i = slots_[i].next) f(slots_[i].key, slots_[i].value);
  }

  /// Visit entries oldest first with mutable values: f(const Key&, Value&).
  template <typename F>
  void for_each_mut(F f) {
    for (Index i = head_; i != NIL; i = slots_[i].next) f(slots_[i].key, slots_[i].value);
  }

  /**
   * @brief Remove every entry for which pred(key, value) is true.
   * @return number removed
   */
  template <typename Pred>
  size_t erase_if(Pred pred) {
    size_t removed = 0;
    Index i = head_;
    while (i != NIL) {
      const Index next = slots_[i].next;
      if (pred(slots_[i].key, slots_[i].value)) { release(i); ++removed; }
      i = next;
    }
    return removed;
  }

private:
  struct Slot {
    Key   key{};
    Value value{};
    Index prev{NIL};
    Index next{NIL};
  };
  using IndexMap = etl::map<Key, Index, N>;

  void unlink(Index i) {
    Slot& s = slots_[i];
    if (s.prev != NIL) slots_[s.prev].next = s.next; else head_ = s.next;
    if (s.next != NIL) slots_[s.next].prev = s.prev; else tail_ = s.prev;
    s.prev = s.next = NIL;
  }

  void link_tail(Index i) {
    slots_[i].prev = tail_;
    slots_[i].next = NIL;
    if (tail_ != NIL) slots_[tail_].next = i; else head_ = i;
    tail_ = i;
  }

  void release(Index i) {
    index_.erase(slots_[i].key);
    unlink(i);
    slots_[i].value = Value{};
    slots_[i].next = free_;
    free_ = i;
  }

  void evict_oldest() {
    if (head_ != NIL) release(head_);
  }

  Slot     slots_[N];
  IndexMap index_;
  Index    head_{NIL};
  Index    tail_{NIL};
  Index    free_{NIL};
  size_t   limit_{N};
};

} // namespace mycorrhiza

#endif // MYCORRHIZA_LRU_ARENA_HPP
