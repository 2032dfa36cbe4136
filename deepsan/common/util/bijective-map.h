// Copyright 2026 The Deep Sanitizer Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef DEEPSAN_COMMON_UTIL_BIJECTIVE_MAP_H_
#define DEEPSAN_COMMON_UTIL_BIJECTIVE_MAP_H_

#include <cstddef>
#include <functional>
#include <map>
#include <utility>

namespace deepsan {

// One-to-one association between keys and values.  Every key maps to exactly
// one value and every value back to exactly one key; an insertion that would
// break this is refused as a whole.
//
// Each key and value is stored once.  The forward map points into the keys of
// the reverse map and vice versa, which is safe because std::map never
// relocates its nodes.
template <class K, class V, class KComp = std::less<K>,
          class VComp = std::less<V>>
class BijectiveMap {
  using forward_map_type = std::map<K, const V *, KComp>;
  using reverse_map_type = std::map<V, const K *, VComp>;

 public:
  BijectiveMap() = default;

  // Entries cross-reference each other's nodes, so copying would leave the
  // copy pointing into the original.
  BijectiveMap(const BijectiveMap &) = delete;
  BijectiveMap &operator=(const BijectiveMap &) = delete;

  size_t size() const { return forward_map_.size(); }
  bool empty() const { return forward_map_.empty(); }

  void clear() {
    forward_map_.clear();
    reverse_map_.clear();
  }

  // Read-only access to both directions.  Mapped values are pointers to the
  // opposite side's stored key.
  const forward_map_type &forward_view() const { return forward_map_; }
  const reverse_map_type &reverse_view() const { return reverse_map_; }

  // Returns the value associated with k, or nullptr.
  template <typename ConvertibleToKey>
  const V *find_forward(const ConvertibleToKey &k) const {
    const auto found = forward_map_.find(k);
    return found == forward_map_.end() ? nullptr : found->second;
  }

  // Returns the key associated with v, or nullptr.
  template <typename ConvertibleToValue>
  const K *find_reverse(const ConvertibleToValue &v) const {
    const auto found = reverse_map_.find(v);
    return found == reverse_map_.end() ? nullptr : found->second;
  }

  // Associates k with v.  Returns false, and changes nothing, if either side
  // is already present.
  bool insert(const K &k, const V &v) {
    const auto fwd_p = forward_map_.emplace(k, nullptr);
    if (!fwd_p.second) return false;
    const auto rev_p = reverse_map_.emplace(v, nullptr);
    if (!rev_p.second) {
      forward_map_.erase(fwd_p.first);
      return false;
    }
    Link(fwd_p.first, rev_p.first);
    return true;
  }

  // Looks up k, and if absent, draws values from generator until one is found
  // that is not yet used, then associates it with k.  The generator must
  // eventually produce an unused value.
  // Returns the associated value and whether a new entry was created.
  template <class Generator>
  std::pair<const V *, bool> find_or_insert_generated(const K &k,
                                                      Generator &&generator) {
    const auto fwd_p = forward_map_.emplace(k, nullptr);
    if (!fwd_p.second) return {fwd_p.first->second, false};
    for (;;) {
      const auto rev_p = reverse_map_.emplace(generator(), nullptr);
      if (rev_p.second) {
        Link(fwd_p.first, rev_p.first);
        return {fwd_p.first->second, true};
      }
    }
  }

 private:
  void Link(typename forward_map_type::iterator fwd,
            typename reverse_map_type::iterator rev) {
    fwd->second = &rev->first;
    rev->second = &fwd->first;
  }

  forward_map_type forward_map_;
  reverse_map_type reverse_map_;
};

}  // namespace deepsan

#endif  // DEEPSAN_COMMON_UTIL_BIJECTIVE_MAP_H_
