// Copyright 2024 Google LLC
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

#ifndef P4GRAPHS_UTIL_ORDERED_MAP_H_
#define P4GRAPHS_UTIL_ORDERED_MAP_H_

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/string_view.h"

namespace p4graphs {

// A string-keyed map that iterates in insertion order. Used for every name
// indexed collection of the IR so that all downstream traversals (and hence
// all generated graphs) are deterministic and follow declaration order.
//
// References returned by `Find` stay valid until the next `Insert`.
template <typename V>
class OrderedMap {
 public:
  using value_type = std::pair<std::string, V>;
  using const_iterator = typename std::vector<value_type>::const_iterator;

  // Inserts `value` under `key`. Returns false (and leaves the map unchanged)
  // if `key` is already present.
  bool Insert(std::string key, V value) {
    if (index_.contains(key)) return false;
    index_.emplace(key, entries_.size());
    entries_.emplace_back(std::move(key), std::move(value));
    return true;
  }

  // Returns the entry stored under `key`, or nullptr.
  const V *Find(absl::string_view key) const {
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].second;
  }

  V *FindMutable(absl::string_view key) {
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].second;
  }

  bool contains(absl::string_view key) const { return index_.contains(key); }

  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  const_iterator begin() const { return entries_.begin(); }
  const_iterator end() const { return entries_.end(); }

 private:
  std::vector<value_type> entries_;
  absl::flat_hash_map<std::string, size_t> index_;
};

}  // namespace p4graphs

#endif  // P4GRAPHS_UTIL_ORDERED_MAP_H_
