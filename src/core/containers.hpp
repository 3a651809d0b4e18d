/*
 * Copyright 2025 tokengate Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// tokengate Containers
// Hash map alias backed by ankerl::unordered_dense.
//
// Key indexes are built once per key-set snapshot and then only read, so
// the dense layout's insertion-time iterator invalidation never matters.

#pragma once

#include <ankerl/unordered_dense.h>

namespace tokengate::core {

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

}  // namespace tokengate::core
