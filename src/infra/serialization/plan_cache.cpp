/*
   Copyright 2025 The Bytewalk Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#include "plan_cache.hpp"

namespace bytewalk::ser {

PlanCache& PlanCache::instance() {
    static PlanCache cache;
    return cache;
}

size_t PlanCache::size() const {
    std::shared_lock lock(mutex_);
    return plans_.size();
}

std::shared_ptr<const void> PlanCache::find(const std::type_index& key) const {
    std::shared_lock lock(mutex_);
    const auto it{plans_.find(key)};
    return it == plans_.end() ? nullptr : it->second;
}

std::shared_ptr<const void> PlanCache::insert(const std::type_index& key, std::shared_ptr<const void> plan,
                                              const std::string& type_name) {
    std::unique_lock lock(mutex_);
    const auto [it, inserted]{plans_.try_emplace(key, std::move(plan))};
    if (not inserted) {
        LOG_TRACE << "Plan already built by a concurrent caller" << log::Tag{"type", type_name};
    }
    return it->second;
}

}  // namespace bytewalk::ser
